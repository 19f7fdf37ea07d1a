#pragma once

#include <stdexcept>
#include <string>

namespace Locus::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by Locus.
    ///
    /// @details
    /// `Exception` is the common base for every error Locus reports through exceptions.
    /// Catch it to handle any library failure; catch a derived type to react to one kind.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message) : std::runtime_error(message) {}

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message) : std::runtime_error(message) {}

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Locus::Exceptions
