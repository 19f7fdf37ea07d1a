#pragma once

/// @file NotSupportedException.hpp
/// @brief Declares the NotSupportedException class.

#include <Locus/Exceptions/Exception.hpp>

namespace Locus::Exceptions
{
    /// @class NotSupportedException
    /// @brief Exception thrown when an operation is not available for the object it was invoked on.
    ///
    /// @details
    /// Raised, for instance, when an inheritance transform is requested from a handle that was
    /// not created as inheritable. It signals a programming error and is not meant to be retried.
    class NotSupportedException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit NotSupportedException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a string message.
        /// @param message The exception message.
        explicit NotSupportedException(const std::string& message)
            : Exception(message)
        {
        }

        NotSupportedException(const NotSupportedException& other) noexcept            = default;
        NotSupportedException& operator=(const NotSupportedException& other) noexcept = default;

        ~NotSupportedException() noexcept override = default;
    };
}// namespace Locus::Exceptions
