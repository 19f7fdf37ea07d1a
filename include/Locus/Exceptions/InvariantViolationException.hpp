#pragma once

/// @file InvariantViolationException.hpp
/// @brief Declares the InvariantViolationException class.

#include <Locus/Exceptions/Exception.hpp>

namespace Locus::Exceptions
{
    /// @class InvariantViolationException
    /// @brief Exception thrown when a container detects that its internal structure is corrupt.
    ///
    /// @details
    /// Only raised by explicit consistency checks (for example `OwnerTable::CheckInvariants`).
    /// Correct use of the library never produces it; seeing one indicates a bug.
    class InvariantViolationException : public Exception
    {
    public:
        explicit InvariantViolationException(const char* message)
            : Exception(message)
        {
        }

        explicit InvariantViolationException(const std::string& message)
            : Exception(message)
        {
        }

        ~InvariantViolationException() noexcept override = default;
    };
}// namespace Locus::Exceptions
