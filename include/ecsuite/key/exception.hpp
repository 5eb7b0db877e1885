/// @file
/// @brief Exception type for key operations.

#pragma once

#include <string_view>
#include <system_error>

#include <ecsuite/key/error_code.hpp>

namespace ecsuite
{

/// @brief Raised when a key operation fails; the error code tells which precondition was violated.
class KeyException final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] e Error kind.
    /// @param[in] what Error message.
    ///
    KeyException(KeyError e, std::string_view what)
        : std::system_error(MakeErrorCode(e), std::string(what))
    {
    }

    KeyError error() const noexcept
    {
        return static_cast<KeyError>(code().value());
    }
};

} // namespace ecsuite
