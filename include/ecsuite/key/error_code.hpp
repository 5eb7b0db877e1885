/// @file
/// @brief Error codes reported by key implementations.

#pragma once
#include <string>
#include <system_error>

namespace ecsuite
{

enum class KeyError
{
    InvalidKey = 1,        ///< Malformed or absent key handle.
    NotPrivateKey,         ///< Private-key operation invoked on a public-only key.
    UnsupportedOperation,  ///< Operation not available for this key type.
    CsrGeneration,         ///< Certificate signing request could not be produced.
    CertificateGeneration, ///< Certificate could not be produced.
};

/// @brief Error category of ::KeyError values.
class KeyErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;

    static KeyErrorCategory& getInstance();

private:
    KeyErrorCategory() = default;
    ~KeyErrorCategory() = default;
};

std::error_code MakeErrorCode(KeyError e);

} // namespace ecsuite
