#include <ecsuite/key/error_code.hpp>

namespace ecsuite
{

const char* KeyErrorCategory::name() const noexcept
{
    return "ecsuite.key";
}

std::string KeyErrorCategory::message(int value) const
{
    switch (static_cast<KeyError>(value))
    {
    case KeyError::InvalidKey:
        return "invalid key";
    case KeyError::NotPrivateKey:
        return "not a private key";
    case KeyError::UnsupportedOperation:
        return "unsupported operation";
    case KeyError::CsrGeneration:
        return "CSR generation failed";
    case KeyError::CertificateGeneration:
        return "certificate generation failed";
    default:
        return "unknown key error";
    }
}

KeyErrorCategory& KeyErrorCategory::getInstance()
{
    static KeyErrorCategory instance;
    return instance;
}

std::error_code MakeErrorCode(KeyError e)
{
    return std::error_code(static_cast<int>(e), KeyErrorCategory::getInstance());
}

} // namespace ecsuite
