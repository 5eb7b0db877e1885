#include <openssl/err.h>
#include <ecsuite/crypto/error_category.hpp>

namespace ecsuite::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const char* reason = ::ERR_reason_error_string(value);
    if (reason)
    {
        std::string result(reason);
        const char* lib = ::ERR_lib_error_string(value);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

} // namespace ecsuite::crypto
