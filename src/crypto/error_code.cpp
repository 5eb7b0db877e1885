#include <openssl/err.h>
#include <ecsuite/crypto/error_code.hpp>
#include <ecsuite/crypto/error_category.hpp>

namespace ecsuite::crypto
{

std::error_code TranslateError(unsigned long error)
{
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }

    return std::error_code{static_cast<int>(error), ErrorCategory::getInstance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    if (err)
    {
        // Remaining entries belong to the same failure.
        ::ERR_clear_error();
        return TranslateError(err);
    }
    return TranslateError(ERR_R_OPERATION_FAIL);
}

} // namespace ecsuite::crypto
