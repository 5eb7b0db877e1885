#include <string>
#include <openssl/evp.h>
#include <openssl/core_names.h>

#include <ecsuite/crypto/asymm_keygen.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/exception.hpp>

using namespace ecsuite;

namespace
{

crypto::KeyPtr generateWithParams(const char* name, const OSSL_PARAM* params)
{
    EVP_PKEY* pkey{nullptr};
    auto ctx = crypto::CryptoManager::getInstance().createKeyContext(name);
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_params(ctx, params));
    crypto::ThrowIfFalse(0 < EVP_PKEY_generate(ctx, &pkey));
    return crypto::KeyPtr{pkey};
}

} // namespace

namespace ecsuite::crypto::akey
{

namespace ec
{

KeyPtr generate(std::string_view groupName)
{
    std::string group(groupName);
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};

    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0);

    return ::generateWithParams("EC", params);
}

} // namespace ec

} // namespace ecsuite::crypto::akey
