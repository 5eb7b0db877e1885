#include <string>
#include <openssl/store.h>
#include <openssl/ui.h>
#include <ecsuite/crypto/store_loader.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/exception.hpp>

namespace
{

std::string storeInfoTypeToStr(int type)
{
    switch (type)
    {
    case OSSL_STORE_INFO_PARAMS:
        return "PARAMS";
    case OSSL_STORE_INFO_PUBKEY:
        return "PUBKEY";
    case OSSL_STORE_INFO_PKEY:
        return "PKEY";
    case OSSL_STORE_INFO_CERT:
        return "CERT";
    default:
        return "UNKNOWN(" + std::to_string(type) + ")";
    }
}

} // namespace

namespace ecsuite::crypto
{

StoreLoader::StoreLoader(std::string_view uri)
{
    auto& manager = CryptoManager::getInstance();
    ctx_.reset(OSSL_STORE_open_ex(std::string(uri).c_str(), manager.libraryContext(), manager.propertyQuery(),
                                  UI_null(), nullptr, nullptr, nullptr, nullptr));
    crypto::ThrowIfTrue(ctx_ == nullptr, "failed to open store '" + std::string(uri) + "'");
}

StoreInfoPtr StoreLoader::load(int type)
{
    crypto::ThrowIfFalse(OSSL_STORE_expect(ctx_, type));

    StoreInfoPtr result;
    while (!result && !OSSL_STORE_eof(ctx_))
    {
        result.reset(OSSL_STORE_load(ctx_));
        crypto::ThrowIfTrue(OSSL_STORE_error(ctx_), "failed to load object of type: " + storeInfoTypeToStr(type));
    }
    crypto::ThrowIfTrue(result == nullptr, "no object of type: " + storeInfoTypeToStr(type));
    return result;
}

} // namespace ecsuite::crypto
