#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/store.h>
#include <openssl/err.h>
#include <openssl/core_names.h>

#include <ecsuite/crypto/asymm_key.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/store_loader.hpp>

#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/error_code.hpp>

namespace
{

// Encrypted private keys are out of scope: never prompt for a passphrase.
int noPassphrase(char*, int, int, void*)
{
    return 0;
}

} // namespace

namespace ecsuite::crypto
{

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    return EVP_PKEY_is_a(key, alg.data());
}

bool AsymmKey::isEqual(const Key* a, const Key* b)
{
    return 0 < EVP_PKEY_eq(a, b);
}

KeyPtr AsymmKey::fromStorage(KeyType keyType, const std::string& uri)
{
    using LoadFn = Key* (*)(const StoreInfo*);

    int loadType;
    LoadFn loadFn;

    switch (keyType)
    {
    case KeyType::Private:
    {
        loadType = OSSL_STORE_INFO_PKEY;
        loadFn = &OSSL_STORE_INFO_get1_PKEY;
    }
    break;

    case KeyType::Public:
    {
        loadType = OSSL_STORE_INFO_PUBKEY;
        loadFn = &OSSL_STORE_INFO_get1_PUBKEY;
    }
    break;

    default:
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported key type");
    }

    StoreLoader storeLoader(uri);
    auto storeInfo = storeLoader.load(loadType);
    auto result = KeyPtr{loadFn(storeInfo)};
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

KeyPtr AsymmKey::fromFile(KeyType keyType, const std::filesystem::path& path)
{
    return fromStorage(keyType, "file:" + std::filesystem::absolute(path).string());
}

KeyPtr AsymmKey::fromPem(KeyType keyType, Bio* in)
{
    auto& manager = CryptoManager::getInstance();
    KeyPtr result;

    if (keyType == KeyType::Public)
    {
        result.reset(PEM_read_bio_PUBKEY_ex(in, nullptr, &noPassphrase, nullptr, manager.libraryContext(),
                                            manager.propertyQuery()));
    }
    else
    {
        result.reset(PEM_read_bio_PrivateKey_ex(in, nullptr, &noPassphrase, nullptr, manager.libraryContext(),
                                                manager.propertyQuery()));
    }

    crypto::ThrowIfTrue(result == nullptr, "Failed to parse key");
    return result;
}

void AsymmKey::toPem(KeyType keyType, Key* key, Bio* bio)
{
    const int ret = (keyType == KeyType::Public)
                        ? PEM_write_bio_PUBKEY(bio, key)
                        : PEM_write_bio_PKCS8PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
    crypto::ThrowIfFalse(ret, "Failed to save key");
}

std::vector<uint8_t> AsymmKey::getEncodedPublicKey(const Key* key)
{
    size_t size{0};

    ThrowIfFalse(0 < EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, nullptr, 0, &size),
                 "unable to get public key value");

    std::vector<uint8_t> publicKey(size);
    ThrowIfFalse(0 < EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, publicKey.data(),
                                                     publicKey.size(), &size));
    publicKey.resize(size);
    return publicKey;
}

} // namespace ecsuite::crypto
