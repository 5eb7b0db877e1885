#include <array>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/core_names.h>

#include <ecsuite/crypto/ec_asymm_key.hpp>
#include <ecsuite/crypto/asymm_key.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/exception.hpp>

namespace
{

/// Runs a probe that is allowed to fail without leaving entries in the error queue.
template <typename Fn>
bool probe(Fn&& fn)
{
    ERR_set_mark();
    const bool result = fn();
    ERR_pop_to_mark();
    return result;
}

} // namespace

namespace ecsuite::crypto
{

std::string EcAsymmKey::getGroupName(const Key* key)
{
    std::array<char, 80> name{};
    size_t length{0};
    ThrowIfFalse(0 < EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, name.data(), name.size(),
                                                    &length),
                 "unable to get EC group name");
    return std::string(name.data(), length);
}

size_t EcAsymmKey::getOrderBits(const Key* key)
{
    // For EC keys OpenSSL reports the bit length of the group order.
    const int bits = EVP_PKEY_get_bits(key);
    ThrowIfFalse(bits > 0, "unable to get EC group order size");
    return static_cast<size_t>(bits);
}

bool EcAsymmKey::hasPrivateKey(const Key* key)
{
    return probe([key]() {
        BigNum* scalar{nullptr};
        if (0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_PRIV_KEY, &scalar))
        {
            SecureBigNumPtr holder{scalar};
            return true;
        }
        return false;
    });
}

bool EcAsymmKey::hasPublicKey(const Key* key)
{
    return probe([key]() {
        size_t size{0};
        return 0 < EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_PUB_KEY, nullptr, 0, &size) && size > 0;
    });
}

KeyPtr EcAsymmKey::derivePublicKey(const Key* key)
{
    auto groupName = getGroupName(key);
    auto point = AsymmKey::getEncodedPublicKey(key);

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, groupName.data(), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
        OSSL_PARAM_END,
    };

    auto ctx = CryptoManager::getInstance().createKeyContext("EC");
    ThrowIfFalse(0 < EVP_PKEY_fromdata_init(ctx));

    EVP_PKEY* publicKey{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_fromdata(ctx, &publicKey, EVP_PKEY_PUBLIC_KEY, params),
                 "unable to derive EC public key");
    return KeyPtr{publicKey};
}

std::vector<uint8_t> EcAsymmKey::getUncompressedPoint(const Key* key)
{
    const size_t byteLength = (getOrderBits(key) + 7) >> 3;

    BigNum* x{nullptr};
    BigNum* y{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_EC_PUB_X, &x), "unable to get EC point X");
    BigNumPtr xHolder{x};
    ThrowIfFalse(0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_EC_PUB_Y, &y), "unable to get EC point Y");
    BigNumPtr yHolder{y};

    ThrowIfTrue(static_cast<size_t>(BN_num_bytes(x)) > byteLength, "EC point X exceeds group order size");
    ThrowIfTrue(static_cast<size_t>(BN_num_bytes(y)) > byteLength, "EC point Y exceeds group order size");

    std::vector<uint8_t> result(1 + 2 * byteLength);
    result[0] = kUncompressedPoint;
    ThrowIfFalse(0 < BN_bn2binpad(x, result.data() + 1, static_cast<int>(byteLength)));
    ThrowIfFalse(0 < BN_bn2binpad(y, result.data() + 1 + byteLength, static_cast<int>(byteLength)));
    return result;
}

} // namespace ecsuite::crypto
