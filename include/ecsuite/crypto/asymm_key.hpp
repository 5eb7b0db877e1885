#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

class AsymmKey
{
public:
    static bool isAlgorithm(const Key* key, std::string_view alg);

    static bool isEqual(const Key* a, const Key* b);

    static KeyPtr fromStorage(KeyType keyType, const std::string& uri);

    static KeyPtr fromFile(KeyType keyType, const std::filesystem::path& path);

    /// @brief Reads a PEM key; private keys may be PKCS#8 or SEC1, never encrypted.
    static KeyPtr fromPem(KeyType keyType, Bio* in);

    /// @brief Writes SubjectPublicKeyInfo or unencrypted PKCS#8 PEM.
    static void toPem(KeyType keyType, Key* key, Bio* bio);

    static std::vector<uint8_t> getEncodedPublicKey(const Key* key);
};

} // namespace ecsuite::crypto
