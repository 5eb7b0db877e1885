#pragma once
#include <string>
#include <vector>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

/// @brief Elliptic-curve specific operations over EVP_PKEY handles.
class EcAsymmKey final
{
public:
    /// @brief Uncompressed point marker (X9.62, section 4.3.6).
    static constexpr uint8_t kUncompressedPoint{0x04};

    static std::string getGroupName(const Key* key);

    /// @brief Bit length of the order of the key's group.
    static size_t getOrderBits(const Key* key);

    static bool hasPrivateKey(const Key* key);

    static bool hasPublicKey(const Key* key);

    /// @brief Creates a key with the same group and public point but no private scalar.
    static KeyPtr derivePublicKey(const Key* key);

    /// @brief Encodes the public point as 0x04 || X || Y.
    ///
    /// Both coordinates are left-padded with zeros to ceil(orderBits / 8) bytes,
    /// so the result is always 1 + 2 * ceil(orderBits / 8) bytes long.
    static std::vector<uint8_t> getUncompressedPoint(const Key* key);
};

} // namespace ecsuite::crypto
