#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <casket/utils/noncopyable.hpp>

#include <ecsuite/crypto/pointers.hpp>
#include <ecsuite/key/crypto_key.hpp>

namespace ecsuite
{

/// @brief ECDSA key, either public-only or a private key with its public point.
///
/// Instances are always owned by std::shared_ptr, so getPublicKey() on a
/// public-only key can hand out the same object.
class EcdsaKey final : public CryptoKey,
                       public std::enable_shared_from_this<EcdsaKey>,
                       casket::NonCopyable
{
public:
    /// @brief Wraps an EC key handle.
    ///
    /// The key is private when the handle carries a private scalar.
    ///
    /// @throw KeyException with KeyError::InvalidKey if the handle is null,
    ///        is not an EC key or has no public point.
    static std::shared_ptr<EcdsaKey> create(crypto::KeyPtr handle);

    /// @brief Parses a PEM public key (SubjectPublicKeyInfo) or private key (PKCS#8, SEC1).
    static std::shared_ptr<EcdsaKey> fromPem(std::string_view pem);

    static std::shared_ptr<EcdsaKey> fromFile(crypto::KeyType keyType, const std::filesystem::path& path);

    ~EcdsaKey() noexcept;

    bool isSymmetric() const override;

    bool isPrivate() const override;

    std::shared_ptr<const CryptoKey> getPublicKey() const override;

    std::vector<uint8_t> getIdentity() const override;

    HsmHandle getHandleForHsm() const override;

    std::string generateCsr(const std::string& subjectName,
                            const std::vector<CertExtension>& extensions = {}) const override;

    std::string generateSelfSignedCertificate(const CertificateOptions& options) const override;

    std::string toBytes() const override;

    /// @brief Underlying OpenSSL key, owned by this object.
    crypto::Key* handle() const noexcept;

    std::string curveName() const;

private:
    struct PublicKeyData
    {
        crypto::KeyPtr key;
    };

    struct PrivateKeyData
    {
        crypto::KeyPtr key;
        std::shared_ptr<const EcdsaKey> publicKey;
    };

    using KeyData = std::variant<PublicKeyData, PrivateKeyData>;

    explicit EcdsaKey(KeyData data);

    std::shared_ptr<const EcdsaKey> publicKey() const;

    const PrivateKeyData& requirePrivate(std::string_view operation) const;

private:
    KeyData data_;
};

} // namespace ecsuite
