#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <ecsuite/key/certificate_options.hpp>

namespace ecsuite
{

/// @brief Handle of a key object stored in a hardware security module.
using HsmHandle = unsigned long;

/// @brief Capability interface of a cryptographic key.
///
/// Implementations are immutable; every operation is const and may be called
/// concurrently on a shared instance.
///
/// Every failure is reported as KeyException; the KeyError value tells which
/// kind of failure occurred.
class CryptoKey
{
public:
    virtual ~CryptoKey() = default;

    virtual bool isSymmetric() const = 0;

    virtual bool isPrivate() const = 0;

    /// @brief Returns the public part of the key.
    ///
    /// A public key returns itself.
    virtual std::shared_ptr<const CryptoKey> getPublicKey() const = 0;

    /// @brief Returns the subject key identifier, a stable fingerprint of the public key.
    ///
    /// @throw KeyException with KeyError::InvalidKey if the public point cannot be encoded.
    virtual std::vector<uint8_t> getIdentity() const = 0;

    virtual HsmHandle getHandleForHsm() const = 0;

    /// @brief Generates a PEM-encoded PKCS#10 request.
    ///
    /// @param[in] subjectName Subject in RFC 2253 form, e.g. "CN=peer0,O=Org1".
    /// @param[in] extensions Extensions requested for the certificate.
    ///
    virtual std::string generateCsr(const std::string& subjectName,
                                    const std::vector<CertExtension>& extensions = {}) const = 0;

    /// @brief Generates a PEM-encoded self-signed certificate.
    virtual std::string generateSelfSignedCertificate(const CertificateOptions& options) const = 0;

    /// @brief Serializes the key as PEM.
    ///
    /// @throw KeyException with KeyError::InvalidKey if the key cannot be encoded.
    virtual std::string toBytes() const = 0;
};

} // namespace ecsuite
