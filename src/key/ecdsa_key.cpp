#include <chrono>
#include <ctime>

#include <openssl/objects.h>

#include <casket/log/log_manager.hpp>

#include <ecsuite/key/ecdsa_key.hpp>
#include <ecsuite/key/exception.hpp>

#include <ecsuite/crypto/asymm_key.hpp>
#include <ecsuite/crypto/bio.hpp>
#include <ecsuite/crypto/cert.hpp>
#include <ecsuite/crypto/cert_builder.hpp>
#include <ecsuite/crypto/cert_request.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/ec_asymm_key.hpp>
#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/hash_traits.hpp>
#include <ecsuite/crypto/req_builder.hpp>

using namespace ecsuite::crypto;

namespace
{

// Identity is always SHA-256, whatever the curve size.
constexpr const char* kIdentityDigest{"SHA256"};
constexpr const char* kSignatureDigest{"SHA256"};

// Self-signed certificates serve short-lived bootstrap identities only.
constexpr long kSelfSignedSerial{4};
constexpr std::chrono::seconds kNotBeforeOffset{-5};
constexpr std::chrono::seconds kNotAfterOffset{60};

constexpr std::string_view kPublicKeyPemHeader{"-----BEGIN PUBLIC KEY-----"};

} // namespace

namespace ecsuite
{

std::shared_ptr<EcdsaKey> EcdsaKey::create(KeyPtr handle)
{
    if (!handle)
    {
        throw KeyException(KeyError::InvalidKey, "The key handle is required, whether for a public or a private key");
    }

    if (!AsymmKey::isAlgorithm(handle, "EC"))
    {
        throw KeyException(KeyError::InvalidKey, "This key implementation only supports EC keys");
    }

    if (!EcAsymmKey::hasPublicKey(handle))
    {
        throw KeyException(KeyError::InvalidKey, "The EC key must have a public point");
    }

    if (!EcAsymmKey::hasPrivateKey(handle))
    {
        return std::shared_ptr<EcdsaKey>(new EcdsaKey(PublicKeyData{std::move(handle)}));
    }

    KeyPtr publicHandle;
    try
    {
        publicHandle = EcAsymmKey::derivePublicKey(handle);
    }
    catch (const CryptoException& e)
    {
        throw KeyException(KeyError::InvalidKey, std::string("Unable to derive the public key: ") + e.what());
    }

    auto publicKey = create(std::move(publicHandle));
    return std::shared_ptr<EcdsaKey>(new EcdsaKey(PrivateKeyData{std::move(handle), std::move(publicKey)}));
}

std::shared_ptr<EcdsaKey> EcdsaKey::fromPem(std::string_view pem)
{
    const auto keyType = (pem.find(kPublicKeyPemHeader) != std::string_view::npos) ? KeyType::Public
                                                                                     : KeyType::Private;
    KeyPtr key;
    try
    {
        auto bio = BioTraits::createMemoryReader(pem);
        key = AsymmKey::fromPem(keyType, bio);
    }
    catch (const CryptoException& e)
    {
        throw KeyException(KeyError::InvalidKey, std::string("Unable to parse PEM key: ") + e.what());
    }

    return create(std::move(key));
}

std::shared_ptr<EcdsaKey> EcdsaKey::fromFile(KeyType keyType, const std::filesystem::path& path)
{
    KeyPtr key;
    try
    {
        key = AsymmKey::fromFile(keyType, path);
    }
    catch (const CryptoException& e)
    {
        throw KeyException(KeyError::InvalidKey, "Unable to load key from '" + path.string() + "': " + e.what());
    }

    return create(std::move(key));
}

EcdsaKey::EcdsaKey(KeyData data)
    : data_(std::move(data))
{
}

EcdsaKey::~EcdsaKey() noexcept
{
}

bool EcdsaKey::isSymmetric() const
{
    return false;
}

bool EcdsaKey::isPrivate() const
{
    return std::holds_alternative<PrivateKeyData>(data_);
}

std::shared_ptr<const CryptoKey> EcdsaKey::getPublicKey() const
{
    return publicKey();
}

std::vector<uint8_t> EcdsaKey::getIdentity() const
{
    try
    {
        auto point = EcAsymmKey::getUncompressedPoint(publicKey()->handle());
        auto digest = CryptoManager::getInstance().fetchDigest(kIdentityDigest);
        return HashTraits::digest(digest, point);
    }
    catch (const CryptoException& e)
    {
        throw KeyException(KeyError::InvalidKey, std::string("Unable to compute key identity: ") + e.what());
    }
}

HsmHandle EcdsaKey::getHandleForHsm() const
{
    throw KeyException(KeyError::UnsupportedOperation, "This key does not have a PKCS#11 handle");
}

std::string EcdsaKey::generateCsr(const std::string& subjectName, const std::vector<CertExtension>& extensions) const
{
    const auto& privateData = requirePrivate("A CSR");

    try
    {
        ReqBuilder builder;
        builder.setSubjectName(subjectName).setPublicKey(publicKey()->handle()).signedBy(privateData.key);
        for (const auto& extension : extensions)
        {
            builder.addExtension(extension.name, extension.value);
        }

        auto digest = CryptoManager::getInstance().fetchDigest(kSignatureDigest);
        auto req = builder.build(digest);

        auto bio = BioTraits::createMemoryBuffer();
        CertRequest::toPem(req, bio);

        casket::debug("CSR generated for '{}'", subjectName);
        return BioTraits::getMemoryDataAsString(bio);
    }
    catch (const std::exception& e)
    {
        casket::error("CSR generation for '{}' failed: {}", subjectName, e.what());
        throw KeyException(KeyError::CsrGeneration, std::string("Unable to generate CSR: ") + e.what());
    }
}

std::string EcdsaKey::generateSelfSignedCertificate(const CertificateOptions& options) const
{
    const auto& privateData = requirePrivate("An X509 certificate");

    try
    {
        CertBuilder builder;
        // clang-format off
        builder
            .selfSigned(privateData.key)
            .setVersion(CertVersion::V3)
            .setSerialNumber(kSelfSignedSerial)
            .setSubjectName(options.subjectName)
            .setIssuerName(options.subjectName)
            .setReferenceTime(std::time(nullptr))
            .setNotBefore(kNotBeforeOffset)
            .setNotAfter(kNotAfterOffset)
            .setPublicKey(publicKey()->handle())
            .addExtension(NID_basic_constraints, "critical,CA:FALSE")
            .addExtension(NID_key_usage, "digitalSignature,nonRepudiation")
            .addExtension(NID_ext_key_usage, "clientAuth");
        // clang-format on

        auto digest = CryptoManager::getInstance().fetchDigest(kSignatureDigest);
        auto cert = builder.build(digest);

        auto bio = BioTraits::createMemoryBuffer();
        Cert::toPem(cert, bio);

        casket::debug("Self-signed certificate generated for '{}'", options.subjectName);
        return BioTraits::getMemoryDataAsString(bio);
    }
    catch (const std::exception& e)
    {
        casket::error("Certificate generation for '{}' failed: {}", options.subjectName, e.what());
        throw KeyException(KeyError::CertificateGeneration,
                           std::string("Unable to generate X509 certificate: ") + e.what());
    }
}

std::string EcdsaKey::toBytes() const
{
    try
    {
        auto bio = BioTraits::createMemoryBuffer();
        AsymmKey::toPem(isPrivate() ? KeyType::Private : KeyType::Public, handle(), bio);
        return BioTraits::getMemoryDataAsString(bio);
    }
    catch (const CryptoException& e)
    {
        throw KeyException(KeyError::InvalidKey, std::string("Unable to encode key: ") + e.what());
    }
}

Key* EcdsaKey::handle() const noexcept
{
    return std::visit([](const auto& data) -> Key* { return data.key; }, data_);
}

std::string EcdsaKey::curveName() const
{
    return EcAsymmKey::getGroupName(handle());
}

std::shared_ptr<const EcdsaKey> EcdsaKey::publicKey() const
{
    if (const auto* privateData = std::get_if<PrivateKeyData>(&data_))
    {
        return privateData->publicKey;
    }
    return shared_from_this();
}

const EcdsaKey::PrivateKeyData& EcdsaKey::requirePrivate(std::string_view operation) const
{
    const auto* privateData = std::get_if<PrivateKeyData>(&data_);
    if (!privateData)
    {
        throw KeyException(KeyError::NotPrivateKey,
                           std::string(operation) + " cannot be generated from a public key");
    }
    return *privateData;
}

} // namespace ecsuite
