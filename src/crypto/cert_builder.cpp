#include <limits>
#include <optional>
#include <string>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/error_code.hpp>

#include <ecsuite/crypto/cert.hpp>
#include <ecsuite/crypto/cert_builder.hpp>
#include <ecsuite/crypto/cert_name_builder.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>

using namespace ecsuite;

namespace
{

crypto::BigNumPtr randBigNum(size_t bits = 64)
{
    crypto::BigNumPtr ret(BN_new());
    crypto::ThrowIfTrue(ret == nullptr);

    constexpr size_t limit = std::numeric_limits<int>::max();
    crypto::ThrowIfFalse(0 < BN_rand(ret, (bits > limit ? static_cast<int>(limit) : static_cast<int>(bits)), 0, 0));
    return ret;
}

crypto::Asn1IntegerPtr convertToAsn1(const crypto::BigNum* num)
{
    crypto::Asn1IntegerPtr ret(ASN1_INTEGER_new());
    crypto::ThrowIfTrue(ret == nullptr);
    crypto::ThrowIfFalse(BN_to_ASN1_INTEGER(num, ret));
    return ret;
}

} // namespace

namespace ecsuite::crypto
{

struct CertBuilder::Impl
{
    X509CertPtr cert;
    X509V3Ctx ctx;
    KeyPtr signingKey;
    std::optional<std::time_t> referenceTime;

    Impl()
    {
        reset();
    }

    void reset()
    {
        auto& manager = CryptoManager::getInstance();
        cert.reset(X509_new_ex(manager.libraryContext(), manager.propertyQuery()));
        crypto::ThrowIfTrue(cert == nullptr);

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, nullptr, nullptr, X509V3_CTX_REPLACE);

        signingKey.reset();
        referenceTime.reset();
    }

    std::time_t* baseTime()
    {
        return referenceTime ? &referenceTime.value() : nullptr;
    }
};

CertBuilder::CertBuilder()
    : impl_(std::make_unique<CertBuilder::Impl>())
{
}

CertBuilder::~CertBuilder() noexcept
{
}

void CertBuilder::reset()
{
    impl_->reset();
}

CertBuilder& CertBuilder::setVersion(CertVersion version)
{
    crypto::ThrowIfFalse(X509_set_version(impl_->cert, static_cast<long>(version)));
    return *this;
}

CertBuilder& CertBuilder::setSubjectName(const X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_subject_name(impl_->cert, name));
    return *this;
}

CertBuilder& CertBuilder::setSubjectName(const std::string& name)
{
    auto decodedName = CertNameBuilder::fromString(name);
    return setSubjectName(decodedName);
}

CertBuilder& CertBuilder::setIssuerName(const X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_issuer_name(impl_->cert, name));
    return *this;
}

CertBuilder& CertBuilder::setIssuerName(const std::string& name)
{
    auto decodedName = CertNameBuilder::fromString(name);
    return setIssuerName(decodedName);
}

CertBuilder& CertBuilder::setPublicKey(Key* subjectPublicKey)
{
    crypto::ThrowIfFalse(X509_set_pubkey(impl_->cert, subjectPublicKey));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(const Asn1Integer* serialNumber)
{
    crypto::ThrowIfFalse(X509_set_serialNumber(impl_->cert, const_cast<Asn1Integer*>(serialNumber)));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(long serialNumber)
{
    crypto::ThrowIfFalse(ASN1_INTEGER_set(X509_get_serialNumber(impl_->cert), serialNumber));
    return *this;
}

CertBuilder& CertBuilder::setReferenceTime(std::time_t time)
{
    impl_->referenceTime = time;
    return *this;
}

CertBuilder& CertBuilder::setNotBefore(std::chrono::seconds offsetSec)
{
    crypto::ThrowIfFalse(X509_time_adj(X509_getm_notBefore(impl_->cert), offsetSec.count(), impl_->baseTime()));
    return *this;
}

CertBuilder& CertBuilder::setNotAfter(std::chrono::seconds offsetSec)
{
    crypto::ThrowIfFalse(X509_time_adj(X509_getm_notAfter(impl_->cert), offsetSec.count(), impl_->baseTime()));
    return *this;
}

CertBuilder& CertBuilder::addExtension(X509Ext* ext)
{
    crypto::ThrowIfFalse(X509_add_ext(impl_->cert, ext, -1));
    return *this;
}

CertBuilder& CertBuilder::addExtension(int extNid, std::string_view value)
{
    X509ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &impl_->ctx, extNid, std::string(value).c_str()));
    crypto::ThrowIfTrue(ext == nullptr, "invalid extension value '" + std::string(value) + "'");
    return addExtension(ext);
}

CertBuilder& CertBuilder::addExtension(std::string_view name, std::string_view value)
{
    X509ExtPtr ext(X509V3_EXT_conf(nullptr, &impl_->ctx, std::string(name).c_str(), std::string(value).c_str()));
    crypto::ThrowIfTrue(ext == nullptr, "invalid extension '" + std::string(name) + "'");
    return addExtension(ext);
}

CertBuilder& CertBuilder::selfSigned(Key* subjectPrivateKey)
{
    crypto::ThrowIfFalse(EVP_PKEY_up_ref(subjectPrivateKey));
    impl_->signingKey = KeyPtr(subjectPrivateKey);

    X509V3_set_ctx(&impl_->ctx, impl_->cert, impl_->cert, nullptr, nullptr, X509V3_CTX_REPLACE);
    return *this;
}

X509CertPtr CertBuilder::build(const Hash* digest)
{
    crypto::ThrowIfTrue(impl_->signingKey == nullptr, "signing key not specified");

    auto serial = Cert::serialNumber(impl_->cert);
    if (BN_is_zero(serial))
    {
        auto n = ::randBigNum();
        auto s = ::convertToAsn1(n);
        setSerialNumber(s);
    }

    const EVP_MD* md = digest;
    if (md == nullptr)
    {
        int mdNid{NID_undef};
        crypto::ThrowIfFalse(0 < EVP_PKEY_get_default_digest_nid(impl_->signingKey, &mdNid));

        md = EVP_get_digestbynid(mdNid);
        crypto::ThrowIfTrue(md == nullptr);
    }
    crypto::ThrowIfFalse(0 < X509_sign(impl_->cert, impl_->signingKey, md), "unable to sign certificate");

    auto result = std::move(impl_->cert);
    reset();

    return result;
}

} // namespace ecsuite::crypto
