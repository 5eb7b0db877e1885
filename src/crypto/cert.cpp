#include <string>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <ecsuite/crypto/cert.hpp>
#include <ecsuite/crypto/cert_name.hpp>

#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/error_code.hpp>

using namespace ecsuite::crypto;

namespace
{

ECSUITE_DEFINE_UNIQUE_PTR(Asn1TimePtr, Asn1Time, ASN1_TIME_free);

std::time_t asn1TimeToEpoch(const Asn1Time* asn1Time)
{
    Asn1TimePtr epoch{ASN1_TIME_set(nullptr, 0)};
    ThrowIfTrue(epoch == nullptr);

    int days{0};
    int seconds{0};
    if (!ASN1_TIME_diff(&days, &seconds, epoch, asn1Time))
    {
        throw CryptoException(TranslateError(ERR_R_OPERATION_FAIL), "Cannot convert ASN1_TIME to epoch");
    }

    return static_cast<std::time_t>(days) * 86400 + seconds;
}

} // namespace

namespace ecsuite::crypto
{

CertVersion Cert::version(const X509Cert* cert)
{
    long value = X509_get_version(cert);
    switch (value)
    {
    case static_cast<long>(CertVersion::V1):
    case static_cast<long>(CertVersion::V2):
    case static_cast<long>(CertVersion::V3):
        return static_cast<CertVersion>(value);
    default:
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT),
                              "Unsupported version of certificate: " + std::to_string(value));
    }
}

X509NamePtr Cert::subjectName(const X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

X509NamePtr Cert::issuerName(const X509Cert* cert)
{
    auto name = X509_get_issuer_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

BigNumPtr Cert::serialNumber(const X509Cert* cert)
{
    const Asn1Integer* sn = X509_get0_serialNumber(cert);
    crypto::ThrowIfTrue(sn == nullptr);

    BigNumPtr result{ASN1_INTEGER_to_BN(sn, nullptr)};
    crypto::ThrowIfTrue(result == nullptr);
    return result;
}

KeyPtr Cert::publicKey(const X509Cert* cert)
{
    auto result = X509_get_pubkey(const_cast<X509Cert*>(cert));
    crypto::ThrowIfTrue(result == nullptr);

    return KeyPtr{result};
}

std::time_t Cert::notBefore(const X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notBefore(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

std::time_t Cert::notAfter(const X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notAfter(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

bool Cert::verifySignature(X509Cert* cert, Key* key)
{
    int ret = X509_verify(cert, key);
    crypto::ThrowIfTrue(ret < 0, "unable to verify certificate signature");
    ERR_clear_error();
    return ret == 1;
}

X509CertPtr Cert::fromPem(Bio* bio)
{
    X509CertPtr result{PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)};
    crypto::ThrowIfTrue(result == nullptr, "Failed to parse certificate");
    return result;
}

void Cert::toPem(X509Cert* cert, Bio* bio)
{
    crypto::ThrowIfFalse(PEM_write_bio_X509(bio, cert), "Failed to save certificate");
}

} // namespace ecsuite::crypto
