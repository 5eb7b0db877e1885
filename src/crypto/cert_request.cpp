#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <ecsuite/crypto/cert_request.hpp>
#include <ecsuite/crypto/cert_name.hpp>

#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/error_code.hpp>

namespace ecsuite::crypto
{

long CertRequest::version(const X509Req* req)
{
    return X509_REQ_get_version(req);
}

X509NamePtr CertRequest::subjectName(const X509Req* req)
{
    auto name = X509_REQ_get_subject_name(req);
    crypto::ThrowIfTrue(name == nullptr);

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr);

    return result;
}

KeyPtr CertRequest::publicKey(const X509Req* req)
{
    auto result = X509_REQ_get_pubkey(const_cast<X509Req*>(req));
    crypto::ThrowIfTrue(result == nullptr);

    return KeyPtr{result};
}

CertExtOwningStackPtr CertRequest::extensions(X509Req* req)
{
    CertExtOwningStackPtr result{X509_REQ_get_extensions(req)};
    if (!result)
    {
        // A request without the extensionRequest attribute.
        ERR_clear_error();
        result.reset(sk_X509_EXTENSION_new_null());
        crypto::ThrowIfTrue(result == nullptr);
    }
    return result;
}

bool CertRequest::verifySignature(X509Req* req, Key* key)
{
    int ret = X509_REQ_verify(req, key);
    crypto::ThrowIfTrue(ret < 0, "unable to verify request signature");
    ERR_clear_error();
    return ret == 1;
}

X509ReqPtr CertRequest::fromPem(Bio* bio)
{
    X509ReqPtr result{PEM_read_bio_X509_REQ(bio, nullptr, nullptr, nullptr)};
    crypto::ThrowIfTrue(result == nullptr, "Failed to parse certificate request");
    return result;
}

void CertRequest::toPem(X509Req* req, Bio* bio)
{
    crypto::ThrowIfFalse(PEM_write_bio_X509_REQ(bio, req), "Failed to save certificate request");
}

} // namespace ecsuite::crypto
