#pragma once
#include <string>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

/// @brief Accessors for PKCS#10 certificate signing requests.
class CertRequest final
{
public:
    static long version(const X509Req* req);

    static X509NamePtr subjectName(const X509Req* req);

    static KeyPtr publicKey(const X509Req* req);

    /// @brief Returns the requested extensions (empty stack if there are none).
    static CertExtOwningStackPtr extensions(X509Req* req);

    /// @brief Checks the request signature against @p key.
    static bool verifySignature(X509Req* req, Key* key);

    static X509ReqPtr fromPem(Bio* bio);

    static void toPem(X509Req* req, Bio* bio);
};

} // namespace ecsuite::crypto
