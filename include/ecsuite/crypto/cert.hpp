#pragma once
#include <ctime>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

class Cert final
{
public:
    static CertVersion version(const X509Cert* cert);

    static X509NamePtr subjectName(const X509Cert* cert);

    static X509NamePtr issuerName(const X509Cert* cert);

    static BigNumPtr serialNumber(const X509Cert* cert);

    static KeyPtr publicKey(const X509Cert* cert);

    static std::time_t notBefore(const X509Cert* cert);

    static std::time_t notAfter(const X509Cert* cert);

    /// @brief Checks the certificate signature against @p key.
    static bool verifySignature(X509Cert* cert, Key* key);

    static X509CertPtr fromPem(Bio* bio);

    static void toPem(X509Cert* cert, Bio* bio);
};

} // namespace ecsuite::crypto
