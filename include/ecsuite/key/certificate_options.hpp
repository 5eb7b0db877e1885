#pragma once
#include <string>

namespace ecsuite
{

/// @brief X.509v3 extension in OpenSSL configuration syntax.
///
/// For example {"subjectAltName", "DNS:peer0.example.com"} or
/// {"keyUsage", "critical,digitalSignature"}.
struct CertExtension
{
    std::string name;
    std::string value;
};

/// @brief Settings for self-signed certificate generation.
struct CertificateOptions
{
    /// Subject and issuer name, one-line ("/CN=a/O=b") or RFC 2253 ("CN=a,O=b") form.
    std::string subjectName{"/CN=self"};
};

} // namespace ecsuite
