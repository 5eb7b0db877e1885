#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <string_view>

#include <casket/utils/noncopyable.hpp>

#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

class CertBuilder final : casket::NonCopyable
{
public:
    CertBuilder();

    ~CertBuilder() noexcept;

    void reset();

    CertBuilder& setVersion(CertVersion version);

    CertBuilder& setSubjectName(const X509Name* name);

    CertBuilder& setSubjectName(const std::string& name);

    CertBuilder& setIssuerName(const X509Name* name);

    CertBuilder& setIssuerName(const std::string& name);

    CertBuilder& setPublicKey(Key* publicKey);

    CertBuilder& setSerialNumber(const Asn1Integer* serialNumber);

    CertBuilder& setSerialNumber(long serialNumber);

    /// @brief Sets the time validity offsets are counted from (the current time by default).
    CertBuilder& setReferenceTime(std::time_t time);

    CertBuilder& setNotBefore(std::chrono::seconds offsetSec);

    CertBuilder& setNotAfter(std::chrono::seconds offsetSec);

    CertBuilder& addExtension(X509Ext* ext);

    CertBuilder& addExtension(int extNid, std::string_view value);

    CertBuilder& addExtension(std::string_view name, std::string_view value);

    CertBuilder& selfSigned(Key* subjectPrivateKey);

    /// @brief Signs the certificate.
    ///
    /// @param[in] digest Signature digest, the key's default digest when null.
    ///
    X509CertPtr build(const Hash* digest = nullptr);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ecsuite::crypto
