#pragma once
#include <string>
#include <ecsuite/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace ecsuite::crypto
{

class CertNameBuilder final : casket::NonCopyable
{
public:
    /// @brief Parses a distinguished name.
    ///
    /// Two notations are accepted:
    /// - one-line form "/C=US/O=Org/CN=name", RDNs in encoding order;
    /// - RFC 2253 form "CN=name,O=Org,C=US", most significant RDN last.
    ///
    /// In both forms '+' joins attributes of a multi-valued RDN and a backslash
    /// escapes the following character.
    static X509NamePtr fromString(const std::string& DN);

    static X509NamePtr fromOneline(const std::string& DN);

    static X509NamePtr fromLdap(const std::string& DN);

public:
    CertNameBuilder();

    ~CertNameBuilder() = default;

    void reset();

    /// @brief Appends a new RDN holding a single attribute.
    CertNameBuilder& addEntry(const std::string& field, const std::string& value);

    /// @brief Adds an attribute to the last RDN, making it multi-valued.
    CertNameBuilder& appendToLastEntry(const std::string& field, const std::string& value);

    X509NamePtr build();

    X509Name* name()
    {
        return name_;
    }

private:
    X509NamePtr name_;
};

} // namespace ecsuite::crypto
