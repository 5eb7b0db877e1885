#include <openssl/x509.h>
#include <openssl/crypto.h>
#include <ecsuite/crypto/cert_name.hpp>
#include <ecsuite/crypto/exception.hpp>

namespace ecsuite::crypto
{

X509NamePtr CertName::deepCopy(const X509Name* name)
{
    return X509NamePtr{X509_NAME_dup(name)};
}

bool CertName::isEqual(const X509Name* a, const X509Name* b)
{
    return (0 == X509_NAME_cmp(a, b));
}

std::string CertName::toString(const X509Name* name)
{
    char* oneline = X509_NAME_oneline(name, nullptr, 0);
    ThrowIfTrue(oneline == nullptr);

    std::string result(oneline);
    OPENSSL_free(oneline);
    return result;
}

std::string CertName::entryValue(const X509Name* name, int nid)
{
    auto loc = X509_NAME_get_index_by_NID(name, nid, -1);
    if (loc < 0)
    {
        return std::string();
    }

    auto entry = X509_NAME_get_entry(name, loc);
    if (!entry)
    {
        return std::string();
    }

    auto value = X509_NAME_ENTRY_get_data(entry);
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)), ASN1_STRING_length(value));
}

} // namespace ecsuite::crypto
