#pragma once
#include <string>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

class CertName final
{
public:
    static X509NamePtr deepCopy(const X509Name* name);

    static bool isEqual(const X509Name* a, const X509Name* b);

    /// @brief Renders @p name in one-line form, e.g. "/O=Org/CN=name".
    static std::string toString(const X509Name* name);

    /// @brief Returns the value of the first entry with @p nid or an empty string.
    static std::string entryValue(const X509Name* name, int nid);
};

} // namespace ecsuite::crypto
