#include <algorithm>
#include <iterator>
#include <vector>

#include <ecsuite/crypto/cert_name_builder.hpp>
#include <ecsuite/crypto/exception.hpp>

#include <casket/utils/exception.hpp>

namespace
{

using Rdn = std::vector<std::pair<std::string, std::string>>;

/// Splits on unescaped @p delim. Escapes are kept so that nested splits see them.
std::vector<std::string> splitEscaped(const std::string& str, char delim)
{
    std::vector<std::string> result;
    std::string token;

    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c == '\\' && i + 1 < str.size())
        {
            token += c;
            token += str[++i];
        }
        else if (c == delim)
        {
            result.push_back(std::move(token));
            token.clear();
        }
        else
        {
            token += c;
        }
    }
    result.push_back(std::move(token));

    return result;
}

size_t findUnescaped(const std::string& str, char c)
{
    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '\\')
        {
            ++i;
        }
        else if (str[i] == c)
        {
            return i;
        }
    }
    return std::string::npos;
}

std::string unescape(const std::string& str)
{
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '\\' && i + 1 < str.size())
        {
            ++i;
        }
        result += str[i];
    }
    return result;
}

std::string trimmed(const std::string& str)
{
    const auto first = str.find_first_not_of(' ');
    if (first == std::string::npos)
    {
        return std::string();
    }
    auto last = str.find_last_not_of(' ');
    // Keep an escaped trailing space.
    if (last + 1 < str.size() && str[last] == '\\')
    {
        ++last;
    }
    return str.substr(first, last - first + 1);
}

Rdn parseRdn(const std::string& DN, const std::string& rdn)
{
    Rdn result;

    for (auto&& attribute : splitEscaped(rdn, '+'))
    {
        const auto separator = findUnescaped(attribute, '=');
        casket::ThrowIfTrue(separator == std::string::npos,
                            "Invalid format of DN: '" + DN + "'. Expected <ENTRY=VALUE> pairs");

        auto field = unescape(trimmed(attribute.substr(0, separator)));
        auto value = unescape(trimmed(attribute.substr(separator + 1)));
        casket::ThrowIfTrue(field.empty(), "Invalid format of DN: '" + DN + "'. Empty attribute type");

        result.emplace_back(std::move(field), std::move(value));
    }

    return result;
}

ecsuite::crypto::X509NamePtr buildName(const std::vector<Rdn>& rdns)
{
    ecsuite::crypto::CertNameBuilder builder;

    for (const auto& rdn : rdns)
    {
        builder.addEntry(rdn.front().first, rdn.front().second);
        for (auto it = std::next(rdn.begin()); it != rdn.end(); ++it)
        {
            builder.appendToLastEntry(it->first, it->second);
        }
    }

    return builder.build();
}

} // namespace

namespace ecsuite::crypto
{

CertNameBuilder::CertNameBuilder()
{
    reset();
}

CertNameBuilder& CertNameBuilder::addEntry(const std::string& field, const std::string& value)
{
    auto data = reinterpret_cast<const unsigned char*>(value.data());
    int sz = static_cast<int>(value.size());

    crypto::ThrowIfFalse(X509_NAME_add_entry_by_txt(name(), field.data(), MBSTRING_UTF8, data, sz, -1, 0),
                         "unable to add DN entry '" + field + "'");
    return *this;
}

CertNameBuilder& CertNameBuilder::appendToLastEntry(const std::string& field, const std::string& value)
{
    casket::ThrowIfTrue(X509_NAME_entry_count(name()) == 0, "no RDN to extend with '" + field + "'");

    auto data = reinterpret_cast<const unsigned char*>(value.data());
    int sz = static_cast<int>(value.size());

    crypto::ThrowIfFalse(X509_NAME_add_entry_by_txt(name(), field.data(), MBSTRING_UTF8, data, sz, -1, -1),
                         "unable to add DN entry '" + field + "'");
    return *this;
}

X509NamePtr CertNameBuilder::build()
{
    auto result = std::move(name_);
    reset();
    return result;
}

void CertNameBuilder::reset()
{
    name_.reset(X509_NAME_new());
    crypto::ThrowIfTrue(name_ == nullptr);
}

X509NamePtr CertNameBuilder::fromString(const std::string& DN)
{
    casket::ThrowIfTrue(DN.empty(), "DN can't be empty");

    if (DN.front() == '/')
    {
        return fromOneline(DN);
    }
    return fromLdap(DN);
}

X509NamePtr CertNameBuilder::fromOneline(const std::string& DN)
{
    casket::ThrowIfTrue(DN.empty() || DN.front() != '/',
                        "Invalid format of DN: '" + DN + "'. Expected format: /<ENTRY=VALUE>[/<ENTRY=VALUE>...]");

    auto&& rdns = splitEscaped(DN.substr(1), '/');

    std::vector<Rdn> parsed;
    parsed.reserve(rdns.size());
    for (auto&& rdn : rdns)
    {
        parsed.push_back(parseRdn(DN, rdn));
    }

    return buildName(parsed);
}

X509NamePtr CertNameBuilder::fromLdap(const std::string& DN)
{
    casket::ThrowIfTrue(DN.empty(), "DN can't be empty");

    auto&& rdns = splitEscaped(DN, ',');

    std::vector<Rdn> parsed;
    parsed.reserve(rdns.size());
    for (auto&& rdn : rdns)
    {
        parsed.push_back(parseRdn(DN, rdn));
    }

    // RFC 2253 lists the most significant RDN last.
    std::reverse(parsed.begin(), parsed.end());

    return buildName(parsed);
}

} // namespace ecsuite::crypto
