#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <casket/utils/noncopyable.hpp>

#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto
{

/// @brief Builds PKCS#10 certificate signing requests.
class ReqBuilder final : casket::NonCopyable
{
public:
    ReqBuilder();

    ~ReqBuilder() noexcept;

    void reset();

    ReqBuilder& setSubjectName(const X509Name* name);

    ReqBuilder& setSubjectName(const std::string& name);

    ReqBuilder& setPublicKey(Key* publicKey);

    /// @brief Queues an extension for the extensionRequest attribute.
    ReqBuilder& addExtension(X509Ext* ext);

    ReqBuilder& addExtension(int extNid, std::string_view value);

    ReqBuilder& addExtension(std::string_view name, std::string_view value);

    ReqBuilder& signedBy(Key* subjectPrivateKey);

    /// @brief Signs the request.
    ///
    /// @param[in] digest Signature digest, the key's default digest when null.
    ///
    X509ReqPtr build(const Hash* digest = nullptr);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ecsuite::crypto
