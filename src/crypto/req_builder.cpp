#include <string>

#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <ecsuite/crypto/exception.hpp>
#include <ecsuite/crypto/req_builder.hpp>
#include <ecsuite/crypto/cert_name_builder.hpp>
#include <ecsuite/crypto/crypto_manager.hpp>

namespace ecsuite::crypto
{

struct ReqBuilder::Impl
{
    X509ReqPtr req;
    X509V3Ctx ctx;
    CertExtOwningStackPtr extensions;
    KeyPtr signingKey;

    Impl()
    {
        reset();
    }

    void reset()
    {
        auto& manager = CryptoManager::getInstance();
        req.reset(X509_REQ_new_ex(manager.libraryContext(), manager.propertyQuery()));
        crypto::ThrowIfTrue(req == nullptr);

        extensions.reset(sk_X509_EXTENSION_new_null());
        crypto::ThrowIfTrue(extensions == nullptr);

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, req, nullptr, 0);

        signingKey.reset();
    }
};

ReqBuilder::ReqBuilder()
    : impl_(std::make_unique<ReqBuilder::Impl>())
{
}

ReqBuilder::~ReqBuilder() noexcept
{
}

void ReqBuilder::reset()
{
    impl_->reset();
}

ReqBuilder& ReqBuilder::setSubjectName(const X509Name* name)
{
    crypto::ThrowIfFalse(X509_REQ_set_subject_name(impl_->req, name));
    return *this;
}

ReqBuilder& ReqBuilder::setSubjectName(const std::string& name)
{
    auto decodedName = CertNameBuilder::fromString(name);
    return setSubjectName(decodedName);
}

ReqBuilder& ReqBuilder::setPublicKey(Key* publicKey)
{
    crypto::ThrowIfFalse(X509_REQ_set_pubkey(impl_->req, publicKey));
    return *this;
}

ReqBuilder& ReqBuilder::addExtension(X509Ext* ext)
{
    X509ExtPtr copy(X509_EXTENSION_dup(ext));
    crypto::ThrowIfTrue(copy == nullptr);
    crypto::ThrowIfFalse(0 < sk_X509_EXTENSION_push(impl_->extensions, copy));
    copy.release();
    return *this;
}

ReqBuilder& ReqBuilder::addExtension(int extNid, std::string_view value)
{
    X509ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &impl_->ctx, extNid, std::string(value).c_str()));
    crypto::ThrowIfTrue(ext == nullptr, "invalid extension value '" + std::string(value) + "'");
    return addExtension(ext);
}

ReqBuilder& ReqBuilder::addExtension(std::string_view name, std::string_view value)
{
    X509ExtPtr ext(X509V3_EXT_conf(nullptr, &impl_->ctx, std::string(name).c_str(), std::string(value).c_str()));
    crypto::ThrowIfTrue(ext == nullptr, "invalid extension '" + std::string(name) + "'");
    return addExtension(ext);
}

ReqBuilder& ReqBuilder::signedBy(Key* subjectPrivateKey)
{
    crypto::ThrowIfFalse(EVP_PKEY_up_ref(subjectPrivateKey));
    impl_->signingKey = KeyPtr(subjectPrivateKey);
    return *this;
}

X509ReqPtr ReqBuilder::build(const Hash* digest)
{
    crypto::ThrowIfTrue(impl_->signingKey == nullptr, "signing key not specified");

    // PKCS#10 defines a single version, encoded as 0.
    crypto::ThrowIfFalse(X509_REQ_set_version(impl_->req, X509_REQ_VERSION_1));

    if (sk_X509_EXTENSION_num(impl_->extensions) > 0)
    {
        crypto::ThrowIfFalse(X509_REQ_add_extensions(impl_->req, impl_->extensions));
    }

    const EVP_MD* md = digest;
    if (md == nullptr)
    {
        int mdNid{NID_undef};
        crypto::ThrowIfFalse(0 < EVP_PKEY_get_default_digest_nid(impl_->signingKey, &mdNid));

        md = EVP_get_digestbynid(mdNid);
        crypto::ThrowIfTrue(md == nullptr);
    }
    crypto::ThrowIfFalse(0 < X509_REQ_sign(impl_->req, impl_->signingKey, md), "unable to sign request");

    auto result = std::move(impl_->req);
    reset();

    return result;
}

} // namespace ecsuite::crypto
