#include <ecsuite/crypto/crypto_manager.hpp>
#include <ecsuite/crypto/exception.hpp>

namespace ecsuite::crypto
{

struct CryptoManager::Impl final
{
public:
    Impl()
        : libctx(nullptr)
        , propq(nullptr)
    {
    }

    ~Impl() noexcept
    {
    }

    OSSL_LIB_CTX* libctx;
    const char* propq;
};

CryptoManager::CryptoManager()
    : impl_(std::make_unique<Impl>())
{
}

CryptoManager& CryptoManager::getInstance()
{
    static CryptoManager instance;
    return instance;
}

CryptoManager::~CryptoManager() noexcept
{
}

LibContext* CryptoManager::libraryContext() const noexcept
{
    return impl_->libctx;
}

const char* CryptoManager::propertyQuery() const noexcept
{
    return impl_->propq;
}

HashPtr CryptoManager::fetchDigest(std::string_view algorithm)
{
    auto digest = HashPtr(EVP_MD_fetch(impl_->libctx, algorithm.data(), impl_->propq));
    ThrowIfTrue(digest == nullptr);
    return digest;
}

KeyCtxPtr CryptoManager::createKeyContext(std::string_view algorithm)
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_name(impl_->libctx, algorithm.data(), impl_->propq));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

} // namespace ecsuite::crypto
