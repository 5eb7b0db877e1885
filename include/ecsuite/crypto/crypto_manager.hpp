#pragma once
#include <memory>
#include <string_view>
#include <ecsuite/crypto/pointers.hpp>
#include <casket/utils/singleton.hpp>

namespace ecsuite::crypto
{

/// @brief Entry point for fetching OpenSSL algorithm implementations.
///
/// All fetches go through the same library context and property query,
/// so a provider configuration applies uniformly to key handling.
class CryptoManager final : casket::Singleton<CryptoManager>
{
private:
    CryptoManager();

public:
    static CryptoManager& getInstance();

    ~CryptoManager() noexcept;

    LibContext* libraryContext() const noexcept;

    const char* propertyQuery() const noexcept;

    HashPtr fetchDigest(std::string_view algorithm);

    KeyCtxPtr createKeyContext(std::string_view algorithm);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ecsuite::crypto
