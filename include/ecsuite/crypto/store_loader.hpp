#pragma once

#include <string_view>
#include <ecsuite/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace ecsuite::crypto
{

/// @brief Reads objects from an OpenSSL store URI (for example "file:/path/key.pem").
///
/// Passphrase prompts are disabled, so encrypted objects fail to load.
class StoreLoader final : public casket::NonCopyable
{
public:
    explicit StoreLoader(std::string_view uri);

    ~StoreLoader() = default;

    /// @brief Returns the first object of @p type (OSSL_STORE_INFO_PKEY, OSSL_STORE_INFO_PUBKEY, ...).
    StoreInfoPtr load(int type);

private:
    StoreCtxPtr ctx_;
};

} // namespace ecsuite::crypto
