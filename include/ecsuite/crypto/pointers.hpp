#pragma once

#include <openssl/evp.h>
#include <openssl/bn.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/store.h>
#include <openssl/safestack.h>

#include <ecsuite/crypto/typedefs.hpp>
#include <ecsuite/utils/custom_unique_ptr.hpp>

namespace ecsuite::crypto
{

struct StoreCtxDeleter
{
    void operator()(StoreCtx* ctx) const noexcept
    {
        OSSL_STORE_close(ctx);
    }
};

struct CertExtOwningStackDeleter
{
    void operator()(CertExtStack* stack) const noexcept
    {
        sk_X509_EXTENSION_pop_free(stack, X509_EXTENSION_free);
    }
};

ECSUITE_DEFINE_UNIQUE_PTR(Asn1IntegerPtr, Asn1Integer, ASN1_INTEGER_free);

ECSUITE_DEFINE_UNIQUE_PTR(BigNumPtr, BigNum, BN_free);
ECSUITE_DEFINE_UNIQUE_PTR(SecureBigNumPtr, BigNum, BN_clear_free);
ECSUITE_DEFINE_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

ECSUITE_DEFINE_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
ECSUITE_DEFINE_UNIQUE_PTR(X509ReqPtr, X509Req, X509_REQ_free);
ECSUITE_DEFINE_UNIQUE_PTR(X509ExtPtr, X509Ext, X509_EXTENSION_free);
ECSUITE_DEFINE_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);

ECSUITE_DEFINE_UNIQUE_PTR(StoreInfoPtr, StoreInfo, OSSL_STORE_INFO_free);

ECSUITE_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
ECSUITE_DEFINE_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
ECSUITE_DEFINE_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
ECSUITE_DEFINE_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);

ECSUITE_DEFINE_UNIQUE_PTR_WITH_DELETER(CertExtOwningStackPtr, CertExtStack, CertExtOwningStackDeleter);
ECSUITE_DEFINE_UNIQUE_PTR_WITH_DELETER(StoreCtxPtr, StoreCtx, StoreCtxDeleter);

} // namespace ecsuite::crypto
