#pragma once
#include <openssl/types.h>
#include <openssl/x509.h>
#include <openssl/store.h>

namespace ecsuite::crypto
{

enum class CertVersion
{
    V1 = 0, ///< X509v1
    V2 = 1, ///< X509v2
    V3 = 2, ///< X509v3
};

enum class KeyType
{
    Public,
    Private
};

using Asn1Integer = ASN1_INTEGER;
using Asn1Time = ASN1_TIME;
using BigNum = BIGNUM;
using Bio = BIO;
using X509Cert = X509;
using X509Ext = X509_EXTENSION;
using X509Name = X509_NAME;
using X509V3Ctx = X509V3_CTX;
using X509Req = X509_REQ;
using Hash = EVP_MD;
using HashCtx = EVP_MD_CTX;
using Key = EVP_PKEY;
using KeyCtx = EVP_PKEY_CTX;
using LibContext = OSSL_LIB_CTX;

using StoreCtx = OSSL_STORE_CTX;
using StoreInfo = OSSL_STORE_INFO;

using CertExtStack = STACK_OF(X509_EXTENSION);

} // namespace ecsuite::crypto
