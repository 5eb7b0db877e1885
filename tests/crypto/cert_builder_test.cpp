#include <string_view>
#include <gtest/gtest.h>

#include <ecsuite/crypto/asymm_key.hpp>
#include <ecsuite/crypto/asymm_keygen.hpp>
#include <ecsuite/crypto/cert.hpp>
#include <ecsuite/crypto/cert_name.hpp>
#include <ecsuite/crypto/cert_builder.hpp>
#include <ecsuite/crypto/cert_name_builder.hpp>
#include <ecsuite/crypto/exception.hpp>

using namespace ecsuite;
using namespace ecsuite::crypto;
using namespace std::chrono_literals;

class CertBuilderTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(key_ = akey::ec::generate("prime256v1"));
    }

    void TearDown() override
    {
        key_.reset();
    }

protected:
    KeyPtr key_;
};

TEST_F(CertBuilderTest, CreateSelfSignedCert)
{
    X509NamePtr name;
    ASSERT_NO_THROW(name = CertNameBuilder::fromString("CN=Test Root CA"));

    CertBuilder builder;
    // clang-format off
    ASSERT_NO_THROW(
        builder
            .selfSigned(key_)
            .setPublicKey(key_)
            .setSubjectName(name)
            .setIssuerName(name)
            .setNotBefore(0s)
            .setNotAfter(24h)
            .setVersion(CertVersion::V3)
            .addExtension(NID_subject_key_identifier, "hash")
            .addExtension(NID_basic_constraints, "critical,CA:TRUE")
            .addExtension(NID_key_usage, "critical,cRLSign,keyCertSign")
    );
    // clang-format on
    X509CertPtr cert;
    ASSERT_NO_THROW(cert = builder.build());

    ASSERT_EQ(Cert::version(cert), CertVersion::V3);
    ASSERT_TRUE(CertName::isEqual(Cert::subjectName(cert), name));
    ASSERT_TRUE(CertName::isEqual(Cert::issuerName(cert), name));
    ASSERT_TRUE(AsymmKey::isEqual(key_, Cert::publicKey(cert)));
    ASSERT_TRUE(Cert::verifySignature(cert, key_));
}

TEST_F(CertBuilderTest, ValidityCountedFromReferenceTime)
{
    const std::time_t reference = 1700000000;

    CertBuilder builder;
    // clang-format off
    builder
        .selfSigned(key_)
        .setPublicKey(key_)
        .setSubjectName("/CN=validity")
        .setIssuerName("/CN=validity")
        .setReferenceTime(reference)
        .setNotBefore(-5s)
        .setNotAfter(60s);
    // clang-format on

    auto cert = builder.build();
    EXPECT_EQ(Cert::notBefore(cert), reference - 5);
    EXPECT_EQ(Cert::notAfter(cert), reference + 60);
}

TEST_F(CertBuilderTest, ExplicitSerialNumber)
{
    CertBuilder builder;
    builder.selfSigned(key_).setPublicKey(key_).setSubjectName("/CN=serial").setSerialNumber(4);

    auto cert = builder.build();
    EXPECT_EQ(BN_get_word(Cert::serialNumber(cert)), 4UL);
}

TEST_F(CertBuilderTest, RandomSerialNumberWhenUnset)
{
    CertBuilder builder;
    builder.selfSigned(key_).setPublicKey(key_).setSubjectName("/CN=serial");

    auto cert = builder.build();
    EXPECT_FALSE(BN_is_zero(Cert::serialNumber(cert)));
}

TEST_F(CertBuilderTest, BuilderIsReusable)
{
    CertBuilder builder;
    builder.selfSigned(key_).setPublicKey(key_).setSubjectName("/CN=first");
    auto first = builder.build();

    builder.selfSigned(key_).setPublicKey(key_).setSubjectName("/CN=second");
    auto second = builder.build();

    EXPECT_EQ(CertName::toString(Cert::subjectName(first)), "/CN=first");
    EXPECT_EQ(CertName::toString(Cert::subjectName(second)), "/CN=second");
}

TEST_F(CertBuilderTest, BuildWithoutSigningKey)
{
    CertBuilder builder;
    builder.setPublicKey(key_).setSubjectName("/CN=unsigned");
    ASSERT_THROW(builder.build(), CryptoException);
}

TEST_F(CertBuilderTest, InvalidExtensionValue)
{
    CertBuilder builder;
    builder.selfSigned(key_);
    ASSERT_THROW(builder.addExtension(NID_key_usage, "notAKeyUsage"), CryptoException);
    ASSERT_THROW(builder.addExtension("noSuchExtension", "value"), CryptoException);
}
