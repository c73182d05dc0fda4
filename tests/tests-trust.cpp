#include "test_identity.hpp"

#include <ircsock/connection_config.hpp>
#include <ircsock/trust.hpp>

#include <boost/system/system_error.hpp>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <gtest/gtest.h>

#include <unistd.h>

#include <cctype>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using ircsock_test::Identity;
using ircsock_test::make_identity;

auto make_context(Identity const& identity, long const verify_result) -> std::shared_ptr<ircsock::TrustContext const>
{
    return std::make_shared<ircsock::TrustContext>(
        std::vector<ircsock::X509Ref>{identity.certificate},
        verify_result,
        "irc.example.net",
        "SSL server");
}

auto hex_sha256(unsigned char const* const data, std::size_t const len) -> std::string
{
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (1 != EVP_Digest(data, len, md, &md_len, EVP_sha256(), nullptr))
    {
        throw std::runtime_error{"EVP_Digest"};
    }

    std::string result;
    char hex[3];
    for (unsigned i = 0; i < md_len; i++)
    {
        std::snprintf(hex, sizeof hex, "%02x", md[i]);
        result += hex;
    }
    return result;
}

/// Digest of the subjectPublicKey BIT STRING contents
auto expected_fingerprint(Identity const& identity) -> std::string
{
    auto const bits = X509_get0_pubkey_bitstr(identity.certificate.get());
    return hex_sha256(ASN1_STRING_get0_data(bits), ASN1_STRING_length(bits));
}

/// Digest of the whole DER SubjectPublicKeyInfo
auto spki_fingerprint(Identity const& identity) -> std::string
{
    unsigned char* der = nullptr;
    auto const len = i2d_X509_PUBKEY(X509_get_X509_PUBKEY(identity.certificate.get()), &der);
    if (len <= 0)
    {
        throw std::runtime_error{"i2d_X509_PUBKEY"};
    }
    auto const result = hex_sha256(der, len);
    OPENSSL_free(der);
    return result;
}

/// Runs a policy synchronously and captures its verdict
auto decide(ircsock::TrustPolicy const& policy, std::shared_ptr<ircsock::TrustContext const> trust) -> std::optional<bool>
{
    std::optional<bool> verdict;
    policy(std::move(trust), [&verdict](bool const accept) { verdict = accept; });
    return verdict;
}

TEST(TrustContext, Preverified)
{
    auto const identity = make_identity("irc.example.net");

    EXPECT_TRUE(make_context(identity, X509_V_OK)->preverified());
    EXPECT_FALSE(make_context(identity, X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT)->preverified());

    ircsock::TrustContext const empty{{}, X509_V_OK, "irc.example.net", "SSL server"};
    EXPECT_FALSE(empty.preverified());
    EXPECT_EQ(empty.public_key_fingerprint(), std::nullopt);
}

TEST(TrustContext, CertificateChainDer)
{
    auto const identity = make_identity("irc.example.net");
    auto const chain = make_context(identity, X509_V_OK)->certificate_chain_der();

    ASSERT_EQ(chain.size(), 1);
    auto cursor = chain[0].data();
    auto const decoded = ircsock::X509Ref::adopt(d2i_X509(nullptr, &cursor, static_cast<long>(chain[0].size())));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(X509_cmp(decoded.get(), identity.certificate.get()), 0);
}

TEST(TrustContext, PublicKeyFingerprint)
{
    auto const identity = make_identity("irc.example.net");
    auto const fingerprint = make_context(identity, X509_V_OK)->public_key_fingerprint();

    ASSERT_TRUE(fingerprint);
    EXPECT_EQ(fingerprint->size(), 64);
    EXPECT_EQ(*fingerprint, expected_fingerprint(identity));

    // The algorithm identifier is not part of the digested bytes
    EXPECT_NE(*fingerprint, spki_fingerprint(identity));
}

TEST(TrustPolicy, AcceptPreverified)
{
    auto const identity = make_identity("irc.example.net");
    auto const policy = ircsock::accept_preverified();

    EXPECT_EQ(decide(policy, make_context(identity, X509_V_OK)), true);
    EXPECT_EQ(decide(policy, make_context(identity, X509_V_ERR_HOSTNAME_MISMATCH)), false);
}

TEST(TrustPolicy, AcceptAny)
{
    auto const identity = make_identity("irc.example.net");
    EXPECT_EQ(decide(ircsock::accept_any(), make_context(identity, X509_V_ERR_CERT_HAS_EXPIRED)), true);
}

TEST(TrustPolicy, PinPublicKey)
{
    auto const identity = make_identity("irc.example.net");
    auto const other = make_identity("irc.example.net");
    auto const fingerprint = expected_fingerprint(identity);

    auto const policy = ircsock::pin_public_key(fingerprint);
    EXPECT_EQ(decide(policy, make_context(identity, X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT)), true);
    EXPECT_EQ(decide(policy, make_context(other, X509_V_OK)), false);

    // Colon separated uppercase form
    std::string formatted;
    for (std::size_t i = 0; i < fingerprint.size(); i += 2)
    {
        if (i > 0) formatted += ':';
        formatted += static_cast<char>(std::toupper(fingerprint[i]));
        formatted += static_cast<char>(std::toupper(fingerprint[i + 1]));
    }
    EXPECT_EQ(decide(ircsock::pin_public_key(formatted), make_context(identity, X509_V_OK)), true);
}

TEST(TrustVerifier, EmptyPolicyAcceptsPreverified)
{
    auto const identity = make_identity("irc.example.net");
    ircsock::TrustVerifier verifier{ircsock::TrustPolicy{}};

    std::optional<bool> verdict;
    verifier.evaluate(make_context(identity, X509_V_OK), [&verdict](bool const accept) { verdict = accept; });
    EXPECT_EQ(verdict, true);

    verifier.evaluate(make_context(identity, X509_V_ERR_CERT_REVOKED), [&verdict](bool const accept) { verdict = accept; });
    EXPECT_EQ(verdict, false);
}

TEST(TrustVerifier, CompletionRunsOnce)
{
    auto const identity = make_identity("irc.example.net");
    ircsock::TrustVerifier verifier{[](auto, ircsock::TrustCompletion const completion) {
        completion(true);
        completion(false);
        completion(true);
    }};

    std::vector<bool> verdicts;
    verifier.evaluate(make_context(identity, X509_V_OK), [&verdicts](bool const accept) { verdicts.push_back(accept); });

    std::vector<bool> const expected {true};
    EXPECT_EQ(verdicts, expected);
}

TEST(TrustVerifier, ThrowingPolicyRejects)
{
    auto const identity = make_identity("irc.example.net");
    ircsock::TrustVerifier verifier{[](auto, ircsock::TrustCompletion) {
        throw std::runtime_error{"policy exploded"};
    }};

    std::optional<bool> verdict;
    verifier.evaluate(make_context(identity, X509_V_OK), [&verdict](bool const accept) { verdict = accept; });
    EXPECT_EQ(verdict, false);
}

TEST(TrustVerifier, DeferredVerdict)
{
    auto const identity = make_identity("irc.example.net");
    ircsock::TrustCompletion saved;
    ircsock::TrustVerifier verifier{[&saved](auto, ircsock::TrustCompletion completion) {
        saved = std::move(completion);
    }};

    std::optional<bool> verdict;
    verifier.evaluate(make_context(identity, X509_V_OK), [&verdict](bool const accept) { verdict = accept; });
    EXPECT_EQ(verdict, std::nullopt);

    ASSERT_TRUE(saved);
    saved(true);
    EXPECT_EQ(verdict, true);
}

TEST(TrustVerifier, QueriesFollowRetainedTrust)
{
    auto const identity = make_identity("irc.example.net");
    ircsock::TrustVerifier verifier{ircsock::accept_any()};

    EXPECT_EQ(verifier.policy_name(), std::nullopt);
    EXPECT_EQ(verifier.certificate_chain(), std::nullopt);

    verifier.evaluate(make_context(identity, X509_V_OK), [](bool) {});
    EXPECT_EQ(verifier.policy_name(), "SSL server");
    ASSERT_TRUE(verifier.certificate_chain());
    EXPECT_EQ(verifier.certificate_chain()->size(), 1);

    verifier.reset();
    EXPECT_EQ(verifier.policy_name(), std::nullopt);
    EXPECT_EQ(verifier.certificate_chain(), std::nullopt);
}

class ClientIdentityTest : public ::testing::Test
{
protected:
    std::filesystem::path dir;

    auto SetUp() -> void override
    {
        dir = std::filesystem::temp_directory_path() / ("ircsock-tests-" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir);
    }

    auto TearDown() -> void override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    auto write_pem(
        std::string const& name,
        X509* const cert,
        EVP_PKEY* const key,
        std::string const& password = {}
    ) -> std::string
    {
        auto const path = (dir / name).string();
        auto const bio = BIO_new_file(path.c_str(), "w");
        if (nullptr == bio)
        {
            throw std::runtime_error{"BIO_new_file"};
        }
        if (cert)
        {
            PEM_write_bio_X509(bio, cert);
        }
        if (key)
        {
            if (password.empty())
            {
                PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
            }
            else
            {
                PEM_write_bio_PrivateKey(
                    bio, key, EVP_aes_256_cbc(),
                    reinterpret_cast<unsigned char const*>(password.data()), static_cast<int>(password.size()),
                    nullptr, nullptr);
            }
        }
        BIO_free_all(bio);
        return path;
    }
};

TEST_F(ClientIdentityTest, SeparateFiles)
{
    auto const identity = make_identity("nick");
    auto const cert = write_pem("cert.pem", identity.certificate.get(), nullptr);
    auto const key = write_pem("key.pem", nullptr, identity.key.get());

    auto const loaded = ircsock::load_client_identity(cert, key, "");
    EXPECT_EQ(X509_cmp(loaded.certificate.get(), identity.certificate.get()), 0);
    EXPECT_EQ(EVP_PKEY_eq(loaded.private_key.get(), identity.key.get()), 1);
}

TEST_F(ClientIdentityTest, CombinedFile)
{
    auto const identity = make_identity("nick");
    auto const combined = write_pem("combined.pem", identity.certificate.get(), identity.key.get());

    auto const loaded = ircsock::load_client_identity(combined, "", "");
    EXPECT_TRUE(loaded.certificate);
    EXPECT_TRUE(loaded.private_key);
}

TEST_F(ClientIdentityTest, EncryptedKey)
{
    auto const identity = make_identity("nick");
    auto const cert = write_pem("cert.pem", identity.certificate.get(), nullptr);
    auto const key = write_pem("key.pem", nullptr, identity.key.get(), "hunter2");

    EXPECT_NO_THROW(ircsock::load_client_identity(cert, key, "hunter2"));
    EXPECT_THROW(ircsock::load_client_identity(cert, key, "wrong"), boost::system::system_error);
}

TEST_F(ClientIdentityTest, MismatchedKey)
{
    auto const identity = make_identity("nick");
    auto const other = make_identity("nick");
    auto const cert = write_pem("cert.pem", identity.certificate.get(), nullptr);
    auto const key = write_pem("key.pem", nullptr, other.key.get());

    EXPECT_THROW(ircsock::load_client_identity(cert, key, ""), boost::system::system_error);
}

TEST_F(ClientIdentityTest, MissingFile)
{
    EXPECT_THROW(
        ircsock::load_client_identity((dir / "absent.pem").string(), "", ""),
        boost::system::system_error);
}

} // namespace
