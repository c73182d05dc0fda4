#pragma once
/**
 * @file trust.hpp
 * @brief Server certificate trust evaluation
 *
 */

#include "openssl_ref.hpp"

#include <openssl/ssl.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ircsock {

using DerCertificate = std::vector<unsigned char>;

/**
 * @brief Certificate chain presented by the server along with the
 * result of OpenSSL's own chain and hostname verification.
 */
class TrustContext
{
    std::vector<X509Ref> chain_;
    long verify_result_;
    std::string host_;
    std::string policy_name_;

public:
    TrustContext(
        std::vector<X509Ref> chain,
        long verify_result,
        std::string host,
        std::string policy_name);

    /**
     * @brief Capture the peer chain of a completed handshake
     *
     * @param ssl connection after a successful handshake
     * @param host name the chain was verified against
     * @return shared trust context
     */
    static auto from_ssl(SSL const* ssl, std::string host) -> std::shared_ptr<TrustContext const>;

    /// @brief Peer certificates, leaf first
    auto chain() const -> std::vector<X509Ref> const& { return chain_; }

    /// @brief X509_V_OK or the first X509_V_ERR_* encountered
    auto verify_result() const -> long { return verify_result_; }

    auto preverified() const -> bool;

    auto host() const -> std::string const& { return host_; }

    auto policy_name() const -> std::string const& { return policy_name_; }

    auto certificate_chain_der() const -> std::vector<DerCertificate>;

    /**
     * @brief Lowercase hex SHA2-256 digest of the leaf public key
     *
     * The digest covers the contents of the subjectPublicKey BIT STRING
     * (X509_pubkey_digest), not the DER SubjectPublicKeyInfo with its
     * algorithm identifier.
     */
    auto public_key_fingerprint() const -> std::optional<std::string>;
};

/// @brief Verdict callback; true accepts the certificate chain
using TrustCompletion = std::function<void(bool)>;

/**
 * @brief Caller-supplied decision procedure.
 *
 * The policy may answer synchronously or later from any thread, but it must
 * eventually invoke the completion.
 */
using TrustPolicy = std::function<void(std::shared_ptr<TrustContext const>, TrustCompletion)>;

/// @brief Accept chains that passed OpenSSL chain and hostname verification
auto accept_preverified() -> TrustPolicy;

/**
 * @brief Accept only a leaf whose public key has the given SHA2-256 digest
 *
 * The fingerprint is compared with TrustContext::public_key_fingerprint.
 * Colons and letter case are ignored.
 */
auto pin_public_key(std::string fingerprint) -> TrustPolicy;

/// @brief Accept every chain
auto accept_any() -> TrustPolicy;

/**
 * @brief Retains the latest trust object and forwards the accept/reject
 * decision to the configured policy.
 */
class TrustVerifier
{
    TrustPolicy policy_;
    std::shared_ptr<TrustContext const> trust_;

public:
    explicit TrustVerifier(TrustPolicy policy);

    /**
     * @brief Evaluate a newly presented trust object
     *
     * The previous trust object is replaced. The completion takes effect
     * exactly once; a policy that throws rejects the chain.
     *
     * @param trust trust object from the handshake
     * @param completion verdict callback
     */
    auto evaluate(std::shared_ptr<TrustContext const> trust, TrustCompletion completion) -> void;

    auto trust() const -> std::shared_ptr<TrustContext const> const& { return trust_; }

    auto certificate_chain() const -> std::optional<std::vector<DerCertificate>>;

    auto policy_name() const -> std::optional<std::string>;

    /// @brief Forget the retained trust object
    auto reset() -> void { trust_.reset(); }
};

} // namespace ircsock
