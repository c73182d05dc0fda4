#include "ircsock/trust.hpp"

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ircsock {

namespace {

auto ssl_server_policy_name() -> std::string
{
    auto const purpose = X509_PURPOSE_get0(X509_PURPOSE_get_by_id(X509_PURPOSE_SSL_SERVER));
    if (nullptr == purpose)
    {
        return "SSL server";
    }
    return X509_PURPOSE_get0_name(purpose);
}

auto lowercase(std::string str) -> std::string
{
    std::transform(std::begin(str), std::end(str), std::begin(str),
        [](unsigned char const c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

TrustContext::TrustContext(
    std::vector<X509Ref> chain,
    long const verify_result,
    std::string host,
    std::string policy_name)
    : chain_{std::move(chain)}
    , verify_result_{verify_result}
    , host_{std::move(host)}
    , policy_name_{std::move(policy_name)}
{
}

auto TrustContext::from_ssl(SSL const* const ssl, std::string host) -> std::shared_ptr<TrustContext const>
{
    std::vector<X509Ref> chain;

    // For clients the peer chain includes the leaf certificate
    if (auto const certs = SSL_get_peer_cert_chain(ssl))
    {
        auto const n = sk_X509_num(certs);
        chain.reserve(n);
        for (int i = 0; i < n; i++)
        {
            chain.emplace_back(sk_X509_value(certs, i));
        }
    }

    return std::make_shared<TrustContext>(
        std::move(chain),
        SSL_get_verify_result(ssl),
        std::move(host),
        ssl_server_policy_name());
}

auto TrustContext::preverified() const -> bool
{
    return X509_V_OK == verify_result_ && not chain_.empty();
}

auto TrustContext::certificate_chain_der() const -> std::vector<DerCertificate>
{
    std::vector<DerCertificate> result;
    result.reserve(chain_.size());

    for (auto const& cert : chain_)
    {
        auto const len = i2d_X509(cert.get(), nullptr);
        if (len < 0)
        {
            continue;
        }
        auto& der = result.emplace_back(len);
        auto cursor = der.data();
        i2d_X509(cert.get(), &cursor);
    }

    return result;
}

auto TrustContext::public_key_fingerprint() const -> std::optional<std::string>
{
    if (chain_.empty())
    {
        return std::nullopt;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (1 != X509_pubkey_digest(chain_.front().get(), EVP_sha256(), md, &md_len))
    {
        return std::nullopt;
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (unsigned i = 0; i < md_len; i++)
    {
        os << std::setw(2) << int{md[i]};
    }
    return os.str();
}

auto accept_preverified() -> TrustPolicy
{
    return [](std::shared_ptr<TrustContext const> const trust, TrustCompletion const completion) {
        completion(trust->preverified());
    };
}

auto pin_public_key(std::string fingerprint) -> TrustPolicy
{
    fingerprint.erase(std::remove(std::begin(fingerprint), std::end(fingerprint), ':'), std::end(fingerprint));
    return [expected = lowercase(std::move(fingerprint))](
        std::shared_ptr<TrustContext const> const trust,
        TrustCompletion const completion
    ) {
        auto const actual = trust->public_key_fingerprint();
        completion(actual && *actual == expected);
    };
}

auto accept_any() -> TrustPolicy
{
    return [](std::shared_ptr<TrustContext const>, TrustCompletion const completion) {
        completion(true);
    };
}

TrustVerifier::TrustVerifier(TrustPolicy policy)
    : policy_{policy ? std::move(policy) : accept_preverified()}
{
}

auto TrustVerifier::evaluate(std::shared_ptr<TrustContext const> trust, TrustCompletion completion) -> void
{
    trust_ = std::move(trust);

    TrustCompletion once =
        [done = std::make_shared<std::atomic<bool>>(false), completion = std::move(completion)](bool const verdict) {
            if (not done->exchange(true))
            {
                completion(verdict);
            }
        };

    try
    {
        policy_(trust_, once);
    }
    catch (std::exception const& e)
    {
        std::cerr << "error in trust policy: " << e.what() << std::endl;
        once(false);
    }
}

auto TrustVerifier::certificate_chain() const -> std::optional<std::vector<DerCertificate>>
{
    if (not trust_)
    {
        return std::nullopt;
    }
    return trust_->certificate_chain_der();
}

auto TrustVerifier::policy_name() const -> std::optional<std::string>
{
    if (not trust_)
    {
        return std::nullopt;
    }
    return trust_->policy_name();
}

} // namespace ircsock
