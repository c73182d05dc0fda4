#pragma once
/**
 * @file connection_config.hpp
 * @brief Per-connection settings consumed by the connection socket
 *
 */

#include "openssl_ref.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ircsock {

/// @brief How the connection should treat proxies configured on the host
enum class ProxyType
{
    none,
    system,
};

/// @brief Certificate and private key presented for mutual TLS
struct ClientIdentity
{
    X509Ref certificate;
    PkeyRef private_key;
};

struct ConnectionConfig
{
    std::string server_address;
    std::uint16_t server_port = 6667;

    bool prefers_secured_connection = false;
    ProxyType proxy_type = ProxyType::system;

    /// @brief OpenSSL cipher list; nullopt selects the library default group
    std::optional<std::string> cipher_suites;
    bool prefers_modern_ciphers_only = false;

    std::optional<ClientIdentity> client_identity;

    /// @brief Name used for SNI and hostname verification; empty uses server_address
    std::string server_name;

    /// @brief Log informational transport statuses to stderr
    bool debug_logging = false;

    auto verify_name() const -> std::string const&
    {
        return server_name.empty() ? server_address : server_name;
    }
};

/**
 * @brief Load a client certificate and private key from PEM files.
 *
 * Throws a boost::system::system_error carrying the OpenSSL error on failure.
 *
 * @param certificate_file PEM certificate path
 * @param key_file PEM private key path; empty reads the key from certificate_file
 * @param password key password; empty for unencrypted keys
 * @return loaded identity
 */
auto load_client_identity(
    std::string const& certificate_file,
    std::string const& key_file,
    std::string const& password
) -> ClientIdentity;

} // namespace ircsock
