/**
 * @file configuration.hpp
 * @brief Command-line configuration for ircsock-cat
 *
 */

#pragma once

#include <ircsock/connection_config.hpp>
#include <ircsock/trust.hpp>

#include <cstdint>

struct configuration
{
    char const* host;
    std::uint16_t port;
    bool tls;
    char const* client_cert;
    char const* client_key;
    char const* client_key_password;
    char const* cipher_list;
    bool modern_ciphers;
    char const* server_name;
    char const* fingerprint;
    bool insecure;
    bool no_proxy;
    bool debug;
};

/**
 * @brief Process command-line arguments.
 *
 * On error this function prints usage and terminates the process.
 *
 * @param argc Number of arguments
 * @param argv Pointer to arguments
 * @return configuration Populated configuration value.
 */
configuration load_configuration(int argc, char** argv);

/**
 * @brief Build the connection settings, loading the client identity if requested.
 *
 * Throws boost::system::system_error when the identity cannot be loaded.
 *
 * @param cfg command-line configuration
 * @return connection settings
 */
auto connection_config(configuration const& cfg) -> ircsock::ConnectionConfig;

/// @brief Select the certificate trust policy requested on the command line
auto trust_policy(configuration const& cfg) -> ircsock::TrustPolicy;
