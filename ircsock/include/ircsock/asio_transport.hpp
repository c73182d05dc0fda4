#pragma once
/**
 * @file asio_transport.hpp
 * @brief TCP and TLS transport implemented with Boost.Asio and OpenSSL
 *
 */

#include "connection_config.hpp"
#include "transport.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/ssl/context.hpp>

#include <cstddef>
#include <memory>

namespace ircsock {

/// @brief Socket and TLS BIO buffer size
std::size_t const irc_buffer_size = 131'072;

/**
 * @brief Build the TLS client context for a connection
 *
 * Applies the default verify paths, the cipher selection and the
 * minimum protocol version. Throws boost::system::system_error on
 * OpenSSL failures.
 *
 * @param config connection settings
 * @return configured context
 */
auto build_ssl_context(ConnectionConfig const& config) -> boost::asio::ssl::context;

/**
 * @brief Create a transport connecting over TCP with optional TLS
 *
 * The TLS handshake sends ALPN "irc", SNI and the client identity when
 * configured. Once the handshake completes the peer chain is handed to the
 * trust handler and the transport only becomes ready if it is accepted.
 *
 * @param strand strand every callback is delivered on
 * @param config connection settings
 * @param trust_handler certificate decision hook
 * @return new transport
 */
auto make_asio_transport(
    Strand strand,
    ConnectionConfig const& config,
    TrustHandler trust_handler
) -> std::shared_ptr<Transport>;

} // namespace ircsock
