#pragma once
/**
 * @file transport.hpp
 * @brief Byte transport consumed by the connection socket
 *
 */

#include "connection_config.hpp"
#include "trust.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ircsock {

/// @brief Serialized execution context owned by one connection attempt
using Strand = boost::asio::strand<boost::asio::any_io_executor>;

enum class TransportStatus
{
    setup,
    preparing,
    waiting,
    ready,
    failed,
    cancelled,
};

auto to_string(TransportStatus status) -> char const*;

struct TransportState
{
    TransportStatus status;
    boost::system::error_code error;
};

/// @brief Parameters agreed on by a completed TLS handshake
struct TlsMetadata
{
    std::string protocol;
    std::string cipher_suite;
};

/**
 * @brief TCP/TLS connection primitives.
 *
 * Every handler is invoked on the strand the transport was created with.
 * A started transport reports exactly one terminal status (failed or
 * cancelled) unless it is destroyed first.
 */
class Transport
{
public:
    using StatusHandler = std::function<void(TransportState)>;

    /// Receive completion; the bytes are only valid during the call
    using ReceiveHandler = std::function<void(boost::system::error_code, std::string_view)>;

    using SendHandler = std::function<void(boost::system::error_code)>;

    virtual ~Transport() = default;

    /// @brief Begin connecting and report progress to the handler
    virtual auto start(StatusHandler handler) -> void = 0;

    /// @brief Tear down the connection; completes with a cancelled status
    virtual auto cancel() -> void = 0;

    /// @brief Read up to max_length bytes
    virtual auto receive(std::size_t max_length, ReceiveHandler handler) -> void = 0;

    /// @brief Write all of data
    virtual auto send(std::string data, SendHandler handler) -> void = 0;

    /// @brief Address of the connected peer, if known
    virtual auto remote_endpoint() const -> std::optional<std::string> = 0;

    /// @brief Negotiated TLS parameters once the handshake completed
    virtual auto tls_metadata() const -> std::optional<TlsMetadata> = 0;
};

/// @brief Invoked by the transport with the server's trust object
using TrustHandler = std::function<void(std::shared_ptr<TrustContext const>, TrustCompletion)>;

/// @brief Creates the transport for one connection attempt
using TransportFactory = std::function<
    std::shared_ptr<Transport>(Strand, ConnectionConfig const&, TrustHandler)>;

} // namespace ircsock
