#pragma once
/**
 * @file connection_socket.hpp
 * @brief Connection lifecycle, line framing and write gating for one IRC link
 *
 */

#include "connection_config.hpp"
#include "connection_delegate.hpp"
#include "connection_error.hpp"
#include "line_framer.hpp"
#include "transport.hpp"
#include "trust.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ircsock {

enum class ConnectionState
{
    disconnected,
    connecting,
    connected,
    securing,
    secured,
    disconnecting,
};

auto to_string(ConnectionState state) -> char const*;

/**
 * @brief A single network connection to an IRC server.
 *
 * Public operations never block. They must be called from the thread
 * running the executor or from within a delegate callback; results are
 * delivered later through the delegate on the connection's strand.
 */
class ConnectionSocket final : public std::enable_shared_from_this<ConnectionSocket>
{
public:
    /// @brief Largest single receive request
    static std::size_t const maximum_data_length = 131'072;

private:
    struct Private {};
    struct ResetGuard;

    boost::asio::any_io_executor executor_;
    ConnectionConfig const config_;
    std::weak_ptr<ConnectionDelegate> delegate_;
    TransportFactory transport_factory_;

    /// @brief Created by open and released by reset_state
    std::optional<Strand> strand_;
    std::shared_ptr<Transport> transport_;

    LineFramer framer_;
    TrustVerifier trust_verifier_;

    /// @brief Error reported in place of the transport's own at disconnect
    std::optional<ConnectionError> alternate_disconnect_error_;

    ConnectionState state_;
    bool sending_;

    /// @brief Incremented per attempt so late callbacks from an old transport are ignored
    std::uint64_t generation_;

public:
    ConnectionSocket(
        Private,
        boost::asio::any_io_executor executor,
        ConnectionConfig config,
        std::weak_ptr<ConnectionDelegate> delegate,
        TrustPolicy trust_policy,
        TransportFactory transport_factory);

    auto operator=(ConnectionSocket const&) -> ConnectionSocket& = delete;
    auto operator=(ConnectionSocket&&) -> ConnectionSocket& = delete;
    ConnectionSocket(ConnectionSocket const&) = delete;
    ConnectionSocket(ConnectionSocket&&) = delete;

    /**
     * @brief Construct a connection socket
     *
     * @param executor executor the per-connection strand is created on
     * @param config immutable connection settings
     * @param delegate receiver of lifecycle events
     * @param trust_policy certificate decision procedure; empty accepts preverified chains
     * @param transport_factory transport constructor; empty uses the Asio transport
     * @return shared connection socket
     */
    static auto create(
        boost::asio::any_io_executor executor,
        ConnectionConfig config,
        std::weak_ptr<ConnectionDelegate> delegate,
        TrustPolicy trust_policy = {},
        TransportFactory transport_factory = {}
    ) -> std::shared_ptr<ConnectionSocket>;

    /**
     * @brief Start connecting to the configured server.
     *
     * Does nothing unless the socket is fully disconnected.
     */
    auto open() -> void;

    /**
     * @brief Request teardown of the connection.
     *
     * The disconnected state is reached asynchronously once the transport
     * confirms the cancellation.
     */
    auto close() -> void;

    /**
     * @brief Request teardown and report the given error to the delegate
     *
     * @param error error delivered through disconnected_with
     */
    auto close(ConnectionError error) -> void;

    /// @brief Request the next chunk of bytes from the transport
    auto read() -> void;

    /**
     * @brief Send bytes to the server
     *
     * Only one write may be outstanding; a write issued before the previous
     * one completed is dropped.
     *
     * @param data bytes including any needed line terminators
     */
    auto write(std::string data) -> void;

    auto state() const -> ConnectionState { return state_; }
    auto connected() const -> bool;
    auto secured() const -> bool { return ConnectionState::secured == state_; }
    auto disconnected() const -> bool { return ConnectionState::disconnected == state_; }
    auto disconnecting() const -> bool { return ConnectionState::disconnecting == state_; }
    auto sending() const -> bool { return sending_; }

    auto config() const -> ConnectionConfig const& { return config_; }

    auto connected_host() const -> std::optional<std::string>;
    auto tls_negotiated_protocol() const -> std::optional<std::string>;
    auto tls_negotiated_cipher_suite() const -> std::optional<std::string>;
    auto tls_certificate_chain() const -> std::optional<std::vector<DerCertificate>>;
    auto tls_policy_name() const -> std::optional<std::string>;

private:
    static auto lock(std::weak_ptr<ConnectionSocket> const& weak, std::uint64_t generation)
        -> std::shared_ptr<ConnectionSocket>;

    auto close_with(boost::system::error_code const& error) -> void;

    auto status_update(TransportState const& state) -> void;
    auto on_connect() -> void;
    auto on_secured() -> void;
    auto on_disconnect(boost::system::error_code const& error) -> void;

    auto read_completion(boost::system::error_code const& error, std::string_view data) -> void;
    auto read_in(std::string_view data) -> void;
    auto write_completion(boost::system::error_code const& error) -> void;

    auto reset_state() -> void;
};

} // namespace ircsock
