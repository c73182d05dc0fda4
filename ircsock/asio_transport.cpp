#include "ircsock/asio_transport.hpp"

#include "ircsock/connection_error.hpp"
#include "ircsock/trust.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <fcntl.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <exception>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <stdexcept>
#include <system_error>
#include <variant>
#include <vector>

namespace ircsock {

namespace {

using tcp_type = boost::asio::ip::tcp::socket;
using tls_type = boost::asio::ssl::stream<tcp_type>;
using socket_type = tcp_type::lowest_layer_type;
using stream_type = std::variant<tcp_type, tls_type>;

/**
 * @brief Set size of the read and write buffers on a TLS stream.
 *
 * @param stream TLS stream
 * @param n buffer size in bytes
 */
auto set_buffer_size(tls_type& stream, std::size_t const n) -> void
{
    auto const ssl = stream.native_handle();
    BIO_set_buffer_size(SSL_get_rbio(ssl), n);
    BIO_set_buffer_size(SSL_get_wbio(ssl), n);
}

/**
 * @brief Set size of the read and write buffers on a plain TCP socket.
 *
 * @param socket TCP socket
 * @param n buffer size in bytes
 */
auto set_buffer_size(socket_type& socket, std::size_t const n) -> void
{
    socket.set_option(tcp_type::send_buffer_size{static_cast<int>(n)});
    socket.set_option(tcp_type::receive_buffer_size{static_cast<int>(n)});
}

/**
 * @brief Set the CLOEXEC flag on a file descriptor.
 *
 * This throws a system_error exception on failure.
 *
 * @param fd Open file descriptor
 */
auto set_cloexec(int const fd) -> void
{
    auto const flags = fcntl(fd, F_GETFD);
    if (-1 == flags)
    {
        throw boost::system::system_error{errno, boost::system::generic_category(), "failed to get file descriptor flags"};
    }
    if (-1 == fcntl(fd, F_SETFD, flags | FD_CLOEXEC))
    {
        throw boost::system::system_error{errno, boost::system::generic_category(), "failed to set file descriptor flags"};
    }
}

template <std::size_t... Ns>
auto constexpr sum() -> std::size_t { return (0 + ... + Ns); }

/**
 * @brief Builds the string format required for the ALPN extension
 *
 * @tparam Ns sizes of each protocol name
 * @param protocols array of the names of the supported protocols
 * @return encoded protocol names
 */
template <std::size_t... Ns>
auto constexpr alpn_encode(char const (&... protocols)[Ns]) -> std::array<unsigned char, sum<Ns...>()>
{
    auto result = std::array<unsigned char, sum<Ns...>()>{};
    auto cursor = std::begin(result);
    auto const encode = [&cursor]<std::size_t N>(char const(&protocol)[N]) {
        static_assert(N > 0, "Protocol name must be null-terminated");
        static_assert(N < 256, "Protocol name too long");

        // Prefixed length byte
        *cursor++ = N - 1;

        // Add string skipping null terminator
        cursor = std::copy(std::begin(protocol), std::end(protocol) - 1, cursor);
    };
    (encode(protocols), ...);
    return result;
}

auto is_ip_address(std::string const& name) -> bool
{
    boost::system::error_code ec;
    boost::asio::ip::make_address(name, ec);
    return not ec;
}

auto make_stream(Strand const& strand, std::optional<boost::asio::ssl::context>& ssl_context) -> stream_type
{
    if (ssl_context)
    {
        return stream_type{std::in_place_type<tls_type>, strand, *ssl_context};
    }
    return stream_type{std::in_place_type<tcp_type>, strand};
}

class AsioTransport final : public Transport, public std::enable_shared_from_this<AsioTransport>
{
    Strand strand_;
    ConnectionConfig const config_;
    TrustHandler trust_handler_;

    boost::asio::ip::tcp::resolver resolver_;
    std::optional<boost::asio::ssl::context> ssl_context_;
    stream_type stream_;

    StatusHandler status_handler_;

    /// @brief Storage for the outstanding receive
    std::vector<char> read_buffer_;

    /// @brief The bytes held for async_write
    std::string sending_;

    std::optional<TlsMetadata> tls_metadata_;

    bool cancelled_;
    bool established_;

    /// @brief Set once failed or cancelled has been reported
    bool terminal_;

public:
    AsioTransport(Strand strand, ConnectionConfig const& config, TrustHandler trust_handler)
        : strand_{std::move(strand)}
        , config_{config}
        , trust_handler_{std::move(trust_handler)}
        , resolver_{strand_}
        , ssl_context_{config.prefers_secured_connection
            ? std::optional<boost::asio::ssl::context>{build_ssl_context(config)}
            : std::nullopt}
        , stream_{make_stream(strand_, ssl_context_)}
        , cancelled_{false}
        , established_{false}
        , terminal_{false}
    {
    }

    auto start(StatusHandler handler) -> void override
    {
        status_handler_ = std::move(handler);

        if (cancelled_)
        {
            finish({TransportStatus::cancelled, {}});
            return;
        }

        report({TransportStatus::preparing, {}});

        // Host proxy settings are never consulted; both dispositions dial directly
        if (config_.debug_logging)
        {
            std::cerr << "proxy="
                      << (ProxyType::none == config_.proxy_type ? "none" : "system (not consulted)")
                      << std::endl;
        }

        boost::asio::co_spawn(strand_, establish(),
            [self = shared_from_this()](std::exception_ptr const e) {
                if (e)
                {
                    self->fail(e);
                }
                else
                {
                    self->on_established();
                }
            });
    }

    auto cancel() -> void override
    {
        if (cancelled_ || terminal_)
        {
            return;
        }

        cancelled_ = true;
        close_socket();

        if (status_handler_)
        {
            finish({TransportStatus::cancelled, {}});
        }
    }

    auto receive(std::size_t const max_length, ReceiveHandler handler) -> void override
    {
        if (not established_ || terminal_)
        {
            boost::asio::post(strand_, [handler = std::move(handler)] {
                handler(make_error_code(ConnectionErrc::not_connected), {});
            });
            return;
        }

        read_buffer_.resize(max_length);

        std::visit([this, &handler](auto& stream) {
            stream.async_read_some(
                boost::asio::buffer(read_buffer_),
                [self = shared_from_this(), handler = std::move(handler)](
                    boost::system::error_code const error,
                    std::size_t const n
                ) {
                    handler(error, std::string_view{self->read_buffer_.data(), n});
                });
        }, stream_);
    }

    auto send(std::string data, SendHandler handler) -> void override
    {
        if (not established_ || terminal_)
        {
            boost::asio::post(strand_, [handler = std::move(handler)] {
                handler(make_error_code(ConnectionErrc::not_connected));
            });
            return;
        }

        sending_ = std::move(data);

        std::visit([this, &handler](auto& stream) {
            boost::asio::async_write(
                stream,
                boost::asio::buffer(sending_),
                [self = shared_from_this(), handler = std::move(handler)](
                    boost::system::error_code const error,
                    std::size_t
                ) {
                    self->sending_.clear();
                    handler(error);
                });
        }, stream_);
    }

    auto remote_endpoint() const -> std::optional<std::string> override
    {
        boost::system::error_code ec;
        auto const endpoint = lowest_layer().remote_endpoint(ec);
        if (ec)
        {
            return std::nullopt;
        }
        return endpoint.address().to_string();
    }

    auto tls_metadata() const -> std::optional<TlsMetadata> override
    {
        return established_ ? tls_metadata_ : std::nullopt;
    }

private:
    auto lowest_layer() -> socket_type&
    {
        return std::visit([](auto& stream) -> socket_type& { return stream.lowest_layer(); }, stream_);
    }

    auto lowest_layer() const -> socket_type const&
    {
        return std::visit([](auto const& stream) -> socket_type const& { return stream.lowest_layer(); }, stream_);
    }

    /// @brief Deliver a status on the strand
    auto report(TransportState const state) -> void
    {
        if (terminal_)
        {
            return;
        }

        boost::asio::post(strand_, [self = shared_from_this(), state] {
            self->status_handler_(state);
        });
    }

    /// @brief Deliver the one terminal status
    auto finish(TransportState const state) -> void
    {
        if (terminal_)
        {
            return;
        }

        report(state);
        terminal_ = true;
    }

    auto close_socket() -> void
    {
        resolver_.cancel();

        boost::system::error_code err;
        auto& socket = lowest_layer();
        socket.shutdown(socket.shutdown_both, err);
        socket.close(err);
    }

    auto fail(std::exception_ptr const e) -> void
    {
        try
        {
            std::rethrow_exception(e);
        }
        catch (boost::system::system_error const& err)
        {
            finish({TransportStatus::failed, err.code()});
        }
        catch (std::exception const& err)
        {
            std::cerr << "error in transport: " << err.what() << std::endl;
            finish({TransportStatus::failed, make_error_code(ConnectionErrc::transport_failure)});
        }
    }

    /// @brief Abandon setup when cancel ran while an operation was suspended
    auto check_cancelled() -> void
    {
        if (cancelled_)
        {
            // async_connect reopens the socket it was given
            close_socket();
            throw boost::system::system_error{boost::asio::error::make_error_code(boost::asio::error::operation_aborted)};
        }
    }

    auto establish() -> boost::asio::awaitable<void>
    {
        auto const entries = co_await resolver_.async_resolve(
            config_.server_address,
            std::to_string(config_.server_port),
            boost::asio::use_awaitable);
        check_cancelled();

        auto& socket = lowest_layer();
        auto const endpoint = co_await boost::asio::async_connect(socket, entries, boost::asio::use_awaitable);
        check_cancelled();

        if (config_.debug_logging)
        {
            std::cerr << "tcp=" << endpoint << std::endl;
        }

        socket.set_option(boost::asio::ip::tcp::no_delay{true});
        set_buffer_size(socket, irc_buffer_size);
        set_cloexec(socket.native_handle());

        if (auto const tls = std::get_if<tls_type>(&stream_))
        {
            configure_tls(*tls);

            // Configuration complete, initiate the handshake
            co_await tls->async_handshake(tls_type::client, boost::asio::use_awaitable);
        }
    }

    auto configure_tls(tls_type& stream) -> void
    {
        auto const ssl = stream.native_handle();

        // Set the client certificate, if specified
        if (config_.client_identity)
        {
            if (auto const client_cert = config_.client_identity->certificate.get())
            {
                if (1 != SSL_use_certificate(ssl, client_cert))
                {
                    openssl_error("SSL_use_certificate");
                }
            }

            if (auto const client_key = config_.client_identity->private_key.get())
            {
                if (1 != SSL_use_PrivateKey(ssl, client_key))
                {
                    openssl_error("SSL_use_PrivateKey");
                }
            }
        }

        // Update the BIO buffer sizes
        set_buffer_size(stream, irc_buffer_size);

        // Configure ALPN
        {
            auto constexpr protos = alpn_encode("irc");
            // non-standard return behavior
            if (0 != SSL_set_alpn_protos(ssl, protos.data(), protos.size()))
            {
                // not documented to set an error code
                throw std::runtime_error{"SSL_set_alpn_protos"};
            }
        }

        auto const& name = config_.verify_name();

        if (is_ip_address(name))
        {
            if (1 != X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), name.c_str()))
            {
                openssl_error("X509_VERIFY_PARAM_set1_ip_asc");
            }
        }
        else
        {
            // SNI is only defined for host names
            if (1 != SSL_set_tlsext_host_name(ssl, name.c_str()))
            {
                // not documented to set an error code
                throw std::runtime_error{"SSL_set_tlsext_host_name"};
            }

            if (1 != SSL_set1_host(ssl, name.c_str()))
            {
                openssl_error("SSL_set1_host");
            }
        }

        // Verification failures are recorded and judged by the trust policy
        stream.set_verify_mode(boost::asio::ssl::verify_peer);
        stream.set_verify_callback([](bool, boost::asio::ssl::verify_context&) { return true; });
    }

    auto on_established() -> void
    {
        if (terminal_)
        {
            return;
        }

        auto const tls = std::get_if<tls_type>(&stream_);
        if (nullptr == tls)
        {
            established_ = true;
            report({TransportStatus::ready, {}});
            return;
        }

        auto const ssl = tls->native_handle();

        tls_metadata_ = TlsMetadata{
            SSL_get_version(ssl),
            SSL_CIPHER_get_name(SSL_get_current_cipher(ssl)),
        };

        auto trust = TrustContext::from_ssl(ssl, config_.verify_name());
        auto const verify_result = trust->verify_result();

        trust_handler_(std::move(trust),
            [self = shared_from_this(), verify_result](bool const accepted) {
                boost::asio::post(self->strand_, [self, verify_result, accepted] {
                    self->on_trust(accepted, verify_result);
                });
            });
    }

    auto on_trust(bool const accepted, long const verify_result) -> void
    {
        if (terminal_)
        {
            return;
        }

        if (not accepted)
        {
            auto const error = X509_V_OK == verify_result
                ? make_error_code(ConnectionErrc::certificate_rejected)
                : make_x509_error(verify_result);
            close_socket();
            finish({TransportStatus::failed, error});
            return;
        }

        established_ = true;
        report({TransportStatus::ready, {}});
    }
};

} // namespace

auto build_ssl_context(ConnectionConfig const& config) -> boost::asio::ssl::context
{
    boost::asio::ssl::context ssl_context{boost::asio::ssl::context::method::tls_client};
    ssl_context.set_default_verify_paths();

    auto const ctx = ssl_context.native_handle();

    if (config.prefers_modern_ciphers_only)
    {
        if (1 != SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION))
        {
            openssl_error("SSL_CTX_set_min_proto_version");
        }
    }

    if (config.cipher_suites || config.prefers_modern_ciphers_only)
    {
        std::string cipher_list = config.cipher_suites.value_or("DEFAULT");

        // Drop key exchanges without forward secrecy and non-AEAD MACs
        if (config.prefers_modern_ciphers_only)
        {
            cipher_list += ":!kRSA:!SHA1:!SHA256:!SHA384";
        }

        if (1 != SSL_CTX_set_cipher_list(ctx, cipher_list.c_str()))
        {
            openssl_error("SSL_CTX_set_cipher_list");
        }
    }

    return ssl_context;
}

auto make_asio_transport(
    Strand strand,
    ConnectionConfig const& config,
    TrustHandler trust_handler
) -> std::shared_ptr<Transport>
{
    return std::make_shared<AsioTransport>(std::move(strand), config, std::move(trust_handler));
}

} // namespace ircsock
