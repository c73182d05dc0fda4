#include "ircsock/connection_socket.hpp"

#include "ircsock/asio_transport.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <iostream>

namespace ircsock {

auto to_string(ConnectionState const state) -> char const*
{
    switch (state)
    {
    case ConnectionState::disconnected:
        return "disconnected";
    case ConnectionState::connecting:
        return "connecting";
    case ConnectionState::connected:
        return "connected";
    case ConnectionState::securing:
        return "securing";
    case ConnectionState::secured:
        return "secured";
    case ConnectionState::disconnecting:
        return "disconnecting";
    default:
        return "(unrecognized state)";
    }
}

/// Runs reset_state when the disconnect handler exits by any path
struct ConnectionSocket::ResetGuard
{
    ConnectionSocket& socket;

    explicit ResetGuard(ConnectionSocket& socket) : socket{socket} {}
    ResetGuard(ResetGuard const&) = delete;
    auto operator=(ResetGuard const&) -> ResetGuard& = delete;

    ~ResetGuard()
    {
        socket.reset_state();
    }
};

ConnectionSocket::ConnectionSocket(
    Private,
    boost::asio::any_io_executor executor,
    ConnectionConfig config,
    std::weak_ptr<ConnectionDelegate> delegate,
    TrustPolicy trust_policy,
    TransportFactory transport_factory
)
    : executor_{std::move(executor)}
    , config_{std::move(config)}
    , delegate_{std::move(delegate)}
    , transport_factory_{transport_factory ? std::move(transport_factory) : TransportFactory{make_asio_transport}}
    , trust_verifier_{std::move(trust_policy)}
    , state_{ConnectionState::disconnected}
    , sending_{false}
    , generation_{0}
{
}

auto ConnectionSocket::create(
    boost::asio::any_io_executor executor,
    ConnectionConfig config,
    std::weak_ptr<ConnectionDelegate> delegate,
    TrustPolicy trust_policy,
    TransportFactory transport_factory
) -> std::shared_ptr<ConnectionSocket>
{
    return std::make_shared<ConnectionSocket>(
        Private{},
        std::move(executor),
        std::move(config),
        std::move(delegate),
        std::move(trust_policy),
        std::move(transport_factory));
}

auto ConnectionSocket::lock(std::weak_ptr<ConnectionSocket> const& weak, std::uint64_t const generation)
    -> std::shared_ptr<ConnectionSocket>
{
    auto self = weak.lock();
    if (self && self->generation_ == generation)
    {
        return self;
    }
    return nullptr;
}

auto ConnectionSocket::connected() const -> bool
{
    switch (state_)
    {
    case ConnectionState::connected:
    case ConnectionState::securing:
    case ConnectionState::secured:
        return true;
    default:
        return false;
    }
}

// Open/Close

auto ConnectionSocket::open() -> void
{
    if (ConnectionState::disconnected != state_)
    {
        return;
    }

    strand_.emplace(boost::asio::make_strand(executor_));
    auto const generation = ++generation_;
    auto const weak = weak_from_this();

    state_ = ConnectionState::connecting;

    boost::system::error_code failure;

    try
    {
        transport_ = transport_factory_(
            *strand_,
            config_,
            [weak, generation](std::shared_ptr<TrustContext const> trust, TrustCompletion completion) {
                if (auto const self = lock(weak, generation))
                {
                    self->trust_verifier_.evaluate(std::move(trust), std::move(completion));
                }
                else
                {
                    completion(false);
                }
            });

        if (not transport_)
        {
            std::cerr << "error in open: no transport" << std::endl;
            failure = ConnectionErrc::transport_failure;
        }
    }
    catch (boost::system::system_error const& e)
    {
        std::cerr << "error in open: " << e.what() << std::endl;
        failure = e.code();
    }
    catch (std::exception const& e)
    {
        std::cerr << "error in open: " << e.what() << std::endl;
        failure = ConnectionErrc::transport_failure;
    }

    // The attempt still ends through the disconnect handler
    if (failure)
    {
        transport_.reset();
        boost::asio::post(*strand_, [weak, generation, failure] {
            if (auto const self = lock(weak, generation))
            {
                self->on_disconnect(failure);
            }
        });
        return;
    }

    if (auto const delegate = delegate_.lock())
    {
        delegate->will_connect(config_.server_address, config_.server_port);
    }

    // a close requested by the delegate is reported by the transport as cancelled
    transport_->start([weak, generation](TransportState const state) {
        if (auto const self = lock(weak, generation))
        {
            self->status_update(state);
        }
    });
}

auto ConnectionSocket::close() -> void
{
    if (ConnectionState::disconnected == state_ || ConnectionState::disconnecting == state_)
    {
        return;
    }

    state_ = ConnectionState::disconnecting;

    if (transport_)
    {
        transport_->cancel();
    }
}

auto ConnectionSocket::close(ConnectionError error) -> void
{
    if (ConnectionState::disconnected == state_ || ConnectionState::disconnecting == state_)
    {
        return;
    }

    alternate_disconnect_error_ = std::move(error);

    close();
}

auto ConnectionSocket::close_with(boost::system::error_code const& error) -> void
{
    close(translate_error(error));
}

auto ConnectionSocket::reset_state() -> void
{
    state_ = ConnectionState::disconnected;
    sending_ = false;
    generation_++;
    alternate_disconnect_error_.reset();
    framer_.clear();
    trust_verifier_.reset();
    transport_.reset();
    strand_.reset();
}

// Read & Write

auto ConnectionSocket::read() -> void
{
    if (not connected() || not transport_)
    {
        return;
    }

    transport_->receive(
        maximum_data_length,
        [weak = weak_from_this(), generation = generation_](
            boost::system::error_code const error,
            std::string_view const data
        ) {
            if (auto const self = lock(weak, generation))
            {
                self->read_completion(error, data);
            }
        });
}

auto ConnectionSocket::read_completion(boost::system::error_code const& error, std::string_view const data) -> void
{
    if (error)
    {
        close_with(error);
        return;
    }

    if (data.empty())
    {
        close_with(ConnectionErrc::no_data);
        return;
    }

    read_in(data);
    read();
}

auto ConnectionSocket::read_in(std::string_view const data) -> void
{
    if (ConnectionState::disconnected == state_ || ConnectionState::disconnecting == state_)
    {
        return;
    }

    auto const delegate = delegate_.lock();
    framer_.append(data, [&delegate](std::string_view const line) {
        if (delegate)
        {
            delegate->received(line);
        }
    });
}

auto ConnectionSocket::write(std::string data) -> void
{
    if (not connected() || not transport_)
    {
        return;
    }

    // We only allow one write at a time
    if (sending_)
    {
        return;
    }

    sending_ = true;

    if (auto const delegate = delegate_.lock())
    {
        delegate->will_send(data);
    }

    transport_->send(
        std::move(data),
        [weak = weak_from_this(), generation = generation_](boost::system::error_code const error) {
            if (auto const self = lock(weak, generation))
            {
                self->write_completion(error);
            }
        });
}

auto ConnectionSocket::write_completion(boost::system::error_code const& error) -> void
{
    sending_ = false;

    if (error)
    {
        close_with(error);
        return;
    }

    if (auto const delegate = delegate_.lock())
    {
        delegate->did_send();
    }
}

// Properties

auto ConnectionSocket::connected_host() const -> std::optional<std::string>
{
    if (not transport_)
    {
        return std::nullopt;
    }
    return transport_->remote_endpoint();
}

auto ConnectionSocket::tls_negotiated_protocol() const -> std::optional<std::string>
{
    if (not transport_)
    {
        return std::nullopt;
    }
    if (auto metadata = transport_->tls_metadata())
    {
        return std::move(metadata->protocol);
    }
    return std::nullopt;
}

auto ConnectionSocket::tls_negotiated_cipher_suite() const -> std::optional<std::string>
{
    if (not transport_)
    {
        return std::nullopt;
    }
    if (auto metadata = transport_->tls_metadata())
    {
        return std::move(metadata->cipher_suite);
    }
    return std::nullopt;
}

auto ConnectionSocket::tls_certificate_chain() const -> std::optional<std::vector<DerCertificate>>
{
    return trust_verifier_.certificate_chain();
}

auto ConnectionSocket::tls_policy_name() const -> std::optional<std::string>
{
    return trust_verifier_.policy_name();
}

// Transport status

auto ConnectionSocket::status_update(TransportState const& state) -> void
{
    switch (state.status)
    {
    case TransportStatus::waiting:
        close_with(state.error);
        break;
    case TransportStatus::ready:
        on_connect();
        break;
    case TransportStatus::cancelled:
        on_disconnect({});
        break;
    case TransportStatus::failed:
        on_disconnect(state.error);
        break;
    default:
        if (config_.debug_logging)
        {
            std::cerr << "status changed: " << to_string(state.status) << std::endl;
        }
        break;
    }
}

auto ConnectionSocket::on_connect() -> void
{
    if (ConnectionState::connecting != state_)
    {
        return;
    }

    state_ = ConnectionState::connected;

    read();

    if (auto const delegate = delegate_.lock())
    {
        delegate->did_connect(connected_host());
    }

    on_secured();
}

auto ConnectionSocket::on_secured() -> void
{
    // Evaluated for every connection; only TLS transports report metadata
    if (ConnectionState::connected != state_ || not transport_)
    {
        return;
    }

    state_ = ConnectionState::securing;

    auto const metadata = transport_->tls_metadata();
    if (not metadata)
    {
        state_ = ConnectionState::connected;
        return;
    }

    state_ = ConnectionState::secured;

    if (auto const delegate = delegate_.lock())
    {
        delegate->secured_with(metadata->protocol, metadata->cipher_suite);
    }
}

auto ConnectionSocket::on_disconnect(boost::system::error_code const& error) -> void
{
    if (ConnectionState::disconnected == state_)
    {
        return;
    }

    ResetGuard const guard{*this};

    std::optional<ConnectionError> payload;

    if (alternate_disconnect_error_)
    {
        payload = std::move(alternate_disconnect_error_);
    }
    else if (error)
    {
        payload = translate_error(error);
    }

    auto const delegate = delegate_.lock();
    if (not delegate)
    {
        return;
    }

    if (payload)
    {
        delegate->disconnected_with(*payload);
    }
    else
    {
        delegate->disconnected();
    }
}

} // namespace ircsock
