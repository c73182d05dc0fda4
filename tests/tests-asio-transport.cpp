#include "test_identity.hpp"

#include <ircsock/asio_transport.hpp>
#include <ircsock/connection_error.hpp>

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ircsock::TransportStatus;
using tcp = boost::asio::ip::tcp;

class AsioTransportTest : public ::testing::Test
{
protected:
    boost::asio::io_context io_context;
    ircsock::Strand strand{io_context.get_executor()};
    tcp::acceptor acceptor{io_context, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    std::vector<ircsock::TransportState> statuses;

    auto config() -> ircsock::ConnectionConfig
    {
        ircsock::ConnectionConfig config;
        config.server_address = "127.0.0.1";
        config.server_port = acceptor.local_endpoint().port();
        return config;
    }

    auto make(ircsock::ConnectionConfig const& config, ircsock::TrustHandler trust_handler = {})
        -> std::shared_ptr<ircsock::Transport>
    {
        return ircsock::make_asio_transport(strand, config, std::move(trust_handler));
    }

    auto start(ircsock::Transport& transport) -> void
    {
        transport.start([this](ircsock::TransportState const state) {
            statuses.push_back(state);
        });
    }

    /// Run handlers until the condition holds or no work remains
    auto run_until(std::function<bool()> const& done) -> void
    {
        while (not done())
        {
            io_context.restart();
            if (0 == io_context.run_one())
            {
                break;
            }
        }
    }

    auto has(TransportStatus const status) const -> bool
    {
        for (auto const& state : statuses)
        {
            if (state.status == status)
            {
                return true;
            }
        }
        return false;
    }

    auto status_list() const -> std::vector<TransportStatus>
    {
        std::vector<TransportStatus> result;
        for (auto const& state : statuses)
        {
            result.push_back(state.status);
        }
        return result;
    }
};

TEST(BuildSslContext, InvalidCipherListThrows)
{
    ircsock::ConnectionConfig config;
    config.cipher_suites = "NOT-A-CIPHER";
    EXPECT_THROW(ircsock::build_ssl_context(config), boost::system::system_error);
}

TEST(BuildSslContext, ModernCiphersOnly)
{
    ircsock::ConnectionConfig config;
    config.prefers_modern_ciphers_only = true;
    auto context = ircsock::build_ssl_context(config);
    auto const ctx = context.native_handle();

    EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx), TLS1_2_VERSION);

    auto const ciphers = SSL_CTX_get_ciphers(ctx);
    ASSERT_NE(ciphers, nullptr);
    ASSERT_GT(sk_SSL_CIPHER_num(ciphers), 0);
    for (int i = 0; i < sk_SSL_CIPHER_num(ciphers); i++)
    {
        auto const cipher = sk_SSL_CIPHER_value(ciphers, i);
        EXPECT_EQ(SSL_CIPHER_is_aead(cipher), 1) << SSL_CIPHER_get_name(cipher);
        EXPECT_NE(SSL_CIPHER_get_kx_nid(cipher), NID_kx_rsa) << SSL_CIPHER_get_name(cipher);
    }
}

TEST_F(AsioTransportTest, CancelBeforeStart)
{
    auto const transport = make(config());
    transport->cancel();
    start(*transport);
    io_context.run();

    std::vector<TransportStatus> const expected {TransportStatus::cancelled};
    EXPECT_EQ(status_list(), expected);
}

TEST_F(AsioTransportTest, PlainRoundTrip)
{
    tcp::socket server{io_context};
    bool accepted = false;
    acceptor.async_accept(server, [&accepted](boost::system::error_code const error) {
        ASSERT_FALSE(error);
        accepted = true;
    });

    auto const transport = make(config());
    start(*transport);
    run_until([&] { return accepted && has(TransportStatus::ready); });

    std::vector<TransportStatus> expected {TransportStatus::preparing, TransportStatus::ready};
    ASSERT_EQ(status_list(), expected);
    EXPECT_EQ(transport->remote_endpoint(), "127.0.0.1");
    EXPECT_FALSE(transport->tls_metadata());

    boost::asio::write(server, boost::asio::buffer(std::string_view{"PING :x\r\n"}));

    std::optional<std::string> received;
    transport->receive(512, [&received](boost::system::error_code const error, std::string_view const bytes) {
        ASSERT_FALSE(error);
        received = std::string{bytes};
    });
    run_until([&] { return received && *received == "PING :x\r\n"; });
    EXPECT_EQ(received, "PING :x\r\n");

    std::optional<boost::system::error_code> sent;
    transport->send("PONG :x\r\n", [&sent](boost::system::error_code const error) {
        sent = error;
    });
    run_until([&] { return sent.has_value(); });
    ASSERT_TRUE(sent);
    EXPECT_FALSE(*sent);

    std::string reply(9, '\0');
    boost::asio::read(server, boost::asio::buffer(reply));
    EXPECT_EQ(reply, "PONG :x\r\n");

    transport->cancel();
    transport->cancel();
    io_context.restart();
    io_context.run();

    expected.push_back(TransportStatus::cancelled);
    EXPECT_EQ(status_list(), expected);

    // The peer sees the connection shut down
    char byte;
    boost::system::error_code error;
    server.read_some(boost::asio::buffer(&byte, 1), error);
    EXPECT_EQ(error, boost::asio::error::make_error_code(boost::asio::error::eof));
}

TEST_F(AsioTransportTest, RefusedConnectionFails)
{
    auto const settings = config();
    acceptor.close();

    auto const transport = make(settings);
    start(*transport);
    io_context.run();

    std::vector<TransportStatus> const expected {TransportStatus::preparing, TransportStatus::failed};
    ASSERT_EQ(status_list(), expected);
    EXPECT_EQ(statuses[1].error, boost::asio::error::make_error_code(boost::asio::error::connection_refused));

    // Nothing follows the terminal status
    transport->cancel();
    io_context.restart();
    io_context.run();
    EXPECT_EQ(status_list(), expected);
}

TEST_F(AsioTransportTest, CancelDuringSetup)
{
    auto const transport = make(config());
    start(*transport);
    transport->cancel();
    io_context.run();

    std::vector<TransportStatus> const expected {TransportStatus::preparing, TransportStatus::cancelled};
    EXPECT_EQ(status_list(), expected);
    EXPECT_FALSE(transport->remote_endpoint());
}

TEST_F(AsioTransportTest, DebugLogNamesProxyDisposition)
{
    auto settings = config();
    settings.debug_logging = true;

    settings.proxy_type = ircsock::ProxyType::none;
    auto const direct = make(settings);
    ::testing::internal::CaptureStderr();
    start(*direct);
    auto const direct_log = ::testing::internal::GetCapturedStderr();
    direct->cancel();

    settings.proxy_type = ircsock::ProxyType::system;
    auto const via_system = make(settings);
    ::testing::internal::CaptureStderr();
    start(*via_system);
    auto const system_log = ::testing::internal::GetCapturedStderr();
    via_system->cancel();

    io_context.run();

    EXPECT_NE(direct_log.find("proxy=none"), std::string::npos) << direct_log;
    EXPECT_NE(system_log.find("proxy=system (not consulted)"), std::string::npos) << system_log;
}

TEST_F(AsioTransportTest, IoBeforeReadyIsRejected)
{
    auto const transport = make(config());

    std::optional<boost::system::error_code> receive_error;
    transport->receive(512, [&receive_error](boost::system::error_code const error, std::string_view) {
        receive_error = error;
    });

    std::optional<boost::system::error_code> send_error;
    transport->send("PING :x\r\n", [&send_error](boost::system::error_code const error) {
        send_error = error;
    });

    io_context.run();

    EXPECT_EQ(receive_error, make_error_code(ircsock::ConnectionErrc::not_connected));
    EXPECT_EQ(send_error, make_error_code(ircsock::ConnectionErrc::not_connected));
}

class AsioTlsTransportTest : public AsioTransportTest
{
protected:
    ircsock_test::Identity identity = ircsock_test::make_identity("irc.example.net");
    boost::asio::ssl::context tls_server{boost::asio::ssl::context::tls_server};
    boost::asio::ssl::stream<tcp::socket> server{io_context, tls_server};
    bool server_ready = false;

    std::shared_ptr<ircsock::TrustContext const> seen;

    auto SetUp() -> void override
    {
        auto const ctx = tls_server.native_handle();
        ASSERT_EQ(SSL_CTX_use_certificate(ctx, identity.certificate.get()), 1);
        ASSERT_EQ(SSL_CTX_use_PrivateKey(ctx, identity.key.get()), 1);
        // server's SSL* was created from tls_server before the key pair was installed
        ASSERT_EQ(SSL_use_certificate(server.native_handle(), identity.certificate.get()), 1);
        ASSERT_EQ(SSL_use_PrivateKey(server.native_handle(), identity.key.get()), 1);

        acceptor.async_accept(server.lowest_layer(), [this](boost::system::error_code const error) {
            ASSERT_FALSE(error);
            server.async_handshake(boost::asio::ssl::stream_base::server,
                [this](boost::system::error_code const handshake_error) {
                    server_ready = not handshake_error;
                });
        });
    }

    /// Transport whose trust handler records the chain and answers with the verdict
    auto make_tls(bool const verdict) -> std::shared_ptr<ircsock::Transport>
    {
        auto settings = config();
        settings.prefers_secured_connection = true;
        return make(settings,
            [this, verdict](std::shared_ptr<ircsock::TrustContext const> trust, ircsock::TrustCompletion completion) {
                seen = std::move(trust);
                completion(verdict);
            });
    }
};

TEST_F(AsioTlsTransportTest, RejectedChainFails)
{
    auto const transport = make_tls(false);
    start(*transport);
    run_until([this] { return has(TransportStatus::failed); });

    std::vector<TransportStatus> const expected {TransportStatus::preparing, TransportStatus::failed};
    ASSERT_EQ(status_list(), expected);

    ASSERT_TRUE(seen);
    EXPECT_NE(seen->verify_result(), X509_V_OK);
    EXPECT_EQ(seen->chain().size(), 1u);
    EXPECT_EQ(statuses[1].error, ircsock::make_x509_error(seen->verify_result()));
    EXPECT_FALSE(transport->tls_metadata());
}

TEST_F(AsioTlsTransportTest, AcceptedChainIsReady)
{
    auto const transport = make_tls(true);
    start(*transport);
    run_until([this] { return server_ready && has(TransportStatus::ready); });

    std::vector<TransportStatus> expected {TransportStatus::preparing, TransportStatus::ready};
    ASSERT_EQ(status_list(), expected);

    ASSERT_TRUE(seen);
    EXPECT_EQ(seen->host(), "127.0.0.1");
    EXPECT_EQ(seen->chain().size(), 1u);

    auto const metadata = transport->tls_metadata();
    ASSERT_TRUE(metadata);
    EXPECT_FALSE(metadata->protocol.empty());
    EXPECT_FALSE(metadata->cipher_suite.empty());

    transport->cancel();
    run_until([this] { return has(TransportStatus::cancelled); });

    expected.push_back(TransportStatus::cancelled);
    EXPECT_EQ(status_list(), expected);
}

} // namespace
