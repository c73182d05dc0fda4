#pragma once
/**
 * @file console.hpp
 * @brief Bridges stdin/stdout to a connection socket
 *
 */

#include <ircsock/connection_delegate.hpp>
#include <ircsock/connection_socket.hpp>

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Prints received lines on stdout and sends stdin lines to the server.
 *
 * The connection socket drops overlapping writes, so lines typed while a
 * send is in flight wait in an outbox until did_send. End of input closes
 * the connection after the outbox has been sent. Everything runs on a
 * single-threaded io_context.
 */
class Console final : public ircsock::ConnectionDelegate, public std::enable_shared_from_this<Console>
{
    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf input_buffer_;
    boost::asio::signal_set signals_;

    std::deque<std::string> outbox_;
    std::weak_ptr<ircsock::ConnectionSocket> socket_;

    /// @brief Set at end of input; the socket closes once the outbox drains
    bool input_closed_;
    bool failed_;

public:
    /**
     * @brief Construct a console reading lines from a file descriptor
     *
     * @param io_context context running the connection
     * @param input_fd descriptor to read; the console takes ownership
     */
    Console(boost::asio::io_context& io_context, int input_fd);

    auto operator=(Console const&) -> Console& = delete;
    auto operator=(Console&&) -> Console& = delete;
    Console(Console const&) = delete;
    Console(Console&&) = delete;

    /**
     * @brief Begin reading stdin and watching for termination signals
     *
     * @param socket connection that receives typed lines
     */
    auto start(std::shared_ptr<ircsock::ConnectionSocket> const& socket) -> void;

    auto exit_code() const -> int;

    auto will_connect(std::string_view address, std::uint16_t port) -> void override;
    auto did_connect(std::optional<std::string> const& host) -> void override;
    auto secured_with(std::string_view protocol, std::string_view cipher_suite) -> void override;
    auto received(std::string_view line) -> void override;
    auto will_send(std::string_view data) -> void override;
    auto did_send() -> void override;
    auto disconnected() -> void override;
    auto disconnected_with(ircsock::ConnectionError const& error) -> void override;

private:
    auto read_input() -> void;

    auto queue_line(std::string line) -> void;

    // Send the next queued line if the socket is idle
    auto flush() -> void;

    auto shutdown() -> void;
};
