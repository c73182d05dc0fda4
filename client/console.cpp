#include "console.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <istream>
#include <iterator>

Console::Console(boost::asio::io_context& io_context, int const input_fd)
    : input_{io_context, input_fd}
    , signals_{io_context, SIGINT, SIGTERM}
    , input_closed_{false}
    , failed_{false}
{
}

auto Console::start(std::shared_ptr<ircsock::ConnectionSocket> const& socket) -> void
{
    socket_ = socket;

    signals_.async_wait([weak = weak_from_this()](boost::system::error_code const error, int) {
        if (error)
        {
            return;
        }
        if (auto const self = weak.lock())
        {
            if (auto const socket = self->socket_.lock())
            {
                socket->close();
            }
        }
    });

    read_input();
}

auto Console::exit_code() const -> int
{
    return failed_ ? EXIT_FAILURE : EXIT_SUCCESS;
}

auto Console::read_input() -> void
{
    boost::asio::async_read_until(input_, input_buffer_, '\n',
        [self = shared_from_this()](boost::system::error_code const error, std::size_t) {
            if (boost::asio::error::operation_aborted == error)
            {
                return;
            }

            if (error)
            {
                // a final line without a newline is still sent
                if (0 < self->input_buffer_.size())
                {
                    std::istream is{&self->input_buffer_};
                    std::string line{std::istreambuf_iterator<char>{is}, {}};
                    self->queue_line(std::move(line));
                }

                // end of input closes the connection once the outbox drains
                self->input_closed_ = true;
                self->flush();
                return;
            }

            std::istream is{&self->input_buffer_};
            std::string line;
            std::getline(is, line);
            self->queue_line(std::move(line));
            self->flush();
            self->read_input();
        });
}

auto Console::queue_line(std::string line) -> void
{
    if (not line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    line += "\r\n";
    outbox_.push_back(std::move(line));
}

auto Console::flush() -> void
{
    auto const socket = socket_.lock();
    if (not socket || socket->sending())
    {
        return;
    }

    if (outbox_.empty())
    {
        if (input_closed_)
        {
            socket->close();
        }
        return;
    }

    if (not socket->connected())
    {
        return;
    }

    auto line = std::move(outbox_.front());
    outbox_.pop_front();
    socket->write(std::move(line));
}

auto Console::shutdown() -> void
{
    boost::system::error_code err;
    input_.cancel(err);
    input_.close(err);
    signals_.cancel(err);
}

auto Console::will_connect(std::string_view const address, std::uint16_t const port) -> void
{
    std::cerr << "connecting to " << address << " port " << port << std::endl;
}

auto Console::did_connect(std::optional<std::string> const& host) -> void
{
    std::cerr << "connected to " << host.value_or("(unknown)") << std::endl;
    flush();
}

auto Console::secured_with(std::string_view const protocol, std::string_view const cipher_suite) -> void
{
    std::cerr << "secured with " << protocol << " " << cipher_suite;
    if (auto const socket = socket_.lock())
    {
        if (auto const policy = socket->tls_policy_name())
        {
            std::cerr << " (" << *policy << ")";
        }
    }
    std::cerr << std::endl;
}

auto Console::received(std::string_view const line) -> void
{
    std::cout << line << std::endl;
}

auto Console::will_send(std::string_view) -> void
{
}

auto Console::did_send() -> void
{
    flush();
}

auto Console::disconnected() -> void
{
    std::cerr << "disconnected" << std::endl;
    shutdown();
}

auto Console::disconnected_with(ircsock::ConnectionError const& error) -> void
{
    std::cerr << "error in connection: " << error << std::endl;
    failed_ = true;
    shutdown();
}
