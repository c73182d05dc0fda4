#include "configuration.hpp"
#include "console.hpp"

#include <ircsock/connection_socket.hpp>

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <memory>

auto main(int argc, char* argv[]) -> int
{
    auto const cfg = load_configuration(argc, argv);

    ircsock::ConnectionConfig config;
    try
    {
        config = connection_config(cfg);
    }
    catch (boost::system::system_error const& e)
    {
        std::cerr << "error in client identity: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    boost::asio::io_context io_context;

    auto const console = std::make_shared<Console>(io_context, ::dup(STDIN_FILENO));
    auto const socket = ircsock::ConnectionSocket::create(
        io_context.get_executor(),
        std::move(config),
        console,
        trust_policy(cfg));

    console->start(socket);
    socket->open();

    io_context.run();

    return console->exit_code();
}
