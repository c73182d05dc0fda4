#pragma once

#include "connection_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ircsock {

/**
 * @brief Receiver of connection lifecycle events.
 *
 * will_connect and will_send run synchronously on the thread calling
 * open() and write(). Every other callback runs on the strand of the
 * current attempt. Exactly one of disconnected or disconnected_with ends
 * every connection attempt.
 */
class ConnectionDelegate
{
public:
    virtual ~ConnectionDelegate() = default;

    virtual auto will_connect(std::string_view address, std::uint16_t port) -> void = 0;
    virtual auto did_connect(std::optional<std::string> const& host) -> void = 0;
    virtual auto secured_with(std::string_view protocol, std::string_view cipher_suite) -> void = 0;

    /// @brief One completed line without its terminator
    virtual auto received(std::string_view line) -> void = 0;

    virtual auto will_send(std::string_view data) -> void = 0;
    virtual auto did_send() -> void = 0;

    virtual auto disconnected() -> void = 0;
    virtual auto disconnected_with(ConnectionError const& error) -> void = 0;
};

} // namespace ircsock
