#include "ircsock/transport.hpp"

namespace ircsock {

auto to_string(TransportStatus const status) -> char const*
{
    switch (status)
    {
    case TransportStatus::setup:
        return "setup";
    case TransportStatus::preparing:
        return "preparing";
    case TransportStatus::waiting:
        return "waiting";
    case TransportStatus::ready:
        return "ready";
    case TransportStatus::failed:
        return "failed";
    case TransportStatus::cancelled:
        return "cancelled";
    default:
        return "(unrecognized status)";
    }
}

} // namespace ircsock
