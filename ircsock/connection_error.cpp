#include "ircsock/connection_error.hpp"

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/err.h>
#include <openssl/x509.h>

#include <sstream>

namespace ircsock {

ConnectionErrCategory const theConnectionErrCategory;
X509ErrCategory const theX509ErrCategory;

char const* ConnectionErrCategory::name() const noexcept
{
    return "ircsock";
}

std::string ConnectionErrCategory::message(int ev) const
{
    switch (static_cast<ConnectionErrc>(ev))
    {
    case ConnectionErrc::no_data:
        return "Unexpected condition: There is no data when there is no error";
    case ConnectionErrc::not_connected:
        return "transport is not connected";
    case ConnectionErrc::certificate_rejected:
        return "certificate rejected by trust policy";
    case ConnectionErrc::transport_failure:
        return "transport setup failed";
    default:
        return "(unrecognized error)";
    }
}

char const* X509ErrCategory::name() const noexcept
{
    return "x509";
}

std::string X509ErrCategory::message(int ev) const
{
    return X509_verify_cert_error_string(ev);
}

auto make_error_code(ConnectionErrc const err) -> boost::system::error_code
{
    return boost::system::error_code{static_cast<int>(err), theConnectionErrCategory};
}

auto make_x509_error(long const verify_result) -> boost::system::error_code
{
    return boost::system::error_code{static_cast<int>(verify_result), theX509ErrCategory};
}

[[noreturn]] auto openssl_error(char const* const prefix) -> void
{
    boost::system::error_code ec{
        static_cast<int>(::ERR_get_error()),
        boost::asio::error::get_ssl_category()
    };

    ::ERR_clear_error();

    throw boost::system::system_error{ec, prefix};
}

namespace {

auto is_posix(boost::system::error_category const& category) -> bool
{
    return category == boost::system::system_category()
        || category == boost::system::generic_category();
}

/// Human-readable description of an OpenSSL packed error code
auto handshake_failure_string(boost::system::error_code const& error) -> std::string
{
    if (auto const reason = ERR_reason_error_string(static_cast<unsigned long>(error.value())))
    {
        return reason;
    }
    return error.message();
}

} // namespace

auto translate_error(boost::system::error_code const& error) -> ConnectionError
{
    auto const& category = error.category();

    if (is_posix(category))
    {
        return PosixError{error.value(), boost::system::generic_category().message(error.value())};
    }

    if (category == boost::asio::error::get_ssl_category())
    {
        return TlsError{handshake_failure_string(error)};
    }

    if (category == boost::asio::ssl::error::get_stream_category()
     || category == theX509ErrCategory
     || error == ConnectionErrc::certificate_rejected)
    {
        return TlsError{error.message()};
    }

    return GenericError{error.message()};
}

auto describe(ConnectionError const& error) -> std::string
{
    std::ostringstream os;
    os << error;
    return os.str();
}

auto operator<<(std::ostream& os, ConnectionError const& error) -> std::ostream&
{
    struct Printer
    {
        std::ostream& os;
        auto operator()(PosixError const& e) const -> void
        {
            os << "socket error " << e.code << ": " << e.message;
        }
        auto operator()(TlsError const& e) const -> void
        {
            os << "unable to secure connection: " << e.reason;
        }
        auto operator()(GenericError const& e) const -> void
        {
            os << e.message;
        }
    };
    std::visit(Printer{os}, error);
    return os;
}

} // namespace ircsock
