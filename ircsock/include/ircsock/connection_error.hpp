#pragma once
/**
 * @file connection_error.hpp
 * @brief Uniform error values reported to connection delegates
 *
 */

#include <boost/system/error_code.hpp>

#include <ostream>
#include <string>
#include <variant>

namespace ircsock {

/// @brief Operating system level transport failure
struct PosixError
{
    int code;
    std::string message;

    auto operator==(PosixError const&) const -> bool = default;
};

/// @brief TLS negotiation or certificate trust failure
struct TlsError
{
    std::string reason;

    auto operator==(TlsError const&) const -> bool = default;
};

/// @brief Any failure without a more specific classification
struct GenericError
{
    std::string message;

    auto operator==(GenericError const&) const -> bool = default;
};

using ConnectionError = std::variant<PosixError, TlsError, GenericError>;

/**
 * @brief Render an error for humans
 *
 * @param error error value
 * @return single-line description
 */
auto describe(ConnectionError const& error) -> std::string;

auto operator<<(std::ostream& os, ConnectionError const& error) -> std::ostream&;

/**
 * @brief Map a transport error code into the uniform taxonomy.
 *
 * Codes in the system or generic categories become PosixError, OpenSSL,
 * X.509 verification and trust rejection codes become TlsError and anything
 * else becomes GenericError. Every input produces a usable message.
 *
 * @param error transport error code
 * @return translated error
 */
auto translate_error(boost::system::error_code const& error) -> ConnectionError;

/// @brief Errors raised by this library itself
enum class ConnectionErrc
{
    no_data = 1,
    not_connected,
    certificate_rejected,
    transport_failure,
};

struct ConnectionErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern ConnectionErrCategory const theConnectionErrCategory;

/// @brief Certificate verification results as reported by X509_verify_cert
struct X509ErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern X509ErrCategory const theX509ErrCategory;

auto make_error_code(ConnectionErrc err) -> boost::system::error_code;

/// @brief Wrap an X509_V_ERR_* value
auto make_x509_error(long verify_result) -> boost::system::error_code;

/**
 * @brief Throws a boost::system::system_error with the latest OpenSSL error.
 *
 * Retrieves the most recent OpenSSL error code, clears the OpenSSL error queue,
 * and throws with the provided prefix and the error code.
 *
 * @param prefix A string to prefix the error message.
 */
[[noreturn]] auto openssl_error(char const* prefix) -> void;

} // namespace ircsock

namespace boost::system {
template <>
struct is_error_code_enum<ircsock::ConnectionErrc> : std::true_type {};
} // namespace boost::system
