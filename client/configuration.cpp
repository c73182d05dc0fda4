#include "configuration.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unistd.h>

[[noreturn]] static void usage(void)
{
    std::cerr <<
    "usage: ircsock-cat\n"
    "         -H host\n"
    "         [-p port]\n"
    "         [-t]\n"
    "         [-c client_cert.pem]\n"
    "         [-k client_key.pem]\n"
    "         [-C cipher_list]\n"
    "         [-m]\n"
    "         [-n server_name]\n"
    "         [-F sha256_fingerprint]\n"
    "         [-I]\n"
    "         [-x]\n"
    "         [-d]\n"
    "         [-h]\n"
    "\n"
    "  -F  SHA-256 of the leaf's subjectPublicKey bits (not the whole SPKI),\n"
    "      hex with optional colons\n"
    "  -x  connect directly; proxy settings are not consulted\n"
    "\n"
    "  IRCSOCK_KEY_PASSWORD   password for the client private key\n";
    exit(EXIT_FAILURE);
}

static auto parse_port(char const* const str) -> std::uint16_t
{
    std::uint16_t port;
    auto const end = str + std::strlen(str);
    auto const [ptr, ec] = std::from_chars(str, end, port);
    if (ec != std::errc{} || ptr != end || 0 == port)
    {
        std::cerr << "Bad port number: " << str << std::endl;
        usage();
    }
    return port;
}

configuration load_configuration(int argc, char** argv)
{
    configuration cfg {};

    cfg.client_key_password = getenv("IRCSOCK_KEY_PASSWORD");

    char const* const flags = ":c:C:dF:hH:Ik:mn:p:tx";
    int opt;
    while ((opt = getopt(argc, argv, flags)) != -1) {
        switch (opt) {
        default: abort();
        case '?': std::cerr << "Unknown flag: " << char(optopt) << std::endl; usage();
        case ':': std::cerr << "Missing flag argument: " << char(optopt) << std::endl; usage();
        case 'h': usage();
        case 'c': cfg.client_cert           = optarg; break;
        case 'C': cfg.cipher_list           = optarg; break;
        case 'd': cfg.debug                 = true; break;
        case 'F': cfg.fingerprint           = optarg; break;
        case 'H': cfg.host                  = optarg; break;
        case 'I': cfg.insecure              = true; break;
        case 'k': cfg.client_key            = optarg; break;
        case 'm': cfg.modern_ciphers        = true; break;
        case 'n': cfg.server_name           = optarg; break;
        case 'p': cfg.port                  = parse_port(optarg); break;
        case 't': cfg.tls                   = true; break;
        case 'x': cfg.no_proxy              = true; break;
        }
    }

    argv += optind;
    argc -= optind;

    bool show_usage = false;

    if (nullptr == cfg.host) {
        std::cerr << "Server host required (-H).\n";
        show_usage = true;
    }

    if (nullptr != cfg.client_key && nullptr == cfg.client_cert) {
        std::cerr << "Client key requires a client certificate (-c).\n";
        show_usage = true;
    }

    if (nullptr != cfg.fingerprint && cfg.insecure) {
        std::cerr << "Fingerprint pinning (-F) and insecure mode (-I) are exclusive.\n";
        show_usage = true;
    }

    if (argc != 0) {
        std::cerr << "Unexpected positional argument.\n";
        show_usage = true;
    }

    if (show_usage) {
        usage();
    }

    if (0 == cfg.port) {
        cfg.port = cfg.tls ? 6697 : 6667;
    }

    return cfg;
}

auto connection_config(configuration const& cfg) -> ircsock::ConnectionConfig
{
    ircsock::ConnectionConfig config;
    config.server_address = cfg.host;
    config.server_port = cfg.port;
    config.prefers_secured_connection = cfg.tls;
    config.proxy_type = cfg.no_proxy ? ircsock::ProxyType::none : ircsock::ProxyType::system;
    config.prefers_modern_ciphers_only = cfg.modern_ciphers;
    config.debug_logging = cfg.debug;

    if (nullptr != cfg.cipher_list) {
        config.cipher_suites = cfg.cipher_list;
    }

    if (nullptr != cfg.server_name) {
        config.server_name = cfg.server_name;
    }

    if (nullptr != cfg.client_cert) {
        config.client_identity = ircsock::load_client_identity(
            cfg.client_cert,
            nullptr == cfg.client_key ? "" : cfg.client_key,
            nullptr == cfg.client_key_password ? "" : cfg.client_key_password);
    }

    return config;
}

auto trust_policy(configuration const& cfg) -> ircsock::TrustPolicy
{
    if (nullptr != cfg.fingerprint) {
        return ircsock::pin_public_key(cfg.fingerprint);
    }
    if (cfg.insecure) {
        return ircsock::accept_any();
    }
    return ircsock::accept_preverified();
}
