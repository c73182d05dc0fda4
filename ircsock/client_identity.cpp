#include "ircsock/connection_config.hpp"

#include "ircsock/connection_error.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>

#include <cstring>
#include <memory>

namespace ircsock {

namespace {

struct BioDeleter { auto operator()(BIO* const bio) -> void { BIO_free_all(bio); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

auto open_file(std::string const& path) -> BioPtr
{
    BioPtr bio{BIO_new_file(path.c_str(), "r")};
    if (not bio)
    {
        openssl_error("BIO_new_file");
    }
    return bio;
}

/// pem_password_cb copying the password stored in userdata
auto password_callback(char* const buf, int const size, int, void* const userdata) -> int
{
    auto const& password = *static_cast<std::string const*>(userdata);
    if (password.size() > static_cast<std::size_t>(size))
    {
        return 0;
    }
    std::memcpy(buf, password.data(), password.size());
    return static_cast<int>(password.size());
}

} // namespace

auto load_client_identity(
    std::string const& certificate_file,
    std::string const& key_file,
    std::string const& password
) -> ClientIdentity
{
    ClientIdentity identity;

    {
        auto const bio = open_file(certificate_file);
        identity.certificate = X509Ref::adopt(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (not identity.certificate)
        {
            openssl_error("PEM_read_bio_X509");
        }
    }

    {
        auto const bio = open_file(key_file.empty() ? certificate_file : key_file);
        auto const userdata = const_cast<std::string*>(&password);
        identity.private_key = PkeyRef::adopt(PEM_read_bio_PrivateKey(bio.get(), nullptr, password_callback, userdata));
        if (not identity.private_key)
        {
            openssl_error("PEM_read_bio_PrivateKey");
        }
    }

    if (1 != X509_check_private_key(identity.certificate.get(), identity.private_key.get()))
    {
        openssl_error("X509_check_private_key");
    }

    return identity;
}

} // namespace ircsock
