#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>

namespace ircsock {

/**
 * @brief Owning reference to a reference-counted OpenSSL object
 *
 * @tparam T OpenSSL object type
 * @tparam UpRef function incrementing the reference count
 * @tparam Free function releasing one reference
 */
template <typename T, auto UpRef(T *) -> int, auto Free(T *) -> void>
class Ref {
    struct Deleter { auto operator()(T * const ptr) -> void { Free(ptr); }};
    std::unique_ptr<T, Deleter> obj;

public:
    Ref() = default;

    /// @brief Share an object owned elsewhere
    explicit Ref(T* t) : obj{t} { if (t) UpRef(t); }

    Ref(Ref const& other) : Ref{other.get()} {}
    Ref(Ref&&) noexcept = default;
    auto operator=(Ref const& other) -> Ref& { return *this = Ref{other}; }
    auto operator=(Ref&&) noexcept -> Ref& = default;

    /// @brief Take ownership of a freshly created object without touching its count
    static auto adopt(T* t) -> Ref
    {
        Ref result;
        result.obj.reset(t);
        return result;
    }

    auto get() const noexcept -> T* { return obj.get(); }
    explicit operator bool() const noexcept { return obj != nullptr; }
};

using X509Ref = Ref<X509, X509_up_ref, X509_free>;
using PkeyRef = Ref<EVP_PKEY, EVP_PKEY_up_ref, EVP_PKEY_free>;

} // namespace ircsock
