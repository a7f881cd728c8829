#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <openssl/ssl.h>

// Client-side resumption tickets keyed by server name. Filled from OpenSSL's
// new-session callback and consulted when a client session is created.
class session_store{
    struct session_deleter{
        void operator()(SSL_SESSION* p) const noexcept;
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::unique_ptr<SSL_SESSION, session_deleter>> sessions;

    static int on_new_session(SSL* ssl, SSL_SESSION* sess);
public:
    session_store() = default;
    session_store(const session_store&) = delete;
    session_store& operator=(const session_store&) = delete;

    static void attach(SSL_CTX* ctx, session_store* store);
    static void detach(SSL_CTX* ctx) noexcept;

    // Takes ownership of sess.
    void put(std::string_view server_name, SSL_SESSION* sess);
    bool resume(SSL* ssl, std::string_view server_name) const;
    void erase(std::string_view server_name);
    std::size_t size() const;
};
