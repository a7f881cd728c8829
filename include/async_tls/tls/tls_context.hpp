#pragma once
#include "async_tls/core/error_code.hpp"
#include "async_tls/tls/session_store.hpp"
#include "async_tls/tls/tls_config.hpp"
#include <expected>
#include <memory>
#include <openssl/ssl.h>
#include <string_view>

class tls_context{
    struct ctx_deleter{
        void operator()(SSL_CTX* p) const noexcept;
    };

    std::unique_ptr<SSL_CTX, ctx_deleter> ctx;
    // Heap-allocated so the address registered with OpenSSL survives moves.
    std::unique_ptr<session_store> store;
    bool server = false;
    tls_options opts{};

    static std::expected <void, error_code> init_tls();
    static std::expected <void, error_code> set_common_options(SSL_CTX* ctx, const tls_options& opt);
    static std::expected <std::unique_ptr<SSL_CTX, ctx_deleter>, error_code> new_ctx(
        bool server, const tls_options& opt
    );
    static std::expected <void, error_code> use_pem_identity(
        SSL_CTX* ctx, std::string_view cert_chain_pem, std::string_view private_key_pem
    );
    static std::expected <void, error_code> add_pem_trust(SSL_CTX* ctx, std::string_view ca_pem);
    void release_store() noexcept;
    static tls_context make_client(std::unique_ptr<SSL_CTX, ctx_deleter> ctx, const tls_options& opt);

    tls_context(std::unique_ptr<SSL_CTX, ctx_deleter> ctx, bool server, const tls_options& opt) noexcept;
public:
    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    tls_context(tls_context&& other) noexcept = default;
    tls_context& operator=(tls_context&& other) noexcept;
    ~tls_context();

    static std::expected <tls_context, error_code> create_server(
        std::string_view cert_chain_path,
        std::string_view private_key_path,
        const tls_options& opt = {}
    );
    static std::expected <tls_context, error_code> create_server_from_pem(
        std::string_view cert_chain_pem,
        std::string_view private_key_pem,
        const tls_options& opt = {}
    );
    static std::expected <tls_context, error_code> create_client(
        std::string_view ca_file_path = {}, const tls_options& opt = {}
    );
    static std::expected <tls_context, error_code> create_client_from_pem(
        std::string_view ca_pem, const tls_options& opt = {}
    );
    static std::expected <tls_context, error_code> create(const tls_config& cfg);

    SSL_CTX* get() const noexcept;
    bool is_server() const noexcept;
    bool early_data_enabled() const noexcept;
    const tls_options& options() const noexcept;

    // Client contexts only; nullptr for servers.
    session_store* sessions() const noexcept;
};
