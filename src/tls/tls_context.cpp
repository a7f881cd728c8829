#include "async_tls/tls/tls_context.hpp"
#include "async_tls/tls/tls_error.hpp"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <string>

namespace{
int tls_context_last_reason(){
    unsigned long err = ::ERR_peek_last_error();
    if(err == 0) return 0;
    return static_cast<int>(::ERR_GET_REASON(err));
}

error_code make_tls_context_error(tls::tls_error kind){
    return error_code::from_tls(tls::make_code(kind, tls_context_last_reason()));
}

struct bio_deleter{
    void operator()(BIO* p) const noexcept{ if(p) ::BIO_free(p); }
};
struct x509_deleter{
    void operator()(X509* p) const noexcept{ if(p) ::X509_free(p); }
};
struct pkey_deleter{
    void operator()(EVP_PKEY* p) const noexcept{ if(p) ::EVP_PKEY_free(p); }
};

using bio_ptr = std::unique_ptr<BIO, bio_deleter>;

bio_ptr open_pem(std::string_view pem){
    if(pem.empty() || pem.size() > static_cast<std::size_t>(INT_MAX)) return nullptr;
    return bio_ptr(::BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}
}

std::expected <void, error_code> tls_context::init_tls(){
    ::ERR_clear_error();
    if(::OPENSSL_init_ssl(0, nullptr) == 1) return {};
    return std::unexpected(make_tls_context_error(tls::tls_error::openssl_init_failed));
}

std::expected <void, error_code> tls_context::set_common_options(SSL_CTX* ctx, const tls_options& opt){
    int min_version = opt.min_version == tls_version::tls1_3 ? TLS1_3_VERSION : TLS1_2_VERSION;
    ::ERR_clear_error();
    if(::SSL_CTX_set_min_proto_version(ctx, min_version) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::min_protocol_set_failed));
    }

    long options = SSL_OP_NO_COMPRESSION;
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    options |= SSL_OP_IGNORE_UNEXPECTED_EOF;
#endif
    ::SSL_CTX_set_options(ctx, options);
    ::SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    return {};
}

std::expected <std::unique_ptr<SSL_CTX, tls_context::ctx_deleter>, error_code> tls_context::new_ctx(
    bool server, const tls_options& opt
){
    auto init_exp = tls_context::init_tls();
    if(!init_exp) return std::unexpected(init_exp.error());

    ::ERR_clear_error();
    SSL_CTX* raw = ::SSL_CTX_new(server ? ::TLS_server_method() : ::TLS_client_method());
    if(raw == nullptr) return std::unexpected(make_tls_context_error(tls::tls_error::ctx_create_failed));

    std::unique_ptr<SSL_CTX, ctx_deleter> ctx(raw);
    auto common_exp = tls_context::set_common_options(ctx.get(), opt);
    if(!common_exp) return std::unexpected(common_exp.error());

    if(server){
        // Tickets advertise this budget; 0 keeps early data off.
        ::SSL_CTX_set_max_early_data(ctx.get(), static_cast<uint32_t>(opt.max_early_data));
    }
    else{
        ::SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    }
    return ctx;
}

std::expected <void, error_code> tls_context::use_pem_identity(
    SSL_CTX* ctx, std::string_view cert_chain_pem, std::string_view private_key_pem
){
    bio_ptr cert_bio = open_pem(cert_chain_pem);
    if(cert_bio == nullptr) return std::unexpected(make_tls_context_error(tls::tls_error::cert_chain_load_failed));

    ::ERR_clear_error();
    std::unique_ptr<X509, x509_deleter> leaf(::PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if(leaf == nullptr || ::SSL_CTX_use_certificate(ctx, leaf.get()) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::cert_chain_load_failed));
    }

    // Remaining certificates in the PEM form the chain.
    ::SSL_CTX_clear_chain_certs(ctx);
    while(true){
        X509* extra = ::PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr);
        if(extra == nullptr) break;
        if(::SSL_CTX_add0_chain_cert(ctx, extra) != 1){
            ::X509_free(extra);
            return std::unexpected(make_tls_context_error(tls::tls_error::cert_chain_load_failed));
        }
    }
    ::ERR_clear_error();

    bio_ptr key_bio = open_pem(private_key_pem);
    if(key_bio == nullptr) return std::unexpected(make_tls_context_error(tls::tls_error::private_key_load_failed));

    std::unique_ptr<EVP_PKEY, pkey_deleter> key(
        ::PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr)
    );
    if(key == nullptr || ::SSL_CTX_use_PrivateKey(ctx, key.get()) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::private_key_load_failed));
    }

    ::ERR_clear_error();
    if(::SSL_CTX_check_private_key(ctx) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::private_key_check_failed));
    }
    return {};
}

std::expected <void, error_code> tls_context::add_pem_trust(SSL_CTX* ctx, std::string_view ca_pem){
    bio_ptr bio = open_pem(ca_pem);
    if(bio == nullptr) return std::unexpected(make_tls_context_error(tls::tls_error::ca_load_failed));

    X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
    int added = 0;
    ::ERR_clear_error();
    while(true){
        std::unique_ptr<X509, x509_deleter> cert(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if(cert == nullptr) break;
        if(::X509_STORE_add_cert(store, cert.get()) != 1){
            return std::unexpected(make_tls_context_error(tls::tls_error::ca_load_failed));
        }
        ++added;
    }

    if(added == 0) return std::unexpected(make_tls_context_error(tls::tls_error::ca_load_failed));
    ::ERR_clear_error();
    return {};
}

tls_context tls_context::make_client(std::unique_ptr<SSL_CTX, ctx_deleter> ctx, const tls_options& opt){
    tls_context out(std::move(ctx), false, opt);
    out.store = std::make_unique<session_store>();
    session_store::attach(out.ctx.get(), out.store.get());
    return out;
}

void tls_context::ctx_deleter::operator()(SSL_CTX* p) const noexcept{
    if(p) ::SSL_CTX_free(p);
}

tls_context::tls_context(std::unique_ptr<SSL_CTX, ctx_deleter> ctx, bool server, const tls_options& opt) noexcept :
    ctx(std::move(ctx)), server(server), opts(opt){}

// SSL objects can outlive the context and keep the SSL_CTX alive, so the
// callback must stop seeing the store before it is destroyed.
void tls_context::release_store() noexcept{
    if(ctx != nullptr && store != nullptr) session_store::detach(ctx.get());
}

tls_context::~tls_context(){
    release_store();
}

tls_context& tls_context::operator=(tls_context&& other) noexcept{
    if(this == &other) return *this;
    release_store();
    ctx = std::move(other.ctx);
    store = std::move(other.store);
    server = other.server;
    opts = other.opts;
    return *this;
}

std::expected <tls_context, error_code> tls_context::create_server(
    std::string_view cert_chain_path,
    std::string_view private_key_path,
    const tls_options& opt
){
    if(cert_chain_path.empty() || private_key_path.empty()){
        return std::unexpected(error_code::from_errno(EINVAL));
    }

    auto ctx_exp = tls_context::new_ctx(true, opt);
    if(!ctx_exp) return std::unexpected(ctx_exp.error());
    auto ctx = std::move(*ctx_exp);

    std::string cert(cert_chain_path);
    std::string key(private_key_path);
    ::ERR_clear_error();
    if(::SSL_CTX_use_certificate_chain_file(ctx.get(), cert.c_str()) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::cert_chain_load_failed));
    }

    ::ERR_clear_error();
    if(::SSL_CTX_use_PrivateKey_file(ctx.get(), key.c_str(), SSL_FILETYPE_PEM) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::private_key_load_failed));
    }

    ::ERR_clear_error();
    if(::SSL_CTX_check_private_key(ctx.get()) != 1){
        return std::unexpected(make_tls_context_error(tls::tls_error::private_key_check_failed));
    }

    return tls_context(std::move(ctx), true, opt);
}

std::expected <tls_context, error_code> tls_context::create_server_from_pem(
    std::string_view cert_chain_pem,
    std::string_view private_key_pem,
    const tls_options& opt
){
    auto ctx_exp = tls_context::new_ctx(true, opt);
    if(!ctx_exp) return std::unexpected(ctx_exp.error());
    auto ctx = std::move(*ctx_exp);

    auto identity_exp = tls_context::use_pem_identity(ctx.get(), cert_chain_pem, private_key_pem);
    if(!identity_exp) return std::unexpected(identity_exp.error());

    return tls_context(std::move(ctx), true, opt);
}

std::expected <tls_context, error_code> tls_context::create_client(
    std::string_view ca_file_path, const tls_options& opt
){
    auto ctx_exp = tls_context::new_ctx(false, opt);
    if(!ctx_exp) return std::unexpected(ctx_exp.error());
    auto ctx = std::move(*ctx_exp);

    if(ca_file_path.empty()){
        ::ERR_clear_error();
        if(::SSL_CTX_set_default_verify_paths(ctx.get()) != 1){
            return std::unexpected(make_tls_context_error(tls::tls_error::default_verify_paths_failed));
        }
    }
    else{
        std::string ca_file(ca_file_path);
        ::ERR_clear_error();
        if(::SSL_CTX_load_verify_locations(ctx.get(), ca_file.c_str(), nullptr) != 1){
            return std::unexpected(make_tls_context_error(tls::tls_error::ca_load_failed));
        }
    }

    return make_client(std::move(ctx), opt);
}

std::expected <tls_context, error_code> tls_context::create_client_from_pem(
    std::string_view ca_pem, const tls_options& opt
){
    auto ctx_exp = tls_context::new_ctx(false, opt);
    if(!ctx_exp) return std::unexpected(ctx_exp.error());
    auto ctx = std::move(*ctx_exp);

    auto trust_exp = tls_context::add_pem_trust(ctx.get(), ca_pem);
    if(!trust_exp) return std::unexpected(trust_exp.error());

    return make_client(std::move(ctx), opt);
}

std::expected <tls_context, error_code> tls_context::create(const tls_config& cfg){
    if(cfg.role == tls_role::server){
        return create_server(cfg.cert_chain_path, cfg.private_key_path, cfg.options);
    }
    return create_client(cfg.ca_file_path, cfg.options);
}

SSL_CTX* tls_context::get() const noexcept{ return ctx.get(); }
bool tls_context::is_server() const noexcept{ return server; }
bool tls_context::early_data_enabled() const noexcept{ return opts.early_data; }
const tls_options& tls_context::options() const noexcept{ return opts; }
session_store* tls_context::sessions() const noexcept{ return store.get(); }
