#include "async_tls/tls/openssl_session.hpp"
#include "async_tls/core/logger.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include "async_tls/tls/tls_error.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <climits>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <string>

namespace{
constexpr std::size_t BIO_PAIR_SIZE = 65536;

unsigned long last_ssl_error(){
    return ::ERR_peek_last_error();
}

int reason_of_error(unsigned long err){
    if(err == 0) return 0;
    return static_cast<int>(::ERR_GET_REASON(err));
}

std::string to_lower(std::string s){
    for(char& ch : s){
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

tls::tls_error classify_ssl_reason(unsigned long err){
    int reason = reason_of_error(err);
    if(reason == 0) return tls::tls_error::ssl_library_error;

#ifdef SSL_R_CERTIFICATE_VERIFY_FAILED
    if(reason == SSL_R_CERTIFICATE_VERIFY_FAILED) return tls::tls_error::verify_failed;
#endif

    const char* reason_text = ::ERR_reason_error_string(err);
    if(reason_text == nullptr) return tls::tls_error::ssl_library_error;

    std::string lowered = to_lower(reason_text);
    if(lowered.find("hostname") != std::string::npos){
        return tls::tls_error::verify_hostname_mismatch;
    }
    if(lowered.find("certificate") != std::string::npos || lowered.find("cert") != std::string::npos){
        return tls::tls_error::verify_failed;
    }
    if(lowered.find("verify") != std::string::npos){
        return tls::tls_error::verify_failed;
    }
    if(lowered.find("handshake") != std::string::npos){
        return tls::tls_error::handshake_failed;
    }
    if(lowered.find("alert") != std::string::npos){
        return tls::tls_error::alert_received;
    }
    if(lowered.find("protocol") != std::string::npos || lowered.find("version") != std::string::npos){
        return tls::tls_error::protocol_error;
    }
    return tls::tls_error::ssl_library_error;
}

error_code make_tls_session_error(tls::tls_error kind){
    return error_code::from_tls(tls::make_code(kind, reason_of_error(last_ssl_error())));
}

error_code make_tls_verify_error(tls::tls_error kind, long verify_rc){
    return error_code::from_tls(tls::make_code(kind, static_cast<int>(verify_rc)));
}

int clamp_int(std::size_t n){
    return static_cast<int>(std::min<std::size_t>(n, INT_MAX));
}
}

void openssl_session::ssl_deleter::operator()(SSL* p) const noexcept{
    if(p) ::SSL_free(p);
}

void openssl_session::bio_deleter::operator()(BIO* p) const noexcept{
    if(p) ::BIO_free(p);
}

openssl_session::openssl_session(
    std::unique_ptr<SSL, ssl_deleter> ssl, std::unique_ptr<BIO, bio_deleter> net_bio, bool client
) noexcept :
    ssl(std::move(ssl)), net_bio(std::move(net_bio)), client(client), started(!client){}

std::expected <std::unique_ptr<openssl_session>, error_code> openssl_session::create(tls_context& ctx, bool client){
    ::ERR_clear_error();
    SSL* raw = ::SSL_new(ctx.get());
    if(raw == nullptr) return std::unexpected(make_tls_session_error(tls::tls_error::session_create_failed));
    std::unique_ptr<SSL, ssl_deleter> ssl(raw);

    BIO* inner = nullptr;
    BIO* outer = nullptr;
    ::ERR_clear_error();
    if(::BIO_new_bio_pair(&inner, BIO_PAIR_SIZE, &outer, BIO_PAIR_SIZE) != 1){
        return std::unexpected(make_tls_session_error(tls::tls_error::bio_create_failed));
    }

    // ssl takes the single reference to the inner half.
    ::SSL_set_bio(ssl.get(), inner, inner);
    std::unique_ptr<BIO, bio_deleter> net_bio(outer);

    return std::unique_ptr<openssl_session>(new openssl_session(std::move(ssl), std::move(net_bio), client));
}

std::expected <std::unique_ptr<openssl_session>, error_code> openssl_session::create_server(tls_context& ctx){
    if(!ctx.is_server()) return std::unexpected(error_code::from_errno(EINVAL));

    auto session_exp = create(ctx, false);
    if(!session_exp) return std::unexpected(session_exp.error());

    ::SSL_set_accept_state((*session_exp)->ssl.get());
    return session_exp;
}

std::expected <std::unique_ptr<openssl_session>, error_code> openssl_session::create_client(
    tls_context& ctx, std::string_view server_name
){
    if(ctx.is_server() || server_name.empty()){
        return std::unexpected(error_code::from_errno(EINVAL));
    }

    auto session_exp = create(ctx, true);
    if(!session_exp) return std::unexpected(session_exp.error());
    openssl_session& s = **session_exp;

    std::string host(server_name);
    ::ERR_clear_error();
    if(::SSL_set_tlsext_host_name(s.ssl.get(), host.c_str()) != 1){
        return std::unexpected(make_tls_session_error(tls::tls_error::set_sni_failed));
    }

    ::ERR_clear_error();
    if(::SSL_set1_host(s.ssl.get(), host.c_str()) != 1){
        return std::unexpected(make_tls_session_error(tls::tls_error::set_host_failed));
    }

    session_store* store = ctx.sessions();
    if(store != nullptr && store->resume(s.ssl.get(), host)){
        SSL_SESSION* cached = ::SSL_get0_session(s.ssl.get());
        if(ctx.early_data_enabled() && cached != nullptr){
            s.early_budget = ::SSL_SESSION_get_max_early_data(cached);
            s.early_phase = s.early_budget > 0;
        }
        logger::log_debug("openssl_session", "create_client", "resuming session for " + host);
    }

    ::SSL_set_connect_state(s.ssl.get());
    return session_exp;
}

error_code openssl_session::from_ssl_error(int ssl_error) const{
    if(ssl_error == SSL_ERROR_SSL){
        unsigned long err = last_ssl_error();
        tls::tls_error kind = classify_ssl_reason(err);
        if(tls::is_verify_error(kind)){
            long verify_rc = ::SSL_get_verify_result(ssl.get());
            if(verify_rc == X509_V_ERR_HOSTNAME_MISMATCH){
                return make_tls_verify_error(tls::tls_error::verify_hostname_mismatch, verify_rc);
            }
            // The reason half of a verify kind is an X509_V_ERR_* value.
            return make_tls_verify_error(kind, verify_rc);
        }
        return error_code::from_tls(tls::make_code(kind, reason_of_error(err)));
    }

    if(ssl_error == SSL_ERROR_SYSCALL){
        return make_tls_session_error(tls::tls_error::ssl_library_error);
    }
    return make_tls_session_error(tls::tls_error::protocol_error);
}

std::expected <void, error_code> openssl_session::start_handshake(){
    started = true;
    early_phase = false;

    ::ERR_clear_error();
    int rc = ::SSL_do_handshake(ssl.get());
    if(rc == 1) return {};

    int ssl_error = ::SSL_get_error(ssl.get(), rc);
    if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) return {};
    return std::unexpected(from_ssl_error(ssl_error));
}

std::expected <bool, error_code> openssl_session::advance_handshake(){
    if(::SSL_is_init_finished(ssl.get())) return true;

    started = true;
    early_phase = false;

    ::ERR_clear_error();
    int rc = ::SSL_do_handshake(ssl.get());
    if(rc == 1){
        logger::log_debug(
            "openssl_session", "advance_handshake",
            std::string("handshake complete, ") + ::SSL_get_version(ssl.get())
        );
        return true;
    }

    int ssl_error = ::SSL_get_error(ssl.get(), rc);
    if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) return false;
    return std::unexpected(from_ssl_error(ssl_error));
}

std::expected <void, error_code> openssl_session::drain_plaintext(){
    std::array<char, BUF_SIZE> tmp;
    while(!peer_closed){
        std::size_t byte = 0;
        ::ERR_clear_error();
        int rc = ::SSL_read_ex(ssl.get(), tmp.data(), tmp.size(), &byte);
        if(rc == 1){
            plaintext.append(tmp.data(), byte);
            continue;
        }

        int ssl_error = ::SSL_get_error(ssl.get(), rc);
        if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) return {};
        if(ssl_error == SSL_ERROR_ZERO_RETURN){
            peer_closed = true;
            return {};
        }
        if(ssl_error == SSL_ERROR_SYSCALL && ::ERR_peek_error() == 0) return {};
        return std::unexpected(from_ssl_error(ssl_error));
    }
    return {};
}

std::size_t openssl_session::feed_incoming(){
    std::size_t fed = 0;
    while(incoming.has_pending()){
        int written = ::BIO_write(net_bio.get(), incoming.current_data(), clamp_int(incoming.remaining()));
        if(written <= 0) break;
        incoming.advance(static_cast<std::size_t>(written));
        fed += static_cast<std::size_t>(written);
    }
    return fed;
}

void openssl_session::pull_outgoing(){
    std::array<char, BUF_SIZE> tmp;
    while(::BIO_ctrl_pending(net_bio.get()) > 0){
        int got = ::BIO_read(net_bio.get(), tmp.data(), clamp_int(tmp.size()));
        if(got <= 0) break;
        outgoing.append(tmp.data(), static_cast<std::size_t>(got));
    }
}

std::expected <void, error_code> openssl_session::try_shutdown(){
    ::ERR_clear_error();
    int rc = ::SSL_shutdown(ssl.get());
    if(rc >= 0){
        close_pending = false;
        return {};
    }

    int ssl_error = ::SSL_get_error(ssl.get(), rc);
    if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE){
        close_pending = true;
        return {};
    }
    close_pending = false;
    if(ssl_error == SSL_ERROR_ZERO_RETURN) return {};

    return std::unexpected(
        error_code::from_tls(tls::make_code(tls::tls_error::shutdown_failed, reason_of_error(last_ssl_error())))
    );
}

bool openssl_session::is_handshaking() const{
    return !::SSL_is_init_finished(ssl.get());
}

bool openssl_session::wants_read() const{
    return !peer_closed && plaintext.empty();
}

bool openssl_session::wants_write() const{
    if(!started || close_pending) return true;
    return outgoing.has_pending() || ::BIO_ctrl_pending(net_bio.get()) > 0;
}

bool openssl_session::accepts_early_data() const{
    return client && early_phase && early_budget > 0;
}

bool openssl_session::is_early_data_accepted() const{
    return ::SSL_get_early_data_status(ssl.get()) == SSL_EARLY_DATA_ACCEPTED;
}

std::expected <std::size_t, error_code> openssl_session::write_early_data(const char* src, std::size_t len){
    if(!accepts_early_data() || len == 0) return 0;

    std::size_t byte = 0;
    ::ERR_clear_error();
    int rc = ::SSL_write_early_data(ssl.get(), src, std::min(len, early_budget), &byte);
    started = true;
    if(rc == 1){
        early_budget -= std::min(byte, early_budget);
        return byte;
    }

    early_phase = false;
    int ssl_error = ::SSL_get_error(ssl.get(), rc);
    if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) return 0;
    return std::unexpected(
        error_code::from_tls(tls::make_code(tls::tls_error::early_data_failed, reason_of_error(last_ssl_error())))
    );
}

std::expected <std::size_t, error_code> openssl_session::write_plaintext(const char* src, std::size_t len){
    if(len == 0) return 0;
    if(close_sent) return std::unexpected(error_code::from_errno(EPIPE));

    std::size_t byte = 0;
    ::ERR_clear_error();
    int rc = ::SSL_write_ex(ssl.get(), src, len, &byte);
    if(rc == 1) return byte;

    int ssl_error = ::SSL_get_error(ssl.get(), rc);
    if(ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) return 0;
    if(ssl_error == SSL_ERROR_ZERO_RETURN) return std::unexpected(error_code::from_errno(EPIPE));
    return std::unexpected(from_ssl_error(ssl_error));
}

std::expected <std::size_t, error_code> openssl_session::read_plaintext(char* dst, std::size_t cap){
    if(cap == 0) return 0;
    if(plaintext.has_pending()) return plaintext.consume_into(dst, cap);
    if(peer_closed) return std::unexpected(error_code::from_errno(ECONNABORTED));
    return 0;
}

std::expected <std::size_t, error_code> openssl_session::write_tls(raw_endpoint& io){
    if(!started){
        auto start_exp = start_handshake();
        if(!start_exp) return std::unexpected(start_exp.error());
    }
    if(close_pending){
        auto shutdown_exp = try_shutdown();
        if(!shutdown_exp) return std::unexpected(shutdown_exp.error());
    }

    if(outgoing.empty()) pull_outgoing();
    if(outgoing.empty()) return 0;

    auto write_exp = io.write_some(outgoing.current_data(), outgoing.remaining());
    if(!write_exp) return std::unexpected(write_exp.error());
    outgoing.advance(*write_exp);
    return *write_exp;
}

std::expected <std::size_t, error_code> openssl_session::read_tls(raw_endpoint& io){
    std::array<char, BUF_SIZE> tmp;
    auto read_exp = io.read_some(tmp.data(), tmp.size());
    if(!read_exp) return std::unexpected(read_exp.error());

    if(*read_exp > 0){
        incoming.append(tmp.data(), *read_exp);
        feed_incoming();
    }
    return *read_exp;
}

std::expected <void, error_code> openssl_session::process_new_packets(){
    feed_incoming();
    while(true){
        auto handshake_exp = advance_handshake();
        if(!handshake_exp) return std::unexpected(handshake_exp.error());

        if(*handshake_exp){
            auto drain_exp = drain_plaintext();
            if(!drain_exp) return std::unexpected(drain_exp.error());
        }

        // net_bio had no room; retry once OpenSSL has consumed what it holds.
        if(incoming.empty() || feed_incoming() == 0) return {};
    }
}

std::expected <void, error_code> openssl_session::send_close_notify(){
    if(close_sent) return {};
    close_sent = true;
    return try_shutdown();
}

std::expected <void, error_code> openssl_session::verify_peer() const{
    if(ssl == nullptr) return std::unexpected(error_code::from_errno(EINVAL));
    X509* cert = ::SSL_get1_peer_certificate(ssl.get());
    if(cert == nullptr){
        return std::unexpected(make_tls_verify_error(tls::tls_error::verify_no_peer_cert, 0));
    }
    ::X509_free(cert);

    long verify_rc = ::SSL_get_verify_result(ssl.get());
    if(verify_rc != X509_V_OK){
        if(verify_rc == X509_V_ERR_HOSTNAME_MISMATCH){
            return std::unexpected(
                make_tls_verify_error(tls::tls_error::verify_hostname_mismatch, verify_rc)
            );
        }
        if(verify_rc == X509_V_ERR_CERT_HAS_EXPIRED){
            return std::unexpected(
                make_tls_verify_error(tls::tls_error::verify_cert_expired, verify_rc)
            );
        }
        if(verify_rc == X509_V_ERR_CERT_NOT_YET_VALID){
            return std::unexpected(
                make_tls_verify_error(tls::tls_error::verify_cert_not_yet_valid, verify_rc)
            );
        }
        return std::unexpected(make_tls_verify_error(tls::tls_error::verify_failed, verify_rc));
    }
    return {};
}

bool openssl_session::is_resumed() const{
    return ::SSL_session_reused(ssl.get()) == 1;
}

SSL* openssl_session::get() const noexcept{ return ssl.get(); }
