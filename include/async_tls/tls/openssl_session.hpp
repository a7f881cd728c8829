#pragma once
#include "async_tls/core/error_code.hpp"
#include "async_tls/net/offset_buffer.hpp"
#include "async_tls/tls/tls_context.hpp"
#include "async_tls/tls/tls_session.hpp"
#include <expected>
#include <memory>
#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <string_view>

// tls_session backed by an OpenSSL SSL object attached to one side of a BIO
// pair. The other side (net_bio) is pumped by write_tls / read_tls.
class openssl_session : public tls_session{
    struct ssl_deleter{
        void operator()(SSL* p) const noexcept;
    };
    struct bio_deleter{
        void operator()(BIO* p) const noexcept;
    };

    std::unique_ptr<SSL, ssl_deleter> ssl;
    std::unique_ptr<BIO, bio_deleter> net_bio;

    offset_buffer outgoing;   // ciphertext taken from net_bio, not yet accepted by the endpoint
    offset_buffer incoming;   // ciphertext read from the endpoint, not yet accepted by net_bio
    offset_buffer plaintext;

    bool client = false;
    bool started = false;
    bool early_phase = false;
    std::size_t early_budget = 0;
    bool peer_closed = false;
    bool close_sent = false;
    bool close_pending = false;

    openssl_session(std::unique_ptr<SSL, ssl_deleter> ssl, std::unique_ptr<BIO, bio_deleter> net_bio, bool client) noexcept;

    static std::expected <std::unique_ptr<openssl_session>, error_code> create(tls_context& ctx, bool client);

    std::expected <void, error_code> start_handshake();
    std::expected <bool, error_code> advance_handshake();
    std::expected <void, error_code> drain_plaintext();
    std::expected <void, error_code> try_shutdown();
    std::size_t feed_incoming();
    void pull_outgoing();
    error_code from_ssl_error(int ssl_error) const;
public:
    openssl_session(const openssl_session&) = delete;
    openssl_session& operator=(const openssl_session&) = delete;

    static std::expected <std::unique_ptr<openssl_session>, error_code> create_server(tls_context& ctx);
    static std::expected <std::unique_ptr<openssl_session>, error_code> create_client(
        tls_context& ctx, std::string_view server_name
    );

    bool is_handshaking() const override;
    bool wants_read() const override;
    bool wants_write() const override;

    bool accepts_early_data() const override;
    bool is_early_data_accepted() const override;
    std::expected <std::size_t, error_code> write_early_data(const char* src, std::size_t len) override;

    std::expected <std::size_t, error_code> write_plaintext(const char* src, std::size_t len) override;
    std::expected <std::size_t, error_code> read_plaintext(char* dst, std::size_t cap) override;

    std::expected <std::size_t, error_code> write_tls(raw_endpoint& io) override;
    std::expected <std::size_t, error_code> read_tls(raw_endpoint& io) override;

    std::expected <void, error_code> process_new_packets() override;
    std::expected <void, error_code> send_close_notify() override;

    std::expected <void, error_code> verify_peer() const;
    bool is_resumed() const;
    SSL* get() const noexcept;
};
