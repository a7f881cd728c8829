#pragma once
#include "async_tls/core/error_code.hpp"
#include <cstddef>
#include <expected>

class raw_endpoint;

// In-memory TLS engine driven by tls_stream.
//
// A session never blocks and never touches the network on its own. Ciphertext
// moves only through write_tls / read_tls, which call into the raw endpoint
// exactly once per invocation and consume only what the endpoint accepted.
class tls_session{
public:
    virtual ~tls_session() = default;

    virtual bool is_handshaking() const = 0;
    virtual bool wants_read() const = 0;
    virtual bool wants_write() const = 0;

    // Early data (TLS 1.3 0-RTT). Sessions without the capability return
    // false from accepts_early_data() and never see write_early_data().
    virtual bool accepts_early_data() const = 0;
    virtual bool is_early_data_accepted() const = 0;
    virtual std::expected <std::size_t, error_code> write_early_data(const char* src, std::size_t len) = 0;

    // Queues plaintext for encryption. May accept fewer bytes than offered,
    // including zero when the outgoing record buffer is full.
    virtual std::expected <std::size_t, error_code> write_plaintext(const char* src, std::size_t len) = 0;

    // Copies decrypted data out. 0 means nothing is buffered. Once the peer's
    // close_notify has been processed and the buffer is drained this fails
    // with ECONNABORTED.
    virtual std::expected <std::size_t, error_code> read_plaintext(char* dst, std::size_t cap) = 0;

    virtual std::expected <std::size_t, error_code> write_tls(raw_endpoint& io) = 0;
    virtual std::expected <std::size_t, error_code> read_tls(raw_endpoint& io) = 0;

    // Advances the handshake and decrypts buffered records. Malformed input
    // fails with a tls-domain error code.
    virtual std::expected <void, error_code> process_new_packets() = 0;

    virtual std::expected <void, error_code> send_close_notify() = 0;
};
