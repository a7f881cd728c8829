#pragma once
#include "async_tls/core/error_code.hpp"
#include <cstddef>
#include <expected>

class raw_endpoint;
class tls_session;

// One round of I/O reconciliation between a tls_session and its raw endpoint.
//
// This is the only place that alternates raw endpoint I/O with session
// mutation. A pump borrows both for the duration of a single stream
// operation; the eof flag is seeded from the stream's read half.
class session_pump{
    raw_endpoint& io;
    tls_session& session;
    bool eof = false;
public:
    struct io_counts{
        std::size_t read = 0;
        std::size_t written = 0;
    };

    session_pump(raw_endpoint& io, tls_session& session, bool eof = false) noexcept;

    bool is_eof() const noexcept;

    // Moves ciphertext from the endpoint into the session and processes it.
    // On a protocol error one best-effort write_io is made so a queued alert
    // can reach the peer.
    std::expected <std::size_t, error_code> read_io();
    std::expected <std::size_t, error_code> write_io();

    std::expected <io_counts, error_code> complete_io();

    std::expected <std::size_t, error_code> read(char* dst, std::size_t cap);
    std::expected <std::size_t, error_code> write(const char* src, std::size_t len);
    std::expected <void, error_code> flush();
};
