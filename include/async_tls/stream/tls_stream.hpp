#pragma once
#include "async_tls/core/error_code.hpp"
#include "async_tls/net/offset_buffer.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include "async_tls/stream/connection_state.hpp"
#include "async_tls/stream/session_pump.hpp"
#include "async_tls/tls/tls_session.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <utility>

// Non-blocking TLS byte stream over an exclusively owned raw endpoint and
// session.
//
// Every operation either makes progress or fails with EAGAIN, in which case
// the caller waits for the raw endpoint to become ready and retries with the
// same arguments. A read of 0 bytes is end of stream. A reset or aborted
// connection seen while reading is reported as end of stream too. A zero
// length read or write returns 0 without touching the endpoint.
class tls_stream{
    std::unique_ptr<raw_endpoint> io;
    std::unique_ptr<tls_session> session;
    connection_state conn_state;

    // Plaintext handed to the early-data channel; replayed from the cursor
    // if the server rejects it.
    offset_buffer early_data;

    std::expected <void, error_code> finish_early_data();
    void push_close_notify(session_pump& pump);
    session_pump make_pump();

    friend class mid_handshake;
public:
    tls_stream(
        std::unique_ptr<raw_endpoint> io,
        std::unique_ptr<tls_session> session,
        connection_state state = connection_state{}
    ) noexcept;

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;
    tls_stream(tls_stream&&) noexcept = default;
    tls_stream& operator=(tls_stream&&) noexcept = default;

    std::expected <std::size_t, error_code> read(char* dst, std::size_t cap);
    std::expected <std::size_t, error_code> write(const char* src, std::size_t len);
    std::expected <void, error_code> flush();

    // Sends close_notify once, flushes it, then closes the raw endpoint.
    // Safe to call again, including after an EAGAIN.
    std::expected <void, error_code> close();

    const connection_state& state() const noexcept;
    bool wants_write() const;
    std::size_t early_data_buffered() const noexcept;

    std::pair<const raw_endpoint&, const tls_session&> get_ref() const noexcept;
    std::pair<raw_endpoint&, tls_session&> get_mut() noexcept;
    std::pair<std::unique_ptr<raw_endpoint>, std::unique_ptr<tls_session>> into_inner() &&;
};
