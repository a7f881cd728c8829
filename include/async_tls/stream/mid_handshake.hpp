#pragma once
#include "async_tls/core/error_code.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include "async_tls/stream/tls_stream.hpp"
#include "async_tls/tls/tls_session.hpp"
#include <expected>
#include <memory>
#include <variant>

// One-shot handshake driver. poll() returns EAGAIN until the handshake is
// done, then yields the stream exactly once and becomes spent.
class mid_handshake{
public:
    struct handshaking{
        tls_stream stream;
    };
    // Early data may be written before the handshake finishes; yields at once.
    struct early_data_pending{
        tls_stream stream;
    };
    struct spent{};

    using state_type = std::variant<handshaking, early_data_pending, spent>;

    explicit mid_handshake(handshaking st) noexcept;
    explicit mid_handshake(early_data_pending st) noexcept;

    mid_handshake(mid_handshake&&) noexcept = default;
    mid_handshake& operator=(mid_handshake&&) noexcept = default;

    std::expected <tls_stream, error_code> poll();

    bool is_spent() const noexcept;
    bool is_early_data() const noexcept;
private:
    state_type st;
};

mid_handshake start_client_handshake(
    std::unique_ptr<raw_endpoint> io, std::unique_ptr<tls_session> session, bool early_data = false
);
mid_handshake start_server_handshake(std::unique_ptr<raw_endpoint> io, std::unique_ptr<tls_session> session);
