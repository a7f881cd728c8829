#pragma once
#include "async_tls/core/error_code.hpp"
#include <cstddef>
#include <expected>

// Non-blocking byte transport underneath a tls_stream.
//
// read_some / write_some never block. When no progress is possible they fail
// with an errno-domain EAGAIN code and the caller retries after the endpoint
// becomes ready. A read of 0 bytes means the peer closed its sending side.
class raw_endpoint{
public:
    virtual ~raw_endpoint() = default;

    virtual std::expected <std::size_t, error_code> read_some(char* dst, std::size_t cap) = 0;
    virtual std::expected <std::size_t, error_code> write_some(const char* src, std::size_t len) = 0;
    virtual std::expected <void, error_code> flush() = 0;

    // Stops the sending direction. Calling it again is a no-op.
    virtual std::expected <void, error_code> close() = 0;
};
