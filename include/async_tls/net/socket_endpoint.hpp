#pragma once
#include "async_tls/core/unique_fd.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include <expected>

std::expected <void, error_code> set_nonblocking(int fd);

class socket_endpoint : public raw_endpoint{
    unique_fd ufd;
    bool write_closed = false;
public:
    explicit socket_endpoint(unique_fd ufd) noexcept;

    // Switches the descriptor to non-blocking mode before taking ownership.
    static std::expected <socket_endpoint, error_code> adopt(unique_fd ufd);

    std::expected <std::size_t, error_code> read_some(char* dst, std::size_t cap) override;
    std::expected <std::size_t, error_code> write_some(const char* src, std::size_t len) override;
    std::expected <void, error_code> flush() override;
    std::expected <void, error_code> close() override;

    int native_handle() const noexcept;
};
