#pragma once
#include "async_tls/core/error_code.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include "async_tls/stream/mid_handshake.hpp"
#include "async_tls/tls/tls_context.hpp"
#include <expected>
#include <memory>
#include <string_view>

class tls_connector{
    std::shared_ptr<tls_context> ctx;
    bool early_data = false;
public:
    explicit tls_connector(std::shared_ptr<tls_context> ctx) noexcept;

    // Resumed sessions start in the early-data state and write 0-RTT data.
    tls_connector& enable_early_data(bool on = true) noexcept;
    bool early_data_enabled() const noexcept;

    std::expected <mid_handshake, error_code> connect(
        std::string_view server_name, std::unique_ptr<raw_endpoint> io
    ) const;
    const tls_context& context() const noexcept;
};

class tls_acceptor{
    std::shared_ptr<tls_context> ctx;
public:
    explicit tls_acceptor(std::shared_ptr<tls_context> ctx) noexcept;

    std::expected <mid_handshake, error_code> accept(std::unique_ptr<raw_endpoint> io) const;
    const tls_context& context() const noexcept;
};
