#pragma once
#include <ostream>
#include <string>

namespace config_loader{
    enum class config_error : int;
}

namespace tls{
    enum class tls_error : int;
}

enum class stream_error : int;

enum class error_domain { errno_domain, config_domain, tls_domain, stream_domain };
struct error_code{
    error_domain domain{};
    int code{0};

    static error_code from_errno(int ec);

    static error_code from_config(int ec);
    static error_code from_config(config_loader::config_error ec);
    static error_code from_tls(int ec);
    static error_code from_tls(tls::tls_error ec);
    static error_code from_stream(int ec);
    static error_code from_stream(stream_error ec);

    friend bool operator==(const error_code&, const error_code&) = default;
};

// EAGAIN / EWOULDBLOCK: the operation made no progress and must be retried
// once the raw endpoint is ready again.
bool is_would_block(const error_code& ec) noexcept;
bool is_connection_aborted(const error_code& ec) noexcept;
bool is_invalid_data(const error_code& ec) noexcept;

std::string to_string(const error_code& ec);
std::ostream& operator<<(std::ostream& os, const error_code& ec);
