#include "async_tls/core/error_code.hpp"
#include "async_tls/core/config_loader.hpp"
#include "async_tls/stream/stream_error.hpp"
#include "async_tls/tls/tls_error.hpp"
#include <cerrno>
#include <cstring>

error_code error_code::from_errno(int ec){ return {error_domain::errno_domain, ec}; }

error_code error_code::from_config(int ec){ return {error_domain::config_domain, ec}; }
error_code error_code::from_config(config_loader::config_error ec){
    return from_config(static_cast<int>(ec));
}

error_code error_code::from_tls(int ec){ return {error_domain::tls_domain, ec}; }
error_code error_code::from_tls(tls::tls_error ec){
    return from_tls(tls::make_code(ec));
}

error_code error_code::from_stream(int ec){ return {error_domain::stream_domain, ec}; }
error_code error_code::from_stream(stream_error ec){
    return from_stream(static_cast<int>(ec));
}

bool is_would_block(const error_code& ec) noexcept{
    if(ec.domain != error_domain::errno_domain) return false;
    return ec.code == EAGAIN || ec.code == EWOULDBLOCK;
}

bool is_connection_aborted(const error_code& ec) noexcept{
    if(ec.domain != error_domain::errno_domain) return false;
    return ec.code == ECONNRESET || ec.code == ECONNABORTED;
}

bool is_invalid_data(const error_code& ec) noexcept{
    return ec.domain == error_domain::tls_domain;
}

std::string to_string(const error_code& ec){
    if(ec.domain == error_domain::errno_domain) return std::strerror(ec.code);
    else if(ec.domain == error_domain::config_domain) return config_loader::config_strerror(ec.code);
    else if(ec.domain == error_domain::tls_domain) return tls::tls_strerror(ec.code);
    else if(ec.domain == error_domain::stream_domain) return stream_strerror(ec.code);
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, const error_code& ec){
    return os << to_string(ec);
}
