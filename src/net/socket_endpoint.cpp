#include "async_tls/net/socket_endpoint.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/socket.h>

std::expected <void, error_code> set_nonblocking(int fd){
    int flags = ::fcntl(fd, F_GETFL, 0);
    if(flags == -1) return std::unexpected(error_code::from_errno(errno));
    if(flags & O_NONBLOCK) return {};
    if(::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1){
        return std::unexpected(error_code::from_errno(errno));
    }
    return {};
}

socket_endpoint::socket_endpoint(unique_fd ufd) noexcept : ufd(std::move(ufd)){}

std::expected <socket_endpoint, error_code> socket_endpoint::adopt(unique_fd ufd){
    if(!ufd) return std::unexpected(error_code::from_errno(EBADF));

    auto nb_exp = set_nonblocking(ufd.get());
    if(!nb_exp) return std::unexpected(nb_exp.error());
    return socket_endpoint(std::move(ufd));
}

std::expected <std::size_t, error_code> socket_endpoint::read_some(char* dst, std::size_t cap){
    if(!ufd) return std::unexpected(error_code::from_errno(EBADF));
    while(true){
        ssize_t now = ::recv(ufd.get(), dst, cap, 0);
        if(now >= 0) return static_cast<std::size_t>(now);

        int ec = errno;
        if(ec == EINTR) continue;
        return std::unexpected(error_code::from_errno(ec));
    }
}

std::expected <std::size_t, error_code> socket_endpoint::write_some(const char* src, std::size_t len){
    if(!ufd) return std::unexpected(error_code::from_errno(EBADF));
    if(write_closed) return std::unexpected(error_code::from_errno(EPIPE));
    while(true){
        ssize_t now = ::send(ufd.get(), src, len, MSG_NOSIGNAL);
        if(now >= 0) return static_cast<std::size_t>(now);

        int ec = errno;
        if(ec == EINTR) continue;
        return std::unexpected(error_code::from_errno(ec));
    }
}

std::expected <void, error_code> socket_endpoint::flush(){
    return {};
}

std::expected <void, error_code> socket_endpoint::close(){
    if(!ufd || write_closed) return {};
    if(::shutdown(ufd.get(), SHUT_WR) == -1){
        int ec = errno;
        if(ec != ENOTCONN) return std::unexpected(error_code::from_errno(ec));
    }
    write_closed = true;
    return {};
}

int socket_endpoint::native_handle() const noexcept{ return ufd.get(); }
