#include "async_tls/net/memory_pipe.hpp"
#include <algorithm>
#include <cerrno>

memory_endpoint::memory_endpoint(
    std::shared_ptr<channel> in, std::shared_ptr<channel> out, pipe_options opt
) noexcept : in(std::move(in)), out(std::move(out)), opt(opt){}

std::expected <std::size_t, error_code> memory_endpoint::read_some(char* dst, std::size_t cap){
    ++read_calls;
    if(read_error) return std::unexpected(*read_error);
    if(cap == 0) return 0;

    if(in->data.has_pending()){
        std::size_t want = cap;
        if(opt.max_read_chunk != 0) want = std::min(want, opt.max_read_chunk);
        return in->data.consume_into(dst, want);
    }

    if(in->closed) return 0;
    return std::unexpected(error_code::from_errno(EAGAIN));
}

std::expected <std::size_t, error_code> memory_endpoint::write_some(const char* src, std::size_t len){
    ++write_calls;
    if(write_error) return std::unexpected(*write_error);
    if(out->closed) return std::unexpected(error_code::from_errno(EPIPE));
    if(len == 0) return 0;

    std::size_t room = opt.capacity > out->data.remaining() ? opt.capacity - out->data.remaining() : 0;
    std::size_t n = std::min(len, room);
    if(opt.max_write_chunk != 0) n = std::min(n, opt.max_write_chunk);
    if(n == 0) return std::unexpected(error_code::from_errno(EAGAIN));

    out->data.append(src, n);
    return n;
}

std::expected <void, error_code> memory_endpoint::flush(){
    if(write_error) return std::unexpected(*write_error);
    return {};
}

std::expected <void, error_code> memory_endpoint::close(){
    ++close_calls;
    out->closed = true;
    return {};
}

void memory_endpoint::inject_read_error(error_code ec){ read_error = ec; }
void memory_endpoint::inject_write_error(error_code ec){ write_error = ec; }

void memory_endpoint::clear_errors(){
    read_error.reset();
    write_error.reset();
}

void memory_endpoint::set_max_write_chunk(std::size_t n) noexcept{ opt.max_write_chunk = n; }

std::size_t memory_endpoint::read_call_count() const noexcept{ return read_calls; }
std::size_t memory_endpoint::write_call_count() const noexcept{ return write_calls; }
std::size_t memory_endpoint::close_call_count() const noexcept{ return close_calls; }
std::size_t memory_endpoint::readable_bytes() const noexcept{ return in->data.remaining(); }
bool memory_endpoint::is_write_closed() const noexcept{ return out->closed; }

std::pair<std::unique_ptr<memory_endpoint>, std::unique_ptr<memory_endpoint>>
make_memory_pipe(pipe_options opt){
    auto a_to_b = std::make_shared<memory_endpoint::channel>();
    auto b_to_a = std::make_shared<memory_endpoint::channel>();

    std::unique_ptr<memory_endpoint> a(new memory_endpoint(b_to_a, a_to_b, opt));
    std::unique_ptr<memory_endpoint> b(new memory_endpoint(a_to_b, b_to_a, opt));
    return {std::move(a), std::move(b)};
}
