#pragma once
#include "async_tls/net/offset_buffer.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include <memory>
#include <optional>
#include <utility>

struct pipe_options{
    std::size_t capacity = 64 * 1024;   // bytes buffered per direction
    std::size_t max_write_chunk = 0;    // 0 = no per-call limit
    std::size_t max_read_chunk = 0;
};

// One side of an in-memory duplex pipe. Single threaded: both sides are
// expected to be driven from the same thread.
class memory_endpoint : public raw_endpoint{
    struct channel{
        offset_buffer data;
        bool closed = false;
    };

    std::shared_ptr<channel> in;
    std::shared_ptr<channel> out;
    pipe_options opt;

    std::optional<error_code> read_error;
    std::optional<error_code> write_error;
    std::size_t read_calls = 0;
    std::size_t write_calls = 0;
    std::size_t close_calls = 0;

    memory_endpoint(std::shared_ptr<channel> in, std::shared_ptr<channel> out, pipe_options opt) noexcept;
    friend std::pair<std::unique_ptr<memory_endpoint>, std::unique_ptr<memory_endpoint>>
        make_memory_pipe(pipe_options opt);
public:
    std::expected <std::size_t, error_code> read_some(char* dst, std::size_t cap) override;
    std::expected <std::size_t, error_code> write_some(const char* src, std::size_t len) override;
    std::expected <void, error_code> flush() override;
    std::expected <void, error_code> close() override;

    // Every later read_some / write_some fails with ec until cleared.
    void inject_read_error(error_code ec);
    void inject_write_error(error_code ec);
    void clear_errors();
    void set_max_write_chunk(std::size_t n) noexcept;

    std::size_t read_call_count() const noexcept;
    std::size_t write_call_count() const noexcept;
    std::size_t close_call_count() const noexcept;
    std::size_t readable_bytes() const noexcept;
    bool is_write_closed() const noexcept;
};

std::pair<std::unique_ptr<memory_endpoint>, std::unique_ptr<memory_endpoint>>
    make_memory_pipe(pipe_options opt = {});
