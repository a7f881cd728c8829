#pragma once
#include <cstddef>
#include <string>
#include <string_view>

constexpr std::size_t BUF_SIZE = 16384;

// Byte queue with a consume cursor. Bytes before the cursor have been handed
// on and are reclaimed lazily.
class offset_buffer{
    std::string buf;
    std::size_t offset = 0;
public:
    bool clear_if_done();
    bool compact_if_needed();
    void clear();

    void append(std::string_view sv);
    void append(const char* p, std::size_t n);
    std::size_t consume_into(char* dst, std::size_t cap);

    bool has_pending() const;
    bool empty() const;
    const char* current_data() const;
    std::size_t remaining() const;
    void advance(std::size_t n);
    std::size_t get_offset() const;

    const std::string& raw() const;
};
