#include "async_tls/net/offset_buffer.hpp"
#include <algorithm>
#include <cstring>

bool offset_buffer::clear_if_done(){
    if(buf.size() != offset) return false;
    buf.clear();
    offset = 0;
    return true;
}

bool offset_buffer::compact_if_needed(){
    if(offset < 8192) return false;
    if(offset * 2 < buf.size()) return false;
    buf.erase(0, offset);
    offset = 0;
    return true;
}

void offset_buffer::clear(){
    buf.clear();
    offset = 0;
}

void offset_buffer::append(std::string_view sv){
    buf += sv;
}

void offset_buffer::append(const char* p, std::size_t n){
    buf.append(p, n);
}

std::size_t offset_buffer::consume_into(char* dst, std::size_t cap){
    std::size_t n = std::min(cap, remaining());
    if(n == 0) return 0;
    std::memcpy(dst, current_data(), n);
    advance(n);
    return n;
}

bool offset_buffer::has_pending() const{
    return offset < buf.size();
}

bool offset_buffer::empty() const{
    return !has_pending();
}

const char* offset_buffer::current_data() const{
    return buf.data() + offset;
}

std::size_t offset_buffer::remaining() const{
    return buf.size() - offset;
}

void offset_buffer::advance(std::size_t n){
    offset += std::min(n, remaining());
    if(!clear_if_done()) compact_if_needed();
}

std::size_t offset_buffer::get_offset() const{
    return offset;
}

const std::string& offset_buffer::raw() const{
    return buf;
}
