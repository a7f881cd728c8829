#include "async_tls/stream/connection_state.hpp"

connection_state::connection_state(kind k) noexcept : current(k){}

bool connection_state::readable() const noexcept{
    return current != kind::read_shutdown && current != kind::fully_shutdown;
}

bool connection_state::writable() const noexcept{
    return current != kind::write_shutdown && current != kind::fully_shutdown;
}

bool connection_state::is_early_data() const noexcept{
    return current == kind::early_data;
}

connection_state::kind connection_state::get() const noexcept{ return current; }

void connection_state::shutdown_read() noexcept{
    if(current == kind::write_shutdown || current == kind::fully_shutdown){
        current = kind::fully_shutdown;
        return;
    }
    current = kind::read_shutdown;
}

void connection_state::shutdown_write() noexcept{
    if(current == kind::read_shutdown || current == kind::fully_shutdown){
        current = kind::fully_shutdown;
        return;
    }
    current = kind::write_shutdown;
}

void connection_state::finish_early_data() noexcept{
    if(current == kind::early_data) current = kind::open;
}

const char* to_string(connection_state::kind k) noexcept{
    switch(k){
        case connection_state::kind::early_data: return "early_data";
        case connection_state::kind::open: return "open";
        case connection_state::kind::read_shutdown: return "read_shutdown";
        case connection_state::kind::write_shutdown: return "write_shutdown";
        case connection_state::kind::fully_shutdown: return "fully_shutdown";
    }
    return "unknown";
}
