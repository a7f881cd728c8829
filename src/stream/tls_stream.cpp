#include "async_tls/stream/tls_stream.hpp"
#include "async_tls/core/logger.hpp"
#include <cerrno>
#include <string>

tls_stream::tls_stream(
    std::unique_ptr<raw_endpoint> io,
    std::unique_ptr<tls_session> session,
    connection_state state
) noexcept :
    io(std::move(io)), session(std::move(session)), conn_state(state){}

session_pump tls_stream::make_pump(){
    return session_pump(*io, *session, !conn_state.readable());
}

std::expected <void, error_code> tls_stream::finish_early_data(){
    session_pump pump = make_pump();

    if(session->is_handshaking()){
        auto complete_exp = pump.complete_io();
        if(!complete_exp) return std::unexpected(complete_exp.error());
    }

    if(!session->is_early_data_accepted()){
        if(early_data.has_pending()){
            logger::log_debug(
                "tls_stream", "finish_early_data",
                "early data rejected, replaying " + std::to_string(early_data.remaining()) + " bytes"
            );
        }
        while(early_data.has_pending()){
            auto write_exp = pump.write(early_data.current_data(), early_data.remaining());
            if(!write_exp) return std::unexpected(write_exp.error());
            early_data.advance(*write_exp);
        }
    }

    conn_state.finish_early_data();
    early_data.clear();
    return {};
}

void tls_stream::push_close_notify(session_pump& pump){
    while(session->wants_write()){
        auto write_exp = pump.write_io();
        if(!write_exp){
            if(!is_would_block(write_exp.error())){
                logger::log_warn("close_notify not delivered", "tls_stream::read()", write_exp);
            }
            return;
        }
        if(*write_exp == 0) return;
    }
}

std::expected <std::size_t, error_code> tls_stream::read(char* dst, std::size_t cap){
    if(cap == 0) return 0;

    switch(conn_state.get()){
        case connection_state::kind::early_data:{
            auto finish_exp = finish_early_data();
            if(!finish_exp) return std::unexpected(finish_exp.error());
            return read(dst, cap);
        }
        case connection_state::kind::open:
        case connection_state::kind::write_shutdown:{
            session_pump pump = make_pump();
            auto read_exp = pump.read(dst, cap);
            if(read_exp){
                if(*read_exp == 0) conn_state.shutdown_read();
                return *read_exp;
            }
            if(!is_connection_aborted(read_exp.error())) return std::unexpected(read_exp.error());

            conn_state.shutdown_read();
            if(conn_state.writable()){
                auto notify_exp = session->send_close_notify();
                if(!notify_exp) logger::log_warn("close_notify failed", "tls_stream::read()", notify_exp);
                conn_state.shutdown_write();
                push_close_notify(pump);
            }
            return 0;
        }
        case connection_state::kind::read_shutdown:
        case connection_state::kind::fully_shutdown:
            return 0;
    }
    return 0;
}

std::expected <std::size_t, error_code> tls_stream::write(const char* src, std::size_t len){
    if(len == 0) return 0;

    switch(conn_state.get()){
        case connection_state::kind::early_data:{
            if(session->accepts_early_data()){
                auto early_exp = session->write_early_data(src, len);
                if(!early_exp) return std::unexpected(early_exp.error());
                if(*early_exp > 0){
                    early_data.append(src, *early_exp);
                    return *early_exp;
                }
            }

            auto finish_exp = finish_early_data();
            if(!finish_exp) return std::unexpected(finish_exp.error());
            return make_pump().write(src, len);
        }
        case connection_state::kind::write_shutdown:
        case connection_state::kind::fully_shutdown:
            return std::unexpected(error_code::from_errno(EPIPE));
        case connection_state::kind::open:
        case connection_state::kind::read_shutdown:
            break;
    }
    return make_pump().write(src, len);
}

std::expected <void, error_code> tls_stream::flush(){
    return make_pump().flush();
}

std::expected <void, error_code> tls_stream::close(){
    if(conn_state.is_early_data()){
        auto finish_exp = finish_early_data();
        if(!finish_exp) return std::unexpected(finish_exp.error());
    }

    if(conn_state.writable()){
        auto notify_exp = session->send_close_notify();
        if(!notify_exp) return std::unexpected(notify_exp.error());
        conn_state.shutdown_write();
    }

    auto flush_exp = flush();
    if(!flush_exp) return std::unexpected(flush_exp.error());
    return io->close();
}

const connection_state& tls_stream::state() const noexcept{ return conn_state; }
bool tls_stream::wants_write() const{ return session->wants_write(); }
std::size_t tls_stream::early_data_buffered() const noexcept{ return early_data.remaining(); }

std::pair<const raw_endpoint&, const tls_session&> tls_stream::get_ref() const noexcept{
    return {*io, *session};
}

std::pair<raw_endpoint&, tls_session&> tls_stream::get_mut() noexcept{
    return {*io, *session};
}

std::pair<std::unique_ptr<raw_endpoint>, std::unique_ptr<tls_session>> tls_stream::into_inner() &&{
    return {std::move(io), std::move(session)};
}
