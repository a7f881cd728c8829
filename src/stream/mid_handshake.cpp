#include "async_tls/stream/mid_handshake.hpp"
#include "async_tls/core/logger.hpp"
#include "async_tls/stream/stream_error.hpp"
#include <utility>

mid_handshake::mid_handshake(handshaking st) noexcept : st(std::move(st)){}
mid_handshake::mid_handshake(early_data_pending st) noexcept : st(std::move(st)){}

std::expected <tls_stream, error_code> mid_handshake::poll(){
    if(std::holds_alternative<spent>(st)){
        error_code ec = error_code::from_stream(stream_error::handshake_already_consumed);
        logger::log_error("handshake polled after its stream was taken", "mid_handshake::poll()", ec);
        return std::unexpected(ec);
    }

    if(auto* hs = std::get_if<handshaking>(&st)){
        session_pump pump = hs->stream.make_pump();
        tls_session& session = hs->stream.get_mut().second;

        if(session.is_handshaking()){
            auto complete_exp = pump.complete_io();
            if(!complete_exp) return std::unexpected(complete_exp.error());
        }

        if(session.wants_write()){
            auto complete_exp = pump.complete_io();
            if(!complete_exp) return std::unexpected(complete_exp.error());
        }
        logger::log_debug("mid_handshake", "poll", "handshake complete");
    }

    state_type prev = std::exchange(st, spent{});
    if(auto* hs = std::get_if<handshaking>(&prev)) return std::move(hs->stream);
    return std::move(std::get<early_data_pending>(prev).stream);
}

bool mid_handshake::is_spent() const noexcept{
    return std::holds_alternative<spent>(st);
}

bool mid_handshake::is_early_data() const noexcept{
    return std::holds_alternative<early_data_pending>(st);
}

mid_handshake start_client_handshake(
    std::unique_ptr<raw_endpoint> io, std::unique_ptr<tls_session> session, bool early_data
){
    if(early_data && session->accepts_early_data()){
        connection_state state(connection_state::kind::early_data);
        return mid_handshake(mid_handshake::early_data_pending{
            tls_stream(std::move(io), std::move(session), state)
        });
    }
    return mid_handshake(mid_handshake::handshaking{tls_stream(std::move(io), std::move(session))});
}

mid_handshake start_server_handshake(std::unique_ptr<raw_endpoint> io, std::unique_ptr<tls_session> session){
    return mid_handshake(mid_handshake::handshaking{tls_stream(std::move(io), std::move(session))});
}
