#include "async_tls/stream/session_pump.hpp"
#include "async_tls/core/logger.hpp"
#include "async_tls/net/raw_endpoint.hpp"
#include "async_tls/stream/stream_error.hpp"
#include "async_tls/tls/tls_session.hpp"
#include <cerrno>

session_pump::session_pump(raw_endpoint& io, tls_session& session, bool eof) noexcept :
    io(io), session(session), eof(eof){}

bool session_pump::is_eof() const noexcept{ return eof; }

std::expected <std::size_t, error_code> session_pump::read_io(){
    auto read_exp = session.read_tls(io);
    if(!read_exp) return std::unexpected(read_exp.error());

    auto process_exp = session.process_new_packets();
    if(!process_exp){
        logger::log_debug("tls record rejected", "session_pump::read_io()", process_exp.error());
        auto alert_exp = write_io();
        if(!alert_exp && !is_would_block(alert_exp.error())){
            logger::log_debug("alert not delivered", "session_pump::read_io()", alert_exp.error());
        }
        return std::unexpected(process_exp.error());
    }
    return *read_exp;
}

std::expected <std::size_t, error_code> session_pump::write_io(){
    return session.write_tls(io);
}

std::expected <session_pump::io_counts, error_code> session_pump::complete_io(){
    io_counts counts{};

    while(true){
        bool write_would_block = false;
        bool read_would_block = false;

        while(session.wants_write()){
            auto write_exp = write_io();
            if(!write_exp){
                if(!is_would_block(write_exp.error())) return std::unexpected(write_exp.error());
                write_would_block = true;
                break;
            }
            if(*write_exp == 0) return std::unexpected(error_code::from_errno(EPIPE));
            counts.written += *write_exp;
        }

        if(!eof && session.wants_read()){
            auto read_exp = read_io();
            if(!read_exp){
                if(!is_would_block(read_exp.error())) return std::unexpected(read_exp.error());
                read_would_block = true;
            }
            else if(*read_exp == 0){
                eof = true;
            }
            else{
                counts.read += *read_exp;
            }
        }

        bool would_block = write_would_block || read_would_block;
        bool handshaking = session.is_handshaking();

        if(eof && handshaking){
            return std::unexpected(error_code::from_stream(stream_error::handshake_eof));
        }
        if(!handshaking){
            if(would_block && counts.read == 0 && counts.written == 0){
                return std::unexpected(error_code::from_errno(EAGAIN));
            }
            return counts;
        }
        if(would_block) return std::unexpected(error_code::from_errno(EAGAIN));
    }
}

std::expected <std::size_t, error_code> session_pump::read(char* dst, std::size_t cap){
    std::size_t pos = 0;
    bool would_block = false;

    while(pos != cap){
        while(!eof && session.wants_read()){
            auto read_exp = read_io();
            if(!read_exp){
                if(is_would_block(read_exp.error())){
                    would_block = true;
                    break;
                }
                // Plaintext already copied out stays with the caller; a
                // transport failure resurfaces on the next call.
                if(pos != 0 && !is_invalid_data(read_exp.error())) return pos;
                return std::unexpected(read_exp.error());
            }
            if(*read_exp == 0) eof = true;
        }

        auto plain_exp = session.read_plaintext(dst + pos, cap - pos);
        if(!plain_exp){
            if(pos != 0 && is_connection_aborted(plain_exp.error())) return pos;
            return std::unexpected(plain_exp.error());
        }
        if(*plain_exp == 0) break;
        pos += *plain_exp;

        if(would_block) break;
    }

    if(pos != 0) return pos;
    if(would_block) return std::unexpected(error_code::from_errno(EAGAIN));
    return 0;
}

std::expected <std::size_t, error_code> session_pump::write(const char* src, std::size_t len){
    std::size_t pos = 0;

    while(pos != len){
        auto accepted_exp = session.write_plaintext(src + pos, len - pos);
        if(!accepted_exp) return std::unexpected(accepted_exp.error());
        pos += *accepted_exp;

        bool would_block = false;
        std::size_t pushed = 0;
        while(session.wants_write()){
            auto write_exp = write_io();
            if(!write_exp){
                if(!is_would_block(write_exp.error())) return std::unexpected(write_exp.error());
                would_block = true;
                break;
            }
            if(*write_exp == 0){
                would_block = true;
                break;
            }
            pushed += *write_exp;
        }

        if(would_block){
            if(pos == 0) return std::unexpected(error_code::from_errno(EAGAIN));
            return pos;
        }
        // Nothing taken and nothing pushed: the session cannot make progress.
        if(*accepted_exp == 0 && pushed == 0) return std::unexpected(error_code::from_errno(EPROTO));
    }
    return pos;
}

std::expected <void, error_code> session_pump::flush(){
    while(session.wants_write()){
        auto write_exp = write_io();
        if(!write_exp) return std::unexpected(write_exp.error());
        if(*write_exp == 0) return std::unexpected(error_code::from_errno(EPIPE));
    }
    return io.flush();
}
