#include "async_tls/stream/stream_error.hpp"

std::string stream_strerror(int code){
    switch(static_cast<stream_error>(code)){
        case stream_error::handshake_eof:
            return "stream.handshake_eof (peer closed before the handshake completed)";
        case stream_error::handshake_already_consumed:
            return "stream.handshake_already_consumed (handshake polled after completion)";
    }
    return "stream.unknown";
}
