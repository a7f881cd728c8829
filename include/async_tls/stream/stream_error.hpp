#pragma once
#include <string>

enum class stream_error : int{
    handshake_eof = 1,
    handshake_already_consumed
};

std::string stream_strerror(int code);
