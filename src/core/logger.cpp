#include "async_tls/core/logger.hpp"
#include "async_tls/core/error_code.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace logger{
    static std::atomic<int> g_log_level{static_cast<int>(log_level::info)};
    static std::mutex g_sink_mtx;
    static sink g_sink;

    static bool should_log(log_level level){
        return static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
    }

    static void emit(log_level level, const std::string& line){
        std::lock_guard<std::mutex> lock(g_sink_mtx);
        if(g_sink){
            g_sink(level, line);
            return;
        }
        std::clog << "[" << level_name(level) << "] " << line << "\n";
    }

    static void log_line(log_level level, std::string_view msg){
        emit(level, std::string(msg));
    }

    static void log_line(log_level level, const error_code& ec){
        emit(level, ::to_string(ec));
    }

    static void log_line(log_level level, std::string_view location, std::string_view function, std::string_view msg){
        std::string line;
        line.reserve(location.size() + function.size() + msg.size() + 6);
        line += "[";
        line += location;
        line += "::";
        line += function;
        line += "] ";
        line += msg;
        emit(level, line);
    }

    static void log_line(log_level level, std::string_view msg, std::string_view function, const error_code& ec){
        std::string line = "[";
        line += function;
        line += "] ";
        line += msg;
        line += " ";
        line += ::to_string(ec);
        emit(level, line);
    }

    void set_log_level(log_level level){
        g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    log_level get_log_level(){
        return static_cast<log_level>(g_log_level.load(std::memory_order_relaxed));
    }

    void set_sink(sink s){
        std::lock_guard<std::mutex> lock(g_sink_mtx);
        g_sink = std::move(s);
    }

    void reset_sink(){
        std::lock_guard<std::mutex> lock(g_sink_mtx);
        g_sink = nullptr;
    }

    std::string_view level_name(log_level level){
        switch(level){
            case log_level::debug: return "DEBUG";
            case log_level::info: return "INFO";
            case log_level::warn: return "WARN";
            case log_level::error: return "ERROR";
        }
        return "UNKNOWN";
    }

    void log_debug(std::string_view msg){
        if(should_log(log_level::debug)) log_line(log_level::debug, msg);
    }
    void log_debug(std::string_view location, std::string_view function, std::string_view msg){
        if(should_log(log_level::debug)) log_line(log_level::debug, location, function, msg);
    }
    void log_debug(std::string_view msg, std::string_view function, const error_code& ec){
        if(should_log(log_level::debug)) log_line(log_level::debug, msg, function, ec);
    }

    void log_info(std::string_view msg){
        if(should_log(log_level::info)) log_line(log_level::info, msg);
    }
    void log_info(std::string_view location, std::string_view function, std::string_view msg){
        if(should_log(log_level::info)) log_line(log_level::info, location, function, msg);
    }

    void log_warn(const error_code& ec){
        if(should_log(log_level::warn)) log_line(log_level::warn, ec);
    }

    void log_warn(std::string_view msg, std::string_view function, const error_code& ec){
        if(should_log(log_level::warn)) log_line(log_level::warn, msg, function, ec);
    }

    void log_error(const error_code& ec){
        if(should_log(log_level::error)) log_line(log_level::error, ec);
    }

    void log_error(std::string_view msg, std::string_view function, const error_code& ec){
        if(should_log(log_level::error)) log_line(log_level::error, msg, function, ec);
    }
}
