#pragma once
#include "async_tls/core/logger.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Routes logger output into a vector for the lifetime of the object.
class log_capture{
public:
    struct line{
        logger::log_level level;
        std::string text;
    };

    explicit log_capture(logger::log_level level = logger::log_level::debug) :
        lines(std::make_shared<std::vector<line>>()), saved_level(logger::get_log_level()){
        logger::set_log_level(level);
        auto sink_lines = lines;
        logger::set_sink([sink_lines](logger::log_level lvl, std::string_view text){
            sink_lines->push_back(line{lvl, std::string(text)});
        });
    }

    ~log_capture(){
        logger::reset_sink();
        logger::set_log_level(saved_level);
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    std::size_t count(logger::log_level level) const{
        std::size_t n = 0;
        for(const auto& l : *lines){
            if(l.level == level) ++n;
        }
        return n;
    }

    bool contains(std::string_view needle) const{
        for(const auto& l : *lines){
            if(l.text.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    const std::vector<line>& all() const{ return *lines; }
private:
    std::shared_ptr<std::vector<line>> lines;
    logger::log_level saved_level;
};
