#include "async_tls/core/config_loader.hpp"
#include "async_tls/core/logger.hpp"
#include <charconv>
#include <fstream>

namespace{
constexpr std::string_view SPACES = " \t\r\n\f\v";

std::unexpected<error_code> line_error(config_loader::config_error kind, std::size_t line_no){
    error_code ec = error_code::from_config(kind);
    logger::log_warn(
        "line " + std::to_string(line_no) + " rejected", "config_loader::load_key_value_file()", ec
    );
    return std::unexpected(ec);
}
}

std::string config_loader::config_strerror(int code){
    switch(static_cast<config_error>(code)){
        case config_error::file_not_found: return "config file not found";
        case config_error::malformed_line: return "config malformed line (expected key=value)";
        case config_error::empty_key: return "config key is empty";
        case config_error::duplicate_key: return "config duplicate key";
        case config_error::read_failed: return "config read failed";
        case config_error::missing_required_key: return "config missing required key";
        case config_error::invalid_value: return "config value has the wrong type";
    }
    return "unknown config error";
}

std::string config_loader::trim(std::string_view sv){
    std::size_t begin = sv.find_first_not_of(SPACES);
    if(begin == std::string_view::npos) return {};
    std::size_t end = sv.find_last_not_of(SPACES);
    return std::string(sv.substr(begin, end - begin + 1));
}

std::string config_loader::trim_wrapping_quotes(std::string_view sv){
    if(sv.size() < 2) return std::string(sv);
    char quote = sv.front();
    if((quote != '"' && quote != '\'') || sv.back() != quote) return std::string(sv);
    return std::string(sv.substr(1, sv.size() - 2));
}

bool config_loader::is_comment_or_blank(std::string_view line){
    std::size_t first = line.find_first_not_of(SPACES);
    return first == std::string_view::npos || line[first] == '#';
}

std::expected <config_loader::config_map, error_code> config_loader::load_key_value_file(std::string_view path){
    std::ifstream in{std::string(path)};
    if(!in.is_open()){
        return std::unexpected(error_code::from_config(config_error::file_not_found));
    }

    config_map cfg;
    std::string line;
    std::size_t line_no = 0;
    while(std::getline(in, line)){
        ++line_no;
        if(is_comment_or_blank(line)) continue;

        std::string_view view(line);
        std::size_t eq = view.find('=');
        if(eq == std::string_view::npos) return line_error(config_error::malformed_line, line_no);

        std::string key = trim(view.substr(0, eq));
        if(key.empty()) return line_error(config_error::empty_key, line_no);

        std::string value = trim_wrapping_quotes(trim(view.substr(eq + 1)));
        if(!cfg.emplace(std::move(key), std::move(value)).second){
            return line_error(config_error::duplicate_key, line_no);
        }
    }

    if(in.bad()){
        return std::unexpected(error_code::from_config(config_error::read_failed));
    }
    return cfg;
}

std::expected <std::string, error_code> config_loader::require(const config_map& cfg, std::string_view key){
    auto it = cfg.find(std::string(key));
    if(it == cfg.end()){
        logger::log_debug("config_loader", "require", "missing key " + std::string(key));
        return std::unexpected(error_code::from_config(config_error::missing_required_key));
    }
    return it->second;
}

std::expected <void, error_code> config_loader::require_all(
    const config_map& cfg, std::initializer_list<std::string_view> keys
){
    for(std::string_view key : keys){
        auto req = require(cfg, key);
        if(!req) return std::unexpected(req.error());
    }
    return {};
}

std::string config_loader::get_or(
    const config_map& cfg, std::string_view key, std::string_view fallback
){
    auto it = cfg.find(std::string(key));
    if(it == cfg.end()) return std::string(fallback);
    return it->second;
}

std::expected <bool, error_code> config_loader::get_bool_or(
    const config_map& cfg, std::string_view key, bool fallback
){
    auto it = cfg.find(std::string(key));
    if(it == cfg.end()) return fallback;

    const std::string& v = it->second;
    if(v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if(v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::unexpected(error_code::from_config(config_error::invalid_value));
}

std::expected <std::size_t, error_code> config_loader::get_size_or(
    const config_map& cfg, std::string_view key, std::size_t fallback
){
    auto it = cfg.find(std::string(key));
    if(it == cfg.end()) return fallback;

    const std::string& v = it->second;
    const char* last = v.data() + v.size();
    std::size_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), last, out);
    if(v.empty() || ec != std::errc{} || ptr != last){
        return std::unexpected(error_code::from_config(config_error::invalid_value));
    }
    return out;
}
