#include "async_tls/tls/tls_config.hpp"
#include "async_tls/core/path_util.hpp"

namespace{
std::string resolve_path(const std::filesystem::path& root, const std::string& raw){
    return path_util::resolve_from_root(root, raw).string();
}

error_code invalid_value(){
    return error_code::from_config(config_loader::config_error::invalid_value);
}
}

std::expected <tls_config, error_code> tls_config::from_map(
    const config_loader::config_map& cfg, const std::filesystem::path& root
){
    tls_config out;

    std::string role = config_loader::get_or(cfg, "tls.role", "client");
    if(role == "server") out.role = tls_role::server;
    else if(role == "client") out.role = tls_role::client;
    else return std::unexpected(invalid_value());

    std::string version = config_loader::get_or(cfg, "tls.min_version", "1.2");
    if(version == "1.2") out.options.min_version = tls_version::tls1_2;
    else if(version == "1.3") out.options.min_version = tls_version::tls1_3;
    else return std::unexpected(invalid_value());

    auto early_exp = config_loader::get_bool_or(cfg, "tls.early_data", false);
    if(!early_exp) return std::unexpected(early_exp.error());
    out.options.early_data = *early_exp;

    auto max_early_exp = config_loader::get_size_or(cfg, "tls.max_early_data", 0);
    if(!max_early_exp) return std::unexpected(max_early_exp.error());
    out.options.max_early_data = *max_early_exp;

    if(out.role == tls_role::server){
        auto identity_exp = config_loader::require_all(cfg, {"tls.cert", "tls.key"});
        if(!identity_exp) return std::unexpected(identity_exp.error());

        out.cert_chain_path = resolve_path(root, cfg.at("tls.cert"));
        out.private_key_path = resolve_path(root, cfg.at("tls.key"));
        if(out.options.early_data && out.options.max_early_data == 0){
            out.options.max_early_data = 16384;
        }
        return out;
    }

    auto name_exp = config_loader::require(cfg, "tls.server_name");
    if(!name_exp) return std::unexpected(name_exp.error());
    if(name_exp->empty()) return std::unexpected(invalid_value());
    out.server_name = *name_exp;
    out.ca_file_path = resolve_path(root, config_loader::get_or(cfg, "tls.ca", ""));
    return out;
}

std::expected <tls_config, error_code> tls_config::load(std::string_view path){
    auto cfg_exp = config_loader::load_key_value_file(path);
    if(!cfg_exp) return std::unexpected(cfg_exp.error());
    return from_map(*cfg_exp, path_util::config_root(std::filesystem::path(path)));
}
