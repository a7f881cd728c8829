#pragma once
#include "async_tls/core/config_loader.hpp"
#include "async_tls/core/error_code.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

enum class tls_role{ client, server };
enum class tls_version{ tls1_2, tls1_3 };

struct tls_options{
    tls_version min_version = tls_version::tls1_2;
    bool early_data = false;
    // Server only: early data bytes advertised in issued tickets.
    std::size_t max_early_data = 0;
};

struct tls_config{
    tls_role role = tls_role::client;
    std::string cert_chain_path;
    std::string private_key_path;
    std::string ca_file_path;
    std::string server_name;
    tls_options options{};

    static std::expected <tls_config, error_code> from_map(
        const config_loader::config_map& cfg, const std::filesystem::path& root
    );
    static std::expected <tls_config, error_code> load(std::string_view path);
};
