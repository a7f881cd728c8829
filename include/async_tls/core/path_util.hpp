#pragma once
#include <filesystem>

namespace path_util{
    bool is_regular_file(const std::filesystem::path& path);
    std::filesystem::path normalize(const std::filesystem::path& path);

    // Directory that relative entries of the given config file are read from.
    std::filesystem::path config_root(const std::filesystem::path& config_file);

    std::filesystem::path resolve_from_root(
        const std::filesystem::path& root, const std::filesystem::path& raw_path
    );
}
