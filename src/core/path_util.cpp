#include "async_tls/core/path_util.hpp"
#include <system_error>

bool path_util::is_regular_file(const std::filesystem::path& path){
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::filesystem::path path_util::normalize(const std::filesystem::path& path){
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if(!ec) return normalized;
    return path.lexically_normal();
}

std::filesystem::path path_util::config_root(const std::filesystem::path& config_file){
    std::filesystem::path normalized = normalize(config_file);
    if(normalized.has_parent_path()) return normalized.parent_path();

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if(ec) return ".";
    return cwd;
}

std::filesystem::path path_util::resolve_from_root(
    const std::filesystem::path& root, const std::filesystem::path& raw_path
){
    if(raw_path.empty()) return {};
    if(raw_path.is_absolute()) return raw_path;
    return normalize(root / raw_path);
}
