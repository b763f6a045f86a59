#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::filesystem::path expand_user(const std::string& path_as_string){
    if(path_as_string.empty() || path_as_string[0] != '~') return path_as_string;
    if(path_as_string.size() > 1 && path_as_string[1] != '/') return path_as_string; // ~user is left alone
    const char* home = std::getenv("HOME");
    if(!home || !*home) return path_as_string;
    return std::filesystem::path(home) / path_as_string.substr(std::min<std::size_t>(2, path_as_string.size()));
}

std::filesystem::path resolved_path_from_string(const std::string& path_as_string){
    auto trimmed = trim_copy(path_as_string);
    if(trimmed.empty()) return {};
    std::error_code ec;
    auto absolute = std::filesystem::absolute(expand_user(trimmed), ec);
    if(ec) return expand_user(trimmed);
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    return ec ? absolute.lexically_normal() : resolved;
}

std::filesystem::path default_config_root(){
    if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "file-sorter";
    }
    if(const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "file-sorter";
    }
    return std::filesystem::current_path() / ".config";
}

std::filesystem::path default_configs_location(){
    return default_config_root() / "configs.json";
}

std::filesystem::path default_log_location(){
    return default_config_root() / "file-sorter.log";
}

std::filesystem::path default_settings_location(){
    return default_config_root() / "settings.json";
}

std::filesystem::path normalized_directory(const std::filesystem::path& directory){
    auto normal = directory.lexically_normal();
    if(!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}
