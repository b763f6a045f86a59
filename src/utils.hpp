#pragma once
#include <filesystem>
#include <string>

std::string trim_copy(std::string value);
std::string to_lower(std::string value);
std::filesystem::path expand_user(const std::string& path_as_string);
std::filesystem::path resolved_path_from_string(const std::string& path_as_string);
std::filesystem::path default_config_root();
std::filesystem::path default_configs_location();
std::filesystem::path default_log_location();
std::filesystem::path default_settings_location();
// lexically normal, without a trailing separator
std::filesystem::path normalized_directory(const std::filesystem::path& directory);
