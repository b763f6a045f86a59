#include "autostart.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kDesktopFileName = "file-sorter.desktop";

bool is_quiet_flag(const std::string& argument) {
  if(argument == "--verbose" || argument == "--autostart") return true;
  if(argument.size() < 2 || argument[0] != '-') return false;
  return std::all_of(argument.begin() + 1, argument.end(), [](char ch){ return ch == 'v'; });
}

bool is_bool_literal(const std::string& value) {
  auto lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool needs_quoting(const std::string& argument) {
  if(argument.empty()) return true;
  return argument.find_first_of(" \t\n\"'\\><~|&;$*?#()`") != std::string::npos;
}

fs::path current_executable(const std::string& fallback) {
  std::error_code ec;
  auto self = fs::read_symlink("/proc/self/exe", ec);
  if(!ec && !self.empty()) return self;
  return resolved_path_from_string(fallback);
}

} // namespace

std::vector<std::string> clean_autostart_arguments(const std::vector<std::string>& arguments) {
  std::vector<std::string> cleaned;
  for(std::size_t i = 0; i < arguments.size(); ++i) {
    if(i > 0 && is_quiet_flag(arguments[i])) {
      if(i + 1 < arguments.size() && is_bool_literal(arguments[i + 1])) ++i;
      continue;
    }
    cleaned.push_back(arguments[i]);
  }
  return cleaned;
}

std::string desktop_exec_line(const std::vector<std::string>& arguments) {
  std::string line;
  for(const auto& argument : arguments) {
    if(!line.empty()) line += ' ';
    if(!needs_quoting(argument)) {
      line += argument;
      continue;
    }
    line += '"';
    for(char ch : argument) {
      if(ch == '"' || ch == '`' || ch == '$' || ch == '\\') line += '\\';
      line += ch;
    }
    line += '"';
  }
  return line;
}

fs::path default_autostart_directory() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "autostart";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / ".config" / "autostart";
  }
  return {};
}

fs::path register_autostart(const std::vector<std::string>& arguments,
                            const fs::path& autostart_directory,
                            Logger* logger) {
  if(arguments.empty()) {
    log_error(logger, "Nothing to add to autostart");
    return {};
  }
  if(autostart_directory.empty()) {
    log_error(logger, "No autostart directory available (HOME is not set)");
    return {};
  }

  auto cleaned = clean_autostart_arguments(arguments);
  cleaned.front() = current_executable(cleaned.front()).string();
  log_debug(logger, "Removed verbosity and autostart flags: {} -> {} argument(s)", arguments.size(), cleaned.size());
  const std::string command = desktop_exec_line(cleaned);

  std::error_code ec;
  fs::create_directories(autostart_directory, ec);
  if(ec) {
    log_error(logger, "Unable to create '{}': {}", autostart_directory.string(), ec.message());
    return {};
  }

  const fs::path desktop_file = autostart_directory / kDesktopFileName;
  std::ofstream out(desktop_file, std::ios::trunc);
  if(!out) {
    log_error(logger, "Permission denied or I/O error opening '{}'", desktop_file.string());
    return {};
  }
  out << "[Desktop Entry]\n"
      << "Type=Application\n"
      << "Name=file-sorter\n"
      << "Comment=Sort new files into directories by extension\n"
      << "Exec=" << command << "\n"
      << "Terminal=false\n"
      << "X-GNOME-Autostart-enabled=true\n";
  out.flush();
  if(!out) {
    log_error(logger, "I/O error while writing '{}'", desktop_file.string());
    return {};
  }
  log_info(logger, "Added '{}' with '{}' to autostart", desktop_file.string(), command);
  return desktop_file;
}
