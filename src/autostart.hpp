#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "log.hpp"

// Login-time registration of a track command through an XDG autostart
// entry (~/.config/autostart/file-sorter.desktop).

// Drops -v/-vv.., --verbose and --autostart (plus an explicit boolean
// value following them) so the registered command runs quietly.
std::vector<std::string> clean_autostart_arguments(const std::vector<std::string>& arguments);

// Desktop-entry Exec quoting: arguments with reserved characters are
// double-quoted with ", `, $ and \ escaped.
std::string desktop_exec_line(const std::vector<std::string>& arguments);

std::filesystem::path default_autostart_directory();

// Returns the written .desktop file, or an empty path on failure.
std::filesystem::path register_autostart(const std::vector<std::string>& arguments,
                                         const std::filesystem::path& autostart_directory,
                                         Logger* logger = nullptr);
