#include "extension_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool read_json_file(const fs::path& path, json& doc, Logger& logger) {
  std::error_code ec;
  if(!fs::exists(path, ec)) {
    logger.error("Unable to find '{}'", path.string());
    return false;
  }
  std::ifstream in(path);
  if(!in) {
    logger.error("Unable to open '{}' for reading", path.string());
    return false;
  }
  try {
    in >> doc;
  } catch(const json::parse_error& e) {
    logger.error("'{}' is not correctly formatted JSON: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    logger.error("'{}' must contain a JSON object of extension/path pairs", path.string());
    return false;
  }
  return true;
}

} // namespace

ExtensionStore::ExtensionStore(fs::path location, std::shared_ptr<Logger> logger)
  : location_(std::move(location)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("configs")) {}

std::string ExtensionStore::normalize(const std::string& extension) {
  std::string out;
  out.reserve(extension.size());
  for(unsigned char ch : extension) {
    if(std::isspace(ch)) continue;
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

bool ExtensionStore::is_valid_extension(const std::string& extension) {
  if(extension.size() < 2 || extension.front() != '.') return false;
  return std::all_of(extension.begin() + 1, extension.end(), [](char ch){
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
  });
}

bool ExtensionStore::load() {
  logger_->debug("Reading from '{}'", location_.string());
  entries_.clear();

  std::error_code ec;
  if(!fs::exists(location_, ec)) {
    logger_->error("Unable to find '{}', falling back to an empty configuration", location_.string());
    if(write_entries(entries_)) {
      logger_->config("Created empty configs at '{}'", location_.string());
    }
    return false;
  }

  json doc;
  if(!read_json_file(location_, doc, *logger_)) return false;

  for(const auto& item : doc.items()) {
    if(!item.value().is_string()) {
      logger_->warn("Ignoring '{}' in '{}': path must be a string", item.key(), location_.string());
      continue;
    }
    entries_[item.key()] = item.value().get<std::string>();
  }
  logger_->debug("Read {} extension path(s) from '{}'", entries_.size(), location_.string());
  return true;
}

bool ExtensionStore::save() const {
  if(!write_entries(entries_)) return false;
  logger_->config("Wrote {} extension path(s) to '{}'", entries_.size(), location_.string());
  return true;
}

bool ExtensionStore::write_entries(const Entries& entries) const {
  logger_->debug("Writing to '{}'", location_.string());
  std::error_code ec;
  if(location_.has_parent_path()) {
    fs::create_directories(location_.parent_path(), ec);
    if(ec) {
      logger_->error("Unable to create '{}': {}", location_.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(location_, std::ios::trunc);
  if(!out) {
    logger_->error("Unable to open '{}' for writing", location_.string());
    return false;
  }
  json doc = json::object();
  for(const auto& entry : entries) {
    doc[entry.first] = entry.second;
  }
  out << doc.dump(4);
  out.flush();
  if(!out) {
    logger_->error("I/O error while writing '{}'", location_.string());
    return false;
  }
  return true;
}

bool ExtensionStore::add(const std::string& extension, const std::string& path) {
  const std::string normalized = normalize(extension);
  const std::string clean_path = trim_copy(path);
  logger_->debug("Normalized '{}' to '{}'", extension, normalized);

  if(normalized.empty() || clean_path.empty()) {
    logger_->error("Either an empty extension '{}' or an empty path '{}' was given to add", normalized, clean_path);
    return false;
  }
  if(!is_valid_extension(normalized)) {
    logger_->error("Given extension '{}' is invalid", normalized);
    return false;
  }

  entries_[normalized] = clean_path;
  logger_->config("Updated '{}': '{}'", normalized, clean_path);
  return true;
}

void ExtensionStore::remove(const std::vector<std::string>& extensions) {
  for(const auto& extension : extensions) {
    const std::string normalized = normalize(extension);
    if(!is_valid_extension(normalized)) {
      logger_->warn("Skipping invalid extension '{}'", normalized);
      continue;
    }
    if(entries_.erase(normalized) == 0) {
      logger_->warn("Ignoring '{}', because it is not in the configs", normalized);
      continue;
    }
    logger_->config("Removed '{}'", normalized);
  }
}

bool ExtensionStore::merge_file(const fs::path& json_file) {
  if(to_lower(json_file.extension().string()) != ".json") {
    logger_->error("Configs can only be read from .json files, got '{}'", json_file.string());
    return false;
  }

  json doc;
  if(!read_json_file(json_file, doc, *logger_)) return false;

  std::size_t merged = 0;
  for(const auto& item : doc.items()) {
    const std::string normalized = normalize(item.key());
    if(!is_valid_extension(normalized)) {
      logger_->warn("Skipping invalid extension '{}' from '{}'", item.key(), json_file.string());
      continue;
    }
    if(!item.value().is_string() || trim_copy(item.value().get<std::string>()).empty()) {
      logger_->warn("Skipping '{}' from '{}': path must be a non-empty string", normalized, json_file.string());
      continue;
    }
    entries_[normalized] = trim_copy(item.value().get<std::string>());
    ++merged;
  }
  logger_->config("Loaded {} entr{} from '{}' into configs", merged, merged == 1 ? "y" : "ies", json_file.string());
  return true;
}

std::optional<ExtensionMap> ExtensionStore::select(const std::vector<std::string>& extensions) const {
  ExtensionMap selected;
  for(const auto& extension : extensions) {
    const std::string normalized = normalize(extension);
    if(!is_valid_extension(normalized)) {
      logger_->warn("Ignoring invalid extension '{}'", normalized);
      continue;
    }
    auto it = entries_.find(normalized);
    if(it == entries_.end()) {
      logger_->warn("Ignoring '{}', because it is not in the configs", normalized);
      continue;
    }
    selected[normalized] = resolved_path_from_string(it->second);
  }
  if(selected.empty()) {
    logger_->error("No valid extensions selected");
    return std::nullopt;
  }
  return selected;
}

ExtensionMap ExtensionStore::extension_paths() const {
  ExtensionMap paths;
  for(const auto& entry : entries_) {
    paths[entry.first] = resolved_path_from_string(entry.second);
  }
  logger_->debug("Resolved {} extension path(s)", paths.size());
  return paths;
}
