#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "extension_resolver.hpp"
#include "log.hpp"

// The persisted extension -> directory mapping, stored as a flat JSON
// object: { ".pdf": "~/Documents", ... }. Paths are kept as typed and
// only resolved when handed to the sorter.
class ExtensionStore {
public:
  using Entries = std::map<std::string, std::string>;

  explicit ExtensionStore(std::filesystem::path location, std::shared_ptr<Logger> logger = nullptr);

  // A missing file is created empty and still reported as a failure.
  bool load();
  bool save() const;

  bool add(const std::string& extension, const std::string& path);
  // Invalid or unknown extensions are warned about and skipped.
  void remove(const std::vector<std::string>& extensions);
  bool merge_file(const std::filesystem::path& json_file);

  // nullopt when none of the requested extensions is valid and mapped.
  std::optional<ExtensionMap> select(const std::vector<std::string>& extensions) const;
  ExtensionMap extension_paths() const;

  const Entries& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }
  const std::filesystem::path& location() const { return location_; }

  // Spaces removed, lower-cased; no leading dot is added.
  static std::string normalize(const std::string& extension);
  // '.' followed by one or more ASCII letters or digits.
  static bool is_valid_extension(const std::string& extension);

private:
  bool write_entries(const Entries& entries) const;

  std::filesystem::path location_;
  std::shared_ptr<Logger> logger_;
  Entries entries_;
};
