#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

// Raw extension -> destination directory, as supplied by the config store.
// Keys may use any case, with or without the leading dot.
using ExtensionMap = std::map<std::string, std::filesystem::path>;

struct UndefinedExtensionPolicy {
  enum class Kind { Skip, MoveTo };
  Kind kind = Kind::Skip;
  std::filesystem::path fallback;

  static UndefinedExtensionPolicy skip() { return {}; }
  static UndefinedExtensionPolicy move_to(std::filesystem::path directory) {
    UndefinedExtensionPolicy policy;
    policy.kind = Kind::MoveTo;
    policy.fallback = std::move(directory);
    return policy;
  }
};

struct Destination {
  enum class Kind { Skip, MoveTo };
  Kind kind = Kind::Skip;
  std::filesystem::path directory;
  std::string extension;       // normalized, ".jpg" or "" for none
  bool from_fallback = false;

  bool is_move() const { return kind == Kind::MoveTo; }
};

class ExtensionResolver {
public:
  ExtensionResolver() = default;
  ExtensionResolver(const ExtensionMap& extension_paths, UndefinedExtensionPolicy policy);

  Destination resolve(const std::string& filename) const;
  Destination resolve(const std::filesystem::path& file) const {
    return resolve(file.filename().string());
  }

  const UndefinedExtensionPolicy& policy() const { return policy_; }
  std::size_t size() const { return destinations_.size(); }

  // Lower-case extension including the leading dot; "" when the name has
  // no dot or ends with one.
  static std::string extension_of(const std::string& filename);
  // Trim, drop inner whitespace, lower-case and force a single leading dot.
  static std::string normalize_extension(std::string extension);

private:
  std::unordered_map<std::string, std::filesystem::path> destinations_;
  UndefinedExtensionPolicy policy_;
};
