#include "extension_resolver.hpp"

#include <algorithm>
#include <cctype>

ExtensionResolver::ExtensionResolver(const ExtensionMap& extension_paths,
                                     UndefinedExtensionPolicy policy)
  : policy_(std::move(policy)) {
  for(const auto& [raw, directory] : extension_paths) {
    if(directory.empty()) continue;
    destinations_[normalize_extension(raw)] = directory;
  }
  if(policy_.kind == UndefinedExtensionPolicy::Kind::MoveTo && policy_.fallback.empty()) {
    policy_.kind = UndefinedExtensionPolicy::Kind::Skip;
  }
}

std::string ExtensionResolver::normalize_extension(std::string extension) {
  extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch){
    return std::isspace(ch);
  }), extension.end());

  extension.erase(extension.begin(), std::find_if(extension.begin(), extension.end(),
    [](char ch){ return ch != '.'; }));
  if(extension.empty()) return {};

  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch){
    return static_cast<char>(std::tolower(ch));
  });
  return "." + extension;
}

std::string ExtensionResolver::extension_of(const std::string& filename) {
  auto dot = filename.rfind('.');
  if(dot == std::string::npos || dot + 1 >= filename.size()) return {};
  return normalize_extension(filename.substr(dot + 1));
}

Destination ExtensionResolver::resolve(const std::string& filename) const {
  Destination destination;
  destination.extension = extension_of(filename);

  auto it = destinations_.find(destination.extension);
  if(it != destinations_.end()) {
    destination.kind = Destination::Kind::MoveTo;
    destination.directory = it->second;
    return destination;
  }

  if(policy_.kind == UndefinedExtensionPolicy::Kind::MoveTo) {
    destination.kind = Destination::Kind::MoveTo;
    destination.directory = policy_.fallback;
    destination.from_fallback = true;
  }
  return destination;
}
