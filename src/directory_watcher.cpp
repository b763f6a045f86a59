#include "directory_watcher.hpp"

#include <stdexcept>

#include "inotify_watcher.hpp"
#include "polling_watcher.hpp"

const char* to_string(ChangeEvent::Kind kind) {
  switch(kind) {
    case ChangeEvent::Kind::Created: return "created";
    case ChangeEvent::Kind::Modified: return "modified";
  }
  return "unknown";
}

WatcherFactory make_watcher_factory(const std::string& backend) {
  if(backend == "inotify") {
    return [](const std::filesystem::path& root, bool recursive) -> std::unique_ptr<DirectoryWatcher> {
      return std::make_unique<InotifyWatcher>(root, recursive);
    };
  }
  if(backend == "poll") {
    return [](const std::filesystem::path& root, bool recursive) -> std::unique_ptr<DirectoryWatcher> {
      return std::make_unique<PollingWatcher>(root, recursive);
    };
  }
  throw std::invalid_argument("unknown watch backend '" + backend + "' (expected inotify or poll)");
}
