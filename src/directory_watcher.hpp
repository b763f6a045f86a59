#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ChangeEvent {
  enum class Kind { Created, Modified };
  std::filesystem::path path;
  Kind kind = Kind::Modified;
  bool is_directory = false;
};

const char* to_string(ChangeEvent::Kind kind);

// A subscription to change notifications for one directory tree.
// open() subscribes and may throw std::system_error; wait() blocks until
// notifications arrive, the timeout expires or interrupt() is called from
// any thread; close() releases the OS handle and is safe to repeat.
class DirectoryWatcher {
public:
  virtual ~DirectoryWatcher() = default;

  virtual void open() = 0;
  // Appends to `events`. Returns false once interrupted or closed.
  virtual bool wait(std::vector<ChangeEvent>& events, std::chrono::milliseconds timeout) = 0;
  virtual void interrupt() = 0;
  virtual void close() = 0;

  virtual const std::filesystem::path& root() const = 0;
  virtual bool recursive() const = 0;
};

using WatcherFactory = std::function<std::unique_ptr<DirectoryWatcher>(const std::filesystem::path& root,
                                                                       bool recursive)>;

// backend: "inotify" or "poll" (efsw generic scanner); unknown names throw
// std::invalid_argument.
WatcherFactory make_watcher_factory(const std::string& backend);
