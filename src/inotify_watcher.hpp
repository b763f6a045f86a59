#pragma once

#include "directory_watcher.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>

struct inotify_event;

class InotifyWatcher : public DirectoryWatcher {
public:
  InotifyWatcher(std::filesystem::path root, bool recursive);
  ~InotifyWatcher() override;

  InotifyWatcher(const InotifyWatcher&) = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  void open() override;
  bool wait(std::vector<ChangeEvent>& events, std::chrono::milliseconds timeout) override;
  void interrupt() override;
  void close() override;

  const std::filesystem::path& root() const override { return root_; }
  bool recursive() const override { return recursive_; }

private:
  static const uint32_t kWatchMask;

  void add_watch(const std::filesystem::path& directory);
  void add_watches_recursive(const std::filesystem::path& directory, std::vector<ChangeEvent>* existing);
  void handle_event(const inotify_event* event, std::vector<ChangeEvent>& events);
  void rescan(std::vector<ChangeEvent>& events);

  std::filesystem::path root_;
  bool recursive_ = false;
  int inotify_fd_ = -1;
  int wake_fd_ = -1;
  std::atomic<bool> interrupted_{false};
  std::mutex close_mutex_;
  std::unordered_map<int, std::filesystem::path> watched_dirs_;
};
