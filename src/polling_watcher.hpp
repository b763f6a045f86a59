#pragma once

#include "directory_watcher.hpp"

#include <efsw/efsw.hpp>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

// Portable fallback on efsw's generic backend, which rescans the tree on
// its own thread. Files present when open() runs are not reported.
class PollingWatcher : public DirectoryWatcher, public efsw::FileWatchListener {
public:
  PollingWatcher(std::filesystem::path root, bool recursive);
  ~PollingWatcher() override;

  void open() override;
  bool wait(std::vector<ChangeEvent>& events, std::chrono::milliseconds timeout) override;
  void interrupt() override;
  void close() override;

  const std::filesystem::path& root() const override { return root_; }
  bool recursive() const override { return recursive_; }

  // efsw::FileWatchListener, called on the efsw thread
  void handleFileAction(efsw::WatchID watch_id, const std::string& dir,
                        const std::string& filename, efsw::Action action,
                        std::string old_filename = "") override;

private:
  std::filesystem::path root_;
  bool recursive_ = false;
  std::unique_ptr<efsw::FileWatcher> file_watcher_;
  efsw::WatchID watch_id_ = 0;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChangeEvent> pending_;
  bool interrupted_ = false;
};
