#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "directory_watcher.hpp"
#include "event_handler.hpp"
#include "extension_resolver.hpp"
#include "file_mover.hpp"
#include "log.hpp"

class DirectoryWorker;

// A tracked path is missing, not a directory, or cannot be subscribed to.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The set of per-directory workers running between start() and stop().
class WatchSession {
public:
  struct Stats {
    std::size_t workers = 0;
    std::size_t running_workers = 0;
    std::size_t moved = 0;
    std::size_t skipped = 0;
    std::size_t vanished = 0;
    std::size_t failed = 0;
    std::size_t faulted_workers = 0;
  };

  struct Counters {
    std::atomic<std::size_t> moved{0};
    std::atomic<std::size_t> skipped{0};
    std::atomic<std::size_t> vanished{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> faulted_workers{0};
  };

  ~WatchSession();

  WatchSession(const WatchSession&) = delete;
  WatchSession& operator=(const WatchSession&) = delete;

  // Idempotent; callable from any thread, including a signal-handling one.
  void stop();
  // Blocks until stop() has completed.
  void wait();
  bool wait_for(std::chrono::milliseconds timeout);

  bool running() const;
  Stats stats() const;
  const std::vector<std::filesystem::path>& directories() const { return directories_; }

private:
  friend class WatchSupervisor;

  WatchSession(std::vector<std::filesystem::path> directories,
               std::vector<std::shared_ptr<DirectoryWorker>> workers,
               std::shared_ptr<Counters> counters,
               std::chrono::milliseconds shutdown_timeout,
               std::shared_ptr<Logger> logger);

  std::vector<std::filesystem::path> directories_;
  std::vector<std::shared_ptr<DirectoryWorker>> workers_;
  std::shared_ptr<Counters> counters_;
  std::chrono::milliseconds shutdown_timeout_;
  std::shared_ptr<Logger> logger_;

  std::mutex stop_mutex_;
  mutable std::mutex state_mutex_;
  std::condition_variable stopped_cv_;
  bool stopped_ = false;
};

class WatchSupervisor {
public:
  struct Options {
    ExtensionMap extension_paths;
    UndefinedExtensionPolicy undefined_policy;
    CollisionSafeMover::Options mover;
    WatcherFactory watcher_factory;                    // defaults to inotify
    OutcomeCallback on_outcome;
    bool sweep_on_start = false;
    std::chrono::milliseconds settle{250};
    std::chrono::milliseconds idle_wait{500};
    std::chrono::milliseconds shutdown_timeout{5000};
  };

  explicit WatchSupervisor(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Throws ConfigurationError before any worker runs if one path is bad.
  std::shared_ptr<WatchSession> start(const std::vector<std::filesystem::path>& directories,
                                      bool recursive);
  void stop(WatchSession& session);

  std::shared_ptr<Logger> logger() const { return logger_; }
  const Options& options() const { return options_; }

private:
  std::vector<std::filesystem::path> validate(const std::vector<std::filesystem::path>& directories) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const ExtensionResolver> resolver_;
  std::shared_ptr<const CollisionSafeMover> mover_;
};
