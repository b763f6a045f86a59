#pragma once

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "autostart.hpp"
#include "log.hpp"
#include "watch_supervisor.hpp"

class SettingsManager;
class ExtensionStore;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

// Runs one subcommand (track, read, write, locations) against the
// current settings and returns the process exit code.
class SorterApp {
public:
  struct Options {
    std::vector<std::string> arguments;      // the raw command line, for autostart
    std::filesystem::path autostart_directory = default_autostart_directory();
    bool handle_signals = true;               // SIGINT/SIGTERM stop a track session
    std::chrono::milliseconds liveness_interval{1000};
  };

  SorterApp(std::shared_ptr<SettingsManager> settings, Options options,
            std::shared_ptr<Logger> logger = nullptr);
  ~SorterApp();

  int run();
  // Ends a running track session; safe from any thread, also before it starts.
  void stop();

  // Validated locations; a wrong file type is warned about and replaced
  // by the default.
  std::filesystem::path configs_location() const;
  std::filesystem::path log_location() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<WatchSession> session() const;

private:
  int track(const std::vector<std::string>& operands);
  int read(const std::vector<std::string>& operands);
  int write(const std::vector<std::string>& operands);
  int locations(const std::vector<std::string>& operands);

  bool load_store(ExtensionStore& store, bool create_missing) const;
  WatchSupervisor::Options supervisor_options(ExtensionMap extension_paths) const;
  int wait_for_session(const std::shared_ptr<WatchSession>& session);

  void start_signal_handling();
  void stop_signal_handling();

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;

  mutable std::mutex session_mutex_;
  std::shared_ptr<WatchSession> session_;
  bool stop_requested_ = false;
};
