#pragma once

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sorter::test {

// Scratch directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    root_ = std::filesystem::temp_directory_path() /
            ("file_sorter_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
    root_ = std::filesystem::weakly_canonical(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }

  std::filesystem::path dir(const std::string& relative) const {
    auto path = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return path;
  }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& content) {
  write_file(path, content.dump(4));
}

inline std::size_t count_files(const std::filesystem::path& directory) {
  std::error_code ec;
  std::size_t count = 0;
  for(std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_regular_file(type_ec)) ++count;
  }
  return count;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

} // namespace sorter::test
