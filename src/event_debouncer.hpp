#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "directory_watcher.hpp"

// Coalesces bursts of notifications for the same path. A path becomes
// ready once no notification arrived for it during the settle window;
// ready events come out in the order their paths were first seen.
class EventDebouncer {
public:
  using clock = std::chrono::steady_clock;

  explicit EventDebouncer(std::chrono::milliseconds settle) : settle_(settle) {}

  void add(const ChangeEvent& event, clock::time_point now = clock::now()) {
    auto key = event.path.string();
    auto it = pending_.find(key);
    if(it == pending_.end()) {
      pending_.emplace(key, Entry{event, now, next_order_++});
      return;
    }
    auto& entry = it->second;
    if(event.kind == ChangeEvent::Kind::Created) {
      entry.event.kind = ChangeEvent::Kind::Created;
    }
    entry.event.is_directory = event.is_directory;
    entry.last_seen = now;
  }

  std::vector<ChangeEvent> take_ready(clock::time_point now = clock::now()) {
    std::vector<Entry> ready;
    for(auto it = pending_.begin(); it != pending_.end(); ) {
      if(now - it->second.last_seen >= settle_) {
        ready.push_back(std::move(it->second));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
    std::sort(ready.begin(), ready.end(),
              [](const Entry& a, const Entry& b){ return a.order < b.order; });
    std::vector<ChangeEvent> out;
    out.reserve(ready.size());
    for(auto& entry : ready) out.push_back(std::move(entry.event));
    return out;
  }

  // How long the caller may block before something becomes ready.
  std::chrono::milliseconds time_until_ready(clock::time_point now,
                                             std::chrono::milliseconds idle) const {
    if(pending_.empty()) return idle;
    auto earliest = clock::time_point::max();
    for(const auto& item : pending_) {
      earliest = std::min(earliest, item.second.last_seen + settle_);
    }
    if(earliest <= now) return std::chrono::milliseconds(0);
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now) +
                     std::chrono::milliseconds(1);
    return std::min(remaining, idle);
  }

  bool empty() const { return pending_.empty(); }
  std::size_t size() const { return pending_.size(); }
  std::chrono::milliseconds settle() const { return settle_; }

private:
  struct Entry {
    ChangeEvent event;
    clock::time_point last_seen;
    std::uint64_t order = 0;
  };

  std::chrono::milliseconds settle_;
  std::unordered_map<std::string, Entry> pending_;
  std::uint64_t next_order_ = 0;
};
