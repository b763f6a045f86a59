#include "polling_watcher.hpp"

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

PollingWatcher::PollingWatcher(fs::path root, bool recursive)
  : root_(std::move(root)), recursive_(recursive) {}

PollingWatcher::~PollingWatcher() {
  close();
}

void PollingWatcher::open() {
  std::error_code ec;
  if(!fs::is_directory(root_, ec)) {
    throw std::system_error(ec ? ec : std::make_error_code(std::errc::not_a_directory),
                            "poll '" + root_.string() + "'");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = false;
    pending_.clear();
  }

  file_watcher_ = std::make_unique<efsw::FileWatcher>(true);
  watch_id_ = file_watcher_->addWatch(root_.string(), this, recursive_);
  if(watch_id_ < 0) {
    auto reason = efsw::Errors::Log::getLastErrorLog();
    file_watcher_.reset();
    throw std::system_error(std::make_error_code(std::errc::io_error),
                            "poll '" + root_.string() + "': " + reason);
  }
  file_watcher_->watch();
}

void PollingWatcher::handleFileAction(efsw::WatchID, const std::string& dir,
                                      const std::string& filename, efsw::Action action,
                                      std::string) {
  ChangeEvent event;
  switch(action) {
    case efsw::Actions::Add:
    case efsw::Actions::Moved:
      event.kind = ChangeEvent::Kind::Created;
      break;
    case efsw::Actions::Modified:
      event.kind = ChangeEvent::Kind::Modified;
      break;
    default:
      return;
  }
  event.path = (fs::path(dir) / filename).lexically_normal();
  std::error_code ec;
  event.is_directory = fs::is_directory(event.path, ec);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(event));
  }
  cv_.notify_all();
}

bool PollingWatcher::wait(std::vector<ChangeEvent>& events, std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if(!file_watcher_) return false;
    cv_.wait_for(lock, timeout, [this]{ return interrupted_ || !pending_.empty(); });
    if(interrupted_) return false;
    if(!pending_.empty()) {
      events.insert(events.end(), pending_.begin(), pending_.end());
      pending_.clear();
      return true;
    }
  }
  std::error_code ec;
  if(!fs::is_directory(root_, ec)) {
    throw std::runtime_error("tracked directory '" + root_.string() + "' was removed or moved");
  }
  return true;
}

void PollingWatcher::interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

void PollingWatcher::close() {
  std::unique_ptr<efsw::FileWatcher> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    released = std::move(file_watcher_);
    pending_.clear();
  }
  if(released) {
    released->removeWatch(watch_id_);
  }
  // Destroying the efsw watcher joins its scanning thread.
}
