#include "inotify_watcher.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

const uint32_t InotifyWatcher::kWatchMask =
  IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

InotifyWatcher::InotifyWatcher(fs::path root, bool recursive)
  : root_(std::move(root)), recursive_(recursive) {}

InotifyWatcher::~InotifyWatcher() {
  close();
}

void InotifyWatcher::open() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if(inotify_fd_ >= 0) return;

  inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(inotify_fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }
  wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if(wake_fd_ < 0) {
    int err = errno;
    ::close(inotify_fd_);
    inotify_fd_ = -1;
    throw std::system_error(err, std::generic_category(), "eventfd");
  }
  interrupted_ = false;

  try {
    if(recursive_) {
      add_watches_recursive(root_, nullptr);
    } else {
      add_watch(root_);
    }
  } catch(...) {
    ::close(wake_fd_);
    ::close(inotify_fd_);
    wake_fd_ = inotify_fd_ = -1;
    watched_dirs_.clear();
    throw;
  }
}

void InotifyWatcher::add_watch(const fs::path& directory) {
  int wd = ::inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask);
  if(wd < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_add_watch '" + directory.string() + "'");
  }
  watched_dirs_[wd] = directory;
}

void InotifyWatcher::add_watches_recursive(const fs::path& directory, std::vector<ChangeEvent>* existing) {
  add_watch(directory);
  std::error_code ec;
  for(fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec), end;
      !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
      try {
        add_watch(it->path());
      } catch(const std::system_error& e) {
        // A sub-directory vanishing mid-scan is not fatal once the root is watched.
        if(e.code() != std::errc::no_such_file_or_directory) throw;
      }
    } else if(existing && it->is_regular_file(type_ec)) {
      // Files written before the new sub-directory was watched.
      existing->push_back(ChangeEvent{it->path(), ChangeEvent::Kind::Created, false});
    }
  }
}

void InotifyWatcher::rescan(std::vector<ChangeEvent>& events) {
  std::error_code ec;
  if(recursive_) {
    for(fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec), end;
        !ec && it != end; it.increment(ec)) {
      std::error_code type_ec;
      if(it->is_regular_file(type_ec)) {
        events.push_back(ChangeEvent{it->path(), ChangeEvent::Kind::Modified, false});
      }
    }
    return;
  }
  for(fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_regular_file(type_ec)) {
      events.push_back(ChangeEvent{it->path(), ChangeEvent::Kind::Modified, false});
    }
  }
}

void InotifyWatcher::handle_event(const inotify_event* event, std::vector<ChangeEvent>& events) {
  if(event->mask & IN_Q_OVERFLOW) {
    rescan(events);
    return;
  }

  auto dir_it = watched_dirs_.find(event->wd);
  if(dir_it == watched_dirs_.end()) return;
  const fs::path directory = dir_it->second;

  if(event->mask & IN_IGNORED) {
    watched_dirs_.erase(dir_it);
    return;
  }
  if(event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
    if(directory == root_) {
      throw std::runtime_error("tracked directory '" + root_.string() + "' was removed or moved");
    }
    return;
  }
  if(event->len == 0) return;

  ChangeEvent change;
  change.path = directory / event->name;
  change.is_directory = (event->mask & IN_ISDIR) != 0;
  change.kind = (event->mask & (IN_CREATE | IN_MOVED_TO)) ? ChangeEvent::Kind::Created
                                                          : ChangeEvent::Kind::Modified;

  if(change.is_directory && recursive_ && change.kind == ChangeEvent::Kind::Created) {
    try {
      add_watches_recursive(change.path, &events);
    } catch(const std::system_error& e) {
      if(e.code() != std::errc::no_such_file_or_directory) throw;
    }
  }
  events.push_back(std::move(change));
}

bool InotifyWatcher::wait(std::vector<ChangeEvent>& events, std::chrono::milliseconds timeout) {
  if(inotify_fd_ < 0 || interrupted_) return false;

  pollfd fds[2];
  fds[0].fd = inotify_fd_;
  fds[0].events = POLLIN;
  fds[1].fd = wake_fd_;
  fds[1].events = POLLIN;

  int ready = ::poll(fds, 2, static_cast<int>(timeout.count()));
  if(ready < 0) {
    if(errno == EINTR) return !interrupted_;
    throw std::system_error(errno, std::generic_category(), "poll");
  }
  if(interrupted_ || (fds[1].revents & POLLIN)) {
    return false;
  }
  if(ready == 0 || !(fds[0].revents & POLLIN)) {
    return true;
  }

  alignas(inotify_event) char buffer[64 * (sizeof(inotify_event) + NAME_MAX + 1)];
  for(;;) {
    ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
    if(length < 0) {
      if(errno == EAGAIN || errno == EWOULDBLOCK) break;
      if(errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "read inotify");
    }
    if(length == 0) break;
    for(char* ptr = buffer; ptr < buffer + length; ) {
      auto* event = reinterpret_cast<const inotify_event*>(ptr);
      handle_event(event, events);
      ptr += sizeof(inotify_event) + event->len;
    }
  }
  return true;
}

void InotifyWatcher::interrupt() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  interrupted_ = true;
  if(wake_fd_ >= 0) {
    uint64_t one = 1;
    // EAGAIN only means the counter is already non-zero.
    [[maybe_unused]] auto written = ::write(wake_fd_, &one, sizeof(one));
  }
}

void InotifyWatcher::close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if(inotify_fd_ >= 0) {
    for(const auto& entry : watched_dirs_) {
      ::inotify_rm_watch(inotify_fd_, entry.first);
    }
    watched_dirs_.clear();
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  if(wake_fd_ >= 0) {
    ::close(wake_fd_);
    wake_fd_ = -1;
  }
}
