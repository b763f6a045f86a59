#include "watch_supervisor.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

#include "event_debouncer.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// One tracked directory: its watcher, its handler and the thread that
// drives them. Held through shared_ptr so a worker that outlives the
// shutdown timeout can be detached safely.
class DirectoryWorker : public std::enable_shared_from_this<DirectoryWorker> {
public:
  DirectoryWorker(fs::path directory,
                  std::unique_ptr<DirectoryWatcher> watcher,
                  std::unique_ptr<SortEventHandler> handler,
                  const WatchSupervisor::Options& options,
                  std::shared_ptr<WatchSession::Counters> counters,
                  OutcomeCallback report,
                  std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      watcher_(std::move(watcher)),
      handler_(std::move(handler)),
      debouncer_(options.settle),
      idle_wait_(options.idle_wait),
      sweep_on_start_(options.sweep_on_start),
      counters_(std::move(counters)),
      report_(std::move(report)),
      logger_(std::move(logger)) {}

  void launch() {
    auto self = shared_from_this();
    thread_ = std::thread([self](){ self->run(); });
  }

  void request_stop() {
    stop_requested_ = true;
    watcher_->interrupt();
  }

  bool wait_finished(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(finished_mutex_);
    return finished_cv_.wait_until(lock, deadline, [this]{ return finished_; });
  }

  bool finished() const {
    std::lock_guard<std::mutex> lock(finished_mutex_);
    return finished_;
  }

  // For a worker whose thread never started.
  void discard() {
    watcher_->close();
    {
      std::lock_guard<std::mutex> lock(finished_mutex_);
      finished_ = true;
    }
    finished_cv_.notify_all();
  }

  // True when called from this worker's thread, e.g. by an outcome callback.
  bool on_own_thread() const {
    return thread_.get_id() == std::this_thread::get_id();
  }

  void release(bool finished) {
    if(!thread_.joinable()) return;
    if(finished && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    } else {
      thread_.detach();
    }
  }

  const fs::path& directory() const { return directory_; }

private:
  void run() {
    logger_->info("Started watching '{}'", directory_.string());
    try {
      if(sweep_on_start_) handler_->sweep();
      loop();
    } catch(const std::exception& e) {
      counters_->faulted_workers++;
      logger_->error("Watcher for '{}' failed: {}", directory_.string(), e.what());
      SortOutcome outcome;
      outcome.kind = SortOutcome::Kind::Failed;
      outcome.tracked_directory = directory_;
      outcome.source = directory_;
      outcome.error = MoveError::UnexpectedIOError;
      outcome.message = e.what();
      report_(outcome);
    }
    watcher_->close();
    if(!debouncer_.empty()) {
      logger_->debug("Dropped {} unsettled notification(s) for '{}'", debouncer_.size(), directory_.string());
    }
    logger_->info("Stopped watching '{}'", directory_.string());
    {
      std::lock_guard<std::mutex> lock(finished_mutex_);
      finished_ = true;
    }
    finished_cv_.notify_all();
  }

  void loop() {
    std::vector<ChangeEvent> batch;
    while(!stop_requested_) {
      batch.clear();
      auto timeout = debouncer_.time_until_ready(EventDebouncer::clock::now(), idle_wait_);
      bool alive = watcher_->wait(batch, timeout);
      if(!alive || stop_requested_) break;

      auto now = EventDebouncer::clock::now();
      for(const auto& event : batch) {
        debouncer_.add(event, now);
      }
      for(const auto& event : debouncer_.take_ready()) {
        handler_->handle(event);
        if(stop_requested_) break;
      }
    }
  }

  fs::path directory_;
  std::unique_ptr<DirectoryWatcher> watcher_;
  std::unique_ptr<SortEventHandler> handler_;
  EventDebouncer debouncer_;
  std::chrono::milliseconds idle_wait_;
  bool sweep_on_start_ = false;
  std::shared_ptr<WatchSession::Counters> counters_;
  OutcomeCallback report_;
  std::shared_ptr<Logger> logger_;

  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  mutable std::mutex finished_mutex_;
  std::condition_variable finished_cv_;
  bool finished_ = false;
};

// ---- WatchSession ----------------------------------------------------------

WatchSession::WatchSession(std::vector<fs::path> directories,
                           std::vector<std::shared_ptr<DirectoryWorker>> workers,
                           std::shared_ptr<Counters> counters,
                           std::chrono::milliseconds shutdown_timeout,
                           std::shared_ptr<Logger> logger)
  : directories_(std::move(directories)),
    workers_(std::move(workers)),
    counters_(std::move(counters)),
    shutdown_timeout_(shutdown_timeout),
    logger_(std::move(logger)) {}

WatchSession::~WatchSession() {
  stop();
}

void WatchSession::stop() {
  std::lock_guard<std::mutex> stop_lock(stop_mutex_);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(stopped_) return;
  }

  logger_->debug("Stopping {} worker(s)", workers_.size());
  for(auto& worker : workers_) {
    worker->request_stop();
  }

  auto deadline = std::chrono::steady_clock::now() + shutdown_timeout_;
  for(auto& worker : workers_) {
    if(worker->on_own_thread()) {
      // It exits once the callback that called stop() returns.
      worker->release(false);
      continue;
    }
    bool finished = worker->wait_finished(deadline);
    if(!finished) {
      logger_->warn("Worker for '{}' did not stop within {} ms, abandoning it",
                    worker->directory().string(), shutdown_timeout_.count());
    }
    worker->release(finished);
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stopped_ = true;
  }
  stopped_cv_.notify_all();
  logger_->info("Tracking session stopped");
}

void WatchSession::wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  stopped_cv_.wait(lock, [this]{ return stopped_; });
}

bool WatchSession::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return stopped_cv_.wait_for(lock, timeout, [this]{ return stopped_; });
}

bool WatchSession::running() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return !stopped_;
}

WatchSession::Stats WatchSession::stats() const {
  Stats s;
  s.workers = workers_.size();
  for(const auto& worker : workers_) {
    if(!worker->finished()) s.running_workers++;
  }
  s.moved = counters_->moved.load();
  s.skipped = counters_->skipped.load();
  s.vanished = counters_->vanished.load();
  s.failed = counters_->failed.load();
  s.faulted_workers = counters_->faulted_workers.load();
  return s;
}

// ---- WatchSupervisor -------------------------------------------------------

WatchSupervisor::WatchSupervisor(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("supervisor")) {
  if(!options_.watcher_factory) {
    options_.watcher_factory = make_watcher_factory("inotify");
  }
  if(options_.settle.count() < 0) options_.settle = std::chrono::milliseconds(0);
  if(options_.idle_wait.count() <= 0) options_.idle_wait = std::chrono::milliseconds(500);
  if(options_.shutdown_timeout.count() <= 0) options_.shutdown_timeout = std::chrono::milliseconds(5000);
  resolver_ = std::make_shared<const ExtensionResolver>(options_.extension_paths, options_.undefined_policy);
  mover_ = std::make_shared<const CollisionSafeMover>(options_.mover);
}

std::vector<fs::path> WatchSupervisor::validate(const std::vector<fs::path>& directories) const {
  if(directories.empty()) {
    throw ConfigurationError("no directories to track");
  }

  std::vector<fs::path> resolved;
  std::vector<std::string> problems;
  for(const auto& directory : directories) {
    auto absolute = normalized_directory(resolved_path_from_string(directory.string()));
    std::error_code ec;
    auto status = fs::status(absolute, ec);
    if(!fs::exists(status)) {
      problems.push_back("'" + absolute.string() + "' does not exist");
      continue;
    }
    if(!fs::is_directory(status)) {
      problems.push_back("'" + absolute.string() + "' is not a directory");
      continue;
    }
    if(std::find(resolved.begin(), resolved.end(), absolute) != resolved.end()) {
      logger_->warn("'{}' was given more than once", absolute.string());
      continue;
    }
    resolved.push_back(std::move(absolute));
  }

  if(!problems.empty()) {
    std::string message = "invalid tracked directory: ";
    for(std::size_t i = 0; i < problems.size(); ++i) {
      if(i > 0) message += "; ";
      message += problems[i];
    }
    throw ConfigurationError(message);
  }
  return resolved;
}

std::shared_ptr<WatchSession> WatchSupervisor::start(const std::vector<fs::path>& directories,
                                                     bool recursive) {
  auto resolved = validate(directories);

  // Subscribe everything before any thread runs so a failure leaves nothing behind.
  std::vector<std::unique_ptr<DirectoryWatcher>> watchers;
  for(const auto& directory : resolved) {
    try {
      auto watcher = options_.watcher_factory(directory, recursive);
      if(!watcher) {
        throw std::runtime_error("watcher factory returned nothing");
      }
      watcher->open();
      watchers.push_back(std::move(watcher));
    } catch(const std::exception& e) {
      for(auto& opened : watchers) opened->close();
      throw ConfigurationError("cannot watch '" + directory.string() + "': " + e.what());
    }
  }

  auto counters = std::make_shared<WatchSession::Counters>();
  auto user_callback = options_.on_outcome;
  auto logger = logger_;
  OutcomeCallback report = [counters, user_callback, logger](const SortOutcome& outcome){
    switch(outcome.kind) {
      case SortOutcome::Kind::Moved: counters->moved++; break;
      case SortOutcome::Kind::Skipped: counters->skipped++; break;
      case SortOutcome::Kind::Vanished: counters->vanished++; break;
      case SortOutcome::Kind::Failed: counters->failed++; break;
    }
    if(!user_callback) return;
    try {
      user_callback(outcome);
    } catch(const std::exception& e) {
      logger->error("Outcome listener failed: {}", e.what());
    }
  };

  std::vector<std::shared_ptr<DirectoryWorker>> workers;
  for(std::size_t i = 0; i < resolved.size(); ++i) {
    auto handler = std::make_unique<SortEventHandler>(resolved[i], recursive, resolver_, mover_, logger_, report);
    workers.push_back(std::make_shared<DirectoryWorker>(resolved[i],
                                                        std::move(watchers[i]),
                                                        std::move(handler),
                                                        options_,
                                                        counters,
                                                        report,
                                                        logger_));
  }

  std::shared_ptr<WatchSession> session(new WatchSession(resolved,
                                                         workers,
                                                         counters,
                                                         options_.shutdown_timeout,
                                                         logger_));
  for(std::size_t launched = 0; launched < workers.size(); ++launched) {
    try {
      workers[launched]->launch();
    } catch(const std::system_error& e) {
      for(std::size_t i = launched; i < workers.size(); ++i) workers[i]->discard();
      session->stop();
      throw ConfigurationError("cannot start worker for '" + resolved[launched].string() + "': " + e.what());
    }
  }
  logger_->info("Tracking {} director{} ({})", resolved.size(), resolved.size() == 1 ? "y" : "ies",
                recursive ? "recursive" : "top level only");
  return session;
}

void WatchSupervisor::stop(WatchSession& session) {
  session.stop();
}
