#include "sorter_app.hpp"

#include <algorithm>
#include <csignal>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "extension_store.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

fs::path checked_location(const std::string& raw,
                          const char* required_extension,
                          const fs::path& fallback,
                          const char* what,
                          Logger& logger) {
  auto clean = trim_copy(raw);
  if(clean.empty()) return fallback;
  auto path = resolved_path_from_string(clean);
  if(to_lower(path.extension().string()) != required_extension) {
    logger.warn("Given {} location '{}' is not a '{}' file. Using default location: '{}'",
                what, path.string(), required_extension, fallback.string());
    return fallback;
  }
  return path;
}

// One write invocation: each action at most once, applied as add, json, remove.
struct WriteActions {
  std::optional<std::pair<std::string, std::string>> add;
  std::optional<std::string> json;
  std::optional<std::vector<std::string>> remove;
};

bool is_write_action(const std::string& token) {
  const auto lowered = to_lower(token);
  return lowered == "add" || lowered == "json" || lowered == "remove";
}

std::optional<WriteActions> parse_write_actions(const std::vector<std::string>& operands, std::string& error) {
  WriteActions actions;
  std::size_t next = 0;
  while(next < operands.size()) {
    const auto action = to_lower(operands[next++]);
    if(action == "add") {
      if(actions.add) { error = "write add given more than once"; return std::nullopt; }
      if(next + 2 > operands.size() || is_write_action(operands[next]) || is_write_action(operands[next + 1])) {
        error = "write add needs exactly an extension and a path";
        return std::nullopt;
      }
      actions.add = std::make_pair(operands[next], operands[next + 1]);
      next += 2;
    } else if(action == "json") {
      if(actions.json) { error = "write json given more than once"; return std::nullopt; }
      if(next >= operands.size() || is_write_action(operands[next])) {
        error = "write json needs exactly one file";
        return std::nullopt;
      }
      actions.json = operands[next++];
    } else if(action == "remove") {
      if(actions.remove) { error = "write remove given more than once"; return std::nullopt; }
      std::vector<std::string> extensions;
      while(next < operands.size() && !is_write_action(operands[next])) {
        extensions.push_back(operands[next++]);
      }
      if(extensions.empty()) {
        error = "write remove needs at least one extension";
        return std::nullopt;
      }
      actions.remove = std::move(extensions);
    } else {
      error = "Unknown write action '" + operands[next - 1] + "', expected add, json or remove";
      return std::nullopt;
    }
  }
  if(!actions.add && !actions.json && !actions.remove) {
    error = "write needs an action: add EXT PATH, json FILE, remove EXT...";
    return std::nullopt;
  }
  return actions;
}

} // namespace

SorterApp::SorterApp(std::shared_ptr<SettingsManager> settings, Options options,
                     std::shared_ptr<Logger> logger)
  : settings_(std::move(settings)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("file-sorter")) {
  if(!settings_) {
    throw std::invalid_argument("SorterApp requires settings");
  }
}

SorterApp::~SorterApp() {
  stop();
  stop_signal_handling();
}

fs::path SorterApp::configs_location() const {
  return checked_location(settings_->get<std::string>("configs_location"), ".json",
                          default_configs_location(), "configs", *logger_);
}

fs::path SorterApp::log_location() const {
  return checked_location(settings_->get<std::string>("log_location"), ".log",
                          default_log_location(), "logging", *logger_);
}

std::shared_ptr<WatchSession> SorterApp::session() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_;
}

int SorterApp::run() {
  const auto command = to_lower(trim_copy(settings_->get<std::string>("command")));
  const auto operands = settings_->get<std::vector<std::string>>("operands");
  logger_->debug("Running '{}' with {} operand(s)", command, operands.size());

  if(command == "track") return track(operands);
  if(command == "read") return read(operands);
  if(command == "write") return write(operands);
  if(command == "locations") return locations(operands);

  if(command.empty()) {
    logger_->error("No command given, expected one of: track, read, write, locations");
  } else {
    logger_->error("Unknown command '{}', expected one of: track, read, write, locations", command);
  }
  return kExitFailure;
}

void SorterApp::stop() {
  std::shared_ptr<WatchSession> session;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    stop_requested_ = true;
    session = session_;
  }
  if(session) session->stop();
}

bool SorterApp::load_store(ExtensionStore& store, bool create_missing) const {
  std::error_code ec;
  const bool existed = fs::exists(store.location(), ec);
  if(store.load()) return true;
  if(!existed && create_missing && fs::exists(store.location(), ec)) {
    logger_->info("Starting from an empty configuration at '{}'", store.location().string());
    return true;
  }
  return false;
}

WatchSupervisor::Options SorterApp::supervisor_options(ExtensionMap extension_paths) const {
  WatchSupervisor::Options options;
  options.extension_paths = std::move(extension_paths);

  auto undefined = trim_copy(settings_->get<std::string>("undefined_extensions"));
  if(undefined.empty()) {
    options.undefined_policy = UndefinedExtensionPolicy::skip();
  } else {
    options.undefined_policy = UndefinedExtensionPolicy::move_to(resolved_path_from_string(undefined));
  }

  options.mover.dated_subfolders = settings_->get<bool>("dated_subfolders");
  options.sweep_on_start = settings_->get<bool>("sweep_on_start");

  options.watcher_factory = make_watcher_factory(to_lower(trim_copy(settings_->get<std::string>("watch_backend"))));
  options.settle = std::chrono::milliseconds(std::max(settings_->get<int>("settle_ms"), 0));
  options.shutdown_timeout = std::chrono::milliseconds(std::max(settings_->get<int>("shutdown_timeout_ms"), 1));
  return options;
}

int SorterApp::track(const std::vector<std::string>& operands) {
  if(operands.empty()) {
    logger_->error("track needs at least one directory");
    return kExitFailure;
  }

  ExtensionStore store(configs_location(), logger_);
  if(!load_store(store, false)) return kExitFailure;
  if(store.empty()) {
    logger_->critical("No paths for extensions defined in '{}'", store.location().string());
    return kExitFailure;
  }

  WatchSupervisor::Options options;
  try {
    options = supervisor_options(store.extension_paths());
  } catch(const std::invalid_argument& e) {
    logger_->critical("{}", e.what());
    return kExitFailure;
  }

  std::vector<fs::path> directories;
  directories.reserve(operands.size());
  for(const auto& operand : operands) {
    directories.push_back(resolved_path_from_string(operand));
  }

  WatchSupervisor supervisor(std::move(options), logger_);
  std::shared_ptr<WatchSession> session;
  try {
    session = supervisor.start(directories, settings_->get<bool>("recursive"));
  } catch(const ConfigurationError& e) {
    logger_->critical("{}", e.what());
    return kExitFailure;
  }

  bool stop_now = false;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = session;
    stop_now = stop_requested_;
    stop_requested_ = false;
  }
  if(stop_now) session->stop();

  if(settings_->get<bool>("autostart")) {
    if(register_autostart(options_.arguments, options_.autostart_directory, logger_.get()).empty()) {
      logger_->warn("Could not add the command to autostart, tracking anyway");
    }
  }

  if(options_.handle_signals) start_signal_handling();
  const int exit_code = wait_for_session(session);
  stop_signal_handling();

  const auto stats = session->stats();
  logger_->info("Moved {} file(s), skipped {}, failed {}", stats.moved, stats.skipped, stats.failed);
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.reset();
    stop_requested_ = false;
  }
  return exit_code;
}

int SorterApp::wait_for_session(const std::shared_ptr<WatchSession>& session) {
  while(!session->wait_for(options_.liveness_interval)) {
    auto stats = session->stats();
    if(stats.running_workers == 0) {
      logger_->error("Every watcher has stopped, ending the session");
      session->stop();
    }
  }
  const auto stats = session->stats();
  if(stats.workers > 0 && stats.faulted_workers == stats.workers) {
    return kExitFailure;
  }
  return kExitSuccess;
}

int SorterApp::read(const std::vector<std::string>& operands) {
  ExtensionStore store(configs_location(), logger_);
  if(!load_store(store, false)) return kExitFailure;

  if(!operands.empty()) {
    auto selected = store.select(operands);
    if(!selected) return kExitFailure;
    for(const auto& entry : *selected) {
      logger_->print("{}: {}", entry.first, entry.second.string());
    }
    logger_->debug("Printed {} selected config(s)", selected->size());
    return kExitSuccess;
  }

  const auto paths = store.extension_paths();
  for(const auto& entry : paths) {
    logger_->print("{}: {}", entry.first, entry.second.string());
  }
  logger_->debug("Printed all {} config(s)", paths.size());
  return kExitSuccess;
}

int SorterApp::write(const std::vector<std::string>& operands) {
  std::string error;
  const auto actions = parse_write_actions(operands, error);
  if(!actions) {
    logger_->error("{}", error);
    return kExitFailure;
  }

  ExtensionStore store(configs_location(), logger_);
  if(!load_store(store, true)) return kExitFailure;

  bool applied = true;
  if(actions->add && !store.add(actions->add->first, actions->add->second)) {
    applied = false;
  }
  if(actions->json && !store.merge_file(resolved_path_from_string(*actions->json))) {
    applied = false;
  }
  if(actions->remove) {
    store.remove(*actions->remove);
  }

  if(!store.save()) return kExitFailure;
  return applied ? kExitSuccess : kExitFailure;
}

int SorterApp::locations(const std::vector<std::string>& operands) {
  if(operands.empty()) {
    logger_->print("{}", log_location().string());
    logger_->print("{}", configs_location().string());
    return kExitSuccess;
  }

  int exit_code = kExitSuccess;
  for(const auto& operand : operands) {
    const auto which = to_lower(trim_copy(operand));
    if(which == "log") {
      logger_->print("{}", log_location().string());
    } else if(which == "config" || which == "configs") {
      logger_->print("{}", configs_location().string());
    } else {
      logger_->error("Unknown location '{}', expected log or config", operand);
      exit_code = kExitFailure;
    }
  }
  return exit_code;
}

void SorterApp::start_signal_handling() {
  if(io_thread_.joinable()) return;
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->info("Received signal {}, stopping", signal_number);
    stop();
  });
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SorterApp::stop_signal_handling() {
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  signals_.reset();
  io_.restart();
}
