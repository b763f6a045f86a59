#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "%Y-%m-%d %H:%M:%S.%e [%l] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::filesystem::path g_log_file;
std::once_flag g_init_once;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("log.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("log.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("log.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("log.print_err", std::move(plain_err_sink));

  spdlog::register_logger(g_info_logger);
  spdlog::register_logger(g_error_logger);
  spdlog::register_logger(g_print_logger);
  spdlog::register_logger(g_print_err_logger);

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_init_once, [](){
    create_loggers();
  });
}

// Console sinks keep their own level; the logger level is the minimum
// of console and file so the file can record debug output on its own.
void attach_file_sink(const std::filesystem::path& path, spdlog::level::level_enum level) {
  if(g_file_sink) {
    auto& info_sinks = g_info_logger->sinks();
    info_sinks.erase(std::remove(info_sinks.begin(), info_sinks.end(), g_file_sink), info_sinks.end());
    auto& error_sinks = g_error_logger->sinks();
    error_sinks.erase(std::remove(error_sinks.begin(), error_sinks.end(), g_file_sink), error_sinks.end());
    g_file_sink.reset();
    g_log_file.clear();
  }
  if(path.empty()) return;

  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  try {
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->error("Unable to open log file {}: {}", path.string(), e.what());
    return;
  }
  g_file_sink->set_pattern(kFilePattern);
  g_file_sink->set_level(level);
  g_info_logger->sinks().push_back(g_file_sink);
  g_error_logger->sinks().push_back(g_file_sink);
  g_log_file = path;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

std::filesystem::path log_file_path() {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  return g_log_file;
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener failed on [{}]: {}", channel, e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(const LogOptions& options) {
  ensure_loggers();
  std::lock_guard<std::mutex> lock(g_init_mutex);

  auto console_level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  auto file_level = options.debug ? spdlog::level::debug : spdlog::level::info;
  for(auto& sink : g_info_logger->sinks()) {
    if(sink != g_file_sink) sink->set_level(console_level);
  }
  attach_file_sink(options.log_file, file_level);

  auto logger_level = std::min(console_level, g_file_sink ? file_level : console_level);
  g_info_logger->set_level(logger_level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(logger_level);
}

void init(bool verbose) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  bool plain = false;   // command output, never prefixed with the channel
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  if(!plain && !channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
