#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> g_file_sink;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};
std::atomic<bool> g_debug{false};

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void create_loggers_locked() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("polyglot.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("polyglot.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("polyglot.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("polyglot.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers_locked();
}

void attach_file_sink_locked(const LogOptions& options) {
  if(options.log_file.empty() || g_file_sink) return;
  try {
    g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.log_file, options.max_file_size, options.max_files);
    g_file_sink->set_pattern(kTimestampPattern);
    g_info_logger->sinks().push_back(g_file_sink);
    g_error_logger->sinks().push_back(g_file_sink);
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->error("Unable to open log file {}: {}", options.log_file, e.what());
    g_file_sink.reset();
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers_locked();
  attach_file_sink_locked(options);

  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_debug.store(options.verbose, std::memory_order_release);
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

void init(bool verbose) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  listener_count_.store(listeners_.size(), std::memory_order_release);
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
  listener_count_.store(listeners_.size(), std::memory_order_release);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
  listener_count_.store(0, std::memory_order_release);
}

bool Logger::debug_enabled() const {
  return g_debug.load(std::memory_order_acquire) ||
         listener_count_.load(std::memory_order_acquire) > 0;
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
      detail::emit_to_default("error", name_, spdlog::level::err,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  if(level == spdlog::level::debug && !g_debug.load(std::memory_order_acquire)) return;
  detail::emit_to_default(base_channel, name_, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& component,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  bool plain = false;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
    plain = true;
  } else if(level >= spdlog::level::err) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  if(!plain && !component.empty()) {
    sink->log(level, "[{}] {}", component, message);
  } else {
    sink->log(level, "{}", message);
  }
}

} // namespace detail
