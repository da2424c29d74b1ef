#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::filesystem::path g_file_path;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kLogPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kLogPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("vegam.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("vegam.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("vegam.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("vegam.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers();
}

// Leveled output goes to the file too; plain CLI output stays on the terminal.
void attach_file_sink(const std::filesystem::path& log_file) {
  if(log_file.empty() || log_file == g_file_path) return;
  std::error_code ec;
  if(log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    if(g_file_sink) {
      auto& info_sinks = g_info_logger->sinks();
      info_sinks.erase(std::remove(info_sinks.begin(), info_sinks.end(), g_file_sink), info_sinks.end());
      auto& error_sinks = g_error_logger->sinks();
      error_sinks.erase(std::remove(error_sinks.begin(), error_sinks.end(), g_file_sink), error_sinks.end());
    }
    g_info_logger->sinks().push_back(sink);
    g_error_logger->sinks().push_back(sink);
    g_file_sink = std::move(sink);
    g_file_path = log_file;
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->error("Unable to open log file {}: {}", log_file.string(), e.what());
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
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
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
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
      detail::emit_to_default("error", "log-listener", spdlog::level::err,
                              fmt::format("listener failed: {}", e.what()));
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

void init(bool verbose, const std::filesystem::path& log_file) {
  ensure_loggers();
  std::lock_guard<std::mutex> lock(g_init_mutex);
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  attach_file_sink(log_file);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

void flush_logs() {
  ensure_loggers();
  g_info_logger->flush();
  g_error_logger->flush();
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
