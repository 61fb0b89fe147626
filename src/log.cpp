#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <memory>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_diag_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto diag_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  diag_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_diag_logger = std::make_shared<spdlog::logger>("laport", std::move(diag_sink));
  g_print_logger = std::make_shared<spdlog::logger>("laport.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("laport.print_err", std::move(plain_err_sink));

  g_diag_logger->set_level(spdlog::level::info);
  g_diag_logger->flush_on(spdlog::level::info);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::info);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    default: return g_diag_logger.get();
  }
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

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
      detail::emit_to_default(LogChannel::Warn, name_, spdlog::level::warn,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(LogChannel channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(channel, name_, level, message);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_diag_logger->set_level(level);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_diag_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !prefix.empty()) {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
