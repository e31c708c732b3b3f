#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <memory>
#include <vector>

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> events;
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> console;
  std::shared_ptr<spdlog::logger> console_err;
};

std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const std::string& pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

Sinks& sinks() {
  static Sinks s = []{
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    Sinks created;
    created.events = make_sink_logger("wingsync.event", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                      stamped, spdlog::level::warn);
    created.errors = make_sink_logger("wingsync.error", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                      stamped, spdlog::level::err);
    created.console = make_sink_logger("wingsync.console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                       "%v", spdlog::level::info);
    created.console_err = make_sink_logger("wingsync.console_err",
                                           std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                           "%v", spdlog::level::err);
    return created;
  }();
  return s;
}

spdlog::logger& sink_for(LogChannel channel) {
  auto& s = sinks();
  switch(channel) {
    case LogChannel::Print: return *s.console;
    case LogChannel::PrintErr: return *s.console_err;
    case LogChannel::Error: return *s.errors;
    default: return *s.events;
  }
}

bool is_console(LogChannel channel) {
  return channel == LogChannel::Print || channel == LogChannel::PrintErr;
}

} // namespace

const char* to_string(LogChannel channel) {
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

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void init_logging(bool verbose) {
  auto& s = sinks();
  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.events->set_level(level);
  s.errors->set_level(spdlog::level::info);
  s.console->set_level(spdlog::level::info);
  s.console_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.events);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

void log_to_default(LogChannel channel, const std::string& logger_name, const std::string& message) {
  auto& sink = sink_for(channel);
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  if(logger_name.empty() || is_console(channel)) {
    sink.log(level_of(channel), message);
  } else {
    sink.log(level_of(channel), fmt::format("[{}] {}", logger_name, message));
  }
}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  const auto handle = next_handle_++;
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  LogRecord record;
  record.channel = channel;
  record.message = message;
  std::vector<Listener> listeners;
  std::string name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    name = name_;
    listeners.reserve(listeners_.size());
    for(const auto& [handle, listener] : listeners_) listeners.push_back(listener);
  }
  record.source = name.empty() ? std::string(to_string(channel)) : name + ":" + to_string(channel);

  bool claimed = false;
  for(const auto& listener : listeners) {
    try {
      if(listener(record)) claimed = true;
    } catch(const std::exception& e) {
      log_to_default(LogChannel::Error, name, fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(!claimed) log_to_default(channel, name, message);
}
