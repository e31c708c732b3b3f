#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Where a line goes when no listener claims it: Print/PrintErr are bare
// console output, the rest are timestamped log lines (Error on stderr).
enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

void init_logging(bool verbose = false);
// false silences the shared sinks; listeners still see every line.
void set_log_passthrough(bool enabled);

struct LogRecord {
  std::string source;   // "<logger name>:<channel>", or just the channel
  LogChannel channel = LogChannel::Info;
  std::string message;
};

using LogListenerHandle = std::size_t;

// Named logger. Every line is offered to the registered listeners first; when
// none of them claims it the line goes to the shared stdout/stderr sinks.
class Logger {
public:
  // Returning true swallows the line.
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  void emit(LogChannel channel, const std::string& message);

private:
  mutable std::mutex mutex_;
  std::string name_;
  std::map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_handle_{1};
};

// Shared sinks, bypassing any Logger.
void log_to_default(LogChannel channel, const std::string& logger_name, const std::string& message);

// Free functions for code that may or may not own a Logger.
template<typename... Args>
void log_to(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->emit(channel, message);
  } else {
    log_to_default(channel, std::string(), message);
  }
}

template<typename... Args>
void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
