#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Diagnostic channels carry a timestamp and the component name; Print and
// PrintErr are the command's own output and go out verbatim.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* log_channel_label(LogChannel channel);

struct LogRecord {
  std::string component;
  LogChannel channel = LogChannel::Info;
  std::string message;
};

// Configures console levels once per process. With a log file every channel
// is also written there at debug level, whatever verbose says.
void init(bool verbose = false, const std::string& log_file = std::string());

// Off while tests capture output through listeners.
void set_log_passthrough(bool enabled);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true keeps the record off the console.
  using Listener = std::function<bool(const LogRecord&)>;

  explicit Logger(std::string component = std::string());

  const std::string& component() const { return component_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
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
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogRecord{component_, channel, fmt::format(fmt, std::forward<Args>(args)...)});
  }

  void emit(const LogRecord& record);

  std::string component_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_listener_ = 1;
};

namespace detail {
void write_console(const LogRecord& record);
} // namespace detail

// For code that runs before any component logger exists (argument parsing,
// settings files). A null logger writes straight to the console.
template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console(LogRecord{std::string(), LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console(LogRecord{std::string(), LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}
