#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <vector>

namespace {

constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// One spdlog logger per destination. Diagnostics share stdout, errors go to
// stderr, and the plain pair carries command output.
struct Destinations {
  std::shared_ptr<spdlog::logger> diagnostics;
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;

  std::vector<spdlog::logger*> all() const {
    return {diagnostics.get(), errors.get(), out.get(), err.get()};
  }
};

Destinations g_destinations;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_setup_mutex;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_destination(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

void create_destinations_locked() {
  if(g_destinations.diagnostics) return;
  g_destinations.diagnostics = make_destination(
    "onboard", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kConsolePattern);
  g_destinations.errors = make_destination(
    "onboard.error", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kConsolePattern);
  g_destinations.out = make_destination(
    "onboard.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
  g_destinations.err = make_destination(
    "onboard.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");
  g_destinations.out->flush_on(spdlog::level::info);
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info: return spdlog::level::info;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error: return spdlog::level::err;
    case LogChannel::Print: return spdlog::level::info;
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

spdlog::logger* destination_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_destinations.out.get();
    case LogChannel::PrintErr: return g_destinations.err.get();
    case LogChannel::Error: return g_destinations.errors.get();
    default: return g_destinations.diagnostics.get();
  }
}

} // namespace

const char* log_channel_label(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "unknown";
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard lg(g_setup_mutex);
  create_destinations_locked();

  const auto console_level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_destinations.diagnostics->sinks().front()->set_level(console_level);

  if(!log_file.empty() && !g_file_sink) {
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    g_file_sink->set_pattern(kFilePattern);
    g_file_sink->set_level(spdlog::level::debug);
    for(auto* logger : g_destinations.all()) {
      logger->sinks().push_back(g_file_sink);
    }
  }
  spdlog::set_default_logger(g_destinations.diagnostics);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

Logger::Logger(std::string component) : component_(std::move(component)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(const LogRecord& record) {
  std::vector<Listener> listeners;
  {
    std::lock_guard lg(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  bool swallowed = false;
  for(const auto& listener : listeners) {
    try {
      swallowed = listener(record) || swallowed;
    } catch(const std::exception& e) {
      detail::write_console(LogRecord{"log", LogChannel::Error,
                                      fmt::format("listener threw: {}", e.what())});
    }
  }
  if(!swallowed) detail::write_console(record);
}

namespace detail {

void write_console(const LogRecord& record) {
  {
    std::lock_guard lg(g_setup_mutex);
    create_destinations_locked();
  }
  if(!g_passthrough.load()) return;

  auto* destination = destination_of(record.channel);
  const auto level = level_of(record.channel);
  const bool plain = record.channel == LogChannel::Print || record.channel == LogChannel::PrintErr;
  if(plain || record.component.empty()) {
    destination->log(level, record.message);
  } else {
    destination->log(level, fmt::format("[{}] {}", record.component, record.message));
  }
}

} // namespace detail
