#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

struct LogOptions {
  bool verbose = false;
  std::filesystem::path log_file;          // empty = console only
  std::size_t log_file_max_bytes = 5 * 1024 * 1024;
  std::size_t log_file_count = 3;
};

// Debug and Info go to stdout, Warn and Error to stderr, Print to stdout
// without timestamp or logger name.
enum class LogSeverity { Debug, Info, Warn, Error, Print };

const char* channel_name(LogSeverity severity);
spdlog::level::level_enum spdlog_level(LogSeverity severity);

// Safe to call more than once; the log file sink is attached on first use.
void init_logging(const LogOptions& options = LogOptions{});

// When off, messages reach listeners only (tests use this to keep output
// quiet unless something fails).
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Writes to the process-wide sinks; `logger_name` may be empty.
void emit_log(LogSeverity severity, const std::string& logger_name, const std::string& message);

using LogListenerHandle = std::size_t;

// Named logger. Listeners see every message first and may consume it; what
// nobody consumes goes to the shared spdlog sinks prefixed with the name.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogSeverity severity, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    publish(severity, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogSeverity::Debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogSeverity::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogSeverity::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogSeverity::Error, fmt, std::forward<Args>(args)...);
  }
  // Report and usage text.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogSeverity::Print, fmt, std::forward<Args>(args)...);
  }

  void publish(LogSeverity severity, const std::string& message);

private:
  bool notify_listeners(LogSeverity severity, const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// For code that may run without an owning Logger (settings, caches, usage).
template<typename... Args>
inline void log_at(LogSeverity severity, Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->publish(severity, message);
  } else {
    emit_log(severity, std::string(), message);
  }
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(LogSeverity::Info, logger, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(LogSeverity::Warn, logger, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(LogSeverity::Error, logger, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(LogSeverity::Debug, logger, fmt, std::forward<Args>(args)...);
}
template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(LogSeverity::Print, logger, fmt, std::forward<Args>(args)...);
}
