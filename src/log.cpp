#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

// One spdlog logger per destination; the optional file sink is shared by
// the timestamped ones.
struct Sinks {
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
  std::shared_ptr<spdlog::logger> plain;
  std::shared_ptr<spdlog::sinks::sink> file;
};

std::mutex g_sinks_mutex;
Sinks g_sinks;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console(const char* name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

Sinks& sinks_locked() {
  if(!g_sinks.out) {
    const char* stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.out = make_console("modsync.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), stamped);
    g_sinks.err = make_console("modsync.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), stamped);
    g_sinks.plain = make_console("modsync.plain", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    g_sinks.out->flush_on(spdlog::level::info);
    g_sinks.err->flush_on(spdlog::level::warn);
    g_sinks.plain->flush_on(spdlog::level::info);
  }
  return g_sinks;
}

} // namespace

const char* channel_name(LogSeverity severity) {
  switch(severity) {
    case LogSeverity::Debug: return "debug";
    case LogSeverity::Info:  return "info";
    case LogSeverity::Warn:  return "warn";
    case LogSeverity::Error: return "error";
    case LogSeverity::Print: return "print";
  }
  return "info";
}

spdlog::level::level_enum spdlog_level(LogSeverity severity) {
  switch(severity) {
    case LogSeverity::Debug: return spdlog::level::debug;
    case LogSeverity::Warn:  return spdlog::level::warn;
    case LogSeverity::Error: return spdlog::level::err;
    case LogSeverity::Info:
    case LogSeverity::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

void init_logging(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  auto& sinks = sinks_locked();

  const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.out->set_level(level);
  sinks.err->set_level(spdlog::level::warn);
  sinks.plain->set_level(spdlog::level::info);

  if(!options.log_file.empty() && !sinks.file) {
    std::error_code ec;
    if(options.log_file.has_parent_path()) {
      std::filesystem::create_directories(options.log_file.parent_path(), ec);
    }
    try {
      auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.log_file.string(), options.log_file_max_bytes, options.log_file_count);
      file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.out->sinks().push_back(file);
      sinks.err->sinks().push_back(file);
      sinks.file = std::move(file);
    } catch(const spdlog::spdlog_ex& e) {
      sinks.err->error("Unable to open log file {}: {}", options.log_file.string(), e.what());
    }
  }

  spdlog::set_default_logger(sinks.out);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void emit_log(LogSeverity severity, const std::string& logger_name, const std::string& message) {
  if(!log_passthrough()) return;

  std::shared_ptr<spdlog::logger> target;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    auto& sinks = sinks_locked();
    switch(severity) {
      case LogSeverity::Print: target = sinks.plain; break;
      case LogSeverity::Warn:
      case LogSeverity::Error: target = sinks.err; break;
      default:                 target = sinks.out; break;
    }
  }
  if(severity == LogSeverity::Print || logger_name.empty()) {
    target->log(spdlog_level(severity), message);
  } else {
    target->log(spdlog_level(severity), "[{}] {}", logger_name, message);
  }
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

void Logger::publish(LogSeverity severity, const std::string& message) {
  if(notify_listeners(severity, message)) return;
  emit_log(severity, name_, message);
}

bool Logger::notify_listeners(LogSeverity severity, const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    for(const auto& entry : listeners_) bindings.push_back(entry.second);
  }
  const std::string channel = name_.empty() ? channel_name(severity)
                                            : name_ + ":" + channel_name(severity);
  bool consumed = false;
  for(const auto& binding : bindings) {
    try {
      consumed = binding.callback(binding.user_data, channel, spdlog_level(severity), message) || consumed;
    } catch(const std::exception& e) {
      emit_log(LogSeverity::Error, name_, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return consumed;
}
