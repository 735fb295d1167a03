#include "config.hpp"

#include <stdexcept>

#include "settings_manager.hpp"

namespace {

std::size_t get_count(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<int64_t>(key);
  if(value < 0) throw std::invalid_argument(key + " must not be negative");
  return static_cast<std::size_t>(value);
}

std::chrono::milliseconds get_millis(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<int64_t>(key);
  if(value < 0) throw std::invalid_argument(key + " must not be negative");
  return std::chrono::milliseconds(value);
}

} // namespace

ClientConfig client_config_from(const SettingsManager& settings) {
  ClientConfig config;
  config.server_url = SettingsManager::trim_copy(settings.get<std::string>("server_url"));
  if(config.server_url.rfind("http://", 0) != 0) {
    throw std::invalid_argument("server_url must start with http:// (got '" + config.server_url + "')");
  }
  auto content = settings.get<std::string>("content_dir");
  if(content.empty()) throw std::invalid_argument("content_dir must not be empty");
  config.content_dir = content;

  auto strategy = settings.get<std::string>("strategy");
  auto kind = parse_strategy_kind(strategy);
  if(!kind) throw std::invalid_argument("unknown strategy '" + strategy + "'");
  config.strategy = *kind;

  config.request_timeout = get_millis(settings, "request_timeout_ms");
  config.max_retries = get_count(settings, "max_retries");
  config.max_workers = get_count(settings, "max_workers");
  config.chunk_size = get_count(settings, "chunk_size");
  config.resume_enabled = settings.get<bool>("resume_enabled");
  config.backoff_base = get_millis(settings, "backoff_base_ms");
  config.backoff_max = get_millis(settings, "backoff_max_ms");
  if(config.backoff_max < config.backoff_base) {
    throw std::invalid_argument("backoff_max_ms must be >= backoff_base_ms");
  }
  config.max_mismatch_cycles = get_count(settings, "max_mismatch_cycles");
  config.critical_files = settings.get<std::vector<std::string>>("critical_files");
  config.probe_retries = get_count(settings, "probe_retries");
  config.probe_bytes = get_count(settings, "probe_bytes");
  config.delete_extraneous = settings.get<bool>("delete_extraneous");
  config.dry_run = settings.get<bool>("dry_run");
  config.verbose = settings.get<bool>("verbose");
  config.log_file = settings.get<std::string>("log_file");
  return config;
}

ServerConfig server_config_from(const SettingsManager& settings) {
  ServerConfig config;
  auto port = settings.get<int64_t>("listen_port");
  if(port < 0 || port > 65535) {
    throw std::invalid_argument("listen_port out of range: " + std::to_string(port));
  }
  config.listen_port = static_cast<uint16_t>(port);
  config.listen_ip = SettingsManager::trim_copy(settings.get<std::string>("listen_ip"));
  if(config.listen_ip.empty()) throw std::invalid_argument("listen_ip must not be empty");

  auto served = settings.get<std::string>("served_dir");
  if(served.empty()) throw std::invalid_argument("served_dir must not be empty");
  config.served_dir = served;

  config.monitoring = settings.get<bool>("monitoring");
  config.debounce = get_millis(settings, "debounce_ms");
  config.rescan_interval = get_millis(settings, "rescan_interval_ms");
  config.scan_interval = get_millis(settings, "scan_interval_ms");
  config.speedtest_bytes = get_count(settings, "speedtest_bytes");
  config.io_threads = get_count(settings, "io_threads");
  config.verbose = settings.get<bool>("verbose");
  config.log_file = settings.get<std::string>("log_file");
  return config;
}

LogOptions log_options_for(bool verbose, const std::filesystem::path& log_file) {
  LogOptions options;
  options.verbose = verbose;
  options.log_file = log_file;
  return options;
}
