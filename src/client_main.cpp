#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <stdexcept>
#include <thread>

#include "command_line_parser.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_session.hpp"

namespace {

// Plain-text progress reporting for the console.
void report_event(Logger& logger, const SyncEvent& event) {
  switch(event.type) {
    case SyncEvent::Type::Started:
      logger.debug("[start] {} ({} bytes)", event.path, event.bytes_total);
      break;
    case SyncEvent::Type::Progress:
      if(event.bytes_total > 0) {
        logger.debug("[{:3}%] {}", event.bytes_done * 100 / event.bytes_total, event.path);
      }
      break;
    case SyncEvent::Type::Retrying:
      logger.print("[retry] {} attempt {}: {}", event.path, event.attempt, event.message);
      break;
    case SyncEvent::Type::Mismatch:
      logger.print("[mismatch] {}: {}", event.path, event.message);
      break;
    case SyncEvent::Type::Verified:
      logger.print("[ok] {}", event.path);
      break;
    case SyncEvent::Type::Failed:
      logger.print("[failed] {}: {}", event.path, event.message);
      break;
    case SyncEvent::Type::Quarantined:
      logger.print("[quarantined] {}: {}", event.path, event.message);
      break;
    case SyncEvent::Type::Cancelled:
      logger.print("[cancelled] {}", event.path);
      break;
  }
}

void print_summary(Logger& logger, const SyncReport& report) {
  logger.print("");
  logger.print("Manifest version {} ({} files)", report.manifest_version, report.manifest_files);
  if(report.scheduled > 0) {
    logger.print("Connection: {} ({:.1f} ms, {:.1f} KiB/s){}", to_string(report.profile.tier),
                 report.profile.latency_ms, report.profile.throughput_bps / 1024.0,
                 report.profile.degraded ? " [probe failed]" : "");
    logger.print("Strategy: {} ({} workers)", to_string(report.strategy.kind), report.strategy.workers);
  }
  logger.print("Up to date: {}, scheduled: {}, transferred: {} bytes",
               report.already_verified, report.scheduled, report.bytes_transferred);
  if(report.extraneous_removed > 0) {
    logger.print("Removed {} extraneous files", report.extraneous_removed);
  }
  for(const auto& path : report.problem_files) {
    const auto& result = report.outcomes.at(path);
    logger.print("  {} {}: {}", to_string(result.outcome), path, result.last_error);
  }
  if(report.cancelled) logger.print("Sync cancelled; partial downloads were kept");
}

// Runs the signal handlers; stopped and joined on every exit path.
class SignalThread {
public:
  explicit SignalThread(asio::io_context& io) : io_(io), thread_([this]{ io_.run(); }) {}
  ~SignalThread() {
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

private:
  asio::io_context& io_;
  std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
  try {
    init_logging();
    SettingsManager settings(CLIENT_SETTINGS_SPECIFICATION);
    settings.set_settings_path(std::filesystem::current_path() / ".modsync" / "client.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "modsync_client",
                             "synchronise a local directory with a modsync server",
                             CLIENT_SETTINGS_SPECIFICATION, CLIENT_ARGV_SPECIFICATION);
    ClientConfig config;
    try {
      parser.parse(argc, argv, settings);
      if(settings.help_requested()) {
        parser.usage();
        return 0;
      }
      config = client_config_from(settings);
    } catch(const std::invalid_argument& e) {
      log_error(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }

    init_logging(log_options_for(config.verbose, config.log_file));
    auto logger = std::make_shared<Logger>("client");
    if(settings.save_requested()) {
      if(settings.save()) {
        logger->info("Settings saved to {}", settings.settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    SyncSession session(config, logger);
    session.set_event_sink([&](const SyncEvent& event){ report_event(*logger, event); });

    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int){
      if(ec) return;
      logger->warn("Interrupted, finishing current chunks");
      session.cancel();
    });
    SignalThread signal_thread(signals_io);

    SyncReport report;
    try {
      report = session.run();
    } catch(const TransportError& e) {
      logger->error("Cannot reach {}: {}", config.server_url, e.what());
      return 1;
    } catch(const ManifestError& e) {
      logger->error("Server sent an unusable manifest: {}", e.what());
      return 1;
    }

    print_summary(*logger, report);
    if(report.cancelled) return 130;
    return report.succeeded() ? 0 : 2;
  } catch(std::exception& e) {
    Logger logger("client-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
