#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <stdexcept>

#include "command_line_parser.hpp"
#include "config.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_server.hpp"

int main(int argc, char** argv) {
  try {
    init_logging();
    SettingsManager settings(SERVER_SETTINGS_SPECIFICATION);
    settings.set_settings_path(std::filesystem::current_path() / ".modsync" / "server.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "modsync_server",
                             "publish a directory to modsync clients",
                             SERVER_SETTINGS_SPECIFICATION, SERVER_ARGV_SPECIFICATION);
    ServerConfig config;
    try {
      parser.parse(argc, argv, settings);
      if(settings.help_requested()) {
        parser.usage();
        return 0;
      }
      config = server_config_from(settings);
    } catch(const std::invalid_argument& e) {
      log_error(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }

    init_logging(log_options_for(config.verbose, config.log_file));
    auto logger = std::make_shared<Logger>("server");
    if(settings.save_requested()) {
      if(settings.save()) {
        logger->info("Settings saved to {}", settings.settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    SyncServer::Options options;
    options.listen_ip = config.listen_ip;
    options.listen_port = config.listen_port;
    options.served_dir = config.served_dir;
    options.monitoring = config.monitoring;
    options.watcher.debounce = config.debounce;
    options.watcher.rescan_interval = config.rescan_interval;
    options.watcher.scan_interval = config.scan_interval;
    options.speedtest_bytes = config.speedtest_bytes;
    options.io_threads = config.io_threads;

    SyncServer server(options, logger);
    server.start_background();
    logger->print("Serving {} on http://{}:{}", std::filesystem::absolute(config.served_dir).string(),
                  config.listen_ip, server.listen_port());

    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signal_number){
      if(!ec) logger->info("Signal {} received, shutting down", signal_number);
    });
    signals_io.run();

    server.stop();
    return 0;
  } catch(std::exception& e) {
    Logger logger("server-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
