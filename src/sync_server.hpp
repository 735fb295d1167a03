#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "connection.hpp"
#include "file_watcher.hpp"
#include "http.hpp"
#include "log.hpp"
#include "manifest_service.hpp"

// HTTP front of the server: owns the manifest service, the optional file
// watcher and an io_context run by a small thread pool.
class SyncServer {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 8000;
    std::filesystem::path served_dir;
    bool monitoring = true;
    FileWatcher::Options watcher;
    uint64_t speedtest_bytes = 1024 * 1024;
    std::size_t io_threads = 4;
    std::chrono::milliseconds io_timeout{30000};
  };

  static constexpr uint64_t kMaxSpeedtestBytes = 100ull * 1024 * 1024;

  explicit SyncServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~SyncServer();

  // Publishes the first manifest, binds the listener and starts monitoring.
  void start();
  void start_background();
  void stop();

  HttpReply handle(const HttpRequest& request);

  struct Stats {
    uint64_t requests = 0;
    uint64_t manifest_version = 0;
    std::size_t files = 0;
    uint64_t total_bytes = 0;
    FileWatcher::Mode watch_mode = FileWatcher::Mode::Stopped;
  };

  Stats stats() const;

  uint16_t listen_port() const { return listen_port_; }
  ManifestService& manifest_service() { return *manifest_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  HttpReply serve_index(const ManifestSnapshot& manifest) const;
  HttpReply serve_manifest(const ManifestSnapshot& manifest) const;
  HttpReply serve_file(const HttpRequest& request) const;
  HttpReply serve_speedtest(const HttpRequest& request) const;
  HttpReply serve_status() const;
  HttpReply serve_force_scan();

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<ManifestService> manifest_;
  std::unique_ptr<FileWatcher> watcher_;
  Connection::Router router_;

  asio::io_context io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
  std::atomic<uint64_t> requests_{0};
  std::chrono::steady_clock::time_point started_at_{};
};
