#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "connection_probe.hpp"
#include "download_manager.hpp"
#include "http_client.hpp"
#include "local_state.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "strategy_selector.hpp"

struct SyncReport {
  uint64_t manifest_version = 0;
  std::size_t manifest_files = 0;
  ConnectionProfile profile;
  StrategyConfig strategy;
  std::size_t already_verified = 0;
  std::size_t scheduled = 0;          // missing or mismatched before the run
  std::size_t extraneous_removed = 0;
  std::vector<std::string> extraneous; // listed, kept unless delete_extraneous
  std::map<std::string, TaskResult> outcomes;
  std::vector<std::string> problem_files;
  uint64_t bytes_transferred = 0;
  bool dry_run = false;
  bool cancelled = false;

  bool succeeded() const { return !cancelled && problem_files.empty(); }
};

// One client synchronisation: manifest, local scan, probe, strategy,
// downloads. Throws TransportError if the manifest cannot be fetched.
class SyncSession {
public:
  using EventSink = std::function<void(const SyncEvent& event)>;

  explicit SyncSession(ClientConfig config, std::shared_ptr<Logger> logger = nullptr);

  SyncReport run();

  // Safe from any thread, including before run() reaches the download phase.
  void cancel();

  // Receives download events as they are drained during run().
  void set_event_sink(EventSink sink) { event_sink_ = std::move(sink); }

  Manifest fetch_manifest();

private:
  void pump_events(DownloadManager& manager);

  ClientConfig config_;
  std::shared_ptr<Logger> logger_;
  HttpClient client_;
  EventSink event_sink_;

  std::mutex cancel_mutex_;
  bool cancelled_ = false;
  DownloadManager* active_ = nullptr;
  CancelToken wait_token_;
};
