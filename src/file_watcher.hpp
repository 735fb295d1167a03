#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "log.hpp"

class ManifestService;

// Watches the served directory and drives ManifestService rebuilds.
//
// With inotify available every mutation marks the manifest stale and pushes a
// debounce deadline forward; one rebuild runs once the directory has been
// quiet for the whole window. If inotify cannot be used or breaks at runtime
// (queue overflow, root removed, read error) the watcher keeps going as a
// polling rescan loop.
class FileWatcher {
public:
  struct Options {
    std::chrono::milliseconds debounce{500};
    std::chrono::milliseconds rescan_interval{30000};
    std::chrono::milliseconds scan_interval{300000}; // 0 = no safety rescan
    bool force_polling = false;
  };

  enum class Mode { Stopped, Inotify, Polling };

  FileWatcher(ManifestService& service, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~FileWatcher();

  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  void start();
  void stop();

  Mode mode() const { return mode_.load(); }
  uint64_t events_seen() const { return events_seen_.load(); }
  uint64_t rebuilds_triggered() const { return rebuilds_triggered_.load(); }

private:
  void run();
  void run_inotify();
  void run_polling();

  bool open_inotify();
  void close_inotify();
  bool add_watch_tree(const std::filesystem::path& dir);
  // Returns false when the watch is no longer trustworthy.
  bool drain_events(bool& saw_mutation);
  void trigger_rebuild(const char* reason);
  bool wait_stop_for(std::chrono::milliseconds delay);

  ManifestService& service_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::atomic<Mode> mode_{Mode::Stopped};
  std::atomic<uint64_t> events_seen_{0};
  std::atomic<uint64_t> rebuilds_triggered_{0};

  int inotify_fd_ = -1;
  int root_wd_ = -1;
  std::unordered_map<int, std::filesystem::path> watches_;
};

const char* to_string(FileWatcher::Mode mode);
