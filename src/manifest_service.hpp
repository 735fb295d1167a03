#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "log.hpp"
#include "manifest.hpp"

// Owns the authoritative manifest of one served directory.
//
// Readers call current() and keep the returned snapshot for as long as they
// need it; rebuild() scans without holding the snapshot lock and publishes
// the new manifest with a single pointer swap, so a reader sees either the
// old or the new manifest in full and never waits for a scan.
class ManifestService {
public:
  struct Options {
    std::filesystem::path root;
    std::size_t max_scan_attempts = 3;
  };

  struct Stats {
    uint64_t rebuilds = 0;
    uint64_t failed_rebuilds = 0;
    std::chrono::milliseconds last_duration{0};
    std::chrono::system_clock::time_point last_rebuild{};
    std::string last_error;
  };

  explicit ManifestService(Options options, std::shared_ptr<Logger> logger = nullptr);

  ManifestSnapshot current() const;
  uint64_t version() const { return current()->version(); }

  // Scans the directory and publishes a new snapshot. Returns false when the
  // scan was aborted; the previous snapshot then stays published.
  bool rebuild();

  // Filesystem activity observed by a watcher. A scan that overlaps a
  // mutation is repeated before it is published.
  void note_mutation();
  bool rebuild_pending() const { return pending_.load(std::memory_order_acquire); }

  Stats stats() const;
  const std::filesystem::path& root() const { return options_.root; }

  // Names that never enter the manifest: hidden entries, in-flight uploads,
  // partial downloads, speed-test payloads and the manifest file itself.
  static bool is_ignored_name(const std::string& filename);
  static bool is_ignored(const std::filesystem::path& relative_path);

private:
  enum class ScanStatus { Complete, Unstable, Failed };

  struct ScanResult {
    ScanStatus status = ScanStatus::Failed;
    Manifest::Entries entries;
    std::string error;
    std::size_t skipped = 0;
  };

  ScanResult scan(const Manifest& previous) const;
  void publish(Manifest::Entries entries);
  void record_failure(const std::string& error);

  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex snapshot_mutex_;
  ManifestSnapshot snapshot_;

  std::mutex rebuild_mutex_;
  std::atomic<uint64_t> generation_{0};
  std::atomic<bool> pending_{false};

  mutable std::mutex stats_mutex_;
  Stats stats_;
};
