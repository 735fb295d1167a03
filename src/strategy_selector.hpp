#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "connection_probe.hpp"

enum class StrategyKind {
  StableSequential,
  GamingPriority,
  BalancedAdaptive,
  FastOptimized,
  AdaptiveAuto
};

enum class TaskOrdering {
  Sequential,     // manifest order
  SizeAscending,
  SizeDescending,
  PriorityList    // critical files first, then ascending size
};

const char* to_string(StrategyKind kind);
const char* to_string(TaskOrdering ordering);

// Accepts "auto", "stable", "gaming", "balanced", "fast" (case-insensitive).
std::optional<StrategyKind> parse_strategy_kind(const std::string& name);

// Size distribution of the pending file set.
struct SizeHistogram {
  static constexpr uint64_t kTinyLimit = 100 * 1024;
  static constexpr uint64_t kSmallLimit = 1024 * 1024;
  static constexpr uint64_t kMediumLimit = 10 * 1024 * 1024;

  std::size_t tiny_count = 0;
  std::size_t small_count = 0;
  std::size_t medium_count = 0;
  std::size_t huge_count = 0;
  uint64_t tiny_bytes = 0;
  uint64_t small_bytes = 0;
  uint64_t medium_bytes = 0;
  uint64_t huge_bytes = 0;

  void add(uint64_t size);
  std::size_t total_count() const { return tiny_count + small_count + medium_count + huge_count; }
  uint64_t total_bytes() const { return tiny_bytes + small_bytes + medium_bytes + huge_bytes; }

  // A handful of huge files carry at least three quarters of the bytes.
  bool dominated_by_large() const;

  static SizeHistogram from_sizes(const std::vector<uint64_t>& sizes);
};

struct StrategyConfig {
  StrategyKind kind = StrategyKind::StableSequential;
  std::size_t workers = 1;
  std::size_t chunk_size = 16 * 1024;
  TaskOrdering ordering = TaskOrdering::Sequential;
  bool resume_enabled = true;
  // Files of at least segment_threshold bytes are fetched as up to
  // segments_per_file parallel ranges; 0 disables splitting.
  std::size_t segments_per_file = 1;
  uint64_t segment_threshold = 0;
  std::vector<std::string> critical_files;
  bool selected_automatically = false;

  bool operator==(const StrategyConfig& o) const;
  bool operator!=(const StrategyConfig& o) const { return !(*this == o); }
};

struct StrategyOptions {
  StrategyKind requested = StrategyKind::AdaptiveAuto;
  std::size_t cpu_count = 1;
  std::size_t max_workers = 8;
  std::size_t chunk_size = 0;  // 0 = strategy default
  bool resume_enabled = true;
  std::vector<std::string> critical_files;
};

// Policy of one concrete strategy. AdaptiveAuto is not concrete and maps to
// BalancedAdaptive here; use select_strategy() to resolve it.
StrategyConfig make_strategy(StrategyKind kind, const StrategyOptions& options);

// Deterministic: the same profile, histogram and options always give the same
// configuration.
StrategyConfig select_strategy(const ConnectionProfile& profile,
                               const SizeHistogram& histogram,
                               const StrategyOptions& options);
