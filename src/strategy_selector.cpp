#include "strategy_selector.hpp"

#include <algorithm>

#include "settings_manager.hpp"

namespace {

constexpr uint64_t kSegmentThreshold = 8ull * 1024 * 1024;
constexpr std::size_t kLargeDominationMaxFiles = 8;

} // namespace

const char* to_string(StrategyKind kind) {
  switch(kind) {
    case StrategyKind::StableSequential: return "stable";
    case StrategyKind::GamingPriority:   return "gaming";
    case StrategyKind::BalancedAdaptive: return "balanced";
    case StrategyKind::FastOptimized:    return "fast";
    case StrategyKind::AdaptiveAuto:     return "auto";
  }
  return "unknown";
}

const char* to_string(TaskOrdering ordering) {
  switch(ordering) {
    case TaskOrdering::Sequential:     return "sequential";
    case TaskOrdering::SizeAscending:  return "size-ascending";
    case TaskOrdering::SizeDescending: return "size-descending";
    case TaskOrdering::PriorityList:   return "priority-list";
  }
  return "unknown";
}

std::optional<StrategyKind> parse_strategy_kind(const std::string& name) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(name));
  for(auto kind : {StrategyKind::AdaptiveAuto, StrategyKind::StableSequential,
                   StrategyKind::GamingPriority, StrategyKind::BalancedAdaptive,
                   StrategyKind::FastOptimized}) {
    if(lowered == to_string(kind)) return kind;
  }
  return std::nullopt;
}

void SizeHistogram::add(uint64_t size) {
  if(size < kTinyLimit) {
    ++tiny_count;
    tiny_bytes += size;
  } else if(size < kSmallLimit) {
    ++small_count;
    small_bytes += size;
  } else if(size < kMediumLimit) {
    ++medium_count;
    medium_bytes += size;
  } else {
    ++huge_count;
    huge_bytes += size;
  }
}

bool SizeHistogram::dominated_by_large() const {
  if(huge_count == 0 || huge_count > kLargeDominationMaxFiles) return false;
  return huge_bytes * 4 >= total_bytes() * 3;
}

SizeHistogram SizeHistogram::from_sizes(const std::vector<uint64_t>& sizes) {
  SizeHistogram histogram;
  for(auto size : sizes) histogram.add(size);
  return histogram;
}

bool StrategyConfig::operator==(const StrategyConfig& o) const {
  return kind == o.kind && workers == o.workers && chunk_size == o.chunk_size &&
         ordering == o.ordering && resume_enabled == o.resume_enabled &&
         segments_per_file == o.segments_per_file && segment_threshold == o.segment_threshold &&
         critical_files == o.critical_files && selected_automatically == o.selected_automatically;
}

StrategyConfig make_strategy(StrategyKind kind, const StrategyOptions& options) {
  const std::size_t cpus = std::max<std::size_t>(1, options.cpu_count);
  StrategyConfig config;
  config.kind = kind;
  switch(kind) {
    case StrategyKind::StableSequential:
      config.workers = 1;
      config.ordering = TaskOrdering::Sequential;
      config.chunk_size = 16 * 1024;
      break;
    case StrategyKind::GamingPriority:
      config.workers = 2;
      config.ordering = TaskOrdering::PriorityList;
      config.chunk_size = 64 * 1024;
      config.critical_files = options.critical_files;
      break;
    case StrategyKind::FastOptimized:
      config.workers = std::min<std::size_t>(8, std::max<std::size_t>(2, 2 * cpus));
      config.ordering = TaskOrdering::SizeDescending;
      config.chunk_size = 256 * 1024;
      config.segment_threshold = kSegmentThreshold;
      break;
    case StrategyKind::BalancedAdaptive:
    case StrategyKind::AdaptiveAuto:
      config.kind = StrategyKind::BalancedAdaptive;
      config.workers = std::min<std::size_t>(4, cpus);
      config.ordering = TaskOrdering::SizeAscending;
      config.chunk_size = 64 * 1024;
      break;
  }

  if(options.max_workers > 0) config.workers = std::min(config.workers, options.max_workers);
  config.workers = std::max<std::size_t>(1, config.workers);
  if(config.segment_threshold > 0) config.segments_per_file = config.workers;
  if(options.chunk_size > 0) config.chunk_size = options.chunk_size;
  config.resume_enabled = options.resume_enabled;
  return config;
}

StrategyConfig select_strategy(const ConnectionProfile& profile,
                               const SizeHistogram& histogram,
                               const StrategyOptions& options) {
  if(options.requested != StrategyKind::AdaptiveAuto) {
    return make_strategy(options.requested, options);
  }

  StrategyKind chosen = StrategyKind::BalancedAdaptive;
  switch(profile.tier) {
    case QualityTier::Poor:
      chosen = StrategyKind::StableSequential;
      break;
    case QualityTier::Excellent:
      chosen = StrategyKind::FastOptimized;
      break;
    case QualityTier::Good:
      chosen = histogram.dominated_by_large() ? StrategyKind::FastOptimized
                                              : StrategyKind::BalancedAdaptive;
      break;
    case QualityTier::Fair:
      chosen = StrategyKind::BalancedAdaptive;
      break;
  }
  auto config = make_strategy(chosen, options);
  config.selected_automatically = true;
  return config;
}
