#include "manifest_service.hpp"

#include <system_error>

#include "hashing.hpp"

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct FileStamp {
  uint64_t size = 0;
  int64_t mtime = 0;
  bool operator==(const FileStamp& o) const { return size == o.size && mtime == o.mtime; }
  bool operator!=(const FileStamp& o) const { return !(*this == o); }
};

std::optional<FileStamp> stamp_of(const fs::path& file) {
  std::error_code ec;
  auto size = fs::file_size(file, ec);
  if(ec) return std::nullopt;
  auto mtime = fs::last_write_time(file, ec);
  if(ec) return std::nullopt;
  return FileStamp{static_cast<uint64_t>(size),
                   static_cast<int64_t>(mtime.time_since_epoch().count())};
}

} // namespace

ManifestService::ManifestService(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("manifest")),
    snapshot_(std::make_shared<const Manifest>()) {
  if(options_.max_scan_attempts == 0) options_.max_scan_attempts = 1;
}

ManifestSnapshot ManifestService::current() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

void ManifestService::note_mutation() {
  generation_.fetch_add(1, std::memory_order_acq_rel);
  pending_.store(true, std::memory_order_release);
}

ManifestService::Stats ManifestService::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

bool ManifestService::is_ignored_name(const std::string& filename) {
  if(filename.empty()) return true;
  if(filename.front() == '.') return true;
  if(ends_with(filename, ".filepart") || ends_with(filename, ".part")) return true;
  if(filename == "hashes.json") return true;
  if(filename.rfind("speed_test_", 0) == 0 && ends_with(filename, ".bin")) return true;
  return false;
}

bool ManifestService::is_ignored(const fs::path& relative_path) {
  for(const auto& part : relative_path) {
    if(is_ignored_name(part.string())) return true;
  }
  return false;
}

bool ManifestService::rebuild() {
  std::lock_guard<std::mutex> writer(rebuild_mutex_);
  pending_.store(false, std::memory_order_release);

  const auto started = std::chrono::steady_clock::now();
  const auto previous = current();

  for(std::size_t attempt = 1; attempt <= options_.max_scan_attempts; ++attempt) {
    const auto generation_before = generation_.load(std::memory_order_acquire);
    auto result = scan(*previous);

    if(result.status == ScanStatus::Failed) {
      logger_->error("Rebuild aborted, keeping manifest v{}: {}", previous->version(), result.error);
      record_failure(result.error);
      return false;
    }

    const bool raced = generation_.load(std::memory_order_acquire) != generation_before;
    if(result.status == ScanStatus::Unstable || raced) {
      logger_->debug("Directory changed during scan (attempt {}/{}), rescanning",
                     attempt, options_.max_scan_attempts);
      continue;
    }

    const auto file_count = result.entries.size();
    publish(std::move(result.entries));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.rebuilds;
      stats_.last_duration = elapsed;
      stats_.last_rebuild = std::chrono::system_clock::now();
      stats_.last_error.clear();
    }
    logger_->info("Manifest v{} published: {} files ({} skipped) in {} ms",
                  version(), file_count, result.skipped, elapsed.count());
    return true;
  }

  // Still churning: keep the old snapshot and let the next trigger retry.
  pending_.store(true, std::memory_order_release);
  record_failure("directory kept changing during scan");
  logger_->warn("Rebuild deferred: directory kept changing during {} scans", options_.max_scan_attempts);
  return false;
}

void ManifestService::publish(Manifest::Entries entries) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  auto next = std::make_shared<const Manifest>(std::move(entries), snapshot_->version() + 1);
  snapshot_ = std::move(next);
}

void ManifestService::record_failure(const std::string& error) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.failed_rebuilds;
  stats_.last_error = error;
}

ManifestService::ScanResult ManifestService::scan(const Manifest& previous) const {
  ScanResult result;
  std::error_code ec;

  if(!fs::is_directory(options_.root, ec)) {
    result.error = "cannot enumerate " + options_.root.string() +
                   (ec ? ": " + ec.message() : ": not a directory");
    return result;
  }

  fs::recursive_directory_iterator it(options_.root, fs::directory_options::none, ec);
  if(ec) {
    result.error = "cannot enumerate " + options_.root.string() + ": " + ec.message();
    return result;
  }

  const fs::recursive_directory_iterator end;
  while(it != end) {
    const fs::directory_entry entry = *it;
    const auto name = entry.path().filename().string();

    std::error_code type_ec;
    const bool is_directory = entry.is_directory(type_ec);
    if(is_directory && is_ignored_name(name)) it.disable_recursion_pending();

    // A failed increment also turns the iterator into end; check the error
    // first so a partial walk is never published.
    it.increment(ec);
    if(ec) {
      result.error = "enumeration failed after " + entry.path().string() + ": " + ec.message();
      return result;
    }

    if(is_directory || !entry.is_regular_file(type_ec)) continue;
    if(is_ignored_name(name)) {
      ++result.skipped;
      continue;
    }

    const auto relative = entry.path().lexically_relative(options_.root).generic_string();
    if(!is_valid_utf8(relative)) {
      logger_->warn("Skipping {}: name is not valid UTF-8", relative);
      ++result.skipped;
      continue;
    }
    auto before = stamp_of(entry.path());
    if(!before) {
      // Vanished between listing and stat.
      result.status = ScanStatus::Unstable;
      return result;
    }

    auto prior = previous.entries().find(relative);
    if(prior != previous.entries().end() &&
       prior->second.size == before->size && prior->second.mtime == before->mtime) {
      result.entries.emplace(relative, prior->second);
      continue;
    }

    auto hash = sha256_file(entry.path());
    auto after = stamp_of(entry.path());
    if(!after || *after != *before) {
      result.status = ScanStatus::Unstable;
      return result;
    }
    if(!hash) {
      logger_->warn("Skipping unreadable file {}", relative);
      ++result.skipped;
      continue;
    }
    result.entries.emplace(relative, ManifestEntry{*hash, before->size, before->mtime});
  }

  result.status = ScanStatus::Complete;
  return result;
}
