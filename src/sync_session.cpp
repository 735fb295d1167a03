#include "sync_session.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <system_error>
#include <thread>

#include "errors.hpp"

namespace {

constexpr std::chrono::milliseconds kEventPollSlice{100};

uint64_t parse_version(const std::string& header) {
  if(header.empty()) return 0;
  try {
    std::size_t used = 0;
    auto value = std::stoull(header, &used);
    return used == header.size() ? value : 0;
  } catch(const std::exception&) {
    return 0;
  }
}

} // namespace

SyncSession::SyncSession(ClientConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync")),
    client_(config_.server_url, HttpClient::Options{config_.request_timeout}) {}

void SyncSession::cancel() {
  std::lock_guard<std::mutex> lock(cancel_mutex_);
  cancelled_ = true;
  wait_token_.cancel();
  if(active_) active_->cancel();
}

Manifest SyncSession::fetch_manifest() {
  RetryPolicy policy{config_.max_retries, config_.backoff_base, config_.backoff_max};
  for(std::size_t attempt = 1; ; ++attempt) {
    try {
      auto response = client_.get("/hashes.json");
      auto version = parse_version(response.header("X-Manifest-Version"));
      nlohmann::json doc;
      try {
        doc = nlohmann::json::parse(response.body);
      } catch(const nlohmann::json::parse_error& e) {
        throw ManifestError(std::string("manifest is not valid JSON: ") + e.what());
      }
      auto manifest = Manifest::from_json(doc, version);
      logger_->info("Manifest v{}: {} files, {} bytes", manifest.version(),
                    manifest.file_count(), manifest.total_size());
      return manifest;
    } catch(const TransportError& e) {
      if(!e.transient() || attempt >= policy.max_attempts) throw;
      auto delay = policy.delay_for(attempt);
      logger_->warn("Manifest fetch failed: {} (retry {}/{} in {} ms)", e.what(), attempt,
                    policy.max_attempts - 1, delay.count());
      if(wait_token_.wait_for(delay)) throw TransportError("manifest fetch cancelled", false);
    }
  }
}

void SyncSession::pump_events(DownloadManager& manager) {
  while(auto event = manager.events().try_pop()) {
    if(event_sink_) event_sink_(*event);
  }
}

SyncReport SyncSession::run() {
  SyncReport report;
  report.dry_run = config_.dry_run;

  auto manifest = fetch_manifest();
  report.manifest_version = manifest.version();
  report.manifest_files = manifest.file_count();

  std::error_code ec;
  std::filesystem::create_directories(config_.content_dir, ec);
  if(ec) throw ResourceError("cannot create " + config_.content_dir.string(), ec);

  LocalState local(config_.content_dir, logger_);
  auto files = local.classify(manifest);

  report.extraneous = local.extraneous_files(manifest);
  if(!report.extraneous.empty()) {
    if(config_.delete_extraneous && !config_.dry_run) {
      report.extraneous_removed = local.delete_extraneous(manifest);
    } else {
      logger_->info("{} local files are not in the manifest", report.extraneous.size());
    }
  }

  std::vector<ModFile> pending;
  SizeHistogram histogram;
  for(auto& file : files) {
    if(file.status == ModFileStatus::Verified) {
      ++report.already_verified;
    } else {
      histogram.add(file.expected_size);
      pending.push_back(file);
    }
  }
  report.scheduled = pending.size();
  local.save_cache();

  StrategyOptions options;
  options.requested = config_.strategy;
  options.cpu_count = std::max(1u, std::thread::hardware_concurrency());
  options.max_workers = config_.max_workers;
  options.chunk_size = config_.chunk_size;
  options.resume_enabled = config_.resume_enabled;
  options.critical_files = config_.critical_files;

  if(pending.empty()) {
    logger_->info("All {} files verified; nothing to download", report.already_verified);
    report.strategy = make_strategy(options.requested, options);
    return report;
  }

  ConnectionProbe::Options probe_options;
  probe_options.retries = config_.probe_retries;
  probe_options.payload_bytes = config_.probe_bytes;
  ConnectionProbe probe(client_, probe_options, logger_);
  report.profile = probe.measure();
  report.strategy = select_strategy(report.profile, histogram, options);
  logger_->info("{} files ({} bytes) to fetch; strategy '{}'{} with {} workers",
                pending.size(), histogram.total_bytes(), to_string(report.strategy.kind),
                report.strategy.selected_automatically ? " (auto)" : "", report.strategy.workers);

  if(config_.dry_run) {
    for(const auto& file : pending) {
      logger_->print("  would fetch {} ({}, {} bytes)", file.relative_path, to_string(file.status),
                     file.expected_size);
    }
    return report;
  }

  DownloadManager::Options manager_options;
  manager_options.content_dir = config_.content_dir;
  manager_options.strategy = report.strategy;
  manager_options.retry = RetryPolicy{config_.max_retries, config_.backoff_base, config_.backoff_max};
  manager_options.max_mismatch_cycles = config_.max_mismatch_cycles;
  DownloadManager manager(manager_options, make_http_fetcher(client_), logger_);

  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if(cancelled_) manager.cancel();
    active_ = &manager;
  }

  DownloadReport downloads;
  std::exception_ptr failure;
  std::atomic<bool> done{false};
  std::thread runner([&]{
    try {
      downloads = manager.run(pending);
    } catch(...) {
      failure = std::current_exception();
    }
    done = true;
  });
  while(!done) {
    if(auto event = manager.events().pop_for(kEventPollSlice)) {
      if(event_sink_) event_sink_(*event);
    }
  }
  runner.join();
  pump_events(manager);
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    active_ = nullptr;
  }
  if(failure) std::rethrow_exception(failure);

  for(const auto& file : pending) {
    if(file.status == ModFileStatus::Verified) local.record_verified(file);
  }
  if(!local.save_cache()) {
    logger_->warn("Hash cache not saved; the next sync will rehash local files");
  }

  report.outcomes = std::move(downloads.results);
  report.bytes_transferred = downloads.bytes_transferred;
  report.cancelled = downloads.cancelled;
  for(const auto& [path, result] : report.outcomes) {
    if(result.outcome == TaskOutcome::Failed || result.outcome == TaskOutcome::Quarantined) {
      report.problem_files.push_back(path);
    }
  }
  return report;
}
