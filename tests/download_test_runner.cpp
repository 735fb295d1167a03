#include "download_manager.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "integrity_verifier.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using modsync::test::make_payload;
using modsync::test::read_file;
using modsync::test::TempWorkspace;
using modsync::test::TestCase;
using modsync::test::TestContext;
using modsync::test::wait_for_condition;
using modsync::test::write_file;

// In-memory stand-in for the sync server's file endpoint.
class FakeRemote {
public:
  void put(const std::string& path, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = std::move(content);
  }
  void fail_transiently(const std::string& path, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    transient_failures_[path] = times;
  }
  // Drops the connection once when a transfer reaches `offset`.
  void interrupt_at(const std::string& path, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupts_[path] = offset;
  }

  bool ignore_ranges = false;
  std::size_t block = 16 * 1024;
  std::chrono::milliseconds block_delay{0};

  RangeFetcher fetcher() {
    return [this](const RangeRequest& request, const ChunkSink& sink, const CancelToken& cancel){
      return serve(request, sink, cancel);
    };
  }

  std::vector<RangeRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }
  std::vector<RangeRequest> requests_for(const std::string& path) const {
    std::vector<RangeRequest> out;
    for(const auto& request : requests()) {
      if(request.path == path) out.push_back(request);
    }
    return out;
  }
  int peak_active() const { return peak_active_.load(); }
  uint64_t delivered() const { return delivered_.load(); }

private:
  bool serve(const RangeRequest& request, const ChunkSink& sink, const CancelToken& cancel) {
    std::string content;
    std::optional<uint64_t> interrupt;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      auto file = files_.find(request.path);
      if(file == files_.end()) throw TransportError("HTTP 404 Not Found", false, 404);
      content = file->second;
      auto& failures = transient_failures_[request.path];
      if(failures > 0) {
        --failures;
        throw TransportError("HTTP 503 Service Unavailable", true, 503);
      }
      auto cut = interrupts_.find(request.path);
      if(cut != interrupts_.end()) {
        interrupt = cut->second;
        interrupts_.erase(cut);
      }
    }

    const uint64_t size = content.size();
    uint64_t first = 0;
    uint64_t end = size;
    if(!ignore_ranges) {
      if(request.offset > 0 && request.offset >= size) {
        throw TransportError("HTTP 416 Range Not Satisfiable", false, 416);
      }
      first = request.offset;
      if(request.last) end = std::min<uint64_t>(*request.last + 1, size);
    }

    auto now = ++active_;
    auto peak = peak_active_.load();
    while(now > peak && !peak_active_.compare_exchange_weak(peak, now)) {}
    struct Leave {
      std::atomic<int>& active;
      ~Leave() { --active; }
    } leave{active_};

    for(uint64_t position = first; position < end;) {
      if(cancel.cancelled()) return false;
      if(interrupt && position >= *interrupt) {
        throw TransportError("connection reset by peer");
      }
      uint64_t stop = end;
      if(interrupt && *interrupt > position) stop = std::min(stop, *interrupt);
      auto n = static_cast<std::size_t>(std::min<uint64_t>(block, stop - position));
      if(!sink(position, content.data() + position, n)) return false;
      position += n;
      delivered_ += n;
      if(block_delay.count() > 0) std::this_thread::sleep_for(block_delay);
    }
    return true;
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
  std::map<std::string, int> transient_failures_;
  std::map<std::string, uint64_t> interrupts_;
  std::vector<RangeRequest> requests_;
  std::atomic<int> active_{0};
  std::atomic<int> peak_active_{0};
  std::atomic<uint64_t> delivered_{0};
};

ModFile mod_file(const std::string& path, const std::string& content) {
  ModFile file;
  file.relative_path = path;
  file.expected_hash = sha256_hex(content);
  file.expected_size = content.size();
  return file;
}

StrategyConfig strategy(std::size_t workers, TaskOrdering ordering = TaskOrdering::Sequential) {
  StrategyConfig config;
  config.kind = StrategyKind::BalancedAdaptive;
  config.workers = workers;
  config.ordering = ordering;
  config.chunk_size = 16 * 1024;
  return config;
}

DownloadManager::Options manager_options(const fs::path& content, StrategyConfig config) {
  DownloadManager::Options options;
  options.content_dir = content;
  options.strategy = std::move(config);
  options.retry.max_attempts = 4;
  options.retry.base_delay = 5ms;
  options.retry.max_delay = 20ms;
  return options;
}

std::vector<SyncEvent::Type> event_types(DownloadManager& manager, const std::string& path) {
  std::vector<SyncEvent::Type> out;
  for(const auto& event : manager.events().drain()) {
    if(event.path == path) out.push_back(event.type);
  }
  return out;
}

bool has_event(const std::vector<SyncEvent::Type>& types, SyncEvent::Type type) {
  return std::find(types.begin(), types.end(), type) != types.end();
}

bool test_retry_delay_doubles(TestContext&) {
  RetryPolicy policy{5, 1000ms, 30000ms};
  return policy.delay_for(1) == 1000ms && policy.delay_for(2) == 2000ms &&
         policy.delay_for(3) == 4000ms && policy.delay_for(6) == 30000ms &&
         policy.delay_for(60) == 30000ms;
}

bool test_downloads_into_place(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_basic");
  FakeRemote remote;
  const auto core = make_payload(1000, 1);
  const auto nested = make_payload(70000, 2);
  remote.put("core.jar", core);
  remote.put("packs/extra/nested.zip", nested);
  remote.put("empty.txt", "");

  std::vector<ModFile> files = {mod_file("core.jar", core), mod_file("packs/extra/nested.zip", nested),
                                mod_file("empty.txt", "")};
  DownloadManager manager(manager_options(ws.root(), strategy(2)), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);

  return report.count(TaskOutcome::Verified) == 3 && report.problem_files().empty() &&
         std::all_of(files.begin(), files.end(), [](const ModFile& f){ return f.status == ModFileStatus::Verified; }) &&
         read_file(ws / "core.jar") == core && read_file(ws / "packs/extra/nested.zip") == nested &&
         fs::exists(ws / "empty.txt") && fs::file_size(ws / "empty.txt") == 0 &&
         !fs::exists(manager.partial_path("core.jar")) &&
         report.bytes_transferred == core.size() + nested.size();
}

bool test_worker_pool_is_bounded(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_bound");
  FakeRemote remote;
  remote.block = 4096;
  remote.block_delay = 2ms;
  std::vector<ModFile> files;
  for(int i = 0; i < 12; ++i) {
    auto content = make_payload(32 * 1024, static_cast<unsigned>(i + 10));
    auto path = "f" + std::to_string(i) + ".bin";
    remote.put(path, content);
    files.push_back(mod_file(path, content));
  }
  DownloadManager manager(manager_options(ws.root(), strategy(3)), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);
  return report.count(TaskOutcome::Verified) == 12 && report.peak_in_flight <= 3 &&
         remote.peak_active() <= 3 && remote.peak_active() >= 2;
}

bool test_transient_errors_are_retried(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_retry");
  FakeRemote remote;
  const auto content = make_payload(5000, 3);
  remote.put("flaky.jar", content);
  remote.fail_transiently("flaky.jar", 2);

  std::vector<ModFile> files = {mod_file("flaky.jar", content)};
  DownloadManager manager(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);
  auto types = event_types(manager, "flaky.jar");
  const auto& result = report.results.at("flaky.jar");
  return result.outcome == TaskOutcome::Verified && result.attempts == 2 &&
         remote.requests_for("flaky.jar").size() == 3 &&
         std::count(types.begin(), types.end(), SyncEvent::Type::Retrying) == 2 &&
         read_file(ws / "flaky.jar") == content;
}

bool test_failures_are_isolated(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_isolated");
  FakeRemote remote;
  const auto good = make_payload(3000, 4);
  const auto flaky = make_payload(3000, 5);
  remote.put("good.jar", good);
  remote.put("down.jar", flaky);
  remote.fail_transiently("down.jar", 100);

  std::vector<ModFile> files = {mod_file("gone.jar", "whatever"), mod_file("down.jar", flaky),
                                mod_file("good.jar", good)};
  DownloadManager manager(manager_options(ws.root(), strategy(2)), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);

  const auto& gone = report.results.at("gone.jar");
  const auto& down = report.results.at("down.jar");
  auto problems = report.problem_files();
  return gone.outcome == TaskOutcome::Failed && remote.requests_for("gone.jar").size() == 1 &&
         gone.last_error.find("404") != std::string::npos &&
         down.outcome == TaskOutcome::Failed && remote.requests_for("down.jar").size() == 4 &&
         report.results.at("good.jar").outcome == TaskOutcome::Verified &&
         files[0].status == ModFileStatus::Failed && files[2].status == ModFileStatus::Verified &&
         problems == std::vector<std::string>{"down.jar", "gone.jar"};
}

bool test_local_write_failures_are_not_retried(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_resource");
  FakeRemote remote;
  const auto locked = make_payload(4000, 30);
  const auto stuck = make_payload(4000, 31);
  const auto plain = make_payload(4000, 32);
  remote.put("locked/mod.jar", locked);
  remote.put("stuck/cfg.txt", stuck);
  remote.put("free.jar", plain);

  std::vector<ModFile> files = {mod_file("locked/mod.jar", locked), mod_file("stuck/cfg.txt", stuck),
                                mod_file("free.jar", plain)};
  DownloadManager manager(manager_options(ws.root(), strategy(2)), remote.fetcher(), ctx.logger("download"));

  // The target directory refuses the final rename; the staging directory
  // refuses the partial file itself.
  using perms = fs::perms;
  modsync::test::LockedDirectory target_dir(ws / "locked", perms::owner_read | perms::owner_exec);
  modsync::test::LockedDirectory staging_dir(manager.partial_path("stuck/cfg.txt").parent_path(),
                                             perms::owner_read | perms::owner_exec);
  if(!target_dir.enforced() || !staging_dir.enforced()) {
    if(ctx.verbose) std::cout << "    permissions not enforced for this user, skipping\n";
    return true;
  }
  auto report = manager.run(files);

  const auto& rename_failed = report.results.at("locked/mod.jar");
  const auto& open_failed = report.results.at("stuck/cfg.txt");
  return rename_failed.outcome == TaskOutcome::Failed &&
         remote.requests_for("locked/mod.jar").size() == 1 &&
         rename_failed.last_error.find("into place") != std::string::npos &&
         !fs::exists(ws / "locked/mod.jar") &&
         open_failed.outcome == TaskOutcome::Failed &&
         remote.requests_for("stuck/cfg.txt").empty() &&
         report.results.at("free.jar").outcome == TaskOutcome::Verified &&
         read_file(ws / "free.jar") == plain &&
         files[0].status == ModFileStatus::Failed && files[1].status == ModFileStatus::Failed;
}

bool test_interrupted_download_resumes(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_resume");
  FakeRemote remote;
  remote.block = 256 * 1024;
  const auto content = make_payload(10 * 1000 * 1000, 6);
  remote.put("world.pak", content);
  remote.interrupt_at("world.pak", 4000000);

  std::vector<ModFile> files = {mod_file("world.pak", content)};
  DownloadManager manager(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);

  auto requests = remote.requests_for("world.pak");
  return report.results.at("world.pak").outcome == TaskOutcome::Verified &&
         requests.size() == 2 && requests[0].offset == 0 && requests[1].offset == 4000000 &&
         !requests[1].last && report.bytes_transferred == content.size() &&
         sha256_file(ws / "world.pak") == sha256_hex(content);
}

bool test_resume_from_previous_run(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_resume_run");
  FakeRemote remote;
  const auto content = make_payload(300000, 7);
  remote.put("mod.jar", content);

  std::vector<ModFile> files = {mod_file("mod.jar", content)};
  DownloadManager manager(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  write_file(manager.partial_path("mod.jar"), content.substr(0, 120000));
  auto report = manager.run(files);

  auto requests = remote.requests_for("mod.jar");
  return report.results.at("mod.jar").outcome == TaskOutcome::Verified &&
         requests.size() == 1 && requests[0].offset == 120000 &&
         report.bytes_transferred == content.size() - 120000 &&
         read_file(ws / "mod.jar") == content;
}

bool test_resume_disabled_starts_over(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_noresume");
  FakeRemote remote;
  const auto content = make_payload(50000, 8);
  remote.put("mod.jar", content);

  auto config = strategy(1);
  config.resume_enabled = false;
  std::vector<ModFile> files = {mod_file("mod.jar", content)};
  DownloadManager manager(manager_options(ws.root(), config), remote.fetcher(), ctx.logger("download"));
  write_file(manager.partial_path("mod.jar"), content.substr(0, 20000));
  auto report = manager.run(files);
  auto requests = remote.requests_for("mod.jar");
  return report.results.at("mod.jar").outcome == TaskOutcome::Verified &&
         requests.size() == 1 && requests[0].offset == 0;
}

bool test_ignored_range_restarts_cleanly(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_norange");
  FakeRemote remote;
  remote.ignore_ranges = true;
  const auto content = make_payload(80000, 9);
  remote.put("mod.jar", content);

  std::vector<ModFile> files = {mod_file("mod.jar", content)};
  DownloadManager manager(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  write_file(manager.partial_path("mod.jar"), content.substr(0, 30000));
  auto report = manager.run(files);
  return report.results.at("mod.jar").outcome == TaskOutcome::Verified &&
         remote.requests_for("mod.jar").at(0).offset == 30000 &&
         read_file(ws / "mod.jar") == content;
}

bool test_repeated_mismatch_quarantines(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_quarantine");
  FakeRemote remote;
  const auto served = make_payload(4000, 10);
  const auto listed = make_payload(4000, 11);
  remote.put("changed.jar", served);

  std::vector<ModFile> files = {mod_file("changed.jar", listed)};
  auto options = manager_options(ws.root(), strategy(1));
  options.max_mismatch_cycles = 2;
  DownloadManager manager(options, remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);
  auto types = event_types(manager, "changed.jar");
  const auto& result = report.results.at("changed.jar");

  return result.outcome == TaskOutcome::Quarantined && result.mismatch_cycles == 2 &&
         files[0].status == ModFileStatus::Quarantined &&
         remote.requests_for("changed.jar").size() == 2 &&
         std::count(types.begin(), types.end(), SyncEvent::Type::Mismatch) == 2 &&
         has_event(types, SyncEvent::Type::Quarantined) &&
         !fs::exists(ws / "changed.jar") &&
         read_file(manager.quarantine_path("changed.jar")) == served &&
         report.problem_files() == std::vector<std::string>{"changed.jar"};
}

bool test_stale_partial_is_refetched(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_stale");
  FakeRemote remote;
  const auto content = make_payload(6000, 12);
  remote.put("mod.jar", content);

  std::vector<ModFile> files = {mod_file("mod.jar", content)};
  DownloadManager manager(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  // Complete-looking partial with the wrong bytes.
  write_file(manager.partial_path("mod.jar"), make_payload(6000, 13));
  auto report = manager.run(files);
  const auto& result = report.results.at("mod.jar");
  auto requests = remote.requests_for("mod.jar");
  return result.outcome == TaskOutcome::Verified && result.mismatch_cycles == 1 &&
         requests.size() == 1 && requests[0].offset == 0 && read_file(ws / "mod.jar") == content;
}

bool test_cancel_keeps_partial_data(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_cancel");
  FakeRemote remote;
  remote.block = 16 * 1024;
  remote.block_delay = 5ms;
  const auto content = make_payload(4 * 1024 * 1024, 14);
  remote.put("big.pak", content);
  remote.put("later.jar", "later");

  std::vector<ModFile> files = {mod_file("big.pak", content), mod_file("later.jar", "later")};
  auto options = manager_options(ws.root(), strategy(1));
  DownloadManager manager(options, remote.fetcher(), ctx.logger("download"));

  DownloadReport report;
  std::thread runner([&]{ report = manager.run(files); });
  bool started = wait_for_condition([&]{ return remote.delivered() >= 256 * 1024; }, 10s);
  auto cancel_at = std::chrono::steady_clock::now();
  manager.cancel();
  runner.join();
  auto stopped_in = std::chrono::steady_clock::now() - cancel_at;

  const auto partial = manager.partial_path("big.pak");
  std::error_code ec;
  auto kept = fs::file_size(partial, ec);
  bool cancelled = started && report.cancelled &&
                   report.results.at("big.pak").outcome == TaskOutcome::Cancelled &&
                   report.results.at("later.jar").outcome == TaskOutcome::Cancelled &&
                   files[0].status == ModFileStatus::Missing && !ec && kept > 0 &&
                   kept < content.size() && !fs::exists(ws / "big.pak") &&
                   remote.requests_for("later.jar").empty() && stopped_in < 2s;
  if(!cancelled) return false;

  // A later run picks up from the kept bytes.
  remote.block_delay = 0ms;
  DownloadManager second(manager_options(ws.root(), strategy(1)), remote.fetcher(), ctx.logger("download"));
  auto resumed = second.run(files);
  auto requests = remote.requests_for("big.pak");
  return resumed.count(TaskOutcome::Verified) == 2 && requests.back().offset == kept &&
         read_file(ws / "big.pak") == content;
}

bool test_cancel_interrupts_backoff(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_cancel_backoff");
  FakeRemote remote;
  remote.put("down.jar", "x");
  remote.fail_transiently("down.jar", 100);

  auto options = manager_options(ws.root(), strategy(1));
  options.retry.max_attempts = 10;
  options.retry.base_delay = 10s;
  options.retry.max_delay = 10s;
  std::vector<ModFile> files = {mod_file("down.jar", "x")};
  DownloadManager manager(options, remote.fetcher(), ctx.logger("download"));

  DownloadReport report;
  std::thread runner([&]{ report = manager.run(files); });
  wait_for_condition([&]{ return !remote.requests_for("down.jar").empty(); }, 5s);
  auto cancel_at = std::chrono::steady_clock::now();
  manager.cancel();
  runner.join();
  return std::chrono::steady_clock::now() - cancel_at < 2s &&
         report.results.at("down.jar").outcome == TaskOutcome::Cancelled;
}

bool test_large_files_use_segments(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_segments");
  FakeRemote remote;
  remote.block = 8 * 1024;
  const auto big = make_payload(400 * 1024, 15);
  const auto small = make_payload(2000, 16);
  remote.put("big.pak", big);
  remote.put("small.cfg", small);

  auto config = strategy(4, TaskOrdering::SizeDescending);
  config.kind = StrategyKind::FastOptimized;
  config.segments_per_file = 4;
  config.segment_threshold = 64 * 1024;
  std::vector<ModFile> files = {mod_file("small.cfg", small), mod_file("big.pak", big)};
  DownloadManager manager(manager_options(ws.root(), config), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);

  auto requests = remote.requests_for("big.pak");
  std::set<uint64_t> starts;
  for(const auto& request : requests) starts.insert(request.offset);
  bool bounded = std::all_of(requests.begin(), requests.end(),
                             [](const RangeRequest& r){ return r.last.has_value(); });
  return report.count(TaskOutcome::Verified) == 2 && requests.size() == 4 && bounded &&
         starts == std::set<uint64_t>{0, 102400, 204800, 307200} &&
         remote.requests_for("small.cfg").size() == 1 && !remote.requests_for("small.cfg")[0].last &&
         read_file(ws / "big.pak") == big &&
         !fs::exists(fs::path(manager.partial_path("big.pak").string() + ".json"));
}

bool test_segmented_resume_uses_saved_state(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_segment_resume");
  FakeRemote remote;
  remote.block = 8 * 1024;
  remote.block_delay = 3ms;
  const auto big = make_payload(1024 * 1024, 17);
  remote.put("big.pak", big);

  auto config = strategy(2);
  config.segments_per_file = 2;
  config.segment_threshold = 64 * 1024;
  config.chunk_size = 8 * 1024;
  std::vector<ModFile> files = {mod_file("big.pak", big)};

  uint64_t first_run_bytes = 0;
  {
    DownloadManager manager(manager_options(ws.root(), config), remote.fetcher(), ctx.logger("download"));
    DownloadReport report;
    std::thread runner([&]{ report = manager.run(files); });
    wait_for_condition([&]{ return remote.delivered() >= 200 * 1024; }, 10s);
    manager.cancel();
    runner.join();
    if(report.results.at("big.pak").outcome != TaskOutcome::Cancelled) return false;
    first_run_bytes = report.bytes_transferred;
  }
  if(!fs::exists(fs::path((ws / ".modsync/partial/big.pak.part").string() + ".json"))) return false;

  remote.block_delay = 0ms;
  auto before = remote.requests().size();
  DownloadManager manager(manager_options(ws.root(), config), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);
  auto requests = remote.requests();
  bool resumed_mid_segment = std::all_of(requests.begin() + static_cast<std::ptrdiff_t>(before), requests.end(),
    [](const RangeRequest& r){ return r.offset != 0 && r.offset != 512 * 1024; });
  return report.results.at("big.pak").outcome == TaskOutcome::Verified && resumed_mid_segment &&
         first_run_bytes + report.bytes_transferred <= big.size() + 2 * config.chunk_size &&
         read_file(ws / "big.pak") == big;
}

bool test_priority_ordering(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_priority");
  FakeRemote remote;
  std::vector<ModFile> files;
  for(const auto& item : std::vector<std::pair<std::string, std::size_t>>{
        {"a_large.pak", 9000}, {"config/core.jar", 5000}, {"b_small.txt", 10}, {"c_mid.zip", 500}}) {
    auto content = make_payload(item.second, static_cast<unsigned>(item.second));
    remote.put(item.first, content);
    files.push_back(mod_file(item.first, content));
  }
  auto config = strategy(1, TaskOrdering::PriorityList);
  config.critical_files = {"core.jar"};
  DownloadManager manager(manager_options(ws.root(), config), remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);

  std::vector<std::string> order;
  for(const auto& request : remote.requests()) order.push_back(request.path);
  return report.count(TaskOutcome::Verified) == 4 &&
         order == std::vector<std::string>{"config/core.jar", "b_small.txt", "c_mid.zip", "a_large.pak"};
}

bool test_events_never_block_workers(TestContext& ctx) {
  TempWorkspace ws("modsync_dl_events");
  FakeRemote remote;
  std::vector<ModFile> files;
  for(int i = 0; i < 20; ++i) {
    auto content = make_payload(64 * 1024, static_cast<unsigned>(100 + i));
    auto path = "e" + std::to_string(i) + ".bin";
    remote.put(path, content);
    files.push_back(mod_file(path, content));
  }
  auto options = manager_options(ws.root(), strategy(4));
  options.event_capacity = 8;
  DownloadManager manager(options, remote.fetcher(), ctx.logger("download"));
  auto report = manager.run(files);
  return report.count(TaskOutcome::Verified) == 20 && manager.events().size() == 8 &&
         manager.events().dropped() > 0;
}

bool test_verifier_checks_size_then_hash(TestContext&) {
  TempWorkspace ws("modsync_verifier");
  write_file(ws / "f.bin", "hello");
  IntegrityVerifier verifier(2);
  auto ok = verifier.verify(ws / "f.bin", sha256_hex("hello"), 5);
  auto upper = verifier.verify(ws / "f.bin",
                               "2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824", 5);
  auto short_size = verifier.verify(ws / "f.bin", sha256_hex("hello"), 6);
  auto wrong_hash = verifier.verify(ws / "f.bin", sha256_hex("world"), 5);
  bool threw = false;
  try {
    verifier.verify(ws / "missing.bin", sha256_hex("x"), 1);
  } catch(const ResourceError&) {
    threw = true;
  }
  return ok.matches && upper.matches && !short_size.matches && short_size.actual_hash.empty() &&
         short_size.actual_size == 5 && !wrong_hash.matches && wrong_hash.actual_hash == sha256_hex("hello") &&
         threw && !verifier.should_quarantine(1) && verifier.should_quarantine(2);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"retry_delay_doubles", test_retry_delay_doubles},
    {"downloads_into_place", test_downloads_into_place},
    {"worker_pool_is_bounded", test_worker_pool_is_bounded},
    {"transient_errors_are_retried", test_transient_errors_are_retried},
    {"failures_are_isolated", test_failures_are_isolated},
    {"local_write_failures_are_not_retried", test_local_write_failures_are_not_retried},
    {"interrupted_download_resumes", test_interrupted_download_resumes},
    {"resume_from_previous_run", test_resume_from_previous_run},
    {"resume_disabled_starts_over", test_resume_disabled_starts_over},
    {"ignored_range_restarts_cleanly", test_ignored_range_restarts_cleanly},
    {"repeated_mismatch_quarantines", test_repeated_mismatch_quarantines},
    {"stale_partial_is_refetched", test_stale_partial_is_refetched},
    {"cancel_keeps_partial_data", test_cancel_keeps_partial_data},
    {"cancel_interrupts_backoff", test_cancel_interrupts_backoff},
    {"large_files_use_segments", test_large_files_use_segments},
    {"segmented_resume_uses_saved_state", test_segmented_resume_uses_saved_state},
    {"priority_ordering", test_priority_ordering},
    {"events_never_block_workers", test_events_never_block_workers},
    {"verifier_checks_size_then_hash", test_verifier_checks_size_then_hash},
  };
  return modsync::test::run_tests("download", argc, argv, tests);
}
