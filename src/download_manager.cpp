#include "download_manager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <numeric>
#include <system_error>
#include <thread>

#include "errors.hpp"
#include "http.hpp"
#include "http_client.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kJobWaitSlice{100};

std::error_code last_errno() {
  return std::error_code(errno, std::generic_category());
}

class ScopeExit {
public:
  explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
  ~ScopeExit() { fn_(); }
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

private:
  std::function<void()> fn_;
};

void ensure_parent(const fs::path& file) {
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  if(ec) throw ResourceError("cannot create " + file.parent_path().string(), ec);
}

fs::path sidecar_for(const fs::path& partial) {
  return fs::path(partial.string() + ".json");
}

ModFileStatus status_for(TaskOutcome outcome) {
  switch(outcome) {
    case TaskOutcome::Verified:    return ModFileStatus::Verified;
    case TaskOutcome::Failed:      return ModFileStatus::Failed;
    case TaskOutcome::Quarantined: return ModFileStatus::Quarantined;
    case TaskOutcome::Cancelled:   return ModFileStatus::Missing;
  }
  return ModFileStatus::Failed;
}

SyncEvent::Type event_for(TaskOutcome outcome) {
  switch(outcome) {
    case TaskOutcome::Verified:    return SyncEvent::Type::Verified;
    case TaskOutcome::Failed:      return SyncEvent::Type::Failed;
    case TaskOutcome::Quarantined: return SyncEvent::Type::Quarantined;
    case TaskOutcome::Cancelled:   return SyncEvent::Type::Cancelled;
  }
  return SyncEvent::Type::Failed;
}

} // namespace

const char* to_string(SyncEvent::Type type) {
  switch(type) {
    case SyncEvent::Type::Started:     return "started";
    case SyncEvent::Type::Progress:    return "progress";
    case SyncEvent::Type::Retrying:    return "retrying";
    case SyncEvent::Type::Mismatch:    return "mismatch";
    case SyncEvent::Type::Verified:    return "verified";
    case SyncEvent::Type::Failed:      return "failed";
    case SyncEvent::Type::Quarantined: return "quarantined";
    case SyncEvent::Type::Cancelled:   return "cancelled";
  }
  return "unknown";
}

const char* to_string(TaskOutcome outcome) {
  switch(outcome) {
    case TaskOutcome::Verified:    return "verified";
    case TaskOutcome::Failed:      return "failed";
    case TaskOutcome::Quarantined: return "quarantined";
    case TaskOutcome::Cancelled:   return "cancelled";
  }
  return "unknown";
}

std::chrono::milliseconds RetryPolicy::delay_for(std::size_t attempt) const {
  auto delay = base_delay;
  for(std::size_t i = 1; i < attempt && delay < max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay);
}

std::size_t DownloadReport::count(TaskOutcome outcome) const {
  return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
    [outcome](const auto& item){ return item.second.outcome == outcome; }));
}

std::vector<std::string> DownloadReport::problem_files() const {
  std::vector<std::string> out;
  for(const auto& item : results) {
    if(item.second.outcome == TaskOutcome::Failed || item.second.outcome == TaskOutcome::Quarantined) {
      out.push_back(item.first);
    }
  }
  return out;
}

DownloadManager::DownloadManager(Options options, RangeFetcher fetcher, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    fetcher_(std::move(fetcher)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("download")),
    verifier_(options_.max_mismatch_cycles),
    events_(options_.event_capacity) {
  if(!fetcher_) throw std::invalid_argument("DownloadManager needs a fetcher");
  if(options_.retry.max_attempts == 0) options_.retry.max_attempts = 1;
  if(options_.strategy.workers == 0) options_.strategy.workers = 1;
  if(options_.strategy.chunk_size == 0) options_.strategy.chunk_size = 64 * 1024;
}

DownloadManager::~DownloadManager() {
  cancel_.cancel();
}

fs::path DownloadManager::staging_root(const fs::path& content_dir) {
  return content_dir / ".modsync";
}

fs::path DownloadManager::final_path(const std::string& relative_path) const {
  return options_.content_dir / fs::path(relative_path);
}

fs::path DownloadManager::partial_path(const std::string& relative_path) const {
  return staging_root(options_.content_dir) / "partial" / fs::path(relative_path + ".part");
}

fs::path DownloadManager::quarantine_path(const std::string& relative_path) const {
  return staging_root(options_.content_dir) / "quarantine" / fs::path(relative_path);
}

DownloadReport DownloadManager::run(std::vector<ModFile>& files) {
  slots_.clear();
  job_queue_.clear();
  in_flight_ = 0;
  peak_in_flight_ = 0;
  bytes_transferred_ = 0;

  for(const auto& file : files) {
    auto slot = std::make_unique<FileSlot>();
    slot->task.file = file;
    slots_.push_back(std::move(slot));
  }
  unfinished_ = slots_.size();
  for(auto index : order_tasks()) {
    job_queue_.push_back(Job{index, std::nullopt});
  }

  if(!slots_.empty()) {
    logger_->info("Downloading {} files with strategy '{}' ({} workers, {} order)",
                  slots_.size(), to_string(options_.strategy.kind), options_.strategy.workers,
                  to_string(options_.strategy.ordering));
    std::vector<std::thread> workers;
    workers.reserve(options_.strategy.workers);
    for(std::size_t i = 0; i < options_.strategy.workers; ++i) {
      workers.emplace_back([this]{ worker_loop(); });
    }
    for(auto& thread : workers) {
      if(thread.joinable()) thread.join();
    }
  }

  // Anything never picked up (or left mid-way by cancellation).
  for(std::size_t i = 0; i < slots_.size(); ++i) {
    if(!slots_[i]->finished) finalize(i, TaskOutcome::Cancelled, "cancelled");
  }

  DownloadReport report;
  report.bytes_transferred = bytes_transferred_.load();
  report.peak_in_flight = peak_in_flight_.load();
  report.cancelled = cancel_.cancelled();
  for(std::size_t i = 0; i < slots_.size(); ++i) {
    files[i].status = slots_[i]->task.file.status;
    report.results[files[i].relative_path] = slots_[i]->result;
  }
  logger_->info("Download finished: {} verified, {} failed, {} quarantined, {} cancelled",
                report.count(TaskOutcome::Verified), report.count(TaskOutcome::Failed),
                report.count(TaskOutcome::Quarantined), report.count(TaskOutcome::Cancelled));
  return report;
}

std::vector<std::size_t> DownloadManager::order_tasks() const {
  std::vector<std::size_t> order(slots_.size());
  std::iota(order.begin(), order.end(), 0);
  auto size_of = [this](std::size_t i){ return slots_[i]->task.file.expected_size; };

  switch(options_.strategy.ordering) {
    case TaskOrdering::Sequential:
      break;
    case TaskOrdering::SizeAscending:
      std::stable_sort(order.begin(), order.end(),
        [&](std::size_t a, std::size_t b){ return size_of(a) < size_of(b); });
      break;
    case TaskOrdering::SizeDescending:
      std::stable_sort(order.begin(), order.end(),
        [&](std::size_t a, std::size_t b){ return size_of(a) > size_of(b); });
      break;
    case TaskOrdering::PriorityList: {
      const auto& critical = options_.strategy.critical_files;
      auto rank_of = [&](std::size_t i){
        const auto& path = slots_[i]->task.file.relative_path;
        const auto name = fs::path(path).filename().string();
        for(std::size_t r = 0; r < critical.size(); ++r) {
          if(critical[r] == path || critical[r] == name) return r;
        }
        return critical.size();
      };
      std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){
        auto ra = rank_of(a);
        auto rb = rank_of(b);
        if(ra != rb) return ra < rb;
        return size_of(a) < size_of(b);
      });
      break;
    }
  }
  return order;
}

std::optional<DownloadManager::Job> DownloadManager::take_job() {
  std::unique_lock<std::mutex> lock(job_mutex_);
  auto ready = [&]{ return cancel_.cancelled() || unfinished_ == 0 || !job_queue_.empty(); };
  while(!ready()) {
    job_cv_.wait_for(lock, kJobWaitSlice);
  }
  if(cancel_.cancelled() || unfinished_ == 0) return std::nullopt;
  Job job = job_queue_.front();
  job_queue_.pop_front();
  return job;
}

void DownloadManager::push_jobs(const std::vector<Job>& jobs, bool front) {
  {
    std::lock_guard<std::mutex> lock(job_mutex_);
    if(front) {
      job_queue_.insert(job_queue_.begin(), jobs.begin(), jobs.end());
    } else {
      job_queue_.insert(job_queue_.end(), jobs.begin(), jobs.end());
    }
  }
  job_cv_.notify_all();
}

void DownloadManager::worker_loop() {
  while(auto job = take_job()) {
    if(job->segment) {
      process_segment(job->slot, *job->segment);
    } else {
      process_file(job->slot);
    }
  }
}

void DownloadManager::track_in_flight(int delta) {
  if(delta > 0) {
    auto now = in_flight_.fetch_add(1) + 1;
    auto peak = peak_in_flight_.load();
    while(now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {}
  } else {
    in_flight_.fetch_sub(1);
  }
}

void DownloadManager::emit(SyncEvent::Type type, const DownloadTask& task, uint64_t done, std::string message) {
  SyncEvent event;
  event.type = type;
  event.path = task.file.relative_path;
  event.bytes_done = done;
  event.bytes_total = task.file.expected_size;
  event.attempt = task.attempts;
  event.message = std::move(message);
  events_.push(std::move(event));
}

bool DownloadManager::should_segment(const DownloadTask& task) const {
  const auto& strategy = options_.strategy;
  return strategy.segment_threshold > 0 && strategy.segments_per_file > 1 &&
         task.file.expected_size >= strategy.segment_threshold;
}

void DownloadManager::discard_partial(const std::string& relative_path) {
  std::error_code ec;
  auto partial = partial_path(relative_path);
  fs::remove(partial, ec);
  fs::remove(sidecar_for(partial), ec);
}

void DownloadManager::process_file(std::size_t index) {
  auto& slot = *slots_[index];
  auto& task = slot.task;
  if(cancel_.cancelled()) {
    finalize(index, TaskOutcome::Cancelled, "cancelled");
    return;
  }
  task.file.status = ModFileStatus::Downloading;

  try {
    if(should_segment(task)) {
      start_segmented(index);
      return;
    }

    emit(SyncEvent::Type::Started, task, task.offset);
    if(task.fresh) {
      const auto partial = partial_path(task.file.relative_path);
      std::error_code ec;
      const bool segmented_leftover = fs::exists(sidecar_for(partial), ec);
      task.offset = 0;
      if(!options_.strategy.resume_enabled || task.discard_partial || segmented_leftover) {
        discard_partial(task.file.relative_path);
      } else {
        auto existing = fs::file_size(partial, ec);
        if(!ec && existing <= task.file.expected_size) {
          task.offset = existing;
        } else if(!ec) {
          discard_partial(task.file.relative_path);
        }
      }
      if(task.offset > 0) {
        logger_->info("Resuming {} at byte {}", task.file.relative_path, task.offset);
      }
      task.fresh = false;
      task.discard_partial = false;
    }

    switch(fetch_whole(slot)) {
      case FetchEnd::Completed:
        verify_and_commit(index);
        break;
      case FetchEnd::Aborted:
        finalize(index, TaskOutcome::Cancelled, "cancelled");
        break;
      case FetchEnd::Failed:
        finalize(index, TaskOutcome::Failed);
        break;
    }
  } catch(const ResourceError& e) {
    finalize(index, TaskOutcome::Failed, e.what());
  } catch(const std::exception& e) {
    logger_->error("Unexpected error on {}: {}", task.file.relative_path, e.what());
    finalize(index, TaskOutcome::Failed, e.what());
  }
}

bool DownloadManager::backoff(FileSlot& slot, const std::string& error, std::size_t attempt) {
  auto delay = options_.retry.delay_for(attempt);
  logger_->warn("{}: {} (retry {}/{} in {} ms)", slot.task.file.relative_path, error,
                attempt, options_.retry.max_attempts - 1, delay.count());
  emit(SyncEvent::Type::Retrying, slot.task, 0, error);
  return !cancel_.wait_for(delay);
}

DownloadManager::FetchEnd DownloadManager::fetch_whole(FileSlot& slot) {
  auto& task = slot.task;
  const auto partial = partial_path(task.file.relative_path);
  ensure_parent(partial);

  while(true) {
    if(cancel_.cancelled()) return FetchEnd::Aborted;

    std::ofstream out(partial, std::ios::binary | (task.offset == 0 ? std::ios::trunc : std::ios::app));
    if(!out) throw ResourceError("cannot open " + partial.string(), last_errno());
    if(task.offset == task.file.expected_size) return FetchEnd::Completed;

    uint64_t unflushed = 0;
    try {
      track_in_flight(+1);
      ScopeExit in_flight_done([this]{ track_in_flight(-1); });

      RangeRequest request{task.file.relative_path, task.offset, std::nullopt};
      bool finished = fetcher_(request, [&](uint64_t position, const char* data, std::size_t size){
        if(position != task.offset) {
          if(position != 0) {
            throw TransportError("server sent data from byte " + std::to_string(position) +
                                 ", expected " + std::to_string(task.offset));
          }
          // Range not honoured: the body is the whole file.
          logger_->debug("{}: server ignored range, restarting from 0", task.file.relative_path);
          out.close();
          out.open(partial, std::ios::binary | std::ios::trunc);
          if(!out) throw ResourceError("cannot open " + partial.string(), last_errno());
          task.offset = 0;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if(!out) throw ResourceError("write to " + partial.string() + " failed", last_errno());
        task.offset += size;
        slot.result.bytes_downloaded += size;
        bytes_transferred_ += size;
        unflushed += size;
        if(unflushed >= options_.strategy.chunk_size) {
          out.flush();
          unflushed = 0;
          emit(SyncEvent::Type::Progress, task, task.offset);
        }
        return !cancel_.cancelled();
      }, cancel_);

      out.flush();
      if(!out) throw ResourceError("write to " + partial.string() + " failed", last_errno());
      return finished ? FetchEnd::Completed : FetchEnd::Aborted;
    } catch(const TransportError& e) {
      out.flush();
      ++task.attempts;
      task.last_error = e.what();
      if(e.status() == 416) {
        // Our cursor is past the end of the server's file; start over.
        task.offset = 0;
      } else if(!e.transient()) {
        logger_->error("{}: {}", task.file.relative_path, e.what());
        return FetchEnd::Failed;
      }
      if(task.attempts >= options_.retry.max_attempts) {
        logger_->error("{}: giving up after {} attempts: {}", task.file.relative_path, task.attempts, e.what());
        return FetchEnd::Failed;
      }
      if(!backoff(slot, e.what(), task.attempts)) return FetchEnd::Aborted;
    }
  }
}

void DownloadManager::start_segmented(std::size_t index) {
  auto& slot = *slots_[index];
  auto& task = slot.task;
  const auto partial = partial_path(task.file.relative_path);
  const auto size = task.file.expected_size;
  emit(SyncEvent::Type::Started, task, 0);

  std::vector<Job> jobs;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    const bool may_resume = task.fresh && options_.strategy.resume_enabled && !task.discard_partial;
    bool resumed = may_resume && load_segments(slot);

    if(!resumed) {
      std::error_code ec;
      uint64_t base = 0;
      if(may_resume && !fs::exists(sidecar_for(partial), ec)) {
        // Contiguous prefix from an earlier unsegmented attempt.
        auto existing = fs::file_size(partial, ec);
        if(!ec) base = std::min<uint64_t>(existing, size);
      } else {
        discard_partial(task.file.relative_path);
      }

      slot.segments.clear();
      const uint64_t span = size - base;
      const uint64_t count = std::max<uint64_t>(1, options_.strategy.segments_per_file);
      const uint64_t per_segment = (span + count - 1) / count;
      for(uint64_t first = base; per_segment > 0 && first < size; first += per_segment) {
        Segment segment;
        segment.first = first;
        segment.last = std::min(first + per_segment, size) - 1;
        segment.next = first;
        slot.segments.push_back(segment);
      }

      ensure_parent(partial);
      if(!fs::exists(partial, ec)) {
        std::ofstream create(partial, std::ios::binary);
        if(!create) throw ResourceError("cannot create " + partial.string(), last_errno());
      }
      fs::resize_file(partial, size, ec);
      if(ec) throw ResourceError("cannot size " + partial.string(), ec);
      save_segments_locked(slot);
    } else {
      logger_->info("Resuming {} from {} saved segments", task.file.relative_path, slot.segments.size());
    }

    task.fresh = false;
    task.discard_partial = false;
    slot.segment_failed = false;
    slot.unsaved_bytes = 0;
    for(std::size_t i = 0; i < slot.segments.size(); ++i) {
      if(!slot.segments[i].done()) jobs.push_back(Job{index, i});
    }
    slot.active_segment_jobs = jobs.size();
  }

  if(jobs.empty()) {
    verify_and_commit(index);
    return;
  }
  logger_->debug("{}: {} parallel segments", task.file.relative_path, jobs.size());
  push_jobs(jobs, true);
}

void DownloadManager::process_segment(std::size_t index, std::size_t segment) {
  auto& slot = *slots_[index];
  FetchEnd end = FetchEnd::Aborted;
  bool skip = false;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    skip = slot.segment_failed;
  }
  if(!skip && !cancel_.cancelled()) {
    try {
      end = fetch_segment(slot, segment);
    } catch(const std::exception& e) {
      std::lock_guard<std::mutex> lock(slot.mutex);
      slot.task.last_error = e.what();
      end = FetchEnd::Failed;
    }
  }

  bool last_job = false;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if(end == FetchEnd::Failed) slot.segment_failed = true;
    last_job = (--slot.active_segment_jobs == 0);
    save_segments_locked(slot);
  }
  if(last_job) finish_segmented(index);
}

void DownloadManager::finish_segmented(std::size_t index) {
  auto& slot = *slots_[index];
  bool complete = false;
  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    failed = slot.segment_failed;
    complete = std::all_of(slot.segments.begin(), slot.segments.end(),
                           [](const Segment& s){ return s.done(); });
  }
  if(failed) {
    finalize(index, TaskOutcome::Failed);
  } else if(complete) {
    verify_and_commit(index);
  } else {
    finalize(index, TaskOutcome::Cancelled, "cancelled");
  }
}

DownloadManager::FetchEnd DownloadManager::fetch_segment(FileSlot& slot, std::size_t segment) {
  auto& task = slot.task;
  const auto partial = partial_path(task.file.relative_path);
  std::fstream out(partial, std::ios::in | std::ios::out | std::ios::binary);
  if(!out) throw ResourceError("cannot open " + partial.string(), last_errno());

  std::size_t attempts = 0;
  while(true) {
    Segment range;
    {
      std::lock_guard<std::mutex> lock(slot.mutex);
      range = slot.segments[segment];
      if(slot.segment_failed) return FetchEnd::Aborted;
    }
    if(range.done()) return FetchEnd::Completed;
    if(cancel_.cancelled()) return FetchEnd::Aborted;

    uint64_t cursor = range.next;
    out.seekp(static_cast<std::streamoff>(cursor));
    try {
      track_in_flight(+1);
      ScopeExit in_flight_done([this]{ track_in_flight(-1); });

      RangeRequest request{task.file.relative_path, cursor, range.last};
      bool stop = false;
      fetcher_(request, [&](uint64_t position, const char* data, std::size_t size){
        if(position != cursor) {
          throw TransportError("server ignored range request for " + task.file.relative_path, false);
        }
        auto take = static_cast<std::size_t>(std::min<uint64_t>(size, range.last + 1 - cursor));
        out.write(data, static_cast<std::streamsize>(take));
        if(!out) throw ResourceError("write to " + partial.string() + " failed", last_errno());
        cursor += take;
        bytes_transferred_ += take;

        uint64_t done = 0;
        bool report = false;
        {
          std::lock_guard<std::mutex> lock(slot.mutex);
          slot.segments[segment].next = cursor;
          slot.result.bytes_downloaded += take;
          slot.unsaved_bytes += take;
          if(slot.unsaved_bytes >= options_.strategy.chunk_size) {
            out.flush();
            save_segments_locked(slot);
            slot.unsaved_bytes = 0;
            report = true;
            done = slot.segments.front().first;
            for(const auto& s : slot.segments) done += s.next - s.first;
          }
          stop = slot.segment_failed;
        }
        if(report) emit(SyncEvent::Type::Progress, task, done);
        return !stop && !cancel_.cancelled() && cursor <= range.last;
      }, cancel_);

      out.flush();
      if(!out) throw ResourceError("write to " + partial.string() + " failed", last_errno());
      if(cursor > range.last) return FetchEnd::Completed;
      if(stop || cancel_.cancelled()) return FetchEnd::Aborted;
      throw TransportError("segment of " + task.file.relative_path + " ended at byte " + std::to_string(cursor));
    } catch(const TransportError& e) {
      out.clear();
      out.flush();
      ++attempts;
      {
        std::lock_guard<std::mutex> lock(slot.mutex);
        task.attempts = std::max(task.attempts, attempts);
        task.last_error = e.what();
      }
      if(!e.transient() || attempts >= options_.retry.max_attempts) {
        logger_->error("{}: segment {} failed: {}", task.file.relative_path, segment, e.what());
        return FetchEnd::Failed;
      }
      if(!backoff(slot, e.what(), attempts)) return FetchEnd::Aborted;
    }
  }
}

bool DownloadManager::load_segments(FileSlot& slot) {
  const auto& task = slot.task;
  const auto partial = partial_path(task.file.relative_path);
  std::ifstream in(sidecar_for(partial));
  if(!in) return false;

  std::error_code ec;
  auto partial_size = fs::file_size(partial, ec);
  if(ec || partial_size != task.file.expected_size) return false;

  try {
    nlohmann::json doc;
    in >> doc;
    if(doc.at("size").get<uint64_t>() != task.file.expected_size ||
       doc.at("hash").get<std::string>() != task.file.expected_hash) {
      return false;
    }
    std::vector<Segment> segments;
    for(const auto& item : doc.at("segments")) {
      Segment segment;
      segment.first = item.at("first").get<uint64_t>();
      segment.last = item.at("last").get<uint64_t>();
      segment.next = item.at("next").get<uint64_t>();
      if(segment.first > segment.last || segment.last >= task.file.expected_size ||
         segment.next < segment.first || segment.next > segment.last + 1) {
        return false;
      }
      segments.push_back(segment);
    }
    if(segments.empty()) return false;
    slot.segments = std::move(segments);
    return true;
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Ignoring unreadable segment state for {}: {}", task.file.relative_path, e.what());
    return false;
  }
}

void DownloadManager::save_segments_locked(FileSlot& slot) {
  if(slot.segments.empty()) return;
  nlohmann::json doc = {
    {"size", slot.task.file.expected_size},
    {"hash", slot.task.file.expected_hash},
    {"segments", nlohmann::json::array()}
  };
  for(const auto& segment : slot.segments) {
    doc["segments"].push_back({{"first", segment.first}, {"last", segment.last}, {"next", segment.next}});
  }
  const auto path = sidecar_for(partial_path(slot.task.file.relative_path));
  std::ofstream out(path, std::ios::trunc);
  out << doc.dump();
  if(!out) {
    logger_->warn("Unable to save segment state to {}", path.string());
  }
}

void DownloadManager::verify_and_commit(std::size_t index) {
  auto& slot = *slots_[index];
  auto& task = slot.task;
  const auto partial = partial_path(task.file.relative_path);

  IntegrityVerifier::Verdict verdict;
  try {
    verdict = verifier_.verify(partial, task.file.expected_hash, task.file.expected_size);
  } catch(const ResourceError& e) {
    finalize(index, TaskOutcome::Failed, e.what());
    return;
  }

  std::error_code ec;
  if(verdict.matches) {
    const auto target = final_path(task.file.relative_path);
    fs::create_directories(target.parent_path(), ec);
    fs::rename(partial, target, ec);
    if(ec) {
      finalize(index, TaskOutcome::Failed, "cannot move " + task.file.relative_path + " into place: " + ec.message());
      return;
    }
    fs::remove(sidecar_for(partial), ec);
    finalize(index, TaskOutcome::Verified);
    return;
  }

  ++task.mismatch_cycles;
  std::string message = "hash mismatch: got " +
    (verdict.actual_hash.empty() ? std::string("-") : verdict.actual_hash) +
    " (" + std::to_string(verdict.actual_size) + " bytes), expected " +
    task.file.expected_hash + " (" + std::to_string(task.file.expected_size) + " bytes)";
  task.last_error = message;
  emit(SyncEvent::Type::Mismatch, task, verdict.actual_size, message);

  if(verifier_.should_quarantine(task.mismatch_cycles)) {
    const auto target = quarantine_path(task.file.relative_path);
    fs::create_directories(target.parent_path(), ec);
    fs::remove(target, ec);
    fs::rename(partial, target, ec);
    if(ec) {
      logger_->warn("Unable to move {} to quarantine: {}", task.file.relative_path, ec.message());
    }
    fs::remove(sidecar_for(partial), ec);
    finalize(index, TaskOutcome::Quarantined, message);
    return;
  }

  logger_->warn("{}: {}; downloading again ({}/{})", task.file.relative_path, message,
                task.mismatch_cycles, verifier_.max_mismatch_cycles());
  discard_partial(task.file.relative_path);
  task.file.status = ModFileStatus::Mismatched;
  task.offset = 0;
  task.attempts = 0;
  task.fresh = true;
  task.discard_partial = true;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.segments.clear();
  }
  push_jobs({Job{index, std::nullopt}}, false);
}

void DownloadManager::finalize(std::size_t index, TaskOutcome outcome, const std::string& error) {
  auto& slot = *slots_[index];
  if(slot.finished) return;
  slot.finished = true;

  auto& task = slot.task;
  task.file.status = status_for(outcome);
  slot.result.outcome = outcome;
  slot.result.attempts = task.attempts;
  slot.result.mismatch_cycles = task.mismatch_cycles;
  slot.result.last_error = error.empty() ? task.last_error : error;

  switch(outcome) {
    case TaskOutcome::Verified:
      logger_->info("Verified {}", task.file.relative_path);
      break;
    case TaskOutcome::Cancelled:
      logger_->debug("Cancelled {}", task.file.relative_path);
      break;
    default:
      logger_->error("{} {}: {}", to_string(outcome), task.file.relative_path, slot.result.last_error);
      break;
  }
  emit(event_for(outcome), task, outcome == TaskOutcome::Verified ? task.file.expected_size : 0,
       slot.result.last_error);

  {
    std::lock_guard<std::mutex> lock(job_mutex_);
    if(unfinished_ > 0) --unfinished_;
  }
  job_cv_.notify_all();
}

RangeFetcher make_http_fetcher(HttpClient& client) {
  return [&client](const RangeRequest& request, const ChunkSink& sink, const CancelToken& cancel) {
    HttpHeaders headers;
    if(request.offset > 0 || request.last) {
      headers.emplace_back("Range", "bytes=" + std::to_string(request.offset) + "-" +
                                    (request.last ? std::to_string(*request.last) : std::string()));
    }
    uint64_t position = 0;
    bool started = false;
    return client.stream("/" + percent_encode_path(request.path), headers,
      [&](const HttpResponse& head, const char* data, std::size_t size){
        if(!started) {
          started = true;
          if(head.status == 206) {
            auto range = parse_content_range(head.header("Content-Range"));
            if(!range) throw TransportError("206 response without a usable Content-Range", false);
            position = range->first;
          }
        }
        if(size == 0) return true;
        bool keep_going = sink(position, data, size);
        position += size;
        return keep_going;
      }, &cancel);
  };
}
