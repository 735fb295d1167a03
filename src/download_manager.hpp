#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cancel_token.hpp"
#include "event_channel.hpp"
#include "integrity_verifier.hpp"
#include "log.hpp"
#include "mod_file.hpp"
#include "strategy_selector.hpp"

class HttpClient;

struct SyncEvent {
  enum class Type {
    Started,
    Progress,
    Retrying,
    Mismatch,
    Verified,
    Failed,
    Quarantined,
    Cancelled
  };

  Type type = Type::Started;
  std::string path;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  std::size_t attempt = 0;
  std::string message;
};

const char* to_string(SyncEvent::Type type);

struct RetryPolicy {
  std::size_t max_attempts = 5;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};

  // Backoff before retry number `attempt` (1-based): base, 2*base, 4*base ...
  std::chrono::milliseconds delay_for(std::size_t attempt) const;
};

enum class TaskOutcome { Verified, Failed, Quarantined, Cancelled };

const char* to_string(TaskOutcome outcome);

struct TaskResult {
  TaskOutcome outcome = TaskOutcome::Failed;
  std::size_t attempts = 0;
  std::size_t mismatch_cycles = 0;
  uint64_t bytes_downloaded = 0;
  std::string last_error;
};

struct DownloadReport {
  std::map<std::string, TaskResult> results;
  uint64_t bytes_transferred = 0;
  std::size_t peak_in_flight = 0;
  bool cancelled = false;

  std::size_t count(TaskOutcome outcome) const;
  // Failed or quarantined paths.
  std::vector<std::string> problem_files() const;
};

// Per-file unit of work. Owned by the queue or by exactly one worker.
struct DownloadTask {
  ModFile file;
  uint64_t offset = 0;          // resume cursor
  std::size_t attempts = 0;
  std::size_t mismatch_cycles = 0;
  std::string last_error;
  bool fresh = true;            // cursor not yet initialised from local state
  bool discard_partial = false; // next start must ignore any partial artifact
};

struct RangeRequest {
  std::string path;
  uint64_t offset = 0;
  std::optional<uint64_t> last; // inclusive; open-ended when unset
};

// Receives body bytes; `position` is the file offset of data[0]. Returning
// false aborts the request.
using ChunkSink = std::function<bool(uint64_t position, const char* data, std::size_t size)>;

// Performs one range request. Returns false if aborted by the sink or the
// token; throws TransportError on network or HTTP failure.
using RangeFetcher = std::function<bool(const RangeRequest& request,
                                        const ChunkSink& sink,
                                        const CancelToken& cancel)>;

RangeFetcher make_http_fetcher(HttpClient& client);

// Executes a strategy over a set of files with a bounded worker pool.
//
// Partial data lives under <content>/.modsync/partial and is renamed into
// place only after verification; quarantined files go to
// <content>/.modsync/quarantine. run() returns once every worker has joined,
// with exactly one outcome per input file.
class DownloadManager {
public:
  struct Options {
    std::filesystem::path content_dir;
    StrategyConfig strategy;
    RetryPolicy retry;
    std::size_t max_mismatch_cycles = 2;
    std::size_t event_capacity = 1024;
  };

  DownloadManager(Options options, RangeFetcher fetcher, std::shared_ptr<Logger> logger = nullptr);
  ~DownloadManager();

  DownloadManager(const DownloadManager&) = delete;
  DownloadManager& operator=(const DownloadManager&) = delete;

  // Updates each file's status from its outcome; cancelled files go back to
  // Missing with their partial data kept.
  DownloadReport run(std::vector<ModFile>& files);

  void cancel() { cancel_.cancel(); }
  CancelToken& cancel_token() { return cancel_; }
  EventChannel<SyncEvent>& events() { return events_; }

  std::filesystem::path final_path(const std::string& relative_path) const;
  std::filesystem::path partial_path(const std::string& relative_path) const;
  std::filesystem::path quarantine_path(const std::string& relative_path) const;

  static std::filesystem::path staging_root(const std::filesystem::path& content_dir);

private:
  struct Segment {
    uint64_t first = 0;
    uint64_t last = 0;  // inclusive
    uint64_t next = 0;  // cursor
    bool done() const { return next > last; }
  };

  struct FileSlot {
    DownloadTask task;
    std::mutex mutex;   // guards segment bookkeeping below
    std::vector<Segment> segments;
    std::size_t active_segment_jobs = 0;
    uint64_t unsaved_bytes = 0;
    bool segment_failed = false;
    bool finished = false;
    TaskResult result;
  };

  struct Job {
    std::size_t slot = 0;
    std::optional<std::size_t> segment;
  };

  enum class FetchEnd { Completed, Aborted, Failed };

  std::vector<std::size_t> order_tasks() const;
  std::optional<Job> take_job();
  void push_jobs(const std::vector<Job>& jobs, bool front);
  void worker_loop();

  void process_file(std::size_t index);
  void process_segment(std::size_t index, std::size_t segment);
  bool should_segment(const DownloadTask& task) const;
  void start_segmented(std::size_t index);
  void finish_segmented(std::size_t index);

  FetchEnd fetch_whole(FileSlot& slot);
  FetchEnd fetch_segment(FileSlot& slot, std::size_t segment);
  bool backoff(FileSlot& slot, const std::string& error, std::size_t attempt);

  void verify_and_commit(std::size_t index);
  void finalize(std::size_t index, TaskOutcome outcome, const std::string& error = std::string());

  bool load_segments(FileSlot& slot);
  void save_segments_locked(FileSlot& slot);
  void discard_partial(const std::string& relative_path);

  void emit(SyncEvent::Type type, const DownloadTask& task, uint64_t done, std::string message = std::string());
  void track_in_flight(int delta);

  Options options_;
  RangeFetcher fetcher_;
  std::shared_ptr<Logger> logger_;
  IntegrityVerifier verifier_;
  CancelToken cancel_;
  EventChannel<SyncEvent> events_;

  std::vector<std::unique_ptr<FileSlot>> slots_;
  std::mutex job_mutex_;
  std::condition_variable job_cv_;
  std::deque<Job> job_queue_;
  std::size_t unfinished_ = 0;

  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_in_flight_{0};
  std::atomic<uint64_t> bytes_transferred_{0};
};
