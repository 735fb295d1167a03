#include "file_watcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "manifest_service.hpp"

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB |
                                IN_DELETE_SELF | IN_MOVE_SELF;

// Upper bound on one poll() so stop() is noticed promptly.
constexpr std::chrono::milliseconds kPollTick{100};

} // namespace

const char* to_string(FileWatcher::Mode mode) {
  switch(mode) {
    case FileWatcher::Mode::Stopped: return "stopped";
    case FileWatcher::Mode::Inotify: return "inotify";
    case FileWatcher::Mode::Polling: return "polling";
  }
  return "unknown";
}

FileWatcher::FileWatcher(ManifestService& service, Options options, std::shared_ptr<Logger> logger)
  : service_(service),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("watcher")) {
  if(options_.debounce.count() <= 0) options_.debounce = std::chrono::milliseconds(500);
  if(options_.rescan_interval.count() <= 0) options_.rescan_interval = std::chrono::seconds(30);
}

FileWatcher::~FileWatcher() {
  stop();
}

void FileWatcher::start() {
  if(thread_.joinable()) return;
  stop_requested_ = false;
  if(!options_.force_polling && open_inotify()) {
    mode_ = Mode::Inotify;
  } else {
    mode_ = Mode::Polling;
  }
  logger_->info("Watching {} ({})", service_.root().string(), to_string(mode_.load()));
  thread_ = std::thread([this]{ run(); });
}

void FileWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
  close_inotify();
  mode_ = Mode::Stopped;
}

bool FileWatcher::wait_stop_for(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return stop_cv_.wait_for(lock, delay, [this]{ return stop_requested_.load(); });
}

void FileWatcher::run() {
  if(mode_ == Mode::Inotify) {
    run_inotify();
  }
  if(!stop_requested_) {
    run_polling();
  }
}

void FileWatcher::trigger_rebuild(const char* reason) {
  ++rebuilds_triggered_;
  logger_->debug("Rebuilding manifest ({})", reason);
  if(!service_.rebuild()) {
    logger_->warn("Manifest rebuild did not publish; serving v{}", service_.version());
  }
}

void FileWatcher::run_inotify() {
  using clock = std::chrono::steady_clock;
  bool dirty = false;
  auto debounce_deadline = clock::time_point::max();
  auto next_safety_scan = options_.scan_interval.count() > 0
    ? clock::now() + options_.scan_interval
    : clock::time_point::max();

  while(!stop_requested_) {
    auto now = clock::now();
    auto next_deadline = std::min(debounce_deadline, next_safety_scan);
    auto wait = kPollTick;
    if(next_deadline != clock::time_point::max()) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next_deadline - now);
      wait = std::max(std::chrono::milliseconds(0), std::min(wait, remaining));
    }

    pollfd pfd{inotify_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if(ready < 0 && errno != EINTR) {
      logger_->warn("inotify poll failed: {}; falling back to polling", std::strerror(errno));
      break;
    }
    if(ready > 0) {
      bool saw_mutation = false;
      if(!drain_events(saw_mutation)) {
        logger_->warn("inotify watch lost; falling back to polling every {} ms",
                      options_.rescan_interval.count());
        break;
      }
      if(saw_mutation) {
        dirty = true;
        debounce_deadline = clock::now() + options_.debounce;
      }
    }

    now = clock::now();
    if(dirty && now >= debounce_deadline) {
      dirty = false;
      debounce_deadline = clock::time_point::max();
      trigger_rebuild("change");
      if(next_safety_scan != clock::time_point::max()) {
        next_safety_scan = clock::now() + options_.scan_interval;
      }
    } else if(now >= next_safety_scan) {
      trigger_rebuild("periodic");
      next_safety_scan = clock::now() + options_.scan_interval;
    }
  }

  close_inotify();
  if(!stop_requested_) {
    mode_ = Mode::Polling;
    // Events may have been lost, so the current manifest can't be trusted.
    service_.note_mutation();
    trigger_rebuild("watch fallback");
  }
}

void FileWatcher::run_polling() {
  auto interval = options_.rescan_interval;
  if(options_.scan_interval.count() > 0) interval = std::min(interval, options_.scan_interval);
  while(!wait_stop_for(interval)) {
    trigger_rebuild("poll");
  }
}

bool FileWatcher::open_inotify() {
  inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(inotify_fd_ < 0) {
    logger_->warn("inotify_init1 failed: {}", std::strerror(errno));
    return false;
  }
  if(!add_watch_tree(service_.root())) {
    close_inotify();
    return false;
  }
  return true;
}

void FileWatcher::close_inotify() {
  if(inotify_fd_ >= 0) {
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  watches_.clear();
  root_wd_ = -1;
}

bool FileWatcher::add_watch_tree(const fs::path& dir) {
  int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
  if(wd < 0) {
    // A subdirectory removed right after it appeared is not a watch failure.
    if(errno == ENOENT && dir != service_.root()) return true;
    logger_->warn("inotify_add_watch({}) failed: {}", dir.string(), std::strerror(errno));
    return false;
  }
  watches_[wd] = dir;
  if(dir == service_.root()) root_wd_ = wd;

  std::error_code ec;
  for(fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if(!it->is_directory(type_ec)) continue;
    if(ManifestService::is_ignored_name(it->path().filename().string())) continue;
    if(!add_watch_tree(it->path())) return false;
  }
  return true;
}

bool FileWatcher::drain_events(bool& saw_mutation) {
  alignas(inotify_event) char buffer[16 * 1024];
  while(true) {
    ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
    if(length < 0) {
      if(errno == EAGAIN || errno == EWOULDBLOCK) return true;
      if(errno == EINTR) continue;
      logger_->warn("inotify read failed: {}", std::strerror(errno));
      return false;
    }
    if(length == 0) return true;

    for(char* ptr = buffer; ptr < buffer + length;) {
      const auto* event = reinterpret_cast<const inotify_event*>(ptr);
      ptr += sizeof(inotify_event) + event->len;

      if(event->mask & IN_Q_OVERFLOW) {
        logger_->warn("inotify queue overflow");
        return false;
      }
      if(event->mask & IN_IGNORED) {
        watches_.erase(event->wd);
        if(event->wd == root_wd_) return false;
        continue;
      }
      if((event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) && event->wd == root_wd_) {
        return false;
      }

      std::string name = event->len > 0 ? std::string(event->name) : std::string();
      if(!name.empty() && ManifestService::is_ignored_name(name)) continue;

      auto dir = watches_.find(event->wd);
      if((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) &&
         dir != watches_.end() && !name.empty()) {
        // Files may already exist inside before the watch is in place; the
        // rebuild that follows picks them up.
        if(!add_watch_tree(dir->second / name)) return false;
      }

      ++events_seen_;
      service_.note_mutation();
      saw_mutation = true;
    }
  }
}
