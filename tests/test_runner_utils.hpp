#pragma once

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace modsync::test {

// Scratch directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name)
    : root_(std::filesystem::temp_directory_path() /
            (name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter()++))) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& relative) const { return root_ / relative; }

private:
  static int& counter() {
    static int value = 0;
    return value;
  }

  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random content of a given size.
inline std::string make_payload(std::size_t size, unsigned seed = 1) {
  std::string data(size, '\0');
  uint32_t state = seed * 2654435761u + 1;
  for(auto& ch : data) {
    state = state * 1664525u + 1013904223u;
    ch = static_cast<char>(state >> 24);
  }
  return data;
}

// Narrows a directory's permissions until destruction. Permission bits do not
// bind root, so tests check enforced() and skip the locked part when false.
class LockedDirectory {
public:
  explicit LockedDirectory(std::filesystem::path dir,
                           std::filesystem::perms allowed = std::filesystem::perms::none)
    : dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    std::filesystem::permissions(dir_, allowed, std::filesystem::perm_options::replace, ec);
    enforced_ = !ec && ::geteuid() != 0;
  }

  ~LockedDirectory() {
    std::error_code ec;
    std::filesystem::permissions(dir_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
  }

  LockedDirectory(const LockedDirectory&) = delete;
  LockedDirectory& operator=(const LockedDirectory&) = delete;

  bool enforced() const { return enforced_; }

private:
  std::filesystem::path dir_;
  bool enforced_ = false;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_locked(needle);
  }

  bool wait_for_substring(const std::string& needle, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return seen_locked(needle); });
  }

private:
  bool seen_locked(const std::string& needle) const {
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;

  // Logger wired to the capture so failures can dump what happened.
  std::shared_ptr<Logger> logger(const std::string& name) {
    auto out = std::make_shared<Logger>(name);
    logs.attach(out);
    return out;
  }
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Prints one '.' per passing test and 'F' plus captured logs per failure.
inline int run_tests(const std::string& suite, int argc, char** argv, const std::vector<TestCase>& tests) {
  bool verbose = (std::getenv("MODSYNC_TEST_VERBOSE") != nullptr);
  std::vector<std::string> only;
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      only.push_back(arg);
    }
  }

  const bool show_logs = (std::getenv("MODSYNC_TEST_LOGS") != nullptr) || verbose;
  if(!show_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::vector<const TestCase*> selected;
  for(const auto& test : tests) {
    if(only.empty() || std::find(only.begin(), only.end(), test.name) != only.end()) {
      selected.push_back(&test);
    }
  }

  std::size_t failures = 0;
  std::cout << "Running " << selected.size() << " " << suite << " tests: " << std::flush;
  for(std::size_t idx = 0; idx < selected.size(); ++idx) {
    const auto& test = *selected[idx];
    logs.detach_all();
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < selected.size()) {
        std::cout << "Running " << selected.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  logs.detach_all();
  std::cout << "\n";
  if(!show_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << selected.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << selected.size() << " failed)\n";
  return 1;
}

} // namespace modsync::test
