#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "manifest.hpp"
#include "mod_file.hpp"

// Persistent path -> {hash, size, mtime} cache so unchanged local files are
// not rehashed on every sync. Stored as JSON under .modsync/cache.json.
class HashCache {
public:
  struct Entry {
    std::string hash;
    uint64_t size = 0;
    int64_t mtime = 0;
  };

  explicit HashCache(std::filesystem::path file);

  // A missing file is an empty cache; a corrupt one is discarded with a warning.
  void load();
  bool save() const;

  std::optional<std::string> lookup(const std::string& relative_path, uint64_t size, int64_t mtime) const;
  void record(const std::string& relative_path, Entry entry);
  void forget(const std::string& relative_path);
  std::size_t size() const { return entries_.size(); }
  const std::filesystem::path& file() const { return file_; }

private:
  std::filesystem::path file_;
  std::map<std::string, Entry> entries_;
};

// What the client holds on disk relative to a manifest.
class LocalState {
public:
  explicit LocalState(std::filesystem::path content_dir, std::shared_ptr<Logger> logger = nullptr);

  // One ModFile per manifest entry, classified Missing / Mismatched /
  // Verified. Entries with unsafe paths are dropped.
  std::vector<ModFile> classify(const Manifest& manifest);

  // Regular files under the content directory that the manifest does not
  // list. Hidden entries and the .modsync staging area are never reported.
  std::vector<std::string> extraneous_files(const Manifest& manifest) const;
  std::size_t delete_extraneous(const Manifest& manifest);

  // Caches the hash of a file that was just verified in place.
  void record_verified(const ModFile& file);
  bool save_cache() const { return cache_.save(); }

  HashCache& cache() { return cache_; }
  const std::filesystem::path& content_dir() const { return content_dir_; }

private:
  std::filesystem::path content_dir_;
  std::shared_ptr<Logger> logger_;
  HashCache cache_;
};
