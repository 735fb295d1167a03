#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

struct ManifestEntry {
  std::string hash; // lowercase sha256 hex
  uint64_t size = 0;
  int64_t mtime = 0; // server-side only, used to reuse hashes between scans

  bool operator==(const ManifestEntry& other) const {
    return hash == other.hash && size == other.size;
  }
  bool operator!=(const ManifestEntry& other) const { return !(*this == other); }
};

// Immutable snapshot of the served directory. Shared between threads as
// std::shared_ptr<const Manifest>; a new rebuild produces a new object.
class Manifest {
public:
  using Entries = std::map<std::string, ManifestEntry>;

  Manifest() = default;
  Manifest(Entries entries,
           uint64_t version,
           std::chrono::system_clock::time_point generated_at = std::chrono::system_clock::now());

  const Entries& entries() const { return entries_; }
  uint64_t version() const { return version_; }
  std::chrono::system_clock::time_point generated_at() const { return generated_at_; }

  std::size_t file_count() const { return entries_.size(); }
  uint64_t total_size() const { return total_size_; }
  bool contains(const std::string& relative_path) const;
  std::optional<ManifestEntry> find(const std::string& relative_path) const;

  // Wire form: { "<relative path>": { "hash": "...", "size": N }, ... }
  nlohmann::json to_json() const;

  // Accepts the wire form above, or an object carrying it under "files"
  // (older servers). Throws ManifestError on malformed input.
  static Manifest from_json(const nlohmann::json& doc, uint64_t version = 0);

private:
  Entries entries_;
  uint64_t version_ = 0;
  std::chrono::system_clock::time_point generated_at_{};
  uint64_t total_size_ = 0;
};

using ManifestSnapshot = std::shared_ptr<const Manifest>;

// Relative paths on the wire always use '/', never escape the root and never
// name a hidden component.
bool is_safe_relative_path(const std::string& relative_path);

// JSON strings must be valid UTF-8; names failing this cannot be published.
bool is_valid_utf8(const std::string& text);
