#pragma once

#include <cstdint>
#include <string>

enum class ModFileStatus {
  Missing,
  Mismatched,
  Verified,
  Downloading,
  Failed,
  Quarantined
};

inline const char* to_string(ModFileStatus status) {
  switch(status) {
    case ModFileStatus::Missing:     return "missing";
    case ModFileStatus::Mismatched:  return "mismatched";
    case ModFileStatus::Verified:    return "verified";
    case ModFileStatus::Downloading: return "downloading";
    case ModFileStatus::Failed:      return "failed";
    case ModFileStatus::Quarantined: return "quarantined";
  }
  return "unknown";
}

// One file of the working set, created from the manifest diff.
struct ModFile {
  std::string relative_path;
  std::string expected_hash;
  uint64_t expected_size = 0;
  ModFileStatus status = ModFileStatus::Missing;
};
