#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

// Compares a completed local file with its manifest entry and decides when
// repeated mismatches stop being retried.
class IntegrityVerifier {
public:
  struct Verdict {
    bool matches = false;
    uint64_t actual_size = 0;
    std::string actual_hash; // empty when the size already disagreed
  };

  explicit IntegrityVerifier(std::size_t max_mismatch_cycles = 2);

  // Throws ResourceError if the file cannot be read.
  Verdict verify(const std::filesystem::path& file,
                 const std::string& expected_hash,
                 uint64_t expected_size) const;

  // `mismatch_cycles` counts mismatches seen so far, including the current one.
  bool should_quarantine(std::size_t mismatch_cycles) const {
    return mismatch_cycles >= max_mismatch_cycles_;
  }

  std::size_t max_mismatch_cycles() const { return max_mismatch_cycles_; }

private:
  std::size_t max_mismatch_cycles_;
};
