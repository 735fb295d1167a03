#include "integrity_verifier.hpp"

#include <algorithm>
#include <system_error>

#include "errors.hpp"
#include "hashing.hpp"
#include "settings_manager.hpp"

IntegrityVerifier::IntegrityVerifier(std::size_t max_mismatch_cycles)
  : max_mismatch_cycles_(std::max<std::size_t>(1, max_mismatch_cycles)) {}

IntegrityVerifier::Verdict IntegrityVerifier::verify(const std::filesystem::path& file,
                                                      const std::string& expected_hash,
                                                      uint64_t expected_size) const {
  Verdict verdict;
  std::error_code ec;
  verdict.actual_size = static_cast<uint64_t>(std::filesystem::file_size(file, ec));
  if(ec) {
    throw ResourceError("cannot stat " + file.string(), ec);
  }
  if(verdict.actual_size != expected_size) {
    return verdict;
  }
  auto hash = sha256_file(file);
  if(!hash) {
    throw ResourceError("cannot read " + file.string());
  }
  verdict.actual_hash = std::move(*hash);
  verdict.matches = (verdict.actual_hash == SettingsManager::to_lower(expected_hash));
  return verdict;
}
