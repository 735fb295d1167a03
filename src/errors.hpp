#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

// Network-level failure talking to the sync server. Transient failures
// (timeouts, resets, 5xx, 408/429) are worth retrying; others are not.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what, bool transient = true, int status = 0)
    : std::runtime_error(what), transient_(transient), status_(status) {}

  bool transient() const { return transient_; }
  int status() const { return status_; }

  static bool status_is_transient(int status) {
    return status >= 500 || status == 408 || status == 429;
  }

private:
  bool transient_;
  int status_;
};

// Local disk failure (permission denied, disk full, ...). Retrying cannot help.
class ResourceError : public std::runtime_error {
public:
  ResourceError(const std::string& what, std::error_code code = {})
    : std::runtime_error(code ? what + ": " + code.message() : what), code_(code) {}

  std::error_code code() const { return code_; }

private:
  std::error_code code_;
};

// Malformed manifest document or a directory that cannot be enumerated.
class ManifestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
