#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Minimal HTTP/1.1 pieces shared by the sync server and client.

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;
  std::string target;   // raw request target
  std::string path;     // percent-decoded, without query
  std::string query;
  std::map<std::string, std::string> headers; // lowercase names

  std::string header(const std::string& name) const;
};

// Parses the request line and headers (everything up to the blank line).
std::optional<HttpRequest> parse_http_request(const std::string& head);

struct HttpReply {
  int status = 200;
  HttpHeaders headers;
  std::string body;

  // When set, the body is the byte range [file_offset, file_offset + body_length)
  // of this file and `body` is ignored.
  std::optional<std::filesystem::path> file;
  uint64_t file_offset = 0;
  // Length of a file or generated body; a string body uses body.size().
  uint64_t body_length = 0;
  // Synthetic payload of body_length bytes (speed test).
  bool generated = false;
  bool head_only = false;

  uint64_t content_length() const { return (file || generated) ? body_length : body.size(); }
};

std::string build_response_head(const HttpReply& reply);
const char* http_status_reason(int status);

// Inclusive byte range.
struct ByteRange {
  uint64_t first = 0;
  uint64_t last = 0;
  uint64_t length() const { return last - first + 1; }
};

enum class RangeStatus {
  None,          // no header, or a form we don't serve (multi-range, bad syntax)
  Satisfiable,
  Unsatisfiable
};

struct RangeResult {
  RangeStatus status = RangeStatus::None;
  ByteRange range;
};

// Evaluates a Range header ("bytes=a-b", "bytes=a-", "bytes=-n") against a
// resource of `size` bytes.
RangeResult parse_range_header(const std::string& value, uint64_t size);

// "bytes a-b/size" from a 206 response; nullopt if malformed.
std::optional<ByteRange> parse_content_range(const std::string& value);

std::optional<std::string> percent_decode(const std::string& value);
std::string percent_encode_path(const std::string& path);
std::string html_escape(const std::string& value);

std::map<std::string, std::string> parse_query(const std::string& query);
