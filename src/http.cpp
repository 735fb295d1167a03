#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "settings_manager.hpp"

namespace {

bool parse_u64(const std::string& text, uint64_t& out) {
  if(text.empty() || text.size() > 20) return false;
  if(!std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    return false;
  }
  try {
    out = std::stoull(text);
  } catch(const std::out_of_range&) {
    return false;
  }
  return true;
}

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(SettingsManager::to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

std::optional<HttpRequest> parse_http_request(const std::string& head) {
  std::istringstream stream(head);
  std::string line;
  if(!std::getline(stream, line)) return std::nullopt;
  if(!line.empty() && line.back() == '\r') line.pop_back();

  HttpRequest request;
  std::istringstream request_line(line);
  std::string version;
  if(!(request_line >> request.method >> request.target >> version)) return std::nullopt;
  if(version.rfind("HTTP/1.", 0) != 0) return std::nullopt;
  if(request.target.empty() || request.target.front() != '/') return std::nullopt;

  while(std::getline(stream, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos) return std::nullopt;
    auto name = SettingsManager::to_lower(SettingsManager::trim_copy(line.substr(0, colon)));
    request.headers[name] = SettingsManager::trim_copy(line.substr(colon + 1));
  }

  auto question = request.target.find('?');
  std::string raw_path = request.target.substr(0, question);
  if(question != std::string::npos) request.query = request.target.substr(question + 1);
  auto decoded = percent_decode(raw_path);
  if(!decoded) return std::nullopt;
  request.path = std::move(*decoded);
  return request;
}

const char* http_status_reason(int status) {
  switch(status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 416: return "Range Not Satisfiable";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
  }
  return "Unknown";
}

std::string build_response_head(const HttpReply& reply) {
  std::string head = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                     http_status_reason(reply.status) + "\r\n";
  for(const auto& header : reply.headers) {
    head += header.first + ": " + header.second + "\r\n";
  }
  head += "Content-Length: " + std::to_string(reply.content_length()) + "\r\n";
  head += "Connection: close\r\n\r\n";
  return head;
}

RangeResult parse_range_header(const std::string& value, uint64_t size) {
  RangeResult result;
  auto spec = SettingsManager::trim_copy(value);
  if(spec.rfind("bytes=", 0) != 0) return result;
  spec = SettingsManager::trim_copy(spec.substr(6));
  if(spec.find(',') != std::string::npos) return result;
  auto dash = spec.find('-');
  if(dash == std::string::npos) return result;

  auto first_text = SettingsManager::trim_copy(spec.substr(0, dash));
  auto last_text = SettingsManager::trim_copy(spec.substr(dash + 1));

  if(first_text.empty()) {
    uint64_t suffix = 0;
    if(!parse_u64(last_text, suffix)) return result;
    if(suffix == 0 || size == 0) {
      result.status = RangeStatus::Unsatisfiable;
      return result;
    }
    result.status = RangeStatus::Satisfiable;
    result.range.first = size - std::min(suffix, size);
    result.range.last = size - 1;
    return result;
  }

  uint64_t first = 0;
  if(!parse_u64(first_text, first)) return result;
  uint64_t last = size == 0 ? 0 : size - 1;
  if(!last_text.empty()) {
    uint64_t requested_last = 0;
    if(!parse_u64(last_text, requested_last) || requested_last < first) return result;
    last = std::min(last, requested_last);
  }
  if(first >= size) {
    result.status = RangeStatus::Unsatisfiable;
    return result;
  }
  result.status = RangeStatus::Satisfiable;
  result.range.first = first;
  result.range.last = last;
  return result;
}

std::optional<ByteRange> parse_content_range(const std::string& value) {
  auto text = SettingsManager::trim_copy(value);
  if(text.rfind("bytes ", 0) != 0) return std::nullopt;
  text = text.substr(6);
  auto dash = text.find('-');
  auto slash = text.find('/');
  if(dash == std::string::npos || slash == std::string::npos || dash > slash) return std::nullopt;
  ByteRange range;
  if(!parse_u64(text.substr(0, dash), range.first)) return std::nullopt;
  if(!parse_u64(text.substr(dash + 1, slash - dash - 1), range.last)) return std::nullopt;
  if(range.last < range.first) return std::nullopt;
  return range;
}

std::optional<std::string> percent_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if(c == '%') {
      if(i + 2 >= value.size()) return std::nullopt;
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if(hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string percent_encode_path(const std::string& path) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for(unsigned char c : path) {
    if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string html_escape(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(char c : value) {
    switch(c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> out;
  std::istringstream stream(query);
  std::string pair;
  while(std::getline(stream, pair, '&')) {
    if(pair.empty()) continue;
    auto eq = pair.find('=');
    auto key = percent_decode(pair.substr(0, eq));
    auto value = percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1));
    if(key && value) out[*key] = *value;
  }
  return out;
}
