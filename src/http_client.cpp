#include "http_client.hpp"

#include <asio.hpp>

#include <sstream>
#include <stdexcept>
#include <vector>

#include "cancel_token.hpp"
#include "errors.hpp"
#include "settings_manager.hpp"

namespace {

using tcp = asio::ip::tcp;

// Granularity at which a blocked operation re-checks its deadline and the
// cancel token.
constexpr std::chrono::milliseconds kWaitSlice{50};
constexpr std::size_t kReadBlock = 64 * 1024;

// One request/response exchange on a private io_context. Each asynchronous
// step is driven to completion by wait(), which enforces the timeout.
class Exchange {
public:
  Exchange(std::chrono::milliseconds timeout, const CancelToken* cancel)
    : socket_(io_), timeout_(timeout), cancel_(cancel) {}

  ~Exchange() {
    std::error_code ec;
    socket_.close(ec);
  }

  tcp::socket& socket() { return socket_; }
  asio::io_context& io() { return io_; }

  // Returns false if cancelled; throws TransportError on timeout.
  bool wait(const std::string& what) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    io_.restart();
    while(true) {
      io_.run_for(kWaitSlice);
      if(io_.stopped()) return true;
      if(cancel_ && cancel_->cancelled()) {
        abort();
        return false;
      }
      if(std::chrono::steady_clock::now() >= deadline) {
        abort();
        throw TransportError(what + " timed out");
      }
    }
  }

private:
  void abort() {
    std::error_code ec;
    socket_.close(ec);
    io_.restart();
    io_.run();
  }

  asio::io_context io_;
  tcp::socket socket_;
  std::chrono::milliseconds timeout_;
  const CancelToken* cancel_;
};

void parse_response_head(const std::string& head, HttpResponse& response) {
  std::istringstream stream(head);
  std::string line;
  if(!std::getline(stream, line)) throw TransportError("empty response");
  if(!line.empty() && line.back() == '\r') line.pop_back();
  std::istringstream status_line(line);
  std::string version;
  if(!(status_line >> version >> response.status) || version.rfind("HTTP/", 0) != 0) {
    throw TransportError("malformed status line: " + line);
  }
  while(std::getline(stream, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    response.headers[SettingsManager::to_lower(SettingsManager::trim_copy(line.substr(0, colon)))] =
      SettingsManager::trim_copy(line.substr(colon + 1));
  }
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(SettingsManager::to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient(const std::string& base_url, Options options)
  : options_(options) {
  const std::string scheme = "http://";
  if(base_url.rfind(scheme, 0) != 0) {
    throw std::invalid_argument("server URL must start with http:// (got '" + base_url + "')");
  }
  auto rest = base_url.substr(scheme.size());
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if(slash != std::string::npos) {
    base_path_ = rest.substr(slash);
    while(!base_path_.empty() && base_path_.back() == '/') base_path_.pop_back();
  }

  std::string port_text;
  if(!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if(close == std::string::npos) throw std::invalid_argument("bad IPv6 host in '" + base_url + "'");
    host_ = authority.substr(1, close - 1);
    if(close + 1 < authority.size() && authority[close + 1] == ':') port_text = authority.substr(close + 2);
  } else {
    auto colon = authority.rfind(':');
    host_ = authority.substr(0, colon);
    if(colon != std::string::npos) port_text = authority.substr(colon + 1);
  }
  if(host_.empty()) throw std::invalid_argument("missing host in '" + base_url + "'");
  if(!port_text.empty()) {
    int value = 0;
    try {
      value = std::stoi(port_text);
    } catch(const std::exception&) {
      value = -1;
    }
    if(value <= 0 || value > 65535) throw std::invalid_argument("bad port in '" + base_url + "'");
    port_ = static_cast<uint16_t>(value);
  }
  if(options_.timeout.count() <= 0) options_.timeout = std::chrono::seconds(30);
}

HttpResponse HttpClient::get(const std::string& target, const HttpHeaders& headers) {
  HttpResponse response;
  stream(target, headers, [&](const HttpResponse& head, const char* data, std::size_t size){
    if(response.status == 0) {
      response.status = head.status;
      response.headers = head.headers;
    }
    response.body.append(data, size);
    return true;
  });
  return response;
}

bool HttpClient::stream(const std::string& target,
                        const HttpHeaders& headers,
                        const BodyHandler& on_body,
                        const CancelToken* cancel) {
  Exchange exchange(options_.timeout, cancel);
  std::error_code op_ec;
  const auto where = host_ + ":" + std::to_string(port_) + target;

  tcp::resolver resolver(exchange.io());
  tcp::resolver::results_type endpoints;
  resolver.async_resolve(host_, std::to_string(port_),
    [&](std::error_code ec, tcp::resolver::results_type results){
      op_ec = ec;
      endpoints = std::move(results);
    });
  if(!exchange.wait("resolve " + host_)) return false;
  if(op_ec) throw TransportError("resolve " + host_ + " failed: " + op_ec.message());

  asio::async_connect(exchange.socket(), endpoints,
    [&](std::error_code ec, const tcp::endpoint&){ op_ec = ec; });
  if(!exchange.wait("connect to " + where)) return false;
  if(op_ec) throw TransportError("connect to " + where + " failed: " + op_ec.message());

  std::string request = "GET " + base_path_ + target + " HTTP/1.1\r\n";
  request += "Host: " + host_ + ":" + std::to_string(port_) + "\r\n";
  request += "User-Agent: modsync\r\n";
  request += "Connection: close\r\n";
  for(const auto& header : headers) {
    request += header.first + ": " + header.second + "\r\n";
  }
  request += "\r\n";

  asio::async_write(exchange.socket(), asio::buffer(request),
    [&](std::error_code ec, std::size_t){ op_ec = ec; });
  if(!exchange.wait("send " + where)) return false;
  if(op_ec) throw TransportError("send " + where + " failed: " + op_ec.message());

  asio::streambuf buffer;
  std::size_t head_bytes = 0;
  asio::async_read_until(exchange.socket(), buffer, "\r\n\r\n",
    [&](std::error_code ec, std::size_t n){ op_ec = ec; head_bytes = n; });
  if(!exchange.wait("response from " + where)) return false;
  if(op_ec) throw TransportError("response from " + where + " failed: " + op_ec.message());

  HttpResponse head;
  std::string head_text(asio::buffers_begin(buffer.data()),
                        asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(head_bytes));
  buffer.consume(head_bytes);
  parse_response_head(head_text, head);

  if(head.status < 200 || head.status >= 300) {
    throw TransportError("HTTP " + std::to_string(head.status) + " for " + where,
                         TransportError::status_is_transient(head.status), head.status);
  }

  bool has_length = false;
  uint64_t remaining = 0;
  auto length_header = head.header("Content-Length");
  if(!length_header.empty()) {
    try {
      remaining = std::stoull(length_header);
      has_length = true;
    } catch(const std::exception&) {
      throw TransportError("bad Content-Length from " + where, false);
    }
  }

  // Body bytes that arrived together with the head; the handler always sees
  // the head once, even for an empty body.
  std::string early(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  buffer.consume(buffer.size());
  if(has_length && early.size() > remaining) early.resize(static_cast<std::size_t>(remaining));
  if(has_length) remaining -= early.size();
  if(!on_body(head, early.data(), early.size())) return false;

  std::vector<char> block(kReadBlock);
  while(!has_length || remaining > 0) {
    std::size_t received = 0;
    exchange.socket().async_read_some(asio::buffer(block),
      [&](std::error_code ec, std::size_t n){ op_ec = ec; received = n; });
    if(!exchange.wait("body from " + where)) return false;
    if(op_ec == asio::error::eof && !has_length) break;
    if(op_ec) {
      throw TransportError("body from " + where + " interrupted: " + op_ec.message());
    }
    if(cancel && cancel->cancelled()) return false;
    if(has_length) {
      if(received > remaining) received = static_cast<std::size_t>(remaining);
      remaining -= received;
    }
    if(!on_body(head, block.data(), received)) return false;
  }
  return true;
}
