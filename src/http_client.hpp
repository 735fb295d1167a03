#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "http.hpp"

class CancelToken;

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers; // lowercase names
  std::string body;

  std::string header(const std::string& name) const;
};

struct HttpClientOptions {
  std::chrono::milliseconds timeout{30000};
};

// Blocking HTTP/1.1 client for one server. Every connect, write and read is
// bounded by the configured timeout; non-2xx responses raise TransportError
// carrying the status.
class HttpClient {
public:
  using Options = HttpClientOptions;

  // Receives the response head once, then each body block. Returning false
  // aborts the transfer.
  using BodyHandler = std::function<bool(const HttpResponse& head, const char* data, std::size_t size)>;

  explicit HttpClient(const std::string& base_url, Options options = {});

  HttpResponse get(const std::string& target, const HttpHeaders& headers = {});

  // Returns false if the handler or the cancel token stopped the transfer.
  bool stream(const std::string& target,
              const HttpHeaders& headers,
              const BodyHandler& on_body,
              const CancelToken* cancel = nullptr);

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  std::chrono::milliseconds timeout() const { return options_.timeout; }

private:
  std::string host_;
  uint16_t port_ = 80;
  std::string base_path_;
  Options options_;
};
