#pragma once

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include "http.hpp"
#include "log.hpp"

// One accepted HTTP connection: reads a single request, writes the reply
// produced by the router and closes. All handlers run on the socket's strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using Router = std::function<HttpReply(const HttpRequest&)>;

  static std::shared_ptr<Connection> create(asio::ip::tcp::socket socket,
                                            const Router& router,
                                            std::shared_ptr<Logger> logger,
                                            std::chrono::milliseconds io_timeout);

  ~Connection();

  void start();

private:
  Connection(asio::ip::tcp::socket socket,
             const Router& router,
             std::shared_ptr<Logger> logger,
             std::chrono::milliseconds io_timeout);

  void do_read();
  void handle_request(const std::string& head);
  void send_reply();
  void write_head();
  void write_body_chunk();
  void arm_deadline();
  void close();

  static constexpr std::size_t kMaxRequestHead = 16 * 1024;
  static constexpr std::size_t kBodyChunk = 64 * 1024;

  asio::ip::tcp::socket socket_;
  asio::steady_timer deadline_;
  Router router_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds io_timeout_;

  asio::streambuf read_buf_;
  std::string head_;
  HttpReply reply_;
  std::ifstream file_;
  uint64_t remaining_ = 0;
  uint64_t generated_offset_ = 0;
  std::array<char, kBodyChunk> chunk_{};
  bool closed_ = false;
};
