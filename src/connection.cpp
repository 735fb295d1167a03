#include "connection.hpp"

#include <algorithm>

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket socket,
                                               const Router& router,
                                               std::shared_ptr<Logger> logger,
                                               std::chrono::milliseconds io_timeout) {
  return std::shared_ptr<Connection>(new Connection(std::move(socket), router, std::move(logger), io_timeout));
}

Connection::Connection(asio::ip::tcp::socket socket,
                       const Router& router,
                       std::shared_ptr<Logger> logger,
                       std::chrono::milliseconds io_timeout)
  : socket_(std::move(socket)),
    deadline_(socket_.get_executor()),
    router_(router),
    logger_(std::move(logger)),
    io_timeout_(io_timeout),
    read_buf_(kMaxRequestHead) {}

Connection::~Connection() {
  std::error_code ec;
  socket_.close(ec);
}

void Connection::start() {
  do_read();
}

void Connection::arm_deadline() {
  auto self = shared_from_this();
  deadline_.expires_after(io_timeout_);
  deadline_.async_wait([this, self](const std::error_code& ec){
    if(ec) return; // re-armed or cancelled
    logger_->debug("Connection timed out");
    close();
  });
}

void Connection::close() {
  if(closed_) return;
  closed_ = true;
  std::error_code ec;
  deadline_.cancel();
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

void Connection::do_read() {
  auto self = shared_from_this();
  arm_deadline();
  asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
    [this, self](std::error_code ec, std::size_t bytes){
      if(ec) {
        if(ec == asio::error::not_found) {
          reply_ = HttpReply{};
          reply_.status = 400;
          reply_.body = "request header too large\n";
          send_reply();
          return;
        }
        if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
          logger_->debug("Connection read error: {}", ec.message());
        }
        close();
        return;
      }
      std::string head(asio::buffers_begin(read_buf_.data()),
                       asio::buffers_begin(read_buf_.data()) + static_cast<std::ptrdiff_t>(bytes));
      read_buf_.consume(bytes);
      handle_request(head);
    });
}

void Connection::handle_request(const std::string& head) {
  auto request = parse_http_request(head);
  reply_ = HttpReply{};
  if(!request) {
    reply_.status = 400;
    reply_.body = "malformed request\n";
  } else if(request->method != "GET" && request->method != "HEAD") {
    reply_.status = 405;
    reply_.headers.emplace_back("Allow", "GET, HEAD");
    reply_.body = "method not allowed\n";
  } else {
    try {
      reply_ = router_(*request);
    } catch(const std::exception& e) {
      logger_->error("Handler for {} failed: {}", request->target, e.what());
      reply_ = HttpReply{};
      reply_.status = 500;
      reply_.body = "internal error\n";
    }
    reply_.head_only = (request->method == "HEAD");
  }
  send_reply();
}

void Connection::send_reply() {
  if(reply_.file && !reply_.head_only) {
    file_.open(*reply_.file, std::ios::binary);
    if(file_) file_.seekg(static_cast<std::streamoff>(reply_.file_offset));
    if(!file_) {
      logger_->warn("Unable to open {} for reading", reply_.file->string());
      reply_ = HttpReply{};
      reply_.status = 404;
      reply_.body = "not found\n";
    }
  }
  head_ = build_response_head(reply_);
  if(!reply_.head_only && !reply_.file && !reply_.generated) {
    head_ += reply_.body;
    remaining_ = 0;
  } else {
    remaining_ = reply_.head_only ? 0 : reply_.content_length();
  }
  write_head();
}

void Connection::write_head() {
  auto self = shared_from_this();
  arm_deadline();
  asio::async_write(socket_, asio::buffer(head_),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        logger_->debug("Connection write error: {}", ec.message());
        close();
        return;
      }
      write_body_chunk();
    });
}

void Connection::write_body_chunk() {
  if(remaining_ == 0) {
    close();
    return;
  }
  auto length = static_cast<std::size_t>(std::min<uint64_t>(remaining_, chunk_.size()));
  if(reply_.file) {
    file_.read(chunk_.data(), static_cast<std::streamsize>(length));
    if(file_.gcount() != static_cast<std::streamsize>(length)) {
      // File shrank under us; the client sees a short body and retries.
      logger_->warn("Short read from {}", reply_.file->string());
      close();
      return;
    }
  } else {
    for(std::size_t i = 0; i < length; ++i) {
      chunk_[i] = static_cast<char>((generated_offset_ + i) & 0xFF);
    }
    generated_offset_ += length;
  }
  remaining_ -= length;

  auto self = shared_from_this();
  arm_deadline();
  asio::async_write(socket_, asio::buffer(chunk_.data(), length),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        logger_->debug("Connection write error: {}", ec.message());
        close();
        return;
      }
      write_body_chunk();
    });
}
