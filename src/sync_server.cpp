#include "sync_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

#include "manifest.hpp"

namespace fs = std::filesystem;

namespace {

HttpReply text_reply(int status, std::string body) {
  HttpReply reply;
  reply.status = status;
  reply.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
  reply.body = std::move(body);
  return reply;
}

HttpReply json_reply(const nlohmann::json& doc) {
  HttpReply reply;
  reply.headers.emplace_back("Content-Type", "application/json");
  reply.body = doc.dump();
  return reply;
}

} // namespace

SyncServer::SyncServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("server")) {
  if(options_.served_dir.empty()) {
    throw std::invalid_argument("served_dir must be set");
  }
  if(options_.io_threads == 0) options_.io_threads = 1;
  options_.speedtest_bytes = std::min(options_.speedtest_bytes, kMaxSpeedtestBytes);

  ManifestService::Options manifest_options;
  manifest_options.root = options_.served_dir;
  manifest_ = std::make_unique<ManifestService>(manifest_options, std::make_shared<Logger>("manifest"));
  router_ = [this](const HttpRequest& request){ return handle(request); };
}

SyncServer::~SyncServer() {
  stop();
}

void SyncServer::start() {
  if(started_) return;

  std::error_code ec;
  fs::create_directories(options_.served_dir, ec);
  if(!manifest_->rebuild()) {
    logger_->warn("Initial scan of {} failed; serving an empty manifest", options_.served_dir.string());
  }

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();

  started_ = true;
  started_at_ = std::chrono::steady_clock::now();
  start_accept();

  if(options_.monitoring) {
    watcher_ = std::make_unique<FileWatcher>(*manifest_, options_.watcher, std::make_shared<Logger>("watcher"));
    watcher_->start();
  } else {
    logger_->info("Filesystem monitoring disabled; use /force_scan to rebuild");
  }

  logger_->info("Serving {} on {}:{} (manifest v{}, {} files)",
                options_.served_dir.string(), options_.listen_ip, listen_port_,
                manifest_->version(), manifest_->current()->file_count());
}

void SyncServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else {
        ++requests_;
        Connection::create(std::move(socket), router_, logger_, options_.io_timeout)->start();
      }
      if(started_) {
        start_accept();
      }
    });
}

void SyncServer::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(std::size_t i = 0; i < options_.io_threads; ++i) {
    io_threads_.emplace_back([this]{ io_.run(); });
  }
}

void SyncServer::stop() {
  if(!started_.exchange(false)) return;

  if(watcher_) {
    watcher_->stop();
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }

  io_.stop();
  for(auto& thread : io_threads_) {
    if(thread.joinable()) thread.join();
  }
  io_threads_.clear();
  acceptor_.reset();
  io_.restart();
}

SyncServer::Stats SyncServer::stats() const {
  Stats s;
  auto snapshot = manifest_->current();
  s.requests = requests_.load();
  s.manifest_version = snapshot->version();
  s.files = snapshot->file_count();
  s.total_bytes = snapshot->total_size();
  s.watch_mode = watcher_ ? watcher_->mode() : FileWatcher::Mode::Stopped;
  return s;
}

HttpReply SyncServer::handle(const HttpRequest& request) {
  const auto& path = request.path;
  if(path == "/ping") return text_reply(200, "pong");
  if(path == "/speedtest") return serve_speedtest(request);
  if(path == "/status") return serve_status();
  if(path == "/force_scan") return serve_force_scan();

  // One snapshot per request: the listing and the manifest are never mixed.
  auto manifest = manifest_->current();
  if(path == "/") return serve_index(manifest);
  if(path == "/hashes.json") return serve_manifest(manifest);
  return serve_file(request);
}

HttpReply SyncServer::serve_index(const ManifestSnapshot& manifest) const {
  std::string html = "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>modsync</title></head><body>\n";
  html += "<h1>modsync: " + std::to_string(manifest->file_count()) + " files, manifest v" +
          std::to_string(manifest->version()) + "</h1>\n<ul>\n";
  for(const auto& item : manifest->entries()) {
    html += "<li><a href=\"/" + percent_encode_path(item.first) + "\">" + html_escape(item.first) +
            "</a> (" + std::to_string(item.second.size) + " bytes)</li>\n";
  }
  html += "</ul>\n</body></html>\n";

  HttpReply reply;
  reply.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
  reply.body = std::move(html);
  return reply;
}

HttpReply SyncServer::serve_manifest(const ManifestSnapshot& manifest) const {
  auto reply = json_reply(manifest->to_json());
  reply.headers.emplace_back("X-Manifest-Version", std::to_string(manifest->version()));
  reply.headers.emplace_back("Cache-Control", "no-cache");
  return reply;
}

HttpReply SyncServer::serve_file(const HttpRequest& request) const {
  auto relative = request.path.substr(1);
  if(!is_safe_relative_path(relative) || ManifestService::is_ignored(fs::path(relative))) {
    return text_reply(403, "forbidden\n");
  }
  auto full_path = options_.served_dir / fs::path(relative);

  std::error_code ec;
  if(!fs::is_regular_file(full_path, ec)) {
    return text_reply(404, "not found\n");
  }
  auto size = fs::file_size(full_path, ec);
  if(ec) {
    return text_reply(404, "not found\n");
  }

  HttpReply reply;
  reply.headers.emplace_back("Content-Type", "application/octet-stream");
  reply.headers.emplace_back("Accept-Ranges", "bytes");
  reply.file = full_path;
  reply.file_offset = 0;
  reply.body_length = size;

  auto range_header = request.header("Range");
  if(!range_header.empty()) {
    auto range = parse_range_header(range_header, size);
    if(range.status == RangeStatus::Unsatisfiable) {
      auto unsatisfiable = text_reply(416, "range not satisfiable\n");
      unsatisfiable.headers.emplace_back("Content-Range", "bytes */" + std::to_string(size));
      return unsatisfiable;
    }
    if(range.status == RangeStatus::Satisfiable) {
      reply.status = 206;
      reply.file_offset = range.range.first;
      reply.body_length = range.range.length();
      reply.headers.emplace_back("Content-Range",
        "bytes " + std::to_string(range.range.first) + "-" + std::to_string(range.range.last) +
        "/" + std::to_string(size));
    }
  }
  return reply;
}

HttpReply SyncServer::serve_speedtest(const HttpRequest& request) const {
  uint64_t size = options_.speedtest_bytes;
  auto query = parse_query(request.query);
  auto it = query.find("size");
  if(it != query.end()) {
    try {
      size = std::min<uint64_t>(std::stoull(it->second), kMaxSpeedtestBytes);
    } catch(const std::exception&) {
      return text_reply(400, "invalid size\n");
    }
  }
  HttpReply reply;
  reply.headers.emplace_back("Content-Type", "application/octet-stream");
  reply.headers.emplace_back("Cache-Control", "no-store");
  reply.generated = true;
  reply.body_length = size;
  return reply;
}

HttpReply SyncServer::serve_status() const {
  auto s = stats();
  auto manifest_stats = manifest_->stats();
  auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::now() - started_at_).count();
  nlohmann::json doc = {
    {"version", s.manifest_version},
    {"files", s.files},
    {"total_size", s.total_bytes},
    {"uptime_seconds", uptime},
    {"requests", s.requests},
    {"monitoring", options_.monitoring ? to_string(s.watch_mode) : "disabled"},
    {"rebuilds", manifest_stats.rebuilds},
    {"failed_rebuilds", manifest_stats.failed_rebuilds},
    {"last_rebuild_ms", manifest_stats.last_duration.count()},
    {"last_error", manifest_stats.last_error}
  };
  return json_reply(doc);
}

HttpReply SyncServer::serve_force_scan() {
  bool ok = manifest_->rebuild();
  nlohmann::json doc = {
    {"ok", ok},
    {"version", manifest_->version()},
    {"files", manifest_->current()->file_count()}
  };
  auto reply = json_reply(doc);
  if(!ok) reply.status = 503;
  return reply;
}
