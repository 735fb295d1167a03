#include "errors.hpp"
#include "file_watcher.hpp"
#include "hashing.hpp"
#include "http.hpp"
#include "http_client.hpp"
#include "manifest.hpp"
#include "manifest_service.hpp"
#include "sync_server.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using modsync::test::TempWorkspace;
using modsync::test::TestCase;
using modsync::test::TestContext;
using modsync::test::wait_for_condition;
using modsync::test::write_file;

ManifestService make_service(TestContext& ctx, const fs::path& root) {
  ManifestService::Options options;
  options.root = root;
  return ManifestService(options, ctx.logger("manifest"));
}

HttpRequest request_for(const std::string& target, const std::string& extra_headers = std::string()) {
  auto parsed = parse_http_request("GET " + target + " HTTP/1.1\r\nHost: test\r\n" + extra_headers + "\r\n");
  if(!parsed) throw std::runtime_error("unparseable request for " + target);
  return *parsed;
}

std::string header_of(const HttpReply& reply, const std::string& name) {
  for(const auto& header : reply.headers) {
    if(header.first == name) return header.second;
  }
  return std::string();
}

bool test_ignore_rules(TestContext&) {
  return ManifestService::is_ignored_name(".hidden") &&
         ManifestService::is_ignored_name("upload.jar.filepart") &&
         ManifestService::is_ignored_name("mod.jar.part") &&
         ManifestService::is_ignored_name("hashes.json") &&
         ManifestService::is_ignored_name("speed_test_1024.bin") &&
         !ManifestService::is_ignored_name("speed_test.txt") &&
         !ManifestService::is_ignored_name("core.jar") &&
         ManifestService::is_ignored(fs::path(".git/config")) &&
         ManifestService::is_ignored(fs::path("mods/.cache/a.jar")) &&
         !ManifestService::is_ignored(fs::path("mods/extra/a.jar"));
}

bool test_rebuild_lists_regular_files(TestContext& ctx) {
  TempWorkspace ws("modsync_manifest_scan");
  write_file(ws / "core.jar", "core");
  write_file(ws / "config/options.cfg", "a=1\n");
  write_file(ws / ".hidden", "x");
  write_file(ws / ".cache/inner.jar", "x");
  write_file(ws / "big.jar.filepart", "x");
  write_file(ws / "speed_test_1.bin", "x");
  write_file(ws / "hashes.json", "{}");

  auto service = make_service(ctx, ws.root());
  if(service.version() != 0 || service.current()->file_count() != 0) return false;
  if(!service.rebuild()) return false;

  auto manifest = service.current();
  auto core = manifest->find("core.jar");
  auto cfg = manifest->find("config/options.cfg");
  return manifest->version() == 1 && manifest->file_count() == 2 &&
         core && core->hash == sha256_hex("core") && core->size == 4 &&
         cfg && cfg->hash == sha256_hex("a=1\n") &&
         manifest->total_size() == 8 && !service.rebuild_pending();
}

bool test_hash_reused_for_unchanged_stamp(TestContext& ctx) {
  TempWorkspace ws("modsync_manifest_reuse");
  const auto file = ws / "mod.jar";
  write_file(file, "AAAA");
  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;
  const auto original = service.current()->find("mod.jar");

  // Same size and mtime: the previous hash is trusted without reading the file.
  auto stamp = fs::last_write_time(file);
  write_file(file, "BBBB");
  fs::last_write_time(file, stamp);
  if(!service.rebuild()) return false;
  auto reused = service.current()->find("mod.jar");

  fs::last_write_time(file, stamp + 5s);
  if(!service.rebuild()) return false;
  auto rehashed = service.current()->find("mod.jar");

  return original && reused && rehashed &&
         reused->hash == original->hash &&
         rehashed->hash == sha256_hex("BBBB") &&
         service.version() == 3;
}

bool test_failed_scan_keeps_snapshot(TestContext& ctx) {
  TempWorkspace ws("modsync_manifest_fail");
  const auto root = ws / "served";
  write_file(root / "a.jar", "a");
  auto service = make_service(ctx, root);
  if(!service.rebuild()) return false;
  auto before = service.current();

  fs::remove_all(root);
  bool published = service.rebuild();
  auto after = service.current();
  auto stats = service.stats();
  bool missing_root_ok = !published && after == before && after->contains("a.jar") &&
                         stats.failed_rebuilds == 1 && stats.rebuilds == 1 && !stats.last_error.empty();
  if(!missing_root_ok) return false;

  // An unreadable subdirectory halfway through the walk aborts the rebuild
  // instead of publishing whatever was listed before it.
  const auto tree = ws / "tree";
  write_file(tree / "a_locked/inner.jar", "inner");
  for(const char* name : {"b.jar", "c.jar", "d.jar", "z.jar"}) write_file(tree / name, name);
  auto walker = make_service(ctx, tree);
  if(!walker.rebuild() || walker.current()->file_count() != 5) return false;
  auto full = walker.current();

  modsync::test::LockedDirectory locked(tree / "a_locked");
  if(!locked.enforced()) {
    if(ctx.verbose) std::cout << "    permissions not enforced for this user, skipping\n";
    return true;
  }
  bool partial_published = walker.rebuild();
  auto kept = walker.current();
  return !partial_published && kept == full && kept->version() == 1 &&
         kept->contains("z.jar") && kept->contains("a_locked/inner.jar") &&
         walker.stats().failed_rebuilds == 1 &&
         walker.stats().last_error.find("a_locked") != std::string::npos;
}

bool test_names_outside_utf8_are_skipped(TestContext& ctx) {
  TempWorkspace ws("modsync_manifest_utf8");
  write_file(ws / "core.jar", "core");
  write_file(ws / "bad\xffname.jar", "bad");
  write_file(ws / "dir\xc3/inner.jar", "inner");
  write_file(ws / "caf\xc3\xa9.cfg", "ok");

  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;
  auto manifest = service.current();

  std::string wire;
  try {
    wire = manifest->to_json().dump();
  } catch(const nlohmann::json::exception&) {
    return false;
  }
  return manifest->file_count() == 2 && manifest->contains("core.jar") &&
         manifest->contains("caf\xc3\xa9.cfg") && !wire.empty() &&
         ctx.logs.contains("not valid UTF-8");
}

bool test_utf8_validation(TestContext&) {
  return is_valid_utf8("mods/plain.jar") && is_valid_utf8("caf\xc3\xa9") &&
         is_valid_utf8("\xe2\x82\xac") && is_valid_utf8("\xf0\x9f\x98\x80") &&
         !is_valid_utf8("\xff") && !is_valid_utf8("cut\xc3") && !is_valid_utf8("\xe2\x82") &&
         !is_valid_utf8("\xc0\xaf") && !is_valid_utf8("\xed\xa0\x80") &&
         !is_valid_utf8("\xf4\x90\x80\x80");
}

bool test_readers_see_whole_snapshots(TestContext& ctx) {
  TempWorkspace ws("modsync_manifest_readers");
  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;

  std::atomic<bool> done{false};
  std::atomic<bool> consistent{true};
  std::vector<std::thread> readers;
  for(int r = 0; r < 4; ++r) {
    readers.emplace_back([&]{
      uint64_t last_version = 0;
      while(!done) {
        auto snapshot = service.current();
        uint64_t sum = 0;
        for(const auto& item : snapshot->entries()) sum += item.second.size;
        // Every file written so far holds 10 bytes; version v lists v-1 files.
        if(sum != snapshot->total_size() || snapshot->version() < last_version ||
           snapshot->file_count() + 1 != snapshot->version()) {
          consistent = false;
        }
        last_version = snapshot->version();
      }
    });
  }
  bool rebuilt = true;
  for(int i = 0; i < 20; ++i) {
    write_file(ws / ("file" + std::to_string(i) + ".bin"), "0123456789");
    rebuilt = service.rebuild() && rebuilt;
  }
  done = true;
  for(auto& reader : readers) reader.join();
  return rebuilt && consistent && service.current()->file_count() == 20 && service.version() == 21;
}

bool test_manifest_json_forms(TestContext&) {
  auto bare = nlohmann::json::parse(R"({"core.jar": {"hash": "AB12", "size": 1000}})");
  auto wrapped = nlohmann::json::parse(R"({"files": {"core.jar": {"hash": "ab12", "size": 1000}}})");
  auto a = Manifest::from_json(bare, 4);
  auto b = Manifest::from_json(wrapped);
  auto entry = a.find("core.jar");
  bool shape = entry && entry->hash == "ab12" && entry->size == 1000 && a.version() == 4 &&
               b.entries() == a.entries() && a.to_json() == nlohmann::json::parse(R"({"core.jar": {"hash": "ab12", "size": 1000}})");

  auto rejects = [](const char* text){
    try {
      Manifest::from_json(nlohmann::json::parse(text));
    } catch(const ManifestError&) {
      return true;
    }
    return false;
  };
  return shape &&
         rejects(R"({"../escape.jar": {"hash": "ab", "size": 1}})") &&
         rejects(R"({"/abs.jar": {"hash": "ab", "size": 1}})") &&
         rejects(R"({".modsync/cache.json": {"hash": "ab", "size": 1}})") &&
         rejects(R"({"mods/.hidden/a.jar": {"hash": "ab", "size": 1}})") &&
         rejects(R"({"a.jar": {"hash": "not-hex", "size": 1}})") &&
         rejects(R"({"a.jar": {"hash": "ab", "size": -1}})") &&
         rejects(R"({"a.jar": {"size": 1}})") &&
         rejects(R"([1, 2])");
}

bool test_watcher_debounces_to_one_rebuild(TestContext& ctx) {
  TempWorkspace ws("modsync_watch_debounce");
  write_file(ws / "existing.jar", "old");
  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;

  FileWatcher::Options options;
  options.debounce = 300ms;
  options.scan_interval = 0ms;
  FileWatcher watcher(service, options, ctx.logger("watcher"));
  watcher.start();
  if(watcher.mode() != FileWatcher::Mode::Inotify) {
    if(ctx.verbose) std::cout << "    inotify unavailable, skipping\n";
    return true;
  }

  // A burst of writes inside the debounce window.
  for(int i = 0; i < 5; ++i) {
    write_file(ws / "new.jar", std::string(100 * (i + 1), 'n'));
    std::this_thread::sleep_for(40ms);
  }
  bool appeared = wait_for_condition([&]{ return service.current()->contains("new.jar"); }, 5s);
  std::this_thread::sleep_for(900ms);
  watcher.stop();

  auto entry = service.current()->find("new.jar");
  return appeared && service.version() == 2 && watcher.rebuilds_triggered() == 1 &&
         entry && entry->size == 500;
}

bool test_watcher_tracks_new_directories(TestContext& ctx) {
  TempWorkspace ws("modsync_watch_dirs");
  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;

  FileWatcher::Options options;
  options.debounce = 100ms;
  options.scan_interval = 0ms;
  FileWatcher watcher(service, options, ctx.logger("watcher"));
  watcher.start();
  if(watcher.mode() != FileWatcher::Mode::Inotify) return true;

  fs::create_directories(ws / "pack");
  std::this_thread::sleep_for(300ms);
  write_file(ws / "pack/late.jar", "late");
  bool seen = wait_for_condition([&]{ return service.current()->contains("pack/late.jar"); }, 5s);

  fs::remove(ws / "pack/late.jar");
  bool removed = wait_for_condition([&]{ return !service.current()->contains("pack/late.jar"); }, 5s);
  watcher.stop();
  return seen && removed && watcher.mode() == FileWatcher::Mode::Stopped;
}

bool test_polling_mode_rescans(TestContext& ctx) {
  TempWorkspace ws("modsync_watch_poll");
  auto service = make_service(ctx, ws.root());
  if(!service.rebuild()) return false;

  FileWatcher::Options options;
  options.force_polling = true;
  options.rescan_interval = 100ms;
  options.scan_interval = 0ms;
  FileWatcher watcher(service, options, ctx.logger("watcher"));
  watcher.start();
  bool polling = watcher.mode() == FileWatcher::Mode::Polling;
  write_file(ws / "polled.jar", "p");
  bool seen = wait_for_condition([&]{ return service.current()->contains("polled.jar"); }, 3s);
  watcher.stop();
  return polling && seen && watcher.rebuilds_triggered() >= 1;
}

bool test_range_header_forms(TestContext&) {
  auto full = parse_range_header("bytes=0-99", 1000);
  auto open = parse_range_header("bytes=900-", 1000);
  auto suffix = parse_range_header("bytes=-100", 1000);
  auto clamped = parse_range_header("bytes=990-5000", 1000);
  auto past_end = parse_range_header("bytes=1000-", 1000);
  auto multi = parse_range_header("bytes=0-1,5-6", 1000);
  auto garbage = parse_range_header("items=0-1", 1000);
  auto content = parse_content_range("bytes 10-19/100");
  return full.status == RangeStatus::Satisfiable && full.range.first == 0 && full.range.last == 99 &&
         open.range.first == 900 && open.range.last == 999 &&
         suffix.range.first == 900 && suffix.range.last == 999 &&
         clamped.range.last == 999 && clamped.range.length() == 10 &&
         past_end.status == RangeStatus::Unsatisfiable &&
         multi.status == RangeStatus::None && garbage.status == RangeStatus::None &&
         content && content->first == 10 && content->last == 19 &&
         !parse_content_range("bytes */100");
}

bool test_path_encoding(TestContext&) {
  return percent_decode("mods/a%20b.jar") == std::optional<std::string>("mods/a b.jar") &&
         !percent_decode("bad%zz") && !percent_decode("cut%4") &&
         percent_encode_path("dir/a b+c.jar") == "dir/a%20b%2Bc.jar" &&
         html_escape("<a & b>") == "&lt;a &amp; b&gt;";
}

bool test_server_routes(TestContext& ctx) {
  TempWorkspace ws("modsync_server_routes");
  write_file(ws / "core.jar", "0123456789");
  write_file(ws / "dir/with space.cfg", "cfg");
  write_file(ws / ".secret", "no");

  SyncServer::Options options;
  options.served_dir = ws.root();
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  options.monitoring = false;
  SyncServer server(options, ctx.logger("server"));
  server.start();

  auto manifest = server.handle(request_for("/hashes.json"));
  auto doc = nlohmann::json::parse(manifest.body);
  bool manifest_ok = manifest.status == 200 && doc.size() == 2 &&
                     doc["core.jar"]["hash"] == sha256_hex("0123456789") &&
                     header_of(manifest, "X-Manifest-Version") == "1";

  auto whole = server.handle(request_for("/core.jar"));
  auto ranged = server.handle(request_for("/core.jar", "Range: bytes=4-\r\n"));
  auto beyond = server.handle(request_for("/core.jar", "Range: bytes=10-\r\n"));
  auto spaced = server.handle(request_for("/dir/with%20space.cfg"));
  auto hidden = server.handle(request_for("/.secret"));
  auto escape = server.handle(request_for("/../etc/passwd"));
  auto missing = server.handle(request_for("/nope.jar"));
  auto ping = server.handle(request_for("/ping"));
  auto speed = server.handle(request_for("/speedtest?size=2048"));
  auto status = nlohmann::json::parse(server.handle(request_for("/status")).body);
  auto index = server.handle(request_for("/"));
  server.stop();

  return manifest_ok &&
         whole.status == 200 && whole.file && whole.body_length == 10 &&
         ranged.status == 206 && ranged.file_offset == 4 && ranged.body_length == 6 &&
         header_of(ranged, "Content-Range") == "bytes 4-9/10" &&
         beyond.status == 416 && header_of(beyond, "Content-Range") == "bytes */10" &&
         spaced.status == 200 && spaced.body_length == 3 &&
         hidden.status == 403 && escape.status == 403 && missing.status == 404 &&
         ping.status == 200 && speed.generated && speed.body_length == 2048 &&
         status["monitoring"] == "disabled" && status["files"] == 2 &&
         index.body.find("with%20space.cfg") != std::string::npos;
}

bool test_server_over_loopback(TestContext& ctx) {
  TempWorkspace ws("modsync_server_loopback");
  write_file(ws / "a.jar", modsync::test::make_payload(200000));

  SyncServer::Options options;
  options.served_dir = ws.root();
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  options.monitoring = false;
  options.io_threads = 2;
  SyncServer server(options, ctx.logger("server"));
  server.start_background();

  HttpClient client("http://127.0.0.1:" + std::to_string(server.listen_port()),
                    HttpClient::Options{5000ms});
  auto pong = client.get("/ping");
  auto manifest = client.get("/hashes.json");
  auto tail = client.get("/a.jar", {{"Range", "bytes=199990-"}});
  auto body = client.get("/a.jar");

  bool not_found = false;
  try {
    client.get("/missing.jar");
  } catch(const TransportError& e) {
    not_found = e.status() == 404 && !e.transient();
  }

  write_file(ws / "b.jar", "b");
  auto rescan = client.get("/force_scan");
  auto after = nlohmann::json::parse(client.get("/hashes.json").body);
  server.stop();

  const auto payload = modsync::test::make_payload(200000);
  return pong.status == 200 && pong.body.find("pong") != std::string::npos &&
         manifest.header("X-Manifest-Version") == "1" &&
         tail.status == 206 && tail.body == payload.substr(199990) &&
         body.status == 200 && body.body == payload &&
         not_found && rescan.status == 200 && after.contains("b.jar");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"ignore_rules", test_ignore_rules},
    {"rebuild_lists_regular_files", test_rebuild_lists_regular_files},
    {"hash_reused_for_unchanged_stamp", test_hash_reused_for_unchanged_stamp},
    {"failed_scan_keeps_snapshot", test_failed_scan_keeps_snapshot},
    {"names_outside_utf8_are_skipped", test_names_outside_utf8_are_skipped},
    {"utf8_validation", test_utf8_validation},
    {"readers_see_whole_snapshots", test_readers_see_whole_snapshots},
    {"manifest_json_forms", test_manifest_json_forms},
    {"watcher_debounces_to_one_rebuild", test_watcher_debounces_to_one_rebuild},
    {"watcher_tracks_new_directories", test_watcher_tracks_new_directories},
    {"polling_mode_rescans", test_polling_mode_rescans},
    {"range_header_forms", test_range_header_forms},
    {"path_encoding", test_path_encoding},
    {"server_routes", test_server_routes},
    {"server_over_loopback", test_server_over_loopback},
  };
  return modsync::test::run_tests("manifest", argc, argv, tests);
}
