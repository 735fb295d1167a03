#include "local_state.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

#include "download_manager.hpp"
#include "hashing.hpp"
#include "settings_manager.hpp"

namespace fs = std::filesystem;

namespace {

struct Stamp {
  uint64_t size = 0;
  int64_t mtime = 0;
};

std::optional<Stamp> stamp_of(const fs::path& file) {
  std::error_code ec;
  if(!fs::is_regular_file(file, ec)) return std::nullopt;
  auto size = fs::file_size(file, ec);
  if(ec) return std::nullopt;
  auto mtime = fs::last_write_time(file, ec);
  if(ec) return std::nullopt;
  return Stamp{static_cast<uint64_t>(size), static_cast<int64_t>(mtime.time_since_epoch().count())};
}

} // namespace

HashCache::HashCache(fs::path file) : file_(std::move(file)) {}

void HashCache::load() {
  entries_.clear();
  std::ifstream in(file_);
  if(!in) return;
  try {
    nlohmann::json doc;
    in >> doc;
    for(const auto& item : doc.items()) {
      Entry entry;
      entry.hash = item.value().at("hash").get<std::string>();
      entry.size = item.value().at("size").get<uint64_t>();
      entry.mtime = item.value().at("mtime").get<int64_t>();
      entries_[item.key()] = std::move(entry);
    }
  } catch(const nlohmann::json::exception& e) {
    log_warn(nullptr, "Discarding unreadable hash cache {}: {}", file_.string(), e.what());
    entries_.clear();
  }
}

bool HashCache::save() const {
  std::error_code ec;
  fs::create_directories(file_.parent_path(), ec);
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& [path, entry] : entries_) {
    doc[path] = {{"hash", entry.hash}, {"size", entry.size}, {"mtime", entry.mtime}};
  }
  auto temp = fs::path(file_.string() + ".tmp");
  {
    std::ofstream out(temp, std::ios::trunc);
    out << doc.dump();
    if(!out) {
      log_warn(nullptr, "Unable to write hash cache {}", temp.string());
      return false;
    }
  }
  fs::rename(temp, file_, ec);
  if(ec) {
    log_warn(nullptr, "Unable to replace hash cache {}: {}", file_.string(), ec.message());
    return false;
  }
  return true;
}

std::optional<std::string> HashCache::lookup(const std::string& relative_path, uint64_t size, int64_t mtime) const {
  auto it = entries_.find(relative_path);
  if(it == entries_.end() || it->second.size != size || it->second.mtime != mtime) {
    return std::nullopt;
  }
  return it->second.hash;
}

void HashCache::record(const std::string& relative_path, Entry entry) {
  entries_[relative_path] = std::move(entry);
}

void HashCache::forget(const std::string& relative_path) {
  entries_.erase(relative_path);
}

LocalState::LocalState(fs::path content_dir, std::shared_ptr<Logger> logger)
  : content_dir_(std::move(content_dir)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("local")),
    cache_(DownloadManager::staging_root(content_dir_) / "cache.json") {
  cache_.load();
}

std::vector<ModFile> LocalState::classify(const Manifest& manifest) {
  std::vector<ModFile> files;
  files.reserve(manifest.file_count());
  std::size_t hashed = 0;

  for(const auto& [relative, entry] : manifest.entries()) {
    if(!is_safe_relative_path(relative)) {
      logger_->warn("Skipping manifest entry with unsafe path '{}'", relative);
      continue;
    }
    ModFile file;
    file.relative_path = relative;
    file.expected_hash = SettingsManager::to_lower(entry.hash);
    file.expected_size = entry.size;

    auto stamp = stamp_of(content_dir_ / fs::path(relative));
    if(!stamp) {
      file.status = ModFileStatus::Missing;
      cache_.forget(relative);
    } else if(stamp->size != entry.size) {
      file.status = ModFileStatus::Mismatched;
    } else {
      auto hash = cache_.lookup(relative, stamp->size, stamp->mtime);
      if(!hash) {
        hash = sha256_file(content_dir_ / fs::path(relative));
        ++hashed;
        if(hash) {
          cache_.record(relative, HashCache::Entry{*hash, stamp->size, stamp->mtime});
        } else {
          logger_->warn("Unable to read {}", relative);
        }
      }
      file.status = (hash && *hash == file.expected_hash) ? ModFileStatus::Verified
                                                          : ModFileStatus::Mismatched;
    }
    files.push_back(std::move(file));
  }

  logger_->debug("Classified {} files ({} hashed, {} from cache)", files.size(), hashed,
                 files.size() - hashed);
  return files;
}

std::vector<std::string> LocalState::extraneous_files(const Manifest& manifest) const {
  std::vector<std::string> out;
  std::error_code ec;
  if(!fs::is_directory(content_dir_, ec)) return out;

  fs::recursive_directory_iterator it(content_dir_, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    logger_->warn("Unable to list {}: {}", content_dir_.string(), ec.message());
    return out;
  }
  for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(ec) {
      logger_->warn("Directory walk stopped early: {}", ec.message());
      break;
    }
    const auto name = it->path().filename().string();
    if(!name.empty() && name[0] == '.') {
      if(it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if(!it->is_regular_file(ec)) continue;
    auto relative = it->path().lexically_relative(content_dir_).generic_string();
    if(!manifest.contains(relative)) out.push_back(std::move(relative));
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t LocalState::delete_extraneous(const Manifest& manifest) {
  std::size_t removed = 0;
  for(const auto& relative : extraneous_files(manifest)) {
    std::error_code ec;
    if(fs::remove(content_dir_ / fs::path(relative), ec)) {
      logger_->info("Removed extraneous file {}", relative);
      cache_.forget(relative);
      ++removed;
    } else if(ec) {
      logger_->warn("Unable to remove {}: {}", relative, ec.message());
    }
  }
  return removed;
}

void LocalState::record_verified(const ModFile& file) {
  auto stamp = stamp_of(content_dir_ / fs::path(file.relative_path));
  if(!stamp) return;
  cache_.record(file.relative_path, HashCache::Entry{file.expected_hash, stamp->size, stamp->mtime});
}
