#include "manifest.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "errors.hpp"
#include "settings_manager.hpp"

namespace {

bool is_hex_digest(const std::string& value) {
  if(value.empty()) return false;
  return std::all_of(value.begin(), value.end(), [](unsigned char c){
    return std::isxdigit(c) != 0;
  });
}

} // namespace

Manifest::Manifest(Entries entries,
                   uint64_t version,
                   std::chrono::system_clock::time_point generated_at)
  : entries_(std::move(entries)), version_(version), generated_at_(generated_at) {
  for(const auto& item : entries_) {
    total_size_ += item.second.size;
  }
}

bool Manifest::contains(const std::string& relative_path) const {
  return entries_.count(relative_path) > 0;
}

std::optional<ManifestEntry> Manifest::find(const std::string& relative_path) const {
  auto it = entries_.find(relative_path);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

nlohmann::json Manifest::to_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& item : entries_) {
    doc[item.first] = {{"hash", item.second.hash}, {"size", item.second.size}};
  }
  return doc;
}

Manifest Manifest::from_json(const nlohmann::json& doc, uint64_t version) {
  if(!doc.is_object()) {
    throw ManifestError("manifest must be a JSON object");
  }
  const nlohmann::json* files = &doc;
  if(doc.contains("files") && doc["files"].is_object()) {
    files = &doc["files"];
    if(version == 0 && doc.contains("version") && doc["version"].is_number_unsigned()) {
      version = doc["version"].get<uint64_t>();
    }
  }

  Entries entries;
  for(const auto& item : files->items()) {
    const auto& path = item.key();
    const auto& value = item.value();
    if(!is_safe_relative_path(path)) {
      throw ManifestError("unsafe path in manifest: " + path);
    }
    if(!value.is_object() || !value.contains("hash") || !value.contains("size")) {
      throw ManifestError("manifest entry for " + path + " needs hash and size");
    }
    if(!value["hash"].is_string() || !value["size"].is_number_integer()) {
      throw ManifestError("manifest entry for " + path + " has wrong field types");
    }
    auto size = value["size"].get<int64_t>();
    auto hash = SettingsManager::to_lower(value["hash"].get<std::string>());
    if(size < 0 || !is_hex_digest(hash)) {
      throw ManifestError("manifest entry for " + path + " is invalid");
    }
    entries.emplace(path, ManifestEntry{std::move(hash), static_cast<uint64_t>(size), 0});
  }
  return Manifest(std::move(entries), version);
}

bool is_safe_relative_path(const std::string& relative_path) {
  if(relative_path.empty()) return false;
  if(relative_path.front() == '/' || relative_path.find('\\') != std::string::npos) return false;
  if(relative_path.find('\0') != std::string::npos) return false;
  std::filesystem::path path(relative_path);
  if(path.has_root_path()) return false;
  // Hidden components are never published and hold the client's own
  // staging area (.modsync/).
  for(const auto& part : path) {
    const auto name = part.string();
    if(name.empty() || name.front() == '.') return false;
  }
  return true;
}

bool is_valid_utf8(const std::string& text) {
  std::size_t i = 0;
  while(i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    uint32_t code = 0;
    if(lead < 0x80) {
      ++i;
      continue;
    } else if((lead & 0xE0) == 0xC0) {
      extra = 1;
      code = lead & 0x1F;
    } else if((lead & 0xF0) == 0xE0) {
      extra = 2;
      code = lead & 0x0F;
    } else if((lead & 0xF8) == 0xF0) {
      extra = 3;
      code = lead & 0x07;
    } else {
      return false;
    }
    if(i + extra >= text.size()) return false;
    for(std::size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if((next & 0xC0) != 0x80) return false;
      code = (code << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    static const uint32_t kMinimum[] = {0, 0x80, 0x800, 0x10000};
    if(code < kMinimum[extra] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}
