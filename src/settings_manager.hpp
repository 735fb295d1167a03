#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class SettingType { Bool, Int, Float, String, List };

// Typed key/value store described by a JSON specification table. Each row:
//   { key, aliases, type (bool|int|float|string|list), default, description,
//     persistent, min, max }
// Every write is validated against its row; list settings hold string arrays
// and accept comma-separated text. Keys and aliases match case-insensitively
// with '-' and '_' interchangeable.
class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws std::invalid_argument for keys outside the specification.
  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) throw std::invalid_argument("Unknown setting: " + key);
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& text, std::string& error);

  // A missing file leaves the defaults untouched and returns false; invalid
  // entries are skipped with a warning.
  bool load() { return load_from_file(settings_path_); }
  bool save() const { return save_to_file(settings_path_); }
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return flag("save"); }
  bool help_requested() const { return flag("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  const std::filesystem::path& settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::optional<bool> parse_bool(const std::string& text);
  static bool is_bool_literal(const std::string& text) { return parse_bool(text).has_value(); }

private:
  struct Row {
    std::string key;
    std::string match_key;
    std::vector<std::string> aliases;
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    bool persistent = true;
    std::optional<double> min;
    std::optional<double> max;
  };

  static Row parse_row(const nlohmann::json& entry);
  static std::string match_form(const std::string& token);

  const Row* find_row(const std::string& token) const;
  bool flag(const char* key) const { return has(key) && get<bool>(key); }

  // Converts `value` to the row's type and range, or explains why not.
  std::optional<nlohmann::json> coerce(const Row& row, const nlohmann::json& value, std::string& error) const;
  std::optional<nlohmann::json> parse_text(const Row& row, const std::string& text, std::string& error) const;

  std::vector<Row> rows_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};
