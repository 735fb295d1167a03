#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "log.hpp"

namespace {

SettingType parse_type(const std::string& name) {
  if(name == "bool")   return SettingType::Bool;
  if(name == "int")    return SettingType::Int;
  if(name == "float")  return SettingType::Float;
  if(name == "string") return SettingType::String;
  if(name == "list")   return SettingType::List;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

} // namespace

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    rows_.push_back(parse_row(entry));
  }
  for(const auto& row : rows_) {
    values_[row.key] = row.default_value;
  }
}

SettingsManager::Row SettingsManager::parse_row(const nlohmann::json& entry) {
  Row row;
  row.key = entry.at("key").get<std::string>();
  row.match_key = match_form(row.key);
  for(const auto& alias : entry.value("aliases", std::vector<std::string>())) {
    row.aliases.push_back(match_form(alias));
  }
  row.type = parse_type(entry.at("type").get<std::string>());
  row.default_value = entry.at("default");
  row.persistent = entry.value("persistent", true);
  if(entry.contains("min")) row.min = entry.at("min").get<double>();
  if(entry.contains("max")) row.max = entry.at("max").get<double>();
  return row;
}

std::string SettingsManager::match_form(const std::string& token) {
  auto out = to_lower(token);
  std::replace(out.begin(), out.end(), '-', '_');
  return out;
}

const SettingsManager::Row* SettingsManager::find_row(const std::string& token) const {
  const auto wanted = match_form(token);
  for(const auto& row : rows_) {
    if(row.match_key == wanted ||
       std::find(row.aliases.begin(), row.aliases.end(), wanted) != row.aliases.end()) {
      return &row;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* row = find_row(token)) return row->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* row = find_row(key);
  return row && row->type == SettingType::Bool;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& text, std::string& error) {
  const auto* row = find_row(key);
  if(!row) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  auto parsed = parse_text(*row, text, error);
  if(!parsed) return false;
  auto value = coerce(*row, *parsed, error);
  if(!value) return false;
  values_[row->key] = std::move(*value);
  return true;
}

std::optional<nlohmann::json> SettingsManager::parse_text(const Row& row, const std::string& text,
                                                          std::string& error) const {
  const auto clean = trim_copy(text);
  switch(row.type) {
    case SettingType::Bool: {
      auto flag = parse_bool(clean);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return std::nullopt;
      }
      return nlohmann::json(*flag);
    }
    case SettingType::Int:
    case SettingType::Float:
      try {
        std::size_t used = 0;
        nlohmann::json number = (row.type == SettingType::Int)
          ? nlohmann::json(static_cast<int64_t>(std::stoll(clean, &used)))
          : nlohmann::json(std::stod(clean, &used));
        if(used != clean.size()) {
          error = "trailing characters in '" + clean + "'";
          return std::nullopt;
        }
        return number;
      } catch(const std::logic_error&) {
        error = "expected a number, got '" + clean + "'";
        return std::nullopt;
      }
    case SettingType::String:
      return nlohmann::json(clean);
    case SettingType::List: {
      auto items = nlohmann::json::array();
      std::stringstream stream(clean);
      std::string item;
      while(std::getline(stream, item, ',')) {
        item = trim_copy(item);
        if(!item.empty()) items.push_back(item);
      }
      return items;
    }
  }
  error = "unsupported type";
  return std::nullopt;
}

std::optional<nlohmann::json> SettingsManager::coerce(const Row& row, const nlohmann::json& value,
                                                      std::string& error) const {
  auto in_range = [&](double number){
    if(row.min && number < *row.min) {
      error = "must be >= " + nlohmann::json(*row.min).dump();
      return false;
    }
    if(row.max && number > *row.max) {
      error = "must be <= " + nlohmann::json(*row.max).dump();
      return false;
    }
    return true;
  };

  switch(row.type) {
    case SettingType::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return nlohmann::json(value.get<int64_t>() != 0);
      error = "expected boolean";
      return std::nullopt;
    case SettingType::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return std::nullopt;
      }
      if(!in_range(static_cast<double>(value.get<int64_t>()))) return std::nullopt;
      return nlohmann::json(value.get<int64_t>());
    case SettingType::Float:
      if(!value.is_number()) {
        error = "expected number";
        return std::nullopt;
      }
      if(!in_range(value.get<double>())) return std::nullopt;
      return nlohmann::json(value.get<double>());
    case SettingType::String:
      if(value.is_string()) return value;
      error = "expected string";
      return std::nullopt;
    case SettingType::List:
      if(value.is_array() &&
         std::all_of(value.begin(), value.end(), [](const nlohmann::json& v){ return v.is_string(); })) {
        return value;
      }
      error = "expected list of strings";
      return std::nullopt;
  }
  error = "unsupported type";
  return std::nullopt;
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    log_error(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* row = find_row(item.key());
    if(!row) continue;
    std::string error;
    if(auto value = coerce(*row, item.value(), error)) {
      values_[row->key] = std::move(*value);
    } else {
      log_warn(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  const auto temp = std::filesystem::path(path.string() + ".tmp");
  {
    std::ofstream out(temp, std::ios::trunc);
    out << get_json(true).dump(2);
    if(!out) {
      log_error(nullptr, "Unable to write {}", temp.string());
      return false;
    }
  }
  std::filesystem::rename(temp, path, ec);
  if(ec) {
    log_error(nullptr, "Unable to replace {}: {}", path.string(), ec.message());
    return false;
  }
  return true;
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  auto doc = nlohmann::json::object();
  for(const auto& row : rows_) {
    if(persistent_only && !row.persistent) continue;
    doc[row.key] = values_.at(row.key);
  }
  return doc;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  return value;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  static const std::pair<const char*, bool> kLiterals[] = {
    {"true", true}, {"on", true}, {"yes", true}, {"1", true},
    {"false", false}, {"off", false}, {"no", false}, {"0", false},
  };
  const auto lowered = to_lower(trim_copy(text));
  for(const auto& literal : kLiterals) {
    if(lowered == literal.first) return literal.second;
  }
  return std::nullopt;
}
