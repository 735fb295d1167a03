#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

#include "log.hpp"

namespace {

// "--key", "--key=value" or "-alias"; nullopt for anything positional.
struct OptionToken {
  std::string name;
  std::optional<std::string> inline_value;
  bool long_form = false;
};

std::optional<OptionToken> split_option(const std::string& token) {
  OptionToken out;
  if(token.rfind("--", 0) == 0 && token.size() > 2) {
    out.long_form = true;
    auto body = token.substr(2);
    auto eq = body.find('=');
    if(eq != std::string::npos) {
      out.inline_value = body.substr(eq + 1);
      body.resize(eq);
    }
    out.name = std::move(body);
    return out;
  }
  if(token.size() > 1 && token[0] == '-') {
    out.name = token.substr(1);
    return out;
  }
  return std::nullopt;
}

std::string default_text(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(!value.is_array()) return value.dump();
  std::string joined;
  for(const auto& item : value) {
    if(!joined.empty()) joined += ",";
    joined += item.get<std::string>();
  }
  return joined;
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  SettingsManager known(settings_spec_);
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec positional{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()};
    if(!known.resolve_key(positional.key)) {
      throw std::invalid_argument("positional argument refers to unknown setting '" + positional.key + "'");
    }
    result.push_back(std::move(positional));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  auto assign = [&](const std::string& key, const std::string& value, const std::string& shown_as){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw std::invalid_argument("Invalid value for " + shown_as + " '" + value + "': " + error);
    }
  };

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    auto option = split_option(token);
    auto key = option ? settings.resolve_key(option->name) : std::nullopt;

    if(option && !key && option->long_form) {
      throw std::invalid_argument("Unknown option --" + option->name);
    }
    if(key) {
      std::string value;
      if(option->inline_value) {
        value = *option->inline_value;
      } else if(settings.is_bool_setting(*key)) {
        // Bare flags mean true; a following true/false literal is consumed.
        const bool literal_follows = i + 1 < args.size() && !is_option_token(args[i + 1]) &&
                                     SettingsManager::is_bool_literal(args[i + 1]);
        value = literal_follows ? args[++i] : "true";
      } else if(i + 1 < args.size()) {
        value = args[++i];
      } else {
        throw std::invalid_argument("Missing value for option '" + option->name + "'");
      }
      assign(*key, value, "option '" + option->name + "'");
      continue;
    }

    // Unknown short tokens such as "-1" fall through as positionals.
    if(next_positional >= positional_specs_.size()) {
      throw std::invalid_argument("Unexpected positional argument '" + token + "'");
    }
    const auto& positional = positional_specs_[next_positional++];
    assign(positional.key, token, positional.key);
  }
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& positional : positional_specs_) synopsis += " [" + positional.key + "]";

  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:\n  {}\n\nOptions:", synopsis);
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    const auto hint = (type == "bool") ? std::string("[true|false]") : "<" + type + ">";

    std::string aliases;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>())) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";

    print_out(nullptr, "  --{:<22} {:<14} {}{} (default: {})",
              key, hint, entry.value("description", ""), aliases, default_text(entry.at("default")));
  }
  print_out(nullptr, "");
}
