#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)) {
  load_positionals(argv_spec);
}

void CommandLineParser::load_positionals(const nlohmann::json& argv_spec) {
  SettingsManager known(settings_spec_);
  for(const auto& entry : argv_spec) {
    Positional p{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()};
    if(!known.resolve_key(p.key)) {
      throw std::invalid_argument("positional argument refers to unknown setting '" + p.key + "'");
    }
    positionals_.push_back(std::move(p));
  }
  std::sort(positionals_.begin(), positionals_.end(),
            [](const Positional& a, const Positional& b){ return a.index < b.index; });
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]));
}

void CommandLineParser::store(SettingsManager& settings,
                              const std::string& key,
                              const std::string& value,
                              const std::string& shown_as) {
  std::string error;
  if(!settings.set_from_string(key, value, error)) {
    throw UsageError("Invalid value for " + shown_as + " '" + value + "': " + error);
  }
}

bool CommandLineParser::consume_option(const std::vector<std::string>& args,
                                       std::size_t& i,
                                       SettingsManager& settings) const {
  const std::string& token = args[i];
  const bool long_form = token.rfind("--", 0) == 0;
  std::string name = token.substr(long_form ? 2 : 1);
  std::optional<std::string> inline_value;
  if(long_form) {
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.resize(eq);
    }
  }

  auto key = settings.resolve_key(name);
  if(!key) {
    if(long_form) throw UsageError("Unknown option " + token);
    return false;
  }
  const std::string shown_as = (long_form ? "--" : "-") + name;

  if(inline_value) {
    store(settings, *key, *inline_value, shown_as);
  } else if(settings.is_bool_setting(*key)) {
    // a following true/false/yes/no belongs to the flag, anything else does not
    bool literal_follows = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                           SettingsManager::is_bool_literal(args[i + 1]);
    store(settings, *key, literal_follows ? args[++i] : std::string("true"), shown_as);
  } else {
    if(i + 1 >= args.size()) throw UsageError("Missing value for " + shown_as);
    store(settings, *key, args[++i], shown_as);
  }
  return true;
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token == "--") {
      if(!accepts_trailing_command_) throw UsageError("Unexpected '--'");
      return std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
    }
    if(looks_like_option(token) && consume_option(args, i, settings)) continue;

    if(next_positional < positionals_.size()) {
      const auto& p = positionals_[next_positional++];
      store(settings, p.key, token, p.key);
      continue;
    }
    if(accepts_trailing_command_) {
      return std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    }
    throw UsageError("Unexpected argument '" + token + "'");
  }
  return {};
}

std::string CommandLineParser::option_line(const nlohmann::json& entry) {
  const auto key = entry.at("key").get<std::string>();
  const auto type = entry.at("type").get<std::string>();
  const auto& fallback = entry.at("default");

  std::string shown_default;
  if(fallback.is_boolean()) {
    shown_default = fallback.get<bool>() ? "true" : "false";
  } else if(fallback.is_string()) {
    shown_default = fallback.get<std::string>().empty() ? "none" : fallback.get<std::string>();
  } else if(fallback.is_array() && fallback.empty()) {
    shown_default = "none";
  } else {
    shown_default = fallback.dump();
  }

  std::string aliases;
  for(const auto& alias : entry.value("aliases", std::vector<std::string>())) {
    aliases += aliases.empty() ? " (-" : ", -";
    aliases += alias;
  }
  if(!aliases.empty()) aliases += ")";

  return fmt::format("  --{:<26} {:<14} {}{} [{}]",
                     key,
                     type == "bool" ? "[true|false]" : "<" + type + ">",
                     entry.value("description", std::string()),
                     aliases,
                     shown_default);
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& p : positionals_) synopsis += " [" + p.key + "]";
  if(accepts_trailing_command_) synopsis += " [--] [command [args...]]";

  print_out("{} - {}", process_name_, summary_);
  print_out("");
  print_out("Usage: {}", synopsis);
  print_out("");
  print_out("Options:");
  for(const auto& entry : settings_spec_) {
    print_out("{}", option_line(entry));
  }
}
