#include "command_line_parser.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    result.push_back(ArgvSpec{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()});
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager known(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!known.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const char* const literals[] = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  const std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return std::any_of(std::begin(literals), std::end(literals),
                     [&](const char* literal){ return lowered == literal; });
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    const bool long_form = token.rfind("--", 0) == 0;
    const bool short_form = !long_form && token.size() > 1 && token[0] == '-';

    if(long_form || short_form) {
      const std::string key_token = token.substr(long_form ? 2 : 1);
      auto resolved = settings.resolve_key(key_token);
      if(!resolved && long_form) {
        error = "Unknown option --" + key_token;
        return false;
      }
      if(resolved) {
        std::string value;
        if(settings.is_bool_setting(*resolved)) {
          if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
            value = args[++i];
          } else {
            value = "true";
          }
        } else {
          if(i + 1 >= args.size()) {
            error = "Missing value for option '" + key_token + "'";
            return false;
          }
          value = args[++i];
        }
        std::string set_error;
        if(!settings.set_from_string(*resolved, value, set_error)) {
          error = "Invalid value for option '" + key_token + "': " + set_error;
          return false;
        }
        continue;
      }
      // unknown short alias: treat as positional (e.g. a negative number)
    }

    if(positional_index >= positional_specs_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "Invalid value for " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string error;
  if(!parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage();
    std::exit(1);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - LAN file drop between phone and desktop", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    if(entry.contains("choices")) {
      argument_hint = "<";
      const auto choices = entry.at("choices").get<std::vector<std::string>>();
      for(std::size_t i = 0; i < choices.size(); ++i) {
        if(i > 0) argument_hint += "|";
        argument_hint += choices[i];
      }
      argument_hint += ">";
    }
    std::ostringstream aliases;
    const auto alias_list = entry.value("aliases", std::vector<std::string>{});
    if(!alias_list.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << alias_list[i];
      }
      aliases << ")";
    }
    const auto& default_value = entry.at("default");
    const std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{} {:<16} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
