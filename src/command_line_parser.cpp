#include "command_line_parser.hpp"

#include <cctype>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& arg) {
  if(arg.size() < 2 || arg[0] != '-') return false;
  // "-5" is a value, not an option
  return arg[1] == '-' || !std::isdigit(static_cast<unsigned char>(arg[1]));
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::size_t next_positional = 0;

  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i] ? argv[i] : "";

    if(!looks_like_option(arg)) {
      if(next_positional >= positional_keys_.size()) {
        error = "Unexpected argument '" + arg + "'";
        return false;
      }
      const auto& key = positional_keys_[next_positional++];
      std::string set_error;
      if(!settings.set_from_string(key, arg, set_error)) {
        error = "Invalid " + key + " '" + arg + "': " + set_error;
        return false;
      }
      continue;
    }

    std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string value;
    bool inline_value = false;
    auto equals = name.find('=');
    if(equals != std::string::npos) {
      value = name.substr(equals + 1);
      name.erase(equals);
      inline_value = true;
    }

    const auto* definition = settings.definition(name);
    if(!definition) {
      error = "Unknown option " + arg;
      return false;
    }

    if(!inline_value) {
      bool has_next = i + 1 < argc && argv[i + 1] && !looks_like_option(argv[i + 1]);
      if(definition->type == SettingType::Bool) {
        // a flag only consumes the next word when it reads as a boolean
        bool ignored = false;
        if(has_next && parse_bool_text(argv[i + 1], ignored)) {
          value = argv[++i];
        } else {
          value = "true";
        }
      } else {
        if(!has_next) {
          error = "Missing value for option " + arg;
          return false;
        }
        value = argv[++i];
      }
    }

    std::string set_error;
    if(!settings.set_from_string(definition->key, value, set_error)) {
      error = "Invalid value for option " + arg + ": " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) {
    synopsis += " [" + key + "]";
  }
  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage: {} [options]", synopsis);
  print_out(nullptr, "Options:");
  for(const auto& definition : settings.definitions()) {
    std::string flags = "--" + definition.key;
    for(const auto& alias : definition.aliases) {
      flags += ", -" + alias;
    }
    std::string current = definition.default_value.is_string()
      ? "'" + definition.default_value.get<std::string>() + "'"
      : definition.default_value.dump();
    print_out(nullptr, "  {:<28} <{}> {} (default {})",
              flags, setting_type_name(definition.type), definition.description, current);
  }
}
