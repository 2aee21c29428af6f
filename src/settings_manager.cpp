#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"

namespace {

std::string lowered(std::string text) {
  for(auto& ch : text) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return text;
}

std::string trimmed(const std::string& text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if(first == std::string::npos) return std::string();
  auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool type_matches(SettingType type, const nlohmann::json& value) {
  switch(type) {
    case SettingType::Bool: return value.is_boolean();
    case SettingType::Int: return value.is_number_integer();
    case SettingType::String: return value.is_string();
  }
  return false;
}

} // namespace

const char* setting_type_name(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::String: return "string";
  }
  return "unknown";
}

bool parse_bool_text(const std::string& text, bool& out) {
  auto word = lowered(trimmed(text));
  if(word == "true" || word == "on" || word == "yes" || word == "1") {
    out = true;
    return true;
  }
  if(word == "false" || word == "off" || word == "no" || word == "0") {
    out = false;
    return true;
  }
  return false;
}

std::vector<SettingDefinition> parse_setting_definitions(const nlohmann::json& specification) {
  if(!specification.is_array()) {
    throw std::invalid_argument("settings specification must be an array");
  }
  std::vector<SettingDefinition> definitions;
  for(const auto& entry : specification) {
    if(!entry.contains("key") || !entry.at("key").is_string()) {
      throw std::invalid_argument("settings entry without a key: " + entry.dump());
    }
    SettingDefinition definition;
    definition.key = entry.at("key").get<std::string>();

    auto type = entry.value("type", std::string("string"));
    if(type == "bool") definition.type = SettingType::Bool;
    else if(type == "int") definition.type = SettingType::Int;
    else if(type == "string") definition.type = SettingType::String;
    else throw std::invalid_argument("setting '" + definition.key + "' has unknown type '" + type + "'");

    definition.default_value = entry.value("default", nlohmann::json());
    if(!type_matches(definition.type, definition.default_value)) {
      throw std::invalid_argument("setting '" + definition.key + "' default is not a " + type);
    }
    definition.description = entry.value("description", std::string());
    if(entry.contains("aliases")) {
      definition.aliases = entry.at("aliases").get<std::vector<std::string>>();
    }
    definition.persistent = entry.value("persistent", true);
    definitions.push_back(std::move(definition));
  }
  return definitions;
}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : definitions_(parse_setting_definitions(specification)),
    values_(nlohmann::json::object()) {
  for(std::size_t i = 0; i < definitions_.size(); ++i) {
    const auto& definition = definitions_[i];
    names_[lowered(definition.key)] = i;
    for(const auto& alias : definition.aliases) {
      names_.emplace(lowered(alias), i);
    }
    values_[definition.key] = definition.default_value;
  }
}

const SettingDefinition* SettingsManager::definition(const std::string& name) const {
  auto it = names_.find(lowered(name));
  return it == names_.end() ? nullptr : &definitions_[it->second];
}

bool SettingsManager::store(const SettingDefinition& definition,
                            const nlohmann::json& value,
                            std::string& error) {
  if(definition.type == SettingType::Bool && value.is_number_integer()) {
    values_[definition.key] = value.get<long long>() != 0;
    return true;
  }
  if(!type_matches(definition.type, value)) {
    error = std::string("expected ") + setting_type_name(definition.type) + ", got " + value.dump();
    return false;
  }
  values_[definition.key] = value;
  return true;
}

bool SettingsManager::set_from_json(const std::string& name,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* found = definition(name);
  if(!found) {
    error = "unknown setting '" + name + "'";
    return false;
  }
  return store(*found, value, error);
}

bool SettingsManager::set_from_string(const std::string& name,
                                      const std::string& text,
                                      std::string& error) {
  const auto* found = definition(name);
  if(!found) {
    error = "unknown setting '" + name + "'";
    return false;
  }
  auto clean = trimmed(text);
  switch(found->type) {
    case SettingType::Bool: {
      bool flag = false;
      if(!parse_bool_text(clean, flag)) {
        error = "expected true|false, got '" + text + "'";
        return false;
      }
      return store(*found, flag, error);
    }
    case SettingType::Int: {
      std::size_t used = 0;
      int number = 0;
      try {
        number = std::stoi(clean, &used);
      } catch(const std::exception&) {
        used = 0;
      }
      if(clean.empty() || used != clean.size()) {
        error = "expected an integer, got '" + text + "'";
        return false;
      }
      return store(*found, number, error);
    }
    case SettingType::String:
      return store(*found, clean, error);
  }
  error = "unsupported setting type";
  return false;
}

bool SettingsManager::get_int_in_range(const std::string& key,
                                       int min,
                                       int max,
                                       int& out,
                                       std::string& error) const {
  int value = get<int>(key);
  if(value < min || value > max) {
    error = key + " must be between " + std::to_string(min) + " and " +
            std::to_string(max) + " (got " + std::to_string(value) + ")";
    return false;
  }
  out = value;
  return true;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_.empty()) return path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err(nullptr, "Ignoring unreadable settings file {}", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* found = definition(item.key());
    if(!found || !found->persistent) continue;
    std::string error;
    if(!store(*found, item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& definition : definitions_) {
    if(persistent_only && !definition.persistent) continue;
    doc[definition.key] = values_.at(definition.key);
  }
  return doc;
}
