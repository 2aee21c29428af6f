#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Each entry: key, aliases, type (int|string|bool), default,
// description, and whether `save` writes it to the settings file.
inline const nlohmann::json PEER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_host"},    {"aliases", {"sh","server"}},  {"type","string"}, {"default","127.0.0.1"}, {"description","Index server host"}, {"persistent", true}},
  {{"key","server_port"},    {"aliases", {"sp"}},           {"type","int"},    {"default",7734},        {"description","Index server port"}, {"persistent", true}},
  {{"key","listen_ip"},      {"aliases", {"li"}},           {"type","string"}, {"default","0.0.0.0"},   {"description","Interface/IP the transfer listener binds"}, {"persistent", true}},
  {{"key","listen_port"},    {"aliases", {"lp"}},           {"type","int"},    {"default",0},           {"description","Transfer listener port (0 = ephemeral)"}, {"persistent", true}},
  {{"key","advertise_host"}, {"aliases", {"ah","host"}},    {"type","string"}, {"default","127.0.0.1"}, {"description","Host other peers use to reach this peer"}, {"persistent", true}},
  {{"key","peer_name"},      {"aliases", {"name"}},         {"type","string"}, {"default",""},          {"description","Peer name (default <hostname>-<pid>)"}, {"persistent", true}},
  {{"key","rfc_dir"},        {"aliases", {"dir"}},          {"type","string"}, {"default",""},          {"description","Directory holding rfc<N>.txt files (default <peer_name>_rfcs)"}, {"persistent", true}},
  {{"key","tokens"},         {"aliases", {"accept"}},       {"type","string"}, {"default","P2P-CI/1.0"},{"description","Comma separated protocol tokens accepted for GET"}, {"persistent", true}},
  {{"key","protocol_token"}, {"aliases", {"token"}},        {"type","string"}, {"default","P2P-CI/1.0"},{"description","Token used for automatic registrations"}, {"persistent", true}},
  {{"key","auto_register"},  {"aliases", {"ar"}},           {"type","bool"},   {"default",true},        {"description","ADD local documents at start-up and after each get"}, {"persistent", true}},
  {{"key","io_threads"},     {"aliases", {"threads"}},      {"type","int"},    {"default",2},           {"description","Worker threads serving transfers"}, {"persistent", true}},
  {{"key","timeout_ms"},     {"aliases", {"timeout"}},      {"type","int"},    {"default",10000},       {"description","Per-operation network timeout in milliseconds"}, {"persistent", true}},
  {{"key","verbose"},        {"aliases", {"v"}},            {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},           {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},           {"aliases", {"persist"}},      {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json SERVER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},       {"aliases", {"li"}},          {"type","string"}, {"default","0.0.0.0"},   {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},     {"aliases", {"lp"}},          {"type","int"},    {"default",7734},        {"description","Well-known control port"}, {"persistent", true}},
  {{"key","tokens"},          {"aliases", {"accept"}},      {"type","string"}, {"default","P2P-CI/1.0"},{"description","Comma separated protocol tokens accepted"}, {"persistent", true}},
  {{"key","io_threads"},      {"aliases", {"threads"}},     {"type","int"},    {"default",4},           {"description","Worker threads serving connections"}, {"persistent", true}},
  {{"key","idle_timeout_ms"}, {"aliases", {"idle"}},        {"type","int"},    {"default",30000},       {"description","Close connections idle this long"}, {"persistent", true}},
  {{"key","verbose"},         {"aliases", {"v"}},           {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},            {"aliases", {"h","?"}},       {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},            {"aliases", {"persist"}},     {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String };

const char* setting_type_name(SettingType type);

// true/on/yes/1 and false/off/no/0, any case.
bool parse_bool_text(const std::string& text, bool& out);

struct SettingDefinition {
  std::string key;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  std::vector<std::string> aliases;
  bool persistent = true;
};

// Throws std::invalid_argument when an entry lacks a key, names an unknown
// type, or carries a default of the wrong type.
std::vector<SettingDefinition> parse_setting_definitions(const nlohmann::json& specification);

// Typed key/value settings described by one of the specifications above.
// Keys and aliases match case-insensitively.
class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification);

  const std::vector<SettingDefinition>& definitions() const { return definitions_; }
  // nullptr when `name` is neither a key nor an alias.
  const SettingDefinition* definition(const std::string& name) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  // Reads an int setting and checks it lies in [min, max].
  bool get_int_in_range(const std::string& key, int min, int max, int& out, std::string& error) const;

  bool set_from_string(const std::string& name, const std::string& text, std::string& error);
  bool set_from_json(const std::string& name, const nlohmann::json& value, std::string& error);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  // Defaults to <cwd>/.config/settings.json.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_ = path; }

  // False when the file is missing or unreadable. Unknown keys are skipped.
  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  nlohmann::json to_json(bool persistent_only = true) const;

private:
  bool store(const SettingDefinition& definition, const nlohmann::json& value, std::string& error);

  std::vector<SettingDefinition> definitions_;
  std::map<std::string, std::size_t> names_;   // lower-cased key or alias -> index
  nlohmann::json values_;
  std::filesystem::path path_;
};
