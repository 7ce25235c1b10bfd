#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every option the tool understands. Command line flags, the config file and
// the usage text are all derived from this table; "persistent" marks what
// --save writes back.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},             {"aliases", {"cmd"}},            {"type","string"}, {"default",""},        {"description","Command to run (list-devices, verify, fetch-data, download, transfer, deploy, settings)"}, {"persistent", false}},
  {{"key","config"},              {"aliases", {"c"}},              {"type","string"}, {"default",""},        {"description","Explicit configuration file"}, {"persistent", false}},
  {{"key","api_url"},             {"aliases", {"api"}},            {"type","string"}, {"default","https://api.eldersvr.com"}, {"description","Content backend base URL"}, {"persistent", true}},
  {{"key","auth_endpoint"},       {"aliases", nlohmann::json::array()}, {"type","string"}, {"default","/integration/auth/login"}, {"description","Login endpoint path"}, {"persistent", true}},
  {{"key","tags_endpoint"},       {"aliases", nlohmann::json::array()}, {"type","string"}, {"default","/integration/tags"}, {"description","Tags endpoint path"}, {"persistent", true}},
  {{"key","films_endpoint"},      {"aliases", nlohmann::json::array()}, {"type","string"}, {"default","/integration/films"}, {"description","Films endpoint path"}, {"persistent", true}},
  {{"key","email"},               {"aliases", {"e","username"}},   {"type","string"}, {"default",""},        {"description","Backend account email"}, {"persistent", true}},
  {{"key","password"},            {"aliases", {"p"}},              {"type","string"}, {"default",""},        {"description","Backend account password"}, {"persistent", false}},
  {{"key","downloads_root"},      {"aliases", {"root","dr"}},      {"type","string"}, {"default","downloads"}, {"description","Local directory holding new_data.json, videos/ and images/"}, {"persistent", true}},
  {{"key","device_path"},         {"aliases", {"dp"}},             {"type","string"}, {"default","/storage/emulated/0/Download/EldersVR"}, {"description","Primary base directory on the device"}, {"persistent", true}},
  {{"key","fallback_paths"},      {"aliases", {"fallbacks"}},      {"type","json"},   {"default", nlohmann::json::array({
                                    "/storage/emulated/0/Android/data/com.q42.eldersvr/files/EldersVR",
                                    "/sdcard/EldersVR",
                                    "/storage/self/primary/EldersVR",
                                    "/mnt/sdcard/EldersVR",
                                    "/data/local/tmp/EldersVR"})}, {"description","Ordered fallback base directories (JSON array)"}, {"persistent", true}},
  {{"key","allow_root"},          {"aliases", {"root_escalation"}}, {"type","bool"},  {"default",true},      {"description","Try su to make the primary path writable"}, {"persistent", true}},
  {{"key","master_serial"},       {"aliases", {"master"}},         {"type","string"}, {"default",""},        {"description","Serial of the master (phone) device"}, {"persistent", true}},
  {{"key","slave_serial"},        {"aliases", {"slave"}},          {"type","string"}, {"default",""},        {"description","Serial of the slave (headset) device"}, {"persistent", true}},
  {{"key","quality"},             {"aliases", {"q"}},              {"type","string"}, {"default","both"},    {"description","Video quality to download (high|low|both)"}, {"persistent", true}},
  {{"key","images_only"},         {"aliases", {"io"}},             {"type","bool"},   {"default",false},     {"description","Download thumbnails and tag images only"}, {"persistent", false}},
  {{"key","max_concurrent_downloads"}, {"aliases", {"mcd","parallel"}}, {"type","int"}, {"default",4},     {"description","Parallel download workers"}, {"persistent", true}},
  {{"key","retry_attempts"},      {"aliases", {"retries"}},        {"type","int"},    {"default",3},         {"description","Retries after the first failed download attempt"}, {"persistent", true}},
  {{"key","retry_delay_ms"},      {"aliases", {"rdm"}},            {"type","int"},    {"default",2000},      {"description","Delay between download retries"}, {"persistent", true}},
  {{"key","http_timeout"},        {"aliases", {"timeout"}},        {"type","int"},    {"default",60},        {"description","HTTP inactivity timeout in seconds"}, {"persistent", true}},
  {{"key","adb_host"},            {"aliases", nlohmann::json::array()}, {"type","string"}, {"default","127.0.0.1"}, {"description","ADB server host"}, {"persistent", true}},
  {{"key","adb_port"},            {"aliases", nlohmann::json::array()}, {"type","int"},    {"default",5037},      {"description","ADB server port"}, {"persistent", true}},
  {{"key","bridge_timeout_ms"},   {"aliases", {"btm"}},            {"type","int"},    {"default",15000},     {"description","Timeout for device probes and shell commands"}, {"persistent", true}},
  {{"key","push_timeout_ms"},     {"aliases", {"ptm"}},            {"type","int"},    {"default",300000},    {"description","Inactivity timeout for a single push"}, {"persistent", true}},
  {{"key","conflict_policy"},     {"aliases", {"conflicts"}},      {"type","string"}, {"default","prompt"},  {"description","Pre-existing remote files (prompt|skip|override|cancel)"}, {"persistent", true}},
  {{"key","master_only"},         {"aliases", {"mo"}},             {"type","bool"},   {"default",false},     {"description","Transfer to the master device only"}, {"persistent", false}},
  {{"key","slave_only"},          {"aliases", {"so"}},             {"type","bool"},   {"default",false},     {"description","Transfer to the slave device only"}, {"persistent", false}},
  {{"key","videos_only"},         {"aliases", {"vo"}},             {"type","bool"},   {"default",false},     {"description","Transfer videos and images, skip the JSON files"}, {"persistent", false}},
  {{"key","json_only"},           {"aliases", {"jo"}},             {"type","bool"},   {"default",false},     {"description","Transfer new_data.json and credential.json only"}, {"persistent", false}},
  {{"key","clean_remote"},        {"aliases", {"clean"}},          {"type","bool"},   {"default",false},     {"description","Remove previous content from the device before transfer"}, {"persistent", false}},
  {{"key","device"},              {"aliases", {"d"}},              {"type","string"}, {"default",""},        {"description","Serial to verify"}, {"persistent", false}},
  {{"key","deployment"},          {"aliases", nlohmann::json::array()}, {"type","bool"},   {"default",false},     {"description","Verify master and slave together"}, {"persistent", false}},
  {{"key","auto"},                {"aliases", {"a"}},              {"type","bool"},   {"default",false},     {"description","Pick master and slave from connected devices"}, {"persistent", false}},
  {{"key","skip_fetch"},          {"aliases", {"sf"}},             {"type","bool"},   {"default",false},     {"description","Deploy without fetching new_data.json"}, {"persistent", false}},
  {{"key","skip_download"},       {"aliases", {"sd"}},             {"type","bool"},   {"default",false},     {"description","Deploy without downloading assets"}, {"persistent", false}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"lf"}},             {"type","string"}, {"default",""},        {"description","Mirror all log output into this file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { String, Int, Bool, Json };

struct SettingSpec {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  bool persistent = true;
};

const char* setting_type_name(SettingType type);

// Throws std::invalid_argument on a malformed table.
std::vector<SettingSpec> parse_setting_specs(const nlohmann::json& table);

class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& table = SETTINGS_SPECIFICATION);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  // Parses value according to the setting's type. key may be an alias.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Matches a key or an alias, case-insensitively.
  const SettingSpec* find(const std::string& token) const;
  const std::vector<SettingSpec>& specs() const { return specs_; }
  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  // An explicit path wins. Otherwise the first existing file among
  // ./onboard_config.json, ~/.onboard/config.json and /etc/onboard/config.json,
  // or the first of them when none exists yet.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { explicit_path_ = path; }

  // Missing file is not an error; unreadable or invalid JSON is.
  bool load();
  bool save() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static std::optional<bool> parse_bool(const std::string& text);

private:
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path explicit_path_;
};

// Human readable problems with the configuration; empty means usable.
// Credentials are only demanded for commands that log in to the backend.
std::vector<std::string> validate_settings(const SettingsManager& settings,
                                           bool require_credentials = false);
