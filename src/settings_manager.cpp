#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "log.hpp"

namespace {

SettingType parse_type(const std::string& name) {
  if(name == "string") return SettingType::String;
  if(name == "int") return SettingType::Int;
  if(name == "bool") return SettingType::Bool;
  if(name == "json") return SettingType::Json;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

} // namespace

const char* setting_type_name(SettingType type) {
  switch(type) {
    case SettingType::String: return "string";
    case SettingType::Int: return "int";
    case SettingType::Bool: return "bool";
    case SettingType::Json: return "json";
  }
  return "unknown";
}

std::vector<SettingSpec> parse_setting_specs(const nlohmann::json& table) {
  std::vector<SettingSpec> specs;
  for(const auto& row : table) {
    SettingSpec spec;
    spec.key = row.at("key").get<std::string>();
    for(const auto& alias : row.value("aliases", nlohmann::json::array())) {
      spec.aliases.push_back(SettingsManager::to_lower(alias.get<std::string>()));
    }
    spec.type = parse_type(row.at("type").get<std::string>());
    spec.default_value = row.at("default");
    spec.description = row.value("description", "");
    spec.persistent = row.value("persistent", true);
    specs.push_back(std::move(spec));
  }
  return specs;
}

SettingsManager::SettingsManager(const nlohmann::json& table)
  : specs_(parse_setting_specs(table)) {
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

const SettingSpec* SettingsManager::find(const std::string& token) const {
  auto lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(spec.key == lowered ||
       std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> result;
  for(const auto& spec : specs_) result.push_back(spec.key);
  return result;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  return it->dump();
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  error.clear();
  const auto* spec = find(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto text = trim_copy(value);
  nlohmann::json parsed;
  switch(spec->type) {
    case SettingType::String:
      parsed = text;
      break;
    case SettingType::Bool: {
      auto flag = parse_bool(text);
      if(!flag) {
        error = "expected true/false, on/off, yes/no or 1/0";
        return false;
      }
      parsed = *flag;
      break;
    }
    case SettingType::Int:
      try {
        std::size_t used = 0;
        parsed = std::stoi(text, &used);
        if(used != text.size()) {
          error = "trailing characters after integer";
          return false;
        }
      } catch(const std::exception&) {
        error = "expected an integer";
        return false;
      }
      break;
    case SettingType::Json:
      parsed = nlohmann::json::parse(text, nullptr, false);
      if(parsed.is_discarded()) {
        error = "expected JSON";
        return false;
      }
      break;
  }
  return store(*spec, parsed, error);
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  bool ok = false;
  switch(spec.type) {
    case SettingType::String: ok = value.is_string(); break;
    case SettingType::Int: ok = value.is_number_integer(); break;
    case SettingType::Bool: ok = value.is_boolean(); break;
    case SettingType::Json: ok = true; break;
  }
  if(!ok) {
    error = std::string("expected ") + setting_type_name(spec.type);
    return false;
  }
  values_[spec.key] = value;
  return true;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!explicit_path_.empty()) return explicit_path_;
  std::vector<std::filesystem::path> candidates{std::filesystem::current_path() / "onboard_config.json"};
  if(const char* home = std::getenv("HOME")) {
    candidates.push_back(std::filesystem::path(home) / ".onboard" / "config.json");
  }
  candidates.push_back("/etc/onboard/config.json");
  std::error_code ec;
  for(const auto& candidate : candidates) {
    if(std::filesystem::exists(candidate, ec)) return candidate;
  }
  return candidates.front();
}

bool SettingsManager::load() {
  auto path = settings_path();
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return true;

  std::ifstream in(path);
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(!in.is_open() || doc.is_discarded() || !doc.is_object()) {
    print_err(nullptr, "Failed to read settings from {}", path.string());
    return false;
  }
  for(const auto& [key, value] : doc.items()) {
    const auto* spec = find(key);
    if(!spec) continue;
    std::string error;
    if(!store(*spec, value, error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", key, path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = values_.at(spec.key);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2) << "\n";
  return static_cast<bool>(out);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  auto v = to_lower(trim_copy(text));
  if(v == "true" || v == "on" || v == "yes" || v == "1") return true;
  if(v == "false" || v == "off" || v == "no" || v == "0") return false;
  return std::nullopt;
}

std::vector<std::string> validate_settings(const SettingsManager& settings, bool require_credentials) {
  std::vector<std::string> issues;

  auto api_url = settings.get<std::string>("api_url");
  if(!starts_with(api_url, "http://") && !starts_with(api_url, "https://")) {
    issues.push_back("api_url must start with http:// or https://");
  }
  for(const char* key : {"auth_endpoint", "tags_endpoint", "films_endpoint"}) {
    if(!starts_with(settings.get<std::string>(key), "/")) {
      issues.push_back(std::string(key) + " must start with '/'");
    }
  }
  if(SettingsManager::trim_copy(settings.get<std::string>("device_path")).empty()) {
    issues.push_back("device_path must not be empty");
  }
  auto fallbacks = settings.get<nlohmann::json>("fallback_paths");
  bool fallbacks_ok = fallbacks.is_array() &&
    std::all_of(fallbacks.begin(), fallbacks.end(), [](const nlohmann::json& entry){
      return entry.is_string() && !entry.get<std::string>().empty();
    });
  if(!fallbacks_ok) {
    issues.push_back("fallback_paths must be a JSON array of non-empty strings");
  }
  if(settings.get<int>("max_concurrent_downloads") <= 0) {
    issues.push_back("max_concurrent_downloads must be positive");
  }
  if(settings.get<int>("http_timeout") <= 0) {
    issues.push_back("http_timeout must be positive");
  }
  if(settings.get<int>("retry_attempts") < 0) {
    issues.push_back("retry_attempts must not be negative");
  }
  if(settings.get<int>("retry_delay_ms") < 0) {
    issues.push_back("retry_delay_ms must not be negative");
  }
  int adb_port = settings.get<int>("adb_port");
  if(adb_port <= 0 || adb_port > 65535) {
    issues.push_back("adb_port must be between 1 and 65535");
  }
  auto quality = SettingsManager::to_lower(settings.get<std::string>("quality"));
  if(quality != "high" && quality != "low" && quality != "both") {
    issues.push_back("quality must be one of high, low, both");
  }
  auto policy = SettingsManager::to_lower(settings.get<std::string>("conflict_policy"));
  if(policy != "prompt" && policy != "skip" && policy != "override" && policy != "cancel") {
    issues.push_back("conflict_policy must be one of prompt, skip, override, cancel");
  }
  if(require_credentials && settings.get<std::string>("email").empty()) {
    issues.push_back("email is required");
  }
  return issues;
}
