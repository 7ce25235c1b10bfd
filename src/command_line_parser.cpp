#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  return token.size() >= 2 && token[0] == '-' &&
         (token[1] == '-' || std::isalpha(static_cast<unsigned char>(token[1])));
}

struct CommandHelp {
  const char* name;
  const char* summary;
};

constexpr CommandHelp kCommands[] = {
  {"list-devices", "show connected devices"},
  {"verify",       "check a device (--device) or the deployment (--deployment)"},
  {"fetch-data",   "log in and write new_data.json"},
  {"download",     "download videos and images named by new_data.json"},
  {"transfer",     "push content to master and slave devices"},
  {"deploy",       "fetch, download, transfer and verify in one go"},
  {"settings",     "print the effective configuration"},
};

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional)
  : process_name_(std::move(process_name)),
    positional_(std::move(positional)) {}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  std::string error;
  if(!parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage();
    std::exit(1);
  }
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    if(token.rfind("--", 0) == 0) {
      if(take_option(token.substr(2), true, args, i, settings, error) < 0) return false;
      continue;
    }
    if(looks_like_option(token)) {
      int taken = take_option(token.substr(1), false, args, i, settings, error);
      if(taken < 0) return false;
      if(taken > 0) continue;
    }
    if(next_positional >= positional_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

int CommandLineParser::take_option(const std::string& name,
                                   bool long_form,
                                   const std::vector<std::string>& args,
                                   std::size_t& index,
                                   SettingsManager& settings,
                                   std::string& error) const {
  std::string key = name;
  std::replace(key.begin(), key.end(), '-', '_');
  const auto* spec = settings.find(key);
  if(!spec) {
    if(!long_form) return 0;
    error = "Unknown option --" + name;
    return -1;
  }

  std::string value;
  if(spec->type == SettingType::Bool) {
    // A flag alone means true; an explicit literal may follow.
    value = "true";
    if(index + 1 < args.size() && !looks_like_option(args[index + 1]) &&
       SettingsManager::parse_bool(args[index + 1])) {
      value = args[++index];
    }
  } else {
    if(index + 1 >= args.size()) {
      error = "Missing value for option '" + name + "'";
      return -1;
    }
    value = args[++index];
  }

  std::string set_error;
  if(!settings.set_from_string(spec->key, value, set_error)) {
    error = "Invalid value for option '" + name + "': " + set_error;
    return -1;
  }
  return 1;
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - onboard media assets onto EldersVR devices", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options]", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& command : kCommands) {
    print_out(nullptr, "  {:<14} {}", command.name, command.summary);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Options:");

  SettingsManager defaults;
  for(const auto& spec : defaults.specs()) {
    std::string hint = spec.type == SettingType::Bool
      ? "[true|false]"
      : "<" + std::string(setting_type_name(spec.type)) + ">";
    std::string aliases;
    for(const auto& alias : spec.aliases) {
      aliases += (aliases.empty() ? " (alias: -" : ", -") + alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              spec.key, hint, spec.description, aliases, defaults.value_as_string(spec.key));
  }
  print_out(nullptr, "");
}
