#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings. Long options use the setting key ("--device-path"
// and "--device_path" are the same), single-dash tokens may also be aliases,
// and bare words fill the positional settings in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "onboard",
                             std::vector<std::string> positional = {"command"});

  // Prints the problem and the usage text, then exits with status 1.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;

  void usage() const;

private:
  // 1 when the option (and its value) was consumed, 0 when token is not an
  // option after all, -1 on error.
  int take_option(const std::string& name,
                  bool long_form,
                  const std::vector<std::string>& args,
                  std::size_t& index,
                  SettingsManager& settings,
                  std::string& error) const;

  std::string process_name_;
  std::vector<std::string> positional_;
};
