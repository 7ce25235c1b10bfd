#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "onboard_app.hpp"
#include "settings_manager.hpp"

namespace {

// --config has to be known before the settings file is loaded, so it is
// picked out of argv ahead of the real parse.
std::string find_config_override(int argc, char** argv) {
  for(int i = 1; i + 1 < argc; ++i) {
    std::string token = argv[i];
    if(token == "--config" || token == "-config" || token == "-c" || token == "--c") {
      return argv[i + 1];
    }
    for(const char* prefix : {"--config=", "-config="}) {
      if(token.rfind(prefix, 0) == 0) return token.substr(std::string(prefix).size());
    }
  }
  return std::string();
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    auto config = find_config_override(argc, argv);
    if(!config.empty()) {
      settings->set_settings_path(config);
      if(!std::filesystem::exists(config)) {
        init(false);
        print_err(nullptr, "Configuration file {} not found", config);
        return 1;
      }
    }
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "onboard");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));

    OnboardApp app(settings);
    auto logger = app.logger();
    logger->debug("Configuration from {}", settings->settings_path().string());

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      } else {
        logger->info("Settings saved to {}", settings->settings_path().string());
      }
      if(settings->get<std::string>("command").empty()) return 0;
    }

    return app.run();
  } catch(std::exception& e) {
    init(false);
    Logger logger("onboard-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
