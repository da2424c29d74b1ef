#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "vegam_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    VegamEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = false;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "vegam");
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    VegamEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.run();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("vegam-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
