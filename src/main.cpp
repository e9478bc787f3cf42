#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>

#include "hub_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "ttyhub");

    // The first pass only finds --config; the second lets the command line
    // win over the file.
    try {
      parser.parse(argc, argv, *settings);
    } catch(const UsageError& e) {
      print_err("{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    HubEngine::Options options;
    options.handle_signals = true;
    auto config = settings->get<std::string>("config");
    settings->set_settings_path(config.empty()
      ? options.state_dir / "settings.json"
      : std::filesystem::path(config));
    if(!settings->load() && !config.empty()) {
      print_err("Unable to read {}", config);
      return 1;
    }
    parser.parse(argc, argv, *settings);

    HubEngine engine(settings, options);
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("ttyhub-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
