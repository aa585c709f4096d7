#include <cpptrace/cpptrace.hpp>

#include <stdexcept>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "poll_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  init();
  auto logger = std::make_shared<Logger>();

  SettingsManager settings;
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "downloadarr");
  try {
    parser.parse(argc, argv, settings);
  } catch(const std::invalid_argument& e) {
    print_err(logger.get(), "{}", e.what());
    parser.usage();
    return 1;
  }
  if(settings.help_requested()) {
    parser.usage();
    return 0;
  }

  try {
    auto options = PollEngine::options_from_settings(settings);
    if(options.debug) {
      init(spdlog::level::debug);
      logger->debug("Settings: {}", settings.get_json().dump());
    }

    PollEngine engine(options, logger);
    engine.run();
    return 0;
  } catch(const ConfigurationFatal& e) {
    logger->clear_status();
    logger->critical("{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    logger->clear_status();
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
