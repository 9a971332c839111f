#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_session.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "bulkfetch");
    try {
      parser.parse(argc, argv, settings);
    } catch(const ConfigError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return kExitConfigError;
    }
    if(settings.help_requested()) {
      parser.usage();
      return kExitSuccess;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("bulkfetch");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    TransferSession session(SessionOptions::from_settings(settings), logger);

    if(settings.get<bool>("dry_run")) {
      session.preview();
      return kExitSuccess;
    }

    RunResult result = settings.get<bool>("verify_only") ? session.audit() : session.run();
    if(!result.ok()) {
      logger->error("Run finished with {} (exit {})", to_string(result.outcome), result.exit_code);
    }
    return result.exit_code;
  } catch(const ConfigError& e) {
    init(false);
    Logger logger("bulkfetch");
    logger.error("{}", e.what());
    return kExitConfigError;
  } catch(const LaunchError& e) {
    init(false);
    Logger logger("bulkfetch");
    logger.error("Transfer client was never started: {}", e.what());
    return kExitLaunchFailed;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("bulkfetch");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitConfigError;
  }
}
