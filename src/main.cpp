#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "polyglot_engine.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::string join_command(const std::vector<std::string>& words) {
    std::string line;
    for (const auto& word : words) {
        if (!line.empty()) line += ' ';
        if (word.find_first_of(" \t") != std::string::npos) {
            line += '"' + word + '"';
        } else {
            line += word;
        }
    }
    return line;
}

} // namespace

int main(int argc, char** argv){
  try {
    PolyglotEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "polyglot");
    std::vector<std::string> command;
    try {
      command = parser.parse(argc, argv, *settings);
    } catch(const PolyglotError& e) {
      Logger("polyglot").print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    const bool interactive = command.empty();
    const bool serve = !interactive && to_lower(command.front()) == "serve";
    options.start_cli_thread = interactive;
    options.enable_scheduler = interactive || serve;

    PolyglotEngine engine(settings, options);
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(settings->save()) {
        logger->info("Saved settings to {}", settings->settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    if(interactive || serve) {
      if(serve && !engine.execute_command(join_command(command))) {
        engine.stop();
        return 1;
      }
      engine.run();
      engine.stop();
      return 0;
    }

    engine.start_background();
    bool ok = engine.execute_command(join_command(command));
    engine.stop();
    return ok ? 0 : 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("polyglot-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
