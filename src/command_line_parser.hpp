#pragma once

#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "settings_manager.hpp"

// polyglot [--option value]... <command> [args...]
//
// Options before the command set runtime settings. Everything from the
// first non-option token on is handed back untouched as the command line.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "polyglot",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    std::shared_ptr<Logger> logger = nullptr);

  // Throws PolyglotError(Validation) on unknown options or bad values.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::shared_ptr<Logger> logger_;
};
