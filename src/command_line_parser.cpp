#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "errors.hpp"
#include "utils.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     std::shared_ptr<Logger> logger)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("")) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return candidate.size() > 2;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }

  auto fail = [&](const std::string& message){
    throw PolyglotError(ErrorKind::Validation, message);
  };

  std::size_t i = 0;
  for(; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token == "--") {
      ++i;
      break;
    }
    if(!is_option_token(token)) break;

    const bool long_form = token.rfind("--", 0) == 0;
    const std::string key_token = token.substr(long_form ? 2 : 1);
    auto resolved = settings.resolve_key(key_token);
    if(!resolved) {
      fail("Unknown option " + token);
    }

    std::string value;
    if(settings.is_bool_setting(*resolved)) {
      if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        fail("Missing value for option '" + key_token + "'");
      }
      value = args[++i];
    }
    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      fail("Invalid value for option '" + key_token + "': " + error);
    }
  }

  return std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
}

void CommandLineParser::usage() const {
  logger_->print("{} - language mirrors for a media library", process_name_);
  logger_->print("Usage:");
  logger_->print("  {} [--option value]... <command> [args...]", process_name_);
  logger_->print("  {} [--option value]...            (interactive shell)", process_name_);
  logger_->print("");
  logger_->print("Run '{} help' for the list of commands.", process_name_);
  logger_->print("");
  logger_->print("Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    const auto alias_list = entry.value("aliases", std::vector<std::string>{});
    if(!alias_list.empty()) {
      aliases << " (alias: ";
      for(std::size_t a = 0; a < alias_list.size(); ++a) {
        if(a > 0) aliases << ", ";
        aliases << (alias_list[a].size() == 1 ? "-" : "--") << alias_list[a];
      }
      aliases << ")";
    }
    auto default_value = entry.at("default");
    std::string default_str;
    if(default_value.is_boolean()) {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    logger_->print("  --{:<17} {:<12} {}{} (default: {})",
                   key,
                   argument_hint,
                   entry.value("description", ""),
                   aliases.str(),
                   default_str.empty() ? "none" : default_str);
  }
  logger_->print("");
}
