#pragma once
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "configuration_store.hpp"
#include "errors.hpp"
#include "host_catalog.hpp"
#include "library_access_service.hpp"
#include "log.hpp"
#include "mirror_service.hpp"
#include "orphan_reconciler.hpp"
#include "polyglot_engine.hpp"
#include "settings_manager.hpp"
#include "user_language_service.hpp"
#include "utils.hpp"

// Operator shell. Runs one command line at a time, either from the
// interactive loop or from execute_command().
class PolyglotCLI {
public:
  PolyglotCLI(PolyglotEngine& engine, std::shared_ptr<Logger> logger)
    : engine_(engine),
      logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")),
      running_(true) {}

  ~PolyglotCLI() {
    stop();
  }

  void start(std::function<void()> on_exit) {
    on_exit_ = std::move(on_exit);
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable()) cli_thread_.join();
  }

  bool execute_command(const std::string& line) {
    auto words = split_words(line);
    if(words.empty()) return true;
    engine_.clear_cancellation();
    try {
      return dispatch(words);
    } catch(const PolyglotError& e) {
      logger_->print_err("error ({}): {}", error_kind_name(e.kind()), e.what());
    } catch(const std::exception& e) {
      logger_->print_err("error: {}", e.what());
    }
    return false;
  }

private:
  // Positional words plus the --flags given after the command.
  struct Args {
    std::vector<std::string> words;
    std::set<std::string> flags;

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
    std::size_t size() const { return words.size(); }
    const std::string& operator[](std::size_t i) const { return words[i]; }
  };

  PolyglotEngine& engine_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::function<void()> on_exit_;
  std::atomic<bool> quit_requested_{false};

#if !defined(HAVE_READLINE)
  std::vector<std::string> cli_history_;
  static constexpr std::size_t history_limit_ = 200;
#endif

  void run_loop() {
    logger_->print("polyglot shell, type 'help' for commands");
    while(running_ && !quit_requested_) {
      auto input = read_command_line("polyglot> ");
      if(!input) break;
      if(trim_copy(*input).empty()) continue;
      execute_command(*input);
    }
    running_ = false;
    if(on_exit_) on_exit_();
  }

  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    if(!line.empty() && (cli_history_.empty() || cli_history_.back() != line)) {
      cli_history_.push_back(line);
      if(cli_history_.size() > history_limit_) {
        cli_history_.erase(cli_history_.begin());
      }
    }
    return line;
#endif
  }

  static Args split_args(const std::vector<std::string>& words, std::size_t first) {
    Args args;
    for(std::size_t i = first; i < words.size(); ++i) {
      if(words[i].size() > 2 && words[i].rfind("--", 0) == 0) {
        args.flags.insert(to_lower(words[i].substr(2)));
      } else {
        args.words.push_back(words[i]);
      }
    }
    return args;
  }

  bool usage(const char* text) {
    logger_->print_err("usage: {}", text);
    return false;
  }

  bool dispatch(const std::vector<std::string>& words) {
    const std::string cmd = to_lower(words[0]);
    const Args args = split_args(words, 1);

    if(cmd == "libraries" || cmd == "libs") return list_libraries();
    if(cmd == "alternatives" || cmd == "alts") return list_alternatives();
    if(cmd == "alt-add") return add_alternative(args);
    if(cmd == "alt-remove") return remove_alternative(args);
    if(cmd == "mirror-add") return add_mirror(args);
    if(cmd == "mirror-remove") return remove_mirror(args);
    if(cmd == "sync") return sync(args);
    if(cmd == "cleanup") return cleanup();
    if(cmd == "scan") return scan();
    if(cmd == "users") return list_users();
    if(cmd == "assign") return assign(args);
    if(cmd == "clear") return clear(args);
    if(cmd == "reconcile") return reconcile();
    if(cmd == "enable-all") return enable_all();
    if(cmd == "disable") return disable(args);
    if(cmd == "library-add") return add_host_library(args);
    if(cmd == "user-add") return add_host_user(args);
    if(cmd == "user-remove") return remove_host_user(args);
    if(cmd == "exclusions") return show_exclusions();
    if(cmd == "settings" || cmd == "set") return handle_settings(args);
    if(cmd == "serve") return serve();
    if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
      return true;
    }
    if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      logger_->print("Quitting...");
      quit_requested_ = true;
      return true;
    }
    logger_->print_err("Unknown command: {} (try 'help')", words[0]);
    return false;
  }

  // ---- lookups ------------------------------------------------------------

  std::optional<Alternative> resolve_alternative(const std::string& token) const {
    for(const auto& alt : engine_.store()->get_alternatives()) {
      if(alt.id == token || iequals(alt.name, token)) return alt;
    }
    return std::nullopt;
  }

  std::optional<VirtualLibrary> resolve_library(const std::string& token) const {
    for(const auto& lib : engine_.catalog()->list_libraries()) {
      if(lib.id == token || iequals(lib.name, token)) return lib;
    }
    return std::nullopt;
  }

  std::optional<HostUser> resolve_user(const std::string& token) const {
    for(const auto& user : engine_.catalog()->list_users()) {
      if(user.id == token || iequals(user.username, token)) return user;
    }
    return std::nullopt;
  }

  Alternative require_alternative(const std::string& token) const {
    auto alt = resolve_alternative(token);
    if(!alt) throw PolyglotError(ErrorKind::NotFound, "No alternative named '" + token + "'");
    return *alt;
  }

  VirtualLibrary require_library(const std::string& token) const {
    auto lib = resolve_library(token);
    if(!lib) throw PolyglotError(ErrorKind::NotFound, "No library named '" + token + "'");
    return *lib;
  }

  HostUser require_user(const std::string& token) const {
    auto user = resolve_user(token);
    if(!user) throw PolyglotError(ErrorKind::NotFound, "No user named '" + token + "'");
    return *user;
  }

  ProgressCallback progress_printer(const std::string& label) {
    auto last = std::make_shared<int>(-1);
    return [this, label, last](double percent){
      int step = static_cast<int>(percent / 10.0);
      if(step <= *last) return;
      *last = step;
      logger_->print("  {} {:3.0f}%", label, percent);
    };
  }

  // ---- libraries and alternatives -----------------------------------------

  bool list_libraries() {
    auto libraries = engine_.mirrors()->get_libraries();
    if(libraries.empty()) {
      logger_->print("No libraries.");
      return true;
    }
    for(const auto& lib : libraries) {
      std::string kind = "source";
      if(lib.is_mirror && lib.alternative_id) {
        auto alt = engine_.store()->get_alternative(*lib.alternative_id);
        kind = "mirror (" + (alt ? alt->name : *lib.alternative_id) + ")";
      }
      std::string paths;
      for(const auto& p : lib.paths) {
        if(!paths.empty()) paths += ", ";
        paths += p;
      }
      logger_->print("  {:<24} {:<10} {:<22} {}", lib.name, lib.collection_type.empty() ? "-" : lib.collection_type,
                     kind, paths);
    }
    return true;
  }

  bool list_alternatives() {
    auto alternatives = engine_.store()->get_alternatives();
    if(alternatives.empty()) {
      logger_->print("No alternatives.");
      return true;
    }
    const auto settings = engine_.store()->get_settings();
    for(const auto& alt : alternatives) {
      bool is_default = settings.default_alternative_id && *settings.default_alternative_id == alt.id;
      logger_->print("{} [{}] -> {}{}", alt.name, alt.language_code, alt.destination_base_path,
                     is_default ? " (default)" : "");
      if(alt.mirrors.empty()) {
        logger_->print("    no mirrors");
      }
      for(const auto& m : alt.mirrors) {
        logger_->print("    {:<24} <- {:<20} {:<8} files={} last={}", m.target_library_name, m.source_library_name,
                       sync_status_name(m.status), m.last_file_count,
                       m.last_synced_at ? format_timestamp(*m.last_synced_at) : std::string("never"));
        if(m.last_error) logger_->print("      error: {}", *m.last_error);
      }
    }
    return true;
  }

  bool add_alternative(const Args& args) {
    if(args.size() < 3 || args.size() > 5) {
      return usage("alt-add <name> <language-code> <base-path> [metadata-language] [metadata-country]");
    }
    auto alt = engine_.mirrors()->create_alternative(args[0], args[1], args[2],
                                                     args.size() > 3 ? args[3] : std::string(),
                                                     args.size() > 4 ? args[4] : std::string());
    logger_->print("Created alternative {} ({}-{}) id {}", alt.name, alt.metadata_language,
                   alt.metadata_country.empty() ? "*" : alt.metadata_country, alt.id);
    return true;
  }

  bool remove_alternative(const Args& args) {
    if(args.size() != 1) return usage("alt-remove <alternative> [--libraries] [--files]");
    auto alt = require_alternative(args[0]);
    auto result = engine_.mirrors()->delete_alternative(alt.id, args.has("libraries"), args.has("files"));
    for(const auto& failure : result.failures) {
      logger_->print_err("  {}", failure);
    }
    if(!result.removed) {
      logger_->print_err("Alternative {} kept, {} mirror(s) could not be removed", alt.name, result.failures.size());
      return false;
    }
    logger_->print("Removed alternative {}", alt.name);
    return true;
  }

  bool add_mirror(const Args& args) {
    if(args.size() < 3 || args.size() > 4) {
      return usage("mirror-add <alternative> <source-library> <target-path> [library-name]");
    }
    auto alt = require_alternative(args[0]);
    auto source = require_library(args[1]);
    auto mirror = engine_.mirrors()->add_mirror(alt.id, source.id, args[2], args.size() > 3 ? args[3] : std::string());
    logger_->print("Mirror {} created at {} ({} files)", mirror.target_library_name, mirror.target_path,
                   mirror.last_file_count);
    engine_.access()->reconcile_all_users(engine_.cancellation());
    return true;
  }

  bool remove_mirror(const Args& args) {
    if(args.size() != 2) return usage("mirror-remove <alternative> <source-library> [--library] [--files] [--force]");
    auto alt = require_alternative(args[0]);
    const Mirror* mirror = nullptr;
    for(const auto& m : alt.mirrors) {
      if(m.source_library_id == args[1] || iequals(m.source_library_name, args[1]) ||
         iequals(m.target_library_name, args[1])) {
        mirror = &m;
        break;
      }
    }
    if(!mirror) {
      throw PolyglotError(ErrorKind::NotFound, alt.name + " has no mirror of '" + args[1] + "'");
    }
    const bool keep_defaults = !args.has("library") && !args.has("files");
    auto result = engine_.mirrors()->delete_mirror(mirror->id,
                                                   keep_defaults || args.has("library"),
                                                   keep_defaults || args.has("files"),
                                                   args.has("force"));
    if(result.library_error) logger_->print_err("  library: {}", *result.library_error);
    if(result.files_error) logger_->print_err("  files: {}", *result.files_error);
    logger_->print("Removed mirror {}", mirror->target_library_name);
    engine_.access()->reconcile_all_users(engine_.cancellation());
    return true;
  }

  // ---- sync and maintenance -----------------------------------------------

  bool sync(const Args& args) {
    if(args.size() > 1) return usage("sync [alternative]");
    if(args.size() == 0) {
      bool ok = engine_.run_task_and_wait(PolyglotEngine::TaskKind::MirrorSync);
      logger_->print(ok ? "Sync finished" : "Sync did not complete");
      return ok;
    }
    auto alt = require_alternative(args[0]);
    auto result = engine_.mirrors()->sync_all_mirrors(alt.id, progress_printer(alt.name), engine_.cancellation());
    logger_->print("{}: {} ({}/{} synced, {} failed)", alt.name, sync_all_status_name(result.status),
                   result.synced, result.total, result.failed);
    return result.status == SyncAllResult::Status::Completed;
  }

  bool cleanup() {
    auto result = engine_.orphans()->cleanup(engine_.cancellation());
    for(const auto& label : result.cleaned) logger_->print("  removed {}", label);
    for(const auto& failure : result.failed) logger_->print_err("  failed {}", failure);
    if(!result.sources_without_mirrors.empty()) {
      for(const auto& config : engine_.store()->get_user_languages()) {
        if(config.plugin_managed) {
          engine_.access()->add_libraries_to_user_access(config.user_id, result.sources_without_mirrors);
        }
      }
      engine_.access()->reconcile_all_users(engine_.cancellation());
    }
    logger_->print("Cleaned {} orphaned mirror(s), {} failed", result.total_cleaned(), result.failed.size());
    return result.failed.empty();
  }

  bool scan() {
    bool ok = engine_.run_task_and_wait(PolyglotEngine::TaskKind::PostScan);
    logger_->print(ok ? "Post-scan sync finished" : "Post-scan sync did not complete");
    return ok;
  }

  // ---- users --------------------------------------------------------------

  bool list_users() {
    auto users = engine_.user_languages()->get_all_users_with_languages();
    if(users.empty()) {
      logger_->print("No users.");
      return true;
    }
    for(const auto& u : users) {
      std::string language = u.plugin_managed
        ? (u.assigned_alternative_id ? (u.assigned_alternative_name.empty() ? *u.assigned_alternative_id
                                                                           : u.assigned_alternative_name)
                                     : std::string("default"))
        : std::string("(unmanaged)");
      logger_->print("  {:<20} {:<16} {}{}", u.username, language,
                     u.set_by.empty() ? std::string() : "set by " + u.set_by,
                     u.is_administrator ? " [admin]" : "");
    }
    return true;
  }

  bool assign(const Args& args) {
    if(args.size() != 2) return usage("assign <user> <alternative|default>");
    auto user = require_user(args[0]);
    std::optional<std::string> alternative_id;
    if(!iequals(args[1], "default")) {
      alternative_id = require_alternative(args[1]).id;
    }
    engine_.user_languages()->assign_language(user.id, alternative_id, "admin", true, true);
    logger_->print("{} now watches {}", user.username, alternative_id ? args[1] : std::string("the default libraries"));
    return true;
  }

  bool clear(const Args& args) {
    if(args.size() != 1) return usage("clear <user>");
    auto user = require_user(args[0]);
    engine_.user_languages()->clear_language(user.id);
    logger_->print("Cleared language of {}", user.username);
    return true;
  }

  bool reconcile() {
    int changed = engine_.access()->reconcile_all_users(engine_.cancellation());
    logger_->print("Corrected library access of {} user(s)", changed);
    return true;
  }

  bool enable_all() {
    int enabled = engine_.access()->enable_all_users(engine_.cancellation());
    logger_->print("Enabled management for {} user(s)", enabled);
    return true;
  }

  bool disable(const Args& args) {
    if(args.size() != 1) return usage("disable <user> [--restore]");
    auto user = require_user(args[0]);
    engine_.access()->disable_user(user.id, args.has("restore"));
    logger_->print("{} is no longer managed", user.username);
    return true;
  }

  // ---- host catalog -------------------------------------------------------

  bool add_host_library(const Args& args) {
    if(args.size() < 3) return usage("library-add <name> <collection-type> <path> [path...]");
    std::vector<std::string> paths(args.words.begin() + 2, args.words.end());
    auto id = engine_.catalog()->add_source_library(args[0], args[1], paths);
    logger_->print("Added library {} id {}", args[0], id);
    return true;
  }

  bool add_host_user(const Args& args) {
    if(args.size() != 1) return usage("user-add <username> [--admin]");
    auto id = engine_.catalog()->add_user(args[0], args.has("admin"));
    logger_->print("Added user {} id {}", args[0], id);
    engine_.notify_user_created(id);
    return true;
  }

  bool remove_host_user(const Args& args) {
    if(args.size() != 1) return usage("user-remove <user>");
    auto user = require_user(args[0]);
    if(!engine_.catalog()->remove_user(user.id)) {
      throw PolyglotError(ErrorKind::NotFound, "No user named '" + args[0] + "'");
    }
    engine_.notify_user_deleted(user.id);
    logger_->print("Removed user {}", user.username);
    return true;
  }

  // ---- settings -----------------------------------------------------------

  static std::string join(const std::vector<std::string>& values) {
    std::string out;
    for(const auto& v : values) {
      if(!out.empty()) out += ",";
      out += v;
    }
    return out;
  }

  static std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string item;
    while(std::getline(iss, item, ',')) {
      item = to_lower(trim_copy(item));
      if(!item.empty()) out.push_back(item);
    }
    return out;
  }

  static std::optional<bool> parse_bool(const std::string& value) {
    auto v = to_lower(trim_copy(value));
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    return std::nullopt;
  }

  static std::optional<int> parse_non_negative(const std::string& value) {
    try {
      std::size_t used = 0;
      int n = std::stoi(value, &used);
      if(used != value.size() || n < 0) return std::nullopt;
      return n;
    } catch(const std::logic_error&) {
      return std::nullopt;
    }
  }

  bool show_exclusions() {
    const auto s = engine_.store()->get_settings();
    logger_->print("excluded_extensions  = {}", join(s.excluded_extensions));
    logger_->print("excluded_directories = {}", join(s.excluded_directories));
    logger_->print("included_directories = {}", join(s.included_directories));
    return true;
  }

  void list_settings() {
    const auto s = engine_.store()->get_settings();
    std::string default_name = "none";
    if(s.default_alternative_id) {
      auto alt = engine_.store()->get_alternative(*s.default_alternative_id);
      default_name = alt ? alt->name : *s.default_alternative_id;
    }
    logger_->print("default_alternative             = {}", default_name);
    logger_->print("auto_manage_new_users           = {}", s.auto_manage_new_users);
    logger_->print("sync_mirrors_after_library_scan = {}", s.sync_mirrors_after_library_scan);
    logger_->print("mirror_sync_interval_hours      = {}", s.mirror_sync_interval_hours);
    logger_->print("user_reconciliation_time        = {}", s.user_reconciliation_time);
    logger_->print("ghost_threshold_minutes         = {}", s.ghost_threshold_minutes);
    show_exclusions();
    auto runtime = engine_.settings();
    for(const auto& key : runtime->keys()) {
      if(key == "help" || key == "save") continue;
      logger_->print("{:<31} = {}", key, runtime->value_as_string(key));
    }
  }

  // Applies one store-backed setting. Returns nullopt for keys that are
  // not store settings.
  std::optional<bool> apply_store_setting(const std::string& key, const std::string& value, std::string& error) {
    std::function<bool(PluginSettings&)> change;
    if(key == "default_alternative") {
      std::optional<std::string> id;
      if(!iequals(value, "none") && !iequals(value, "default")) {
        auto alt = resolve_alternative(value);
        if(!alt) {
          error = "no alternative named '" + value + "'";
          return false;
        }
        id = alt->id;
      }
      change = [id](PluginSettings& s){ s.default_alternative_id = id; return true; };
    } else if(key == "auto_manage_new_users" || key == "sync_mirrors_after_library_scan") {
      auto flag = parse_bool(value);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      const bool auto_manage = key == "auto_manage_new_users";
      change = [flag, auto_manage](PluginSettings& s){
        (auto_manage ? s.auto_manage_new_users : s.sync_mirrors_after_library_scan) = *flag;
        return true;
      };
    } else if(key == "mirror_sync_interval_hours" || key == "ghost_threshold_minutes") {
      auto number = parse_non_negative(value);
      if(!number) {
        error = "expected a non-negative integer";
        return false;
      }
      const bool interval = key == "mirror_sync_interval_hours";
      change = [number, interval](PluginSettings& s){
        (interval ? s.mirror_sync_interval_hours : s.ghost_threshold_minutes) = *number;
        return true;
      };
    } else if(key == "user_reconciliation_time") {
      if(!parse_time_of_day(value)) {
        error = "expected HH:MM";
        return false;
      }
      change = [value](PluginSettings& s){ s.user_reconciliation_time = value; return true; };
    } else if(key == "excluded_extensions" || key == "excluded_directories" || key == "included_directories") {
      auto list = split_list(value);
      if(key == "excluded_extensions") {
        for(auto& ext : list) {
          if(ext[0] != '.') ext = "." + ext;
        }
      }
      change = [list, key](PluginSettings& s){
        if(key == "excluded_extensions") s.excluded_extensions = list;
        else if(key == "excluded_directories") s.excluded_directories = list;
        else s.included_directories = list;
        return true;
      };
    } else {
      return std::nullopt;
    }
    if(!engine_.store()->update_settings(change)) {
      error = "configuration is unavailable";
      return false;
    }
    return true;
  }

  bool handle_settings(const Args& args) {
    if(args.size() == 0) {
      list_settings();
      return true;
    }
    if(args.size() == 1 && iequals(args[0], "save")) {
      auto runtime = engine_.settings();
      if(!runtime->save()) {
        logger_->print_err("Failed to save settings to {}", runtime->settings_path().string());
        return false;
      }
      logger_->print("Saved settings to {}", runtime->settings_path().string());
      return true;
    }
    if(args.size() < 2) return usage("settings [<key> <value>] | settings save");

    const std::string key = to_lower(args[0]);
    std::string value = args[1];
    for(std::size_t i = 2; i < args.size(); ++i) value += " " + args[i];

    std::string error;
    if(auto applied = apply_store_setting(key, value, error)) {
      if(!*applied) {
        logger_->print_err("Failed to set {}: {}", key, error);
        return false;
      }
      logger_->print("{} = {}", key, value);
      return true;
    }

    auto runtime = engine_.settings();
    auto resolved = runtime->resolve_key(key);
    if(!resolved) {
      logger_->print_err("Unknown setting '{}'", args[0]);
      return false;
    }
    if(!runtime->set_from_string(*resolved, value, error)) {
      logger_->print_err("Failed to set {}: {}", *resolved, error);
      return false;
    }
    logger_->print("{} = {} (takes effect on restart)", *resolved, runtime->value_as_string(*resolved));
    return true;
  }

  bool serve() {
    if(!engine_.settings()->get<bool>("enable_scheduler")) {
      logger_->print("Scheduler disabled by the enable_scheduler setting");
      return true;
    }
    engine_.start_scheduler();
    logger_->print("Scheduler running: mirror sync every {}h, user reconciliation daily at {}",
                   engine_.store()->get_settings().mirror_sync_interval_hours,
                   engine_.store()->get_settings().user_reconciliation_time);
    return true;
  }

  void print_help() {
    logger_->print("Libraries and alternatives:");
    logger_->print("  libraries                                    list host libraries");
    logger_->print("  alternatives                                 list alternatives and their mirrors");
    logger_->print("  alt-add <name> <code> <base> [lang] [country] create an alternative");
    logger_->print("  alt-remove <alt> [--libraries] [--files]     delete an alternative");
    logger_->print("  mirror-add <alt> <source> <path> [name]      mirror a library into an alternative");
    logger_->print("  mirror-remove <alt> <source> [--library] [--files] [--force]");
    logger_->print("  sync [alt]                                   sync one alternative, or run the full sync task");
    logger_->print("  cleanup                                      remove orphaned mirrors");
    logger_->print("  scan                                         run the post-scan sync");
    logger_->print("Users:");
    logger_->print("  users                                        list users and their languages");
    logger_->print("  assign <user> <alt|default>                  set a user's language");
    logger_->print("  clear <user>                                 reset a user to the default libraries");
    logger_->print("  reconcile                                    fix drifted library access");
    logger_->print("  enable-all                                   manage every user");
    logger_->print("  disable <user> [--restore]                   stop managing a user");
    logger_->print("Host catalog:");
    logger_->print("  library-add <name> <type> <path>...          register a source library");
    logger_->print("  user-add <name> [--admin]                    register a user");
    logger_->print("  user-remove <user>                           delete a user");
    logger_->print("Other:");
    logger_->print("  exclusions                                   show file classification rules");
    logger_->print("  settings [key value] | settings save         show or change settings");
    logger_->print("  serve                                        run scheduled tasks until interrupted");
    logger_->print("  help, quit");
  }
};
