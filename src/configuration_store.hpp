#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"
#include "models.hpp"

struct RemoveAlternativeResult {
  enum class Status { Succeeded, NotFound, ConfigUnavailable, NewMirrorsFound };

  Status status = Status::Succeeded;
  std::vector<std::string> unexpected_mirror_ids;

  bool succeeded() const { return status == Status::Succeeded; }
};

// Single source of truth for alternatives, mirrors, user assignments, group
// mappings and global settings. Every call runs under one mutex covering
// lookup, precondition check, mutation and save. Readers get copies.
class ConfigurationStore {
public:
  // An empty path keeps the document in memory only.
  explicit ConfigurationStore(std::filesystem::path path = {},
                              std::shared_ptr<Logger> logger = nullptr);

  // Missing file means an empty configuration. A document that cannot be
  // parsed marks the store unavailable and every mutation is refused.
  bool load();
  void save();
  bool available() const;
  const std::filesystem::path& path() const { return path_; }

  // Alternatives
  std::optional<Alternative> get_alternative(const std::string& alternative_id) const;
  std::vector<Alternative> get_alternatives() const;
  bool update_alternative(const std::string& alternative_id, const std::function<void(Alternative&)>& update);
  bool add_alternative(const Alternative& alternative);
  bool remove_alternative(const std::string& alternative_id);
  RemoveAlternativeResult try_remove_alternative_atomic(const std::string& alternative_id,
                                                        const std::set<std::string>& expected_mirror_ids);

  // Mirrors
  std::optional<Mirror> get_mirror(const std::string& mirror_id) const;
  std::optional<std::pair<Mirror, std::string>> get_mirror_with_alternative(const std::string& mirror_id) const;
  bool update_mirror(const std::string& mirror_id, const std::function<void(Mirror&)>& update);
  bool add_mirror(const std::string& alternative_id, const Mirror& mirror);
  bool remove_mirror(const std::string& mirror_id);

  // User language assignments
  std::optional<UserLanguageConfig> get_user_language(const std::string& user_id) const;
  std::vector<UserLanguageConfig> get_user_languages() const;
  // Returns true when a new record was created.
  bool update_or_create_user_language(const std::string& user_id,
                                      const std::function<void(UserLanguageConfig&)>& update);
  bool update_user_language(const std::string& user_id,
                            const std::function<void(UserLanguageConfig&)>& update);
  bool remove_user_language(const std::string& user_id);

  // Group mappings
  std::vector<GroupMapping> get_group_mappings() const;
  bool add_group_mapping(const GroupMapping& mapping);
  bool remove_group_mapping(const std::string& mapping_id);

  // Settings; the transform returns whether the change should be kept.
  PluginSettings get_settings() const;
  bool update_settings(const std::function<bool(PluginSettings&)>& update);

  // Uninstall: drops alternatives, user assignments and group mappings.
  bool clear_all();

private:
  struct Document {
    std::vector<Alternative> alternatives;
    std::vector<UserLanguageConfig> user_languages;
    std::vector<GroupMapping> group_mappings;
    PluginSettings settings;
  };

  static Alternative* find_alternative(Document& doc, const std::string& alternative_id);
  static Mirror* find_mirror(Document& doc, const std::string& mirror_id);
  static UserLanguageConfig* find_user(Document& doc, const std::string& user_id);
  static void drop_alternative(Document& doc, const std::string& alternative_id);
  void log_alternative_removal(const Document& before, const std::string& name,
                               const std::string& alternative_id) const;
  void commit_locked(const std::function<void(Document&)>& change);
  void save_locked(const Document& doc) const;

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  Document doc_;
  bool available_ = true;
};
