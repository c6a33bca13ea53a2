#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "utils.hpp"

enum class SyncStatus { Pending, Syncing, Synced, Error };

const char* sync_status_name(SyncStatus status);
std::optional<SyncStatus> sync_status_from_name(const std::string& name);

struct Mirror {
  std::string id;
  std::string source_library_id;
  std::string source_library_name;
  std::optional<std::string> target_library_id; // unset until the host library exists
  std::string target_library_name;
  std::string target_path;
  std::string collection_type;
  SyncStatus status = SyncStatus::Pending;
  std::optional<Timestamp> last_synced_at;
  int last_file_count = 0;
  std::optional<std::string> last_error;
};

struct Alternative {
  std::string id;
  std::string name;
  std::string language_code;
  std::string metadata_language;
  std::string metadata_country;
  std::string destination_base_path;
  Timestamp created_at{};
  std::optional<Timestamp> modified_at;
  std::vector<Mirror> mirrors;

  const Mirror* find_mirror(const std::string& mirror_id) const;
  Mirror* find_mirror(const std::string& mirror_id);
  const Mirror* find_mirror_for_source(const std::string& source_library_id) const;
};

struct UserLanguageConfig {
  std::string user_id;
  std::string username;
  std::optional<std::string> selected_alternative_id; // unset = default/source libraries
  bool manually_set = false;
  bool plugin_managed = false;
  std::string set_by;
  Timestamp set_at{};
};

struct GroupMapping {
  std::string id;
  std::string group_dn;
  std::string group_name;
  std::string alternative_id;
  int priority = 0;
};

struct PluginSettings {
  std::optional<std::string> default_alternative_id;
  bool auto_manage_new_users = false;
  bool sync_mirrors_after_library_scan = true;
  int mirror_sync_interval_hours = 6;
  std::string user_reconciliation_time = "03:00";
  std::vector<std::string> excluded_extensions{".nfo", ".jpg", ".jpeg", ".png", ".gif", ".webp", ".tbn", ".bmp"};
  std::vector<std::string> excluded_directories{"extrafanart", "extrathumbs", ".trickplay", "metadata", ".actors"};
  std::vector<std::string> included_directories;
  int ghost_threshold_minutes = 30;
};

// Host library annotated with mirror ownership, as listed by MirrorService.
struct LibraryInfo {
  std::string id;
  std::string name;
  std::string collection_type;
  std::vector<std::string> paths;
  std::string metadata_language;
  std::string metadata_country;
  bool is_mirror = false;
  std::optional<std::string> alternative_id;
};

// Host user joined with its stored language assignment.
struct UserInfo {
  std::string id;
  std::string username;
  bool is_administrator = false;
  bool plugin_managed = false;
  std::optional<std::string> assigned_alternative_id;
  std::string assigned_alternative_name;
  bool manually_set = false;
  std::string set_by;
  std::optional<Timestamp> set_at;
};

// "pt-BR" -> {"pt", "BR"}, "de" -> {"de", ""}.
std::pair<std::string, std::string> derive_metadata_locale(const std::string& language_code);

void to_json(nlohmann::json& j, const Mirror& m);
void from_json(const nlohmann::json& j, Mirror& m);
void to_json(nlohmann::json& j, const Alternative& a);
void from_json(const nlohmann::json& j, Alternative& a);
void to_json(nlohmann::json& j, const UserLanguageConfig& u);
void from_json(const nlohmann::json& j, UserLanguageConfig& u);
void to_json(nlohmann::json& j, const GroupMapping& g);
void from_json(const nlohmann::json& j, GroupMapping& g);
void to_json(nlohmann::json& j, const PluginSettings& s);
void from_json(const nlohmann::json& j, PluginSettings& s);
