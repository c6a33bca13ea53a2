#include "models.hpp"

#include <algorithm>
#include <cctype>

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
  if(value) return *value;
  return nullptr;
}

std::optional<std::string> read_optional_string(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::nullopt;
  auto value = it->get<std::string>();
  if(value.empty()) return std::nullopt;
  return value;
}

nlohmann::json optional_timestamp(const std::optional<Timestamp>& value) {
  if(value) return format_timestamp(*value);
  return nullptr;
}

std::optional<Timestamp> read_optional_timestamp(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::nullopt;
  return parse_timestamp(it->get<std::string>());
}

Timestamp read_timestamp(const nlohmann::json& j, const char* key) {
  auto parsed = read_optional_timestamp(j, key);
  return parsed ? *parsed : Timestamp{};
}

template<typename T>
T value_or(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return fallback;
  try {
    return it->get<T>();
  } catch(const nlohmann::json::exception&) {
    return fallback;
  }
}

} // namespace

const char* sync_status_name(SyncStatus status) {
  switch(status) {
    case SyncStatus::Pending: return "Pending";
    case SyncStatus::Syncing: return "Syncing";
    case SyncStatus::Synced: return "Synced";
    case SyncStatus::Error: return "Error";
  }
  return "Pending";
}

std::optional<SyncStatus> sync_status_from_name(const std::string& name) {
  if(iequals(name, "Pending")) return SyncStatus::Pending;
  if(iequals(name, "Syncing")) return SyncStatus::Syncing;
  if(iequals(name, "Synced")) return SyncStatus::Synced;
  if(iequals(name, "Error")) return SyncStatus::Error;
  return std::nullopt;
}

const Mirror* Alternative::find_mirror(const std::string& mirror_id) const {
  auto it = std::find_if(mirrors.begin(), mirrors.end(),
                         [&](const Mirror& m){ return m.id == mirror_id; });
  return it == mirrors.end() ? nullptr : &*it;
}

Mirror* Alternative::find_mirror(const std::string& mirror_id) {
  auto it = std::find_if(mirrors.begin(), mirrors.end(),
                         [&](const Mirror& m){ return m.id == mirror_id; });
  return it == mirrors.end() ? nullptr : &*it;
}

const Mirror* Alternative::find_mirror_for_source(const std::string& source_library_id) const {
  auto it = std::find_if(mirrors.begin(), mirrors.end(),
                         [&](const Mirror& m){ return m.source_library_id == source_library_id; });
  return it == mirrors.end() ? nullptr : &*it;
}

std::pair<std::string, std::string> derive_metadata_locale(const std::string& language_code) {
  auto code = trim_copy(language_code);
  auto sep = code.find_first_of("-_");
  if(sep == std::string::npos) {
    return {to_lower(code), std::string()};
  }
  auto country = code.substr(sep + 1);
  std::transform(country.begin(), country.end(), country.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return {to_lower(code.substr(0, sep)), country};
}

void to_json(nlohmann::json& j, const Mirror& m) {
  j = nlohmann::json{
    {"id", m.id},
    {"source_library_id", m.source_library_id},
    {"source_library_name", m.source_library_name},
    {"target_library_id", optional_string(m.target_library_id)},
    {"target_library_name", m.target_library_name},
    {"target_path", m.target_path},
    {"collection_type", m.collection_type},
    {"status", sync_status_name(m.status)},
    {"last_synced_at", optional_timestamp(m.last_synced_at)},
    {"last_file_count", m.last_file_count},
    {"last_error", optional_string(m.last_error)}
  };
}

void from_json(const nlohmann::json& j, Mirror& m) {
  m.id = value_or<std::string>(j, "id", "");
  m.source_library_id = value_or<std::string>(j, "source_library_id", "");
  m.source_library_name = value_or<std::string>(j, "source_library_name", "");
  m.target_library_id = read_optional_string(j, "target_library_id");
  m.target_library_name = value_or<std::string>(j, "target_library_name", "");
  m.target_path = value_or<std::string>(j, "target_path", "");
  m.collection_type = value_or<std::string>(j, "collection_type", "");
  m.status = sync_status_from_name(value_or<std::string>(j, "status", "Pending")).value_or(SyncStatus::Pending);
  m.last_synced_at = read_optional_timestamp(j, "last_synced_at");
  m.last_file_count = value_or<int>(j, "last_file_count", 0);
  m.last_error = read_optional_string(j, "last_error");
}

void to_json(nlohmann::json& j, const Alternative& a) {
  j = nlohmann::json{
    {"id", a.id},
    {"name", a.name},
    {"language_code", a.language_code},
    {"metadata_language", a.metadata_language},
    {"metadata_country", a.metadata_country},
    {"destination_base_path", a.destination_base_path},
    {"created_at", format_timestamp(a.created_at)},
    {"modified_at", optional_timestamp(a.modified_at)},
    {"mirrors", a.mirrors}
  };
}

void from_json(const nlohmann::json& j, Alternative& a) {
  a.id = value_or<std::string>(j, "id", "");
  a.name = value_or<std::string>(j, "name", "");
  a.language_code = value_or<std::string>(j, "language_code", "");
  a.metadata_language = value_or<std::string>(j, "metadata_language", "");
  a.metadata_country = value_or<std::string>(j, "metadata_country", "");
  a.destination_base_path = value_or<std::string>(j, "destination_base_path", "");
  a.created_at = read_timestamp(j, "created_at");
  a.modified_at = read_optional_timestamp(j, "modified_at");
  a.mirrors.clear();
  auto it = j.find("mirrors");
  if(it != j.end() && it->is_array()) {
    a.mirrors = it->get<std::vector<Mirror>>();
  }
}

void to_json(nlohmann::json& j, const UserLanguageConfig& u) {
  j = nlohmann::json{
    {"user_id", u.user_id},
    {"username", u.username},
    {"selected_alternative_id", optional_string(u.selected_alternative_id)},
    {"manually_set", u.manually_set},
    {"plugin_managed", u.plugin_managed},
    {"set_by", u.set_by},
    {"set_at", format_timestamp(u.set_at)}
  };
}

void from_json(const nlohmann::json& j, UserLanguageConfig& u) {
  u.user_id = value_or<std::string>(j, "user_id", "");
  u.username = value_or<std::string>(j, "username", "");
  u.selected_alternative_id = read_optional_string(j, "selected_alternative_id");
  u.manually_set = value_or<bool>(j, "manually_set", false);
  u.plugin_managed = value_or<bool>(j, "plugin_managed", false);
  u.set_by = value_or<std::string>(j, "set_by", "");
  u.set_at = read_timestamp(j, "set_at");
}

void to_json(nlohmann::json& j, const GroupMapping& g) {
  j = nlohmann::json{
    {"id", g.id},
    {"group_dn", g.group_dn},
    {"group_name", g.group_name},
    {"alternative_id", g.alternative_id},
    {"priority", g.priority}
  };
}

void from_json(const nlohmann::json& j, GroupMapping& g) {
  g.id = value_or<std::string>(j, "id", "");
  g.group_dn = value_or<std::string>(j, "group_dn", "");
  g.group_name = value_or<std::string>(j, "group_name", "");
  g.alternative_id = value_or<std::string>(j, "alternative_id", "");
  g.priority = value_or<int>(j, "priority", 0);
}

void to_json(nlohmann::json& j, const PluginSettings& s) {
  j = nlohmann::json{
    {"default_alternative_id", optional_string(s.default_alternative_id)},
    {"auto_manage_new_users", s.auto_manage_new_users},
    {"sync_mirrors_after_library_scan", s.sync_mirrors_after_library_scan},
    {"mirror_sync_interval_hours", s.mirror_sync_interval_hours},
    {"user_reconciliation_time", s.user_reconciliation_time},
    {"excluded_extensions", s.excluded_extensions},
    {"excluded_directories", s.excluded_directories},
    {"included_directories", s.included_directories},
    {"ghost_threshold_minutes", s.ghost_threshold_minutes}
  };
}

void from_json(const nlohmann::json& j, PluginSettings& s) {
  PluginSettings defaults;
  s.default_alternative_id = read_optional_string(j, "default_alternative_id");
  s.auto_manage_new_users = value_or<bool>(j, "auto_manage_new_users", defaults.auto_manage_new_users);
  s.sync_mirrors_after_library_scan = value_or<bool>(j, "sync_mirrors_after_library_scan",
                                                     defaults.sync_mirrors_after_library_scan);
  s.mirror_sync_interval_hours = value_or<int>(j, "mirror_sync_interval_hours", defaults.mirror_sync_interval_hours);
  s.user_reconciliation_time = value_or<std::string>(j, "user_reconciliation_time", defaults.user_reconciliation_time);
  s.excluded_extensions = value_or<std::vector<std::string>>(j, "excluded_extensions", defaults.excluded_extensions);
  s.excluded_directories = value_or<std::vector<std::string>>(j, "excluded_directories", defaults.excluded_directories);
  s.included_directories = value_or<std::vector<std::string>>(j, "included_directories", defaults.included_directories);
  s.ghost_threshold_minutes = value_or<int>(j, "ghost_threshold_minutes", defaults.ghost_threshold_minutes);
}
