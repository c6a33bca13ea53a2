#include "host_catalog.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "utils.hpp"

namespace {

nlohmann::json options_to_json(const LibraryOptions& o) {
  return {
    {"metadata_language", o.metadata_language},
    {"metadata_country", o.metadata_country},
    {"enable_realtime_monitor", o.enable_realtime_monitor},
    {"enable_internet_providers", o.enable_internet_providers},
    {"save_local_metadata", o.save_local_metadata},
    {"save_subtitles_with_media", o.save_subtitles_with_media},
    {"save_lyrics_with_media", o.save_lyrics_with_media},
    {"metadata_fetchers", o.metadata_fetchers},
    {"image_fetchers", o.image_fetchers}
  };
}

LibraryOptions options_from_json(const nlohmann::json& j) {
  LibraryOptions o;
  if(!j.is_object()) return o;
  o.metadata_language = j.value("metadata_language", "");
  o.metadata_country = j.value("metadata_country", "");
  o.enable_realtime_monitor = j.value("enable_realtime_monitor", true);
  o.enable_internet_providers = j.value("enable_internet_providers", true);
  o.save_local_metadata = j.value("save_local_metadata", false);
  o.save_subtitles_with_media = j.value("save_subtitles_with_media", true);
  o.save_lyrics_with_media = j.value("save_lyrics_with_media", false);
  o.metadata_fetchers = j.value("metadata_fetchers", std::vector<std::string>{});
  o.image_fetchers = j.value("image_fetchers", std::vector<std::string>{});
  return o;
}

} // namespace

HostCatalog::HostCatalog(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("catalog")) {}

bool HostCatalog::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  libraries_.clear();
  users_.clear();
  if(path_.empty()) return true;
  std::error_code ec;
  if(!std::filesystem::exists(path_, ec)) {
    logger_->info("No host catalog at {}, starting empty", path_.string());
    return true;
  }
  std::ifstream in(path_);
  if(!in) {
    logger_->error("Unable to open host catalog {}", path_.string());
    return false;
  }
  try {
    nlohmann::json j;
    in >> j;
    for(const auto& entry : j.value("libraries", nlohmann::json::array())) {
      VirtualLibrary lib;
      lib.id = entry.value("id", "");
      lib.name = entry.value("name", "");
      lib.collection_type = entry.value("collection_type", "");
      lib.paths = entry.value("paths", std::vector<std::string>{});
      lib.options = options_from_json(entry.value("options", nlohmann::json::object()));
      if(lib.id.empty()) lib.id = generate_id();
      libraries_.push_back(std::move(lib));
    }
    for(const auto& entry : j.value("users", nlohmann::json::array())) {
      HostUser user;
      user.id = entry.value("id", "");
      user.username = entry.value("username", "");
      user.is_administrator = entry.value("is_administrator", false);
      user.enable_all_folders = entry.value("enable_all_folders", true);
      user.enabled_folders = entry.value("enabled_folders", std::vector<std::string>{});
      if(user.id.empty()) user.id = generate_id();
      users_.push_back(std::move(user));
    }
  } catch(const std::exception& e) {
    logger_->error("Failed to parse host catalog {}: {}", path_.string(), e.what());
    libraries_.clear();
    users_.clear();
    return false;
  }
  return true;
}

void HostCatalog::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  save_locked();
}

void HostCatalog::save_locked() const {
  if(path_.empty()) return;
  nlohmann::json libraries = nlohmann::json::array();
  for(const auto& lib : libraries_) {
    libraries.push_back({
      {"id", lib.id},
      {"name", lib.name},
      {"collection_type", lib.collection_type},
      {"paths", lib.paths},
      {"options", options_to_json(lib.options)}
    });
  }
  nlohmann::json users = nlohmann::json::array();
  for(const auto& user : users_) {
    users.push_back({
      {"id", user.id},
      {"username", user.username},
      {"is_administrator", user.is_administrator},
      {"enable_all_folders", user.enable_all_folders},
      {"enabled_folders", user.enabled_folders}
    });
  }
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::trunc);
  if(!out) {
    throw PolyglotError(ErrorKind::FatalIo, "Unable to write host catalog " + path_.string());
  }
  out << nlohmann::json{{"libraries", libraries}, {"users", users}}.dump(2);
}

std::vector<VirtualLibrary> HostCatalog::list_libraries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return libraries_;
}

void HostCatalog::add_library(const std::string& name,
                              const std::string& collection_type,
                              const LibraryOptions& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto exists = std::any_of(libraries_.begin(), libraries_.end(),
                            [&](const VirtualLibrary& l){ return iequals(l.name, name); });
  if(exists) {
    throw PolyglotError(ErrorKind::Conflict, "A library named '" + name + "' already exists");
  }
  VirtualLibrary lib;
  lib.id = generate_id();
  lib.name = name;
  lib.collection_type = collection_type;
  lib.options = options;
  libraries_.push_back(lib);
  save_locked();
  logger_->info("Registered library '{}' ({})", name, lib.id);
}

void HostCatalog::add_media_path(const std::string& library_name, const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(libraries_.begin(), libraries_.end(),
                         [&](const VirtualLibrary& l){ return l.name == library_name; });
  if(it == libraries_.end()) {
    throw PolyglotError(ErrorKind::NotFound, "Library '" + library_name + "' not found");
  }
  if(std::find(it->paths.begin(), it->paths.end(), path) == it->paths.end()) {
    it->paths.push_back(path);
  }
  save_locked();
}

void HostCatalog::remove_library(const std::string& library_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(libraries_.begin(), libraries_.end(),
                         [&](const VirtualLibrary& l){ return l.name == library_name; });
  if(it == libraries_.end()) {
    throw PolyglotError(ErrorKind::NotFound, "Library '" + library_name + "' not found");
  }
  const auto removed_id = it->id;
  libraries_.erase(it);
  for(auto& user : users_) {
    auto& folders = user.enabled_folders;
    folders.erase(std::remove(folders.begin(), folders.end(), removed_id), folders.end());
  }
  save_locked();
  logger_->info("Removed library '{}'", library_name);
}

void HostCatalog::queue_refresh(const std::string& library_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  refresh_queue_.push_back(library_id);
  logger_->debug("Queued metadata refresh for {}", library_id);
}

std::vector<std::string> HostCatalog::pending_refreshes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refresh_queue_;
}

std::vector<HostUser> HostCatalog::list_users() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return users_;
}

std::optional<HostUser> HostCatalog::get_user(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& user : users_) {
    if(user.id == user_id) return user;
  }
  return std::nullopt;
}

void HostCatalog::update_user(const HostUser& user) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(users_.begin(), users_.end(),
                         [&](const HostUser& u){ return u.id == user.id; });
  if(it == users_.end()) {
    throw PolyglotError(ErrorKind::NotFound, "User " + user.id + " not found");
  }
  *it = user;
  save_locked();
}

std::string HostCatalog::add_source_library(const std::string& name,
                                            const std::string& collection_type,
                                            const std::vector<std::string>& paths,
                                            const LibraryOptions& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto exists = std::any_of(libraries_.begin(), libraries_.end(),
                            [&](const VirtualLibrary& l){ return iequals(l.name, name); });
  if(exists) {
    throw PolyglotError(ErrorKind::Conflict, "A library named '" + name + "' already exists");
  }
  VirtualLibrary lib;
  lib.id = generate_id();
  lib.name = name;
  lib.collection_type = collection_type;
  lib.paths = paths;
  lib.options = options;
  libraries_.push_back(lib);
  save_locked();
  return lib.id;
}

std::string HostCatalog::add_user(const std::string& username, bool is_administrator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto exists = std::any_of(users_.begin(), users_.end(),
                            [&](const HostUser& u){ return iequals(u.username, username); });
  if(exists) {
    throw PolyglotError(ErrorKind::Conflict, "A user named '" + username + "' already exists");
  }
  HostUser user;
  user.id = generate_id();
  user.username = username;
  user.is_administrator = is_administrator;
  users_.push_back(user);
  save_locked();
  return user.id;
}

bool HostCatalog::remove_user(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto before = users_.size();
  users_.erase(std::remove_if(users_.begin(), users_.end(),
                              [&](const HostUser& u){ return u.id == user_id; }),
               users_.end());
  if(users_.size() == before) return false;
  save_locked();
  return true;
}
