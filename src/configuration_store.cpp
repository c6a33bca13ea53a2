#include "configuration_store.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "errors.hpp"

ConfigurationStore::ConfigurationStore(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("config")) {}

bool ConfigurationStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  doc_ = Document{};
  available_ = true;
  if(path_.empty()) return true;

  std::error_code ec;
  if(!std::filesystem::exists(path_, ec)) {
    logger_->info("No configuration at {}, starting empty", path_.string());
    return true;
  }
  std::ifstream in(path_);
  if(!in) {
    logger_->error("Unable to open configuration {}", path_.string());
    available_ = false;
    return false;
  }
  try {
    nlohmann::json j;
    in >> j;
    if(!j.is_object()) throw std::runtime_error("document root is not an object");
    if(auto it = j.find("alternatives"); it != j.end() && it->is_array()) {
      doc_.alternatives = it->get<std::vector<Alternative>>();
    }
    if(auto it = j.find("user_languages"); it != j.end() && it->is_array()) {
      doc_.user_languages = it->get<std::vector<UserLanguageConfig>>();
    }
    if(auto it = j.find("group_mappings"); it != j.end() && it->is_array()) {
      doc_.group_mappings = it->get<std::vector<GroupMapping>>();
    }
    if(auto it = j.find("settings"); it != j.end() && it->is_object()) {
      doc_.settings = it->get<PluginSettings>();
    }
  } catch(const std::exception& e) {
    logger_->error("Failed to parse configuration {}: {}", path_.string(), e.what());
    doc_ = Document{};
    available_ = false;
    return false;
  }
  logger_->debug("Loaded {} alternative(s), {} user assignment(s) from {}",
                 doc_.alternatives.size(), doc_.user_languages.size(), path_.string());
  return true;
}

void ConfigurationStore::save() {
  std::lock_guard<std::mutex> lock(mutex_);
  save_locked(doc_);
}

bool ConfigurationStore::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

void ConfigurationStore::save_locked(const Document& doc) const {
  if(path_.empty()) return;
  nlohmann::json j{
    {"alternatives", doc.alternatives},
    {"user_languages", doc.user_languages},
    {"group_mappings", doc.group_mappings},
    {"settings", doc.settings}
  };
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw PolyglotError(ErrorKind::FatalIo, "Unable to write " + tmp.string());
    }
    out << j.dump(2);
    out.flush();
    if(!out) {
      throw PolyglotError(ErrorKind::FatalIo, "Short write to " + tmp.string());
    }
  }
  std::filesystem::rename(tmp, path_, ec);
  if(ec) {
    throw PolyglotError(ErrorKind::FatalIo, "Unable to replace " + path_.string() + ": " + ec.message());
  }
}

// The change runs on a copy; the copy replaces the live document only once
// it is on disk.
void ConfigurationStore::commit_locked(const std::function<void(Document&)>& change) {
  Document next = doc_;
  change(next);
  save_locked(next);
  doc_ = std::move(next);
}

Alternative* ConfigurationStore::find_alternative(Document& doc, const std::string& alternative_id) {
  auto it = std::find_if(doc.alternatives.begin(), doc.alternatives.end(),
                         [&](const Alternative& a){ return a.id == alternative_id; });
  return it == doc.alternatives.end() ? nullptr : &*it;
}

Mirror* ConfigurationStore::find_mirror(Document& doc, const std::string& mirror_id) {
  for(auto& alt : doc.alternatives) {
    if(auto* m = alt.find_mirror(mirror_id)) return m;
  }
  return nullptr;
}

UserLanguageConfig* ConfigurationStore::find_user(Document& doc, const std::string& user_id) {
  auto it = std::find_if(doc.user_languages.begin(), doc.user_languages.end(),
                         [&](const UserLanguageConfig& u){ return u.user_id == user_id; });
  return it == doc.user_languages.end() ? nullptr : &*it;
}

// ---- alternatives ----------------------------------------------------------

std::optional<Alternative> ConfigurationStore::get_alternative(const std::string& alternative_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& alt : doc_.alternatives) {
    if(alt.id == alternative_id) return alt;
  }
  return std::nullopt;
}

std::vector<Alternative> ConfigurationStore::get_alternatives() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.alternatives;
}

bool ConfigurationStore::update_alternative(const std::string& alternative_id,
                                            const std::function<void(Alternative&)>& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("update_alternative: configuration unavailable");
    return false;
  }
  if(!find_alternative(doc_, alternative_id)) {
    logger_->debug("update_alternative: alternative {} not found", alternative_id);
    return false;
  }
  commit_locked([&](Document& next){
    auto* alt = find_alternative(next, alternative_id);
    update(*alt);
    alt->id = alternative_id;
    alt->modified_at = Clock::now();
  });
  return true;
}

bool ConfigurationStore::add_alternative(const Alternative& alternative) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("add_alternative: configuration unavailable");
    return false;
  }
  bool duplicate = std::any_of(doc_.alternatives.begin(), doc_.alternatives.end(),
    [&](const Alternative& a){ return iequals(a.name, alternative.name) || a.id == alternative.id; });
  if(duplicate) {
    logger_->warn("add_alternative: an alternative named '{}' already exists", alternative.name);
    return false;
  }
  commit_locked([&](Document& next){ next.alternatives.push_back(alternative); });
  logger_->info("Added alternative '{}' ({})", alternative.name, alternative.language_code);
  return true;
}

void ConfigurationStore::drop_alternative(Document& doc, const std::string& alternative_id) {
  doc.alternatives.erase(
    std::remove_if(doc.alternatives.begin(), doc.alternatives.end(),
                   [&](const Alternative& a){ return a.id == alternative_id; }),
    doc.alternatives.end());
  if(doc.settings.default_alternative_id && *doc.settings.default_alternative_id == alternative_id) {
    doc.settings.default_alternative_id.reset();
  }
  doc.group_mappings.erase(
    std::remove_if(doc.group_mappings.begin(), doc.group_mappings.end(),
                   [&](const GroupMapping& g){ return g.alternative_id == alternative_id; }),
    doc.group_mappings.end());
}

void ConfigurationStore::log_alternative_removal(const Document& before, const std::string& name,
                                                 const std::string& alternative_id) const {
  if(before.settings.default_alternative_id && *before.settings.default_alternative_id == alternative_id) {
    logger_->info("Cleared default alternative (was '{}')", name);
  }
  auto mappings = std::count_if(before.group_mappings.begin(), before.group_mappings.end(),
                                [&](const GroupMapping& g){ return g.alternative_id == alternative_id; });
  if(mappings > 0) {
    logger_->info("Removed {} group mapping(s) that referenced '{}'", mappings, name);
  }
  logger_->info("Removed alternative '{}'", name);
}

bool ConfigurationStore::remove_alternative(const std::string& alternative_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("remove_alternative: configuration unavailable");
    return false;
  }
  auto* alt = find_alternative(doc_, alternative_id);
  if(!alt) return false;
  const std::string name = alt->name;
  const Document before = doc_;
  commit_locked([&](Document& next){ drop_alternative(next, alternative_id); });
  log_alternative_removal(before, name, alternative_id);
  return true;
}

RemoveAlternativeResult ConfigurationStore::try_remove_alternative_atomic(
    const std::string& alternative_id,
    const std::set<std::string>& expected_mirror_ids) {
  RemoveAlternativeResult result;
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("try_remove_alternative_atomic: configuration unavailable");
    result.status = RemoveAlternativeResult::Status::ConfigUnavailable;
    return result;
  }
  auto* alt = find_alternative(doc_, alternative_id);
  if(!alt) {
    result.status = RemoveAlternativeResult::Status::NotFound;
    return result;
  }
  for(const auto& m : alt->mirrors) {
    if(!expected_mirror_ids.count(m.id)) {
      result.unexpected_mirror_ids.push_back(m.id);
    }
  }
  if(!result.unexpected_mirror_ids.empty()) {
    logger_->warn("{} mirror(s) were added to '{}' while it was being deleted, keeping it",
                  result.unexpected_mirror_ids.size(), alt->name);
    result.status = RemoveAlternativeResult::Status::NewMirrorsFound;
    return result;
  }
  const std::string name = alt->name;
  const Document before = doc_;
  try {
    commit_locked([&](Document& next){ drop_alternative(next, alternative_id); });
  } catch(const PolyglotError& e) {
    logger_->error("try_remove_alternative_atomic: {}", e.what());
    result.status = RemoveAlternativeResult::Status::ConfigUnavailable;
    return result;
  }
  log_alternative_removal(before, name, alternative_id);
  result.status = RemoveAlternativeResult::Status::Succeeded;
  return result;
}

// ---- mirrors ---------------------------------------------------------------

std::optional<Mirror> ConfigurationStore::get_mirror(const std::string& mirror_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& alt : doc_.alternatives) {
    if(const auto* m = alt.find_mirror(mirror_id)) return *m;
  }
  return std::nullopt;
}

std::optional<std::pair<Mirror, std::string>>
ConfigurationStore::get_mirror_with_alternative(const std::string& mirror_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& alt : doc_.alternatives) {
    if(const auto* m = alt.find_mirror(mirror_id)) return std::make_pair(*m, alt.id);
  }
  return std::nullopt;
}

bool ConfigurationStore::update_mirror(const std::string& mirror_id,
                                       const std::function<void(Mirror&)>& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("update_mirror: configuration unavailable");
    return false;
  }
  if(!find_mirror(doc_, mirror_id)) {
    logger_->debug("update_mirror: mirror {} not found", mirror_id);
    return false;
  }
  commit_locked([&](Document& next){
    auto* mirror = find_mirror(next, mirror_id);
    update(*mirror);
    mirror->id = mirror_id;
  });
  return true;
}

bool ConfigurationStore::add_mirror(const std::string& alternative_id, const Mirror& mirror) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("add_mirror: configuration unavailable");
    return false;
  }
  auto* alt = find_alternative(doc_, alternative_id);
  if(!alt) {
    logger_->warn("add_mirror: alternative {} not found", alternative_id);
    return false;
  }
  if(alt->find_mirror_for_source(mirror.source_library_id)) {
    logger_->warn("add_mirror: '{}' already has a mirror of library '{}'",
                  alt->name, mirror.source_library_name);
    return false;
  }
  const std::string name = alt->name;
  commit_locked([&](Document& next){
    find_alternative(next, alternative_id)->mirrors.push_back(mirror);
  });
  logger_->info("Added mirror '{}' to '{}'", mirror.target_library_name, name);
  return true;
}

bool ConfigurationStore::remove_mirror(const std::string& mirror_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("remove_mirror: configuration unavailable");
    return false;
  }
  for(const auto& alt : doc_.alternatives) {
    const auto* mirror = alt.find_mirror(mirror_id);
    if(!mirror) continue;
    const auto name = mirror->target_library_name;
    const auto alternative_name = alt.name;
    commit_locked([&](Document& next){
      for(auto& candidate : next.alternatives) {
        candidate.mirrors.erase(
          std::remove_if(candidate.mirrors.begin(), candidate.mirrors.end(),
                         [&](const Mirror& m){ return m.id == mirror_id; }),
          candidate.mirrors.end());
      }
    });
    logger_->info("Removed mirror '{}' from '{}'", name, alternative_name);
    return true;
  }
  logger_->debug("remove_mirror: mirror {} not found", mirror_id);
  return false;
}

// ---- users -----------------------------------------------------------------

std::optional<UserLanguageConfig> ConfigurationStore::get_user_language(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& u : doc_.user_languages) {
    if(u.user_id == user_id) return u;
  }
  return std::nullopt;
}

std::vector<UserLanguageConfig> ConfigurationStore::get_user_languages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.user_languages;
}

bool ConfigurationStore::update_or_create_user_language(
    const std::string& user_id,
    const std::function<void(UserLanguageConfig&)>& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("update_or_create_user_language: configuration unavailable");
    return false;
  }
  const bool created = find_user(doc_, user_id) == nullptr;
  commit_locked([&](Document& next){
    auto* user = find_user(next, user_id);
    if(!user) {
      UserLanguageConfig fresh;
      fresh.user_id = user_id;
      next.user_languages.push_back(std::move(fresh));
      user = &next.user_languages.back();
    }
    update(*user);
    user->user_id = user_id;
  });
  logger_->debug("Saved language assignment for user {} (new: {})", user_id, created);
  return created;
}

bool ConfigurationStore::update_user_language(const std::string& user_id,
                                              const std::function<void(UserLanguageConfig&)>& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("update_user_language: configuration unavailable");
    return false;
  }
  if(!find_user(doc_, user_id)) return false;
  commit_locked([&](Document& next){
    auto* user = find_user(next, user_id);
    update(*user);
    user->user_id = user_id;
  });
  return true;
}

bool ConfigurationStore::remove_user_language(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("remove_user_language: configuration unavailable");
    return false;
  }
  if(!find_user(doc_, user_id)) return false;
  commit_locked([&](Document& next){
    next.user_languages.erase(
      std::remove_if(next.user_languages.begin(), next.user_languages.end(),
                     [&](const UserLanguageConfig& u){ return u.user_id == user_id; }),
      next.user_languages.end());
  });
  logger_->info("Removed language assignment for user {}", user_id);
  return true;
}

// ---- group mappings --------------------------------------------------------

std::vector<GroupMapping> ConfigurationStore::get_group_mappings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.group_mappings;
}

bool ConfigurationStore::add_group_mapping(const GroupMapping& mapping) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) return false;
  bool duplicate = std::any_of(doc_.group_mappings.begin(), doc_.group_mappings.end(),
    [&](const GroupMapping& g){ return iequals(g.group_dn, mapping.group_dn); });
  if(duplicate) {
    logger_->warn("add_group_mapping: group '{}' is already mapped", mapping.group_dn);
    return false;
  }
  commit_locked([&](Document& next){ next.group_mappings.push_back(mapping); });
  return true;
}

bool ConfigurationStore::remove_group_mapping(const std::string& mapping_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) return false;
  auto matches = [&](const GroupMapping& g){ return g.id == mapping_id; };
  if(std::none_of(doc_.group_mappings.begin(), doc_.group_mappings.end(), matches)) return false;
  commit_locked([&](Document& next){
    next.group_mappings.erase(
      std::remove_if(next.group_mappings.begin(), next.group_mappings.end(), matches),
      next.group_mappings.end());
  });
  return true;
}

// ---- settings --------------------------------------------------------------

PluginSettings ConfigurationStore::get_settings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.settings;
}

bool ConfigurationStore::update_settings(const std::function<bool(PluginSettings&)>& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("update_settings: configuration unavailable");
    return false;
  }
  PluginSettings candidate = doc_.settings;
  if(!update(candidate)) {
    logger_->debug("update_settings: change rejected, nothing saved");
    return false;
  }
  commit_locked([&](Document& next){ next.settings = std::move(candidate); });
  return true;
}

bool ConfigurationStore::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!available_) {
    logger_->warn("clear_all: configuration unavailable");
    return false;
  }
  commit_locked([](Document& next){
    next.alternatives.clear();
    next.user_languages.clear();
    next.group_mappings.clear();
    next.settings.default_alternative_id.reset();
  });
  logger_->info("Cleared all alternatives, user assignments and group mappings");
  return true;
}
