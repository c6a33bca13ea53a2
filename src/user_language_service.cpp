#include "user_language_service.hpp"

#include "errors.hpp"

UserLanguageService::UserLanguageService(std::shared_ptr<ConfigurationStore> store,
                                         std::shared_ptr<UserDirectory> users,
                                         std::shared_ptr<LibraryAccessService> access,
                                         std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    users_(std::move(users)),
    access_(std::move(access)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("users")) {}

void UserLanguageService::assign_language(const std::string& user_id,
                                          const std::optional<std::string>& alternative_id,
                                          const std::string& set_by,
                                          bool manually_set,
                                          bool plugin_managed) {
  auto user = users_->get_user(user_id);
  if(!user) {
    throw PolyglotError(ErrorKind::NotFound, "User " + user_id + " not found");
  }
  if(!store_->available()) {
    throw PolyglotError(ErrorKind::FatalIo, "Configuration is unavailable, assignment not stored");
  }
  std::string alternative_name = "default libraries";
  if(alternative_id) {
    auto alternative = store_->get_alternative(*alternative_id);
    if(!alternative) {
      throw PolyglotError(ErrorKind::NotFound, "Alternative " + *alternative_id + " not found");
    }
    alternative_name = alternative->name;
  }

  store_->update_or_create_user_language(user_id, [&](UserLanguageConfig& c){
    c.username = user->username;
    c.selected_alternative_id = alternative_id;
    c.manually_set = manually_set;
    c.plugin_managed = plugin_managed;
    c.set_by = set_by;
    c.set_at = Clock::now();
  });
  logger_->info("Assigned {} to {} (by {}, manual: {}, managed: {})",
                alternative_name, user->username, set_by, manually_set, plugin_managed);

  if(plugin_managed) access_->update_user_library_access(user_id);
}

void UserLanguageService::clear_language(const std::string& user_id) {
  bool updated = store_->update_user_language(user_id, [](UserLanguageConfig& c){
    c.selected_alternative_id.reset();
    c.set_by = "admin";
    c.set_at = Clock::now();
  });
  if(!updated) {
    logger_->debug("No language assignment for user {}", user_id);
    return;
  }
  logger_->info("Cleared language assignment of user {}", user_id);
  access_->update_user_library_access(user_id);
}

std::optional<UserLanguageConfig> UserLanguageService::get_user_language(const std::string& user_id) const {
  return store_->get_user_language(user_id);
}

std::optional<Alternative> UserLanguageService::get_user_language_alternative(const std::string& user_id) const {
  auto config = store_->get_user_language(user_id);
  if(!config || !config->selected_alternative_id) return std::nullopt;
  return store_->get_alternative(*config->selected_alternative_id);
}

bool UserLanguageService::is_manually_set(const std::string& user_id) const {
  auto config = store_->get_user_language(user_id);
  return config && config->manually_set;
}

std::vector<UserInfo> UserLanguageService::get_all_users_with_languages() const {
  const auto configs = store_->get_user_languages();
  const auto alternatives = store_->get_alternatives();
  std::vector<UserInfo> out;
  for(const auto& user : users_->list_users()) {
    UserInfo info;
    info.id = user.id;
    info.username = user.username;
    info.is_administrator = user.is_administrator;
    for(const auto& c : configs) {
      if(c.user_id != user.id) continue;
      info.plugin_managed = c.plugin_managed;
      info.assigned_alternative_id = c.selected_alternative_id;
      info.manually_set = c.manually_set;
      info.set_by = c.set_by;
      info.set_at = c.set_at;
      if(c.selected_alternative_id) {
        for(const auto& alt : alternatives) {
          if(alt.id == *c.selected_alternative_id) info.assigned_alternative_name = alt.name;
        }
      }
      break;
    }
    out.push_back(std::move(info));
  }
  return out;
}

void UserLanguageService::remove_user(const std::string& user_id) {
  if(store_->remove_user_language(user_id)) {
    logger_->info("Removed language assignment of deleted user {}", user_id);
  } else {
    logger_->debug("No language assignment for user {}", user_id);
  }
}

void UserLanguageService::on_user_created(const std::string& user_id) {
  const auto settings = store_->get_settings();
  if(!settings.auto_manage_new_users) return;
  try {
    assign_language(user_id, settings.default_alternative_id, "auto", false, true);
  } catch(const std::exception& e) {
    logger_->error("Failed to auto-assign a language to new user {}: {}", user_id, e.what());
  }
}

void UserLanguageService::on_user_updated(const std::string& user_id) {
  auto user = users_->get_user(user_id);
  if(!user) return;
  auto config = store_->get_user_language(user_id);
  if(!config || config->username == user->username) return;
  store_->update_user_language(user_id, [&](UserLanguageConfig& c){ c.username = user->username; });
  logger_->debug("Username of {} is now {}", user_id, user->username);
}
