#include "library_access_service.hpp"

#include "access_projection.hpp"
#include "errors.hpp"

LibraryAccessService::LibraryAccessService(std::shared_ptr<ConfigurationStore> store,
                                           std::shared_ptr<LibraryDirectory> libraries,
                                           std::shared_ptr<UserDirectory> users,
                                           std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    libraries_(std::move(libraries)),
    users_(std::move(users)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("access")) {}

std::vector<std::string> LibraryAccessService::live_library_ids() const {
  std::vector<std::string> ids;
  for(const auto& lib : libraries_->list_libraries()) ids.push_back(lib.id);
  return ids;
}

std::set<std::string> LibraryAccessService::current_access(const HostUser& user,
                                                           const std::vector<std::string>& live) const {
  if(user.enable_all_folders) return std::set<std::string>(live.begin(), live.end());
  std::set<std::string> out;
  for(const auto& id : user.enabled_folders) {
    if(!id.empty()) out.insert(id);
  }
  return out;
}

std::set<std::string> LibraryAccessService::desired_access(const std::string& user_id,
                                                           const HostUser& user,
                                                           const std::vector<std::string>& live) const {
  const auto alternatives = store_->get_alternatives();
  const auto managed = managed_library_ids(alternatives);
  const auto current = current_access(user, live);
  if(managed.empty()) return current;

  auto projected = project_library_access(alternatives, store_->get_user_language(user_id), live);
  std::set<std::string> out(projected.begin(), projected.end());
  for(const auto& id : current) {
    if(!managed.count(id)) out.insert(id);
  }
  return out;
}

std::vector<std::string> LibraryAccessService::get_expected_library_access(const std::string& user_id) const {
  return project_library_access(store_->get_alternatives(), store_->get_user_language(user_id),
                                live_library_ids());
}

void LibraryAccessService::update_user_library_access(const std::string& user_id) {
  auto user = users_->get_user(user_id);
  if(!user) {
    throw PolyglotError(ErrorKind::NotFound, "User " + user_id + " not found");
  }
  auto config = store_->get_user_language(user_id);
  if(!config || !config->plugin_managed) {
    logger_->debug("User {} is not managed, access left alone", user->username);
    return;
  }
  const auto live = live_library_ids();
  auto final_access = desired_access(user_id, *user, live);
  user->enable_all_folders = false;
  user->enabled_folders.assign(final_access.begin(), final_access.end());
  users_->update_user(*user);
  logger_->info("User {} now sees {} librar{}", user->username, final_access.size(),
                final_access.size() == 1 ? "y" : "ies");
}

bool LibraryAccessService::reconcile_user_access(const std::string& user_id) {
  auto user = users_->get_user(user_id);
  if(!user) {
    logger_->debug("Skipping reconciliation of unknown user {}", user_id);
    return false;
  }
  auto config = store_->get_user_language(user_id);
  if(!config || !config->plugin_managed) return false;

  const auto live = live_library_ids();
  auto expected = desired_access(user_id, *user, live);
  auto current = current_access(*user, live);
  if(!user->enable_all_folders && expected == current) return false;

  logger_->info("Reconciling {}: expected {} librar{}, had {} (all folders: {})",
                user->username, expected.size(), expected.size() == 1 ? "y" : "ies",
                current.size(), user->enable_all_folders);
  update_user_library_access(user_id);
  return true;
}

int LibraryAccessService::reconcile_all_users(const CancellationToken* cancel) {
  int changed = 0;
  for(const auto& config : store_->get_user_languages()) {
    throw_if_cancelled(cancel);
    try {
      if(reconcile_user_access(config.user_id)) ++changed;
    } catch(const std::exception& e) {
      logger_->warn("Failed to reconcile user {}: {}", config.username.empty() ? config.user_id : config.username,
                    e.what());
    }
  }
  if(changed > 0) logger_->info("Reconciled library access for {} user(s)", changed);
  return changed;
}

int LibraryAccessService::enable_all_users(const CancellationToken* cancel) {
  int enabled = 0;
  for(const auto& user : users_->list_users()) {
    throw_if_cancelled(cancel);
    try {
      bool newly_managed = false;
      store_->update_or_create_user_language(user.id, [&](UserLanguageConfig& c){
        if(c.plugin_managed) return;
        newly_managed = true;
        c.plugin_managed = true;
        c.username = user.username;
        c.set_by = "bulk-enable";
        c.set_at = Clock::now();
      });
      if(newly_managed) ++enabled;
      update_user_library_access(user.id);
    } catch(const PolyglotError& e) {
      if(e.kind() == ErrorKind::FatalIo) throw;
      logger_->warn("Failed to enable {}: {}", user.username, e.what());
    } catch(const std::exception& e) {
      logger_->warn("Failed to enable {}: {}", user.username, e.what());
    }
  }
  logger_->info("Enabled language management for {} user(s)", enabled);
  return enabled;
}

void LibraryAccessService::disable_user(const std::string& user_id, bool restore_full_access) {
  auto user = users_->get_user(user_id);
  if(!user) {
    throw PolyglotError(ErrorKind::NotFound, "User " + user_id + " not found");
  }
  store_->update_user_language(user_id, [](UserLanguageConfig& c){
    c.plugin_managed = false;
    c.set_by = "admin-disabled";
    c.set_at = Clock::now();
  });
  if(restore_full_access) {
    user->enable_all_folders = true;
    users_->update_user(*user);
  }
  logger_->info("Disabled language management for {}{}", user->username,
                restore_full_access ? " and restored access to all libraries" : "");
}

void LibraryAccessService::add_libraries_to_user_access(const std::string& user_id,
                                                        const std::vector<std::string>& library_ids) {
  if(library_ids.empty()) return;
  auto user = users_->get_user(user_id);
  if(!user) {
    throw PolyglotError(ErrorKind::NotFound, "User " + user_id + " not found");
  }
  auto access = current_access(*user, live_library_ids());
  std::size_t added = 0;
  for(const auto& id : library_ids) {
    if(access.insert(id).second) ++added;
  }
  if(added == 0) return;
  user->enable_all_folders = false;
  user->enabled_folders.assign(access.begin(), access.end());
  users_->update_user(*user);
  logger_->info("Added {} librar{} to {}'s access", added, added == 1 ? "y" : "ies", user->username);
}
