#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "configuration_store.hpp"
#include "host_directory.hpp"
#include "library_access_service.hpp"
#include "log.hpp"
#include "models.hpp"

// Which alternative each user watches, and the host user events that keep
// those records current.
class UserLanguageService {
public:
  UserLanguageService(std::shared_ptr<ConfigurationStore> store,
                      std::shared_ptr<UserDirectory> users,
                      std::shared_ptr<LibraryAccessService> access,
                      std::shared_ptr<Logger> logger = nullptr);

  // An unset alternative means the default (source) libraries.
  void assign_language(const std::string& user_id,
                       const std::optional<std::string>& alternative_id,
                       const std::string& set_by,
                       bool manually_set = false,
                       bool plugin_managed = true);
  void clear_language(const std::string& user_id);

  std::optional<UserLanguageConfig> get_user_language(const std::string& user_id) const;
  std::optional<Alternative> get_user_language_alternative(const std::string& user_id) const;
  bool is_manually_set(const std::string& user_id) const;
  std::vector<UserInfo> get_all_users_with_languages() const;
  void remove_user(const std::string& user_id);

  void on_user_created(const std::string& user_id);
  void on_user_updated(const std::string& user_id);

private:
  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<UserDirectory> users_;
  std::shared_ptr<LibraryAccessService> access_;
  std::shared_ptr<Logger> logger_;
};
