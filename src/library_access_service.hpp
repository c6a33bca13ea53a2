#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "configuration_store.hpp"
#include "host_directory.hpp"
#include "log.hpp"

// Applies projected library visibility to host user accounts. Libraries no
// mirror refers to are left exactly as the administrator set them.
class LibraryAccessService {
public:
  LibraryAccessService(std::shared_ptr<ConfigurationStore> store,
                       std::shared_ptr<LibraryDirectory> libraries,
                       std::shared_ptr<UserDirectory> users,
                       std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::string> get_expected_library_access(const std::string& user_id) const;

  void update_user_library_access(const std::string& user_id);
  // Returns true when the user's access had drifted and was rewritten.
  bool reconcile_user_access(const std::string& user_id);
  int reconcile_all_users(const CancellationToken* cancel = nullptr);

  // Marks every host user as managed and applies access. Returns the
  // number of users that were not managed before.
  int enable_all_users(const CancellationToken* cancel = nullptr);
  void disable_user(const std::string& user_id, bool restore_full_access);
  void add_libraries_to_user_access(const std::string& user_id, const std::vector<std::string>& library_ids);

private:
  std::vector<std::string> live_library_ids() const;
  std::set<std::string> current_access(const HostUser& user, const std::vector<std::string>& live) const;
  std::set<std::string> desired_access(const std::string& user_id,
                                       const HostUser& user,
                                       const std::vector<std::string>& live) const;

  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<LibraryDirectory> libraries_;
  std::shared_ptr<UserDirectory> users_;
  std::shared_ptr<Logger> logger_;
};
