#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "host_directory.hpp"
#include "log.hpp"

// Libraries and users kept in a JSON file, so the mirror tooling can run
// without a media server. Also used as the host in tests.
class HostCatalog : public LibraryDirectory, public UserDirectory {
public:
  explicit HostCatalog(std::filesystem::path path = {},
                       std::shared_ptr<Logger> logger = nullptr);

  bool load();
  void save() const;

  std::vector<VirtualLibrary> list_libraries() const override;
  void add_library(const std::string& name,
                   const std::string& collection_type,
                   const LibraryOptions& options) override;
  void add_media_path(const std::string& library_name, const std::string& path) override;
  void remove_library(const std::string& library_name) override;
  void queue_refresh(const std::string& library_id) override;

  std::vector<HostUser> list_users() const override;
  std::optional<HostUser> get_user(const std::string& user_id) const override;
  void update_user(const HostUser& user) override;

  // Returns the new library id.
  std::string add_source_library(const std::string& name,
                                 const std::string& collection_type,
                                 const std::vector<std::string>& paths,
                                 const LibraryOptions& options = {});
  std::string add_user(const std::string& username, bool is_administrator = false);
  bool remove_user(const std::string& user_id);

  std::vector<std::string> pending_refreshes() const;

private:
  void save_locked() const;

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<VirtualLibrary> libraries_;
  std::vector<HostUser> users_;
  std::vector<std::string> refresh_queue_;
};
