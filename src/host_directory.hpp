#pragma once

#include <optional>
#include <string>
#include <vector>

struct LibraryOptions {
  std::string metadata_language;
  std::string metadata_country;
  bool enable_realtime_monitor = true;
  bool enable_internet_providers = true;
  bool save_local_metadata = false;
  bool save_subtitles_with_media = true;
  bool save_lyrics_with_media = false;
  std::vector<std::string> metadata_fetchers;
  std::vector<std::string> image_fetchers;
};

struct VirtualLibrary {
  std::string id;
  std::string name;
  std::string collection_type;
  std::vector<std::string> paths;
  LibraryOptions options;
};

struct HostUser {
  std::string id;
  std::string username;
  bool is_administrator = false;
  bool enable_all_folders = true;
  std::vector<std::string> enabled_folders;
};

// Media server library registry. Implementations throw on failure.
class LibraryDirectory {
public:
  virtual ~LibraryDirectory() = default;

  virtual std::vector<VirtualLibrary> list_libraries() const = 0;
  virtual void add_library(const std::string& name,
                           const std::string& collection_type,
                           const LibraryOptions& options) = 0;
  virtual void add_media_path(const std::string& library_name, const std::string& path) = 0;
  virtual void remove_library(const std::string& library_name) = 0;
  virtual void queue_refresh(const std::string& library_id) = 0;
};

// Media server user accounts.
class UserDirectory {
public:
  virtual ~UserDirectory() = default;

  virtual std::vector<HostUser> list_users() const = 0;
  virtual std::optional<HostUser> get_user(const std::string& user_id) const = 0;
  virtual void update_user(const HostUser& user) = 0;
};
