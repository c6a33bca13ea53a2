#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cancellation.hpp"
#include "configuration_store.hpp"
#include "errors.hpp"
#include "file_classifier.hpp"
#include "host_directory.hpp"
#include "log.hpp"
#include "models.hpp"

// One mutex per mirror id. Create, sync and delete of the same mirror
// serialize on it; different mirrors run in parallel.
class MirrorLockRegistry {
public:
  std::shared_ptr<std::mutex> handle(const std::string& mirror_id);
  bool is_locked(const std::string& mirror_id) const;
  void evict(const std::string& mirror_id);
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

struct SyncReport {
  int added = 0;
  int updated = 0;
  int removed = 0;
  int failed = 0;
  int file_count = 0;
};

struct DeleteMirrorResult {
  bool removed_from_config = false;
  std::optional<std::string> library_error;
  std::optional<std::string> files_error;

  bool has_warnings() const { return library_error || files_error; }
};

struct SyncAllResult {
  enum class Status { Completed, CompletedWithErrors, Cancelled, AlternativeNotFound };

  Status status = Status::Completed;
  int synced = 0;
  int failed = 0;
  int total = 0;
};

const char* sync_all_status_name(SyncAllResult::Status status);

struct DeleteAlternativeResult {
  bool removed = false;
  std::vector<std::string> failures;
};

class MirrorService {
public:
  MirrorService(std::shared_ptr<ConfigurationStore> store,
                std::shared_ptr<LibraryDirectory> libraries,
                std::shared_ptr<Logger> logger = nullptr);

  Alternative create_alternative(const std::string& name,
                                 const std::string& language_code,
                                 const std::string& destination_base_path,
                                 const std::string& metadata_language = {},
                                 const std::string& metadata_country = {});

  // Validates, records a Pending mirror and builds it. The record is
  // dropped again when the build fails.
  Mirror add_mirror(const std::string& alternative_id,
                    const std::string& source_library_id,
                    const std::string& target_path,
                    const std::string& target_library_name = {});

  void create_mirror(const std::string& alternative_id,
                     const std::string& mirror_id,
                     const CancellationToken* cancel = nullptr);

  SyncReport sync_mirror(const std::string& mirror_id,
                         ProgressCallback progress = nullptr,
                         const CancellationToken* cancel = nullptr);

  DeleteMirrorResult delete_mirror(const std::string& mirror_id,
                                   bool delete_library = true,
                                   bool delete_files = true,
                                   bool force = false);

  SyncAllResult sync_all_mirrors(const std::string& alternative_id,
                                 ProgressCallback progress = nullptr,
                                 const CancellationToken* cancel = nullptr);

  DeleteAlternativeResult delete_alternative(const std::string& alternative_id,
                                             bool delete_libraries,
                                             bool delete_files);

  std::vector<LibraryInfo> get_libraries() const;
  ValidationResult validate_mirror_configuration(const std::string& source_library_id,
                                                 const std::string& target_path) const;

  bool is_mirror_busy(const std::string& mirror_id) const { return locks_.is_locked(mirror_id); }
  const MirrorLockRegistry& locks() const { return locks_; }

private:
  struct FileSignature {
    std::uintmax_t size = 0;
    std::filesystem::file_time_type::rep modified = 0;
  };
  struct SourceFile {
    std::filesystem::path root;
    FileSignature signature;
  };

  std::optional<VirtualLibrary> find_library(const std::string& library_id) const;
  std::vector<std::string> require_source_paths(const Mirror& mirror) const;
  std::map<std::string, FileSignature> scan_tree(const std::filesystem::path& root,
                                                 const FileClassifier& classifier) const;
  std::string register_target_library(const Alternative& alternative,
                                      const Mirror& mirror,
                                      const VirtualLibrary& source);
  void report_progress(const ProgressCallback& progress, double percent) const;

  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<LibraryDirectory> libraries_;
  std::shared_ptr<Logger> logger_;
  MirrorLockRegistry locks_;
};
