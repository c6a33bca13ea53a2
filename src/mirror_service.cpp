#include "mirror_service.hpp"

#include <algorithm>
#include <set>

#include "filesystem_helper.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// ---- lock registry ---------------------------------------------------------

std::shared_ptr<std::mutex> MirrorLockRegistry::handle(const std::string& mirror_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = locks_[mirror_id];
  if(!entry) entry = std::make_shared<std::mutex>();
  return entry;
}

bool MirrorLockRegistry::is_locked(const std::string& mirror_id) const {
  std::shared_ptr<std::mutex> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(mirror_id);
    if(it == locks_.end()) return false;
    entry = it->second;
  }
  if(entry->try_lock()) {
    entry->unlock();
    return false;
  }
  return true;
}

void MirrorLockRegistry::evict(const std::string& mirror_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  locks_.erase(mirror_id);
}

std::size_t MirrorLockRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.size();
}

const char* sync_all_status_name(SyncAllResult::Status status) {
  switch(status) {
    case SyncAllResult::Status::Completed: return "completed";
    case SyncAllResult::Status::CompletedWithErrors: return "completed with errors";
    case SyncAllResult::Status::Cancelled: return "cancelled";
    case SyncAllResult::Status::AlternativeNotFound: return "alternative not found";
  }
  return "unknown";
}

// ---- service ---------------------------------------------------------------

MirrorService::MirrorService(std::shared_ptr<ConfigurationStore> store,
                             std::shared_ptr<LibraryDirectory> libraries,
                             std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    libraries_(std::move(libraries)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("mirror")) {
  if(!store_ || !libraries_) {
    throw std::invalid_argument("MirrorService requires a configuration store and a library directory");
  }
}

std::optional<VirtualLibrary> MirrorService::find_library(const std::string& library_id) const {
  for(auto& lib : libraries_->list_libraries()) {
    if(lib.id == library_id) return lib;
  }
  return std::nullopt;
}

std::vector<std::string> MirrorService::require_source_paths(const Mirror& mirror) const {
  auto source = find_library(mirror.source_library_id);
  if(!source) {
    throw PolyglotError(ErrorKind::NotFound,
                        "Source library " + mirror.source_library_name + " (" + mirror.source_library_id + ") not found");
  }
  if(source->paths.empty()) {
    throw PolyglotError(ErrorKind::Validation, "Source library " + source->name + " has no paths");
  }
  return source->paths;
}

std::map<std::string, MirrorService::FileSignature>
MirrorService::scan_tree(const fs::path& root, const FileClassifier& classifier) const {
  std::map<std::string, FileSignature> out;
  std::error_code ec;
  if(!fs::is_directory(root, ec)) return out;

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    logger_->warn("Cannot enumerate {}: {}", root.string(), ec.message());
    return out;
  }
  for(; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(ec) {
      logger_->warn("Enumeration stopped under {}: {}", root.string(), ec.message());
      break;
    }
    const auto& entry = *it;
    auto relative = entry.path().lexically_relative(root);
    std::error_code entry_ec;
    if(entry.is_directory(entry_ec)) {
      if(classifier.should_exclude_directory(relative)) it.disable_recursion_pending();
      continue;
    }
    if(!entry.is_regular_file(entry_ec)) continue;
    if(!classifier.should_hardlink(relative)) continue;
    FileSignature sig;
    sig.size = entry.file_size(entry_ec);
    if(entry_ec) continue;
    sig.modified = entry.last_write_time(entry_ec).time_since_epoch().count();
    if(entry_ec) continue;
    out.emplace(relative.generic_string(), sig);
  }
  return out;
}

void MirrorService::report_progress(const ProgressCallback& progress, double percent) const {
  if(!progress) return;
  try {
    progress(std::clamp(percent, 0.0, 100.0));
  } catch(const std::exception& e) {
    logger_->debug("Progress callback failed: {}", e.what());
  } catch(...) {
    logger_->debug("Progress callback failed with a non-standard exception");
  }
}

Alternative MirrorService::create_alternative(const std::string& name,
                                              const std::string& language_code,
                                              const std::string& destination_base_path,
                                              const std::string& metadata_language,
                                              const std::string& metadata_country) {
  auto clean_name = trim_copy(name);
  auto clean_code = trim_copy(language_code);
  if(clean_name.empty()) throw PolyglotError(ErrorKind::Validation, "Alternative name is required");
  if(clean_code.empty()) throw PolyglotError(ErrorKind::Validation, "Language code is required");
  if(destination_base_path.empty() || !fs::path(destination_base_path).is_absolute()) {
    throw PolyglotError(ErrorKind::Validation, "Destination base path must be absolute");
  }
  if(has_parent_traversal(destination_base_path)) {
    throw PolyglotError(ErrorKind::Validation, "Destination base path must not contain '..'");
  }

  auto derived = derive_metadata_locale(clean_code);
  Alternative alt;
  alt.id = generate_id();
  alt.name = clean_name;
  alt.language_code = clean_code;
  alt.metadata_language = metadata_language.empty() ? derived.first : metadata_language;
  alt.metadata_country = metadata_country.empty() ? derived.second : metadata_country;
  alt.destination_base_path = destination_base_path;
  alt.created_at = Clock::now();
  if(!store_->add_alternative(alt)) {
    if(!store_->available()) throw PolyglotError(ErrorKind::FatalIo, "Configuration unavailable");
    throw PolyglotError(ErrorKind::Conflict, "An alternative named '" + clean_name + "' already exists");
  }
  return alt;
}

ValidationResult MirrorService::validate_mirror_configuration(const std::string& source_library_id,
                                                              const std::string& target_path) const {
  auto source = find_library(source_library_id);
  if(!source) return ValidationResult::fail("Source library not found");
  return validate_mirror_paths(source->paths, target_path);
}

std::vector<LibraryInfo> MirrorService::get_libraries() const {
  auto alternatives = store_->get_alternatives();
  std::vector<LibraryInfo> out;
  for(const auto& lib : libraries_->list_libraries()) {
    LibraryInfo info;
    info.id = lib.id;
    info.name = lib.name;
    info.collection_type = lib.collection_type;
    info.paths = lib.paths;
    info.metadata_language = lib.options.metadata_language;
    info.metadata_country = lib.options.metadata_country;
    for(const auto& alt : alternatives) {
      auto it = std::find_if(alt.mirrors.begin(), alt.mirrors.end(), [&](const Mirror& m){
        return m.target_library_id && *m.target_library_id == lib.id;
      });
      if(it != alt.mirrors.end()) {
        info.is_mirror = true;
        info.alternative_id = alt.id;
        break;
      }
    }
    out.push_back(std::move(info));
  }
  return out;
}

Mirror MirrorService::add_mirror(const std::string& alternative_id,
                                 const std::string& source_library_id,
                                 const std::string& target_path,
                                 const std::string& target_library_name) {
  auto alternative = store_->get_alternative(alternative_id);
  if(!alternative) {
    throw PolyglotError(ErrorKind::NotFound, "Alternative " + alternative_id + " not found");
  }
  auto source = find_library(source_library_id);
  if(!source) {
    throw PolyglotError(ErrorKind::NotFound, "Library " + source_library_id + " not found");
  }
  for(const auto& alt : store_->get_alternatives()) {
    for(const auto& m : alt.mirrors) {
      if(m.target_library_id && *m.target_library_id == source_library_id) {
        throw PolyglotError(ErrorKind::Validation,
                            "Library '" + source->name + "' is itself a mirror and cannot be mirrored");
      }
    }
  }

  auto path = target_path;
  if(path.empty()) {
    path = (fs::path(alternative->destination_base_path) / to_lower(source->name)).string();
  }
  auto validation = validate_mirror_paths(source->paths, path);
  if(!validation.valid) {
    throw PolyglotError(ErrorKind::Validation, validation.error);
  }

  Mirror mirror;
  mirror.id = generate_id();
  mirror.source_library_id = source->id;
  mirror.source_library_name = source->name;
  mirror.target_library_name = target_library_name.empty()
    ? source->name + " (" + alternative->name + ")"
    : target_library_name;
  mirror.target_path = path;
  mirror.collection_type = source->collection_type;
  mirror.status = SyncStatus::Pending;

  if(!store_->add_mirror(alternative_id, mirror)) {
    if(!store_->get_alternative(alternative_id)) {
      throw PolyglotError(ErrorKind::NotFound, "Alternative " + alternative_id + " not found");
    }
    throw PolyglotError(ErrorKind::Conflict,
                        "'" + alternative->name + "' already mirrors library '" + source->name + "'");
  }

  try {
    create_mirror(alternative_id, mirror.id);
  } catch(const std::exception& e) {
    logger_->warn("Dropping mirror '{}' after failed create: {}", mirror.target_library_name, e.what());
    store_->remove_mirror(mirror.id);
    locks_.evict(mirror.id);
    throw;
  }
  return store_->get_mirror(mirror.id).value_or(mirror);
}

std::string MirrorService::register_target_library(const Alternative& alternative,
                                                   const Mirror& mirror,
                                                   const VirtualLibrary& source) {
  LibraryOptions options = source.options;
  options.metadata_language = alternative.metadata_language;
  options.metadata_country = alternative.metadata_country;
  options.save_local_metadata = false;
  options.save_subtitles_with_media = false;
  options.save_lyrics_with_media = false;
  options.enable_internet_providers = true;
  options.enable_realtime_monitor = true;

  libraries_->add_library(mirror.target_library_name, mirror.collection_type, options);
  libraries_->add_media_path(mirror.target_library_name, mirror.target_path);

  std::string created_id;
  for(const auto& lib : libraries_->list_libraries()) {
    if(iequals(lib.name, mirror.target_library_name)) {
      created_id = lib.id;
      break;
    }
  }
  if(created_id.empty()) {
    throw PolyglotError(ErrorKind::FatalIo,
                        "Library '" + mirror.target_library_name + "' was not found after registration");
  }
  try {
    libraries_->queue_refresh(created_id);
  } catch(const std::exception& e) {
    logger_->warn("Library '{}' created but refresh could not be queued: {}",
                  mirror.target_library_name, e.what());
  }
  logger_->info("Registered library '{}' ({})", mirror.target_library_name, created_id);
  return created_id;
}

void MirrorService::create_mirror(const std::string& alternative_id,
                                  const std::string& mirror_id,
                                  const CancellationToken* cancel) {
  auto handle = locks_.handle(mirror_id);
  std::lock_guard<std::mutex> mirror_lock(*handle);

  auto alternative = store_->get_alternative(alternative_id);
  if(!alternative) {
    throw PolyglotError(ErrorKind::NotFound, "Alternative " + alternative_id + " not found");
  }
  const Mirror* found = alternative->find_mirror(mirror_id);
  if(!found) {
    throw PolyglotError(ErrorKind::NotFound, "Mirror " + mirror_id + " not found");
  }
  Mirror mirror = *found;
  logger_->info("Creating mirror of '{}' at {}", mirror.source_library_name, mirror.target_path);
  store_->update_mirror(mirror_id, [](Mirror& m){ m.status = SyncStatus::Syncing; });

  const fs::path target(mirror.target_path);
  bool target_created = false;
  bool target_was_empty = false;
  bool library_registered = false;
  std::vector<fs::path> placed;

  try {
    auto source = find_library(mirror.source_library_id);
    if(!source) {
      throw PolyglotError(ErrorKind::NotFound, "Source library " + mirror.source_library_id + " not found");
    }
    if(source->paths.empty()) {
      throw PolyglotError(ErrorKind::Validation, "Source library " + source->name + " has no paths");
    }
    for(const auto& source_path : source->paths) {
      if(!are_on_same_filesystem(source_path, target)) {
        throw PolyglotError(ErrorKind::Validation,
                            "Source path " + source_path + " and target path " + mirror.target_path +
                            " are on different filesystems; hardlinks require a single volume");
      }
    }

    std::error_code ec;
    if(fs::exists(target, ec)) {
      target_was_empty = is_directory_empty(target);
    } else {
      fs::create_directories(target, ec);
      if(ec) {
        throw PolyglotError(ErrorKind::FatalIo, "Cannot create " + mirror.target_path + ": " + ec.message());
      }
      target_created = true;
    }

    auto classifier = FileClassifier::from_settings(store_->get_settings());
    std::set<std::string> seen;
    int file_count = 0;
    for(const auto& source_path : source->paths) {
      for(const auto& entry : scan_tree(source_path, classifier)) {
        throw_if_cancelled(cancel);
        if(!seen.insert(entry.first).second) continue;
        auto link_path = target / entry.first;
        std::string error;
        if(create_hard_link(fs::path(source_path) / entry.first, link_path, error)) {
          placed.push_back(link_path);
          ++file_count;
          logger_->debug("Linked {}", entry.first);
        } else {
          logger_->warn("Skipping {}: {}", entry.first, error);
        }
      }
    }

    if(!mirror.target_library_id) {
      throw_if_cancelled(cancel);
      auto library_id = register_target_library(*alternative, mirror, *source);
      library_registered = true;
      mirror.target_library_id = library_id;
    }

    auto target_library_id = mirror.target_library_id;
    store_->update_mirror(mirror_id, [&](Mirror& m){
      m.status = SyncStatus::Synced;
      m.target_library_id = target_library_id;
      m.last_synced_at = Clock::now();
      m.last_file_count = file_count;
      m.last_error.reset();
    });
    logger_->info("Mirror '{}' created with {} file(s)", mirror.target_library_name, file_count);
  } catch(const std::exception& e) {
    logger_->error("Failed to create mirror of '{}': {}", mirror.source_library_name, e.what());
    std::string message = e.what();
    try {
      store_->update_mirror(mirror_id, [&](Mirror& m){
        m.status = SyncStatus::Error;
        m.last_error = message;
      });
    } catch(const std::exception& save_error) {
      logger_->error("Could not record failure for mirror {}: {}", mirror_id, save_error.what());
    }

    if(library_registered) {
      try {
        libraries_->remove_library(mirror.target_library_name);
        store_->update_mirror(mirror_id, [](Mirror& m){ m.target_library_id.reset(); });
      } catch(const std::exception& rollback_error) {
        logger_->error("Rollback: could not remove library '{}': {}",
                       mirror.target_library_name, rollback_error.what());
      }
    }
    std::error_code ec;
    if(target_created) {
      fs::remove_all(target, ec);
      if(ec) logger_->error("Rollback: could not remove {}: {}", mirror.target_path, ec.message());
    } else if(target_was_empty) {
      for(auto it = placed.rbegin(); it != placed.rend(); ++it) {
        fs::remove(*it, ec);
        if(ec) {
          logger_->error("Rollback: could not remove {}: {}", it->string(), ec.message());
          ec.clear();
          continue;
        }
        cleanup_empty_directories(it->parent_path(), target);
      }
    }
    throw;
  }
}

SyncReport MirrorService::sync_mirror(const std::string& mirror_id,
                                      ProgressCallback progress,
                                      const CancellationToken* cancel) {
  auto handle = locks_.handle(mirror_id);
  std::lock_guard<std::mutex> mirror_lock(*handle);

  auto current = store_->get_mirror(mirror_id);
  if(!current) {
    throw PolyglotError(ErrorKind::NotFound, "Mirror " + mirror_id + " not found");
  }
  Mirror mirror = *current;
  logger_->info("Syncing mirror '{}'", mirror.target_library_name);
  store_->update_mirror(mirror_id, [](Mirror& m){ m.status = SyncStatus::Syncing; });

  SyncReport report;
  try {
    auto source_paths = require_source_paths(mirror);
    const fs::path target(mirror.target_path);
    std::error_code ec;
    if(!fs::is_directory(target, ec)) {
      fs::create_directories(target, ec);
      if(ec) {
        throw PolyglotError(ErrorKind::FatalIo, "Cannot create " + mirror.target_path + ": " + ec.message());
      }
    }

    auto classifier = FileClassifier::from_settings(store_->get_settings());
    std::map<std::string, SourceFile> source_files;
    for(const auto& source_path : source_paths) {
      for(const auto& entry : scan_tree(source_path, classifier)) {
        source_files.emplace(entry.first, SourceFile{source_path, entry.second});
      }
    }
    auto target_files = scan_tree(target, classifier);

    std::vector<std::string> to_add;
    std::vector<std::string> to_update;
    std::vector<std::string> to_remove;
    for(const auto& entry : source_files) {
      auto it = target_files.find(entry.first);
      if(it == target_files.end()) {
        to_add.push_back(entry.first);
      } else if(it->second.size != entry.second.signature.size ||
                it->second.modified != entry.second.signature.modified) {
        logger_->debug("Changed: {}", entry.first);
        to_update.push_back(entry.first);
      }
    }
    for(const auto& entry : target_files) {
      if(!source_files.count(entry.first)) to_remove.push_back(entry.first);
    }

    const auto total = to_add.size() + to_update.size() + to_remove.size();
    std::size_t done = 0;
    auto step = [&]{
      ++done;
      report_progress(progress, total == 0 ? 100.0 : 100.0 * static_cast<double>(done) / static_cast<double>(total));
    };

    for(const auto& relative : to_remove) {
      throw_if_cancelled(cancel);
      auto file = target / relative;
      fs::remove(file, ec);
      if(ec) {
        logger_->warn("Failed to delete {}: {}", file.string(), ec.message());
        ec.clear();
        ++report.failed;
      } else {
        logger_->debug("Deleted {}", relative);
        cleanup_empty_directories(file.parent_path(), target);
        ++report.removed;
      }
      step();
    }

    auto link = [&](const std::string& relative, int& counter){
      const auto& source = source_files.at(relative);
      std::string error;
      if(create_hard_link(source.root / relative, target / relative, error)) {
        logger_->debug("Linked {}", relative);
        ++counter;
      } else {
        logger_->warn("Failed to link {}: {}", relative, error);
        ++report.failed;
      }
    };
    for(const auto& relative : to_update) {
      throw_if_cancelled(cancel);
      link(relative, report.updated);
      step();
    }
    for(const auto& relative : to_add) {
      throw_if_cancelled(cancel);
      link(relative, report.added);
      step();
    }

    report.file_count = static_cast<int>(source_files.size());
    store_->update_mirror(mirror_id, [&](Mirror& m){
      m.status = SyncStatus::Synced;
      m.last_synced_at = Clock::now();
      m.last_file_count = report.file_count;
      m.last_error.reset();
    });
    report_progress(progress, 100.0);
    logger_->info("Mirror '{}' synced: {} added, {} updated, {} removed, {} failed",
                  mirror.target_library_name, report.added, report.updated, report.removed, report.failed);
  } catch(const std::exception& e) {
    logger_->error("Failed to sync mirror '{}': {}", mirror.target_library_name, e.what());
    std::string message = e.what();
    try {
      store_->update_mirror(mirror_id, [&](Mirror& m){
        m.status = SyncStatus::Error;
        m.last_error = message;
      });
    } catch(const std::exception& save_error) {
      logger_->error("Could not record failure for mirror {}: {}", mirror_id, save_error.what());
    }
    throw;
  }
  return report;
}

DeleteMirrorResult MirrorService::delete_mirror(const std::string& mirror_id,
                                                bool delete_library,
                                                bool delete_files,
                                                bool force) {
  auto handle = locks_.handle(mirror_id);
  std::lock_guard<std::mutex> mirror_lock(*handle);

  auto current = store_->get_mirror(mirror_id);
  if(!current) {
    throw PolyglotError(ErrorKind::NotFound, "Mirror " + mirror_id + " not found");
  }
  const Mirror& mirror = *current;
  logger_->info("Deleting mirror '{}' (library: {}, files: {}, force: {})",
                mirror.target_library_name, delete_library, delete_files, force);

  DeleteMirrorResult result;
  if(delete_library && mirror.target_library_id) {
    try {
      if(find_library(*mirror.target_library_id)) {
        libraries_->remove_library(mirror.target_library_name);
      } else {
        logger_->debug("Library '{}' already gone", mirror.target_library_name);
      }
    } catch(const std::exception& e) {
      result.library_error = e.what();
      logger_->warn("Failed to remove library '{}': {}", mirror.target_library_name, e.what());
    }
  }

  if(delete_files && !mirror.target_path.empty()) {
    std::error_code ec;
    if(fs::exists(mirror.target_path, ec)) {
      fs::remove_all(mirror.target_path, ec);
      if(ec) {
        result.files_error = ec.message();
        logger_->warn("Failed to delete {}: {}", mirror.target_path, ec.message());
      }
    }
  }

  if(result.has_warnings() && !force) {
    std::string message = "Mirror '" + mirror.target_library_name + "' was not removed:";
    if(result.library_error) message += " library: " + *result.library_error + ";";
    if(result.files_error) message += " files: " + *result.files_error + ";";
    throw PolyglotError(ErrorKind::FatalIo, message);
  }

  result.removed_from_config = store_->remove_mirror(mirror_id);
  locks_.evict(mirror_id);
  return result;
}

SyncAllResult MirrorService::sync_all_mirrors(const std::string& alternative_id,
                                              ProgressCallback progress,
                                              const CancellationToken* cancel) {
  SyncAllResult result;
  auto alternative = store_->get_alternative(alternative_id);
  if(!alternative) {
    result.status = SyncAllResult::Status::AlternativeNotFound;
    return result;
  }
  logger_->info("Syncing all mirrors of '{}'", alternative->name);
  result.total = static_cast<int>(alternative->mirrors.size());
  bool cancelled = false;

  for(std::size_t i = 0; i < alternative->mirrors.size(); ++i) {
    if(is_cancelled(cancel)) {
      cancelled = true;
      break;
    }
    const auto& mirror = alternative->mirrors[i];
    if(!store_->get_mirror(mirror.id)) {
      logger_->debug("Mirror '{}' was removed, skipping", mirror.target_library_name);
      continue;
    }
    const double base = 100.0 * static_cast<double>(i);
    const double count = static_cast<double>(alternative->mirrors.size());
    ProgressCallback per_mirror;
    if(progress) {
      per_mirror = [&, base, count](double p){ progress((base + p) / count); };
    }
    try {
      sync_mirror(mirror.id, per_mirror, cancel);
      ++result.synced;
    } catch(const PolyglotError& e) {
      if(e.kind() == ErrorKind::Cancelled) {
        cancelled = true;
        break;
      }
      ++result.failed;
    } catch(const std::exception& e) {
      logger_->error("Mirror '{}' failed: {}", mirror.target_library_name, e.what());
      ++result.failed;
    }
  }

  if(cancelled) {
    result.status = SyncAllResult::Status::Cancelled;
  } else if(result.failed > 0) {
    result.status = SyncAllResult::Status::CompletedWithErrors;
  } else {
    result.status = SyncAllResult::Status::Completed;
    report_progress(progress, 100.0);
  }
  logger_->info("Sync of '{}' {}: {}/{} synced, {} failed",
                alternative->name, sync_all_status_name(result.status),
                result.synced, result.total, result.failed);
  return result;
}

DeleteAlternativeResult MirrorService::delete_alternative(const std::string& alternative_id,
                                                          bool delete_libraries,
                                                          bool delete_files) {
  auto alternative = store_->get_alternative(alternative_id);
  if(!alternative) {
    throw PolyglotError(ErrorKind::NotFound, "Alternative " + alternative_id + " not found");
  }
  DeleteAlternativeResult result;
  std::set<std::string> expected;
  for(const auto& mirror : alternative->mirrors) {
    expected.insert(mirror.id);
    try {
      delete_mirror(mirror.id, delete_libraries, delete_files, false);
    } catch(const PolyglotError& e) {
      if(e.kind() == ErrorKind::NotFound) continue;
      result.failures.push_back(mirror.target_library_name + ": " + e.what());
    } catch(const std::exception& e) {
      result.failures.push_back(mirror.target_library_name + ": " + e.what());
    }
  }
  if(!result.failures.empty()) {
    logger_->warn("Keeping alternative '{}': {} mirror(s) could not be deleted",
                  alternative->name, result.failures.size());
    return result;
  }

  auto removal = store_->try_remove_alternative_atomic(alternative_id, expected);
  switch(removal.status) {
    case RemoveAlternativeResult::Status::Succeeded:
      result.removed = true;
      break;
    case RemoveAlternativeResult::Status::NotFound:
      logger_->debug("Alternative '{}' was already removed", alternative->name);
      result.removed = true;
      break;
    case RemoveAlternativeResult::Status::ConfigUnavailable:
      throw PolyglotError(ErrorKind::FatalIo, "Configuration unavailable");
    case RemoveAlternativeResult::Status::NewMirrorsFound: {
      std::string ids;
      for(const auto& id : removal.unexpected_mirror_ids) {
        if(!ids.empty()) ids += ", ";
        ids += id;
      }
      throw PolyglotError(ErrorKind::Conflict,
                          "Mirrors were added to '" + alternative->name + "' during deletion: " + ids);
    }
  }
  return result;
}
