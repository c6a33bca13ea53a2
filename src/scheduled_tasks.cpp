#include "scheduled_tasks.hpp"

namespace {

void report(const ProgressCallback& progress, double percent, Logger& logger) {
  if(!progress) return;
  try {
    progress(percent);
  } catch(const std::exception& e) {
    logger.debug("Progress callback threw: {}", e.what());
  } catch(...) {
    logger.debug("Progress callback threw a non-standard exception");
  }
}

// Syncs each alternative in turn, mapping its progress onto a slice of the
// overall range. Alternatives without mirrors are skipped when asked.
void sync_alternatives(MirrorService& mirrors,
                       const std::vector<Alternative>& alternatives,
                       bool skip_empty,
                       const ProgressCallback& progress,
                       const CancellationToken* cancel,
                       Logger& logger) {
  const double total = static_cast<double>(alternatives.size());
  for(std::size_t i = 0; i < alternatives.size(); ++i) {
    throw_if_cancelled(cancel);
    const auto& alt = alternatives[i];
    if(skip_empty && alt.mirrors.empty()) continue;

    const double base = 100.0 * static_cast<double>(i);
    ProgressCallback slice;
    if(progress) {
      slice = [&, base](double p){ report(progress, (base + p) / total, logger); };
    }
    SyncAllResult result;
    try {
      result = mirrors.sync_all_mirrors(alt.id, slice, cancel);
    } catch(const std::exception& e) {
      logger.error("Failed to sync mirrors of '{}': {}", alt.name, e.what());
      continue;
    }
    if(result.status == SyncAllResult::Status::Cancelled) {
      throw PolyglotError(ErrorKind::Cancelled, "Sync of '" + alt.name + "' cancelled");
    }
    if(result.status == SyncAllResult::Status::CompletedWithErrors) {
      logger.warn("'{}': {} of {} mirrors failed to sync", alt.name, result.failed, result.total);
    }
  }
}

} // namespace

MirrorSyncTask::MirrorSyncTask(std::shared_ptr<ConfigurationStore> store,
                               std::shared_ptr<MirrorService> mirrors,
                               std::shared_ptr<OrphanReconciler> orphans,
                               std::shared_ptr<LibraryAccessService> access,
                               std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    mirrors_(std::move(mirrors)),
    orphans_(std::move(orphans)),
    access_(std::move(access)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("task")) {}

void MirrorSyncTask::restore_orphaned_sources(const OrphanCleanupResult& cleanup,
                                              const CancellationToken* cancel) {
  if(cleanup.sources_without_mirrors.empty()) return;
  for(const auto& config : store_->get_user_languages()) {
    if(!config.plugin_managed) continue;
    try {
      access_->add_libraries_to_user_access(config.user_id, cleanup.sources_without_mirrors);
    } catch(const std::exception& e) {
      logger_->warn("Failed to restore source libraries for {}: {}", config.username, e.what());
    }
  }
  access_->reconcile_all_users(cancel);
}

void MirrorSyncTask::run(ProgressCallback progress, const CancellationToken* cancel) {
  logger_->info("Mirror sync task started");
  try {
    auto cleanup = orphans_->cleanup(cancel);
    if(cleanup.total_cleaned() > 0 || !cleanup.failed.empty()) {
      logger_->info("Orphan cleanup removed {} mirror(s), {} failed", cleanup.total_cleaned(), cleanup.failed.size());
    }
    restore_orphaned_sources(cleanup, cancel);
  } catch(const PolyglotError& e) {
    if(e.kind() == ErrorKind::Cancelled) throw;
    logger_->error("Orphan cleanup failed: {}", e.what());
  } catch(const std::exception& e) {
    logger_->error("Orphan cleanup failed: {}", e.what());
  }

  sync_alternatives(*mirrors_, store_->get_alternatives(), false, progress, cancel, *logger_);
  report(progress, 100.0, *logger_);
  logger_->info("Mirror sync task finished");
}

PostScanTask::PostScanTask(std::shared_ptr<ConfigurationStore> store,
                           std::shared_ptr<MirrorService> mirrors,
                           std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    mirrors_(std::move(mirrors)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("task")) {}

void PostScanTask::run(ProgressCallback progress, const CancellationToken* cancel) {
  if(!store_->get_settings().sync_mirrors_after_library_scan) {
    logger_->debug("Sync after library scan is disabled");
    return;
  }
  auto alternatives = store_->get_alternatives();
  if(alternatives.empty()) {
    logger_->debug("No alternatives, nothing to sync after scan");
    return;
  }
  logger_->info("Library scan completed, syncing mirrors");
  sync_alternatives(*mirrors_, alternatives, true, progress, cancel, *logger_);
  report(progress, 100.0, *logger_);
  logger_->info("Post-scan mirror sync finished");
}

UserLanguageSyncTask::UserLanguageSyncTask(std::shared_ptr<ConfigurationStore> store,
                                           std::shared_ptr<LibraryAccessService> access,
                                           std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    access_(std::move(access)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("task")) {}

void UserLanguageSyncTask::run(ProgressCallback progress, const CancellationToken* cancel) {
  const auto configs = store_->get_user_languages();
  std::size_t managed = 0;
  for(const auto& c : configs) {
    if(c.plugin_managed) ++managed;
  }
  logger_->info("Reconciling library access for {} managed user(s)", managed);

  int changed = 0;
  std::size_t done = 0;
  for(const auto& config : configs) {
    throw_if_cancelled(cancel);
    if(!config.plugin_managed) continue;
    try {
      if(access_->reconcile_user_access(config.user_id)) ++changed;
    } catch(const std::exception& e) {
      logger_->warn("Failed to reconcile {}: {}", config.username.empty() ? config.user_id : config.username,
                    e.what());
    }
    ++done;
    report(progress, 100.0 * static_cast<double>(done) / static_cast<double>(managed), *logger_);
  }
  report(progress, 100.0, *logger_);
  logger_->info("User language sync finished, {} user(s) corrected", changed);
}
