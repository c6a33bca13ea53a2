#pragma once

#include <memory>
#include <string>

#include "cancellation.hpp"
#include "configuration_store.hpp"
#include "library_access_service.hpp"
#include "log.hpp"
#include "mirror_service.hpp"
#include "orphan_reconciler.hpp"

// Background job run by the engine's scheduler or on demand from the CLI.
// Cancellation surfaces as PolyglotError(Cancelled).
class ScheduledTask {
public:
  virtual ~ScheduledTask() = default;

  virtual const char* name() const = 0;
  virtual void run(ProgressCallback progress, const CancellationToken* cancel) = 0;
};

// Orphan cleanup, then a sync of every alternative.
class MirrorSyncTask : public ScheduledTask {
public:
  MirrorSyncTask(std::shared_ptr<ConfigurationStore> store,
                 std::shared_ptr<MirrorService> mirrors,
                 std::shared_ptr<OrphanReconciler> orphans,
                 std::shared_ptr<LibraryAccessService> access,
                 std::shared_ptr<Logger> logger = nullptr);

  const char* name() const override { return "mirror-sync"; }
  void run(ProgressCallback progress, const CancellationToken* cancel) override;

private:
  void restore_orphaned_sources(const OrphanCleanupResult& cleanup, const CancellationToken* cancel);

  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<MirrorService> mirrors_;
  std::shared_ptr<OrphanReconciler> orphans_;
  std::shared_ptr<LibraryAccessService> access_;
  std::shared_ptr<Logger> logger_;
};

// Sync after a host library scan, skipping alternatives without mirrors.
class PostScanTask : public ScheduledTask {
public:
  PostScanTask(std::shared_ptr<ConfigurationStore> store,
               std::shared_ptr<MirrorService> mirrors,
               std::shared_ptr<Logger> logger = nullptr);

  const char* name() const override { return "post-scan"; }
  void run(ProgressCallback progress, const CancellationToken* cancel) override;

private:
  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<MirrorService> mirrors_;
  std::shared_ptr<Logger> logger_;
};

class UserLanguageSyncTask : public ScheduledTask {
public:
  UserLanguageSyncTask(std::shared_ptr<ConfigurationStore> store,
                       std::shared_ptr<LibraryAccessService> access,
                       std::shared_ptr<Logger> logger = nullptr);

  const char* name() const override { return "user-language-sync"; }
  void run(ProgressCallback progress, const CancellationToken* cancel) override;

private:
  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<LibraryAccessService> access_;
  std::shared_ptr<Logger> logger_;
};
