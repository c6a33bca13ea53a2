#include "orphan_reconciler.hpp"

#include <algorithm>
#include <set>

OrphanReconciler::OrphanReconciler(std::shared_ptr<ConfigurationStore> store,
                                   std::shared_ptr<LibraryDirectory> libraries,
                                   std::shared_ptr<MirrorService> mirrors,
                                   std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    libraries_(std::move(libraries)),
    mirrors_(std::move(mirrors)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("orphans")) {}

const char* OrphanReconciler::reason_text(Reason reason) {
  switch(reason) {
    case Reason::SourceDeleted: return "source deleted";
    case Reason::MirrorDeleted: return "mirror deleted";
    case Reason::Ghost: return "ghost";
  }
  return "unknown";
}

bool OrphanReconciler::is_ghost(const Mirror& mirror, Timestamp now, std::chrono::minutes threshold) const {
  if(mirror.target_library_id) return false;
  if(mirror.status != SyncStatus::Pending && mirror.status != SyncStatus::Error) return false;
  if(mirrors_->is_mirror_busy(mirror.id)) return false;
  if(!mirror.last_synced_at) return true;
  return now - *mirror.last_synced_at > threshold;
}

OrphanCleanupResult OrphanReconciler::cleanup(const CancellationToken* cancel) {
  OrphanCleanupResult result;
  std::set<std::string> live_ids;
  for(const auto& lib : libraries_->list_libraries()) live_ids.insert(lib.id);

  const auto settings = store_->get_settings();
  const auto threshold = std::chrono::minutes(std::max(0, settings.ghost_threshold_minutes));
  const auto now = Clock::now();

  struct Candidate {
    Mirror mirror;
    Reason reason;
  };
  std::vector<Candidate> candidates;
  for(const auto& alt : store_->get_alternatives()) {
    for(const auto& mirror : alt.mirrors) {
      if(!live_ids.count(mirror.source_library_id)) {
        logger_->warn("Source library of mirror '{}' no longer exists", mirror.target_library_name);
        candidates.push_back({mirror, Reason::SourceDeleted});
      } else if(mirror.target_library_id && !live_ids.count(*mirror.target_library_id)) {
        logger_->warn("Library '{}' was removed outside of polyglot", mirror.target_library_name);
        candidates.push_back({mirror, Reason::MirrorDeleted});
      } else if(is_ghost(mirror, now, threshold)) {
        logger_->warn("Mirror '{}' never finished creating ({})",
                      mirror.target_library_name, sync_status_name(mirror.status));
        candidates.push_back({mirror, Reason::Ghost});
      }
    }
  }

  for(const auto& candidate : candidates) {
    if(is_cancelled(cancel)) {
      logger_->info("Orphan cleanup cancelled");
      break;
    }
    const auto& mirror = candidate.mirror;
    const std::string label = mirror.target_library_name + " (" + reason_text(candidate.reason) + ")";
    // A vanished target library is already gone, so only files and config go.
    const bool delete_library = candidate.reason != Reason::MirrorDeleted;
    try {
      mirrors_->delete_mirror(mirror.id, delete_library, true, true);
      result.cleaned.push_back(label);
      logger_->info("Removed orphaned mirror {}", label);
    } catch(const PolyglotError& e) {
      if(e.kind() == ErrorKind::NotFound) continue;
      logger_->error("Failed to remove orphaned mirror {}: {}", label, e.what());
      result.failed.push_back(label + ": " + e.what());
      continue;
    } catch(const std::exception& e) {
      logger_->error("Failed to remove orphaned mirror {}: {}", label, e.what());
      result.failed.push_back(label + ": " + e.what());
      continue;
    }

    if(candidate.reason == Reason::SourceDeleted) continue;
    if(!live_ids.count(mirror.source_library_id)) continue;
    bool still_mirrored = false;
    for(const auto& alt : store_->get_alternatives()) {
      if(alt.find_mirror_for_source(mirror.source_library_id)) {
        still_mirrored = true;
        break;
      }
    }
    auto& orphans = result.sources_without_mirrors;
    if(!still_mirrored &&
       std::find(orphans.begin(), orphans.end(), mirror.source_library_id) == orphans.end()) {
      logger_->info("Library '{}' has no mirrors left", mirror.source_library_name);
      orphans.push_back(mirror.source_library_id);
    }
  }
  return result;
}
