#include "test_fixture.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace polyglot::test {
namespace {

namespace fs = std::filesystem;

std::optional<VirtualLibrary> library_named(const HostCatalog& catalog, const std::string& name) {
  for(const auto& lib : catalog.list_libraries()) {
    if(lib.name == name) return lib;
  }
  return std::nullopt;
}

bool test_create_alternative(TestContext& ctx) {
  MirrorFixture fx(ctx, "alt_create");
  auto german = fx.add_german();
  POLYGLOT_CHECK(ctx, german.metadata_language == "de");
  POLYGLOT_CHECK(ctx, german.metadata_country == "DE");
  POLYGLOT_CHECK(ctx, fx.store->get_alternative(german.id).has_value());

  auto brazil = fx.mirrors->create_alternative("Brazil", "pt-BR", (fx.workspace / "mirrors/br").string(), "pt", "PT");
  POLYGLOT_CHECK(ctx, brazil.metadata_language == "pt" && brazil.metadata_country == "PT");

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->create_alternative("german", "de", (fx.workspace / "x").string()),
                        ErrorKind::Conflict);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->create_alternative("Spanish", "es", "mirrors/es"), ErrorKind::Validation);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->create_alternative("Spanish", "es", "/mirrors/../es"), ErrorKind::Validation);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->create_alternative("  ", "es", "/mirrors/es"), ErrorKind::Validation);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->create_alternative("Spanish", "", "/mirrors/es"), ErrorKind::Validation);
  POLYGLOT_CHECK(ctx, fx.store->get_alternatives().size() == 2);
  return true;
}

bool test_add_mirror_links_media(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_add");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");

  const auto target = fx.german_movies();
  POLYGLOT_CHECK(ctx, mirror.target_path == target.string());
  POLYGLOT_CHECK(ctx, mirror.target_library_name == "Movies (German)");
  POLYGLOT_CHECK(ctx, mirror.status == SyncStatus::Synced);
  POLYGLOT_CHECK(ctx, mirror.target_library_id.has_value());
  POLYGLOT_CHECK(ctx, mirror.last_file_count == 2);
  POLYGLOT_CHECK(ctx, mirror.last_synced_at.has_value());

  POLYGLOT_CHECK(ctx, same_inode(fx.movies_root / "Film (2020)/film.mkv", target / "Film (2020)/film.mkv"));
  POLYGLOT_CHECK(ctx, same_inode(fx.movies_root / "Film (2020)/film.en.srt", target / "Film (2020)/film.en.srt"));
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Film (2020)/.trickplay"));
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Film (2020)/film.nfo"));
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Film (2020)/poster.jpg"));
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Film (2020)/extrafanart"));
  POLYGLOT_CHECK(ctx, link_count(fx.movies_root / "Film (2020)/film.mkv").value_or(0) >= 2);

  auto library = library_named(*fx.catalog, "Movies (German)");
  POLYGLOT_CHECK(ctx, library.has_value());
  POLYGLOT_CHECK(ctx, library->id == *mirror.target_library_id);
  POLYGLOT_CHECK(ctx, library->collection_type == "movies");
  POLYGLOT_CHECK(ctx, library->paths == std::vector<std::string>{target.string()});
  POLYGLOT_CHECK(ctx, library->options.metadata_language == "de");
  POLYGLOT_CHECK(ctx, library->options.metadata_country == "DE");
  POLYGLOT_CHECK(ctx, !library->options.save_local_metadata);
  POLYGLOT_CHECK(ctx, !library->options.save_subtitles_with_media);

  auto refreshes = fx.catalog->pending_refreshes();
  POLYGLOT_CHECK(ctx, std::find(refreshes.begin(), refreshes.end(), library->id) != refreshes.end());
  return true;
}

bool test_add_mirror_rejections(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_reject");
  auto german = fx.add_german();
  auto french = fx.add_french();

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, fx.movies_id, (fx.movies_root / "de").string()),
                        ErrorKind::Validation);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, fx.movies_id, "relative/path"),
                        ErrorKind::Validation);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror("missing", fx.movies_id, ""), ErrorKind::NotFound);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, "missing", ""), ErrorKind::NotFound);
  POLYGLOT_CHECK(ctx, fx.store->get_alternative(german.id)->mirrors.empty());

  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, fx.movies_id, (fx.workspace / "mirrors/other").string()),
                        ErrorKind::Conflict);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(french.id, *mirror.target_library_id, ""),
                        ErrorKind::Validation);

  auto check = fx.mirrors->validate_mirror_configuration(fx.movies_id, fx.german_movies().string());
  POLYGLOT_CHECK(ctx, !check.valid);
  POLYGLOT_CHECK(ctx, !fx.mirrors->validate_mirror_configuration("missing", "/tmp/x").valid);
  return true;
}

bool test_sync_is_idempotent(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_idempotent");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  for(int i = 0; i < 2; ++i) {
    auto report = fx.mirrors->sync_mirror(mirror.id);
    POLYGLOT_CHECK(ctx, report.added == 0 && report.updated == 0 && report.removed == 0 && report.failed == 0);
    POLYGLOT_CHECK(ctx, report.file_count == 2);
  }
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id)->status == SyncStatus::Synced);
  return true;
}

bool test_sync_follows_source(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_round_trip");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  const auto target = fx.german_movies();

  write_file(fx.movies_root / "New (2021)/new.mkv", "new video");
  write_file(fx.movies_root / "Old (1990)/old.mkv", "old video");
  std::vector<double> progress;
  auto report = fx.mirrors->sync_mirror(mirror.id, [&](double p){ progress.push_back(p); });
  POLYGLOT_CHECK(ctx, report.added == 2 && report.removed == 0);
  POLYGLOT_CHECK(ctx, report.file_count == 4);
  POLYGLOT_CHECK(ctx, same_inode(fx.movies_root / "New (2021)/new.mkv", target / "New (2021)/new.mkv"));
  POLYGLOT_CHECK(ctx, !progress.empty() && progress.back() == 100.0);

  std::error_code ec;
  fs::remove_all(fx.movies_root / "Old (1990)", ec);
  fs::remove(fx.movies_root / "Film (2020)/film.en.srt", ec);
  // Replaced rather than edited, so the mirror still holds the old inode.
  fs::remove(fx.movies_root / "Film (2020)/film.mkv", ec);
  write_file(fx.movies_root / "Film (2020)/film.mkv", "re-encoded video");

  report = fx.mirrors->sync_mirror(mirror.id);
  POLYGLOT_CHECK(ctx, report.removed == 2);
  POLYGLOT_CHECK(ctx, report.updated == 1);
  POLYGLOT_CHECK(ctx, report.added == 0);
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Old (1990)"));
  POLYGLOT_CHECK(ctx, !fs::exists(target / "Film (2020)/film.en.srt"));
  POLYGLOT_CHECK(ctx, same_inode(fx.movies_root / "Film (2020)/film.mkv", target / "Film (2020)/film.mkv"));
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id)->last_file_count == 2);
  return true;
}

bool test_sync_keeps_excluded_target_files(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_exclusions");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  const auto target = fx.german_movies();
  // Metadata written into the mirror by the media server.
  write_file(target / "Film (2020)/film.nfo", "<movie lang=\"de\"/>");
  write_file(target / "Film (2020)/extrafanart/de.jpg", "fanart");

  auto report = fx.mirrors->sync_mirror(mirror.id);
  POLYGLOT_CHECK(ctx, report.removed == 0);
  POLYGLOT_CHECK(ctx, fs::exists(target / "Film (2020)/film.nfo"));
  POLYGLOT_CHECK(ctx, fs::exists(target / "Film (2020)/extrafanart/de.jpg"));
  POLYGLOT_CHECK(ctx, !same_inode(fx.movies_root / "Film (2020)/film.nfo", target / "Film (2020)/film.nfo"));
  return true;
}

bool test_sync_survives_progress_failures(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_progress_throws");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  write_file(fx.movies_root / "New (2021)/new.mkv", "new video");

  int calls = 0;
  auto report = fx.mirrors->sync_mirror(mirror.id, [&](double){
    ++calls;
    throw std::runtime_error("progress sink closed");
  });
  POLYGLOT_CHECK(ctx, calls > 0);
  POLYGLOT_CHECK(ctx, report.added == 1 && report.failed == 0);
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id)->status == SyncStatus::Synced);

  write_file(fx.movies_root / "Other (2022)/other.mkv", "other video");
  report = fx.mirrors->sync_mirror(mirror.id, [](double){ throw 42; });
  POLYGLOT_CHECK(ctx, report.added == 1);
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id)->status == SyncStatus::Synced);

  auto all = fx.mirrors->sync_all_mirrors(german.id, [](double){ throw std::runtime_error("closed"); });
  POLYGLOT_CHECK(ctx, all.status == SyncAllResult::Status::Completed);
  POLYGLOT_CHECK(ctx, all.synced == 1);
  return true;
}

bool test_sync_skips_failed_files(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_file_failure");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  const auto target = fx.german_movies();
  write_file(fx.movies_root / "New (2021)/new.mkv", "new video");
  write_file(fx.movies_root / "Other (2022)/other.mkv", "other video");
  // A non-empty directory sits where the new link has to go. Its content
  // is excluded from mirroring, so sync never deletes it.
  write_file(target / "New (2021)/new.mkv/notes.nfo", "<notes/>");

  auto report = fx.mirrors->sync_mirror(mirror.id);
  POLYGLOT_CHECK(ctx, report.failed == 1);
  POLYGLOT_CHECK(ctx, report.added == 1);
  POLYGLOT_CHECK(ctx, report.removed == 0);
  POLYGLOT_CHECK(ctx, report.file_count == 4);
  POLYGLOT_CHECK(ctx, same_inode(fx.movies_root / "Other (2022)/other.mkv", target / "Other (2022)/other.mkv"));
  POLYGLOT_CHECK(ctx, fs::is_directory(target / "New (2021)/new.mkv"));

  auto stored = fx.store->get_mirror(mirror.id);
  POLYGLOT_CHECK(ctx, stored->status == SyncStatus::Synced);
  POLYGLOT_CHECK(ctx, stored->last_file_count == 4);
  POLYGLOT_CHECK(ctx, stored->last_synced_at.has_value());
  POLYGLOT_CHECK(ctx, !stored->last_error);
  POLYGLOT_CHECK(ctx, ctx.logs.contains("Failed to link New (2021)/new.mkv"));
  return true;
}

bool test_create_failure_rolls_back(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_rollback");
  auto german = fx.add_german();
  // The host refuses the target library name.
  fx.catalog->add_library("Movies (German)", "movies", {});
  const auto libraries_before = fx.catalog->list_libraries().size();

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, fx.movies_id, ""), ErrorKind::Conflict);
  POLYGLOT_CHECK(ctx, fx.store->get_alternative(german.id)->mirrors.empty());
  POLYGLOT_CHECK(ctx, !fs::exists(fx.german_movies()));
  POLYGLOT_CHECK(ctx, fx.catalog->list_libraries().size() == libraries_before);
  POLYGLOT_CHECK(ctx, fx.mirrors->locks().size() == 0);
  POLYGLOT_CHECK(ctx, fs::exists(fx.movies_root / "Film (2020)/film.mkv"));
  POLYGLOT_CHECK(ctx, link_count(fx.movies_root / "Film (2020)/film.mkv").value_or(0) == 1);

  // A target directory that existed empty is kept, and emptied again.
  std::error_code ec;
  fs::create_directories(fx.german_movies(), ec);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->add_mirror(german.id, fx.movies_id, ""), ErrorKind::Conflict);
  POLYGLOT_CHECK(ctx, fs::is_directory(fx.german_movies()));
  POLYGLOT_CHECK(ctx, is_directory_empty(fx.german_movies()));
  return true;
}

bool test_delete_mirror(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_delete");
  auto german = fx.add_german();
  auto shows_id = fx.add_shows();
  auto movies = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  auto shows = fx.mirrors->add_mirror(german.id, shows_id, "");

  auto result = fx.mirrors->delete_mirror(movies.id);
  POLYGLOT_CHECK(ctx, result.removed_from_config && !result.has_warnings());
  POLYGLOT_CHECK(ctx, !fx.store->get_mirror(movies.id));
  POLYGLOT_CHECK(ctx, !library_named(*fx.catalog, "Movies (German)"));
  POLYGLOT_CHECK(ctx, !fs::exists(fx.german_movies()));
  POLYGLOT_CHECK(ctx, fs::exists(fx.movies_root / "Film (2020)/film.mkv"));

  result = fx.mirrors->delete_mirror(shows.id, true, false);
  POLYGLOT_CHECK(ctx, result.removed_from_config);
  POLYGLOT_CHECK(ctx, fs::exists(fx.workspace / "mirrors/german/shows/Show/Season 1/s01e01.mkv"));
  POLYGLOT_CHECK(ctx, !library_named(*fx.catalog, "Shows (German)"));

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->delete_mirror(movies.id), ErrorKind::NotFound);
  return true;
}

bool test_delete_mirror_requires_force_on_warnings(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_delete_force");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.libraries->fail_remove = true;

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->delete_mirror(mirror.id, true, false, false), ErrorKind::FatalIo);
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id).has_value());

  auto result = fx.mirrors->delete_mirror(mirror.id, true, false, true);
  POLYGLOT_CHECK(ctx, result.library_error.has_value());
  POLYGLOT_CHECK(ctx, result.removed_from_config);
  POLYGLOT_CHECK(ctx, !fx.store->get_mirror(mirror.id));
  POLYGLOT_CHECK(ctx, library_named(*fx.catalog, "Movies (German)").has_value());
  return true;
}

bool test_delete_alternative(TestContext& ctx) {
  MirrorFixture fx(ctx, "alt_delete");
  auto german = fx.add_german();
  auto shows_id = fx.add_shows();
  fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.mirrors->add_mirror(german.id, shows_id, "");

  fx.libraries->fail_remove = true;
  auto kept = fx.mirrors->delete_alternative(german.id, true, true);
  POLYGLOT_CHECK(ctx, !kept.removed);
  POLYGLOT_CHECK(ctx, kept.failures.size() == 2);
  POLYGLOT_CHECK(ctx, fx.store->get_alternative(german.id).has_value());

  fx.libraries->fail_remove = false;
  auto result = fx.mirrors->delete_alternative(german.id, true, true);
  POLYGLOT_CHECK(ctx, result.removed && result.failures.empty());
  POLYGLOT_CHECK(ctx, !fx.store->get_alternative(german.id));
  POLYGLOT_CHECK(ctx, fx.catalog->list_libraries().size() == 2);
  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->delete_alternative(german.id, true, true), ErrorKind::NotFound);
  return true;
}

bool test_mirror_lock_serializes(TestContext& ctx) {
  MirrorFixture fx(ctx, "mirror_lock");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  POLYGLOT_CHECK(ctx, !fx.mirrors->is_mirror_busy(mirror.id));

  constexpr int kNewFiles = 20;
  for(int i = 0; i < kNewFiles; ++i) {
    write_file(fx.movies_root / ("Batch/file" + std::to_string(i) + ".mkv"), "batch");
  }

  std::atomic<bool> busy_inside{false};
  std::atomic<int> added{0};
  std::atomic<int> failed{0};
  auto worker = [&](){
    auto report = fx.mirrors->sync_mirror(mirror.id, [&](double){
      // Asked from another thread; the lock is owned by this one.
      std::thread observer([&](){
        if(fx.mirrors->is_mirror_busy(mirror.id)) busy_inside = true;
      });
      observer.join();
    });
    added += report.added;
    failed += report.failed;
  };
  std::thread first(worker);
  std::thread second(worker);
  first.join();
  second.join();

  POLYGLOT_CHECK(ctx, busy_inside.load());
  POLYGLOT_CHECK(ctx, added.load() == kNewFiles);
  POLYGLOT_CHECK(ctx, failed.load() == 0);
  POLYGLOT_CHECK(ctx, !fx.mirrors->is_mirror_busy(mirror.id));
  return true;
}

bool test_sync_missing_source(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_missing_source");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.catalog->remove_library("Movies");

  POLYGLOT_CHECK_THROWS(ctx, fx.mirrors->sync_mirror(mirror.id), ErrorKind::NotFound);
  auto stored = fx.store->get_mirror(mirror.id);
  POLYGLOT_CHECK(ctx, stored && stored->status == SyncStatus::Error && stored->last_error.has_value());

  auto all = fx.mirrors->sync_all_mirrors(german.id);
  POLYGLOT_CHECK(ctx, all.status == SyncAllResult::Status::CompletedWithErrors);
  POLYGLOT_CHECK(ctx, all.failed == 1 && all.synced == 0 && all.total == 1);
  return true;
}

bool test_sync_all_mirrors(TestContext& ctx) {
  MirrorFixture fx(ctx, "sync_all");
  auto german = fx.add_german();
  auto shows_id = fx.add_shows();
  fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.mirrors->add_mirror(german.id, shows_id, "");

  std::vector<double> progress;
  auto result = fx.mirrors->sync_all_mirrors(german.id, [&](double p){ progress.push_back(p); });
  POLYGLOT_CHECK(ctx, result.status == SyncAllResult::Status::Completed);
  POLYGLOT_CHECK(ctx, result.synced == 2 && result.total == 2 && result.failed == 0);
  POLYGLOT_CHECK(ctx, !progress.empty() && progress.back() == 100.0);

  CancellationToken cancel;
  cancel.cancel();
  result = fx.mirrors->sync_all_mirrors(german.id, nullptr, &cancel);
  POLYGLOT_CHECK(ctx, result.status == SyncAllResult::Status::Cancelled);
  POLYGLOT_CHECK(ctx, result.synced == 0);

  result = fx.mirrors->sync_all_mirrors("missing");
  POLYGLOT_CHECK(ctx, result.status == SyncAllResult::Status::AlternativeNotFound);
  return true;
}

bool test_library_listing_marks_mirrors(TestContext& ctx) {
  MirrorFixture fx(ctx, "library_listing");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  bool saw_source = false;
  bool saw_mirror = false;
  for(const auto& info : fx.mirrors->get_libraries()) {
    if(info.id == fx.movies_id) {
      saw_source = !info.is_mirror && !info.alternative_id;
    }
    if(info.id == *mirror.target_library_id) {
      saw_mirror = info.is_mirror && info.alternative_id == german.id && info.metadata_language == "de";
    }
  }
  POLYGLOT_CHECK(ctx, saw_source);
  POLYGLOT_CHECK(ctx, saw_mirror);
  return true;
}

} // namespace

std::vector<TestCase> mirror_service_tests() {
  return {
    {"create_alternative", test_create_alternative},
    {"add_mirror_links_media", test_add_mirror_links_media},
    {"add_mirror_rejections", test_add_mirror_rejections},
    {"sync_is_idempotent", test_sync_is_idempotent},
    {"sync_follows_source", test_sync_follows_source},
    {"sync_keeps_excluded_target_files", test_sync_keeps_excluded_target_files},
    {"sync_survives_progress_failures", test_sync_survives_progress_failures},
    {"sync_skips_failed_files", test_sync_skips_failed_files},
    {"create_failure_rolls_back", test_create_failure_rolls_back},
    {"delete_mirror", test_delete_mirror},
    {"delete_mirror_force", test_delete_mirror_requires_force_on_warnings},
    {"delete_alternative", test_delete_alternative},
    {"mirror_lock_serializes", test_mirror_lock_serializes},
    {"sync_missing_source", test_sync_missing_source},
    {"sync_all_mirrors", test_sync_all_mirrors},
    {"library_listing_marks_mirrors", test_library_listing_marks_mirrors},
  };
}

namespace {

Mirror ghost_mirror(const std::string& source_id, const std::string& target_path) {
  Mirror m;
  m.id = generate_id();
  m.source_library_id = source_id;
  m.source_library_name = "Shows";
  m.target_library_name = "Shows (German)";
  m.target_path = target_path;
  m.status = SyncStatus::Pending;
  return m;
}

bool test_orphan_source_deleted(TestContext& ctx) {
  MirrorFixture fx(ctx, "orphan_source");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.catalog->remove_library("Movies");

  auto result = fx.orphans->cleanup();
  POLYGLOT_CHECK(ctx, result.total_cleaned() == 1);
  POLYGLOT_CHECK(ctx, result.failed.empty());
  POLYGLOT_CHECK(ctx, result.sources_without_mirrors.empty());
  POLYGLOT_CHECK(ctx, !fx.store->get_mirror(mirror.id));
  POLYGLOT_CHECK(ctx, !library_named(*fx.catalog, "Movies (German)"));
  POLYGLOT_CHECK(ctx, !fs::exists(fx.german_movies()));
  return true;
}

bool test_orphan_mirror_library_deleted(TestContext& ctx) {
  MirrorFixture fx(ctx, "orphan_target");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.catalog->remove_library("Movies (German)");

  auto result = fx.orphans->cleanup();
  POLYGLOT_CHECK(ctx, result.total_cleaned() == 1);
  POLYGLOT_CHECK(ctx, result.sources_without_mirrors == std::vector<std::string>{fx.movies_id});
  POLYGLOT_CHECK(ctx, !fx.store->get_mirror(mirror.id));
  POLYGLOT_CHECK(ctx, !fs::exists(fx.german_movies()));
  POLYGLOT_CHECK(ctx, fs::exists(fx.movies_root / "Film (2020)/film.mkv"));
  return true;
}

bool test_orphan_ghosts(TestContext& ctx) {
  MirrorFixture fx(ctx, "orphan_ghost");
  auto german = fx.add_german();
  auto french = fx.add_french();
  auto shows_id = fx.add_shows();
  auto healthy = fx.mirrors->add_mirror(german.id, fx.movies_id, "");

  auto ghost = ghost_mirror(shows_id, (fx.workspace / "mirrors/german/shows").string());
  POLYGLOT_CHECK(ctx, fx.store->add_mirror(german.id, ghost));
  // A create that failed moments ago is not a ghost yet.
  auto recent = ghost_mirror(shows_id, (fx.workspace / "mirrors/french/shows").string());
  recent.status = SyncStatus::Error;
  recent.last_synced_at = Clock::now();
  POLYGLOT_CHECK(ctx, fx.store->add_mirror(french.id, recent));

  auto result = fx.orphans->cleanup();
  POLYGLOT_CHECK(ctx, result.total_cleaned() == 1);
  POLYGLOT_CHECK(ctx, !fx.store->get_mirror(ghost.id));
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(recent.id).has_value());
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(healthy.id).has_value());
  // The French record still mirrors Shows.
  POLYGLOT_CHECK(ctx, result.sources_without_mirrors.empty());

  fx.store->update_settings([](PluginSettings& s){
    s.ghost_threshold_minutes = 0;
    return true;
  });
  fx.store->update_mirror(recent.id, [](Mirror& m){ m.last_synced_at = Clock::now() - std::chrono::minutes(1); });
  result = fx.orphans->cleanup();
  POLYGLOT_CHECK(ctx, result.total_cleaned() == 1);
  POLYGLOT_CHECK(ctx, result.sources_without_mirrors == std::vector<std::string>{shows_id});
  return true;
}

bool test_orphan_cleanup_cancelled(TestContext& ctx) {
  MirrorFixture fx(ctx, "orphan_cancel");
  auto german = fx.add_german();
  auto mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
  fx.catalog->remove_library("Movies");

  CancellationToken cancel;
  cancel.cancel();
  auto result = fx.orphans->cleanup(&cancel);
  POLYGLOT_CHECK(ctx, result.total_cleaned() == 0);
  POLYGLOT_CHECK(ctx, fx.store->get_mirror(mirror.id).has_value());
  return true;
}

} // namespace

std::vector<TestCase> orphan_tests() {
  return {
    {"orphan_source_deleted", test_orphan_source_deleted},
    {"orphan_mirror_library_deleted", test_orphan_mirror_library_deleted},
    {"orphan_ghosts", test_orphan_ghosts},
    {"orphan_cleanup_cancelled", test_orphan_cleanup_cancelled},
  };
}

} // namespace polyglot::test
