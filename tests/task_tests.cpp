#include "polyglot_engine.hpp"
#include "scheduled_tasks.hpp"
#include "settings_manager.hpp"
#include "test_fixture.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <set>
#include <string>
#include <vector>

namespace polyglot::test {
namespace {

namespace fs = std::filesystem;

struct TaskWorld {
  TaskWorld(TestContext& ctx, const std::string& name)
    : fx(ctx, name),
      sync_task(fx.store, fx.mirrors, fx.orphans, fx.access, fx.logger),
      post_scan(fx.store, fx.mirrors, fx.logger),
      user_sync(fx.store, fx.access, fx.logger) {
    german = fx.add_german();
    mirror = fx.mirrors->add_mirror(german.id, fx.movies_id, "");
    alice = fx.catalog->add_user("alice");
    fx.users->assign_language(alice, german.id, "admin", true);
  }

  MirrorFixture fx;
  MirrorSyncTask sync_task;
  PostScanTask post_scan;
  UserLanguageSyncTask user_sync;
  Alternative german;
  Mirror mirror;
  std::string alice;
};

bool test_mirror_sync_task(TestContext& ctx) {
  TaskWorld w(ctx, "task_mirror_sync");
  write_file(w.fx.movies_root / "New (2021)/new.mkv", "new video");
  std::vector<double> progress;
  w.sync_task.run([&](double p){ progress.push_back(p); }, nullptr);
  POLYGLOT_CHECK(ctx, same_inode(w.fx.movies_root / "New (2021)/new.mkv",
                                 w.fx.german_movies() / "New (2021)/new.mkv"));
  POLYGLOT_CHECK(ctx, !progress.empty() && progress.back() == 100.0);
  POLYGLOT_CHECK(ctx, std::string(w.sync_task.name()) == "mirror-sync");
  return true;
}

bool test_mirror_sync_task_restores_sources(TestContext& ctx) {
  TaskWorld w(ctx, "task_restore_sources");
  // Someone deleted the mirror library on the host.
  w.fx.catalog->remove_library("Movies (German)");
  w.sync_task.run(nullptr, nullptr);

  POLYGLOT_CHECK(ctx, !w.fx.store->get_mirror(w.mirror.id));
  POLYGLOT_CHECK(ctx, !fs::exists(w.fx.german_movies()));
  POLYGLOT_CHECK(ctx, w.fx.folders_of(w.alice) == std::set<std::string>{w.fx.movies_id});
  return true;
}

bool test_mirror_sync_task_cancelled(TestContext& ctx) {
  TaskWorld w(ctx, "task_cancel");
  write_file(w.fx.movies_root / "New (2021)/new.mkv", "new video");
  CancellationToken cancel;
  cancel.cancel();
  POLYGLOT_CHECK_THROWS(ctx, w.sync_task.run(nullptr, &cancel), ErrorKind::Cancelled);
  POLYGLOT_CHECK(ctx, !fs::exists(w.fx.german_movies() / "New (2021)/new.mkv"));
  return true;
}

bool test_post_scan_task(TestContext& ctx) {
  TaskWorld w(ctx, "task_post_scan");
  write_file(w.fx.movies_root / "New (2021)/new.mkv", "new video");
  w.fx.store->update_settings([](PluginSettings& s){
    s.sync_mirrors_after_library_scan = false;
    return true;
  });
  w.post_scan.run(nullptr, nullptr);
  POLYGLOT_CHECK(ctx, !fs::exists(w.fx.german_movies() / "New (2021)/new.mkv"));

  w.fx.store->update_settings([](PluginSettings& s){
    s.sync_mirrors_after_library_scan = true;
    return true;
  });
  // An alternative without mirrors is skipped.
  w.fx.add_french();
  w.post_scan.run(nullptr, nullptr);
  POLYGLOT_CHECK(ctx, fs::exists(w.fx.german_movies() / "New (2021)/new.mkv"));
  return true;
}

bool test_user_language_sync_task(TestContext& ctx) {
  TaskWorld w(ctx, "task_user_sync");
  auto user = *w.fx.catalog->get_user(w.alice);
  user.enable_all_folders = true;
  w.fx.catalog->update_user(user);

  std::vector<double> progress;
  w.user_sync.run([&](double p){ progress.push_back(p); }, nullptr);
  POLYGLOT_CHECK(ctx, !w.fx.catalog->get_user(w.alice)->enable_all_folders);
  POLYGLOT_CHECK(ctx, w.fx.folders_of(w.alice) == std::set<std::string>{*w.mirror.target_library_id});
  POLYGLOT_CHECK(ctx, !progress.empty() && progress.back() == 100.0);

  CancellationToken cancel;
  cancel.cancel();
  POLYGLOT_CHECK_THROWS(ctx, w.user_sync.run(nullptr, &cancel), ErrorKind::Cancelled);
  return true;
}

bool test_engine_commands(TestContext& ctx) {
  TempWorkspace ws("engine");
  const auto movies = ws / "media/movies";
  write_file(movies / "Film (2020)/film.mkv", "video");
  write_file(movies / "Film (2020)/film.nfo", "<movie/>");

  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(ws / ".config/settings.json");
  PolyglotEngine::Options options;
  options.workspace_root = ws.root();
  PolyglotEngine engine(settings, options);
  ctx.logs.attach(engine, "engine");
  engine.start();
  engine.start_background();

  engine.catalog()->add_source_library("Movies", "movies", {movies.string()});
  engine.catalog()->add_user("alice");
  const auto base = ws / "mirrors/german";

  bool ok = engine.execute_command("alt-add German de-DE " + base.string());
  ok = ok && engine.execute_command("mirror-add German Movies " + (base / "movies").string());
  ok = ok && engine.execute_command("assign alice German");
  write_file(movies / "New (2021)/new.mkv", "new video");
  ok = ok && engine.execute_command("sync German");
  ok = ok && engine.execute_command("sync");
  ok = ok && engine.execute_command("users");
  ok = ok && engine.execute_command("settings mirror_sync_interval_hours 12");
  const bool rejected = !engine.execute_command("settings mirror_sync_interval_hours soon");
  const bool unknown = !engine.execute_command("bogus");
  const bool missing = !engine.execute_command("assign nobody German");

  const bool linked = fs::exists(base / "movies/New (2021)/new.mkv") &&
                      !fs::exists(base / "movies/Film (2020)/film.nfo");
  const bool interval = engine.store()->get_settings().mirror_sync_interval_hours == 12;
  const bool persisted = fs::exists(ws / "polyglot.json");
  const bool printed = ctx.logs.wait_for_substring("Mirror Movies (German) created", std::chrono::seconds(1));

  engine.stop();
  ctx.logs.detach_all();

  POLYGLOT_CHECK(ctx, ok);
  POLYGLOT_CHECK(ctx, rejected);
  POLYGLOT_CHECK(ctx, unknown);
  POLYGLOT_CHECK(ctx, missing);
  POLYGLOT_CHECK(ctx, linked);
  POLYGLOT_CHECK(ctx, interval);
  POLYGLOT_CHECK(ctx, persisted);
  POLYGLOT_CHECK(ctx, printed);
  return true;
}

bool test_engine_task_queue(TestContext& ctx) {
  TempWorkspace ws("engine_tasks");
  write_file(ws / "media/movies/film.mkv", "video");
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(ws / ".config/settings.json");
  PolyglotEngine::Options options;
  options.workspace_root = ws.root();
  PolyglotEngine engine(settings, options);

  const bool idle_refused = !engine.run_task_and_wait(PolyglotEngine::TaskKind::UserLanguageSync);
  engine.start();
  const bool user_sync = engine.run_task_and_wait(PolyglotEngine::TaskKind::UserLanguageSync);
  const bool post_scan = engine.run_task_and_wait(PolyglotEngine::TaskKind::PostScan);
  engine.cancel_tasks();
  engine.clear_cancellation();
  const bool after_cancel = engine.run_task_and_wait(PolyglotEngine::TaskKind::MirrorSync);
  engine.stop();

  POLYGLOT_CHECK(ctx, idle_refused);
  POLYGLOT_CHECK(ctx, user_sync);
  POLYGLOT_CHECK(ctx, post_scan);
  POLYGLOT_CHECK(ctx, after_cancel);
  POLYGLOT_CHECK(ctx, std::string(PolyglotEngine::task_kind_name(PolyglotEngine::TaskKind::PostScan)) == "post-scan");
  return true;
}

bool test_engine_stop_with_scheduler(TestContext& ctx) {
  TempWorkspace ws("engine_scheduler");
  write_file(ws / "media/movies/film.mkv", "video");
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(ws / ".config/settings.json");
  PolyglotEngine::Options options;
  options.workspace_root = ws.root();
  options.enable_scheduler = true;
  PolyglotEngine engine(settings, options);
  engine.start_background();
  engine.catalog()->add_source_library("Movies", "movies", {(ws / "media/movies").string()});

  const bool armed = engine.scheduler_running();
  auto pending = engine.run_task(PolyglotEngine::TaskKind::MirrorSync);
  engine.stop();
  const bool settled = pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  const bool disarmed = !engine.scheduler_running();
  const bool refused = !engine.run_task_and_wait(PolyglotEngine::TaskKind::MirrorSync);

  // A stopped engine starts again with a fresh pool.
  engine.start();
  const bool restarted = engine.run_task_and_wait(PolyglotEngine::TaskKind::UserLanguageSync);
  engine.stop();

  POLYGLOT_CHECK(ctx, armed);
  POLYGLOT_CHECK(ctx, settled);
  POLYGLOT_CHECK(ctx, disarmed);
  POLYGLOT_CHECK(ctx, refused);
  POLYGLOT_CHECK(ctx, restarted);
  return true;
}

} // namespace

std::vector<TestCase> task_tests() {
  return {
    {"task_mirror_sync", test_mirror_sync_task},
    {"task_mirror_sync_restores_sources", test_mirror_sync_task_restores_sources},
    {"task_mirror_sync_cancelled", test_mirror_sync_task_cancelled},
    {"task_post_scan", test_post_scan_task},
    {"task_user_language_sync", test_user_language_sync_task},
    {"engine_commands", test_engine_commands},
    {"engine_task_queue", test_engine_task_queue},
    {"engine_stop_with_scheduler", test_engine_stop_with_scheduler},
  };
}

} // namespace polyglot::test
