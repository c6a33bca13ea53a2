#pragma once

#include "configuration_store.hpp"
#include "host_catalog.hpp"
#include "library_access_service.hpp"
#include "mirror_service.hpp"
#include "orphan_reconciler.hpp"
#include "test_runner_utils.hpp"
#include "user_language_service.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace polyglot::test {

// Host library directory that can be told to fail removals.
class FlakyLibraries : public LibraryDirectory {
public:
  explicit FlakyLibraries(std::shared_ptr<HostCatalog> catalog) : catalog_(std::move(catalog)) {}

  std::vector<VirtualLibrary> list_libraries() const override { return catalog_->list_libraries(); }
  void add_library(const std::string& name,
                   const std::string& collection_type,
                   const LibraryOptions& options) override {
    catalog_->add_library(name, collection_type, options);
  }
  void add_media_path(const std::string& library_name, const std::string& path) override {
    catalog_->add_media_path(library_name, path);
  }
  void remove_library(const std::string& library_name) override {
    if(fail_remove) throw PolyglotError(ErrorKind::FatalIo, "host refused to remove " + library_name);
    catalog_->remove_library(library_name);
  }
  void queue_refresh(const std::string& library_id) override { catalog_->queue_refresh(library_id); }

  bool fail_remove = false;

private:
  std::shared_ptr<HostCatalog> catalog_;
};

// In-memory store and host catalog over a temp directory holding a
// "Movies" source library, wired the way the engine wires them.
struct MirrorFixture {
  MirrorFixture(TestContext& ctx, const std::string& name)
    : workspace(name),
      logger(ctx.logger),
      store(std::make_shared<ConfigurationStore>(std::filesystem::path{}, logger)),
      catalog(std::make_shared<HostCatalog>(std::filesystem::path{}, logger)),
      libraries(std::make_shared<FlakyLibraries>(catalog)),
      mirrors(std::make_shared<MirrorService>(store, libraries, logger)),
      orphans(std::make_shared<OrphanReconciler>(store, libraries, mirrors, logger)),
      access(std::make_shared<LibraryAccessService>(store, libraries, catalog, logger)),
      users(std::make_shared<UserLanguageService>(store, catalog, access, logger)) {
    movies_root = workspace / "media/movies";
    write_file(movies_root / "Film (2020)/film.mkv", "video");
    write_file(movies_root / "Film (2020)/film.en.srt", "subtitles");
    write_file(movies_root / "Film (2020)/film.nfo", "<movie/>");
    write_file(movies_root / "Film (2020)/poster.jpg", "poster");
    write_file(movies_root / "Film (2020)/extrafanart/fanart.jpg", "fanart");
    write_file(movies_root / "Film (2020)/.trickplay/320/0.jpg", "tile");
    movies_id = catalog->add_source_library("Movies", "movies", {movies_root.string()});
  }

  std::string add_shows() {
    shows_root = workspace / "media/shows";
    write_file(shows_root / "Show/Season 1/s01e01.mkv", "episode");
    return catalog->add_source_library("Shows", "tvshows", {shows_root.string()});
  }

  Alternative add_german() {
    return mirrors->create_alternative("German", "de-DE", (workspace / "mirrors/german").string());
  }

  Alternative add_french() {
    return mirrors->create_alternative("French", "fr", (workspace / "mirrors/french").string());
  }

  std::filesystem::path german_movies() const { return workspace / "mirrors/german/movies"; }

  std::set<std::string> folders_of(const std::string& user_id) const {
    auto user = catalog->get_user(user_id);
    if(!user) return {};
    return std::set<std::string>(user->enabled_folders.begin(), user->enabled_folders.end());
  }

  TempWorkspace workspace;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<ConfigurationStore> store;
  std::shared_ptr<HostCatalog> catalog;
  std::shared_ptr<FlakyLibraries> libraries;
  std::shared_ptr<MirrorService> mirrors;
  std::shared_ptr<OrphanReconciler> orphans;
  std::shared_ptr<LibraryAccessService> access;
  std::shared_ptr<UserLanguageService> users;
  std::filesystem::path movies_root;
  std::filesystem::path shows_root;
  std::string movies_id;
};

} // namespace polyglot::test
