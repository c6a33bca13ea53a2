#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

struct PluginSettings;

// Decides which library files get hardlinked into a mirror. Metadata and
// artwork are language specific and stay out; media and subtitles go in.
// All names compare case-insensitively.
class FileClassifier {
public:
  FileClassifier();
  FileClassifier(const std::vector<std::string>& excluded_extensions,
                 const std::vector<std::string>& excluded_directories,
                 const std::vector<std::string>& included_directories);

  static FileClassifier from_settings(const PluginSettings& settings);

  // Paths are normally relative to the library root so that directories
  // above the root never take part in the decision.
  bool should_hardlink(const std::filesystem::path& file) const;
  bool should_exclude_directory(const std::filesystem::path& dir) const;
  bool is_included_directory(const std::filesystem::path& dir) const;

private:
  using NameSet = std::unordered_set<std::string>;

  static NameSet lowered(const std::vector<std::string>& names);
  static std::string leaf_name(const std::filesystem::path& p);
  static bool any_ancestor_in(const std::filesystem::path& file, const NameSet& names);

  NameSet excluded_extensions_;
  NameSet excluded_directories_;
  NameSet included_directories_;
};
