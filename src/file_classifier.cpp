#include "file_classifier.hpp"

#include "models.hpp"
#include "utils.hpp"

FileClassifier::FileClassifier()
  : FileClassifier(PluginSettings{}.excluded_extensions,
                   PluginSettings{}.excluded_directories,
                   PluginSettings{}.included_directories) {}

FileClassifier::FileClassifier(const std::vector<std::string>& excluded_extensions,
                               const std::vector<std::string>& excluded_directories,
                               const std::vector<std::string>& included_directories)
  : excluded_extensions_(lowered(excluded_extensions)),
    excluded_directories_(lowered(excluded_directories)),
    included_directories_(lowered(included_directories)) {}

FileClassifier FileClassifier::from_settings(const PluginSettings& settings) {
  return FileClassifier(settings.excluded_extensions,
                        settings.excluded_directories,
                        settings.included_directories);
}

FileClassifier::NameSet FileClassifier::lowered(const std::vector<std::string>& names) {
  NameSet out;
  for(const auto& name : names) {
    auto clean = to_lower(trim_copy(name));
    if(!clean.empty()) out.insert(std::move(clean));
  }
  return out;
}

std::string FileClassifier::leaf_name(const std::filesystem::path& p) {
  auto name = p.filename();
  if(name.empty()) name = p.parent_path().filename(); // trailing separator
  return to_lower(name.string());
}

bool FileClassifier::any_ancestor_in(const std::filesystem::path& file, const NameSet& names) {
  if(names.empty()) return false;
  auto dir = file.parent_path();
  for(const auto& part : dir) {
    auto name = to_lower(part.string());
    if(names.count(name)) return true;
  }
  return false;
}

bool FileClassifier::should_hardlink(const std::filesystem::path& file) const {
  if(file.empty()) return false;
  if(any_ancestor_in(file, excluded_directories_)) return false;
  if(any_ancestor_in(file, included_directories_)) return true;
  auto ext = to_lower(file.extension().string());
  return excluded_extensions_.count(ext) == 0;
}

bool FileClassifier::should_exclude_directory(const std::filesystem::path& dir) const {
  if(dir.empty()) return false;
  return excluded_directories_.count(leaf_name(dir)) > 0;
}

bool FileClassifier::is_included_directory(const std::filesystem::path& dir) const {
  if(dir.empty()) return false;
  return included_directories_.count(leaf_name(dir)) > 0;
}
