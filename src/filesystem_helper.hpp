#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "errors.hpp"

// Replaces any existing file at link_path. Parent directories are created.
bool create_hard_link(const std::filesystem::path& source,
                      const std::filesystem::path& link_path,
                      std::string& error);

// Compares device ids of the nearest existing ancestor of each path.
bool are_on_same_filesystem(const std::filesystem::path& a, const std::filesystem::path& b);

// True when path resolves to base or somewhere below it.
bool is_path_safe(const std::filesystem::path& path, const std::filesystem::path& base);
bool has_parent_traversal(const std::filesystem::path& path);
bool is_same_or_nested(const std::filesystem::path& inner, const std::filesystem::path& outer);

bool is_directory_empty(const std::filesystem::path& dir);

// Removes dir and then each empty parent, stopping at (and keeping) base.
void cleanup_empty_directories(const std::filesystem::path& dir, const std::filesystem::path& base);

// Path checks applied before a mirror is accepted.
ValidationResult validate_mirror_paths(const std::vector<std::string>& source_paths,
                                       const std::string& target_path);
