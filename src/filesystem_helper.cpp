#include "filesystem_helper.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace {

fs::path normalized(const fs::path& p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  if(ec) abs = p;
  auto out = abs.lexically_normal();
  if(!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
    out = out.parent_path();
  }
  return out;
}

fs::path nearest_existing(const fs::path& p) {
  auto current = normalized(p);
  std::error_code ec;
  while(!current.empty()) {
    if(fs::exists(current, ec)) return current;
    if(current == current.root_path()) break;
    current = current.parent_path();
  }
  return {};
}

bool device_of(const fs::path& p, dev_t& dev) {
  struct stat st{};
  if(::stat(p.c_str(), &st) != 0) return false;
  dev = st.st_dev;
  return true;
}

} // namespace

bool create_hard_link(const fs::path& source, const fs::path& link_path, std::string& error) {
  error.clear();
  std::error_code ec;
  if(!fs::is_regular_file(source, ec)) {
    error = "source file does not exist: " + source.string();
    return false;
  }
  if(link_path.has_parent_path()) {
    fs::create_directories(link_path.parent_path(), ec);
    if(ec) {
      error = "cannot create " + link_path.parent_path().string() + ": " + ec.message();
      return false;
    }
  }
  if(fs::exists(fs::symlink_status(link_path, ec))) {
    fs::remove(link_path, ec);
    if(ec) {
      error = "cannot replace " + link_path.string() + ": " + ec.message();
      return false;
    }
  }
  if(::link(source.c_str(), link_path.c_str()) != 0) {
    error = "link() failed for " + link_path.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

bool are_on_same_filesystem(const fs::path& a, const fs::path& b) {
  if(a.empty() || b.empty()) return false;
  auto existing_a = nearest_existing(a);
  auto existing_b = nearest_existing(b);
  if(existing_a.empty() || existing_b.empty()) return false;
  dev_t dev_a{};
  dev_t dev_b{};
  if(!device_of(existing_a, dev_a) || !device_of(existing_b, dev_b)) return false;
  return dev_a == dev_b;
}

bool is_same_or_nested(const fs::path& inner, const fs::path& outer) {
  auto in = normalized(inner);
  auto out = normalized(outer);
  auto it_in = in.begin();
  for(auto it_out = out.begin(); it_out != out.end(); ++it_out, ++it_in) {
    if(it_in == in.end() || *it_in != *it_out) return false;
  }
  return true;
}

bool is_path_safe(const fs::path& path, const fs::path& base) {
  if(path.empty() || base.empty()) return false;
  return is_same_or_nested(path, base);
}

bool has_parent_traversal(const fs::path& path) {
  for(const auto& part : path) {
    if(part == "..") return true;
  }
  return false;
}

bool is_directory_empty(const fs::path& dir) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) return false;
  return it == fs::directory_iterator();
}

void cleanup_empty_directories(const fs::path& dir, const fs::path& base) {
  if(dir.empty() || base.empty()) return;
  auto stop = normalized(base);
  auto current = normalized(dir);
  std::error_code ec;
  while(current != stop && is_same_or_nested(current, stop)) {
    if(!fs::is_directory(current, ec) || !is_directory_empty(current)) break;
    fs::remove(current, ec);
    if(ec) break;
    current = current.parent_path();
  }
}

ValidationResult validate_mirror_paths(const std::vector<std::string>& source_paths,
                                       const std::string& target_path) {
  if(source_paths.empty()) {
    return ValidationResult::fail("Source library has no paths configured");
  }
  if(target_path.empty()) {
    return ValidationResult::fail("Target path is required");
  }
  fs::path target(target_path);
  if(!target.is_absolute()) {
    return ValidationResult::fail("Target path must be absolute: " + target_path);
  }
  if(has_parent_traversal(target)) {
    return ValidationResult::fail("Target path must not contain '..': " + target_path);
  }
  for(const auto& source : source_paths) {
    if(is_same_or_nested(target, source)) {
      return ValidationResult::fail("Target path " + target_path + " is inside source path " + source);
    }
    if(is_same_or_nested(source, target)) {
      return ValidationResult::fail("Source path " + source + " is inside target path " + target_path);
    }
    if(!are_on_same_filesystem(source, target)) {
      return ValidationResult::fail("Target path " + target_path +
                                    " is not on the same filesystem as " + source +
                                    "; hardlinks require a single volume");
    }
  }
  std::error_code ec;
  if(fs::exists(target, ec)) {
    if(!fs::is_directory(target, ec)) {
      return ValidationResult::fail("Target path exists and is not a directory: " + target_path);
    }
    if(!is_directory_empty(target)) {
      return ValidationResult::fail("Target directory is not empty: " + target_path);
    }
  }
  return ValidationResult::ok();
}
