#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "polyglot_engine.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace polyglot::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("polyglot_test_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& relative) const { return root_ / relative; }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content = "data") {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::optional<nlink_t> link_count(const std::filesystem::path& path) {
  struct stat st{};
  if(::stat(path.c_str(), &st) != 0) return std::nullopt;
  return st.st_nlink;
}

inline bool same_inode(const std::filesystem::path& a, const std::filesystem::path& b) {
  struct stat sa{};
  struct stat sb{};
  if(::stat(a.c_str(), &sa) != 0 || ::stat(b.c_str(), &sb) != 0) return false;
  return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(PolyglotEngine& engine, const std::string& label = std::string()) {
    auto handle = engine.add_log_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &engine, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.engine && attachment.handle != 0) {
        attachment.engine->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    PolyglotEngine* engine = nullptr;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

struct TestContext {
  LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Evaluates a condition; on failure records where, so the runner can dump it.
#define POLYGLOT_CHECK(ctx, cond)                                                   \
  do {                                                                              \
    if(!(cond)) {                                                                   \
      (ctx).logger->error("check failed at {}:{}: {}", __FILE__, __LINE__, #cond);  \
      return false;                                                                 \
    }                                                                               \
  } while(0)

// Runs stmt and expects a PolyglotError of the given kind.
#define POLYGLOT_CHECK_THROWS(ctx, stmt, expected_kind)                             \
  do {                                                                              \
    bool polyglot_threw_ = false;                                                   \
    try {                                                                           \
      stmt;                                                                         \
    } catch(const PolyglotError& polyglot_e_) {                                     \
      polyglot_threw_ = polyglot_e_.kind() == (expected_kind);                      \
      if(!polyglot_threw_) {                                                        \
        (ctx).logger->error("unexpected error kind {}: {}",                         \
                            error_kind_name(polyglot_e_.kind()), polyglot_e_.what()); \
      }                                                                             \
    }                                                                               \
    if(!polyglot_threw_) {                                                          \
      (ctx).logger->error("expected {} at {}:{}: {}", error_kind_name(expected_kind), \
                          __FILE__, __LINE__, #stmt);                               \
      return false;                                                                 \
    }                                                                               \
  } while(0)

using SuiteFactory = std::vector<TestCase> (*)();

std::vector<TestCase> classifier_tests();
std::vector<TestCase> filesystem_tests();
std::vector<TestCase> configuration_store_tests();
std::vector<TestCase> mirror_service_tests();
std::vector<TestCase> orphan_tests();
std::vector<TestCase> access_tests();
std::vector<TestCase> user_language_tests();
std::vector<TestCase> task_tests();

} // namespace polyglot::test
