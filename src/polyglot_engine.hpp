#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "cancellation.hpp"
#include "log.hpp"

class ConfigurationStore;
class HostCatalog;
class LibraryAccessService;
class MirrorService;
class OrphanReconciler;
class PolyglotCLI;
class ScheduledTask;
class SettingsManager;
class UserLanguageService;

// Wires the store, the host catalog and the services together, runs
// scheduled tasks on a worker pool and timers on an io_context thread.
class PolyglotEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool start_cli_thread = false;
    bool enable_scheduler = false;
    bool startup_reconciliation = true;
  };

  enum class TaskKind { MirrorSync, PostScan, UserLanguageSync };

  PolyglotEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~PolyglotEngine();

  void start();
  void run();
  void start_background();
  // Asks run() to return. Safe from any thread, including the CLI's.
  void request_stop();
  void stop();

  // Returns false when the command failed or was not understood.
  bool execute_command(const std::string& line);

  // Arms the interval sync and daily user timers. Idempotent.
  void start_scheduler();
  bool scheduler_running() const;

  // Queues a task on the worker pool. The future is false when the task
  // failed, was cancelled or was already running.
  std::future<bool> run_task(TaskKind kind);
  bool run_task_and_wait(TaskKind kind);
  void cancel_tasks();
  // Token shared by tasks and CLI commands. clear_cancellation() re-arms
  // it once nothing is running.
  const CancellationToken* cancellation() const { return &cancel_; }
  void clear_cancellation();

  // Host events.
  void notify_library_scan_completed();
  void notify_user_created(const std::string& user_id);
  void notify_user_updated(const std::string& user_id);
  void notify_user_deleted(const std::string& user_id);

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<ConfigurationStore> store() const { return store_; }
  std::shared_ptr<HostCatalog> catalog() const { return catalog_; }
  std::shared_ptr<MirrorService> mirrors() const { return mirrors_; }
  std::shared_ptr<OrphanReconciler> orphans() const { return orphans_; }
  std::shared_ptr<LibraryAccessService> access() const { return access_; }
  std::shared_ptr<UserLanguageService> user_languages() const { return user_languages_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  static const char* task_kind_name(TaskKind kind);

private:
  void ensure_workspace() const;
  void build_services();
  void start_cli();
  void arm_signals();
  void schedule_mirror_sync();
  void schedule_user_reconciliation();
  std::chrono::seconds until_next_daily_run() const;
  std::shared_ptr<ScheduledTask> task_for(TaskKind kind) const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<HostCatalog> catalog_;
  std::shared_ptr<MirrorService> mirrors_;
  std::shared_ptr<OrphanReconciler> orphans_;
  std::shared_ptr<LibraryAccessService> access_;
  std::shared_ptr<UserLanguageService> user_languages_;
  std::shared_ptr<ScheduledTask> mirror_sync_task_;
  std::shared_ptr<ScheduledTask> post_scan_task_;
  std::shared_ptr<ScheduledTask> user_sync_task_;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<asio::thread_pool> pool_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<asio::steady_timer> sync_timer_;
  std::unique_ptr<asio::steady_timer> user_timer_;
  std::unique_ptr<PolyglotCLI> cli_;
  CancellationToken cancel_;

  mutable std::mutex tasks_mutex_;
  std::set<TaskKind> running_tasks_;
  std::atomic<bool> started_{false};
  bool scheduler_running_ = false;
  std::atomic<bool> cli_thread_running_{false};
};
