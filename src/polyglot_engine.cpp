#include "polyglot_engine.hpp"

#include <csignal>
#include <ctime>
#include <optional>
#include <stdexcept>

#include "configuration_store.hpp"
#include "errors.hpp"
#include "host_catalog.hpp"
#include "library_access_service.hpp"
#include "mirror_service.hpp"
#include "orphan_reconciler.hpp"
#include "polyglot_cli.hpp"
#include "scheduled_tasks.hpp"
#include "settings_manager.hpp"
#include "user_language_service.hpp"
#include "utils.hpp"

PolyglotEngine::PolyglotEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("polyglot")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

PolyglotEngine::~PolyglotEngine() {
  stop();
}

const char* PolyglotEngine::task_kind_name(TaskKind kind) {
  switch(kind) {
    case TaskKind::MirrorSync: return "mirror-sync";
    case TaskKind::PostScan: return "post-scan";
    case TaskKind::UserLanguageSync: return "user-language-sync";
  }
  return "unknown";
}

void PolyglotEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw PolyglotError(ErrorKind::FatalIo,
                        "Unable to create workspace " + options_.workspace_root.string() + ": " + ec.message());
  }
}

void PolyglotEngine::build_services() {
  const auto config_path = settings_->resolve_path("config_path", options_.workspace_root);
  const auto catalog_path = settings_->resolve_path("catalog_path", options_.workspace_root);

  store_ = std::make_shared<ConfigurationStore>(config_path, logger_);
  if(!store_->load()) {
    logger_->error("Configuration {} is unreadable, changes are refused until it is repaired",
                   config_path.string());
  }
  catalog_ = std::make_shared<HostCatalog>(catalog_path, logger_);
  if(!catalog_->load()) {
    throw PolyglotError(ErrorKind::FatalIo, "Unable to load host catalog " + catalog_path.string());
  }

  mirrors_ = std::make_shared<MirrorService>(store_, catalog_, logger_);
  orphans_ = std::make_shared<OrphanReconciler>(store_, catalog_, mirrors_, logger_);
  access_ = std::make_shared<LibraryAccessService>(store_, catalog_, catalog_, logger_);
  user_languages_ = std::make_shared<UserLanguageService>(store_, catalog_, access_, logger_);

  mirror_sync_task_ = std::make_shared<MirrorSyncTask>(store_, mirrors_, orphans_, access_, logger_);
  post_scan_task_ = std::make_shared<PostScanTask>(store_, mirrors_, logger_);
  user_sync_task_ = std::make_shared<UserLanguageSyncTask>(store_, access_, logger_);
}

void PolyglotEngine::start() {
  if(started_.exchange(true)) return;

  ensure_workspace();

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.log_file = settings_->resolve_path("log_file", options_.workspace_root).string();
  init(log_options);

  build_services();

  const int workers = settings_->get<int>("worker_threads");
  pool_ = std::make_unique<asio::thread_pool>(static_cast<std::size_t>(workers > 0 ? workers : 1));
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());

  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  arm_signals();

  if(options_.startup_reconciliation) {
    try {
      int changed = access_->reconcile_all_users(&cancel_);
      logger_->info("Startup reconciliation corrected {} user(s)", changed);
    } catch(const std::exception& e) {
      logger_->warn("Startup reconciliation failed: {}", e.what());
    }
  }

  cli_ = std::make_unique<PolyglotCLI>(*this, logger_);
  if(options_.start_cli_thread) {
    start_cli();
  }
  if(options_.enable_scheduler && settings_->get<bool>("enable_scheduler")) {
    start_scheduler();
  }
}

// In the interactive shell a signal only cancels what is running; the
// shell itself exits on 'quit' or end of input.
void PolyglotEngine::arm_signals() {
  if(!signals_) return;
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    cancel_tasks();
    if(cli_thread_running_) {
      logger_->info("Signal {} received, running work cancelled (type 'quit' to exit)", signal_number);
      arm_signals();
      return;
    }
    logger_->info("Signal {} received, stopping", signal_number);
    request_stop();
  });
}

void PolyglotEngine::run() {
  if(!started_) start();
  io_.run();
}

void PolyglotEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void PolyglotEngine::request_stop() {
  asio::post(io_, [this](){
    if(work_) work_->reset();
    io_.stop();
  });
}

void PolyglotEngine::stop() {
  if(!started_.exchange(false)) return;

  cancel_.cancel();
  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }

  if(work_) work_->reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(pool_) {
    pool_->join();
  }
  std::error_code ec;
  if(sync_timer_) sync_timer_->cancel(ec);
  if(user_timer_) user_timer_->cancel(ec);
  if(signals_) signals_->cancel(ec);
  sync_timer_.reset();
  user_timer_.reset();
  signals_.reset();
  pool_.reset();
  work_.reset();
  io_.restart();
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    scheduler_running_ = false;
    running_tasks_.clear();
  }
  cli_.reset();
  cancel_.reset();
}

bool PolyglotEngine::execute_command(const std::string& line) {
  if(!cli_) return false;
  return cli_->execute_command(line);
}

void PolyglotEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->start([this](){ request_stop(); });
  cli_thread_running_ = true;
}

bool PolyglotEngine::scheduler_running() const {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  return scheduler_running_;
}

void PolyglotEngine::start_scheduler() {
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if(!started_ || scheduler_running_) return;
    scheduler_running_ = true;
  }
  asio::post(io_, [this](){
    sync_timer_ = std::make_unique<asio::steady_timer>(io_);
    user_timer_ = std::make_unique<asio::steady_timer>(io_);
    schedule_mirror_sync();
    schedule_user_reconciliation();
  });
  logger_->info("Scheduler started");
}

void PolyglotEngine::schedule_mirror_sync() {
  if(!sync_timer_) return;
  const int hours = store_->get_settings().mirror_sync_interval_hours;
  if(hours <= 0) {
    logger_->info("Periodic mirror sync disabled (interval {}h)", hours);
    return;
  }
  sync_timer_->expires_after(std::chrono::hours(hours));
  sync_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    run_task(TaskKind::MirrorSync);
    schedule_mirror_sync();
  });
  logger_->debug("Next mirror sync in {}h", hours);
}

std::chrono::seconds PolyglotEngine::until_next_daily_run() const {
  const auto configured = store_->get_settings().user_reconciliation_time;
  auto minutes = parse_time_of_day(configured);
  if(!minutes) {
    logger_->warn("Invalid user_reconciliation_time '{}', using 03:00", configured);
    minutes = 3 * 60;
  }
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  local.tm_hour = *minutes / 60;
  local.tm_min = *minutes % 60;
  local.tm_sec = 0;
  std::time_t next = std::mktime(&local);
  if(next <= now) {
    local.tm_mday += 1;
    next = std::mktime(&local);
  }
  return std::chrono::seconds(next - now);
}

void PolyglotEngine::schedule_user_reconciliation() {
  if(!user_timer_) return;
  const auto delay = until_next_daily_run();
  user_timer_->expires_after(delay);
  user_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    run_task(TaskKind::UserLanguageSync);
    schedule_user_reconciliation();
  });
  logger_->debug("Next user reconciliation in {}s", delay.count());
}

std::shared_ptr<ScheduledTask> PolyglotEngine::task_for(TaskKind kind) const {
  switch(kind) {
    case TaskKind::MirrorSync: return mirror_sync_task_;
    case TaskKind::PostScan: return post_scan_task_;
    case TaskKind::UserLanguageSync: return user_sync_task_;
  }
  return nullptr;
}

std::future<bool> PolyglotEngine::run_task(TaskKind kind) {
  auto promise = std::make_shared<std::promise<bool>>();
  auto future = promise->get_future();
  auto task = task_for(kind);
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if(!started_ || !pool_ || !task) {
      promise->set_value(false);
      return future;
    }
    if(running_tasks_.empty()) cancel_.reset();
    if(!running_tasks_.insert(kind).second) {
      logger_->info("Task {} is already running", task_kind_name(kind));
      promise->set_value(false);
      return future;
    }
  }

  asio::post(*pool_, [this, kind, task, promise](){
    bool ok = false;
    int last_decile = -1;
    auto progress = [this, &last_decile, kind](double percent){
      int decile = static_cast<int>(percent / 10.0);
      if(decile == last_decile) return;
      last_decile = decile;
      logger_->debug("{}: {:.0f}%", task_kind_name(kind), percent);
    };
    try {
      task->run(progress, &cancel_);
      ok = true;
    } catch(const PolyglotError& e) {
      if(e.kind() == ErrorKind::Cancelled) {
        logger_->info("Task {} cancelled", task_kind_name(kind));
      } else {
        logger_->error("Task {} failed: {}", task_kind_name(kind), e.what());
      }
    } catch(const std::exception& e) {
      logger_->error("Task {} failed: {}", task_kind_name(kind), e.what());
    }
    {
      std::lock_guard<std::mutex> lock(tasks_mutex_);
      running_tasks_.erase(kind);
    }
    promise->set_value(ok);
  });
  return future;
}

bool PolyglotEngine::run_task_and_wait(TaskKind kind) {
  return run_task(kind).get();
}

void PolyglotEngine::cancel_tasks() {
  cancel_.cancel();
}

void PolyglotEngine::clear_cancellation() {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  if(running_tasks_.empty()) cancel_.reset();
}

void PolyglotEngine::notify_library_scan_completed() {
  run_task(TaskKind::PostScan);
}

void PolyglotEngine::notify_user_created(const std::string& user_id) {
  if(user_languages_) user_languages_->on_user_created(user_id);
}

void PolyglotEngine::notify_user_updated(const std::string& user_id) {
  if(user_languages_) user_languages_->on_user_updated(user_id);
}

void PolyglotEngine::notify_user_deleted(const std::string& user_id) {
  if(user_languages_) user_languages_->remove_user(user_id);
}

LogListenerHandle PolyglotEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void PolyglotEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void PolyglotEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}
