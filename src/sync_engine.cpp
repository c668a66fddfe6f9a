#include "sync_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "concurrency_controller.hpp"
#include "directory_scanner.hpp"
#include "errors.hpp"
#include "event_broadcaster.hpp"
#include "event_sink.hpp"
#include "job_catalog.hpp"
#include "libssh2_session.hpp"
#include "process_runner.hpp"
#include "settings_manager.hpp"
#include "state_recovery_service.hpp"
#include "transfer_executor.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"
#include "transfer_store.hpp"

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(make_component_logger("engine")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SyncEngine::~SyncEngine() {
  stop();
}

void SyncEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / ".warpsync", ec);
}

std::filesystem::path SyncEngine::resolve(const std::string& path) const {
  std::filesystem::path p(path);
  if(p.is_absolute()) return p;
  return options_.workspace_root / p;
}

SchedulerConfig SyncEngine::scheduler_config() const {
  SchedulerConfig config;
  config.check_interval = settings_->get_millis("scheduler_check_interval_ms");
  config.max_concurrent_scans = settings_->get<int>("scheduler_max_concurrent_scans");
  config.scan_timeout = settings_->get_millis("scheduler_scan_timeout_ms");
  config.error_retry_delay = settings_->get_millis("scheduler_error_retry_delay_ms");
  config.max_error_count = settings_->get<int>("scheduler_max_error_count");
  config.health_check_interval = settings_->get_millis("scheduler_health_check_interval_ms");
  return config;
}

void SyncEngine::start() {
  if(started_) return;

  LogConfig log_config;
  const auto level_name = settings_->get<std::string>("log_level");
  const auto level = parse_log_level(level_name);
  log_config.level = level.value_or(spdlog::level::info);
  if(settings_->get<bool>("verbose")) log_config.level = std::min(log_config.level, spdlog::level::debug);
  log_config.file = settings_->get<std::string>("log_file");
  log_config.component_levels = settings_->get<std::string>("log_components");
  std::string log_err;
  if(!init_logging(log_config, log_err)) {
    logger_->warn("Logging configuration: {}", log_err);
  }
  if(!level) logger_->warn("Unknown log_level '{}', using info", level_name);

  // Invalid scheduler settings are fatal before anything is opened.
  const SchedulerConfig sched_config = scheduler_config();
  sched_config.validate();

  ensure_workspace();

  const auto db_path = resolve(settings_->get<std::string>("database_path"));
  std::error_code ec;
  std::filesystem::create_directories(db_path.parent_path(), ec);
  store_ = std::make_shared<TransferStore>(db_path.string());
  std::string err;
  if(!store_->open(err)) {
    logger_->error("Cannot open transfer store {}: {}", db_path.string(), err);
    throw ConsistencyError("cannot open transfer store: " + err);
  }

  auto fanout = std::make_shared<FanoutEventSink>();
  fanout->add(std::make_shared<LogEventSink>(make_component_logger("events")));
  const int event_port = settings_->get<int>("event_port");
  if(event_port >= 0) {
    const auto listen_ip = settings_->get<std::string>("event_listen_ip");
    broadcaster_ = std::make_shared<EventBroadcaster>(io_, make_component_logger("events"));
    if(!broadcaster_->listen(listen_ip, static_cast<unsigned short>(event_port), err)) {
      logger_->error("Cannot listen for event subscribers on {}:{}: {}", listen_ip, event_port, err);
      throw ConnectionError("cannot open event stream: " + err);
    }
    event_port_ = broadcaster_->port();
    fanout->add(broadcaster_);
    logger_->info("Event stream listening on {}:{}", listen_ip, event_port_);
  }
  state_ = std::make_shared<TransferStateManager>(store_, fanout);

  if(options_.catalog) {
    catalog_ = options_.catalog;
  } else {
    auto json_catalog = std::make_shared<JsonJobCatalog>(resolve(settings_->get<std::string>("jobs_file")));
    if(!json_catalog->load(err)) {
      logger_->warn("No jobs loaded: {}", err);
    }
    catalog_ = json_catalog;
  }

  JobConcurrencyController::Options controller_options;
  controller_options.default_limit = settings_->get<int>("per_job_max_concurrency");
  controller_options.limit_cache_ttl = std::chrono::seconds(settings_->get<int>("limit_cache_ttl_seconds"));
  auto catalog = catalog_;
  controller_ = std::make_shared<JobConcurrencyController>(controller_options,
    [catalog](const std::string& job_id) -> std::optional<int> {
      auto job = catalog->get_job(job_id);
      if(!job) return std::nullopt;
      return job->max_concurrent_transfers;
    });

  TransferQueue::Options queue_options;
  queue_options.max_queue_size = static_cast<std::size_t>(settings_->get<int>("max_queue_size"));
  queue_options.max_concurrent_transfers = static_cast<std::size_t>(settings_->get<int>("max_concurrent_transfers"));
  queue_options.default_max_retries = settings_->get<int>("default_max_retries");
  queue_ = std::make_shared<TransferQueue>(io_, state_, controller_, queue_options);

  ProcessRunner::Options runner_options;
  runner_options.rsync_binary = settings_->get<std::string>("rsync_binary");
  runner_options.progress_interval = settings_->get_millis("progress_interval_ms");
  runner_options.cancel_grace = settings_->get_millis("cancel_grace_ms");
  runner_options.ssh_connect_timeout_seconds = std::max(1, settings_->get<int>("ssh_connect_timeout_ms") / 1000);
  runner_ = std::make_shared<ProcessRunner>(runner_options);

  std::shared_ptr<SshSessionFactory> factory = options_.session_factory;
  if(!factory) {
    factory = std::make_shared<Libssh2SessionFactory>(settings_->get<std::string>("ssh_known_hosts"));
  }
  SshConnectionPool::Options pool_options;
  pool_options.min_per_target = static_cast<std::size_t>(settings_->get<int>("ssh_pool_min_per_target"));
  pool_options.max_per_target = static_cast<std::size_t>(settings_->get<int>("ssh_pool_max_per_target"));
  pool_options.connect_timeout = settings_->get_millis("ssh_connect_timeout_ms");
  pool_options.acquire_timeout = settings_->get_millis("ssh_acquire_timeout_ms");
  pool_options.max_idle = settings_->get_millis("ssh_max_idle_ms");
  pool_options.connection_ttl = settings_->get_millis("ssh_connection_ttl_ms");
  pool_ = std::make_shared<SshConnectionPool>(factory, pool_options);
  apply_connection_bounds();

  executor_ = std::make_shared<TransferExecutor>(state_, queue_, pool_, runner_,
                                                 queue_options.max_concurrent_transfers);
  executor_->attach();

  StateRecoveryService::Options recovery_options;
  recovery_options.stuck_threshold = std::chrono::minutes(settings_->get<int>("stuck_threshold_minutes"));
  recovery_options.retention = std::chrono::hours(settings_->get<int>("transfer_retention_hours"));
  recovery_ = std::make_shared<StateRecoveryService>(state_, queue_, controller_, runner_, recovery_options);

  const auto scanner_command = settings_->get<std::string>("scanner_command");
  scanner_ = options_.scanner;
  if(!scanner_) {
    scanner_ = std::make_shared<CommandDirectoryScanner>(scanner_command, runner_);
  }
  scheduler_ = std::make_shared<JobScheduler>(io_, sched_config, catalog_, scanner_, queue_, recovery_);
  auto pool = pool_;
  auto queue = queue_;
  scheduler_->set_health_sources(JobScheduler::HealthSources{
    [pool]() { return pool->get_pool_stats().total; },
    [queue]() { return queue->depth(); }
  });

  started_ = true;
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
    asio::make_work_guard(io_));

  // Pick up where the previous process stopped before new work arrives.
  const std::size_t rehydrated = queue_->rehydrate();
  if(rehydrated > 0) logger_->info("Re-queued {} transfers from the ledger", rehydrated);
  recovery_->perform_system_recovery();

  sweep_interval_ = settings_->get_millis("ssh_pool_sweep_ms");
  recovery_interval_ = settings_->get_millis("recovery_interval_ms");
  if(options_.enable_timers) {
    maintenance_ = std::make_unique<asio::thread_pool>(1);
    sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
    recovery_timer_ = std::make_unique<asio::steady_timer>(io_);
    schedule_pool_sweep();
    schedule_recovery();
  }

  if(options_.enable_scheduler) {
    if(scanner_command.empty() && !options_.scanner) {
      logger_->info("No scanner command configured; scheduled scans are off");
    } else {
      scheduler_->start();
      scheduler_started_ = true;
    }
  }

  logger_->info("Engine started: {} concurrent transfers, queue limit {}, store {}",
                queue_options.max_concurrent_transfers, queue_options.max_queue_size, db_path.string());
}

void SyncEngine::run() {
  if(!started_) start();
  io_.run();
}

void SyncEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncEngine::stop() {
  if(!started_) return;
  started_ = false;
  logger_->info("Engine stopping");

  if(scheduler_ && scheduler_started_) {
    scheduler_->stop();
    scheduler_started_ = false;
  }

  if(sweep_timer_) {
    std::error_code ec;
    sweep_timer_->cancel(ec);
  }
  if(recovery_timer_) {
    std::error_code ec;
    recovery_timer_->cancel(ec);
  }

  if(maintenance_) maintenance_->join();
  if(executor_) executor_->stop();
  if(pool_) pool_->close_all();
  if(broadcaster_) broadcaster_->close();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
  sweep_timer_.reset();
  recovery_timer_.reset();
  logger_->info("Engine stopped");
}

// Jobs that cap their server's connections narrow the pool bounds for it.
void SyncEngine::apply_connection_bounds() {
  const auto& options = pool_->options();
  for(const auto& job : catalog_->list_jobs()) {
    if(!job.max_connections || *job.max_connections < 1) continue;
    pool_->set_target_bounds(job.server, options.min_per_target, static_cast<std::size_t>(*job.max_connections));
  }
}

void SyncEngine::schedule_pool_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(sweep_interval_);
  sweep_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    apply_connection_bounds();
    const std::size_t evicted = pool_->evict_idle();
    if(evicted > 0) log_debug(logger_.get(), "Closed {} idle SSH connections", evicted);
    schedule_pool_sweep();
  });
}

void SyncEngine::schedule_recovery() {
  if(!recovery_timer_) return;
  recovery_timer_->expires_after(recovery_interval_);
  recovery_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    // Stuck recovery signals processes and may wait on the store; keep it off the io thread.
    auto recovery = recovery_;
    asio::post(*maintenance_, [recovery]() { recovery->perform_system_recovery(); });
    schedule_recovery();
  });
}

SyncEngine::Stats SyncEngine::stats() const {
  Stats s;
  if(queue_) {
    s.queue = queue_->get_stats();
    s.in_flight = queue_->in_flight_count();
  }
  if(pool_) s.pool = pool_->get_pool_stats();
  if(scheduler_) s.scheduler = scheduler_->get_stats();
  if(runner_) s.running_processes = runner_->running_count();
  return s;
}

LogListenerHandle SyncEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void SyncEngine::remove_log_listener(LogListenerHandle handle) {
  if(!logger_) return;
  logger_->remove_listener(handle);
}
