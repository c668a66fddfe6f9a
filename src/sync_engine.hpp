#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "job_scheduler.hpp"
#include "log.hpp"
#include "ssh_connection_pool.hpp"
#include "transfer_types.hpp"

class DirectoryScanner;
class EventBroadcaster;
class JobCatalog;
class JobConcurrencyController;
class ProcessRunner;
class SettingsManager;
class SshSessionFactory;
class StateRecoveryService;
class TransferExecutor;
class TransferQueue;
class TransferStateManager;
class TransferStore;

// Composition root: builds every manager from the settings, wires them
// together and owns the io thread that drives dispatch and timers.
class SyncEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool enable_timers = true;
    bool enable_scheduler = true;
    // Replacements for the production collaborators; null means build the default.
    std::shared_ptr<SshSessionFactory> session_factory;
    std::shared_ptr<JobCatalog> catalog;
    std::shared_ptr<DirectoryScanner> scanner;
  };

  struct Stats {
    QueueStats queue;
    PoolStats pool;
    SchedulerStats scheduler;
    std::size_t in_flight = 0;
    std::size_t running_processes = 0;
  };

  SyncEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncEngine();

  void start();
  void run();
  void start_background();
  void stop();

  Stats stats() const;
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<TransferQueue> queue() const { return queue_; }
  std::shared_ptr<TransferStateManager> state() const { return state_; }
  std::shared_ptr<JobConcurrencyController> controller() const { return controller_; }
  std::shared_ptr<SshConnectionPool> pool() const { return pool_; }
  std::shared_ptr<ProcessRunner> runner() const { return runner_; }
  std::shared_ptr<StateRecoveryService> recovery() const { return recovery_; }
  std::shared_ptr<JobScheduler> scheduler() const { return scheduler_; }
  std::shared_ptr<JobCatalog> catalog() const { return catalog_; }

  unsigned short event_port() const { return event_port_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  void ensure_workspace() const;
  std::filesystem::path resolve(const std::string& path) const;
  SchedulerConfig scheduler_config() const;
  void apply_connection_bounds();
  void schedule_pool_sweep();
  void schedule_recovery();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::unique_ptr<asio::steady_timer> recovery_timer_;
  std::unique_ptr<asio::thread_pool> maintenance_;
  std::chrono::milliseconds sweep_interval_{60000};
  std::chrono::milliseconds recovery_interval_{300000};

  std::shared_ptr<TransferStore> store_;
  std::shared_ptr<EventBroadcaster> broadcaster_;
  std::shared_ptr<TransferStateManager> state_;
  std::shared_ptr<JobCatalog> catalog_;
  std::shared_ptr<JobConcurrencyController> controller_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<SshConnectionPool> pool_;
  std::shared_ptr<TransferExecutor> executor_;
  std::shared_ptr<StateRecoveryService> recovery_;
  std::shared_ptr<DirectoryScanner> scanner_;
  std::shared_ptr<JobScheduler> scheduler_;
  bool started_ = false;
  bool scheduler_started_ = false;
  unsigned short event_port_ = 0;
};
