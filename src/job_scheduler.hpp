#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "directory_scanner.hpp"
#include "job_catalog.hpp"

class Logger;
class StateRecoveryService;
class TransferQueue;

struct SchedulerConfig {
  std::chrono::milliseconds check_interval{30000};
  int max_concurrent_scans = 3;
  std::chrono::milliseconds scan_timeout{600000};
  std::chrono::milliseconds error_retry_delay{300000};
  int max_error_count = 5;
  std::chrono::milliseconds health_check_interval{60000};

  // Throws ValidationError naming the first out-of-range value.
  void validate() const;
};

enum class JobRunState { Active, Disabled, Error, Scanning };

std::string to_string(JobRunState state);

struct ScheduledJob {
  std::string job_id;
  std::string job_name;
  JobRunState status = JobRunState::Active;
  TimePoint next_scan;
  std::optional<TimePoint> last_scan;
  int scan_interval_minutes = 60;
  int error_count = 0;
  std::string last_error;
  bool scanning = false;
};

struct ScanExecution {
  std::uint64_t id = 0;
  std::string job_id;
  TimePoint started_at;
  std::optional<TimePoint> ended_at;
  // running | completed | failed | timeout
  std::string status = "running";
  std::size_t files_scanned = 0;
  std::size_t files_queued = 0;
  std::string error;
};

struct SchedulerStats {
  std::size_t total_jobs = 0;
  std::size_t active_jobs = 0;
  std::size_t scanning_jobs = 0;
  std::size_t error_jobs = 0;
  std::optional<std::chrono::seconds> next_scan_in;
  std::optional<TimePoint> last_health_check;
  std::chrono::seconds uptime{0};
  std::uint64_t total_scans_completed = 0;
  std::uint64_t total_scans_failed = 0;
  std::uint64_t skipped_ticks = 0;
};

struct HealthReport {
  // healthy | warning | error
  std::string status = "healthy";
  std::vector<std::string> issues;
  TimePoint checked_at;
  std::uint64_t resident_bytes = 0;
  std::size_t active_connections = 0;
  std::size_t queue_depth = 0;
  std::size_t running_scans = 0;
};

nlohmann::json job_to_json(const ScheduledJob& job);
nlohmann::json execution_to_json(const ScanExecution& execution);
nlohmann::json stats_to_json(const SchedulerStats& stats);
nlohmann::json health_to_json(const HealthReport& report);

std::uint64_t resident_memory_bytes();

// Periodic scans of the job catalog's enabled jobs. Ticks and health checks
// run on the io thread; scans run on a dedicated pool bounded by
// max_concurrent_scans.
class JobScheduler {
public:
  struct HealthSources {
    std::function<std::size_t()> active_connections;
    std::function<std::size_t()> queue_depth;
  };

  JobScheduler(asio::io_context& io,
               SchedulerConfig config,
               std::shared_ptr<JobCatalog> catalog,
               std::shared_ptr<DirectoryScanner> scanner,
               std::shared_ptr<TransferQueue> queue,
               std::shared_ptr<StateRecoveryService> recovery,
               std::shared_ptr<Logger> logger = nullptr);
  ~JobScheduler();

  void start();
  void stop();
  bool running() const { return running_.load(); }

  void refresh_jobs();
  // Throws ValidationError when the job is unknown, already scanning or the
  // scan limit is reached.
  void trigger_job_scan(const std::string& job_id);
  bool reset_job(const std::string& job_id);

  // One scheduling pass; returns the number of scans started.
  std::size_t check_due_jobs();

  std::vector<ScheduledJob> get_scheduled_jobs() const;
  std::vector<ScanExecution> get_running_executions() const;
  std::vector<ScanExecution> get_recent_executions() const;
  SchedulerStats get_stats() const;

  HealthReport health();
  void set_health_sources(HealthSources sources);

  static std::vector<TransferSpec> build_transfer_specs(const JobRecord& job,
                                                        const std::vector<ScanEntry>& entries);

  const SchedulerConfig& config() const { return config_; }

private:
  struct RunningScan {
    ScanExecution execution;
    std::shared_ptr<asio::steady_timer> timer;
  };

  static TimePoint next_scan_after(const std::optional<TimePoint>& last_scan, int interval_minutes, TimePoint now);

  void schedule_tick();
  void schedule_health_check();
  void start_scan_locked(ScheduledJob& job);
  void run_scan(std::uint64_t execution_id, const std::string& job_id);
  void on_scan_timeout(std::uint64_t execution_id, const std::string& job_id);
  // Returns false if the execution was already finalized.
  bool finish_scan(std::uint64_t execution_id, const std::string& job_id, bool success,
                   const std::string& error, std::size_t scanned, std::size_t queued, bool timed_out);

  asio::io_context& io_;
  SchedulerConfig config_;
  std::shared_ptr<JobCatalog> catalog_;
  std::shared_ptr<DirectoryScanner> scanner_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<StateRecoveryService> recovery_;
  std::shared_ptr<Logger> logger_;

  asio::thread_pool scan_pool_;
  std::unique_ptr<asio::steady_timer> tick_timer_;
  std::unique_ptr<asio::steady_timer> health_timer_;
  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_;

  mutable std::mutex mutex_;
  std::map<std::string, ScheduledJob> jobs_;
  std::map<std::string, RunningScan> running_scans_;
  std::vector<ScanExecution> recent_;
  std::uint64_t next_execution_id_ = 1;
  std::uint64_t scans_completed_ = 0;
  std::uint64_t scans_failed_ = 0;
  std::uint64_t skipped_ticks_ = 0;
  std::optional<HealthReport> last_health_;
  HealthSources health_sources_;
};
