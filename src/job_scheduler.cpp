#include "job_scheduler.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <shared_mutex>

#include "errors.hpp"
#include "log.hpp"
#include "state_recovery_service.hpp"
#include "transfer_queue.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kRecentExecutions = 50;
constexpr std::uint64_t kMemoryWarningBytes = 1024ull * 1024ull * 1024ull;
constexpr std::size_t kQueueDepthWarning = 1000;

std::string strip_leading_slashes(const std::string& path) {
  std::size_t pos = 0;
  while(pos < path.size() && path[pos] == '/') ++pos;
  return path.substr(pos);
}

} // namespace

void SchedulerConfig::validate() const {
  if(check_interval < std::chrono::milliseconds(5000)) {
    throw ValidationError("scheduler check interval must be at least 5000ms");
  }
  if(max_concurrent_scans < 1 || max_concurrent_scans > 10) {
    throw ValidationError("scheduler max concurrent scans must be between 1 and 10");
  }
  if(scan_timeout < std::chrono::milliseconds(60000)) {
    throw ValidationError("scheduler scan timeout must be at least 60000ms");
  }
  if(error_retry_delay < std::chrono::milliseconds(30000)) {
    throw ValidationError("scheduler error retry delay must be at least 30000ms");
  }
  if(max_error_count < 1 || max_error_count > 20) {
    throw ValidationError("scheduler max error count must be between 1 and 20");
  }
  if(health_check_interval < std::chrono::milliseconds(30000)) {
    throw ValidationError("scheduler health check interval must be at least 30000ms");
  }
}

std::string to_string(JobRunState state) {
  switch(state) {
    case JobRunState::Active: return "active";
    case JobRunState::Disabled: return "disabled";
    case JobRunState::Error: return "error";
    case JobRunState::Scanning: return "scanning";
  }
  return "unknown";
}

nlohmann::json job_to_json(const ScheduledJob& job) {
  nlohmann::json j{
    {"jobId", job.job_id},
    {"jobName", job.job_name},
    {"status", to_string(job.status)},
    {"nextScan", format_timestamp(job.next_scan)},
    {"scanIntervalMinutes", job.scan_interval_minutes},
    {"errorCount", job.error_count},
    {"scanning", job.scanning}
  };
  if(job.last_scan) j["lastScan"] = format_timestamp(*job.last_scan);
  if(!job.last_error.empty()) j["lastError"] = job.last_error;
  return j;
}

nlohmann::json execution_to_json(const ScanExecution& execution) {
  nlohmann::json j{
    {"id", execution.id},
    {"jobId", execution.job_id},
    {"status", execution.status},
    {"startedAt", format_timestamp(execution.started_at)},
    {"filesScanned", execution.files_scanned},
    {"filesQueued", execution.files_queued}
  };
  if(execution.ended_at) j["endedAt"] = format_timestamp(*execution.ended_at);
  if(!execution.error.empty()) j["error"] = execution.error;
  return j;
}

nlohmann::json stats_to_json(const SchedulerStats& stats) {
  nlohmann::json j{
    {"totalJobs", stats.total_jobs},
    {"activeJobs", stats.active_jobs},
    {"scanningJobs", stats.scanning_jobs},
    {"errorJobs", stats.error_jobs},
    {"uptimeSeconds", stats.uptime.count()},
    {"totalScansCompleted", stats.total_scans_completed},
    {"totalScansFailed", stats.total_scans_failed},
    {"skippedTicks", stats.skipped_ticks}
  };
  if(stats.next_scan_in) j["nextScanInSeconds"] = stats.next_scan_in->count();
  if(stats.last_health_check) j["lastHealthCheck"] = format_timestamp(*stats.last_health_check);
  return j;
}

nlohmann::json health_to_json(const HealthReport& report) {
  return nlohmann::json{
    {"status", report.status},
    {"issues", report.issues},
    {"lastCheck", format_timestamp(report.checked_at)},
    {"memoryUsage", report.resident_bytes},
    {"activeConnections", report.active_connections},
    {"queueSize", report.queue_depth},
    {"runningScans", report.running_scans}
  };
}

std::uint64_t resident_memory_bytes() {
  std::ifstream in("/proc/self/statm");
  std::uint64_t total_pages = 0;
  std::uint64_t resident_pages = 0;
  if(!(in >> total_pages >> resident_pages)) return 0;
  const long page_size = ::sysconf(_SC_PAGESIZE);
  return resident_pages * static_cast<std::uint64_t>(page_size > 0 ? page_size : 4096);
}

JobScheduler::JobScheduler(asio::io_context& io,
                           SchedulerConfig config,
                           std::shared_ptr<JobCatalog> catalog,
                           std::shared_ptr<DirectoryScanner> scanner,
                           std::shared_ptr<TransferQueue> queue,
                           std::shared_ptr<StateRecoveryService> recovery,
                           std::shared_ptr<Logger> logger)
  : io_(io),
    config_(config),
    catalog_(std::move(catalog)),
    scanner_(std::move(scanner)),
    queue_(std::move(queue)),
    recovery_(std::move(recovery)),
    logger_(logger ? std::move(logger) : make_component_logger("scheduler")),
    scan_pool_(static_cast<std::size_t>(std::max(1, config.max_concurrent_scans))) {}

JobScheduler::~JobScheduler() {
  stop();
}

void JobScheduler::start() {
  if(running_.exchange(true)) return;
  started_at_ = std::chrono::steady_clock::now();
  tick_timer_ = std::make_unique<asio::steady_timer>(io_);
  health_timer_ = std::make_unique<asio::steady_timer>(io_);

  refresh_jobs();
  logger_->info("Job scheduler started with {} jobs (check every {}ms, {} concurrent scans)",
                get_scheduled_jobs().size(), config_.check_interval.count(), config_.max_concurrent_scans);

  asio::post(io_, [this]() {
    if(!running_) return;
    check_due_jobs();
  });
  schedule_tick();
  schedule_health_check();
}

void JobScheduler::stop() {
  if(!running_.exchange(false)) {
    scan_pool_.join();
    return;
  }
  logger_->info("Stopping job scheduler");

  std::error_code ec;
  if(tick_timer_) tick_timer_->cancel(ec);
  if(health_timer_) health_timer_->cancel(ec);

  std::vector<std::string> scanning;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& entry : running_scans_) scanning.push_back(entry.first);
  }
  if(!scanning.empty()) {
    logger_->info("Interrupting {} running scans", scanning.size());
  }
  for(const auto& job_id : scanning) scanner_->cancel(job_id);

  scan_pool_.join();
  tick_timer_.reset();
  health_timer_.reset();
  logger_->info("Job scheduler stopped");
}

TimePoint JobScheduler::next_scan_after(const std::optional<TimePoint>& last_scan,
                                        int interval_minutes, TimePoint now) {
  if(!last_scan) return now;
  const TimePoint next = *last_scan + std::chrono::minutes(interval_minutes);
  return next < now ? now : next;
}

void JobScheduler::refresh_jobs() {
  const auto records = catalog_->list_jobs();
  const TimePoint now = Clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, ScheduledJob> refreshed;
  for(const auto& record : records) {
    ScheduledJob job;
    job.job_id = record.id;
    job.job_name = record.name;
    job.scan_interval_minutes = record.scan_interval_minutes;
    job.last_scan = record.last_scan;

    auto old = jobs_.find(record.id);
    const bool known = old != jobs_.end();
    if(known) {
      job.error_count = old->second.error_count;
      job.last_error = old->second.last_error;
      job.scanning = old->second.scanning;
      const auto& previous = old->second.last_scan;
      if(previous && (!job.last_scan || *previous > *job.last_scan)) job.last_scan = previous;
    }

    if(job.scanning) {
      job.status = JobRunState::Scanning;
    } else if(!record.enabled) {
      job.status = JobRunState::Disabled;
    } else if(known && old->second.status == JobRunState::Error) {
      job.status = JobRunState::Error;
    } else {
      job.status = JobRunState::Active;
    }

    if(known && old->second.status != JobRunState::Disabled &&
       old->second.scan_interval_minutes == record.scan_interval_minutes) {
      job.next_scan = old->second.next_scan;
    } else {
      job.next_scan = next_scan_after(job.last_scan, job.scan_interval_minutes, now);
    }
    refreshed.emplace(record.id, std::move(job));
  }
  jobs_.swap(refreshed);
  logger_->debug("Refreshed {} jobs", jobs_.size());
}

std::size_t JobScheduler::check_due_jobs() {
  std::shared_lock<std::shared_mutex> gate;
  if(recovery_) {
    gate = recovery_->try_enter_tick();
    if(!gate.owns_lock()) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++skipped_ticks_;
      logger_->debug("Recovery in progress, skipping scheduler tick");
      return 0;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const TimePoint now = Clock::now();
  std::vector<ScheduledJob*> due;
  for(auto& entry : jobs_) {
    auto& job = entry.second;
    if(job.status == JobRunState::Active && !job.scanning && job.next_scan <= now) {
      due.push_back(&job);
    }
  }
  std::sort(due.begin(), due.end(), [](const ScheduledJob* a, const ScheduledJob* b) {
    return a->next_scan < b->next_scan;
  });

  std::size_t started = 0;
  for(auto* job : due) {
    if(running_scans_.size() >= static_cast<std::size_t>(config_.max_concurrent_scans)) break;
    start_scan_locked(*job);
    ++started;
  }
  if(due.size() > started) {
    logger_->debug("{} due jobs waiting for a scan slot", due.size() - started);
  }
  return started;
}

void JobScheduler::trigger_job_scan(const std::string& job_id) {
  bool known = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    known = jobs_.count(job_id) != 0;
  }
  // The catalog may have gained the job since the last tick.
  if(!known) refresh_jobs();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if(it == jobs_.end()) {
    throw ValidationError("job not found: " + job_id);
  }
  if(it->second.scanning) {
    throw ValidationError("job " + job_id + " is already scanning");
  }
  if(running_scans_.size() >= static_cast<std::size_t>(config_.max_concurrent_scans)) {
    throw ValidationError("maximum concurrent scans reached (" +
                          std::to_string(config_.max_concurrent_scans) + ")");
  }
  logger_->info("Manual scan of {} requested", job_id);
  start_scan_locked(it->second);
}

bool JobScheduler::reset_job(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if(it == jobs_.end()) return false;
  auto& job = it->second;
  job.error_count = 0;
  job.last_error.clear();
  if(job.status == JobRunState::Error) job.status = JobRunState::Active;
  job.next_scan = Clock::now();
  logger_->info("Job {} reset, status {}", job_id, to_string(job.status));
  return true;
}

void JobScheduler::start_scan_locked(ScheduledJob& job) {
  RunningScan scan;
  scan.execution.id = next_execution_id_++;
  scan.execution.job_id = job.job_id;
  scan.execution.started_at = Clock::now();
  scan.timer = std::make_shared<asio::steady_timer>(io_);

  job.scanning = true;
  job.status = JobRunState::Scanning;

  const std::uint64_t id = scan.execution.id;
  const std::string job_id = job.job_id;
  auto timer = scan.timer;
  running_scans_[job_id] = std::move(scan);
  logger_->info("Starting scan {} of {}", id, job_id);

  asio::post(io_, [this, timer, id, job_id]() {
    timer->expires_after(config_.scan_timeout);
    timer->async_wait([this, id, job_id](const std::error_code& ec) {
      if(ec) return;
      on_scan_timeout(id, job_id);
    });
  });
  asio::post(scan_pool_, [this, id, job_id]() { run_scan(id, job_id); });
}

void JobScheduler::run_scan(std::uint64_t execution_id, const std::string& job_id) {
  const auto record = catalog_->get_job(job_id);
  if(!record) {
    finish_scan(execution_id, job_id, false, "job no longer exists", 0, 0, false);
    return;
  }

  std::vector<ScanEntry> entries;
  try {
    entries = scanner_->scan(*record);
  } catch(const WarpsyncError& e) {
    finish_scan(execution_id, job_id, false, e.prefixed(), 0, 0, false);
    return;
  } catch(const std::exception& e) {
    finish_scan(execution_id, job_id, false, e.what(), 0, 0, false);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_scans_.find(job_id);
    if(it == running_scans_.end() || it->second.execution.id != execution_id) {
      logger_->debug("Discarding late results of scan {} for {}", execution_id, job_id);
      return;
    }
  }

  std::vector<std::string> admitted;
  try {
    admitted = queue_->add_batch(build_transfer_specs(*record, entries));
  } catch(const WarpsyncError& e) {
    finish_scan(execution_id, job_id, false, e.prefixed(), entries.size(), 0, false);
    return;
  }
  finish_scan(execution_id, job_id, true, std::string(), entries.size(), admitted.size(), false);
}

void JobScheduler::on_scan_timeout(std::uint64_t execution_id, const std::string& job_id) {
  const std::string error = prefixed_message(ErrorCategory::Timeout,
    "scan exceeded " + std::to_string(config_.scan_timeout.count()) + "ms");
  if(finish_scan(execution_id, job_id, false, error, 0, 0, true)) {
    scanner_->cancel(job_id);
  }
}

bool JobScheduler::finish_scan(std::uint64_t execution_id, const std::string& job_id, bool success,
                               const std::string& error, std::size_t scanned, std::size_t queued,
                               bool timed_out) {
  std::shared_ptr<asio::steady_timer> timer;
  ScanExecution finished;
  int error_count = 0;
  bool entered_error = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_scans_.find(job_id);
    if(it == running_scans_.end() || it->second.execution.id != execution_id) return false;
    finished = std::move(it->second.execution);
    timer = std::move(it->second.timer);
    running_scans_.erase(it);

    const TimePoint now = Clock::now();
    finished.ended_at = now;
    finished.status = success ? "completed" : (timed_out ? "timeout" : "failed");
    finished.files_scanned = scanned;
    finished.files_queued = queued;
    finished.error = error;
    if(success) {
      ++scans_completed_;
    } else {
      ++scans_failed_;
    }
    recent_.push_back(finished);
    if(recent_.size() > kRecentExecutions) recent_.erase(recent_.begin());

    auto job_it = jobs_.find(job_id);
    if(job_it != jobs_.end()) {
      auto& job = job_it->second;
      job.scanning = false;
      if(job.status == JobRunState::Scanning) job.status = JobRunState::Active;
      if(success) {
        job.last_scan = finished.started_at;
        job.next_scan = next_scan_after(job.last_scan, job.scan_interval_minutes, now);
        job.error_count = 0;
        job.last_error.clear();
      } else {
        job.error_count += 1;
        job.last_error = error;
        error_count = job.error_count;
        if(job.error_count >= config_.max_error_count) {
          job.status = JobRunState::Error;
          entered_error = true;
        } else {
          job.next_scan = now + config_.error_retry_delay;
        }
      }
    }
  }

  if(timer) {
    asio::post(io_, [timer]() {
      std::error_code ec;
      timer->cancel(ec);
    });
  }

  if(success) {
    logger_->info("Scan {} of {} finished: {} entries, {} transfers admitted",
                  execution_id, job_id, scanned, queued);
    std::string err;
    if(!catalog_->set_last_scan(job_id, finished.started_at, err)) {
      logger_->warn("Cannot record last scan of {}: {}", job_id, err);
    }
  } else if(entered_error) {
    logger_->error("Job {} moved to error state after {} consecutive failures: {}",
                   job_id, error_count, error);
  } else {
    logger_->warn("Scan {} of {} {} ({}/{}): {}", execution_id, job_id, finished.status,
                  error_count, config_.max_error_count, error);
  }
  return true;
}

std::vector<TransferSpec> JobScheduler::build_transfer_specs(const JobRecord& job,
                                                             const std::vector<ScanEntry>& entries) {
  std::vector<TransferSpec> specs;
  specs.reserve(entries.size());
  for(const auto& entry : entries) {
    if(entry.is_directory || entry.action == "skip") continue;

    const std::string relative = strip_leading_slashes(entry.relative_path);
    TransferSpec spec;
    spec.job_id = job.id;
    spec.file_id = entry.file_id;
    spec.type = entry.action.empty() ? job.direction : transfer_type_from_string(entry.action);
    spec.priority = job.priority;
    spec.relative_path = relative;
    spec.filename = std::filesystem::path(relative).filename().string();
    spec.size = entry.size;
    spec.ssh = job.server;
    spec.rsync = job.rsync;
    spec.max_retries = job.max_retries;

    const std::string remote = join_remote_path(job.remote_path, relative);
    const std::string local = (std::filesystem::path(job.local_path) / relative).lexically_normal().string();
    if(is_pull(spec.type)) {
      spec.source = remote;
      spec.destination = local;
    } else {
      spec.source = local;
      spec.destination = remote;
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

std::vector<ScheduledJob> JobScheduler::get_scheduled_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScheduledJob> out;
  out.reserve(jobs_.size());
  for(const auto& entry : jobs_) out.push_back(entry.second);
  return out;
}

std::vector<ScanExecution> JobScheduler::get_running_executions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScanExecution> out;
  for(const auto& entry : running_scans_) out.push_back(entry.second.execution);
  return out;
}

std::vector<ScanExecution> JobScheduler::get_recent_executions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return recent_;
}

SchedulerStats JobScheduler::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SchedulerStats stats;
  const TimePoint now = Clock::now();
  stats.total_jobs = jobs_.size();
  for(const auto& entry : jobs_) {
    const auto& job = entry.second;
    switch(job.status) {
      case JobRunState::Active: ++stats.active_jobs; break;
      case JobRunState::Scanning: ++stats.scanning_jobs; break;
      case JobRunState::Error: ++stats.error_jobs; break;
      case JobRunState::Disabled: break;
    }
    if(job.status != JobRunState::Active) continue;
    auto wait = std::chrono::duration_cast<std::chrono::seconds>(job.next_scan - now);
    if(wait.count() < 0) wait = std::chrono::seconds(0);
    if(!stats.next_scan_in || wait < *stats.next_scan_in) stats.next_scan_in = wait;
  }
  if(last_health_) stats.last_health_check = last_health_->checked_at;
  if(running_) {
    stats.uptime = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - started_at_);
  }
  stats.total_scans_completed = scans_completed_;
  stats.total_scans_failed = scans_failed_;
  stats.skipped_ticks = skipped_ticks_;
  return stats;
}

void JobScheduler::set_health_sources(HealthSources sources) {
  std::lock_guard<std::mutex> lock(mutex_);
  health_sources_ = std::move(sources);
}

HealthReport JobScheduler::health() {
  HealthSources sources;
  std::size_t error_jobs = 0;
  std::vector<std::string> overdue;
  HealthReport report;
  report.checked_at = Clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sources = health_sources_;
    for(const auto& entry : jobs_) {
      if(entry.second.status == JobRunState::Error) ++error_jobs;
    }
    report.running_scans = running_scans_.size();
    for(const auto& entry : running_scans_) {
      if(report.checked_at - entry.second.execution.started_at > 2 * config_.scan_timeout) {
        overdue.push_back(entry.first);
      }
    }
  }

  report.resident_bytes = resident_memory_bytes();
  report.active_connections = sources.active_connections ? sources.active_connections() : 0;
  report.queue_depth = sources.queue_depth ? sources.queue_depth() : 0;

  bool failed = false;
  if(!running_) {
    report.issues.push_back("scheduler is not running");
    failed = true;
  }
  if(error_jobs > 0) {
    report.issues.push_back(std::to_string(error_jobs) + " job(s) in error state");
  }
  for(const auto& job_id : overdue) {
    report.issues.push_back("scan of " + job_id + " is past its timeout");
  }
  if(report.resident_bytes > kMemoryWarningBytes) {
    report.issues.push_back("high memory usage: " + format_bytes(report.resident_bytes));
  }
  if(report.queue_depth >= kQueueDepthWarning) {
    report.issues.push_back("queue depth " + std::to_string(report.queue_depth));
  }
  if(failed) {
    report.status = "error";
  } else if(!report.issues.empty()) {
    report.status = "warning";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  last_health_ = report;
  return report;
}

void JobScheduler::schedule_tick() {
  if(!tick_timer_) return;
  tick_timer_->expires_after(config_.check_interval);
  tick_timer_->async_wait([this](const std::error_code& ec) {
    if(ec || !running_) return;
    try {
      refresh_jobs();
      check_due_jobs();
    } catch(const std::exception& e) {
      logger_->error("Scheduler tick failed: {}", e.what());
    }
    schedule_tick();
  });
}

void JobScheduler::schedule_health_check() {
  if(!health_timer_) return;
  health_timer_->expires_after(config_.health_check_interval);
  health_timer_->async_wait([this](const std::error_code& ec) {
    if(ec || !running_) return;
    const auto report = health();
    if(report.status == "healthy") {
      logger_->debug("Health check: healthy, {} resident, queue depth {}",
                     format_bytes(report.resident_bytes), report.queue_depth);
    } else {
      std::string joined;
      for(const auto& issue : report.issues) {
        if(!joined.empty()) joined += "; ";
        joined += issue;
      }
      logger_->warn("Health check: {} ({})", report.status, joined);
    }
    schedule_health_check();
  });
}
