#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

class JobConcurrencyController;
class Logger;
class ProcessRunner;
class TransferQueue;
class TransferStateManager;

enum class RecoveryKind { Orphaned, Stuck };

std::string to_string(RecoveryKind kind);

struct RecoveryRecord {
  RecoveryKind kind = RecoveryKind::Orphaned;
  std::string transfer_id;
  std::string job_id;
  TransferStatus state = TransferStatus::Queued;
  TimePoint last_state_change;
  std::chrono::milliseconds stuck_for{0};
  std::optional<int> slot;
};

struct ConsistencyIssue {
  std::string kind;
  std::string severity;
  std::string transfer_id;
  std::string job_id;
  std::string detail;
};

struct ConsistencyReport {
  struct Stats {
    std::size_t store_active = 0;
    std::size_t queue_pending = 0;
    std::size_t in_flight = 0;
    std::size_t occupied_slots = 0;
  };

  bool consistent = true;
  std::vector<ConsistencyIssue> issues;
  Stats stats;
};

struct RecoveryReport {
  std::size_t orphans_found = 0;
  std::size_t orphans_recovered = 0;
  std::size_t stuck_found = 0;
  std::size_t stuck_recovered = 0;
  std::size_t slots_released = 0;
  std::size_t purged = 0;
  ConsistencyReport consistency;
  std::chrono::milliseconds duration{0};
};

nlohmann::json report_to_json(const ConsistencyReport& report);
nlohmann::json report_to_json(const RecoveryReport& report);

// Reconciles the store with the live queue, slot table and process registry.
// A full recovery pass holds the recovery lock exclusively; scheduler ticks
// hold it shared and are skipped while a recovery runs.
class StateRecoveryService {
public:
  struct Options {
    std::chrono::minutes stuck_threshold{30};
    std::chrono::hours retention{24};
  };

  StateRecoveryService(std::shared_ptr<TransferStateManager> state,
                       std::shared_ptr<TransferQueue> queue,
                       std::shared_ptr<JobConcurrencyController> controller,
                       std::shared_ptr<ProcessRunner> runner,
                       Options options,
                       std::shared_ptr<Logger> logger = nullptr);

  std::vector<RecoveryRecord> detect_orphaned_transfers() const;
  bool cleanup_orphaned_transfer(const RecoveryRecord& record);

  std::vector<RecoveryRecord> detect_stuck_transfers(std::chrono::minutes threshold) const;
  bool recover_stuck_transfer(const RecoveryRecord& record);

  ConsistencyReport validate_state_consistency() const;

  // nullopt when another recovery already holds the lock.
  std::optional<RecoveryReport> perform_system_recovery();

  std::shared_lock<std::shared_mutex> try_enter_tick();
  bool recovery_in_progress();

  const Options& options() const { return options_; }

private:
  bool is_live(const std::string& transfer_id) const;
  // Frees slots whose holder is neither in flight nor active in the store.
  std::size_t release_leaked_slots();

  std::shared_ptr<TransferStateManager> state_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<JobConcurrencyController> controller_;
  std::shared_ptr<ProcessRunner> runner_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_mutex recovery_mutex_;
};
