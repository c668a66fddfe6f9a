#include "state_recovery_service.hpp"

#include <map>
#include <set>

#include "concurrency_controller.hpp"
#include "log.hpp"
#include "process_runner.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"

namespace {

ConsistencyIssue make_issue(const char* kind, const char* severity, const std::string& transfer_id,
                            const std::string& job_id, std::string detail) {
  return ConsistencyIssue{kind, severity, transfer_id, job_id, std::move(detail)};
}

} // namespace

std::string to_string(RecoveryKind kind) {
  return kind == RecoveryKind::Orphaned ? "orphaned" : "stuck";
}

nlohmann::json report_to_json(const ConsistencyReport& report) {
  nlohmann::json issues = nlohmann::json::array();
  for(const auto& issue : report.issues) {
    issues.push_back({
      {"kind", issue.kind},
      {"severity", issue.severity},
      {"transferId", issue.transfer_id},
      {"jobId", issue.job_id},
      {"detail", issue.detail}
    });
  }
  return {
    {"consistent", report.consistent},
    {"issues", issues},
    {"stats", {
      {"storeActive", report.stats.store_active},
      {"queuePending", report.stats.queue_pending},
      {"inFlight", report.stats.in_flight},
      {"occupiedSlots", report.stats.occupied_slots}
    }}
  };
}

nlohmann::json report_to_json(const RecoveryReport& report) {
  return {
    {"orphansFound", report.orphans_found},
    {"orphansRecovered", report.orphans_recovered},
    {"stuckFound", report.stuck_found},
    {"stuckRecovered", report.stuck_recovered},
    {"slotsReleased", report.slots_released},
    {"purged", report.purged},
    {"durationMs", report.duration.count()},
    {"consistency", report_to_json(report.consistency)}
  };
}

StateRecoveryService::StateRecoveryService(std::shared_ptr<TransferStateManager> state,
                                           std::shared_ptr<TransferQueue> queue,
                                           std::shared_ptr<JobConcurrencyController> controller,
                                           std::shared_ptr<ProcessRunner> runner,
                                           Options options,
                                           std::shared_ptr<Logger> logger)
  : state_(std::move(state)),
    queue_(std::move(queue)),
    controller_(std::move(controller)),
    runner_(std::move(runner)),
    options_(options),
    logger_(logger ? std::move(logger) : make_component_logger("recovery")) {}

bool StateRecoveryService::is_live(const std::string& transfer_id) const {
  return queue_->is_tracked(transfer_id) || runner_->is_running(transfer_id);
}

std::vector<RecoveryRecord> StateRecoveryService::detect_orphaned_transfers() const {
  std::vector<RecoveryRecord> out;
  for(const auto& t : state_->get_active_transfers()) {
    if(is_live(t.transfer_id)) continue;
    RecoveryRecord r;
    r.kind = RecoveryKind::Orphaned;
    r.transfer_id = t.transfer_id;
    r.job_id = t.job_id;
    r.state = t.status;
    r.last_state_change = t.last_state_change;
    r.stuck_for = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t.last_activity());
    r.slot = t.concurrency_slot;
    out.push_back(r);
  }
  if(!out.empty()) logger_->warn("Found {} orphaned transfers", out.size());
  return out;
}

bool StateRecoveryService::cleanup_orphaned_transfer(const RecoveryRecord& record) {
  try {
    auto current = state_->get(record.transfer_id);
    if(!current || !is_active(current->status) || is_live(record.transfer_id)) {
      logger_->debug("{} no longer orphaned", record.transfer_id);
      return false;
    }

    if(current->status == TransferStatus::Queued) {
      // Nothing ran; the record simply re-enters the queue.
      const bool adopted = queue_->requeue(*current);
      if(adopted) logger_->info("Re-queued orphaned transfer {}", record.transfer_id);
      return adopted;
    }

    TransitionDetails details;
    details.reason = "orphaned in " + to_string(current->status) + ", no live process";
    details.error_category = ErrorCategory::Consistency;
    details.error_message = prefixed_message(ErrorCategory::Consistency, details.reason);
    state_->transition(record.transfer_id, TransferStatus::Failed, details);
    controller_->release_slot_by_transfer(record.transfer_id);

    if(auto retry = state_->schedule_retry(record.transfer_id)) {
      queue_->requeue(*retry);
      logger_->info("Orphaned transfer {} failed and was re-queued (retry {}/{})",
                    record.transfer_id, retry->retry_count, retry->max_retries);
    } else {
      logger_->warn("Orphaned transfer {} failed with no retries left", record.transfer_id);
    }
    return true;
  } catch(const WarpsyncError& e) {
    logger_->error("Cleanup of orphan {} failed: {}", record.transfer_id, e.what());
    return false;
  }
}

std::vector<RecoveryRecord> StateRecoveryService::detect_stuck_transfers(std::chrono::minutes threshold) const {
  std::vector<RecoveryRecord> out;
  const auto now = Clock::now();
  for(const auto& t : state_->get_active_transfers()) {
    // Waiting for a slot is not being stuck.
    if(t.status == TransferStatus::Queued) continue;
    if(!is_live(t.transfer_id)) continue;
    const auto idle = now - t.last_activity();
    if(idle < threshold) continue;
    RecoveryRecord r;
    r.kind = RecoveryKind::Stuck;
    r.transfer_id = t.transfer_id;
    r.job_id = t.job_id;
    r.state = t.status;
    r.last_state_change = t.last_state_change;
    r.stuck_for = std::chrono::duration_cast<std::chrono::milliseconds>(idle);
    r.slot = t.concurrency_slot;
    out.push_back(r);
  }
  if(!out.empty()) logger_->warn("Found {} stuck transfers (threshold {}m)", out.size(), threshold.count());
  return out;
}

bool StateRecoveryService::recover_stuck_transfer(const RecoveryRecord& record) {
  logger_->warn("{} stuck in {} for {}s, terminating", record.transfer_id, to_string(record.state),
                std::chrono::duration_cast<std::chrono::seconds>(record.stuck_for).count());
  // The executor sees a stalled cancel, records a timeout failure, frees the
  // slot and connection and applies the retry policy.
  runner_->cancel(record.transfer_id, CancelReason::Stalled);
  return true;
}

ConsistencyReport StateRecoveryService::validate_state_consistency() const {
  ConsistencyReport report;
  const auto active = state_->get_active_transfers();
  const auto pending = queue_->pending_ids();
  const auto in_flight = queue_->in_flight_ids();
  const auto occupancy = controller_->occupancy();

  const std::set<std::string> pending_set(pending.begin(), pending.end());
  const std::set<std::string> in_flight_set(in_flight.begin(), in_flight.end());
  std::map<std::string, const Transfer*> by_id;
  std::map<std::pair<std::string, std::string>, std::string> pairs;

  report.stats.store_active = active.size();
  report.stats.queue_pending = pending.size();
  report.stats.in_flight = in_flight.size();
  for(const auto& job : occupancy) report.stats.occupied_slots += job.second.size();

  for(const auto& t : active) {
    by_id[t.transfer_id] = &t;
    auto pair = std::make_pair(t.job_id, t.file_id);
    auto dup = pairs.find(pair);
    if(dup != pairs.end()) {
      report.issues.push_back(make_issue("duplicate_active_pair", "error", t.transfer_id, t.job_id,
                                         "file " + t.file_id + " also active as " + dup->second));
    } else {
      pairs.emplace(pair, t.transfer_id);
    }

    const bool queued_here = pending_set.count(t.transfer_id) > 0;
    const bool flying = in_flight_set.count(t.transfer_id) > 0;
    if(!queued_here && !flying) {
      report.issues.push_back(make_issue("missing_in_memory", "warning", t.transfer_id, t.job_id,
                                         to_string(t.status) + " in store but not tracked"));
    } else if(queued_here && t.status != TransferStatus::Queued) {
      report.issues.push_back(make_issue("state_mismatch", "error", t.transfer_id, t.job_id,
                                         "pending in queue but " + to_string(t.status) + " in store"));
    }
  }

  for(const auto& id : pending) {
    if(!by_id.count(id)) {
      report.issues.push_back(make_issue("missing_in_store", "error", id, "", "pending but not active in store"));
    }
  }
  for(const auto& id : in_flight) {
    if(!by_id.count(id)) {
      report.issues.push_back(make_issue("missing_in_store", "warning", id, "", "in flight but not active in store"));
    }
  }

  std::map<std::string, int> slots_per_transfer;
  for(const auto& job : occupancy) {
    for(const auto& slot : job.second) {
      const std::string& holder = slot.second;
      if(++slots_per_transfer[holder] > 1) {
        report.issues.push_back(make_issue("slot_conflict", "error", holder, job.first,
                                           "holds more than one slot"));
      }
      auto it = by_id.find(holder);
      if(it == by_id.end() && !in_flight_set.count(holder)) {
        report.issues.push_back(make_issue("slot_leak", "error", holder, job.first,
                                           "slot " + std::to_string(slot.first) + " held by inactive transfer"));
        continue;
      }
      if(it != by_id.end()) {
        const Transfer& t = *it->second;
        if(t.concurrency_slot && *t.concurrency_slot != slot.first) {
          report.issues.push_back(make_issue("slot_conflict", "error", holder, job.first,
                                             "store records slot " + std::to_string(*t.concurrency_slot) +
                                             ", controller slot " + std::to_string(slot.first)));
        }
      }
    }
  }

  for(const auto& t : active) {
    if(t.status == TransferStatus::Queued || !t.concurrency_slot) continue;
    auto job_it = occupancy.find(t.job_id);
    if(job_it == occupancy.end()) continue;
    auto slot_it = job_it->second.find(*t.concurrency_slot);
    if(slot_it != job_it->second.end() && slot_it->second != t.transfer_id) {
      report.issues.push_back(make_issue("slot_conflict", "error", t.transfer_id, t.job_id,
                                         "slot " + std::to_string(*t.concurrency_slot) + " held by " +
                                         slot_it->second));
    }
  }

  report.consistent = report.issues.empty();
  return report;
}

std::size_t StateRecoveryService::release_leaked_slots() {
  // Read in this order so a holder moving between the queue and the store is
  // always seen in one of them.
  const auto occupancy = controller_->occupancy();
  const auto in_flight = queue_->in_flight_ids();
  const std::set<std::string> in_flight_set(in_flight.begin(), in_flight.end());
  std::set<std::string> active_set;
  for(const auto& t : state_->get_active_transfers()) active_set.insert(t.transfer_id);

  std::size_t released = 0;
  for(const auto& job : occupancy) {
    for(const auto& slot : job.second) {
      const std::string& holder = slot.second;
      if(in_flight_set.count(holder) || active_set.count(holder)) continue;
      if(controller_->release_slot_by_transfer(holder)) {
        logger_->warn("Released slot {} of job {} leaked by {}", slot.first, job.first, holder);
        ++released;
      }
    }
  }
  return released;
}

std::optional<RecoveryReport> StateRecoveryService::perform_system_recovery() {
  std::unique_lock<std::shared_mutex> lock(recovery_mutex_, std::try_to_lock);
  if(!lock.owns_lock()) {
    logger_->info("Recovery already in progress, skipping");
    return std::nullopt;
  }

  const auto started = std::chrono::steady_clock::now();
  RecoveryReport report;
  logger_->info("System recovery started");

  try {
    for(const auto& record : detect_orphaned_transfers()) {
      ++report.orphans_found;
      if(cleanup_orphaned_transfer(record)) ++report.orphans_recovered;
    }
  } catch(const WarpsyncError& e) {
    logger_->error("Orphan detection failed: {}", e.what());
  }

  try {
    for(const auto& record : detect_stuck_transfers(options_.stuck_threshold)) {
      ++report.stuck_found;
      if(recover_stuck_transfer(record)) ++report.stuck_recovered;
    }
  } catch(const WarpsyncError& e) {
    logger_->error("Stuck detection failed: {}", e.what());
  }

  try {
    report.slots_released = release_leaked_slots();
  } catch(const WarpsyncError& e) {
    logger_->error("Slot leak repair failed: {}", e.what());
  }

  report.purged = state_->purge_terminal(options_.retention);

  try {
    report.consistency = validate_state_consistency();
  } catch(const WarpsyncError& e) {
    logger_->error("Consistency validation failed: {}", e.what());
    report.consistency.consistent = false;
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  logger_->info("System recovery done in {}ms: {}/{} orphans, {}/{} stuck, {} slots freed, {} purged, {} issues",
                report.duration.count(), report.orphans_recovered, report.orphans_found,
                report.stuck_recovered, report.stuck_found, report.slots_released, report.purged,
                report.consistency.issues.size());
  return report;
}

std::shared_lock<std::shared_mutex> StateRecoveryService::try_enter_tick() {
  return std::shared_lock<std::shared_mutex>(recovery_mutex_, std::try_to_lock);
}

bool StateRecoveryService::recovery_in_progress() {
  std::shared_lock<std::shared_mutex> lock(recovery_mutex_, std::try_to_lock);
  return !lock.owns_lock();
}
