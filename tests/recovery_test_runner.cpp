#include "concurrency_controller.hpp"
#include "process_runner.hpp"
#include "state_recovery_service.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"
#include "transfer_store.hpp"
#include "test_runner_utils.hpp"

#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace warpsync::test;

namespace {

using namespace std::chrono_literals;

// One process lifetime over a shared store; restart() drops everything held
// in memory the way a crash would.
struct RecoveryFixture {
  explicit RecoveryFixture(TestContext& ctx) : ctx(ctx), workspace("recovery") {
    store = std::make_shared<TransferStore>(workspace.path("transfers.db").string());
    std::string err;
    if(!store->open(err)) throw std::runtime_error("cannot open store: " + err);
    state = std::make_shared<TransferStateManager>(store, nullptr, ctx.logs.logger("state-manager"));
    ProcessRunner::Options ropts;
    ropts.cancel_grace = 500ms;
    runner = std::make_shared<ProcessRunner>(ropts, ctx.logs.logger("process-runner"));
    restart();
  }

  void restart() {
    JobConcurrencyController::Options copts;
    copts.default_limit = 2;
    controller = std::make_shared<JobConcurrencyController>(copts, nullptr, ctx.logs.logger("concurrency"));
    queue = std::make_shared<TransferQueue>(io, state, controller, TransferQueue::Options(),
                                            ctx.logs.logger("transfer-queue"));
    queue->set_dispatch_handler([this](const Transfer& t){ dispatched.push_back(t.transfer_id); });
    StateRecoveryService::Options sopts;
    sopts.retention = std::chrono::hours(24);
    recovery = std::make_shared<StateRecoveryService>(state, queue, controller, runner, sopts,
                                                      ctx.logs.logger("recovery"));
    dispatched.clear();
  }

  // A transfer that was mid-flight in a previous process.
  Transfer seed_transferring(const std::string& job, const std::string& file, int max_retries = 3) {
    Transfer t = admit(job, file, max_retries);
    TransitionDetails scheduled;
    scheduled.slot = 0;
    state->transition(t.transfer_id, TransferStatus::Scheduled, scheduled);
    return state->transition(t.transfer_id, TransferStatus::Transferring);
  }

  Transfer admit(const std::string& job, const std::string& file, int max_retries = 3) {
    auto spec = make_spec(job, file);
    spec.max_retries = max_retries;
    Transfer t = make_transfer(spec, 3);
    state->record_admission(t);
    return t;
  }

  TestContext& ctx;
  TempWorkspace workspace;
  asio::io_context io;
  std::shared_ptr<TransferStore> store;
  std::shared_ptr<TransferStateManager> state;
  std::shared_ptr<ProcessRunner> runner;
  std::shared_ptr<JobConcurrencyController> controller;
  std::shared_ptr<TransferQueue> queue;
  std::shared_ptr<StateRecoveryService> recovery;
  std::vector<std::string> dispatched;
};

bool has_issue(const ConsistencyReport& report, const std::string& kind, const std::string& transfer_id) {
  for(const auto& issue : report.issues) {
    if(issue.kind == kind && issue.transfer_id == transfer_id) return true;
  }
  return false;
}

bool test_orphan_detected_after_restart(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto t = f.seed_transferring("job-a", "f1");
  f.restart();

  auto orphans = f.recovery->detect_orphaned_transfers();
  if(orphans.size() != 1) return false;
  const auto& r = orphans.front();
  if(r.transfer_id != t.transfer_id || r.state != TransferStatus::Transferring || r.slot != 0) return false;

  if(!f.recovery->cleanup_orphaned_transfer(r)) return false;
  auto loaded = f.state->get(t.transfer_id);
  if(!loaded || loaded->status != TransferStatus::Queued || loaded->retry_count != 1) return false;
  if(!f.queue->is_pending(t.transfer_id)) return false;
  if(loaded->history.size() < 2) return false;
  const auto& failed = loaded->history[loaded->history.size() - 2];
  drain(f.io);
  return failed.to == TransferStatus::Failed &&
         failed.reason.find("orphaned in TRANSFERRING") != std::string::npos &&
         f.dispatched == std::vector<std::string>{t.transfer_id} &&
         f.recovery->detect_orphaned_transfers().empty();
}

bool test_queued_orphan_is_adopted(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto t = f.admit("job-a", "f1");
  f.restart();
  auto orphans = f.recovery->detect_orphaned_transfers();
  if(orphans.size() != 1 || !f.recovery->cleanup_orphaned_transfer(orphans.front())) return false;
  auto loaded = f.state->get(t.transfer_id);
  return loaded && loaded->status == TransferStatus::Queued && loaded->retry_count == 0 &&
         f.queue->is_pending(t.transfer_id);
}

bool test_orphan_without_retries_stays_failed(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto t = f.seed_transferring("job-a", "f1", 0);
  f.restart();
  auto orphans = f.recovery->detect_orphaned_transfers();
  if(orphans.size() != 1 || !f.recovery->cleanup_orphaned_transfer(orphans.front())) return false;
  auto loaded = f.state->get(t.transfer_id);
  return loaded && loaded->status == TransferStatus::Failed &&
         loaded->error_category == ErrorCategory::Consistency &&
         loaded->error_message.rfind("consistency: orphaned in", 0) == 0 &&
         !f.queue->is_tracked(t.transfer_id);
}

bool test_cleanup_skips_live_transfer(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto t = f.admit("job-a", "f1");
  f.restart();
  auto orphans = f.recovery->detect_orphaned_transfers();
  if(orphans.size() != 1) return false;
  // Adopted by someone else between detection and cleanup.
  if(!f.queue->requeue(*f.state->get(t.transfer_id))) return false;
  return !f.recovery->cleanup_orphaned_transfer(orphans.front());
}

bool test_tracked_transfers_not_orphaned(TestContext& ctx) {
  RecoveryFixture f(ctx);
  f.queue->add(make_spec("job-a", "f1"));
  f.queue->add(make_spec("job-a", "f2"));
  drain(f.io);
  return f.dispatched.size() == 2 && f.recovery->detect_orphaned_transfers().empty();
}

bool test_stuck_transfer_process_terminated(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto id = f.queue->add(make_spec("job-a", "f1"));
  drain(f.io);
  f.state->transition(id, TransferStatus::Transferring);

  auto pending = std::async(std::launch::async, [&]{
    return f.runner->run(id, {"/bin/sh", "-c", "sleep 10"}, nullptr);
  });
  if(!wait_for_condition([&]{ return f.runner->is_running(id); }, 2000ms)) return false;

  if(!f.recovery->detect_stuck_transfers(std::chrono::minutes(30)).empty()) return false;
  auto stuck = f.recovery->detect_stuck_transfers(std::chrono::minutes(0));
  if(stuck.size() != 1 || stuck.front().transfer_id != id || stuck.front().kind != RecoveryKind::Stuck) {
    f.runner->cancel(id);
    pending.get();
    return false;
  }
  f.recovery->recover_stuck_transfer(stuck.front());
  auto result = pending.get();
  return result.cancelled && result.cancel_reason == CancelReason::Stalled && !f.runner->is_running(id);
}

bool test_waiting_transfers_not_stuck(TestContext& ctx) {
  RecoveryFixture f(ctx);
  f.queue->add(make_spec("job-a", "f1"));
  return f.recovery->detect_stuck_transfers(std::chrono::minutes(0)).empty();
}

bool test_consistency_clean(TestContext& ctx) {
  RecoveryFixture f(ctx);
  f.queue->add(make_spec("job-a", "f1"));
  f.queue->add(make_spec("job-a", "f2"));
  f.queue->add(make_spec("job-a", "f3"));
  drain(f.io);
  auto report = f.recovery->validate_state_consistency();
  return report.consistent && report.issues.empty() &&
         report.stats.store_active == 3 && report.stats.queue_pending == 1 &&
         report.stats.in_flight == 2 && report.stats.occupied_slots == 2;
}

bool test_consistency_finds_problems(TestContext& ctx) {
  RecoveryFixture f(ctx);
  auto untracked = f.admit("job-a", "f1");
  auto twin = f.admit("job-a", "f1");
  f.controller->try_acquire_slot("job-ghost", "tr-ghost");
  auto report = f.recovery->validate_state_consistency();
  const auto json = report_to_json(report);
  return !report.consistent &&
         has_issue(report, "missing_in_memory", untracked.transfer_id) &&
         (has_issue(report, "duplicate_active_pair", twin.transfer_id) ||
          has_issue(report, "duplicate_active_pair", untracked.transfer_id)) &&
         has_issue(report, "slot_leak", "tr-ghost") &&
         json["consistent"] == false && json["issues"].size() == report.issues.size();
}

bool test_system_recovery_pass(TestContext& ctx) {
  RecoveryFixture f(ctx);
  f.seed_transferring("job-a", "f1");
  f.admit("job-a", "f2");
  auto done = f.admit("job-b", "f1");
  f.state->transition(done.transfer_id, TransferStatus::Cancelled);
  f.restart();
  f.controller->try_acquire_slot("job-ghost", "tr-ghost");

  auto report = f.recovery->perform_system_recovery();
  if(!report) return false;
  drain(f.io);
  auto after = f.recovery->validate_state_consistency();
  return report->orphans_found == 2 && report->orphans_recovered == 2 &&
         report->stuck_found == 0 && report->purged == 0 &&
         report->slots_released == 1 && !f.controller->holder_of("tr-ghost") &&
         report_to_json(*report)["slotsReleased"] == 1 &&
         f.dispatched.size() == 2 && report->consistency.consistent && after.consistent;
}

bool test_recovery_excludes_ticks(TestContext& ctx) {
  RecoveryFixture f(ctx);
  {
    auto tick = f.recovery->try_enter_tick();
    if(!tick.owns_lock()) return false;
    if(f.recovery->perform_system_recovery()) return false;
    // Ticks share the lock with each other.
    auto second = f.recovery->try_enter_tick();
    if(!second.owns_lock() || f.recovery->recovery_in_progress()) return false;
  }
  auto report = f.recovery->perform_system_recovery();
  return report.has_value() && !f.recovery->recovery_in_progress() && f.recovery->try_enter_tick().owns_lock();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"orphan_detected_after_restart", test_orphan_detected_after_restart},
    {"queued_orphan_is_adopted", test_queued_orphan_is_adopted},
    {"orphan_without_retries_stays_failed", test_orphan_without_retries_stays_failed},
    {"cleanup_skips_live_transfer", test_cleanup_skips_live_transfer},
    {"tracked_transfers_not_orphaned", test_tracked_transfers_not_orphaned},
    {"stuck_transfer_process_terminated", test_stuck_transfer_process_terminated},
    {"waiting_transfers_not_stuck", test_waiting_transfers_not_stuck},
    {"consistency_clean", test_consistency_clean},
    {"consistency_finds_problems", test_consistency_finds_problems},
    {"system_recovery_pass", test_system_recovery_pass},
    {"recovery_excludes_ticks", test_recovery_excludes_ticks}
  };
  return run_suite("recovery", tests, argc, argv);
}
