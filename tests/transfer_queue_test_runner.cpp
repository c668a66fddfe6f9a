#include "concurrency_controller.hpp"
#include "errors.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"
#include "transfer_store.hpp"
#include "test_runner_utils.hpp"

#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace warpsync::test;

namespace {

struct QueueFixture {
  QueueFixture(TestContext& ctx,
               TransferQueue::Options options,
               int job_limit = 5,
               JobConcurrencyController::LimitProvider provider = nullptr)
    : workspace("queue") {
    store = std::make_shared<TransferStore>(workspace.path("transfers.db").string());
    std::string err;
    if(!store->open(err)) throw std::runtime_error("cannot open store: " + err);
    state = std::make_shared<TransferStateManager>(store, nullptr, ctx.logs.logger("state-manager"));
    JobConcurrencyController::Options copts;
    copts.default_limit = job_limit;
    controller = std::make_shared<JobConcurrencyController>(copts, std::move(provider),
                                                            ctx.logs.logger("concurrency"));
    queue = make_queue(ctx, options);
  }

  std::shared_ptr<TransferQueue> make_queue(TestContext& ctx, TransferQueue::Options options) {
    auto q = std::make_shared<TransferQueue>(io, state, controller, options, ctx.logs.logger("transfer-queue"));
    q->set_dispatch_handler([this](const Transfer& t){ dispatched.push_back(t); });
    q->set_cancel_handler([this](const std::string& id, bool was_dispatched){
      (was_dispatched ? cancel_signals : untracked_signals).push_back(id);
    });
    return q;
  }

  std::vector<std::string> dispatched_ids() const {
    std::vector<std::string> ids;
    for(const auto& t : dispatched) ids.push_back(t.transfer_id);
    return ids;
  }

  TempWorkspace workspace;
  asio::io_context io;
  std::shared_ptr<TransferStore> store;
  std::shared_ptr<TransferStateManager> state;
  std::shared_ptr<JobConcurrencyController> controller;
  std::shared_ptr<TransferQueue> queue;
  std::vector<Transfer> dispatched;
  std::vector<std::string> cancel_signals;
  std::vector<std::string> untracked_signals;
};

TransferQueue::Options queue_options(std::size_t max_concurrent, std::size_t max_size = 100) {
  TransferQueue::Options o;
  o.max_concurrent_transfers = max_concurrent;
  o.max_queue_size = max_size;
  return o;
}

bool test_priority_order(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(3));
  auto low = f.queue->add(make_spec("job-a", "low", TransferPriority::Low));
  auto urgent = f.queue->add(make_spec("job-a", "urgent", TransferPriority::Urgent));
  auto normal = f.queue->add(make_spec("job-a", "normal", TransferPriority::Normal));
  drain(f.io);
  return f.dispatched_ids() == std::vector<std::string>{urgent, normal, low};
}

bool test_fifo_within_priority(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  std::vector<std::string> ids;
  for(const char* file : {"f1", "f2", "f3"}) {
    ids.push_back(f.queue->add(make_spec("job-a", file, TransferPriority::High)));
  }
  for(std::size_t i = 0; i < ids.size(); ++i) {
    drain(f.io);
    if(f.dispatched.size() != i + 1) return false;
    f.queue->complete_dispatch(f.dispatched.back().transfer_id, std::nullopt);
  }
  return f.dispatched_ids() == ids;
}

bool test_duplicate_pair_returns_existing(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto first = f.queue->add(make_spec("job-a", "f1"));
  auto again = f.queue->add(make_spec("job-a", "f1", TransferPriority::Urgent));
  if(first != again || f.queue->depth() != 1) return false;
  f.queue->cancel(first);
  auto fresh = f.queue->add(make_spec("job-a", "f1"));
  return fresh != first && f.queue->depth() == 1;
}

bool test_queue_full_rejected(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1, 2));
  f.queue->add(make_spec("job-a", "f1"));
  auto second = f.queue->add(make_spec("job-a", "f2"));
  try {
    f.queue->add(make_spec("job-a", "f3"));
    return false;
  } catch(const ValidationError& e) {
    if(std::string(e.what()).find("queue is full") == std::string::npos) return false;
  }
  // A duplicate is still answered while full.
  return f.queue->add(make_spec("job-a", "f2")) == second;
}

bool test_invalid_spec_rejected(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto spec = make_spec("job-a", "f1");
  spec.destination = "relative/path.bin";
  try {
    f.queue->add(spec);
  } catch(const ValidationError& e) {
    return std::string(e.what()).find("local path must be absolute") != std::string::npos &&
           f.queue->depth() == 0 && f.state->find(TransferFilter()).empty();
  }
  return false;
}

bool test_batch_skips_invalid(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto bad = make_spec("job-a", "bad");
  bad.ssh.host.clear();
  auto ids = f.queue->add_batch({make_spec("job-a", "f1"), bad, make_spec("job-a", "f2")});
  return ids.size() == 2 && f.queue->depth() == 2;
}

bool test_global_limit(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(2));
  for(const char* job : {"job-a", "job-b", "job-c", "job-d"}) {
    f.queue->add(make_spec(job, "f1"));
  }
  drain(f.io);
  return f.dispatched.size() == 2 && f.queue->in_flight_count() == 2 && f.queue->depth() == 2;
}

bool test_job_limit_skips_to_other_jobs(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(3), 1);
  auto a1 = f.queue->add(make_spec("job-a", "f1", TransferPriority::Urgent));
  auto a2 = f.queue->add(make_spec("job-a", "f2", TransferPriority::Urgent));
  auto b1 = f.queue->add(make_spec("job-b", "f1", TransferPriority::Low));
  drain(f.io);
  if(f.dispatched_ids() != std::vector<std::string>{a1, b1}) return false;
  if(!f.queue->is_pending(a2)) return false;
  auto held = f.state->get(a1);
  if(!held || held->status != TransferStatus::Scheduled || held->concurrency_slot != 0) return false;

  f.queue->complete_dispatch(a1, std::nullopt);
  drain(f.io);
  return f.dispatched.size() == 3 && f.dispatched.back().transfer_id == a2 &&
         f.controller->occupied_count("job-a") == 1;
}

bool test_limit_from_provider(TestContext& ctx) {
  auto provider = [](const std::string& job_id) -> std::optional<int> {
    if(job_id == "job-wide") return 3;
    return std::nullopt;
  };
  QueueFixture f(ctx, queue_options(10), 1, provider);
  for(const char* file : {"f1", "f2", "f3", "f4"}) {
    f.queue->add(make_spec("job-wide", file));
    f.queue->add(make_spec("job-narrow", file));
  }
  drain(f.io);
  return f.controller->occupied_count("job-wide") == 3 &&
         f.controller->occupied_count("job-narrow") == 1 &&
         f.dispatched.size() == 4;
}

bool test_concurrent_add_admits_once(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  const auto spec = make_spec("job-a", "f1");
  std::vector<std::string> ids(8);
  std::vector<std::thread> threads;
  for(std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i]{ ids[i] = f.queue->add(spec); });
  }
  for(auto& t : threads) t.join();
  drain(f.io);

  TransferFilter filter;
  filter.job_id = "job-a";
  filter.file_id = "f1";
  const auto rows = f.state->find(filter);
  const std::set<std::string> distinct(ids.begin(), ids.end());
  return distinct.size() == 1 && !ids.front().empty() && rows.size() == 1 &&
         rows.front().transfer_id == ids.front() && f.dispatched.size() == 1;
}

bool test_cancel_pending(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto id = f.queue->add(make_spec("job-a", "f1"));
  if(!f.queue->cancel(id)) return false;
  drain(f.io);
  auto loaded = f.state->get(id);
  return f.dispatched.empty() && f.queue->depth() == 0 && !f.queue->is_tracked(id) &&
         loaded && loaded->status == TransferStatus::Cancelled && f.cancel_signals.empty();
}

bool test_cancel_dispatched_signals_runner(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto id = f.queue->add(make_spec("job-a", "f1"));
  drain(f.io);
  if(f.dispatched.size() != 1) return false;
  if(!f.queue->cancel(id) || !f.queue->cancel(id)) return false;
  return f.cancel_signals == std::vector<std::string>{id} && f.queue->cancel_requested(id) &&
         f.queue->is_in_flight(id);
}

bool test_cancel_untracked_scheduled(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  Transfer t = make_transfer(make_spec("job-a", "f1"), 3);
  f.state->record_admission(t);
  f.state->transition(t.transfer_id, TransferStatus::Scheduled);
  if(!f.queue->cancel(t.transfer_id)) return false;
  auto loaded = f.state->get(t.transfer_id);
  return f.cancel_signals.empty() &&
         f.untracked_signals == std::vector<std::string>{t.transfer_id} &&
         loaded && loaded->status == TransferStatus::Cancelled;
}

bool test_cancel_unknown(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  return !f.queue->cancel("tr-unknown");
}

bool test_retry_is_requeued(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(1));
  auto id = f.queue->add(make_spec("job-a", "f1"));
  drain(f.io);
  if(f.dispatched.size() != 1) return false;
  f.state->transition(id, TransferStatus::Transferring);
  TransitionDetails failed;
  failed.reason = "exit 23";
  f.state->transition(id, TransferStatus::Failed, failed);
  auto retry = f.state->schedule_retry(id);
  f.queue->complete_dispatch(id, retry);
  drain(f.io);
  return retry && f.dispatched.size() == 2 && f.dispatched.back().transfer_id == id &&
         f.dispatched.back().retry_count == 1 && f.controller->occupied_count() == 1;
}

bool test_rehydrate_restores_order(TestContext& ctx) {
  QueueFixture f(ctx, queue_options(3));
  std::vector<std::string> ids;
  for(const char* file : {"f1", "f2", "f3"}) {
    Transfer t = make_transfer(make_spec("job-a", file), 3);
    f.state->record_admission(t);
    ids.push_back(t.transfer_id);
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
  }
  Transfer done = make_transfer(make_spec("job-a", "f4"), 3);
  f.state->record_admission(done);
  f.state->transition(done.transfer_id, TransferStatus::Cancelled);

  if(f.queue->rehydrate() != 3) return false;
  if(f.queue->rehydrate() != 0) return false;
  drain(f.io);
  return f.dispatched_ids() == ids;
}

// Random admissions and completions never exceed a job's limit, never hand
// out one slot twice, and never exceed the global cap.
bool test_slot_invariant_random(TestContext& ctx) {
  const int job_limit = 2;
  const std::size_t global = 4;
  QueueFixture f(ctx, queue_options(global, 500), job_limit);
  std::mt19937 rng(1234);
  const char* jobs[] = {"job-a", "job-b", "job-c"};
  int next_file = 0;
  std::set<std::string> running;
  std::set<std::string> seen;

  for(int step = 0; step < 300; ++step) {
    const int op = static_cast<int>(rng() % 3);
    if(op < 2) {
      const char* job = jobs[rng() % 3];
      auto priority = static_cast<TransferPriority>(rng() % 4);
      f.queue->add(make_spec(job, "f" + std::to_string(next_file++), priority));
    } else if(!running.empty()) {
      auto it = running.begin();
      std::advance(it, static_cast<long>(rng() % running.size()));
      f.queue->complete_dispatch(*it, std::nullopt);
      running.erase(it);
    }
    drain(f.io);
    for(const auto& t : f.dispatched) {
      if(seen.insert(t.transfer_id).second) running.insert(t.transfer_id);
    }

    if(f.queue->in_flight_count() > global) return false;
    for(const auto& job : f.controller->occupancy()) {
      if(static_cast<int>(job.second.size()) > job_limit) return false;
      std::set<std::string> holders;
      for(const auto& slot : job.second) {
        if(slot.first < 0 || slot.first >= job_limit) return false;
        if(!holders.insert(slot.second).second) return false;
      }
    }
    if(f.controller->occupied_count() != running.size()) return false;
  }
  return true;
}

bool test_controller_lowest_free_slot(TestContext& ctx) {
  JobConcurrencyController::Options o;
  o.default_limit = 3;
  JobConcurrencyController c(o, nullptr, ctx.logs.logger("concurrency"));
  auto s0 = c.try_acquire_slot("job-a", "t0");
  auto s1 = c.try_acquire_slot("job-a", "t1");
  auto s2 = c.try_acquire_slot("job-a", "t2");
  auto refused = c.try_acquire_slot("job-a", "t3");
  if(!s0 || !s1 || !s2 || refused) return false;
  if(!c.release_slot("job-a", 1)) return false;
  if(c.release_slot("job-a", 1)) return false;
  auto reused = c.try_acquire_slot("job-a", "t4");
  auto holder = c.holder_of("t4");
  return reused == 1 && holder && holder->slot == 1 && holder->job_id == "job-a" &&
         c.release_slot_by_transfer("t4") && !c.holder_of("t4");
}

bool test_controller_limit_cache(TestContext& ctx) {
  int lookups = 0;
  JobConcurrencyController::Options o;
  o.default_limit = 1;
  o.limit_cache_ttl = std::chrono::minutes(5);
  JobConcurrencyController c(o, [&lookups](const std::string&) -> std::optional<int> {
    ++lookups;
    return 2;
  }, ctx.logs.logger("concurrency"));

  auto first = c.try_acquire_slot("job-a", "t1");
  auto second = c.try_acquire_slot("job-a", "t2");
  auto refused = c.try_acquire_slot("job-a", "t3");
  auto again = c.try_acquire_slot("job-a", "t4");
  const auto stats = c.get_cache_stats();
  if(first != 0 || second != 1 || refused || again) return false;
  if(lookups != 1 || stats.misses != 1 || stats.hits < 3) return false;

  c.invalidate_limit("job-a");
  c.limit_for("job-a");
  return lookups == 2 && c.get_cache_stats().occupied_slots == 2;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"priority_order", test_priority_order},
    {"fifo_within_priority", test_fifo_within_priority},
    {"duplicate_pair_returns_existing", test_duplicate_pair_returns_existing},
    {"queue_full_rejected", test_queue_full_rejected},
    {"invalid_spec_rejected", test_invalid_spec_rejected},
    {"batch_skips_invalid", test_batch_skips_invalid},
    {"global_limit", test_global_limit},
    {"job_limit_skips_to_other_jobs", test_job_limit_skips_to_other_jobs},
    {"limit_from_provider", test_limit_from_provider},
    {"concurrent_add_admits_once", test_concurrent_add_admits_once},
    {"cancel_pending", test_cancel_pending},
    {"cancel_dispatched_signals_runner", test_cancel_dispatched_signals_runner},
    {"cancel_untracked_scheduled", test_cancel_untracked_scheduled},
    {"cancel_unknown", test_cancel_unknown},
    {"retry_is_requeued", test_retry_is_requeued},
    {"rehydrate_restores_order", test_rehydrate_restores_order},
    {"slot_invariant_random", test_slot_invariant_random},
    {"controller_lowest_free_slot", test_controller_lowest_free_slot},
    {"controller_limit_cache", test_controller_limit_cache}
  };
  return run_suite("transfer queue", tests, argc, argv);
}
