#include "errors.hpp"
#include "process_runner.hpp"
#include "settings_manager.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"
#include "transfer_store.hpp"
#include "test_runner_utils.hpp"

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace warpsync::test;

namespace {

using namespace std::chrono_literals;

const char* kFakeRsync =
  "printf '>f+++++++++ data.bin\\n'\n"
  "printf '            512  50%%    1.00kB/s    0:00:01\\r'\n"
  "printf '          1,024 100%%    2.00kB/s    0:00:00 (xfr#1, to-chk=0/1)\\n'\n"
  "printf 'Total transferred file size: 1,024 bytes\\n'\n"
  "exit 0\n";

// A full engine over a scratch workspace: fake SSH, a shell script in place
// of rsync and no timers or scheduler.
struct PipelineFixture {
  PipelineFixture(TestContext& ctx, const std::string& rsync_body)
    : ctx(ctx),
      workspace("pipeline"),
      factory(std::make_shared<FakeSshSessionFactory>()),
      catalog(std::make_shared<FakeJobCatalog>()) {
    rsync = write_executable_script(workspace.path("bin/fake-rsync"), rsync_body);
    settings = std::make_shared<SettingsManager>();
    set("database_path", workspace.path("state/transfers.db").string());
    set("event_port", -1);
    set("log_level", "trace");
    set("rsync_binary", rsync.string());
    set("progress_interval_ms", 50);
    set("cancel_grace_ms", 200);
    set("ssh_acquire_timeout_ms", 1000);
  }

  ~PipelineFixture() {
    if(engine) {
      ctx.logs.detach_all();
      engine->stop();
    }
  }

  void set(const std::string& key, const nlohmann::json& value) {
    std::string err;
    if(!settings->set_from_json(key, value, err)) {
      throw std::runtime_error("setting " + key + " rejected: " + err);
    }
  }

  void start() {
    SyncEngine::Options options;
    options.workspace_root = workspace.root();
    options.enable_timers = false;
    options.enable_scheduler = false;
    options.session_factory = factory;
    options.catalog = catalog;
    engine = std::make_unique<SyncEngine>(settings, options);
    ctx.logs.attach(*engine);
    engine->start_background();
  }

  TransferSpec spec(const std::string& file_id, int max_retries = 3) {
    auto s = make_spec("job-a", file_id, TransferPriority::Normal, workspace.path("downloads").string());
    s.max_retries = max_retries;
    return s;
  }

  std::optional<Transfer> get(const std::string& id) const {
    return engine->state()->get(id);
  }

  bool wait_for_status(const std::string& id, TransferStatus status,
                       std::chrono::milliseconds timeout = 5000ms) {
    return wait_for_condition([&]{
      auto t = get(id);
      return t && t->status == status;
    }, timeout);
  }

  TestContext& ctx;
  TempWorkspace workspace;
  std::shared_ptr<FakeSshSessionFactory> factory;
  std::shared_ptr<FakeJobCatalog> catalog;
  std::filesystem::path rsync;
  std::shared_ptr<SettingsManager> settings;
  std::unique_ptr<SyncEngine> engine;
};

bool test_transfer_completes(TestContext& ctx) {
  PipelineFixture f(ctx, kFakeRsync);
  f.start();
  const auto id = f.engine->queue()->add(f.spec("f1"));
  if(!f.wait_for_status(id, TransferStatus::Completed)) return false;

  auto t = f.get(id);
  std::vector<TransferStatus> path;
  for(const auto& change : t->history) path.push_back(change.to);
  const std::vector<TransferStatus> expected = {
    TransferStatus::Queued, TransferStatus::Scheduled,
    TransferStatus::Transferring, TransferStatus::Completed
  };
  // The slot goes back once the dispatch is closed.
  if(!wait_for_condition([&]{ return f.engine->queue()->in_flight_count() == 0; }, 2000ms)) return false;
  const auto stats = f.engine->stats();
  return path == expected && t->progress == 100.0 && t->bytes_transferred == 1024 &&
         t->completed_at.has_value() && t->retry_count == 0 &&
         std::filesystem::is_directory(f.workspace.path("downloads")) &&
         stats.pool.total == 1 && stats.pool.in_use == 0 &&
         f.engine->controller()->occupied_count("job-a") == 0;
}

bool test_partial_transfer_is_retried(TestContext& ctx) {
  const std::string marker = "\"$(dirname \"$0\")/attempted\"";
  PipelineFixture f(ctx,
    "if [ ! -f " + marker + " ]; then\n"
    "  touch " + marker + "\n"
    "  echo 'rsync error: some files could not be transferred (code 23)' >&2\n"
    "  exit 23\n"
    "fi\n" + std::string(kFakeRsync));
  f.start();
  const auto id = f.engine->queue()->add(f.spec("f1"));
  if(!f.wait_for_status(id, TransferStatus::Completed)) return false;

  auto t = f.get(id);
  bool saw_failure = false;
  for(const auto& change : t->history) {
    if(change.to == TransferStatus::Failed) saw_failure = true;
  }
  return t->retry_count == 1 && saw_failure;
}

bool test_connect_failure_exhausts_retries(TestContext& ctx) {
  PipelineFixture f(ctx, kFakeRsync);
  f.factory->set_fail(true);
  f.start();
  const auto id = f.engine->queue()->add(f.spec("f1", 1));
  // The first failure is retried, the second one is final.
  if(!wait_for_condition([&]{
    auto t = f.get(id);
    return t && t->status == TransferStatus::Failed && t->retry_count == 1 &&
           !f.engine->queue()->is_tracked(id);
  }, 5000ms)) {
    return false;
  }
  auto t = f.get(id);
  return t->error_category == ErrorCategory::Connection &&
         t->error_message.rfind("connection: ", 0) == 0 &&
         t->error_message.find("id_ed25519") == std::string::npos &&
         f.factory->opened() >= 2;
}

bool test_operator_cancel_stops_rsync(TestContext& ctx) {
  PipelineFixture f(ctx, "exec sleep 10\n");
  f.start();
  const auto id = f.engine->queue()->add(f.spec("f1"));
  if(!wait_for_condition([&]{ return f.engine->runner()->is_running(id); }, 3000ms)) return false;
  const auto started = std::chrono::steady_clock::now();
  if(!f.engine->queue()->cancel(id)) return false;
  if(!f.wait_for_status(id, TransferStatus::Cancelled, 3000ms)) return false;
  const auto elapsed = std::chrono::steady_clock::now() - started;
  return elapsed < 3s && !f.engine->runner()->is_running(id) &&
         wait_for_condition([&]{ return !f.engine->queue()->is_tracked(id); }, 2000ms);
}

bool test_restart_resumes_ledger(TestContext& ctx) {
  PipelineFixture f(ctx, kFakeRsync);
  const auto db = f.workspace.path("state/transfers.db");
  std::filesystem::create_directories(db.parent_path());
  std::string queued_id;
  std::string stale_id;
  {
    auto store = std::make_shared<TransferStore>(db.string());
    std::string err;
    if(!store->open(err)) return false;
    TransferStateManager state(store, nullptr, ctx.logs.logger("state-manager"));
    Transfer queued = make_transfer(f.spec("f1"), 3);
    state.record_admission(queued);
    queued_id = queued.transfer_id;

    // Left mid-flight by a process that died.
    Transfer stale = make_transfer(f.spec("f2"), 3);
    state.record_admission(stale);
    TransitionDetails scheduled;
    scheduled.slot = 0;
    state.transition(stale.transfer_id, TransferStatus::Scheduled, scheduled);
    state.transition(stale.transfer_id, TransferStatus::Transferring);
    stale_id = stale.transfer_id;
  }

  f.start();
  if(!f.wait_for_status(queued_id, TransferStatus::Completed)) return false;
  if(!f.wait_for_status(stale_id, TransferStatus::Completed)) return false;
  auto stale = f.get(stale_id);
  return stale->retry_count == 1 &&
         f.engine->recovery()->validate_state_consistency().consistent;
}

bool test_stop_interrupts_running_transfers(TestContext& ctx) {
  PipelineFixture f(ctx, "exec sleep 10\n");
  f.start();
  const auto id = f.engine->queue()->add(f.spec("f1"));
  if(!wait_for_condition([&]{ return f.engine->runner()->is_running(id); }, 3000ms)) return false;
  const auto started = std::chrono::steady_clock::now();
  ctx.logs.detach_all();
  f.engine->stop();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  if(elapsed >= 5s || f.engine->runner()->running_count() != 0) return false;

  // Shutdown is not an operator cancel: the record stays active.
  auto left = f.get(id);
  if(!left || left->status != TransferStatus::Transferring) return false;

  f.engine.reset();
  write_executable_script(f.rsync, kFakeRsync);
  f.start();
  if(!f.wait_for_status(id, TransferStatus::Completed)) return false;
  auto t = f.get(id);
  return t->retry_count == 1 && t->error_message.empty();
}

bool test_cancel_while_waiting_for_connection(TestContext& ctx) {
  PipelineFixture f(ctx, "exec sleep 10\n");
  f.set("ssh_acquire_timeout_ms", 30000);
  // Two slots for the job but one connection to its server.
  JobRecord job;
  job.id = "job-a";
  job.remote_path = "/srv/data";
  job.local_path = f.workspace.path("downloads").string();
  job.server = test_target();
  job.max_concurrent_transfers = 2;
  job.max_connections = 1;
  f.catalog->put(job);
  f.start();
  const auto holder = f.engine->queue()->add(f.spec("f1"));
  if(!wait_for_condition([&]{ return f.engine->runner()->is_running(holder); }, 3000ms)) return false;
  const auto waiter = f.engine->queue()->add(f.spec("f2"));
  if(!f.wait_for_status(waiter, TransferStatus::Scheduled, 3000ms)) return false;
  std::this_thread::sleep_for(100ms);

  const auto started = std::chrono::steady_clock::now();
  if(!f.engine->queue()->cancel(waiter)) return false;
  if(!f.wait_for_status(waiter, TransferStatus::Cancelled, 3000ms)) return false;
  const auto elapsed = std::chrono::steady_clock::now() - started;
  const bool holder_untouched = f.engine->runner()->is_running(holder);

  f.engine->queue()->cancel(holder);
  return elapsed < 2s && holder_untouched && f.factory->opened() == 1 &&
         f.wait_for_status(holder, TransferStatus::Cancelled, 3000ms) &&
         f.engine->runner()->pending_cancel_count() == 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"transfer_completes", test_transfer_completes},
    {"partial_transfer_is_retried", test_partial_transfer_is_retried},
    {"connect_failure_exhausts_retries", test_connect_failure_exhausts_retries},
    {"operator_cancel_stops_rsync", test_operator_cancel_stops_rsync},
    {"restart_resumes_ledger", test_restart_resumes_ledger},
    {"stop_interrupts_running_transfers", test_stop_interrupts_running_transfers},
    {"cancel_while_waiting_for_connection", test_cancel_while_waiting_for_connection}
  };
  return run_suite("transfer pipeline", tests, argc, argv);
}
