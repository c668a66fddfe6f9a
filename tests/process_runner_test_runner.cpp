#include "process_runner.hpp"
#include "test_runner_utils.hpp"

#include <csignal>
#include <future>
#include <mutex>
#include <string>
#include <vector>

using namespace warpsync::test;

namespace {

using namespace std::chrono_literals;

ProcessRunner::Options runner_options(const std::string& rsync_binary = "rsync") {
  ProcessRunner::Options o;
  o.rsync_binary = rsync_binary;
  o.progress_interval = 0ms;
  o.cancel_grace = 500ms;
  o.ssh_connect_timeout_seconds = 5;
  return o;
}

struct LineLog {
  std::mutex mutex;
  std::vector<std::string> out;
  std::vector<std::string> err;

  ProcessRunner::LineHandler handler() {
    return [this](const std::string& line, bool from_stderr) {
      std::lock_guard<std::mutex> lock(mutex);
      (from_stderr ? err : out).push_back(line);
    };
  }
};

std::vector<std::string> sh(const std::string& script) {
  return {"/bin/sh", "-c", script};
}

Transfer download_into(const TempWorkspace& ws, const std::string& name = "data.bin") {
  Transfer t = make_transfer(make_spec("job-a", "f1", TransferPriority::Normal,
                                       ws.path("out/nested").string()), 3);
  t.filename = name;
  t.destination = ws.path("out/nested/" + name).string();
  return t;
}

const char* kProgressScript =
  "printf '>f+++++++++ data.bin\\n'\n"
  "printf '            512  50%%    1.00kB/s    0:00:01\\r'\n"
  "printf '          1,024 100%%    2.00kB/s    0:00:00 (xfr#1, to-chk=0/1)\\n'\n"
  "printf 'Number of files: 1\\n'\n"
  "printf 'Total transferred file size: 1,024 bytes\\n'\n"
  "printf 'sent 100 bytes  received 1,100 bytes  800.00 bytes/sec\\n'\n";

bool test_run_captures_output_and_exit(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  LineLog lines;
  auto result = runner.run("k", sh("echo hello; echo oops >&2; exit 3"), lines.handler());
  return result.spawned && result.exit_code == 3 && !result.ok() &&
         lines.out == std::vector<std::string>{"hello"} &&
         lines.err == std::vector<std::string>{"oops"} &&
         result.stderr_tail == "oops" && runner.running_count() == 0;
}

bool test_carriage_return_splits_lines(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  LineLog lines;
  auto result = runner.run("k", sh("printf 'one\\rtwo\\r\\nthree'"), lines.handler());
  return result.ok() && lines.out == std::vector<std::string>{"one", "two", "three"};
}

bool test_stderr_tail_bounded(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto result = runner.run("k", sh("i=1; while [ $i -le 30 ]; do echo line$i >&2; i=$((i+1)); done; exit 1"),
                           nullptr);
  return result.exit_code == 1 &&
         result.stderr_tail.rfind("line11\n", 0) == 0 &&
         result.stderr_tail.size() >= 6 &&
         result.stderr_tail.substr(result.stderr_tail.size() - 6) == "line30";
}

bool test_missing_binary(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto result = runner.run("k", {"/nonexistent/warpsync-rsync"}, nullptr);
  return result.spawned && result.exit_code == 127 &&
         result.stderr_tail.find("cannot execute") != std::string::npos;
}

bool test_empty_command_rejected(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto result = runner.run("k", {}, nullptr);
  return !result.spawned && !result.error.empty();
}

bool test_duplicate_key_rejected(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto first = std::async(std::launch::async, [&]{ return runner.run("k", sh("sleep 10"), nullptr); });
  if(!wait_for_condition([&]{ return runner.is_running("k"); }, 2000ms)) return false;
  auto second = runner.run("k", sh("true"), nullptr);
  runner.cancel("k");
  auto r = first.get();
  return !second.spawned && second.error.find("already running") != std::string::npos && r.cancelled;
}

bool test_timeout_terminates(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  const auto started = std::chrono::steady_clock::now();
  auto result = runner.run("k", sh("sleep 10"), nullptr, 200ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  return result.timed_out && !result.ok() && elapsed < 5s && runner.running_count() == 0;
}

bool test_cancel_running_process(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto pending = std::async(std::launch::async, [&]{ return runner.run("tr-1", sh("sleep 10"), nullptr); });
  if(!wait_for_condition([&]{ return runner.is_running("tr-1"); }, 2000ms)) return false;
  if(runner.running_keys() != std::vector<std::string>{"tr-1"}) return false;
  const auto started = std::chrono::steady_clock::now();
  if(!runner.cancel("tr-1", CancelReason::Stalled)) return false;
  auto result = pending.get();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  return result.cancelled && result.cancel_reason == CancelReason::Stalled &&
         elapsed < 3s && !runner.is_running("tr-1");
}

bool test_cancel_escalates_to_kill(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  auto pending = std::async(std::launch::async, [&]{
    return runner.run("tr-1", sh("trap '' TERM; sleep 10"), nullptr);
  });
  if(!wait_for_condition([&]{ return runner.is_running("tr-1"); }, 2000ms)) return false;
  // Give the shell time to install its trap.
  std::this_thread::sleep_for(100ms);
  const auto started = std::chrono::steady_clock::now();
  runner.cancel("tr-1");
  auto result = pending.get();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  return result.cancelled && result.term_signal == SIGKILL && elapsed >= 400ms && elapsed < 5s &&
         ctx.logs.contains("sending SIGKILL");
}

bool test_cancel_before_start(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  if(runner.cancel("tr-1")) return false;
  auto skipped = runner.run("tr-1", sh("exit 0"), nullptr);
  if(!skipped.cancelled || skipped.spawned) return false;

  runner.cancel("tr-2");
  runner.clear_cancel("tr-2");
  auto ran = runner.run("tr-2", sh("exit 0"), nullptr);
  return ran.ok();
}

bool test_signal_running_remembers_nothing(TestContext& ctx) {
  ProcessRunner runner(runner_options(), ctx.logs.logger("process-runner"));
  if(runner.signal_running("tr-1", CancelReason::Operator)) return false;
  if(runner.pending_cancel_count() != 0) return false;
  auto ran = runner.run("tr-1", sh("exit 0"), nullptr);
  if(!ran.ok()) return false;

  auto pending = std::async(std::launch::async, [&]{ return runner.run("tr-2", sh("sleep 10"), nullptr); });
  if(!wait_for_condition([&]{ return runner.is_running("tr-2"); }, 2000ms)) return false;
  if(!runner.signal_running("tr-2", CancelReason::Operator)) return false;
  auto result = pending.get();
  return result.cancelled && runner.pending_cancel_count() == 0;
}

bool test_shutdown_closes_runner(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto script = write_executable_script(ws.path("fake-rsync"), "sleep 10\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));
  runner.cancel("tr-stale");
  Transfer t = download_into(ws);
  auto pending = std::async(std::launch::async, [&]{ return runner.execute(t, nullptr, nullptr); });
  if(!wait_for_condition([&]{ return runner.is_running(t.transfer_id); }, 2000ms)) return false;
  runner.cancel_all(CancelReason::Shutdown);
  auto outcome = pending.get();
  auto later = runner.run("scan:job-a", sh("exit 0"), nullptr);
  return outcome.interrupted && !outcome.cancelled && !outcome.retryable &&
         later.cancelled && !later.spawned && later.cancel_reason == CancelReason::Shutdown &&
         runner.pending_cancel_count() == 0 && std::string(to_string(CancelReason::Shutdown)) == "shutdown";
}

bool test_execute_reports_progress(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto args_file = ws.path("args.txt");
  auto script = write_executable_script(ws.path("fake-rsync"),
    std::string(kProgressScript) + "echo \"$@\" > '" + args_file.string() + "'\nexit 0\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));

  Transfer t = download_into(ws);
  std::vector<ProgressUpdate> updates;
  auto outcome = runner.execute(t, nullptr, [&](const ProgressUpdate& p){ updates.push_back(p); });

  const std::string args = read_file(args_file);
  return outcome.success && outcome.bytes_transferred == 1024 &&
         outcome.stats.seen && outcome.stats.bytes_received == 1100 &&
         updates.size() == 2 && updates.front().percent == 50.0 &&
         updates.back().percent == 100.0 && updates.back().bytes_transferred == 1024 &&
         std::filesystem::is_directory(ws.path("out/nested")) &&
         args.find("sync@files.example.test:") != std::string::npos &&
         args.find(t.destination) != std::string::npos &&
         !ctx.logs.contains("id_ed25519");
}

bool test_execute_emits_final_progress(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto script = write_executable_script(ws.path("fake-rsync"), "exit 0\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));
  std::vector<ProgressUpdate> updates;
  auto outcome = runner.execute(download_into(ws), nullptr, [&](const ProgressUpdate& p){ updates.push_back(p); });
  return outcome.success && updates.size() == 1 && updates.front().percent == 100.0;
}

bool test_execute_classifies_failures(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto partial = write_executable_script(ws.path("rsync-23"),
    "echo 'rsync: some files vanished' >&2\nexit 23\n");
  auto ssh_down = write_executable_script(ws.path("rsync-255"),
    "echo 'ssh: connect to host files.example.test port 2222: Connection refused' >&2\nexit 255\n");
  auto usage = write_executable_script(ws.path("rsync-1"), "exit 1\n");
  auto timeout = write_executable_script(ws.path("rsync-30"), "exit 30\n");

  auto run_with = [&](const std::filesystem::path& binary) {
    ProcessRunner runner(runner_options(binary.string()), ctx.logs.logger("process-runner"));
    return runner.execute(download_into(ws), nullptr, nullptr);
  };

  auto o23 = run_with(partial);
  auto o255 = run_with(ssh_down);
  auto o1 = run_with(usage);
  auto o30 = run_with(timeout);
  return !o23.success && o23.retryable && o23.exit_code == 23 &&
         o23.category == ErrorCategory::Transfer &&
         o23.error_message.find("transfer: rsync exited with code 23") == 0 &&
         o23.error_message.find("some files vanished") != std::string::npos &&
         o255.retryable && o255.category == ErrorCategory::Connection &&
         !o1.retryable && o1.exit_code == 1 &&
         o30.retryable && o30.category == ErrorCategory::Timeout;
}

bool test_execute_cancel_outcomes(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto script = write_executable_script(ws.path("fake-rsync"), "sleep 10\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));

  auto run_and_cancel = [&](CancelReason reason) {
    Transfer t = download_into(ws);
    auto pending = std::async(std::launch::async, [&]{ return runner.execute(t, nullptr, nullptr); });
    wait_for_condition([&]{ return runner.is_running(t.transfer_id); }, 2000ms);
    runner.cancel(t.transfer_id, reason);
    return pending.get();
  };

  auto by_operator = run_and_cancel(CancelReason::Operator);
  auto stalled = run_and_cancel(CancelReason::Stalled);
  return by_operator.cancelled && !by_operator.retryable &&
         by_operator.category == ErrorCategory::Cancelled &&
         !stalled.cancelled && stalled.retryable && stalled.category == ErrorCategory::Timeout;
}

bool test_execute_rejects_invalid_transfer(TestContext& ctx) {
  TempWorkspace ws("runner");
  ProcessRunner runner(runner_options("/bin/true"), ctx.logs.logger("process-runner"));
  Transfer t = download_into(ws);
  t.ssh.user.clear();
  auto outcome = runner.execute(t, nullptr, nullptr);
  return !outcome.success && !outcome.retryable && outcome.category == ErrorCategory::Validation;
}

Transfer upload_to(const std::string& remote) {
  Transfer t = make_transfer(make_spec("job-up", "f1"), 3);
  t.type = TransferType::Upload;
  t.source = "/tmp/warpsync-test/f1.bin";
  t.destination = remote;
  return t;
}

bool test_upload_preflight_creates_remote_dir(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto script = write_executable_script(ws.path("fake-rsync"), "exit 0\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));
  auto state = std::make_shared<FakeSessionState>();
  FakeSshSession session(state);

  auto outcome = runner.execute(upload_to("/srv/in/sub dir/f1.bin"), &session, nullptr);
  const auto commands = state->executed();
  return outcome.success && commands.size() == 1 && commands.front() == "mkdir -p '/srv/in/sub dir'";
}

bool test_upload_preflight_failures(TestContext& ctx) {
  TempWorkspace ws("runner");
  auto script = write_executable_script(ws.path("fake-rsync"), "exit 0\n");
  ProcessRunner runner(runner_options(script.string()), ctx.logs.logger("process-runner"));

  auto refused = std::make_shared<FakeSessionState>();
  refused->exec_status = 1;
  FakeSshSession refusing(refused);
  auto o1 = runner.execute(upload_to("/srv/in/sub/f1.bin"), &refusing, nullptr);

  auto broken = std::make_shared<FakeSessionState>();
  broken->exec_status = -1;
  FakeSshSession channel_down(broken);
  auto o2 = runner.execute(upload_to("/srv/in/sub/f1.bin"), &channel_down, nullptr);

  auto unused = std::make_shared<FakeSessionState>();
  FakeSshSession root_level(unused);
  auto o3 = runner.execute(upload_to("/f1.bin"), &root_level, nullptr);

  return !o1.success && o1.retryable && o1.category == ErrorCategory::Transfer &&
         o1.error_message.find("remote mkdir exited with 1") != std::string::npos &&
         !o2.success && o2.retryable && o2.category == ErrorCategory::Connection &&
         o3.success && unused->executed().empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"run_captures_output_and_exit", test_run_captures_output_and_exit},
    {"carriage_return_splits_lines", test_carriage_return_splits_lines},
    {"stderr_tail_bounded", test_stderr_tail_bounded},
    {"missing_binary", test_missing_binary},
    {"empty_command_rejected", test_empty_command_rejected},
    {"duplicate_key_rejected", test_duplicate_key_rejected},
    {"timeout_terminates", test_timeout_terminates},
    {"cancel_running_process", test_cancel_running_process},
    {"cancel_escalates_to_kill", test_cancel_escalates_to_kill},
    {"cancel_before_start", test_cancel_before_start},
    {"signal_running_remembers_nothing", test_signal_running_remembers_nothing},
    {"shutdown_closes_runner", test_shutdown_closes_runner},
    {"execute_reports_progress", test_execute_reports_progress},
    {"execute_emits_final_progress", test_execute_emits_final_progress},
    {"execute_classifies_failures", test_execute_classifies_failures},
    {"execute_cancel_outcomes", test_execute_cancel_outcomes},
    {"execute_rejects_invalid_transfer", test_execute_rejects_invalid_transfer},
    {"upload_preflight_creates_remote_dir", test_upload_preflight_creates_remote_dir},
    {"upload_preflight_failures", test_upload_preflight_failures}
  };
  return run_suite("process runner", tests, argc, argv);
}
