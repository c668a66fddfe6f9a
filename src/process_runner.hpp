#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rsync_progress_parser.hpp"
#include "transfer_types.hpp"

class Logger;
class SshSession;

enum class CancelReason { Operator, Stalled, Shutdown };

const char* to_string(CancelReason reason);

struct ProcessResult {
  int exit_code = -1;
  int term_signal = 0;
  bool spawned = false;
  bool cancelled = false;
  CancelReason cancel_reason = CancelReason::Operator;
  bool timed_out = false;
  std::string error;
  std::string stderr_tail;

  bool ok() const { return spawned && !cancelled && !timed_out && exit_code == 0; }
};

struct RsyncExitInfo {
  bool retryable = true;
  std::string description;
};

RsyncExitInfo classify_rsync_exit(int exit_code, bool cancelled);

struct TransferOutcome {
  bool success = false;
  bool cancelled = false;
  // Stopped by engine shutdown; the record is left as is for the next start.
  bool interrupted = false;
  bool retryable = false;
  ErrorCategory category = ErrorCategory::Transfer;
  std::string error_message;
  int exit_code = 0;
  std::uint64_t bytes_transferred = 0;
  RsyncStats stats;
};

// Spawns external commands in their own process group and tracks them by key
// (a transfer id, or "scan:<job>" for scanner runs) so they can be cancelled
// from any thread. Every child is reaped before run() returns.
class ProcessRunner {
public:
  using LineHandler = std::function<void(const std::string& line, bool from_stderr)>;
  using ProgressHandler = std::function<void(const ProgressUpdate& progress)>;

  struct Options {
    std::string rsync_binary = "rsync";
    std::chrono::milliseconds progress_interval{1000};
    std::chrono::milliseconds cancel_grace{5000};
    int ssh_connect_timeout_seconds = 30;
  };

  explicit ProcessRunner(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~ProcessRunner();

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  // Blocks until the process is gone. A zero timeout means none.
  ProcessResult run(const std::string& key,
                    const std::vector<std::string>& argv,
                    const LineHandler& on_line,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  // Preflight plus one rsync run for the transfer. Never throws for
  // per-transfer failures; they come back in the outcome.
  TransferOutcome execute(const Transfer& transfer,
                          SshSession* session,
                          const ProgressHandler& on_progress);

  // Returns true if a running process was signalled. A cancel for a key that
  // is not running yet is remembered until clear_cancel().
  bool cancel(const std::string& key, CancelReason reason = CancelReason::Operator);
  // Like cancel() but only touches a running process; nothing is remembered.
  bool signal_running(const std::string& key, CancelReason reason);
  void clear_cancel(const std::string& key);
  // Signals every running process and refuses later run() calls with the
  // same reason.
  void cancel_all(CancelReason reason = CancelReason::Operator);

  std::size_t pending_cancel_count() const;

  bool is_running(const std::string& key) const;
  std::vector<std::string> running_keys() const;
  std::size_t running_count() const;

  const Options& options() const { return options_; }

private:
  struct RunningProcess {
    pid_t pid = -1;
    bool cancel_requested = false;
    CancelReason reason = CancelReason::Operator;
  };

  bool preflight(const Transfer& transfer, SshSession* session, TransferOutcome& outcome);

  Options options_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::map<std::string, RunningProcess> running_;
  std::map<std::string, CancelReason> pending_cancel_;
  std::optional<CancelReason> closed_reason_;
};
