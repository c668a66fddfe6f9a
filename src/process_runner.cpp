#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <filesystem>
#include <optional>
#include <thread>

#include "log.hpp"
#include "rsync_command_builder.hpp"
#include "ssh_session.hpp"
#include "utils.hpp"

namespace {

constexpr int kExecFailedExit = 127;
constexpr std::size_t kStderrTailLines = 20;
constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kDrainLimit = std::chrono::seconds(2);

void signal_group(pid_t pid, int sig) {
  // The child may not have joined its own group yet.
  if(::kill(-pid, sig) != 0 && errno == ESRCH) {
    ::kill(pid, sig);
  }
}

bool set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  if(flags == -1) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void close_fd(int& fd) {
  if(fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Splits a byte stream on '\n' and '\r'; rsync rewrites progress lines with '\r'.
class LineSplitter {
public:
  template<typename Fn>
  void feed(const char* data, std::size_t size, Fn&& emit) {
    for(std::size_t i = 0; i < size; ++i) {
      const char c = data[i];
      if(c == '\n' || c == '\r') {
        if(!pending_.empty()) emit(pending_);
        pending_.clear();
      } else {
        pending_.push_back(c);
      }
    }
  }

  template<typename Fn>
  void flush(Fn&& emit) {
    if(!pending_.empty()) emit(pending_);
    pending_.clear();
  }

private:
  std::string pending_;
};

} // namespace

const char* to_string(CancelReason reason) {
  switch(reason) {
    case CancelReason::Operator: return "operator";
    case CancelReason::Stalled: return "stalled";
    case CancelReason::Shutdown: return "shutdown";
  }
  return "operator";
}

RsyncExitInfo classify_rsync_exit(int exit_code, bool cancelled) {
  switch(exit_code) {
    case 0: return {false, "success"};
    case 1: return {false, "syntax or usage error"};
    case 2: return {false, "protocol incompatibility"};
    case 3: return {false, "errors selecting input/output files, dirs"};
    case 4: return {false, "requested action not supported"};
    case 5: return {false, "error starting client-server protocol"};
    case 6: return {false, "daemon unable to append to log-file"};
    case 10: return {true, "error in socket I/O"};
    case 11: return {true, "error in file I/O"};
    case 12: return {true, "error in rsync protocol data stream"};
    case 13: return {false, "errors with program diagnostics"};
    case 14: return {false, "error in IPC code"};
    case 20: return {!cancelled, "received SIGUSR1 or SIGINT"};
    case 21: return {false, "some error returned by waitpid()"};
    case 22: return {false, "error allocating core memory buffers"};
    case 23: return {true, "partial transfer due to error"};
    case 24: return {true, "partial transfer due to vanished source files"};
    case 25: return {false, "the --max-delete limit stopped deletions"};
    case 30: return {true, "timeout in data send/receive"};
    case 35: return {true, "timeout waiting for daemon connection"};
    case 126: return {false, "command invoked cannot execute"};
    case 127: return {false, "command not found"};
    case 255: return {true, "ssh transport error"};
    default: return {true, "unknown exit code"};
  }
}

ProcessRunner::ProcessRunner(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : make_component_logger("process-runner")) {}

ProcessRunner::~ProcessRunner() {
  cancel_all();
}

ProcessResult ProcessRunner::run(const std::string& key,
                                 const std::vector<std::string>& argv,
                                 const LineHandler& on_line,
                                 std::chrono::milliseconds timeout) {
  ProcessResult result;
  if(argv.empty()) {
    result.error = "empty command line";
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(running_.count(key)) {
      result.error = "a process is already running for " + key;
      return result;
    }
    if(closed_reason_) {
      result.cancelled = true;
      result.cancel_reason = *closed_reason_;
      logger_->debug("{} not started, runner is closed", key);
      return result;
    }
    auto pending = pending_cancel_.find(key);
    if(pending != pending_cancel_.end()) {
      result.cancelled = true;
      result.cancel_reason = pending->second;
      pending_cancel_.erase(pending);
      logger_->info("{} cancelled before start", key);
      return result;
    }
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if(::pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe2: ") + std::strerror(errno);
    return result;
  }
  if(::pipe2(err_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe2: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }

  // Everything the child touches is prepared before fork().
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for(const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
  cargv.push_back(nullptr);
  const std::string exec_failed = "cannot execute " + argv.front() + "\n";

  const pid_t pid = ::fork();
  if(pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return result;
  }

  if(pid == 0) {
    ::setpgid(0, 0);
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if(dev_null >= 0) ::dup2(dev_null, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    ssize_t ignored = ::write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
    (void)ignored;
    ::_exit(kExecFailedExit);
  }

  ::setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  int fds[2] = {out_pipe[0], err_pipe[0]};
  set_nonblocking(fds[0]);
  set_nonblocking(fds[1]);
  result.spawned = true;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    RunningProcess proc;
    proc.pid = pid;
    // A cancel that arrived between the check above and registration.
    auto pending = pending_cancel_.find(key);
    if(pending != pending_cancel_.end()) {
      proc.cancel_requested = true;
      proc.reason = pending->second;
      pending_cancel_.erase(pending);
    }
    running_[key] = proc;
  }
  logger_->debug("{} started pid {}", key, pid);

  std::deque<std::string> stderr_tail;
  LineSplitter splitters[2];
  auto dispatch = [&](const std::string& line, bool from_stderr) {
    if(from_stderr) {
      stderr_tail.push_back(line);
      if(stderr_tail.size() > kStderrTailLines) stderr_tail.pop_front();
    }
    if(!on_line) return;
    try {
      on_line(line, from_stderr);
    } catch(const std::exception& e) {
      logger_->warn("{} output handler failed: {}", key, e.what());
    }
  };

  const auto started = std::chrono::steady_clock::now();
  std::optional<std::chrono::steady_clock::time_point> term_sent_at;
  std::optional<std::chrono::steady_clock::time_point> reaped_at;
  bool kill_sent = false;
  int status = 0;

  for(;;) {
    const auto now = std::chrono::steady_clock::now();

    if(!result.cancelled) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = running_.find(key);
      if(it != running_.end() && it->second.cancel_requested) {
        result.cancelled = true;
        result.cancel_reason = it->second.reason;
      }
    }
    if(!result.cancelled && !result.timed_out && timeout.count() > 0 && now - started >= timeout) {
      result.timed_out = true;
      logger_->warn("{} exceeded its {}ms limit", key, timeout.count());
    }

    if((result.cancelled || result.timed_out) && !reaped_at) {
      if(!term_sent_at) {
        logger_->info("{} terminating process group {} ({})", key, pid,
                      result.timed_out ? "timeout" : to_string(result.cancel_reason));
        signal_group(pid, SIGTERM);
        term_sent_at = now;
      } else if(!kill_sent && now - *term_sent_at >= options_.cancel_grace) {
        logger_->warn("{} still alive after {}ms, sending SIGKILL", key, options_.cancel_grace.count());
        signal_group(pid, SIGKILL);
        kill_sent = true;
      }
    }

    if(!reaped_at) {
      const pid_t r = ::waitpid(pid, &status, WNOHANG);
      if(r == pid) {
        reaped_at = now;
      } else if(r < 0 && errno != EINTR) {
        result.error = std::string("waitpid: ") + std::strerror(errno);
        reaped_at = now;
      }
    }

    if(reaped_at) {
      if(fds[0] < 0 && fds[1] < 0) break;
      // Descendants can keep the pipes open after the child itself exits.
      if(now - *reaped_at >= kDrainLimit) {
        signal_group(pid, SIGKILL);
        break;
      }
    }

    pollfd pfds[2];
    nfds_t count = 0;
    int index_of[2] = {-1, -1};
    for(int i = 0; i < 2; ++i) {
      if(fds[i] >= 0) {
        pfds[count].fd = fds[i];
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        index_of[count] = i;
        ++count;
      }
    }
    if(count == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      continue;
    }

    const int rv = ::poll(pfds, count, static_cast<int>(kPollInterval.count()));
    if(rv < 0) {
      if(errno == EINTR) continue;
      result.error = std::string("poll: ") + std::strerror(errno);
      signal_group(pid, SIGKILL);
      break;
    }
    if(rv == 0) continue;

    for(nfds_t p = 0; p < count; ++p) {
      if(pfds[p].revents == 0) continue;
      const int i = index_of[p];
      char buf[4096];
      for(;;) {
        const ssize_t n = ::read(fds[i], buf, sizeof(buf));
        if(n > 0) {
          splitters[i].feed(buf, static_cast<std::size_t>(n),
                            [&](const std::string& line){ dispatch(line, i == 1); });
          continue;
        }
        if(n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
          close_fd(fds[i]);
        }
        break;
      }
    }
  }

  close_fd(fds[0]);
  close_fd(fds[1]);
  splitters[0].flush([&](const std::string& line){ dispatch(line, false); });
  splitters[1].flush([&](const std::string& line){ dispatch(line, true); });

  if(!reaped_at) {
    // The loop gave up on the pipes; the child is killed and reaped here.
    signal_group(pid, SIGKILL);
    while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  }
  if(result.cancelled || result.timed_out) {
    // Sweep anything left in the group.
    ::kill(-pid, SIGKILL);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(key);
  }

  if(WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = -1;
  }
  for(const auto& line : stderr_tail) {
    if(!result.stderr_tail.empty()) result.stderr_tail.push_back('\n');
    result.stderr_tail += line;
  }

  logger_->debug("{} finished: exit {} signal {}{}", key, result.exit_code, result.term_signal,
                 result.cancelled ? " (cancelled)" : "");
  return result;
}

bool ProcessRunner::preflight(const Transfer& t, SshSession* session, TransferOutcome& outcome) {
  if(is_pull(t.type)) {
    std::filesystem::path dest(t.destination);
    std::filesystem::path dir = t.destination.back() == '/' ? dest : dest.parent_path();
    if(dir.empty()) return true;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if(ec) {
      outcome.category = ErrorCategory::Transfer;
      outcome.retryable = false;
      outcome.error_message = prefixed_message(ErrorCategory::Transfer,
                                               "cannot create " + dir.string() + ": " + ec.message());
      return false;
    }
    return true;
  }

  const std::string parent = remote_parent_directory(t.destination);
  if(parent == "/" || parent == ".") return true;
  if(!session) {
    logger_->debug("{} no session for preflight, relying on rsync", t.transfer_id);
    return true;
  }

  std::string output;
  std::string err;
  int rc = -1;
  try {
    rc = session->exec("mkdir -p " + shell_quote(parent), output, err);
  } catch(const std::exception& e) {
    err = e.what();
    rc = -1;
  }
  if(rc == -1) {
    outcome.category = ErrorCategory::Connection;
    outcome.retryable = true;
    outcome.error_message = prefixed_message(ErrorCategory::Connection, "preflight failed on " +
                                             t.ssh.display() + ": " + err);
    return false;
  }
  if(rc != 0) {
    outcome.category = ErrorCategory::Transfer;
    outcome.retryable = true;
    outcome.error_message = prefixed_message(ErrorCategory::Transfer, "remote mkdir exited with " +
                                             std::to_string(rc) + (output.empty() ? "" : ": " + output));
    return false;
  }
  return true;
}

TransferOutcome ProcessRunner::execute(const Transfer& t,
                                       SshSession* session,
                                       const ProgressHandler& on_progress) {
  TransferOutcome outcome;
  std::vector<std::string> argv;
  try {
    argv = RsyncCommandBuilder::build(
      RsyncCommandBuilder::from_transfer(t, options_.rsync_binary, options_.ssh_connect_timeout_seconds));
  } catch(const ValidationError& e) {
    outcome.category = ErrorCategory::Validation;
    outcome.retryable = false;
    outcome.error_message = e.prefixed();
    return outcome;
  }

  if(!preflight(t, session, outcome)) {
    logger_->warn("{} preflight failed: {}", t.transfer_id, outcome.error_message);
    return outcome;
  }

  logger_->info("{} {} via {}: {}", t.transfer_id, to_string(t.type), t.ssh.display(),
                RsyncCommandBuilder::join_for_log(argv));

  RsyncProgressParser parser;
  double last_percent = 0.0;
  std::uint64_t completed_bytes = 0;
  std::uint64_t current_bytes = 0;
  std::chrono::steady_clock::time_point last_emit{};
  bool emitted_full = false;

  auto emit = [&](double percent, const std::string& speed, const std::string& eta) {
    if(!on_progress) return;
    ProgressUpdate update;
    update.percent = percent;
    update.speed = speed;
    update.eta = eta;
    update.bytes_transferred = completed_bytes + current_bytes;
    on_progress(update);
    last_emit = std::chrono::steady_clock::now();
    if(percent >= 100.0) emitted_full = true;
  };

  auto on_line = [&](const std::string& line, bool from_stderr) {
    if(from_stderr) {
      logger_->debug("{} stderr: {}", t.transfer_id, line);
      return;
    }
    auto progress = parser.parse_line(line);
    if(!progress) return;
    if(progress->percent >= 100.0) {
      completed_bytes += progress->bytes;
      current_bytes = 0;
    } else {
      current_bytes = progress->bytes;
    }
    const double percent = std::max(last_percent, std::min(100.0, progress->overall_percent()));
    last_percent = percent;
    const auto now = std::chrono::steady_clock::now();
    if(now - last_emit >= options_.progress_interval || (percent >= 100.0 && !emitted_full)) {
      emit(percent, progress->speed, progress->eta);
    }
  };

  ProcessResult result = run(t.transfer_id, argv, on_line);
  outcome.stats = parser.stats();
  outcome.bytes_transferred = std::max(completed_bytes + current_bytes, outcome.stats.transferred_size);
  outcome.exit_code = result.exit_code;

  if(!result.spawned && !result.cancelled) {
    outcome.category = ErrorCategory::Transfer;
    outcome.retryable = true;
    outcome.error_message = prefixed_message(ErrorCategory::Transfer, "cannot start rsync: " + result.error);
    return outcome;
  }

  if(result.cancelled) {
    if(result.cancel_reason == CancelReason::Operator) {
      outcome.cancelled = true;
      outcome.category = ErrorCategory::Cancelled;
      outcome.error_message = prefixed_message(ErrorCategory::Cancelled, "cancelled by operator");
    } else if(result.cancel_reason == CancelReason::Shutdown) {
      outcome.interrupted = true;
      outcome.category = ErrorCategory::Cancelled;
      outcome.error_message = prefixed_message(ErrorCategory::Cancelled, "interrupted by shutdown");
    } else {
      outcome.category = ErrorCategory::Timeout;
      outcome.retryable = true;
      outcome.error_message = prefixed_message(ErrorCategory::Timeout, "no progress, process terminated");
    }
    return outcome;
  }

  if(result.exit_code == 0 && result.term_signal == 0) {
    outcome.success = true;
    if(!emitted_full) {
      current_bytes = 0;
      completed_bytes = outcome.bytes_transferred;
      emit(100.0, std::string(), std::string());
    }
    logger_->info("{} completed: {} transferred", t.transfer_id, format_bytes(outcome.bytes_transferred));
    return outcome;
  }

  std::string detail;
  if(result.term_signal != 0) {
    outcome.retryable = true;
    detail = "rsync killed by signal " + std::to_string(result.term_signal);
  } else {
    const RsyncExitInfo info = classify_rsync_exit(result.exit_code, false);
    outcome.retryable = info.retryable;
    detail = "rsync exited with code " + std::to_string(result.exit_code) + " (" + info.description + ")";
    if(result.exit_code == 255) outcome.category = ErrorCategory::Connection;
    else if(result.exit_code == 30 || result.exit_code == 35) outcome.category = ErrorCategory::Timeout;
  }
  if(!result.stderr_tail.empty()) {
    auto pos = result.stderr_tail.find_last_of('\n');
    detail += ": " + (pos == std::string::npos ? result.stderr_tail : result.stderr_tail.substr(pos + 1));
  }
  outcome.error_message = prefixed_message(outcome.category, detail);
  logger_->warn("{} failed ({}): {}", t.transfer_id, outcome.retryable ? "retryable" : "permanent",
                outcome.error_message);
  return outcome;
}

bool ProcessRunner::cancel(const std::string& key, CancelReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = running_.find(key);
  if(it == running_.end()) {
    pending_cancel_[key] = reason;
    return false;
  }
  if(!it->second.cancel_requested) {
    it->second.cancel_requested = true;
    it->second.reason = reason;
    // The run loop escalates to SIGKILL after the grace period.
    signal_group(it->second.pid, SIGTERM);
  }
  return true;
}

bool ProcessRunner::signal_running(const std::string& key, CancelReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = running_.find(key);
  if(it == running_.end()) return false;
  if(!it->second.cancel_requested) {
    it->second.cancel_requested = true;
    it->second.reason = reason;
    signal_group(it->second.pid, SIGTERM);
  }
  return true;
}

void ProcessRunner::clear_cancel(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_cancel_.erase(key);
}

void ProcessRunner::cancel_all(CancelReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!closed_reason_) closed_reason_ = reason;
  pending_cancel_.clear();
  for(auto& entry : running_) {
    if(!entry.second.cancel_requested) {
      entry.second.cancel_requested = true;
      entry.second.reason = reason;
      signal_group(entry.second.pid, SIGTERM);
    }
  }
}

std::size_t ProcessRunner::pending_cancel_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_cancel_.size();
}

bool ProcessRunner::is_running(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_.count(key) > 0;
}

std::vector<std::string> ProcessRunner::running_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(running_.size());
  for(const auto& entry : running_) keys.push_back(entry.first);
  return keys;
}

std::size_t ProcessRunner::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_.size();
}
