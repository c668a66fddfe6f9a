#include "transfer_executor.hpp"

#include "log.hpp"
#include "ssh_connection_pool.hpp"
#include "transfer_queue.hpp"
#include "transfer_state_manager.hpp"

TransferExecutor::TransferExecutor(std::shared_ptr<TransferStateManager> state,
                                   std::shared_ptr<TransferQueue> queue,
                                   std::shared_ptr<SshConnectionPool> pool,
                                   std::shared_ptr<ProcessRunner> runner,
                                   std::size_t worker_threads,
                                   std::shared_ptr<Logger> logger)
  : state_(std::move(state)),
    queue_(std::move(queue)),
    pool_(std::move(pool)),
    runner_(std::move(runner)),
    logger_(logger ? std::move(logger) : make_component_logger("executor")),
    workers_(worker_threads < 1 ? 1 : worker_threads) {}

TransferExecutor::~TransferExecutor() {
  stop();
}

void TransferExecutor::attach() {
  queue_->set_dispatch_handler([this](const Transfer& t) { submit(t); });
  auto runner = runner_;
  auto pool = pool_;
  queue_->set_cancel_handler([runner, pool](const std::string& id, bool dispatched) {
    // A dispatched transfer may not have spawned rsync yet; remember the
    // cancel for it. Anything else only gets a running process signalled.
    if(dispatched) runner->cancel(id, CancelReason::Operator);
    else runner->signal_running(id, CancelReason::Operator);
    pool->wake_waiters();
  });
}

void TransferExecutor::submit(const Transfer& transfer) {
  ++active_;
  asio::post(workers_, [this, transfer] {
    execute(transfer);
    --active_;
  });
}

void TransferExecutor::stop() {
  if(stopped_.exchange(true)) return;
  queue_->set_dispatch_handler(nullptr);
  runner_->cancel_all(CancelReason::Shutdown);
  pool_->wake_waiters();
  workers_.join();
}

void TransferExecutor::execute(const Transfer& t) {
  const std::string& id = t.transfer_id;
  ConnectionHandle conn;
  try {
    conn = pool_->acquire(t.ssh, [this, &id] { return stopped_.load() || queue_->cancel_requested(id); });
  } catch(const ConnectionError& e) {
    logger_->warn("{} could not get a connection: {}", id, e.what());
    TransferOutcome outcome;
    outcome.category = ErrorCategory::Connection;
    outcome.retryable = true;
    outcome.error_message = e.prefixed();
    finish(t, outcome);
    return;
  }

  if(!conn || stopped_ || queue_->cancel_requested(id)) {
    if(conn) pool_->release(conn);
    TransferOutcome outcome;
    if(queue_->cancel_requested(id)) outcome.cancelled = true;
    else outcome.interrupted = true;
    finish(t, outcome);
    return;
  }

  try {
    TransitionDetails details;
    details.reason = "rsync starting";
    state_->transition(id, TransferStatus::Transferring, details);
  } catch(const WarpsyncError& e) {
    logger_->error("{} cannot start: {}", id, e.what());
    pool_->release(conn);
    runner_->clear_cancel(id);
    queue_->complete_dispatch(id, std::nullopt);
    return;
  }

  auto state = state_;
  TransferOutcome outcome = runner_->execute(t, conn->session.get(), [state, id](const ProgressUpdate& p) {
    state->update_progress(id, p);
  });

  if(!outcome.success && outcome.category == ErrorCategory::Connection) {
    pool_->discard(conn);
  } else {
    pool_->release(conn);
  }
  finish(t, outcome);
}

void TransferExecutor::finish(const Transfer& t, const TransferOutcome& result) {
  const std::string& id = t.transfer_id;
  TransferOutcome outcome = result;
  if(outcome.interrupted && queue_->cancel_requested(id)) {
    // An operator cancel outranks the shutdown that cut the run short.
    outcome.interrupted = false;
    outcome.cancelled = true;
  }
  std::optional<Transfer> retry;
  if(outcome.interrupted) {
    // Recovery on the next start fails and retries it as an orphan.
    logger_->info("{} interrupted by shutdown, left for recovery", id);
    runner_->clear_cancel(id);
    queue_->complete_dispatch(id, std::nullopt);
    return;
  }
  try {
    TransitionDetails details;
    if(outcome.success) {
      details.reason = "rsync finished";
      details.bytes_transferred = outcome.bytes_transferred;
      state_->transition(id, TransferStatus::Completed, details);
    } else if(outcome.cancelled) {
      details.reason = "cancelled by operator";
      state_->transition(id, TransferStatus::Cancelled, details);
    } else {
      details.reason = outcome.error_message;
      details.error_message = outcome.error_message;
      details.error_category = outcome.category;
      state_->transition(id, TransferStatus::Failed, details);
      if(outcome.retryable) {
        retry = state_->schedule_retry(id);
      } else {
        logger_->warn("{} failed permanently: {}", id, outcome.error_message);
      }
    }
  } catch(const WarpsyncError& e) {
    logger_->error("Recording outcome of {} failed: {}", id, e.what());
  }
  runner_->clear_cancel(id);
  queue_->complete_dispatch(id, retry);
}
