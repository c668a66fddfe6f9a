#include "transfer_state_manager.hpp"

#include <algorithm>
#include <map>

#include "event_sink.hpp"
#include "log.hpp"
#include "transfer_store.hpp"

namespace {

void append_history(Transfer& t, TransferStatus from, TransferStatus to, const std::string& reason, TimePoint at) {
  t.history.push_back(StateChange{from, to, at, reason});
  if(t.history.size() > kMaxStateHistory) {
    t.history.erase(t.history.begin(), t.history.end() - static_cast<std::ptrdiff_t>(kMaxStateHistory));
  }
}

} // namespace

TransferStateManager::TransferStateManager(std::shared_ptr<TransferStore> store,
                                           std::shared_ptr<EventSink> events,
                                           std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    events_(std::move(events)),
    logger_(logger ? std::move(logger) : make_component_logger("state-manager")) {}

bool TransferStateManager::is_valid_transition(TransferStatus from, TransferStatus to) {
  using S = TransferStatus;
  switch(from) {
    case S::Queued:
      return to == S::Scheduled || to == S::Cancelled;
    case S::Scheduled:
      return to == S::Transferring || to == S::Failed || to == S::Cancelled;
    case S::Transferring:
      return to == S::Completed || to == S::Failed || to == S::Cancelled;
    case S::Failed:
      return to == S::Queued;
    case S::Completed:
    case S::Cancelled:
      return false;
  }
  return false;
}

Transfer TransferStateManager::load_or_throw(const std::string& transfer_id) const {
  Transfer t;
  bool found = false;
  std::string err;
  if(!store_->load(transfer_id, t, found, err)) {
    throw ConsistencyError("cannot read transfer " + transfer_id + ": " + err);
  }
  if(!found) {
    throw ConsistencyError("unknown transfer " + transfer_id);
  }
  return t;
}

void TransferStateManager::persist_or_throw(const Transfer& transfer) const {
  std::string err;
  if(!store_->save(transfer, err)) {
    logger_->error("Persisting {} failed: {}", transfer.transfer_id, err);
    throw ConsistencyError("cannot persist transfer " + transfer.transfer_id + ": " + err);
  }
}

void TransferStateManager::record_admission(const Transfer& transfer) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transfer t = transfer;
  t.status = TransferStatus::Queued;
  append_history(t, TransferStatus::Queued, TransferStatus::Queued, "admitted", t.queued_at);
  persist_or_throw(t);
  logger_->debug("Admitted {} ({}/{}) priority {}", t.transfer_id, t.job_id, t.file_id, to_string(t.priority));
  if(events_) {
    events_->publish(TransferEvent{t.transfer_id, t.job_id, TransferEventKind::Status,
                                   {{"status", to_string(t.status)}, {"priority", to_string(t.priority)}},
                                   Clock::now()});
  }
}

Transfer TransferStateManager::transition(const std::string& transfer_id,
                                          TransferStatus to,
                                          const TransitionDetails& details) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transfer t = load_or_throw(transfer_id);
  const TransferStatus from = t.status;
  if(!is_valid_transition(from, to)) {
    throw StateTransitionError("invalid transition " + to_string(from) + " -> " + to_string(to) +
                               " for " + transfer_id);
  }

  const auto now = Clock::now();
  t.status = to;
  t.last_state_change = now;
  switch(to) {
    case TransferStatus::Scheduled:
      t.concurrency_slot = details.slot;
      break;
    case TransferStatus::Transferring:
      t.started_at = now;
      t.last_progress_at = now;
      break;
    case TransferStatus::Completed:
      t.completed_at = now;
      t.progress = 100.0;
      t.eta.clear();
      if(details.bytes_transferred) t.bytes_transferred = *details.bytes_transferred;
      t.error_message.clear();
      t.error_category.reset();
      break;
    case TransferStatus::Failed:
      t.completed_at = now;
      t.error_category = details.error_category.value_or(ErrorCategory::Transfer);
      t.error_message = details.error_message.empty()
        ? prefixed_message(*t.error_category, details.reason)
        : details.error_message;
      break;
    case TransferStatus::Cancelled:
      t.completed_at = now;
      t.error_category = ErrorCategory::Cancelled;
      t.error_message = prefixed_message(ErrorCategory::Cancelled,
                                         details.reason.empty() ? "cancelled" : details.reason);
      break;
    case TransferStatus::Queued:
      break;
  }
  if(is_terminal(to)) {
    t.speed.clear();
  }
  append_history(t, from, to, details.reason, now);

  persist_or_throw(t);
  logger_->info("{} {} -> {}{}{}", transfer_id, to_string(from), to_string(to),
                details.reason.empty() ? "" : ": ", details.reason);
  publish_transition(t, from, details);
  return t;
}

void TransferStateManager::publish_transition(const Transfer& t, TransferStatus from, const TransitionDetails& details) {
  if(!events_) return;
  const auto now = Clock::now();
  nlohmann::json status_payload{
    {"from", to_string(from)},
    {"status", to_string(t.status)},
    {"retryCount", t.retry_count}
  };
  if(!details.reason.empty()) status_payload["reason"] = details.reason;
  if(t.concurrency_slot) status_payload["slot"] = *t.concurrency_slot;
  events_->publish(TransferEvent{t.transfer_id, t.job_id, TransferEventKind::Status, status_payload, now});

  if(t.status == TransferStatus::Failed) {
    events_->publish(TransferEvent{t.transfer_id, t.job_id, TransferEventKind::Error,
                                   {{"error", t.error_message},
                                    {"category", to_string(t.error_category.value_or(ErrorCategory::Transfer))},
                                    {"retryCount", t.retry_count},
                                    {"maxRetries", t.max_retries}},
                                   now});
  } else if(t.status == TransferStatus::Completed) {
    events_->publish(TransferEvent{t.transfer_id, t.job_id, TransferEventKind::Complete,
                                   {{"bytesTransferred", t.bytes_transferred},
                                    {"destination", t.destination}},
                                   now});
  }
}

std::optional<Transfer> TransferStateManager::update_progress(const std::string& transfer_id,
                                                              const ProgressUpdate& progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transfer t = load_or_throw(transfer_id);
  if(t.status != TransferStatus::Transferring) {
    logger_->debug("Ignoring progress for {} in {}", transfer_id, to_string(t.status));
    return std::nullopt;
  }
  t.progress = std::max(t.progress, std::min(progress.percent, 100.0));
  t.speed = progress.speed;
  t.eta = progress.eta;
  if(progress.bytes_transferred > t.bytes_transferred) t.bytes_transferred = progress.bytes_transferred;
  t.last_progress_at = Clock::now();
  persist_or_throw(t);

  if(events_) {
    events_->publish(TransferEvent{t.transfer_id, t.job_id, TransferEventKind::Progress,
                                   {{"progress", t.progress},
                                    {"speed", t.speed},
                                    {"eta", t.eta},
                                    {"bytesTransferred", t.bytes_transferred}},
                                   *t.last_progress_at});
  }
  return t;
}

std::optional<Transfer> TransferStateManager::schedule_retry(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transfer t = load_or_throw(transfer_id);
  if(t.status != TransferStatus::Failed) {
    throw StateTransitionError("retry requires FAILED, " + transfer_id + " is " + to_string(t.status));
  }
  if(t.retry_count >= t.max_retries) {
    logger_->warn("{} failed permanently after {} retries: {}", transfer_id, t.retry_count, t.error_message);
    return std::nullopt;
  }

  const auto now = Clock::now();
  t.retry_count += 1;
  t.status = TransferStatus::Queued;
  t.queued_at = now;
  t.last_state_change = now;
  t.progress = 0.0;
  t.speed.clear();
  t.eta.clear();
  t.bytes_transferred = 0;
  t.concurrency_slot.reset();
  t.started_at.reset();
  t.completed_at.reset();
  t.last_progress_at.reset();
  const std::string reason = "retry " + std::to_string(t.retry_count) + "/" + std::to_string(t.max_retries);
  append_history(t, TransferStatus::Failed, TransferStatus::Queued, reason, now);

  persist_or_throw(t);
  logger_->info("{} FAILED -> QUEUED: {}", transfer_id, reason);
  TransitionDetails details;
  details.reason = reason;
  publish_transition(t, TransferStatus::Failed, details);
  return t;
}

std::optional<Transfer> TransferStateManager::get(const std::string& transfer_id) const {
  Transfer t;
  bool found = false;
  std::string err;
  if(!store_->load(transfer_id, t, found, err)) {
    throw ConsistencyError("cannot read transfer " + transfer_id + ": " + err);
  }
  if(!found) return std::nullopt;
  return t;
}

std::vector<Transfer> TransferStateManager::get_active_transfers() const {
  std::vector<Transfer> out;
  std::string err;
  if(!store_->load_active(out, err)) {
    throw ConsistencyError("cannot read active transfers: " + err);
  }
  return out;
}

std::vector<Transfer> TransferStateManager::find(const TransferFilter& filter) const {
  std::vector<Transfer> out;
  std::string err;
  if(!store_->load_matching(filter, out, err)) {
    throw ConsistencyError("cannot query transfers: " + err);
  }
  return out;
}

std::optional<Transfer> TransferStateManager::find_active(const std::string& job_id, const std::string& file_id) const {
  std::vector<Transfer> out;
  std::string err;
  if(!store_->find_active_by_pair(job_id, file_id, out, err)) {
    throw ConsistencyError("cannot query transfers: " + err);
  }
  if(out.empty()) return std::nullopt;
  return out.front();
}

QueueStats TransferStateManager::count_by_status() const {
  std::map<TransferStatus, std::size_t> counts;
  std::string err;
  if(!store_->count_by_status(counts, err)) {
    throw ConsistencyError("cannot count transfers: " + err);
  }
  QueueStats s;
  s.queued = counts[TransferStatus::Queued];
  s.scheduled = counts[TransferStatus::Scheduled];
  s.transferring = counts[TransferStatus::Transferring];
  s.completed = counts[TransferStatus::Completed];
  s.failed = counts[TransferStatus::Failed];
  s.cancelled = counts[TransferStatus::Cancelled];
  s.active = s.scheduled + s.transferring;
  s.total = s.queued + s.active + s.completed + s.failed + s.cancelled;
  return s;
}

std::size_t TransferStateManager::purge_terminal(std::chrono::hours retention) {
  std::size_t removed = 0;
  std::string err;
  if(!store_->remove_terminal_before(Clock::now() - retention, removed, err)) {
    logger_->error("Retention purge failed: {}", err);
    return 0;
  }
  if(removed > 0) {
    logger_->info("Purged {} terminal transfers older than {}h", removed, retention.count());
  }
  return removed;
}
