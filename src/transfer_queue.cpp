#include "transfer_queue.hpp"

#include <algorithm>

#include "concurrency_controller.hpp"
#include "log.hpp"
#include "transfer_state_manager.hpp"

TransferQueue::TransferQueue(asio::io_context& io,
                             std::shared_ptr<TransferStateManager> state,
                             std::shared_ptr<JobConcurrencyController> controller,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : io_(io),
    state_(std::move(state)),
    controller_(std::move(controller)),
    options_(options),
    logger_(logger ? std::move(logger) : make_component_logger("transfer-queue")) {
  if(options_.max_concurrent_transfers < 1) options_.max_concurrent_transfers = 1;
}

void TransferQueue::set_dispatch_handler(DispatchHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  dispatch_handler_ = std::move(handler);
}

void TransferQueue::set_cancel_handler(CancelHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancel_handler_ = std::move(handler);
}

std::string TransferQueue::pair_key(const std::string& job_id, const std::string& file_id) {
  return job_id + '\x1f' + file_id;
}

TransferQueue::ReadyKey TransferQueue::ready_key(const Entry& entry) {
  return ReadyKey{priority_rank(entry.priority), entry.seq, entry.transfer_id};
}

void TransferQueue::forget_locked(const std::string& transfer_id) {
  auto it = entries_.find(transfer_id);
  if(it == entries_.end()) return;
  const Entry& e = it->second;
  if(e.phase == Phase::Pending) ready_.erase(ready_key(e));
  if(e.phase == Phase::Claimed || e.phase == Phase::Dispatched) --in_flight_;
  auto pit = pair_index_.find(pair_key(e.job_id, e.file_id));
  if(pit != pair_index_.end() && pit->second == transfer_id) pair_index_.erase(pit);
  entries_.erase(it);
}

void TransferQueue::cancel_queued(const std::string& transfer_id, const std::string& reason) {
  try {
    TransitionDetails details;
    details.reason = reason;
    state_->transition(transfer_id, TransferStatus::Cancelled, details);
  } catch(const WarpsyncError& e) {
    logger_->error("Cannot cancel {}: {}", transfer_id, e.what());
  }
}

std::string TransferQueue::add(const TransferSpec& spec) {
  const auto errors = validate_transfer_spec(spec);
  if(!errors.empty()) {
    std::string message;
    for(const auto& e : errors) {
      if(!message.empty()) message += "; ";
      message += e;
    }
    throw ValidationError("invalid transfer " + spec.job_id + "/" + spec.file_id + ": " + message);
  }

  const std::string key = pair_key(spec.job_id, spec.file_id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pair_index_.find(key);
    if(it != pair_index_.end()) {
      logger_->debug("{}/{} already active as {}", spec.job_id, spec.file_id, it->second);
      return it->second;
    }
  }

  // Active in the store but not tracked here, e.g. left by a previous run.
  if(auto existing = state_->find_active(spec.job_id, spec.file_id)) {
    logger_->debug("{}/{} already active in store as {}", spec.job_id, spec.file_id, existing->transfer_id);
    return existing->transfer_id;
  }

  Transfer t = make_transfer(spec, options_.default_max_retries);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pair_index_.find(key);
    if(it != pair_index_.end()) return it->second;
    const std::size_t queued = entries_.size() - in_flight_;
    if(queued >= options_.max_queue_size) {
      throw ValidationError("queue is full (" + std::to_string(queued) + " transfers waiting)");
    }
    Entry e;
    e.transfer_id = t.transfer_id;
    e.job_id = t.job_id;
    e.file_id = t.file_id;
    e.priority = t.priority;
    e.size = t.size;
    e.seq = next_seq_++;
    e.phase = Phase::Reserved;
    entries_.emplace(t.transfer_id, e);
    pair_index_[key] = t.transfer_id;
  }

  try {
    state_->record_admission(t);
  } catch(const std::exception& e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      forget_locked(t.transfer_id);
    }
    logger_->error("Admission of {}/{} failed: {}", spec.job_id, spec.file_id, e.what());
    throw;
  }

  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(t.transfer_id);
    if(it != entries_.end()) {
      if(it->second.cancel_requested) {
        forget_locked(t.transfer_id);
        cancelled = true;
      } else {
        it->second.phase = Phase::Pending;
        ready_.insert(ready_key(it->second));
      }
    }
  }
  if(cancelled) {
    cancel_queued(t.transfer_id, "cancelled by operator");
    return t.transfer_id;
  }

  logger_->info("Queued {} {} ({}/{}) {}", t.transfer_id, t.filename, t.job_id, t.file_id, to_string(t.priority));
  pump();
  return t.transfer_id;
}

std::vector<std::string> TransferQueue::add_batch(const std::vector<TransferSpec>& specs) {
  std::vector<std::string> ids;
  ids.reserve(specs.size());
  std::size_t skipped = 0;
  for(const auto& spec : specs) {
    try {
      ids.push_back(add(spec));
    } catch(const WarpsyncError& e) {
      ++skipped;
      logger_->warn("Skipping {}/{}: {}", spec.job_id, spec.file_id, e.what());
    }
  }
  if(skipped > 0) {
    logger_->info("Batch admitted {} of {} transfers", ids.size(), specs.size());
  }
  return ids;
}

bool TransferQueue::cancel(const std::string& transfer_id) {
  const std::string reason = "cancelled by operator";
  enum class Action { None, CancelQueued, SignalRunning, Untracked } action = Action::None;
  CancelHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(transfer_id);
    if(it == entries_.end()) {
      action = Action::Untracked;
    } else {
      Entry& e = it->second;
      switch(e.phase) {
        case Phase::Reserved:
        case Phase::Claimed:
          // Picked up by add() or the dispatcher once they retake the lock.
          e.cancel_requested = true;
          return true;
        case Phase::Pending:
          forget_locked(transfer_id);
          action = Action::CancelQueued;
          break;
        case Phase::Dispatched:
          if(e.cancel_requested) return true;
          e.cancel_requested = true;
          handler = cancel_handler_;
          action = Action::SignalRunning;
          break;
      }
    }
  }

  switch(action) {
    case Action::CancelQueued:
      cancel_queued(transfer_id, reason);
      logger_->info("Cancelled queued transfer {}", transfer_id);
      return true;
    case Action::SignalRunning:
      logger_->info("Cancelling running transfer {}", transfer_id);
      if(handler) handler(transfer_id, true);
      return true;
    case Action::Untracked:
      break;
    case Action::None:
      return false;
  }

  std::optional<Transfer> t;
  try {
    t = state_->get(transfer_id);
  } catch(const WarpsyncError& e) {
    logger_->error("Cannot look up {}: {}", transfer_id, e.what());
    return false;
  }
  if(!t || !is_active(t->status)) return false;

  if(t->status != TransferStatus::Queued) {
    CancelHandler signal;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      signal = cancel_handler_;
    }
    if(signal) signal(transfer_id, false);
  }
  cancel_queued(transfer_id, reason);
  controller_->release_slot_by_transfer(transfer_id);
  logger_->info("Cancelled untracked transfer {}", transfer_id);
  return true;
}

void TransferQueue::pump() {
  if(pump_posted_.exchange(true)) return;
  asio::post(io_, [this] {
    pump_posted_.store(false);
    pump_once();
  });
}

void TransferQueue::pump_once() {
  std::set<std::string> blocked;
  for(;;) {
    std::string transfer_id;
    std::string job_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!dispatch_handler_) return;
      if(in_flight_ >= options_.max_concurrent_transfers) return;
      auto it = std::find_if(ready_.begin(), ready_.end(), [&](const ReadyKey& k) {
        return blocked.count(entries_.at(k.transfer_id).job_id) == 0;
      });
      if(it == ready_.end()) return;
      Entry& e = entries_.at(it->transfer_id);
      ready_.erase(it);
      e.phase = Phase::Claimed;
      ++in_flight_;
      transfer_id = e.transfer_id;
      job_id = e.job_id;
    }
    if(!dispatch_claimed(transfer_id, job_id)) {
      blocked.insert(job_id);
    }
  }
}

bool TransferQueue::dispatch_claimed(const std::string& transfer_id, const std::string& job_id) {
  const auto slot = controller_->try_acquire_slot(job_id, transfer_id);
  if(!slot) {
    bool cancel_now = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = entries_.find(transfer_id);
      if(it != entries_.end()) {
        if(it->second.cancel_requested) {
          forget_locked(transfer_id);
          cancel_now = true;
        } else {
          it->second.phase = Phase::Pending;
          --in_flight_;
          ready_.insert(ready_key(it->second));
        }
      }
    }
    if(cancel_now) cancel_queued(transfer_id, "cancelled by operator");
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(transfer_id);
    if(it != entries_.end()) it->second.slot = slot;
  }

  Transfer t;
  try {
    TransitionDetails details;
    details.reason = "slot " + std::to_string(*slot);
    details.slot = slot;
    t = state_->transition(transfer_id, TransferStatus::Scheduled, details);
  } catch(const WarpsyncError& e) {
    logger_->error("Cannot schedule {}: {}", transfer_id, e.what());
    controller_->release_slot(job_id, *slot);
    std::lock_guard<std::mutex> lock(mutex_);
    forget_locked(transfer_id);
    return true;
  }

  bool cancel_now = false;
  DispatchHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(transfer_id);
    if(it != entries_.end()) {
      cancel_now = it->second.cancel_requested;
      if(cancel_now) {
        forget_locked(transfer_id);
      } else {
        it->second.phase = Phase::Dispatched;
        handler = dispatch_handler_;
      }
    }
  }
  if(cancel_now) {
    cancel_queued(transfer_id, "cancelled by operator");
    controller_->release_slot(job_id, *slot);
    return true;
  }

  logger_->debug("Dispatching {} on slot {} of job {}", transfer_id, *slot, job_id);
  try {
    handler(t);
  } catch(const std::exception& e) {
    logger_->error("Dispatch of {} failed: {}", transfer_id, e.what());
    try {
      TransitionDetails details;
      details.reason = e.what();
      details.error_category = ErrorCategory::Transfer;
      state_->transition(transfer_id, TransferStatus::Failed, details);
    } catch(const WarpsyncError& inner) {
      logger_->error("Cannot fail {}: {}", transfer_id, inner.what());
    }
    complete_dispatch(transfer_id, std::nullopt);
  }
  return true;
}

void TransferQueue::complete_dispatch(const std::string& transfer_id, const std::optional<Transfer>& retry) {
  std::optional<int> slot;
  std::string job_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(transfer_id);
    if(it == entries_.end()) {
      logger_->warn("Completion for untracked transfer {}", transfer_id);
    } else {
      slot = it->second.slot;
      job_id = it->second.job_id;
      forget_locked(transfer_id);
    }
  }
  if(slot) controller_->release_slot(job_id, *slot);
  if(retry) requeue(*retry);
  pump();
}

bool TransferQueue::requeue(const Transfer& t) {
  if(t.status != TransferStatus::Queued) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(entries_.count(t.transfer_id)) return false;
    const std::string key = pair_key(t.job_id, t.file_id);
    auto pit = pair_index_.find(key);
    if(pit != pair_index_.end() && pit->second != t.transfer_id) {
      logger_->warn("Not requeueing {}: {}/{} is active as {}", t.transfer_id, t.job_id, t.file_id, pit->second);
      return false;
    }
    Entry e;
    e.transfer_id = t.transfer_id;
    e.job_id = t.job_id;
    e.file_id = t.file_id;
    e.priority = t.priority;
    e.size = t.size;
    e.seq = next_seq_++;
    e.phase = Phase::Pending;
    entries_.emplace(t.transfer_id, e);
    ready_.insert(ready_key(e));
    pair_index_[key] = t.transfer_id;
  }
  logger_->debug("Requeued {} (retry {}/{})", t.transfer_id, t.retry_count, t.max_retries);
  pump();
  return true;
}

std::size_t TransferQueue::rehydrate() {
  std::vector<Transfer> queued;
  for(auto& t : state_->get_active_transfers()) {
    if(t.status == TransferStatus::Queued) queued.push_back(std::move(t));
  }
  // Admission order is rebuilt from the persisted queue time.
  std::stable_sort(queued.begin(), queued.end(), [](const Transfer& a, const Transfer& b) {
    return a.queued_at < b.queued_at;
  });
  std::size_t restored = 0;
  for(const auto& t : queued) {
    if(requeue(t)) ++restored;
  }
  if(restored > 0) logger_->info("Restored {} queued transfers from the store", restored);
  return restored;
}

std::vector<Transfer> TransferQueue::get_transfers(const TransferFilter& filter) const {
  return state_->find(filter);
}

QueueStats TransferQueue::get_stats() const {
  QueueStats stats = state_->count_by_status();
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& entry : entries_) {
    if(entry.second.phase == Phase::Pending || entry.second.phase == Phase::Reserved) {
      stats.queued_bytes += entry.second.size;
    }
  }
  return stats;
}

bool TransferQueue::is_tracked(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(transfer_id) > 0;
}

bool TransferQueue::is_pending(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(transfer_id);
  return it != entries_.end() && (it->second.phase == Phase::Pending || it->second.phase == Phase::Reserved);
}

bool TransferQueue::is_in_flight(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(transfer_id);
  return it != entries_.end() && (it->second.phase == Phase::Claimed || it->second.phase == Phase::Dispatched);
}

bool TransferQueue::cancel_requested(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(transfer_id);
  return it != entries_.end() && it->second.cancel_requested;
}

std::vector<std::string> TransferQueue::pending_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(ready_.size());
  for(const auto& key : ready_) ids.push_back(key.transfer_id);
  return ids;
}

std::vector<std::string> TransferQueue::in_flight_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for(const auto& entry : entries_) {
    if(entry.second.phase == Phase::Claimed || entry.second.phase == Phase::Dispatched) {
      ids.push_back(entry.first);
    }
  }
  return ids;
}

std::size_t TransferQueue::depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_.size();
}

std::size_t TransferQueue::in_flight_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}
