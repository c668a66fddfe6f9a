#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transfer_types.hpp"

class EventSink;
class Logger;
class TransferStore;

struct TransitionDetails {
  std::string reason;
  std::string error_message;
  std::optional<ErrorCategory> error_category;
  std::optional<int> slot;
  std::optional<std::uint64_t> bytes_transferred;
};

// Owner of the transfer state machine. Every accepted change is written to the
// store before it is published; a failed write leaves the transfer unchanged.
class TransferStateManager {
public:
  TransferStateManager(std::shared_ptr<TransferStore> store,
                       std::shared_ptr<EventSink> events,
                       std::shared_ptr<Logger> logger = nullptr);

  static bool is_valid_transition(TransferStatus from, TransferStatus to);

  // Persists a freshly admitted QUEUED transfer. Throws ConsistencyError.
  void record_admission(const Transfer& transfer);

  // Throws StateTransitionError for an edge outside the machine, and
  // ConsistencyError when the transfer is unknown or cannot be persisted.
  Transfer transition(const std::string& transfer_id,
                      TransferStatus to,
                      const TransitionDetails& details = {});

  // Same-state metadata update; ignored once the transfer has left TRANSFERRING.
  std::optional<Transfer> update_progress(const std::string& transfer_id, const ProgressUpdate& progress);

  // FAILED -> QUEUED when retries remain. retry_count grows by exactly one and
  // the transfer re-enters at the current time with its original priority.
  std::optional<Transfer> schedule_retry(const std::string& transfer_id);

  std::optional<Transfer> get(const std::string& transfer_id) const;
  std::vector<Transfer> get_active_transfers() const;
  std::vector<Transfer> find(const TransferFilter& filter) const;
  std::optional<Transfer> find_active(const std::string& job_id, const std::string& file_id) const;
  QueueStats count_by_status() const;

  std::size_t purge_terminal(std::chrono::hours retention);

private:
  Transfer load_or_throw(const std::string& transfer_id) const;
  void persist_or_throw(const Transfer& transfer) const;
  void publish_transition(const Transfer& transfer, TransferStatus from, const TransitionDetails& details);

  std::shared_ptr<TransferStore> store_;
  std::shared_ptr<EventSink> events_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
};
