#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "transfer_types.hpp"

class JobConcurrencyController;
class Logger;
class TransferStateManager;

// Priority queue of admitted transfers plus the set currently dispatched.
// Dispatch runs on the io thread and is triggered by admission and by
// completion; there is no polling loop.
class TransferQueue {
public:
  using DispatchHandler = std::function<void(const Transfer& transfer)>;
  // `dispatched` is false for a record found only in the store; its process,
  // if any, belongs to nobody in this queue.
  using CancelHandler = std::function<void(const std::string& transfer_id, bool dispatched)>;

  struct Options {
    std::size_t max_queue_size = 1000;
    std::size_t max_concurrent_transfers = 3;
    int default_max_retries = 3;
  };

  TransferQueue(asio::io_context& io,
                std::shared_ptr<TransferStateManager> state,
                std::shared_ptr<JobConcurrencyController> controller,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);

  void set_dispatch_handler(DispatchHandler handler);
  void set_cancel_handler(CancelHandler handler);

  // Returns the new id, or the id of the active transfer for the same
  // (job, file) pair. Throws ValidationError for an invalid TransferSpec or a full queue.
  std::string add(const TransferSpec& spec);
  std::vector<std::string> add_batch(const std::vector<TransferSpec>& specs);
  bool cancel(const std::string& transfer_id);

  std::vector<Transfer> get_transfers(const TransferFilter& filter = TransferFilter()) const;
  QueueStats get_stats() const;

  // Called once per dispatched transfer when its execution is over. Frees the
  // slot and re-admits the transfer if a retry was scheduled.
  void complete_dispatch(const std::string& transfer_id, const std::optional<Transfer>& retry);

  // Re-admits a QUEUED record (retry, restart, orphan adoption).
  bool requeue(const Transfer& transfer);
  std::size_t rehydrate();

  void pump();

  bool is_tracked(const std::string& transfer_id) const;
  bool is_pending(const std::string& transfer_id) const;
  bool is_in_flight(const std::string& transfer_id) const;
  bool cancel_requested(const std::string& transfer_id) const;
  std::vector<std::string> pending_ids() const;
  std::vector<std::string> in_flight_ids() const;
  std::size_t depth() const;
  std::size_t in_flight_count() const;

  const Options& options() const { return options_; }

private:
  enum class Phase { Reserved, Pending, Claimed, Dispatched };

  struct Entry {
    std::string transfer_id;
    std::string job_id;
    std::string file_id;
    TransferPriority priority = TransferPriority::Normal;
    std::uint64_t seq = 0;
    std::uint64_t size = 0;
    Phase phase = Phase::Pending;
    bool cancel_requested = false;
    std::optional<int> slot;
  };

  struct ReadyKey {
    int rank = 0;
    std::uint64_t seq = 0;
    std::string transfer_id;

    bool operator<(const ReadyKey& other) const {
      if(rank != other.rank) return rank > other.rank;
      return seq < other.seq;
    }
  };

  static std::string pair_key(const std::string& job_id, const std::string& file_id);
  static ReadyKey ready_key(const Entry& entry);
  void pump_once();
  void forget_locked(const std::string& transfer_id);
  void cancel_queued(const std::string& transfer_id, const std::string& reason);
  bool dispatch_claimed(const std::string& transfer_id, const std::string& job_id);

  asio::io_context& io_;
  std::shared_ptr<TransferStateManager> state_;
  std::shared_ptr<JobConcurrencyController> controller_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  std::set<ReadyKey> ready_;
  std::map<std::string, std::string> pair_index_;
  std::uint64_t next_seq_ = 1;
  std::size_t in_flight_ = 0;
  DispatchHandler dispatch_handler_;
  CancelHandler cancel_handler_;
  std::atomic<bool> pump_posted_{false};
};
