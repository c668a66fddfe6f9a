#pragma once

#include <asio.hpp>

#include <atomic>
#include <memory>
#include <string>

#include "process_runner.hpp"
#include "transfer_types.hpp"

class Logger;
class SshConnectionPool;
class TransferQueue;
class TransferStateManager;

// Worker side of dispatch: borrows a connection, runs rsync and records the
// outcome. Each dispatched transfer ends in exactly one complete_dispatch().
// stop() interrupts work without recording an outcome, so the store keeps the
// transfer active for the next start.
class TransferExecutor {
public:
  TransferExecutor(std::shared_ptr<TransferStateManager> state,
                   std::shared_ptr<TransferQueue> queue,
                   std::shared_ptr<SshConnectionPool> pool,
                   std::shared_ptr<ProcessRunner> runner,
                   std::size_t worker_threads,
                   std::shared_ptr<Logger> logger = nullptr);
  ~TransferExecutor();

  // Installs the queue's dispatch and cancel handlers.
  void attach();
  void submit(const Transfer& transfer);
  void stop();

  std::size_t active_count() const { return active_.load(); }

private:
  void execute(const Transfer& transfer);
  void finish(const Transfer& transfer, const TransferOutcome& outcome);

  std::shared_ptr<TransferStateManager> state_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<SshConnectionPool> pool_;
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<Logger> logger_;
  asio::thread_pool workers_;
  std::atomic<std::size_t> active_{0};
  std::atomic<bool> stopped_{false};
};
