#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ssh_session.hpp"

class Logger;

struct PooledConnection {
  std::uint64_t id = 0;
  std::string fingerprint;
  std::string target_display;
  std::unique_ptr<SshSession> session;
  bool in_use = false;
  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point last_used_at;
};

using ConnectionHandle = std::shared_ptr<PooledConnection>;

struct PoolStats {
  std::size_t total = 0;
  std::size_t in_use = 0;
  std::size_t available = 0;
  std::size_t targets = 0;
  std::uint64_t created = 0;
  std::uint64_t reused = 0;
  std::uint64_t discarded = 0;
  std::uint64_t evicted = 0;
};

// SSH connections keyed by target fingerprint. Sessions are opened and liveness-checked
// outside the pool lock; only bookkeeping happens under it.
class SshConnectionPool {
public:
  struct Options {
    std::size_t min_per_target = 0;
    std::size_t max_per_target = 4;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds acquire_timeout{60000};
    std::chrono::milliseconds max_idle{300000};
    std::chrono::milliseconds connection_ttl{1800000};
  };

  SshConnectionPool(std::shared_ptr<SshSessionFactory> factory,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~SshConnectionPool();

  using AbandonCheck = std::function<bool()>;

  // Throws ConnectionError on connect/auth failure or when no connection frees
  // up before the acquire timeout. Returns nullptr once `abandon` says so; it
  // is checked on every wakeup while waiting.
  ConnectionHandle acquire(const SshTarget& target, const AbandonCheck& abandon = nullptr);
  bool release(const ConnectionHandle& connection);
  void discard(const ConnectionHandle& connection);
  // Wakes blocked acquire() calls so they re-check their abandon condition.
  void wake_waiters();

  // Overrides the pool-wide min/max for one target.
  void set_target_bounds(const SshTarget& target, std::size_t min_idle, std::size_t max_total);

  // One sweep: idle past max_idle (down to the target's min) or past the TTL.
  std::size_t evict_idle();
  void close_all();

  PoolStats get_pool_stats() const;
  const Options& options() const { return options_; }

private:
  struct Bounds {
    std::size_t min = 0;
    std::size_t max = 1;
  };

  struct Bucket {
    std::vector<ConnectionHandle> connections;
    std::size_t opening = 0;
  };

  Bounds bounds_for(const std::string& fingerprint) const;
  bool remove_locked(const ConnectionHandle& connection);

  std::shared_ptr<SshSessionFactory> factory_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, Bucket> buckets_;
  std::map<std::string, Bounds> bounds_;
  std::uint64_t next_id_ = 1;
  std::uint64_t created_ = 0;
  std::uint64_t reused_ = 0;
  std::uint64_t discarded_ = 0;
  std::uint64_t evicted_ = 0;
  bool closed_ = false;
};
