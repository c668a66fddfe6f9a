#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class Logger;

// Per-job slot table. A job may hold at most its configured number of slots;
// the lowest free index is always granted first.
class JobConcurrencyController {
public:
  using LimitProvider = std::function<std::optional<int>(const std::string& job_id)>;

  struct Options {
    int default_limit = 3;
    std::chrono::milliseconds limit_cache_ttl{std::chrono::minutes(5)};
  };

  struct CacheStats {
    std::size_t cached_jobs = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::size_t active_jobs = 0;
    std::size_t occupied_slots = 0;
  };

  struct SlotHolder {
    std::string job_id;
    int slot = 0;
  };

  JobConcurrencyController(Options options,
                           LimitProvider provider = nullptr,
                           std::shared_ptr<Logger> logger = nullptr);

  // Refusal (nullopt) means the job is at its limit; it is not an error.
  std::optional<int> try_acquire_slot(const std::string& job_id, const std::string& transfer_id);
  bool release_slot(const std::string& job_id, int slot);
  bool release_slot_by_transfer(const std::string& transfer_id);

  std::optional<SlotHolder> holder_of(const std::string& transfer_id) const;
  std::map<std::string, std::map<int, std::string>> occupancy() const;
  std::size_t occupied_count() const;
  std::size_t occupied_count(const std::string& job_id) const;

  int limit_for(const std::string& job_id);
  void invalidate_limit(const std::string& job_id);
  void clear_limit_cache();
  CacheStats get_cache_stats() const;

private:
  struct CachedLimit {
    int limit = 0;
    std::chrono::steady_clock::time_point expires_at;
  };

  Options options_;
  LimitProvider provider_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::map<int, std::string>> slots_;
  std::unordered_map<std::string, CachedLimit> limit_cache_;
  std::uint64_t cache_hits_ = 0;
  std::uint64_t cache_misses_ = 0;
};
