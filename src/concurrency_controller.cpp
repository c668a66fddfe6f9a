#include "concurrency_controller.hpp"

#include "log.hpp"

JobConcurrencyController::JobConcurrencyController(Options options,
                                                   LimitProvider provider,
                                                   std::shared_ptr<Logger> logger)
  : options_(options),
    provider_(std::move(provider)),
    logger_(logger ? std::move(logger) : make_component_logger("concurrency")) {
  if(options_.default_limit < 1) options_.default_limit = 1;
}

int JobConcurrencyController::limit_for(const std::string& job_id) {
  const auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limit_cache_.find(job_id);
    if(it != limit_cache_.end() && it->second.expires_at > now) {
      ++cache_hits_;
      return it->second.limit;
    }
    ++cache_misses_;
  }

  // The provider may hit the job catalog; it runs outside the slot lock.
  int limit = options_.default_limit;
  if(provider_) {
    if(auto provided = provider_(job_id)) {
      if(*provided >= 1) limit = *provided;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  limit_cache_[job_id] = CachedLimit{limit, now + options_.limit_cache_ttl};
  return limit;
}

std::optional<int> JobConcurrencyController::try_acquire_slot(const std::string& job_id,
                                                              const std::string& transfer_id) {
  const int limit = limit_for(job_id);

  std::lock_guard<std::mutex> lock(mutex_);
  auto& held = slots_[job_id];
  if(static_cast<int>(held.size()) >= limit) {
    logger_->debug("Job {} at limit {}, refusing {}", job_id, limit, transfer_id);
    return std::nullopt;
  }
  int slot = 0;
  for(const auto& entry : held) {
    if(entry.first != slot) break;
    ++slot;
  }
  held.emplace(slot, transfer_id);
  logger_->debug("Job {} slot {} -> {} ({}/{})", job_id, slot, transfer_id, held.size(), limit);
  return slot;
}

bool JobConcurrencyController::release_slot(const std::string& job_id, int slot) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto job_it = slots_.find(job_id);
  if(job_it == slots_.end() || job_it->second.erase(slot) == 0) {
    logger_->warn("Rejected release of slot {} for job {}: not held", slot, job_id);
    return false;
  }
  if(job_it->second.empty()) slots_.erase(job_it);
  return true;
}

bool JobConcurrencyController::release_slot_by_transfer(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto job_it = slots_.begin(); job_it != slots_.end(); ++job_it) {
    for(auto it = job_it->second.begin(); it != job_it->second.end(); ++it) {
      if(it->second == transfer_id) {
        logger_->debug("Released slot {} of job {} held by {}", it->first, job_it->first, transfer_id);
        job_it->second.erase(it);
        if(job_it->second.empty()) slots_.erase(job_it);
        return true;
      }
    }
  }
  return false;
}

std::optional<JobConcurrencyController::SlotHolder>
JobConcurrencyController::holder_of(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& job : slots_) {
    for(const auto& entry : job.second) {
      if(entry.second == transfer_id) return SlotHolder{job.first, entry.first};
    }
  }
  return std::nullopt;
}

std::map<std::string, std::map<int, std::string>> JobConcurrencyController::occupancy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_;
}

std::size_t JobConcurrencyController::occupied_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for(const auto& job : slots_) total += job.second.size();
  return total;
}

std::size_t JobConcurrencyController::occupied_count(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(job_id);
  return it == slots_.end() ? 0 : it->second.size();
}

void JobConcurrencyController::invalidate_limit(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  limit_cache_.erase(job_id);
}

void JobConcurrencyController::clear_limit_cache() {
  std::lock_guard<std::mutex> lock(mutex_);
  limit_cache_.clear();
}

JobConcurrencyController::CacheStats JobConcurrencyController::get_cache_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.cached_jobs = limit_cache_.size();
  stats.hits = cache_hits_;
  stats.misses = cache_misses_;
  stats.active_jobs = slots_.size();
  for(const auto& job : slots_) stats.occupied_slots += job.second.size();
  return stats;
}
