#include "ssh_connection_pool.hpp"

#include <algorithm>

#include "errors.hpp"
#include "log.hpp"

SshConnectionPool::SshConnectionPool(std::shared_ptr<SshSessionFactory> factory,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : factory_(std::move(factory)),
    options_(options),
    logger_(logger ? std::move(logger) : make_component_logger("ssh-pool")) {
  if(options_.max_per_target < 1) options_.max_per_target = 1;
  if(options_.min_per_target > options_.max_per_target) options_.min_per_target = options_.max_per_target;
}

SshConnectionPool::~SshConnectionPool() {
  close_all();
}

SshConnectionPool::Bounds SshConnectionPool::bounds_for(const std::string& fingerprint) const {
  auto it = bounds_.find(fingerprint);
  if(it != bounds_.end()) return it->second;
  Bounds b;
  b.max = std::max<std::size_t>(1, options_.max_per_target);
  b.min = std::min(options_.min_per_target, b.max);
  return b;
}

void SshConnectionPool::set_target_bounds(const SshTarget& target, std::size_t min_idle, std::size_t max_total) {
  std::lock_guard<std::mutex> lock(mutex_);
  Bounds b;
  b.max = std::max<std::size_t>(1, max_total);
  b.min = std::min(min_idle, b.max);
  auto& current = bounds_[target.fingerprint()];
  if(current.min == b.min && current.max == b.max) return;
  current = b;
  logger_->debug("Bounds for {} set to {}..{}", target.display(), b.min, b.max);
  cv_.notify_all();
}

bool SshConnectionPool::remove_locked(const ConnectionHandle& connection) {
  auto bucket_it = buckets_.find(connection->fingerprint);
  if(bucket_it == buckets_.end()) return false;
  auto& conns = bucket_it->second.connections;
  auto it = std::find(conns.begin(), conns.end(), connection);
  if(it == conns.end()) return false;
  conns.erase(it);
  if(conns.empty() && bucket_it->second.opening == 0) buckets_.erase(bucket_it);
  return true;
}

ConnectionHandle SshConnectionPool::acquire(const SshTarget& target, const AbandonCheck& abandon) {
  const std::string fp = target.fingerprint();
  const std::string display = target.display();
  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

  std::unique_lock<std::mutex> lock(mutex_);
  for(;;) {
    if(closed_) throw ConnectionError("connection pool is closed");
    if(abandon && abandon()) {
      logger_->debug("Gave up waiting for a connection to {}", display);
      return nullptr;
    }

    auto& bucket = buckets_[fp];
    ConnectionHandle idle;
    for(const auto& conn : bucket.connections) {
      if(!conn->in_use && (!idle || conn->last_used_at > idle->last_used_at)) idle = conn;
    }

    if(idle) {
      idle->in_use = true;
      lock.unlock();
      const bool alive = idle->session && idle->session->is_alive();
      lock.lock();
      if(alive) {
        idle->last_used_at = std::chrono::steady_clock::now();
        ++reused_;
        logger_->debug("Reusing connection {} to {}", idle->id, display);
        return idle;
      }
      remove_locked(idle);
      ++discarded_;
      lock.unlock();
      logger_->info("Connection {} to {} failed its liveness check, replacing", idle->id, display);
      if(idle->session) idle->session->close();
      lock.lock();
      cv_.notify_all();
      continue;
    }

    const Bounds bounds = bounds_for(fp);
    if(bucket.connections.size() + bucket.opening < bounds.max) {
      ++bucket.opening;
      lock.unlock();
      std::string err;
      std::unique_ptr<SshSession> session;
      try {
        session = factory_->open(target, options_.connect_timeout, err);
      } catch(const std::exception& e) {
        err = e.what();
      }
      lock.lock();
      auto& b = buckets_[fp];
      --b.opening;
      if(!session) {
        if(b.connections.empty() && b.opening == 0) buckets_.erase(fp);
        cv_.notify_all();
        lock.unlock();
        logger_->warn("Cannot connect to {}: {}", display, err);
        throw ConnectionError("cannot connect to " + display + ": " + err);
      }
      auto conn = std::make_shared<PooledConnection>();
      conn->id = next_id_++;
      conn->fingerprint = fp;
      conn->target_display = display;
      conn->session = std::move(session);
      conn->in_use = true;
      conn->created_at = std::chrono::steady_clock::now();
      conn->last_used_at = conn->created_at;
      b.connections.push_back(conn);
      ++created_;
      logger_->info("Opened connection {} to {} ({}/{})", conn->id, display, b.connections.size(), bounds.max);
      return conn;
    }

    if(cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
       std::chrono::steady_clock::now() >= deadline) {
      lock.unlock();
      logger_->warn("Timed out after {}ms waiting for a connection to {}",
                    options_.acquire_timeout.count(), display);
      throw ConnectionError("timed out waiting for a connection to " + display);
    }
  }
}

void SshConnectionPool::wake_waiters() {
  std::lock_guard<std::mutex> lock(mutex_);
  cv_.notify_all();
}

bool SshConnectionPool::release(const ConnectionHandle& connection) {
  if(!connection) return false;
  std::unique_lock<std::mutex> lock(mutex_);
  if(!connection->in_use) {
    lock.unlock();
    logger_->warn("Ignoring double release of connection {}", connection->id);
    return false;
  }
  connection->in_use = false;
  connection->last_used_at = std::chrono::steady_clock::now();
  if(closed_) {
    remove_locked(connection);
    lock.unlock();
    if(connection->session) connection->session->close();
    return true;
  }
  cv_.notify_all();
  return true;
}

void SshConnectionPool::discard(const ConnectionHandle& connection) {
  if(!connection) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection->in_use = false;
    if(remove_locked(connection)) ++discarded_;
    cv_.notify_all();
  }
  logger_->info("Discarded connection {} to {}", connection->id, connection->target_display);
  if(connection->session) connection->session->close();
}

std::size_t SshConnectionPool::evict_idle() {
  const auto now = std::chrono::steady_clock::now();
  std::vector<ConnectionHandle> victims;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto bucket_it = buckets_.begin(); bucket_it != buckets_.end();) {
      auto& conns = bucket_it->second.connections;
      const Bounds bounds = bounds_for(bucket_it->first);
      std::vector<ConnectionHandle> idle;
      for(const auto& conn : conns) {
        if(!conn->in_use) idle.push_back(conn);
      }
      std::sort(idle.begin(), idle.end(), [](const ConnectionHandle& a, const ConnectionHandle& b) {
        return a->last_used_at < b->last_used_at;
      });
      for(const auto& conn : idle) {
        const bool expired = now - conn->created_at >= options_.connection_ttl;
        const bool stale = now - conn->last_used_at >= options_.max_idle && conns.size() > bounds.min;
        if(!expired && !stale) continue;
        conns.erase(std::find(conns.begin(), conns.end(), conn));
        victims.push_back(conn);
      }
      if(conns.empty() && bucket_it->second.opening == 0) bucket_it = buckets_.erase(bucket_it);
      else ++bucket_it;
    }
    evicted_ += victims.size();
    if(!victims.empty()) cv_.notify_all();
  }
  for(const auto& conn : victims) {
    logger_->debug("Evicting idle connection {} to {}", conn->id, conn->target_display);
    if(conn->session) conn->session->close();
  }
  return victims.size();
}

void SshConnectionPool::close_all() {
  std::vector<ConnectionHandle> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for(auto& bucket : buckets_) {
      for(auto& conn : bucket.second.connections) all.push_back(conn);
    }
    buckets_.clear();
    cv_.notify_all();
  }
  for(const auto& conn : all) {
    if(conn->session) conn->session->close();
  }
  if(!all.empty()) logger_->info("Closed {} pooled connections", all.size());
}

PoolStats SshConnectionPool::get_pool_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PoolStats stats;
  for(const auto& bucket : buckets_) {
    if(!bucket.second.connections.empty()) ++stats.targets;
    for(const auto& conn : bucket.second.connections) {
      ++stats.total;
      if(conn->in_use) ++stats.in_use;
      else ++stats.available;
    }
  }
  stats.created = created_;
  stats.reused = reused_;
  stats.discarded = discarded_;
  stats.evicted = evicted_;
  return stats;
}
