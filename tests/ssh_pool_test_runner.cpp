#include "errors.hpp"
#include "ssh_connection_pool.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace warpsync::test;

namespace {

using namespace std::chrono_literals;

SshConnectionPool::Options pool_options(std::size_t max_per_target = 2,
                                        std::chrono::milliseconds acquire_timeout = 2000ms) {
  SshConnectionPool::Options o;
  o.max_per_target = max_per_target;
  o.acquire_timeout = acquire_timeout;
  o.connect_timeout = 1000ms;
  return o;
}

struct PoolFixture {
  PoolFixture(TestContext& ctx, SshConnectionPool::Options options)
    : factory(std::make_shared<FakeSshSessionFactory>()),
      pool(factory, options, ctx.logs.logger("ssh-pool")) {}

  std::shared_ptr<FakeSshSessionFactory> factory;
  SshConnectionPool pool;
};

bool test_released_connection_is_reused(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto first = f.pool.acquire(test_target());
  const auto id = first->id;
  if(!f.pool.release(first)) return false;
  auto second = f.pool.acquire(test_target());
  const auto stats = f.pool.get_pool_stats();
  return second->id == id && f.factory->opened() == 1 &&
         stats.created == 1 && stats.reused == 1 && stats.in_use == 1 && stats.total == 1;
}

bool test_targets_are_separate(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto a = f.pool.acquire(test_target("alpha.example.test"));
  auto b = f.pool.acquire(test_target("beta.example.test"));
  SshTarget other_user = test_target("alpha.example.test");
  other_user.user = "backup";
  auto c = f.pool.acquire(other_user);
  const auto stats = f.pool.get_pool_stats();
  return a->id != b->id && a->id != c->id && stats.targets == 3 && stats.total == 3 &&
         a->target_display == "sync@alpha.example.test:2222";
}

bool test_dead_connection_replaced(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto first = f.pool.acquire(test_target());
  const auto id = first->id;
  f.pool.release(first);
  auto sessions = f.factory->sessions();
  sessions.front()->alive = false;

  auto second = f.pool.acquire(test_target());
  const auto stats = f.pool.get_pool_stats();
  return second->id != id && sessions.front()->closed.load() &&
         stats.discarded == 1 && stats.created == 2 && stats.total == 1;
}

bool test_acquire_waits_for_release(TestContext& ctx) {
  PoolFixture f(ctx, pool_options(1, 2000ms));
  auto held = f.pool.acquire(test_target());
  auto waiter = std::async(std::launch::async, [&]{ return f.pool.acquire(test_target()); });
  if(waiter.wait_for(100ms) != std::future_status::timeout) return false;
  f.pool.release(held);
  auto got = waiter.get();
  return got->id == held->id && f.factory->opened() == 1;
}

bool test_acquire_times_out(TestContext& ctx) {
  PoolFixture f(ctx, pool_options(1, 150ms));
  auto held = f.pool.acquire(test_target());
  const auto started = std::chrono::steady_clock::now();
  try {
    f.pool.acquire(test_target());
  } catch(const ConnectionError& e) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return e.category() == ErrorCategory::Connection &&
           std::string(e.what()).find("timed out") != std::string::npos &&
           elapsed >= 140ms && elapsed < 2s;
  }
  return false;
}

bool test_connect_failure(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  f.factory->set_fail(true);
  try {
    f.pool.acquire(test_target());
  } catch(const ConnectionError& e) {
    const std::string message = e.what();
    const auto stats = f.pool.get_pool_stats();
    if(message.find("cannot connect to sync@files.example.test:2222") == std::string::npos) return false;
    if(message.find("id_ed25519") != std::string::npos) return false;
    if(stats.total != 0 || stats.targets != 0) return false;
    // The failed attempt does not hold a place against the limit.
    f.factory->set_fail(false);
    auto a = f.pool.acquire(test_target());
    auto b = f.pool.acquire(test_target());
    return a && b && f.pool.get_pool_stats().total == 2;
  }
  return false;
}

bool test_double_release_rejected(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto conn = f.pool.acquire(test_target());
  return f.pool.release(conn) && !f.pool.release(conn) && !f.pool.release(nullptr) &&
         ctx.logs.contains("double release");
}

bool test_discard_closes_session(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto conn = f.pool.acquire(test_target());
  f.pool.discard(conn);
  const auto stats = f.pool.get_pool_stats();
  return f.factory->sessions().front()->closed.load() && stats.total == 0 && stats.discarded == 1;
}

bool test_evict_idle_respects_min_and_use(TestContext& ctx) {
  auto options = pool_options(3);
  options.max_idle = 0ms;
  options.min_per_target = 1;
  PoolFixture f(ctx, options);
  auto a = f.pool.acquire(test_target());
  auto b = f.pool.acquire(test_target());
  auto c = f.pool.acquire(test_target());
  f.pool.release(a);
  f.pool.release(b);

  // c is in use and already satisfies the minimum.
  const std::size_t evicted = f.pool.evict_idle();
  const auto stats = f.pool.get_pool_stats();
  return evicted == 2 && stats.total == 1 && stats.in_use == 1 && stats.evicted == 2 &&
         f.pool.evict_idle() == 0;
}

bool test_evict_keeps_minimum(TestContext& ctx) {
  auto options = pool_options(3);
  options.max_idle = 0ms;
  options.min_per_target = 1;
  PoolFixture f(ctx, options);
  auto a = f.pool.acquire(test_target());
  auto b = f.pool.acquire(test_target());
  f.pool.release(a);
  f.pool.release(b);
  const std::size_t evicted = f.pool.evict_idle();
  return evicted == 1 && f.pool.get_pool_stats().total == 1;
}

bool test_ttl_expires_even_at_minimum(TestContext& ctx) {
  auto options = pool_options(3);
  options.min_per_target = 1;
  options.connection_ttl = 0ms;
  PoolFixture f(ctx, options);
  auto a = f.pool.acquire(test_target());
  f.pool.release(a);
  return f.pool.evict_idle() == 1 && f.pool.get_pool_stats().total == 0 &&
         f.factory->sessions().front()->closed.load();
}

bool test_target_bounds_override(TestContext& ctx) {
  PoolFixture f(ctx, pool_options(4, 100ms));
  f.pool.set_target_bounds(test_target(), 0, 1);
  auto held = f.pool.acquire(test_target());
  try {
    f.pool.acquire(test_target());
    return false;
  } catch(const ConnectionError&) {
  }
  auto other = f.pool.acquire(test_target("other.example.test"));
  auto other2 = f.pool.acquire(test_target("other.example.test"));
  return other->id != other2->id && f.pool.get_pool_stats().targets == 2;
}

bool test_waiter_abandons_on_wakeup(TestContext& ctx) {
  PoolFixture f(ctx, pool_options(1, 30000ms));
  auto held = f.pool.acquire(test_target());
  std::atomic<bool> give_up{false};
  const auto started = std::chrono::steady_clock::now();
  auto waiter = std::async(std::launch::async, [&]{
    return f.pool.acquire(test_target(), [&]{ return give_up.load(); });
  });
  if(waiter.wait_for(200ms) != std::future_status::timeout) return false;
  give_up = true;
  f.pool.wake_waiters();
  auto result = waiter.get();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  const auto stats = f.pool.get_pool_stats();
  return !result && elapsed < 5s && stats.total == 1 && stats.in_use == 1 && f.pool.release(held);
}

bool test_close_all(TestContext& ctx) {
  PoolFixture f(ctx, pool_options());
  auto held = f.pool.acquire(test_target());
  auto idle = f.pool.acquire(test_target());
  f.pool.release(idle);
  f.pool.close_all();
  bool rejected = false;
  try {
    f.pool.acquire(test_target());
  } catch(const ConnectionError&) {
    rejected = true;
  }
  f.pool.release(held);
  const auto sessions = f.factory->sessions();
  return rejected && sessions.size() == 2 && sessions[0]->closed.load() && sessions[1]->closed.load() &&
         f.pool.get_pool_stats().total == 0;
}

bool test_bounded_under_contention(TestContext& ctx) {
  PoolFixture f(ctx, pool_options(2, 5000ms));
  f.factory->set_open_delay(5ms);
  std::atomic<int> in_use{0};
  std::atomic<int> peak{0};
  std::atomic<bool> failed{false};
  std::vector<std::thread> workers;
  for(int w = 0; w < 6; ++w) {
    workers.emplace_back([&]{
      for(int i = 0; i < 10; ++i) {
        try {
          auto conn = f.pool.acquire(test_target());
          const int now = in_use.fetch_add(1) + 1;
          int prev = peak.load();
          while(now > prev && !peak.compare_exchange_weak(prev, now)) {}
          std::this_thread::sleep_for(1ms);
          in_use.fetch_sub(1);
          f.pool.release(conn);
        } catch(const ConnectionError&) {
          failed = true;
        }
      }
    });
  }
  for(auto& t : workers) t.join();
  const auto stats = f.pool.get_pool_stats();
  return !failed.load() && peak.load() <= 2 && f.factory->opened() <= 2 &&
         stats.total <= 2 && stats.in_use == 0 && stats.created + stats.reused == 60;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"released_connection_is_reused", test_released_connection_is_reused},
    {"targets_are_separate", test_targets_are_separate},
    {"dead_connection_replaced", test_dead_connection_replaced},
    {"acquire_waits_for_release", test_acquire_waits_for_release},
    {"acquire_times_out", test_acquire_times_out},
    {"connect_failure", test_connect_failure},
    {"double_release_rejected", test_double_release_rejected},
    {"discard_closes_session", test_discard_closes_session},
    {"evict_idle_respects_min_and_use", test_evict_idle_respects_min_and_use},
    {"evict_keeps_minimum", test_evict_keeps_minimum},
    {"ttl_expires_even_at_minimum", test_ttl_expires_even_at_minimum},
    {"target_bounds_override", test_target_bounds_override},
    {"waiter_abandons_on_wakeup", test_waiter_abandons_on_wakeup},
    {"close_all", test_close_all},
    {"bounded_under_contention", test_bounded_under_contention}
  };
  return run_suite("ssh pool", tests, argc, argv);
}
