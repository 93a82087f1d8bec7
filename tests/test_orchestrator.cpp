#include "tier_cache/errors.hpp"
#include "tier_cache/local_store.hpp"
#include "tier_cache/orchestrator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <latch>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tier_cache;

namespace {

class UnreachableStore final : public ITierStore {
public:
  std::string name() const override { return "unreachable"; }
  std::optional<CacheEntry> get(const std::string &) override {
    throw TierUnavailable(name(), "connection refused");
  }
  void set(const std::string &, const CacheEntry &) override {
    throw TierUnavailable(name(), "connection refused");
  }
  void remove(const std::string &) override {
    throw TierUnavailable(name(), "connection refused");
  }
  void remove_by_tag(const std::string &) override {
    throw TierUnavailable(name(), "connection refused");
  }
};

struct Tiers {
  std::shared_ptr<LocalStore> local = std::make_shared<LocalStore>(LocalStoreConfig{}, "local");
  std::shared_ptr<LocalStore> shared = std::make_shared<LocalStore>(LocalStoreConfig{}, "shared");
};

OrchestratorConfig full_ttl() {
  OrchestratorConfig cfg;
  cfg.ttl.local_ttl_ratio = 1.0;
  return cfg;
}

Loader counting_loader(std::shared_ptr<std::atomic<int>> calls,
                       std::string value = "v") {
  return [calls, value](const std::string &) -> std::optional<Bytes> {
    ++*calls;
    return to_bytes(value);
  };
}

const auto kMinute = ExpirationSpec::absolute(Millis(60000));

void sleep_ms(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace

TEST_CASE("cold key under 100 concurrent callers loads exactly once",
          "[orchestrator][stampede]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);

  std::atomic<int> calls{0};
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  Loader slow = [&](const std::string &key) -> std::optional<Bytes> {
    const int now = ++in_flight;
    int seen = max_in_flight.load();
    while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
    }
    ++calls;
    sleep_ms(50);
    --in_flight;
    return to_bytes("value:" + key);
  };

  constexpr int kCallers = 100;
  std::latch start(kCallers);
  std::vector<std::optional<Bytes>> results(kCallers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] {
      start.arrive_and_wait();
      results[i] = cache.get("cold", slow, kMinute);
    });
  }
  for (auto &th : threads)
    th.join();

  CHECK(calls.load() == 1);
  CHECK(max_in_flight.load() == 1);
  for (const auto &r : results) {
    REQUIRE(r.has_value());
    CHECK(to_string(*r) == "value:cold");
  }
  CHECK(cache.locks().size() == 0);
  const auto s = cache.stats();
  CHECK(s.loads == 1);
  CHECK(s.local_hits + s.shared_hits + 1 == kCallers);
}

TEST_CASE("slow load on one key does not delay another key",
          "[orchestrator][independence]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);

  std::promise<void> entered;
  std::promise<void> gate;
  auto gate_future = gate.get_future().share();
  Loader blocking = [&](const std::string &) -> std::optional<Bytes> {
    entered.set_value();
    gate_future.wait();
    return to_bytes("a");
  };
  std::atomic<bool> a_done{false};
  std::thread a([&] {
    cache.get("A", blocking, kMinute);
    a_done = true;
  });
  entered.get_future().wait();

  auto calls = std::make_shared<std::atomic<int>>(0);
  auto b = cache.get("B", counting_loader(calls, "b"), kMinute);
  REQUIRE(b.has_value());
  CHECK(to_string(*b) == "b");
  CHECK_FALSE(a_done.load());

  gate.set_value();
  a.join();
  CHECK(a_done.load());
}

TEST_CASE("value written while waiting on the lock is used instead of loading",
          "[orchestrator][double-check]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);

  auto holder = cache.locks().acquire("k", Millis(100));
  std::optional<Bytes> result;
  std::thread waiter([&] {
    result = cache.get("k", counting_loader(calls, "from-origin"), kMinute);
  });
  for (int i = 0; i < 2000 && cache.locks().stats().contended == 0; ++i)
    sleep_ms(1);
  REQUIRE(cache.locks().stats().contended == 1);

  CacheEntry seeded;
  seeded.value = to_bytes("seeded");
  seeded.expiration = kMinute;
  t.shared->set("k", seeded);
  holder.release();
  waiter.join();

  CHECK(calls->load() == 0);
  REQUIRE(result.has_value());
  CHECK(to_string(*result) == "seeded");
  CHECK(cache.stats().coalesced == 1);
  CHECK(t.local->contains("k"));
}

TEST_CASE("loader failure is not cached and the next call retries",
          "[orchestrator][errors]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  std::atomic<int> calls{0};
  Loader flaky = [&](const std::string &) -> std::optional<Bytes> {
    if (++calls == 1)
      throw std::runtime_error("origin down");
    return to_bytes("ok");
  };

  CHECK_THROWS_AS(cache.get("k", flaky, kMinute), LoadError);
  CHECK_FALSE(t.local->contains("k"));
  CHECK_FALSE(t.shared->contains("k"));
  CHECK(cache.locks().size() == 0);

  auto v = cache.get("k", flaky, kMinute);
  REQUIRE(v.has_value());
  CHECK(to_string(*v) == "ok");
  CHECK(calls.load() == 2);
  CHECK(cache.stats().load_failures == 1);
}

TEST_CASE("load error names the key and cause", "[orchestrator][errors]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  Loader broken = [](const std::string &) -> std::optional<Bytes> {
    throw std::runtime_error("boom");
  };
  try {
    cache.get("user:7", broken, kMinute);
    FAIL("expected LoadError");
  } catch (const LoadError &e) {
    CHECK(e.key() == "user:7");
    CHECK(std::string(e.what()).find("boom") != std::string::npos);
  }
}

TEST_CASE("absolute expiration reloads after the deadline",
          "[orchestrator][expiration]") {
  Tiers t;
  CacheOrchestrator cache(full_ttl(), t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);
  const auto spec = ExpirationSpec::absolute(Millis(100));

  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  CHECK(calls->load() == 1);
  sleep_ms(150);
  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  CHECK(calls->load() == 2);
}

TEST_CASE("sliding expiration renews on read and lapses when idle",
          "[orchestrator][expiration]") {
  Tiers t;
  CacheOrchestrator cache(full_ttl(), t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);
  const auto spec = ExpirationSpec::sliding(Millis(100));

  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  sleep_ms(50);
  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  sleep_ms(70);
  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  CHECK(calls->load() == 1);

  sleep_ms(150);
  REQUIRE(cache.get("k", counting_loader(calls), spec).has_value());
  CHECK(calls->load() == 2);
}

TEST_CASE("tag invalidation drops tagged keys from both tiers",
          "[orchestrator][tags]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto loader = counting_loader(calls);

  for (const auto *k : {"p1", "p2", "p3"})
    cache.get(k, loader, kMinute, {"products"});
  cache.get("plain", loader, kMinute);
  CHECK(calls->load() == 4);

  cache.invalidate_tag("products");
  CHECK(t.local->tagged_keys("products") == 0);
  CHECK(t.shared->tagged_keys("products") == 0);
  CHECK_FALSE(t.shared->contains("p1"));

  for (const auto *k : {"p1", "p2", "p3"})
    cache.get(k, loader, kMinute, {"products"});
  cache.get("plain", loader, kMinute);
  CHECK(calls->load() == 7);
}

TEST_CASE("invalidate removes a key from both tiers",
          "[orchestrator][invalidate]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);

  cache.get("k", counting_loader(calls, "old"), kMinute);
  cache.invalidate("k");
  CHECK_FALSE(t.local->contains("k"));
  CHECK_FALSE(t.shared->contains("k"));
  auto v = cache.get("k", counting_loader(calls, "new"), kMinute);
  REQUIRE(v.has_value());
  CHECK(to_string(*v) == "new");
  CHECK(calls->load() == 2);
}

TEST_CASE("shared hit backfills local with the derived lifetime",
          "[orchestrator][backfill]") {
  Tiers t;
  OrchestratorConfig cfg;
  cfg.ttl.local_ttl_ratio = 0.25;
  CacheOrchestrator cache(cfg, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);

  CacheEntry seeded;
  seeded.value = to_bytes("remote");
  seeded.expiration = kMinute;
  t.shared->set("k", seeded);

  auto v = cache.get("k", counting_loader(calls), kMinute);
  REQUIRE(v.has_value());
  CHECK(to_string(*v) == "remote");
  CHECK(calls->load() == 0);
  CHECK(cache.stats().shared_hits == 1);
  CHECK(cache.stats().backfills == 1);

  auto ttl = t.local->ttl_ms("k");
  REQUIRE(ttl.has_value());
  CHECK(*ttl <= 15000);
  CHECK(*ttl > 10000);

  cache.get("k", counting_loader(calls), kMinute);
  CHECK(cache.stats().local_hits == 1);
}

TEST_CASE("set writes through to both tiers", "[orchestrator][set]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  cache.set("k", to_bytes("direct"), kMinute, {"grp"});
  CHECK(t.local->contains("k"));
  CHECK(t.shared->contains("k"));
  CHECK(t.shared->tagged_keys("grp") == 1);
}

TEST_CASE("unreachable shared tier degrades to origin loads",
          "[orchestrator][degrade]") {
  auto local = std::make_shared<LocalStore>();
  CacheOrchestrator cache({}, local, std::make_shared<UnreachableStore>());
  auto calls = std::make_shared<std::atomic<int>>(0);

  auto v = cache.get("k", counting_loader(calls), kMinute);
  REQUIRE(v.has_value());
  CHECK(calls->load() == 1);
  CHECK(local->contains("k"));
  cache.get("k", counting_loader(calls), kMinute);
  CHECK(calls->load() == 1);

  CHECK_NOTHROW(cache.invalidate("k"));
  CHECK_NOTHROW(cache.invalidate_tag("x"));
  CHECK(cache.stats().tier_errors >= 4);
}

TEST_CASE("both tiers unreachable still serves from origin",
          "[orchestrator][degrade]") {
  CacheOrchestrator cache({}, std::make_shared<UnreachableStore>(),
                          std::make_shared<UnreachableStore>());
  auto calls = std::make_shared<std::atomic<int>>(0);
  REQUIRE(cache.get("k", counting_loader(calls), kMinute).has_value());
  REQUIRE(cache.get("k", counting_loader(calls), kMinute).has_value());
  CHECK(calls->load() == 2);
}

TEST_CASE("single tier mode works without a shared store",
          "[orchestrator][single]") {
  auto local = std::make_shared<LocalStore>();
  CacheOrchestrator cache({}, local, nullptr);
  auto calls = std::make_shared<std::atomic<int>>(0);
  cache.get("k", counting_loader(calls), kMinute);
  cache.get("k", counting_loader(calls), kMinute);
  CHECK(calls->load() == 1);
  CHECK(cache.info().find("shared_tier:none") != std::string::npos);
}

TEST_CASE("lock wait beyond the bound surfaces a timeout",
          "[orchestrator][timeout]") {
  Tiers t;
  OrchestratorConfig cfg;
  cfg.lock_timeout = Millis(40);
  CacheOrchestrator cache(cfg, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);

  auto holder = cache.locks().acquire("k", Millis(100));
  CHECK_THROWS_AS(cache.get("k", counting_loader(calls), kMinute), TimeoutError);
  CHECK(calls->load() == 0);
  CHECK(cache.stats().lock_timeouts == 1);
  holder.release();
  CHECK(cache.locks().size() == 0);
  CHECK(cache.get("k", counting_loader(calls), kMinute).has_value());
}

TEST_CASE("hung loader is abandoned after the loader timeout",
          "[orchestrator][timeout]") {
  Tiers t;
  OrchestratorConfig cfg;
  cfg.loader_timeout = Millis(50);
  CacheOrchestrator cache(cfg, t.local, t.shared);

  Loader hung = [](const std::string &) -> std::optional<Bytes> {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return to_bytes("late");
  };
  CHECK_THROWS_AS(cache.get("k", hung, kMinute), TimeoutError);
  CHECK(cache.locks().size() == 0);
  CHECK_FALSE(t.local->contains("k"));
  CHECK(cache.stats().loader_timeouts == 1);

  auto calls = std::make_shared<std::atomic<int>>(0);
  auto v = cache.get("k", counting_loader(calls, "fresh"), kMinute);
  REQUIRE(v.has_value());
  CHECK(to_string(*v) == "fresh");

  Loader failing = [](const std::string &) -> std::optional<Bytes> {
    throw std::runtime_error("bad row");
  };
  CHECK_THROWS_AS(cache.get("other", failing, kMinute), LoadError);
}

TEST_CASE("not found is returned empty and only cached when enabled",
          "[orchestrator][not-found]") {
  std::atomic<int> calls{0};
  Loader absent = [&](const std::string &) -> std::optional<Bytes> {
    ++calls;
    return std::nullopt;
  };

  SECTION("default does not cache absence") {
    Tiers t;
    CacheOrchestrator cache({}, t.local, t.shared);
    CHECK_FALSE(cache.get("ghost", absent, kMinute).has_value());
    CHECK_FALSE(cache.get("ghost", absent, kMinute).has_value());
    CHECK(calls.load() == 2);
    CHECK(cache.stats().not_found == 2);
  }

  SECTION("negative entries short-circuit until they expire") {
    Tiers t;
    OrchestratorConfig cfg;
    cfg.cache_not_found = true;
    cfg.not_found_ttl = Millis(100);
    CacheOrchestrator cache(cfg, t.local, t.shared);
    CHECK_FALSE(cache.get("ghost", absent, kMinute).has_value());
    CHECK_FALSE(cache.get("ghost", absent, kMinute).has_value());
    CHECK(calls.load() == 1);
    CHECK(cache.stats().negative_hits == 1);
    CHECK_FALSE(t.shared->contains("ghost"));

    sleep_ms(150);
    CHECK_FALSE(cache.get("ghost", absent, kMinute).has_value());
    CHECK(calls.load() == 2);
  }
}

TEST_CASE("info reports counters", "[orchestrator][info]") {
  Tiers t;
  CacheOrchestrator cache({}, t.local, t.shared);
  auto calls = std::make_shared<std::atomic<int>>(0);
  cache.get("k", counting_loader(calls), kMinute);
  cache.get("k", counting_loader(calls), kMinute);
  const auto info = cache.info();
  CHECK(info.find("loads:1") != std::string::npos);
  CHECK(info.find("local_hits:1") != std::string::npos);
  CHECK(info.find("locks_live:0") != std::string::npos);
}

namespace {
std::size_t thread_count() {
  std::size_t n = 0;
  for (const auto &e : std::filesystem::directory_iterator("/proc/self/task")) {
    (void)e;
    ++n;
  }
  return n;
}

// Blocks until `release` is set, bounded so a broken test cannot hang.
Loader gated_loader(std::shared_ptr<std::atomic<bool>> release,
                    std::shared_ptr<std::atomic<int>> starts) {
  return [release, starts](const std::string &key) -> std::optional<Bytes> {
    ++*starts;
    for (int i = 0; i < 400 && !release->load(); ++i)
      sleep_ms(5);
    return to_bytes("slow:" + key);
  };
}
} // namespace

TEST_CASE("timed-out loads run on a fixed set of threads",
          "[orchestrator][timeout]") {
  Tiers t;
  OrchestratorConfig cfg;
  cfg.loader_timeout = Millis(5);
  cfg.loader_threads = 2;
  cfg.loader_queue = 64;
  const auto before = thread_count();
  auto release = std::make_shared<std::atomic<bool>>(false);
  auto starts = std::make_shared<std::atomic<int>>(0);
  {
    CacheOrchestrator cache(cfg, t.local, t.shared);
    REQUIRE(cache.loader_pool() != nullptr);
    CHECK(cache.loader_pool()->workers() == 2);

    auto slow = gated_loader(release, starts);
    for (int i = 0; i < 50; ++i)
      CHECK_THROWS_AS(cache.get("k" + std::to_string(i), slow, kMinute),
                      TimeoutError);
    CHECK(cache.stats().loader_timeouts == 50);
    CHECK(thread_count() <= before + 2);
    CHECK(cache.locks().size() == 0);

    release->store(true);
    for (int i = 0; i < 100 && cache.loader_pool()->queued() > 0; ++i)
      sleep_ms(5);
    CHECK(cache.loader_pool()->queued() == 0);
    CHECK(starts->load() <= 2);
    CHECK(cache.info().find("loader_workers:2") != std::string::npos);
  }
  CHECK(thread_count() <= before);
}

TEST_CASE("a full loader queue rejects new loads", "[orchestrator][timeout]") {
  Tiers t;
  OrchestratorConfig cfg;
  cfg.loader_timeout = Millis(3000);
  cfg.loader_threads = 1;
  cfg.loader_queue = 1;
  CacheOrchestrator cache(cfg, t.local, t.shared);
  auto release = std::make_shared<std::atomic<bool>>(false);
  auto starts = std::make_shared<std::atomic<int>>(0);
  auto slow = gated_loader(release, starts);

  auto a = std::async(std::launch::async,
                      [&] { return cache.get("a", slow, kMinute); });
  for (int i = 0; i < 200 && cache.loader_pool()->running() == 0; ++i)
    sleep_ms(5);
  auto b = std::async(std::launch::async,
                      [&] { return cache.get("b", slow, kMinute); });
  for (int i = 0; i < 200 && cache.loader_pool()->queued() == 0; ++i)
    sleep_ms(5);
  REQUIRE(cache.loader_pool()->queued() == 1);

  try {
    cache.get("c", slow, kMinute);
    FAIL("expected the load to be rejected");
  } catch (const TimeoutError &e) {
    CHECK(std::string(e.what()).find("saturated") != std::string::npos);
  }
  CHECK(cache.stats().loader_timeouts == 1);
  CHECK(cache.locks().size() == 2);

  release->store(true);
  REQUIRE(a.get().has_value());
  REQUIRE(b.get().has_value());
  CHECK(starts->load() == 2);
  CHECK(cache.get("c", slow, kMinute).has_value());
}

TEST_CASE("loaders throwing non-standard exceptions raise LoadError",
          "[orchestrator][errors]") {
  Loader odd = [](const std::string &) -> std::optional<Bytes> { throw 42; };

  SECTION("inline") {
    Tiers t;
    CacheOrchestrator cache({}, t.local, t.shared);
    CHECK_THROWS_AS(cache.get("k", odd, kMinute), LoadError);
    CHECK(cache.stats().load_failures == 1);
    CHECK(cache.locks().size() == 0);
  }

  SECTION("on the loader pool") {
    Tiers t;
    OrchestratorConfig cfg;
    cfg.loader_timeout = Millis(1000);
    CacheOrchestrator cache(cfg, t.local, t.shared);
    CHECK_THROWS_AS(cache.get("k", odd, kMinute), LoadError);
    CHECK(cache.stats().load_failures == 1);
    CHECK_FALSE(t.local->contains("k"));
  }
}
