#pragma once

#include "tier_cache/expiration.hpp"
#include "tier_cache/key_lock_registry.hpp"
#include "tier_cache/loader_pool.hpp"
#include "tier_cache/tier_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tier_cache {

struct OrchestratorConfig {
  Millis lock_timeout{5000};
  // Zero runs the loader on the calling thread without a bound.
  Millis loader_timeout{0};
  // Threads and queue depth for bounded loads.
  std::size_t loader_threads{4};
  std::size_t loader_queue{64};
  std::size_t lock_shards{64};
  TierTtlPolicy ttl{};
  bool cache_not_found{false};
  Millis not_found_ttl{1000};
};

struct OrchestratorStats {
  std::uint64_t local_hits{0};
  std::uint64_t shared_hits{0};
  std::uint64_t lock_acquisitions{0};
  std::uint64_t coalesced{0};
  std::uint64_t loads{0};
  std::uint64_t load_failures{0};
  std::uint64_t not_found{0};
  std::uint64_t negative_hits{0};
  std::uint64_t lock_timeouts{0};
  std::uint64_t loader_timeouts{0};
  std::uint64_t tier_errors{0};
  std::uint64_t backfills{0};
  std::uint64_t invalidations{0};
};

// Two-tier cache-aside front for an origin. Local is read first, Shared
// second; on a miss in both, at most one caller per key runs the loader while
// the others wait on the key lock and then read what it wrote. Shared may be
// null, which leaves a single-tier cache.
class CacheOrchestrator {
public:
  CacheOrchestrator(OrchestratorConfig cfg, std::shared_ptr<ITierStore> local,
                    std::shared_ptr<ITierStore> shared);
  CacheOrchestrator(const CacheOrchestrator &) = delete;
  CacheOrchestrator &operator=(const CacheOrchestrator &) = delete;

  // Throws LoadError when the loader fails and TimeoutError when the key lock
  // or the loader exceeds its bound. Tier failures are treated as misses.
  std::optional<Bytes> get(const std::string &key, const Loader &loader,
                           const ExpirationSpec &spec,
                           const std::vector<std::string> &tags = {});

  // Writes a value the caller already has to both tiers.
  void set(const std::string &key, const Bytes &value,
           const ExpirationSpec &spec,
           const std::vector<std::string> &tags = {});
  void invalidate(const std::string &key);
  void invalidate_tag(const std::string &tag);

  OrchestratorStats stats() const;
  std::string info() const;
  const OrchestratorConfig &config() const { return cfg_; }
  const ExpirationPolicy &expiration() const { return expiration_; }
  KeyLockRegistry &locks() { return locks_; }
  // Null when loads run on the calling thread.
  const LoaderPool *loader_pool() const { return loaders_.get(); }

private:
  struct Counters {
    std::atomic<std::uint64_t> local_hits{0};
    std::atomic<std::uint64_t> shared_hits{0};
    std::atomic<std::uint64_t> lock_acquisitions{0};
    std::atomic<std::uint64_t> coalesced{0};
    std::atomic<std::uint64_t> loads{0};
    std::atomic<std::uint64_t> load_failures{0};
    std::atomic<std::uint64_t> not_found{0};
    std::atomic<std::uint64_t> negative_hits{0};
    std::atomic<std::uint64_t> lock_timeouts{0};
    std::atomic<std::uint64_t> loader_timeouts{0};
    std::atomic<std::uint64_t> tier_errors{0};
    std::atomic<std::uint64_t> backfills{0};
    std::atomic<std::uint64_t> invalidations{0};
  };

  enum class Source { Local, Shared };
  struct Found {
    CacheEntry entry;
    Source source;
  };

  std::optional<Found> lookup(const std::string &key);
  std::optional<CacheEntry> read_tier(ITierStore &tier, const std::string &key);
  void write_tier(ITierStore &tier, const std::string &key,
                  const CacheEntry &entry);
  void remove_from(ITierStore &tier, const std::string &key);
  void remove_tag_from(ITierStore &tier, const std::string &tag);
  void backfill_local(const std::string &key, const CacheEntry &from_shared,
                      const ExpirationSpec &spec,
                      const std::vector<std::string> &tags);
  std::optional<Bytes> resolve(const std::string &key, Found found,
                               const ExpirationSpec &spec,
                               const std::vector<std::string> &tags);
  std::optional<Bytes> run_loader(const std::string &key, const Loader &loader);
  void store_loaded(const std::string &key, const Bytes &value,
                    const ExpirationSpec &spec,
                    const std::vector<std::string> &tags);

  OrchestratorConfig cfg_;
  std::shared_ptr<ITierStore> local_;
  std::shared_ptr<ITierStore> shared_;
  ExpirationPolicy expiration_;
  KeyLockRegistry locks_;
  Counters counters_;
  std::unique_ptr<LoaderPool> loaders_;
};

} // namespace tier_cache
