#pragma once

#include "tier_cache/policy.hpp"
#include "tier_cache/tier_store.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tier_cache {

struct LocalStoreConfig {
  std::size_t memory_limit_bytes{64 * 1024 * 1024};
  std::size_t max_key_len{256};
  std::size_t max_value_size{1024 * 1024};
  std::size_t ttl_cleanup_per_tick{128};
  std::string policy{"lru"};
};

struct LocalStoreStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t rejected{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t removals{0};
};

// In-process tier. Expired entries are dropped lazily on read and in bounded
// batches by tick(); the memory bound is enforced on every write.
class LocalStore final : public ITierStore {
public:
  explicit LocalStore(LocalStoreConfig cfg = {}, std::string name = "local");

  std::string name() const override { return name_; }
  std::optional<CacheEntry> get(const std::string &key) override;
  void set(const std::string &key, const CacheEntry &entry) override;
  void remove(const std::string &key) override;
  void remove_by_tag(const std::string &tag) override;

  bool try_set(const std::string &key, const CacheEntry &entry,
               std::string *err = nullptr);
  bool contains(const std::string &key);
  std::optional<std::int64_t> ttl_ms(const std::string &key);
  void tick();
  void clear();

  std::string info() const;
  LocalStoreStats stats() const;
  std::size_t size() const;
  std::size_t memory_used() const;
  std::size_t tag_count() const;
  std::size_t tagged_keys(const std::string &tag) const;

private:
  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  bool live_locked(const std::string &key, TimePoint now);
  void erase_locked(const std::string &key, bool eviction, bool expiration);
  void schedule_locked(const std::string &key, TimePoint deadline);
  void evict_until_fit_locked();
  void tick_locked(TimePoint now);

  LocalStoreConfig cfg_;
  std::string name_;
  std::unique_ptr<IEvictionPolicy> policy_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, StoredEntry> entries_;
  std::unordered_map<std::string, std::uint64_t> expiry_generation_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;
  LocalStoreStats stats_;
  std::size_t memory_used_{0};
};

} // namespace tier_cache
