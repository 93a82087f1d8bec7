#pragma once

#include "tier_cache/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tier_cache {

struct KeyLockStats {
  std::uint64_t acquisitions{0};
  std::uint64_t contended{0};
  std::uint64_t timeouts{0};
  std::uint64_t reclaimed{0};
};

// One exclusive lock per key, created on first use and erased once nobody
// holds or waits on it. Keys hash onto shards; a shard mutex only guards the
// bookkeeping of its records and is released while callers wait or hold.
class KeyLockRegistry {
  struct KeyLock;

public:
  class Handle {
  public:
    Handle() = default;
    Handle(Handle &&other) noexcept;
    Handle &operator=(Handle &&other) noexcept;
    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;
    ~Handle();

    bool owns_lock() const { return registry_ != nullptr; }
    const std::string &key() const { return key_; }
    void release();

  private:
    friend class KeyLockRegistry;
    Handle(KeyLockRegistry *registry, std::size_t shard, std::string key,
           KeyLock *lock)
        : registry_(registry), shard_(shard), key_(std::move(key)),
          lock_(lock) {}

    KeyLockRegistry *registry_{nullptr};
    std::size_t shard_{0};
    std::string key_;
    KeyLock *lock_{nullptr};
  };

  explicit KeyLockRegistry(std::size_t shard_count = 64);
  KeyLockRegistry(const KeyLockRegistry &) = delete;
  KeyLockRegistry &operator=(const KeyLockRegistry &) = delete;

  // Waits at most `timeout` (FIFO among waiters of the same key) and throws
  // TimeoutError when it elapses.
  Handle acquire(const std::string &key, Millis timeout);
  void release(Handle &handle);

  std::size_t size() const;
  std::size_t shard_count() const { return shards_.size(); }
  bool is_locked(const std::string &key) const;
  KeyLockStats stats() const;

private:
  struct KeyLock {
    std::condition_variable cv;
    bool held{false};
    std::deque<std::uint64_t> waiters;
    std::uint64_t next_ticket{0};
    // Holder plus waiters. The record is erased when this drops to zero.
    std::size_t refs{0};
  };

  struct Shard {
    mutable std::mutex mu;
    std::unordered_map<std::string, std::unique_ptr<KeyLock>> locks;
    KeyLockStats stats;
  };

  std::size_t shard_for(const std::string &key) const;
  void drop_ref_locked(Shard &shard, const std::string &key, KeyLock *lock);

  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace tier_cache
