#include "tier_cache/key_lock_registry.hpp"

#include "tier_cache/errors.hpp"

#include <algorithm>
#include <functional>

namespace tier_cache {

KeyLockRegistry::Handle::Handle(Handle &&other) noexcept
    : registry_(other.registry_), shard_(other.shard_),
      key_(std::move(other.key_)), lock_(other.lock_) {
  other.registry_ = nullptr;
  other.lock_ = nullptr;
}

KeyLockRegistry::Handle &
KeyLockRegistry::Handle::operator=(Handle &&other) noexcept {
  if (this != &other) {
    release();
    registry_ = other.registry_;
    shard_ = other.shard_;
    key_ = std::move(other.key_);
    lock_ = other.lock_;
    other.registry_ = nullptr;
    other.lock_ = nullptr;
  }
  return *this;
}

KeyLockRegistry::Handle::~Handle() { release(); }

void KeyLockRegistry::Handle::release() {
  if (registry_ != nullptr)
    registry_->release(*this);
}

KeyLockRegistry::KeyLockRegistry(std::size_t shard_count) {
  shard_count = std::max<std::size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

KeyLockRegistry::Handle KeyLockRegistry::acquire(const std::string &key,
                                                 Millis timeout) {
  const std::size_t idx = shard_for(key);
  Shard &shard = *shards_[idx];
  std::unique_lock<std::mutex> lock(shard.mu);

  auto &slot = shard.locks[key];
  if (!slot)
    slot = std::make_unique<KeyLock>();
  KeyLock *kl = slot.get();
  ++kl->refs;

  if (!kl->held && kl->waiters.empty()) {
    kl->held = true;
    ++shard.stats.acquisitions;
    return Handle(this, idx, key, kl);
  }

  ++shard.stats.contended;
  const std::uint64_t ticket = kl->next_ticket++;
  kl->waiters.push_back(ticket);
  const auto deadline = Clock::now() + timeout;
  const bool granted = kl->cv.wait_until(lock, deadline, [&] {
    return !kl->held && kl->waiters.front() == ticket;
  });

  if (!granted) {
    kl->waiters.erase(
        std::find(kl->waiters.begin(), kl->waiters.end(), ticket));
    ++shard.stats.timeouts;
    // The next waiter in line may have been blocked behind this ticket.
    if (!kl->held && !kl->waiters.empty())
      kl->cv.notify_all();
    drop_ref_locked(shard, key, kl);
    throw TimeoutError("timed out after " + std::to_string(timeout.count()) +
                       "ms waiting for lock on '" + key + "'");
  }

  kl->waiters.pop_front();
  if (kl->held)
    throw LockInvariantViolation("second holder granted lock on '" + key + "'");
  kl->held = true;
  ++shard.stats.acquisitions;
  return Handle(this, idx, key, kl);
}

void KeyLockRegistry::release(Handle &handle) {
  if (handle.registry_ != this)
    return;
  Shard &shard = *shards_[handle.shard_];
  {
    std::lock_guard<std::mutex> lock(shard.mu);
    KeyLock *kl = handle.lock_;
    kl->held = false;
    if (!kl->waiters.empty())
      kl->cv.notify_all();
    drop_ref_locked(shard, handle.key_, kl);
  }
  handle.registry_ = nullptr;
  handle.lock_ = nullptr;
}

std::size_t KeyLockRegistry::size() const {
  std::size_t n = 0;
  for (const auto &s : shards_) {
    std::lock_guard<std::mutex> lock(s->mu);
    n += s->locks.size();
  }
  return n;
}

bool KeyLockRegistry::is_locked(const std::string &key) const {
  const Shard &shard = *shards_[shard_for(key)];
  std::lock_guard<std::mutex> lock(shard.mu);
  auto it = shard.locks.find(key);
  return it != shard.locks.end() && it->second->held;
}

KeyLockStats KeyLockRegistry::stats() const {
  KeyLockStats out;
  for (const auto &s : shards_) {
    std::lock_guard<std::mutex> lock(s->mu);
    out.acquisitions += s->stats.acquisitions;
    out.contended += s->stats.contended;
    out.timeouts += s->stats.timeouts;
    out.reclaimed += s->stats.reclaimed;
  }
  return out;
}

std::size_t KeyLockRegistry::shard_for(const std::string &key) const {
  return std::hash<std::string>{}(key) % shards_.size();
}

void KeyLockRegistry::drop_ref_locked(Shard &shard, const std::string &key,
                                      KeyLock *lock) {
  if (--lock->refs > 0)
    return;
  shard.locks.erase(key);
  ++shard.stats.reclaimed;
}

} // namespace tier_cache
