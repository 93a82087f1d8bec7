#include "tier_cache/local_store.hpp"

#include "tier_cache/errors.hpp"
#include "tier_cache/expiration.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace tier_cache {

LocalStore::LocalStore(LocalStoreConfig cfg, std::string name)
    : cfg_(std::move(cfg)), name_(std::move(name)),
      policy_(make_policy_by_name(cfg_.policy)) {
  if (!policy_) {
    spdlog::warn("{}: unknown eviction policy '{}', using lru", name_,
                 cfg_.policy);
    cfg_.policy = "lru";
    policy_ = make_policy_by_name(cfg_.policy);
  }
  if (cfg_.ttl_cleanup_per_tick == 0)
    cfg_.ttl_cleanup_per_tick = 1;
}

std::optional<CacheEntry> LocalStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  tick_locked(now);
  if (!live_locked(key, now)) {
    ++stats_.misses;
    return std::nullopt;
  }
  auto &e = entries_[key];
  e.last_access = now;
  ++e.hit_count;
  e.deadline = ExpirationPolicy::deadline_on_read(e.entry.expiration,
                                                  e.deadline, now);
  ++stats_.hits;
  policy_->on_access(key);
  return e.entry;
}

void LocalStore::set(const std::string &key, const CacheEntry &entry) {
  std::string err;
  if (!try_set(key, entry, &err))
    throw TierUnavailable(name_, err + " (key '" + key + "')");
}

bool LocalStore::try_set(const std::string &key, const CacheEntry &entry,
                         std::string *err) {
  if (key.empty() || key.size() > cfg_.max_key_len) {
    if (err)
      *err = "invalid key length";
    std::lock_guard<std::mutex> lock(mu_);
    ++stats_.rejected;
    return false;
  }
  if (entry.value.size() > cfg_.max_value_size ||
      entry.value.size() + key.size() > cfg_.memory_limit_bytes) {
    if (err)
      *err = "value too large";
    std::lock_guard<std::mutex> lock(mu_);
    ++stats_.rejected;
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  tick_locked(now);

  StoredEntry candidate;
  candidate.entry = entry;
  candidate.size_bytes = entry.value.size() + key.size();
  candidate.created_at = now;
  candidate.last_access = now;
  candidate.deadline =
      ExpirationPolicy::deadline_on_write(entry.expiration, now);

  if (entries_.contains(key))
    erase_locked(key, false, false);

  auto &stored = entries_[key] = std::move(candidate);
  memory_used_ += stored.size_bytes;
  for (const auto &tag : stored.entry.tags)
    tag_index_[tag].insert(key);
  policy_->on_insert(key);
  if (stored.deadline.has_value())
    schedule_locked(key, *stored.deadline);
  ++stats_.sets;

  evict_until_fit_locked();
  return true;
}

void LocalStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!entries_.contains(key))
    return;
  erase_locked(key, false, false);
  ++stats_.removals;
}

void LocalStore::remove_by_tag(const std::string &tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tag_index_.find(tag);
  if (it == tag_index_.end())
    return;
  const std::vector<std::string> keys(it->second.begin(), it->second.end());
  for (const auto &k : keys) {
    if (entries_.contains(k)) {
      erase_locked(k, false, false);
      ++stats_.removals;
    }
  }
  tag_index_.erase(tag);
}

bool LocalStore::contains(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  return live_locked(key, Clock::now());
}

std::optional<std::int64_t> LocalStore::ttl_ms(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  if (!live_locked(key, now))
    return std::nullopt;
  const auto &e = entries_[key];
  if (!e.deadline.has_value())
    return -1;
  return std::chrono::duration_cast<Millis>(*e.deadline - now).count();
}

void LocalStore::tick() {
  std::lock_guard<std::mutex> lock(mu_);
  tick_locked(Clock::now());
}

void LocalStore::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto &[k, _] : entries_)
    policy_->on_erase(k);
  entries_.clear();
  expiry_generation_.clear();
  expiry_heap_ = {};
  tag_index_.clear();
  memory_used_ = 0;
}

std::string LocalStore::info() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream os;
  os << "store:" << name_ << "\n";
  os << "policy_mode:" << policy_->name() << "\n";
  os << "keys:" << entries_.size() << "\n";
  os << "policy_tracked:" << policy_->tracked() << "\n";
  os << "tags:" << tag_index_.size() << "\n";
  os << "memory_used_bytes:" << memory_used_ << "\n";
  os << "memory_limit_bytes:" << cfg_.memory_limit_bytes << "\n";
  os << "expiry_heap:" << expiry_heap_.size() << "\n";
  os << "hits:" << stats_.hits << "\n";
  os << "misses:" << stats_.misses << "\n";
  os << "sets:" << stats_.sets << "\n";
  os << "rejected:" << stats_.rejected << "\n";
  os << "evictions:" << stats_.evictions << "\n";
  os << "expirations:" << stats_.expirations << "\n";
  os << "removals:" << stats_.removals << "\n";
  return os.str();
}

LocalStoreStats LocalStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

std::size_t LocalStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::size_t LocalStore::memory_used() const {
  std::lock_guard<std::mutex> lock(mu_);
  return memory_used_;
}

std::size_t LocalStore::tag_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tag_index_.size();
}

std::size_t LocalStore::tagged_keys(const std::string &tag) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tag_index_.find(tag);
  return it == tag_index_.end() ? 0 : it->second.size();
}

bool LocalStore::live_locked(const std::string &key, TimePoint now) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  if (ExpirationPolicy::expired(it->second.deadline, now)) {
    erase_locked(key, false, true);
    return false;
  }
  return true;
}

void LocalStore::erase_locked(const std::string &key, bool eviction,
                              bool expiration) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  for (const auto &tag : it->second.entry.tags) {
    auto t = tag_index_.find(tag);
    if (t == tag_index_.end())
      continue;
    t->second.erase(key);
    if (t->second.empty())
      tag_index_.erase(t);
  }
  memory_used_ -= it->second.size_bytes;
  policy_->on_erase(key);
  entries_.erase(it);
  expiry_generation_.erase(key);
  if (eviction)
    ++stats_.evictions;
  if (expiration)
    ++stats_.expirations;
}

void LocalStore::schedule_locked(const std::string &key, TimePoint deadline) {
  const auto gen = ++expiry_generation_[key];
  expiry_heap_.push({deadline, key, gen});
}

void LocalStore::evict_until_fit_locked() {
  std::size_t evicted = 0;
  std::size_t safety = entries_.size() + 1;
  while (memory_used_ > cfg_.memory_limit_bytes && safety-- > 0) {
    auto victim = policy_->pick_victim();
    if (!victim.has_value())
      break;
    erase_locked(*victim, true, false);
    ++evicted;
  }
  if (evicted > 0)
    spdlog::debug("{}: evicted {} entries, memory_used={}", name_, evicted,
                  memory_used_);
}

void LocalStore::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = entries_.find(key);
    if (it == entries_.end())
      continue;
    auto g = expiry_generation_.find(key);
    if (g == expiry_generation_.end() || g->second != gen)
      continue;
    if (!it->second.deadline.has_value())
      continue;
    // Sliding entries move their deadline on read without touching the heap.
    if (*it->second.deadline > now) {
      expiry_heap_.push({*it->second.deadline, key, gen});
      continue;
    }
    erase_locked(key, false, true);
    ++cleaned;
  }
}

} // namespace tier_cache
