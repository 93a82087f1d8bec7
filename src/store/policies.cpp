#include "tier_cache/policy.hpp"

#include <iterator>

namespace tier_cache {

void LruPolicy::on_insert(const std::string &key) {
  on_erase(key);
  order_.push_back(key);
  index_[key] = std::prev(order_.end());
}

void LruPolicy::on_access(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  order_.splice(order_.end(), order_, it->second);
}

void LruPolicy::on_erase(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  order_.erase(it->second);
  index_.erase(it);
}

std::optional<std::string> LruPolicy::pick_victim() const {
  if (order_.empty())
    return std::nullopt;
  return order_.front();
}

void LfuPolicy::unlink(const Slot &slot) {
  auto b = buckets_.find(slot.freq);
  b->second.erase(slot.pos);
  if (b->second.empty())
    buckets_.erase(b);
}

void LfuPolicy::on_insert(const std::string &key) {
  on_erase(key);
  auto &bucket = buckets_[0];
  bucket.push_back(key);
  index_[key] = Slot{0, std::prev(bucket.end())};
}

void LfuPolicy::on_access(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  const auto freq = it->second.freq + 1;
  unlink(it->second);
  auto &bucket = buckets_[freq];
  bucket.push_back(key);
  it->second = Slot{freq, std::prev(bucket.end())};
}

void LfuPolicy::on_erase(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  unlink(it->second);
  index_.erase(it);
}

std::optional<std::string> LfuPolicy::pick_victim() const {
  if (buckets_.empty())
    return std::nullopt;
  return buckets_.begin()->second.front();
}

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  if (mode == "lru")
    return std::make_unique<LruPolicy>();
  if (mode == "lfu")
    return std::make_unique<LfuPolicy>();
  return nullptr;
}

} // namespace tier_cache
