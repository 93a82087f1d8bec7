#pragma once

#include "tier_cache/types.hpp"

#include <optional>
#include <string>

namespace tier_cache {

// Capability set shared by the Local and Shared tiers. Implementations must be
// safe to call from many threads and report outages by throwing
// TierUnavailable.
class ITierStore {
public:
  virtual ~ITierStore() = default;
  virtual std::string name() const = 0;
  virtual std::optional<CacheEntry> get(const std::string &key) = 0;
  virtual void set(const std::string &key, const CacheEntry &entry) = 0;
  virtual void remove(const std::string &key) = 0;
  virtual void remove_by_tag(const std::string &tag) = 0;
};

} // namespace tier_cache
