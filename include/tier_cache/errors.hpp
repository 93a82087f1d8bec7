#pragma once

#include <stdexcept>
#include <string>

namespace tier_cache {

class CacheError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A tier store could not serve the request. Read paths treat it as a miss.
class TierUnavailable : public CacheError {
public:
  TierUnavailable(std::string tier, const std::string &what)
      : CacheError(tier + ": " + what), tier_(std::move(tier)) {}
  const std::string &tier() const { return tier_; }

private:
  std::string tier_;
};

class LoadError : public CacheError {
public:
  LoadError(std::string key, const std::string &cause)
      : CacheError("load failed for '" + key + "': " + cause),
        key_(std::move(key)) {}
  const std::string &key() const { return key_; }

private:
  std::string key_;
};

class TimeoutError : public CacheError {
public:
  using CacheError::CacheError;
};

class LockInvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace tier_cache
