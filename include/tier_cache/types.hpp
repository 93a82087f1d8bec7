#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tier_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Bytes = std::vector<std::uint8_t>;

enum class ExpirationKind { Absolute, Sliding };

struct ExpirationSpec {
  ExpirationKind kind{ExpirationKind::Absolute};
  Millis duration{0};

  static ExpirationSpec absolute(Millis d) {
    return {ExpirationKind::Absolute, d};
  }
  static ExpirationSpec sliding(Millis d) {
    return {ExpirationKind::Sliding, d};
  }

  bool operator==(const ExpirationSpec &other) const = default;
};

// An entry as handed to and returned from a tier store. Never mutated after
// it has been stored; a write replaces the whole entry.
struct CacheEntry {
  Bytes value;
  std::optional<ExpirationSpec> expiration;
  std::vector<std::string> tags;
  bool negative{false};
};

// Bookkeeping a local store keeps next to each entry.
struct StoredEntry {
  CacheEntry entry;
  std::size_t size_bytes{0};
  TimePoint created_at{};
  TimePoint last_access{};
  std::uint64_t hit_count{0};
  std::optional<TimePoint> deadline;
};

inline Bytes to_bytes(const std::string &s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace tier_cache
