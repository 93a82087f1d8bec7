#pragma once

#include "tier_cache/types.hpp"

#include <optional>

namespace tier_cache {

// How the Local tier's lifetime is derived from the lifetime a caller asks the
// Shared tier to keep. A zero max_local_ttl means no upper bound.
struct TierTtlPolicy {
  double local_ttl_ratio{0.5};
  Millis min_local_ttl{1};
  Millis max_local_ttl{0};
};

class ExpirationPolicy {
public:
  explicit ExpirationPolicy(TierTtlPolicy ttl = {});

  static std::optional<TimePoint> deadline_on_write(
      const std::optional<ExpirationSpec> &spec, TimePoint now);
  // Deadline after a successful read. Absolute entries keep theirs.
  static std::optional<TimePoint> deadline_on_read(
      const std::optional<ExpirationSpec> &spec,
      std::optional<TimePoint> current, TimePoint now);
  static bool expired(std::optional<TimePoint> deadline, TimePoint now);

  ExpirationSpec local_spec(const ExpirationSpec &shared) const;
  const TierTtlPolicy &ttl_policy() const { return ttl_; }

private:
  TierTtlPolicy ttl_;
};

} // namespace tier_cache
