#include "tier_cache/expiration.hpp"

#include <algorithm>
#include <cmath>

namespace tier_cache {

ExpirationPolicy::ExpirationPolicy(TierTtlPolicy ttl) : ttl_(ttl) {
  if (!(ttl_.local_ttl_ratio > 0.0))
    ttl_.local_ttl_ratio = 1.0;
  ttl_.local_ttl_ratio = std::min(ttl_.local_ttl_ratio, 1.0);
  if (ttl_.min_local_ttl.count() < 1)
    ttl_.min_local_ttl = Millis(1);
  if (ttl_.max_local_ttl.count() > 0 && ttl_.max_local_ttl < ttl_.min_local_ttl)
    ttl_.max_local_ttl = ttl_.min_local_ttl;
}

std::optional<TimePoint>
ExpirationPolicy::deadline_on_write(const std::optional<ExpirationSpec> &spec,
                                    TimePoint now) {
  if (!spec.has_value())
    return std::nullopt;
  return now + spec->duration;
}

std::optional<TimePoint>
ExpirationPolicy::deadline_on_read(const std::optional<ExpirationSpec> &spec,
                                   std::optional<TimePoint> current,
                                   TimePoint now) {
  if (spec.has_value() && spec->kind == ExpirationKind::Sliding)
    return now + spec->duration;
  return current;
}

bool ExpirationPolicy::expired(std::optional<TimePoint> deadline,
                               TimePoint now) {
  return deadline.has_value() && *deadline <= now;
}

ExpirationSpec ExpirationPolicy::local_spec(const ExpirationSpec &shared) const {
  const auto scaled = static_cast<Millis::rep>(
      std::llround(static_cast<double>(shared.duration.count()) *
                   ttl_.local_ttl_ratio));
  Millis d(std::max<Millis::rep>(scaled, ttl_.min_local_ttl.count()));
  if (ttl_.max_local_ttl.count() > 0)
    d = std::min(d, ttl_.max_local_ttl);
  // Never outlive the shared copy.
  if (shared.duration.count() > 0)
    d = std::min(d, shared.duration);
  return {shared.kind, d};
}

} // namespace tier_cache
