#include "tier_cache/orchestrator.hpp"

#include "tier_cache/errors.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <exception>
#include <future>
#include <sstream>
#include <stdexcept>

namespace tier_cache {

CacheOrchestrator::CacheOrchestrator(OrchestratorConfig cfg,
                                     std::shared_ptr<ITierStore> local,
                                     std::shared_ptr<ITierStore> shared)
    : cfg_(std::move(cfg)), local_(std::move(local)),
      shared_(std::move(shared)), expiration_(cfg_.ttl),
      locks_(cfg_.lock_shards) {
  if (!local_)
    throw std::invalid_argument("CacheOrchestrator requires a local tier");
  if (cfg_.loader_timeout.count() > 0)
    loaders_ = std::make_unique<LoaderPool>(cfg_.loader_threads,
                                            cfg_.loader_queue);
  spdlog::info("cache orchestrator: local={} shared={} lock_timeout={}ms "
               "loader_timeout={}ms loader_threads={} local_ttl_ratio={} "
               "cache_not_found={}",
               local_->name(), shared_ ? shared_->name() : "none",
               cfg_.lock_timeout.count(), cfg_.loader_timeout.count(),
               loaders_ ? loaders_->workers() : 0,
               expiration_.ttl_policy().local_ttl_ratio, cfg_.cache_not_found);
}

std::optional<Bytes> CacheOrchestrator::get(const std::string &key,
                                            const Loader &loader,
                                            const ExpirationSpec &spec,
                                            const std::vector<std::string> &tags) {
  if (auto found = lookup(key))
    return resolve(key, std::move(*found), spec, tags);

  KeyLockRegistry::Handle guard;
  try {
    guard = locks_.acquire(key, cfg_.lock_timeout);
  } catch (const TimeoutError &) {
    ++counters_.lock_timeouts;
    spdlog::warn("lock wait for '{}' exceeded {}ms", key,
                 cfg_.lock_timeout.count());
    throw;
  }
  ++counters_.lock_acquisitions;

  // Another caller may have filled a tier while this one waited.
  if (auto found = lookup(key)) {
    ++counters_.coalesced;
    return resolve(key, std::move(*found), spec, tags);
  }

  auto value = run_loader(key, loader);
  if (!value.has_value()) {
    ++counters_.not_found;
    if (cfg_.cache_not_found) {
      CacheEntry marker;
      marker.expiration = ExpirationSpec::absolute(cfg_.not_found_ttl);
      marker.tags = tags;
      marker.negative = true;
      write_tier(*local_, key, marker);
    }
    return std::nullopt;
  }
  store_loaded(key, *value, spec, tags);
  return value;
}

void CacheOrchestrator::set(const std::string &key, const Bytes &value,
                            const ExpirationSpec &spec,
                            const std::vector<std::string> &tags) {
  store_loaded(key, value, spec, tags);
}

void CacheOrchestrator::invalidate(const std::string &key) {
  ++counters_.invalidations;
  if (shared_)
    remove_from(*shared_, key);
  remove_from(*local_, key);
}

void CacheOrchestrator::invalidate_tag(const std::string &tag) {
  ++counters_.invalidations;
  if (shared_)
    remove_tag_from(*shared_, tag);
  remove_tag_from(*local_, tag);
  spdlog::debug("invalidated tag '{}'", tag);
}

OrchestratorStats CacheOrchestrator::stats() const {
  OrchestratorStats s;
  s.local_hits = counters_.local_hits.load();
  s.shared_hits = counters_.shared_hits.load();
  s.lock_acquisitions = counters_.lock_acquisitions.load();
  s.coalesced = counters_.coalesced.load();
  s.loads = counters_.loads.load();
  s.load_failures = counters_.load_failures.load();
  s.not_found = counters_.not_found.load();
  s.negative_hits = counters_.negative_hits.load();
  s.lock_timeouts = counters_.lock_timeouts.load();
  s.loader_timeouts = counters_.loader_timeouts.load();
  s.tier_errors = counters_.tier_errors.load();
  s.backfills = counters_.backfills.load();
  s.invalidations = counters_.invalidations.load();
  return s;
}

std::string CacheOrchestrator::info() const {
  const auto s = stats();
  const auto l = locks_.stats();
  std::ostringstream os;
  os << "local_tier:" << local_->name() << "\n";
  os << "shared_tier:" << (shared_ ? shared_->name() : "none") << "\n";
  os << "local_hits:" << s.local_hits << "\n";
  os << "shared_hits:" << s.shared_hits << "\n";
  os << "lock_acquisitions:" << s.lock_acquisitions << "\n";
  os << "coalesced:" << s.coalesced << "\n";
  os << "loads:" << s.loads << "\n";
  os << "load_failures:" << s.load_failures << "\n";
  os << "not_found:" << s.not_found << "\n";
  os << "negative_hits:" << s.negative_hits << "\n";
  os << "lock_timeouts:" << s.lock_timeouts << "\n";
  os << "loader_timeouts:" << s.loader_timeouts << "\n";
  os << "tier_errors:" << s.tier_errors << "\n";
  os << "backfills:" << s.backfills << "\n";
  os << "invalidations:" << s.invalidations << "\n";
  os << "locks_live:" << locks_.size() << "\n";
  os << "locks_contended:" << l.contended << "\n";
  os << "locks_reclaimed:" << l.reclaimed << "\n";
  os << "loader_workers:" << (loaders_ ? loaders_->workers() : 0) << "\n";
  os << "loader_queued:" << (loaders_ ? loaders_->queued() : 0) << "\n";
  return os.str();
}

std::optional<CacheOrchestrator::Found>
CacheOrchestrator::lookup(const std::string &key) {
  if (auto e = read_tier(*local_, key))
    return Found{std::move(*e), Source::Local};
  if (shared_) {
    if (auto e = read_tier(*shared_, key))
      return Found{std::move(*e), Source::Shared};
  }
  return std::nullopt;
}

std::optional<Bytes>
CacheOrchestrator::resolve(const std::string &key, Found found,
                           const ExpirationSpec &spec,
                           const std::vector<std::string> &tags) {
  if (found.source == Source::Local) {
    ++counters_.local_hits;
  } else {
    ++counters_.shared_hits;
    backfill_local(key, found.entry, spec, tags);
  }
  if (found.entry.negative) {
    ++counters_.negative_hits;
    return std::nullopt;
  }
  return std::move(found.entry.value);
}

std::optional<CacheEntry> CacheOrchestrator::read_tier(ITierStore &tier,
                                                       const std::string &key) {
  try {
    return tier.get(key);
  } catch (const TierUnavailable &e) {
    ++counters_.tier_errors;
    spdlog::warn("{} get '{}' treated as miss: {}", tier.name(), key, e.what());
    return std::nullopt;
  }
}

void CacheOrchestrator::write_tier(ITierStore &tier, const std::string &key,
                                   const CacheEntry &entry) {
  try {
    tier.set(key, entry);
  } catch (const TierUnavailable &e) {
    ++counters_.tier_errors;
    spdlog::warn("{} set '{}' skipped: {}", tier.name(), key, e.what());
  }
}

void CacheOrchestrator::remove_from(ITierStore &tier, const std::string &key) {
  try {
    tier.remove(key);
  } catch (const TierUnavailable &e) {
    ++counters_.tier_errors;
    spdlog::warn("{} remove '{}' failed: {}", tier.name(), key, e.what());
  }
}

void CacheOrchestrator::remove_tag_from(ITierStore &tier,
                                        const std::string &tag) {
  try {
    tier.remove_by_tag(tag);
  } catch (const TierUnavailable &e) {
    ++counters_.tier_errors;
    spdlog::warn("{} remove tag '{}' failed: {}", tier.name(), tag, e.what());
  }
}

void CacheOrchestrator::backfill_local(const std::string &key,
                                       const CacheEntry &from_shared,
                                       const ExpirationSpec &spec,
                                       const std::vector<std::string> &tags) {
  CacheEntry copy;
  copy.value = from_shared.value;
  copy.expiration = expiration_.local_spec(spec);
  copy.tags = tags.empty() ? from_shared.tags : tags;
  copy.negative = from_shared.negative;
  write_tier(*local_, key, copy);
  ++counters_.backfills;
  spdlog::debug("backfilled '{}' into {} for {}ms", key, local_->name(),
                copy.expiration->duration.count());
}

std::optional<Bytes> CacheOrchestrator::run_loader(const std::string &key,
                                                   const Loader &loader) {
  ++counters_.loads;
  spdlog::debug("loading '{}' from origin", key);

  auto fail = [&](const std::string &cause) {
    ++counters_.load_failures;
    spdlog::warn("origin load for '{}' failed: {}", key, cause);
  };

  if (!loaders_) {
    try {
      return loader(key);
    } catch (const LoadError &e) {
      fail(e.what());
      throw;
    } catch (const std::exception &e) {
      fail(e.what());
      throw LoadError(key, e.what());
    } catch (...) {
      fail("non-standard exception");
      throw LoadError(key, "loader threw a non-standard exception");
    }
  }

  // A hung origin call must not pin the key lock. On timeout the task is
  // marked abandoned so a still-queued load is skipped and a running one has
  // its late result dropped.
  auto abandoned = std::make_shared<std::atomic<bool>>(false);
  std::future<std::optional<Bytes>> result;
  try {
    result = loaders_->submit(key, loader, abandoned);
  } catch (const TimeoutError &e) {
    ++counters_.loader_timeouts;
    fail(e.what());
    throw;
  }

  if (result.wait_for(cfg_.loader_timeout) != std::future_status::ready) {
    abandoned->store(true);
    ++counters_.loader_timeouts;
    fail("timed out");
    throw TimeoutError("origin load for '" + key + "' exceeded " +
                       std::to_string(cfg_.loader_timeout.count()) + "ms");
  }
  try {
    return result.get();
  } catch (const LoadError &e) {
    fail(e.what());
    throw;
  } catch (const std::exception &e) {
    fail(e.what());
    throw LoadError(key, e.what());
  } catch (...) {
    fail("non-standard exception");
    throw LoadError(key, "loader threw a non-standard exception");
  }
}

void CacheOrchestrator::store_loaded(const std::string &key, const Bytes &value,
                                     const ExpirationSpec &spec,
                                     const std::vector<std::string> &tags) {
  CacheEntry entry;
  entry.value = value;
  entry.expiration = spec;
  entry.tags = tags;
  if (shared_)
    write_tier(*shared_, key, entry);
  entry.expiration = expiration_.local_spec(spec);
  write_tier(*local_, key, entry);
}

} // namespace tier_cache
