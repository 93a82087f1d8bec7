#pragma once

#include "tier_cache/local_store.hpp"
#include "tier_cache/orchestrator.hpp"
#include "tier_cache/resp_store.hpp"

#include <string>

namespace tier_cache {

struct TierCacheConfig {
  OrchestratorConfig orchestrator{};
  LocalStoreConfig local{};
  bool shared_enabled{false};
  RespStoreConfig shared{};
};

// Reads a flat JSON object. Fields that are absent keep their current value;
// numeric fields are clamped. On failure `cfg` is left untouched.
bool load_config(const std::string &path, TierCacheConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, TierCacheConfig &cfg,
                  std::string *err = nullptr);

} // namespace tier_cache
