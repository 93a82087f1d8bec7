#include "tier_cache/config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tier_cache {
namespace {
bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = std::stod(m[1].str());
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("invalid value for " + key);
  }
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("invalid value for " + key);
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

// Applies every field present in `text` to `c`. Returns false with `err` set
// for a value that is present but unusable; throws std::invalid_argument for a
// number that does not fit its type.
bool apply_fields(const std::string &text, TierCacheConfig &c,
                  std::string *err) {
  std::uint64_t u;
  double d;
  bool b;
  std::string s;

  auto &o = c.orchestrator;
  if (extract_u64(text, "lock_timeout_ms", u))
    o.lock_timeout = Millis(clamp_u64(u, 1, 600000));
  if (extract_u64(text, "loader_timeout_ms", u))
    o.loader_timeout = Millis(clamp_u64(u, 0, 600000));
  if (extract_u64(text, "loader_threads", u))
    o.loader_threads = static_cast<std::size_t>(clamp_u64(u, 1, 256));
  if (extract_u64(text, "loader_queue", u))
    o.loader_queue = static_cast<std::size_t>(clamp_u64(u, 1, 1000000));
  if (extract_u64(text, "lock_shards", u))
    o.lock_shards = static_cast<std::size_t>(clamp_u64(u, 1, 65536));
  if (extract_double(text, "local_ttl_ratio", d))
    o.ttl.local_ttl_ratio = std::clamp(d, 0.001, 1.0);
  if (extract_u64(text, "min_local_ttl_ms", u))
    o.ttl.min_local_ttl = Millis(clamp_u64(u, 1, 86400000));
  if (extract_u64(text, "max_local_ttl_ms", u))
    o.ttl.max_local_ttl = Millis(clamp_u64(u, 0, 86400000));
  if (extract_bool(text, "cache_not_found", b))
    o.cache_not_found = b;
  if (extract_u64(text, "not_found_ttl_ms", u))
    o.not_found_ttl = Millis(clamp_u64(u, 1, 3600000));

  auto &l = c.local;
  if (extract_u64(text, "local_memory_limit_bytes", u))
    l.memory_limit_bytes =
        static_cast<std::size_t>(clamp_u64(u, 1024, 1ULL << 40));
  if (extract_u64(text, "local_max_key_len", u))
    l.max_key_len = static_cast<std::size_t>(clamp_u64(u, 1, 64 * 1024));
  if (extract_u64(text, "local_max_value_size", u))
    l.max_value_size =
        static_cast<std::size_t>(clamp_u64(u, 1, 512ULL * 1024 * 1024));
  if (extract_u64(text, "local_ttl_cleanup_per_tick", u))
    l.ttl_cleanup_per_tick = static_cast<std::size_t>(clamp_u64(u, 1, 1000000));
  if (extract_string(text, "local_policy", s)) {
    if (s != "lru" && s != "lfu") {
      if (err)
        *err = "unknown local_policy: " + s;
      return false;
    }
    l.policy = s;
  }

  auto &r = c.shared;
  if (extract_bool(text, "shared_enabled", b))
    c.shared_enabled = b;
  if (extract_string(text, "shared_host", s))
    r.host = s;
  if (extract_u64(text, "shared_port", u)) {
    if (u == 0 || u > 65535) {
      if (err)
        *err = "shared_port out of range";
      return false;
    }
    r.port = static_cast<int>(u);
  }
  if (extract_string(text, "shared_key_prefix", s))
    r.key_prefix = s;
  if (extract_u64(text, "shared_connect_timeout_ms", u))
    r.connect_timeout = Millis(clamp_u64(u, 1, 60000));
  if (extract_u64(text, "shared_io_timeout_ms", u))
    r.io_timeout = Millis(clamp_u64(u, 1, 60000));
  if (extract_u64(text, "shared_pool_size", u))
    r.pool_size = static_cast<std::size_t>(clamp_u64(u, 1, 1024));
  return true;
}

} // namespace

bool load_config(const std::string &path, TierCacheConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

bool parse_config(const std::string &text, TierCacheConfig &cfg,
                  std::string *err) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  TierCacheConfig c = cfg;
  try {
    if (!apply_fields(text, c, err))
      return false;
  } catch (const std::invalid_argument &e) {
    if (err)
      *err = e.what();
    return false;
  }
  cfg = std::move(c);
  return true;
}

} // namespace tier_cache
