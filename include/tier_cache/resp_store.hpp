#pragma once

#include "tier_cache/resp.hpp"
#include "tier_cache/tier_store.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tier_cache {

struct RespStoreConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::string key_prefix{"tc:"};
  Millis connect_timeout{250};
  Millis io_timeout{500};
  std::size_t pool_size{4};
};

struct RespStoreStats {
  std::uint64_t commands{0};
  std::uint64_t connects{0};
  std::uint64_t failures{0};
  // Transactions retried because a watched key changed.
  std::uint64_t conflicts{0};
  // Tag set members dropped because their entry had expired.
  std::uint64_t pruned{0};
};

// Shared tier backed by a Redis-compatible server. Each entry is a hash at
// <prefix>k:<key> with fields data/kind/ttl/tags/neg; each tag is a set of
// entry keys at <prefix>t:<tag>. Writes and removals run as WATCH/MULTI/EXEC
// so an entry and the tag sets naming it change together. Tag sets carry no
// TTL; every tagged write samples members of its tags and drops the ones whose
// entry has expired. Any transport or protocol failure throws TierUnavailable
// and drops the connection it happened on.
class RespStore final : public ITierStore {
public:
  explicit RespStore(RespStoreConfig cfg, std::string name = "shared");
  ~RespStore() override;
  RespStore(const RespStore &) = delete;
  RespStore &operator=(const RespStore &) = delete;

  std::string name() const override { return name_; }
  std::optional<CacheEntry> get(const std::string &key) override;
  void set(const std::string &key, const CacheEntry &entry) override;
  void remove(const std::string &key) override;
  void remove_by_tag(const std::string &tag) override;

  bool ping(std::string *err = nullptr);
  RespStoreStats stats() const;
  std::size_t open_connections() const;

  std::string entry_key(const std::string &key) const;
  std::string tag_key(const std::string &tag) const;

private:
  class Connection;
  using Commands = std::vector<std::vector<std::string>>;

  std::unique_ptr<Connection> checkout();
  void checkin(std::unique_ptr<Connection> conn);
  void discard();
  void with_connection(const std::function<void(Connection &)> &fn);
  std::vector<RespReply> run(Connection &conn, const Commands &commands);
  std::vector<RespReply> execute(const Commands &commands);
  void write_entry(const std::string &key, const CacheEntry *entry);

  RespStoreConfig cfg_;
  std::string name_;
  mutable std::mutex pool_mu_;
  std::condition_variable pool_cv_;
  std::vector<std::unique_ptr<Connection>> idle_;
  std::size_t open_{0};
  std::atomic<std::uint64_t> commands_{0};
  std::atomic<std::uint64_t> connects_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> conflicts_{0};
  std::atomic<std::uint64_t> pruned_{0};
};

} // namespace tier_cache
