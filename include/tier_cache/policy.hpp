#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace tier_cache {

// Eviction order for LocalStore. The store calls the hooks under its own
// mutex, so implementations need no locking of their own.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const std::string &key) = 0;
  virtual void on_access(const std::string &key) = 0;
  virtual void on_erase(const std::string &key) = 0;
  virtual std::optional<std::string> pick_victim() const = 0;
  virtual std::size_t tracked() const = 0;
};

// Recency list: most recently used at the back.
class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  void on_insert(const std::string &key) override;
  void on_access(const std::string &key) override;
  void on_erase(const std::string &key) override;
  std::optional<std::string> pick_victim() const override;
  std::size_t tracked() const override { return index_.size(); }

private:
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

// Frequency buckets, each in recency order, so ties go to the older key.
class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  void on_insert(const std::string &key) override;
  void on_access(const std::string &key) override;
  void on_erase(const std::string &key) override;
  std::optional<std::string> pick_victim() const override;
  std::size_t tracked() const override { return index_.size(); }

private:
  struct Slot {
    std::uint64_t freq;
    std::list<std::string>::iterator pos;
  };
  void unlink(const Slot &slot);

  std::map<std::uint64_t, std::list<std::string>> buckets_;
  std::unordered_map<std::string, Slot> index_;
};

// Returns nullptr for an unknown name.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace tier_cache
