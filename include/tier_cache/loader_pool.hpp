#pragma once

#include "tier_cache/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tier_cache {

// Returns the value, an empty optional when the origin has no such item, or
// throws when the origin failed. When a loader timeout is configured the
// loader runs on a pool thread and may outlive the call, so it must own
// everything it captures.
using Loader = std::function<std::optional<Bytes>(const std::string &)>;

// Fixed set of threads that run bounded loads. A caller that stops waiting
// marks its task abandoned; queued abandoned tasks are skipped and never
// reach the origin. Destruction waits for loads already running.
class LoaderPool {
public:
  using Abandoned = std::shared_ptr<std::atomic<bool>>;

  LoaderPool(std::size_t threads, std::size_t queue_limit);
  ~LoaderPool();
  LoaderPool(const LoaderPool &) = delete;
  LoaderPool &operator=(const LoaderPool &) = delete;

  // Throws TimeoutError when the queue is full of live tasks.
  std::future<std::optional<Bytes>> submit(const std::string &key,
                                           Loader loader, Abandoned abandoned);

  std::size_t workers() const { return workers_.size(); }
  std::size_t queued() const;
  std::size_t running() const { return running_.load(); }

private:
  struct Task {
    std::packaged_task<std::optional<Bytes>()> work;
    Abandoned abandoned;
  };

  void worker_loop();

  const std::size_t queue_limit_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  bool stop_{false};
  std::atomic<std::size_t> running_{0};
  std::vector<std::thread> workers_;
};

} // namespace tier_cache
