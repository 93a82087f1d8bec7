#include "tier_cache/loader_pool.hpp"

#include "tier_cache/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tier_cache {

LoaderPool::LoaderPool(std::size_t threads, std::size_t queue_limit)
    : queue_limit_(std::max<std::size_t>(1, queue_limit)) {
  threads = std::max<std::size_t>(1, threads);
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i)
    workers_.emplace_back([this] { worker_loop(); });
}

LoaderPool::~LoaderPool() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
}

std::future<std::optional<Bytes>>
LoaderPool::submit(const std::string &key, Loader loader, Abandoned abandoned) {
  Task task{std::packaged_task<std::optional<Bytes>()>(
                [loader = std::move(loader), key] { return loader(key); }),
            std::move(abandoned)};
  auto result = task.work.get_future();
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.size() >= queue_limit_) {
      std::erase_if(queue_, [](const Task &t) { return t.abandoned->load(); });
      if (queue_.size() >= queue_limit_)
        throw TimeoutError("loader pool saturated (" +
                           std::to_string(queue_.size()) + " queued)");
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return result;
}

std::size_t LoaderPool::queued() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void LoaderPool::worker_loop() {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      if (stop_)
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    if (task.abandoned->load()) {
      spdlog::debug("loader pool: skipped abandoned load");
      continue;
    }
    ++running_;
    task.work();
    --running_;
  }
}

} // namespace tier_cache
