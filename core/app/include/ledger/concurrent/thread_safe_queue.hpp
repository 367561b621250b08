#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Unbounded multi-producer / multi-consumer FIFO.
//
// Used at the two thread boundaries of the ledger: committed change events
// travel from caller threads to the notification loop, and telemetry travels
// from the notification loop to the IPC thread.
//
// Thread model: every method is safe from any thread. pop() blocks until an
// item arrives; try_pop() and drain() never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Holds a mutex and a condition variable, neither copyable nor movable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Appends several items in order under one lock acquisition. A commit's
  // events are pushed together so consumers never observe half a commit.
  void push_all(std::vector<T> values) {
    if (values.empty()) {
      return;
    }
    {
      std::lock_guard lock(mutex_);
      for (auto& v : values) {
        queue_.push_back(std::move(v));
      }
    }
    condition_.notify_all();
  }

  // Blocks until an item is available, then removes and returns it.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Removes and returns everything currently queued, oldest first.
  std::vector<T> drain() {
    std::vector<T> out;
    std::lock_guard lock(mutex_);
    out.reserve(queue_.size());
    while (!queue_.empty()) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return out;
  }

  // Snapshot only; another thread may change the answer immediately.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on push
  std::deque<T> queue_;
};

}  // namespace ledger
