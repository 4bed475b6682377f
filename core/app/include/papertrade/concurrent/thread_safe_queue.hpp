#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace papertrade {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — bounded MPSC hand-off queue
// -----------------------------------------------------------------------------
//
// @brief  FIFO protected by a mutex and a condition variable, with an
//         optional capacity.
//
// @details
// Producers are the job threads publishing telemetry through the EventBus;
// the consumer is the IPC server thread. When a capacity is set and the
// queue is full, push() drops the OLDEST element so a slow or absent
// subscriber can never make a job thread block or grow memory without
// bound. dropped() reports how many elements were discarded that way.
//
// capacity == 0 means unbounded.
//
// Thread model:
//   All methods are safe to call concurrently. pop() blocks until an
//   element is available; try_pop() never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends value; evicts the oldest element first when at capacity.
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocks until an element is available.
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

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  const std::size_t capacity_;
  std::size_t dropped_{0};
};

}  // namespace papertrade
