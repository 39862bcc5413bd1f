#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tradeguard {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A fixed-capacity FIFO shared between producer threads that
// must never block and one or more consumer threads that wait for work.
//
// Producers use tryPush(), which fails immediately when the queue is full;
// the caller decides what a drop means (RiskService counts it). Consumers
// use waitPop() with an external stop flag, waitPopFor() with a deadline,
// or tryPop() to poll.
//
// Shutdown protocol: the owner sets its stop flag, then calls wakeAll().
// wakeAll() takes the queue mutex before notifying, so a consumer that has
// evaluated its predicate but not yet started waiting cannot miss the
// wake-up.
//
// Thread model: Not tied to any specific thread. Safe for multiple producers
// and multiple consumers. All methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and a condition_variable.
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // tryPush(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value if there is room.
  //
  // @return true if enqueued, false if the queue was at capacity (value is
  //         discarded).
  //
  // Thread-safety: Safe to call from any thread. Never blocks on a consumer.
  // -------------------------------------------------------------------------
  bool tryPush(T value) {
    {
      std::lock_guard lock(mutex_);
      if (queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // Non-blocking pop. std::nullopt when empty.
  std::optional<T> tryPop() {
    std::lock_guard lock(mutex_);
    return popLocked();
  }

  // -------------------------------------------------------------------------
  // waitPop(stop)
  // -------------------------------------------------------------------------
  // @brief  Blocks until an item is available or stop becomes true.
  //
  // @return The front item, or std::nullopt once stop is set and the queue
  //         is empty. Items already queued are still handed out after stop
  //         is set, so a consumer loop drains before it exits.
  // -------------------------------------------------------------------------
  std::optional<T> waitPop(const std::atomic<bool>& stop) {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [&] { return !queue_.empty() || stop.load(); });
    return popLocked();
  }

  // -------------------------------------------------------------------------
  // waitPopFor(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks up to timeout for an item.
  //
  // @return The front item, or std::nullopt if none arrived in time.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> waitPopFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
    return popLocked();
  }

  // Wakes every waiter so it can re-check its predicate.
  void wakeAll() {
    std::lock_guard lock(mutex_);
    condition_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  // Caller holds mutex_.
  std::optional<T> popLocked() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace tradeguard
