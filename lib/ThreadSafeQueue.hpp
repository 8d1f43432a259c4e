#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace hl {

/**
 * ThreadSafeQueue - A thread-safe wrapper around std::queue
 *
 * Provides synchronized access to queue operations for multi-threaded scenarios.
 * All public methods are thread-safe.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T> class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;
  ~ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  void push(const T &value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(value);
    }
    cv_.notify_one();
  }

  void push(T &&value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(value));
    }
    cv_.notify_one();
  }

  /**
   * Pop the front element, waiting up to timeout for one to arrive
   * @param t Reference to store the popped element
   * @return true if an element was popped, false on timeout
   */
  template <typename Rep, typename Period>
  bool pollFor(T &t, const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

} // namespace hl
