#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

// Bounded FIFO handing messages from the network thread to the caller.
// Order is preserved; when full, the oldest entry is dropped.
template <typename T>
class MessageQueue {
 public:
  explicit MessageQueue(std::size_t capacity) : capacity_(capacity) {}

  // Returns false when an older entry had to be dropped to make room.
  bool push(T value) {
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.size() >= capacity_) {
        items_.pop_front();
        dropped = true;
      }
      items_.push_back(std::move(value));
    }
    cv_.notify_one();
    return !dropped;
  }

  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    return takeAllLocked();
  }

  // Waits up to timeout for at least one entry, then takes everything queued.
  std::vector<T> waitAndDrain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; });
    return takeAllLocked();
  }

  // Wakes any waiter; later waits return immediately.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    items_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  std::vector<T> takeAllLocked() {
    std::vector<T> out;
    out.reserve(items_.size());
    while (!items_.empty()) {
      out.push_back(std::move(items_.front()));
      items_.pop_front();
    }
    return out;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};
