// File: include/sx/core/io/event_queue.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace sx {

// Producer/consumer handoff between a capture thread and the polling loop.
// Bounded: when full, the oldest element is dropped and counted.
template <typename T>
class EventQueue {
 public:
  explicit EventQueue(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (items_.size() >= capacity_) {
        items_.pop_front();
        ++dropped_;
      }
      items_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  // Waits at most `timeout` for the first element, then moves everything queued into `out`.
  // Returns the number of elements appended (0 on timeout).
  std::size_t drain(std::chrono::nanoseconds timeout, std::vector<T>* out) {
    std::unique_lock<std::mutex> lock(mu_);
    if (items_.empty() && timeout.count() > 0) {
      cv_.wait_for(lock, timeout, [this] { return !items_.empty() || woken_; });
    }
    woken_ = false;

    const std::size_t n = items_.size();
    if (out) {
      out->reserve(out->size() + n);
      for (auto& v : items_) out->push_back(std::move(v));
    }
    items_.clear();
    return n;
  }

  // Releases a consumer blocked in drain() without enqueuing anything (used on stop).
  void wake() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      woken_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  [[nodiscard]] std::uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> items_;
  std::uint64_t dropped_{0};
  bool woken_{false};
};

}  // namespace sx
