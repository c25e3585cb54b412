#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace kb_bridge {

// =============================================================================
// Unbounded multi-producer / single-consumer FIFO
// =============================================================================

template<typename T> class DispatchQueue
{
public:
  DispatchQueue() = default;
  ~DispatchQueue() = default;

  DispatchQueue(const DispatchQueue&) = delete;
  DispatchQueue& operator=(const DispatchQueue&) = delete;
  DispatchQueue(DispatchQueue&&) = delete;
  DispatchQueue& operator=(DispatchQueue&&) = delete;

  // Called from any thread - wakes up the consumer if it is blocked
  void push(T item)
  {
    {
      std::scoped_lock lock(mutex_);
      items_.push(std::move(item));
    }
    // Only notify if consumer is actually waiting
    if (waiting_.load(std::memory_order_acquire)) { cv_.notify_one(); }
  }

  // Consumer only. Returns std::nullopt if nothing arrived within timeout.
  template<typename Rep, typename Period>
  [[nodiscard]] std::optional<T> pop_wait_for(std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock lock(mutex_);
    waiting_.store(true, std::memory_order_release);
    const bool signaled = cv_.wait_for(lock, timeout, [this] { return !items_.empty(); });
    waiting_.store(false, std::memory_order_release);
    if (!signaled) { return std::nullopt; }
    return take_front();
  }

  [[nodiscard]] std::optional<T> try_pop()
  {
    std::scoped_lock lock(mutex_);
    if (items_.empty()) { return std::nullopt; }
    return take_front();
  }

  [[nodiscard]] std::size_t size() const
  {
    std::scoped_lock lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] bool empty() const { return size() == 0; }

private:
  // Caller holds mutex_
  T take_front()
  {
    T item = std::move(items_.front());
    items_.pop();
    return item;
  }

  std::queue<T> items_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> waiting_{ false }; // True when consumer is blocked on CV
};

} // namespace kb_bridge
