#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace gambit {

// Thread safe queue. Any thread may push; one consumer pops, either blocking
// or by polling.
template <class Entry> class Channel {
public:
  void push(Entry value) {
    {
      std::scoped_lock lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocks until an entry is available. Returns nullopt once the channel has
  // been released and drained.
  std::optional<Entry> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty() || released_.load(); });

    if (queue_.empty()) {
      return std::nullopt;
    }
    Entry entry = std::move(queue_.front());
    queue_.pop_front();
    return entry;
  }

  // Never blocks.
  std::optional<Entry> try_pop() {
    std::scoped_lock lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    Entry entry = std::move(queue_.front());
    queue_.pop_front();
    return entry;
  }

  [[nodiscard]] bool empty() const {
    std::scoped_lock lock(mutex_);
    return queue_.empty();
  }

  // Stop blocking consumers waiting in pop().
  void release() {
    {
      std::scoped_lock lock(mutex_);
      released_.store(true);
    }
    condition_.notify_all();
  }

private:
  std::deque<Entry> queue_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::atomic<bool> released_{false};
};

} // namespace gambit
