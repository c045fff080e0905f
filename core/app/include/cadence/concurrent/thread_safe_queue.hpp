#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace cadence {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: An unbounded FIFO shared between producer threads and a
// consumer thread. Used by LogRelay to hand log records from whichever
// thread logs to the single thread that writes them out.
//
// Closing: close() stops the queue from accepting new items and wakes every
// consumer blocked in pop(). Items already queued stay available, so a
// consumer can drain the backlog and then sees std::nullopt from pop(). This
// gives the consumer loop a clean exit condition:
//
//   while (auto item = queue.pop()) { handle(*item); }
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Owns a mutex and a condition_variable, neither copyable nor movable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked consumer.
  // Output: false if the queue is closed; the item is dropped in that case.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(), blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting while the queue is
  // empty and open.
  // Output: std::nullopt once the queue is closed and fully drained.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    // The predicate is re-checked after every wakeup, spurious or not.
    condition_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking variant: std::nullopt when nothing is queued right now.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Rejects further pushes and wakes all blocked consumers.
  // Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshots only: another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // Guards queue_ and closed_. mutable so the const observers can lock.
  mutable std::mutex mutex_;

  // Signalled on push (one waiter) and on close (all waiters).
  std::condition_variable condition_;

  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace cadence
