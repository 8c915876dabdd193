#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace util {

/*
 * A fixed-capacity FIFO queue shared between producer threads and a single consumer.
 *
 * push() blocks while the queue is full, try_push() reports it instead. pop() blocks while the
 * queue is empty. Once close() has
 * been called, push() stops accepting items and returns false, while pop() continues to drain the
 * items that were already queued, returning std::nullopt only after the queue is both closed and
 * empty.
 *
 * close() is idempotent and wakes up all blocked threads.
 */
template <typename T>
class BoundedQueue {
 public:
  enum push_result_t : int8_t { kPushed, kFull, kClosed };

  explicit BoundedQueue(size_t capacity);

  /*
   * Blocks until there is room, then enqueues item and returns true. Returns false without
   * enqueueing if the queue is closed, including if it is closed while blocked.
   */
  bool push(T item);

  // Non-blocking variant of push(). item is only consumed if kPushed is returned.
  push_result_t try_push(T item);

  /*
   * Blocks until an item is available. Returns std::nullopt once the queue is closed and drained.
   */
  std::optional<T> pop();

  /*
   * Non-blocking variant of pop(). Returns std::nullopt if the queue is currently empty.
   */
  std::optional<T> try_pop();

  void close();

  bool closed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_not_full_;
  std::condition_variable cv_not_empty_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace util

#include "inline/util/BoundedQueue.inl"
