#include "util/BoundedQueue.hpp"

#include "util/Exception.hpp"

namespace util {

template <typename T>
BoundedQueue<T>::BoundedQueue(size_t capacity) : capacity_(capacity) {
  if (capacity == 0) {
    throw util::Exception("BoundedQueue capacity must be positive");
  }
}

template <typename T>
bool BoundedQueue<T>::push(T item) {
  std::unique_lock lock(mutex_);
  cv_not_full_.wait(lock, [&] { return closed_ || items_.size() < capacity_; });
  if (closed_) return false;

  items_.push_back(std::move(item));
  lock.unlock();
  cv_not_empty_.notify_one();
  return true;
}

template <typename T>
typename BoundedQueue<T>::push_result_t BoundedQueue<T>::try_push(T item) {
  std::unique_lock lock(mutex_);
  if (closed_) return kClosed;
  if (items_.size() >= capacity_) return kFull;

  items_.push_back(std::move(item));
  lock.unlock();
  cv_not_empty_.notify_one();
  return kPushed;
}

template <typename T>
std::optional<T> BoundedQueue<T>::pop() {
  std::unique_lock lock(mutex_);
  cv_not_empty_.wait(lock, [&] { return closed_ || !items_.empty(); });
  if (items_.empty()) return std::nullopt;

  std::optional<T> item(std::move(items_.front()));
  items_.pop_front();
  lock.unlock();
  cv_not_full_.notify_one();
  return item;
}

template <typename T>
std::optional<T> BoundedQueue<T>::try_pop() {
  std::unique_lock lock(mutex_);
  if (items_.empty()) return std::nullopt;

  std::optional<T> item(std::move(items_.front()));
  items_.pop_front();
  lock.unlock();
  cv_not_full_.notify_one();
  return item;
}

template <typename T>
void BoundedQueue<T>::close() {
  std::unique_lock lock(mutex_);
  closed_ = true;
  lock.unlock();
  cv_not_full_.notify_all();
  cv_not_empty_.notify_all();
}

template <typename T>
bool BoundedQueue<T>::closed() const {
  std::unique_lock lock(mutex_);
  return closed_;
}

template <typename T>
size_t BoundedQueue<T>::size() const {
  std::unique_lock lock(mutex_);
  return items_.size();
}

}  // namespace util
