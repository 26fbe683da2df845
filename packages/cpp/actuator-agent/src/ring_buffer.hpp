/**
 * Fixed-capacity ring buffer.
 *
 * push() overwrites the oldest element once the buffer is full; snapshot()
 * copies the current contents oldest-first. Both take a short internal lock,
 * so one writer and any number of readers may use it concurrently.
 */

#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace actuator {

template <typename T>
class RingBuffer {
 public:
  static constexpr size_t kDefaultCapacity = 100;

  explicit RingBuffer(size_t capacity = kDefaultCapacity) : capacity_(capacity) {
    items_.reserve(capacity_);
  }

  // Non-copyable
  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;

  void push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
      return;
    }
    if (items_.size() < capacity_) {
      items_.push_back(std::move(item));
      return;
    }
    // Full: head_ is the oldest slot
    items_[head_] = std::move(item);
    head_ = (head_ + 1) % capacity_;
  }

  std::vector<T> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> result;
    result.reserve(items_.size());
    for (size_t i = 0; i < items_.size(); ++i) {
      result.push_back(items_[(head_ + i) % items_.size()]);
    }
    return result;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    head_ = 0;
  }

 private:
  const size_t capacity_;
  std::vector<T> items_;
  size_t head_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace actuator
