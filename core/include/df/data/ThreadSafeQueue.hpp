#pragma once
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace df {

// maxCapacity == 0 means unbounded. When bounded, push() drops the oldest
// entry on overflow and counts it.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t maxCapacity = 0)
      : maxCap_(maxCapacity) {}

  // Returns false when an older entry had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (maxCap_ > 0 && queue_.size() >= maxCap_) {
      queue_.pop_front();
      ++droppedCount_;
      dropped = true;
    }
    queue_.push_back(std::move(item));
    return !dropped;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  // Empties the queue in one step, FIFO order preserved.
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      taken.swap(queue_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  std::size_t droppedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return droppedCount_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> queue_;
  std::size_t maxCap_;
  std::size_t droppedCount_{0};
};

} // namespace df
