#include "df/loop/TickLoop.hpp"

#include <utility>

namespace df {

TickHandle TickLoop::scheduleNextTick(std::function<void()> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  TickHandle h = nextHandle_++;
  pending_.emplace(h, std::move(cb));
  return h;
}

bool TickLoop::cancelScheduled(TickHandle handle) {
  std::lock_guard<std::mutex> lock(mtx_);
  return pending_.erase(handle) > 0;
}

std::size_t TickLoop::runOnce() {
  // Handles are monotonic, so everything below the current watermark
  // was scheduled before this tick started.
  TickHandle watermark;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++ticks_;
    watermark = nextHandle_;
  }

  std::size_t ran = 0;
  for (;;) {
    std::function<void()> cb;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = pending_.begin();
      if (it == pending_.end() || it->first >= watermark) break;
      cb = std::move(it->second);
      pending_.erase(it);
    }
    // Run outside the lock; the callback may schedule or cancel.
    if (cb) cb();
    ran++;
  }
  return ran;
}

std::size_t TickLoop::pendingCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pending_.size();
}

std::uint64_t TickLoop::tickCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return ticks_;
}

} // namespace df
