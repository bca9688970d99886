#pragma once
#include "df/loop/ConsumerLoop.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace df {

// Reference ConsumerLoop. The host calls runOnce() from its own thread, e.g.
// once per rendered frame.
class TickLoop : public ConsumerLoop {
public:
  TickHandle scheduleNextTick(std::function<void()> cb) override;
  bool cancelScheduled(TickHandle handle) override;

  // Runs the callbacks scheduled before this call, in schedule order.
  // Callbacks scheduled while running wait for the next tick.
  // Returns the number of callbacks executed.
  std::size_t runOnce();

  std::size_t pendingCount() const;
  std::uint64_t tickCount() const;

private:
  mutable std::mutex mtx_;
  std::map<TickHandle, std::function<void()>> pending_;
  TickHandle nextHandle_{1};
  std::uint64_t ticks_{0};
};

} // namespace df
