#pragma once
#include <cstdint>
#include <functional>

namespace df {

using TickHandle = std::uint64_t;

inline constexpr TickHandle kInvalidTick = 0;

// Single-threaded cooperative loop owned by the host (render/UI thread).
// scheduleNextTick may be called from any thread; callbacks run on the loop's
// thread, one at a time, each handle at most once.
class ConsumerLoop {
public:
  virtual ~ConsumerLoop() = default;
  virtual TickHandle scheduleNextTick(std::function<void()> cb) = 0;
  // false when the callback already started, already ran, or is unknown.
  virtual bool cancelScheduled(TickHandle handle) = 0;
};

} // namespace df
