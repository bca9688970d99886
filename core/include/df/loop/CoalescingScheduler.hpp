#pragma once
#include "df/loop/ConsumerLoop.hpp"

#include <cstdint>
#include <functional>
#include <mutex>

namespace df {

enum class FlushKind : std::uint8_t {
  Append = 0,
  Correction = 1
};

const char* flushKindName(FlushKind kind);

struct FlushCounters {
  std::uint64_t requested{0};
  std::uint64_t coalesced{0};  // requests folded into an already scheduled flush
  std::uint64_t executed{0};
};

// One "latest wins" slot per flush kind. A request arms the slot and
// schedules a callback on the consumer loop; requests made while the slot is
// armed are folded into it. The callback disarms the slot before calling the
// handler, and the handler reads current shared state, so a request that
// arrives during a flush gets its own callback on the next tick.
//
// Destroy (or shutdown()) on the consumer loop's thread.
class CoalescingScheduler {
public:
  using FlushHandler = std::function<void(FlushKind)>;

  CoalescingScheduler(ConsumerLoop& loop, FlushHandler handler);
  ~CoalescingScheduler();

  CoalescingScheduler(const CoalescingScheduler&) = delete;
  CoalescingScheduler& operator=(const CoalescingScheduler&) = delete;

  // true if a new callback was scheduled, false if coalesced or shut down.
  bool requestFlush(FlushKind kind);

  // Cancels outstanding callbacks and refuses further requests.
  void shutdown();

  bool isScheduled(FlushKind kind) const;
  FlushCounters counters(FlushKind kind) const;

private:
  struct Slot {
    bool armed{false};
    std::uint64_t armSeq{0};
    TickHandle handle{kInvalidTick};
    FlushCounters counters;
  };

  void run(FlushKind kind, std::uint64_t seq);
  Slot& slot(FlushKind kind) { return slots_[static_cast<int>(kind)]; }
  const Slot& slot(FlushKind kind) const { return slots_[static_cast<int>(kind)]; }

  ConsumerLoop& loop_;
  FlushHandler handler_;

  mutable std::mutex mtx_;
  Slot slots_[2];
  bool shutdown_{false};
};

} // namespace df
