#include "df/loop/CoalescingScheduler.hpp"

#include <utility>

namespace df {

const char* flushKindName(FlushKind kind) {
  switch (kind) {
    case FlushKind::Append:     return "append";
    case FlushKind::Correction: return "correction";
  }
  return "unknown";
}

CoalescingScheduler::CoalescingScheduler(ConsumerLoop& loop, FlushHandler handler)
  : loop_(loop), handler_(std::move(handler)) {}

CoalescingScheduler::~CoalescingScheduler() { shutdown(); }

bool CoalescingScheduler::requestFlush(FlushKind kind) {
  std::uint64_t seq;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutdown_) return false;
    Slot& s = slot(kind);
    s.counters.requested++;
    if (s.armed) {
      s.counters.coalesced++;
      return false;
    }
    s.armed = true;
    seq = ++s.armSeq;
  }

  // Schedule outside our lock so the loop's lock never nests inside ours;
  // the callback may already be running on the loop when we get here.
  TickHandle h = loop_.scheduleNextTick([this, kind, seq]() { run(kind, seq); });

  std::lock_guard<std::mutex> lock(mtx_);
  Slot& s = slot(kind);
  if (s.armed && s.armSeq == seq) s.handle = h;
  return true;
}

void CoalescingScheduler::run(FlushKind kind, std::uint64_t seq) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    Slot& s = slot(kind);
    if (s.armSeq == seq) {
      s.armed = false;
      s.handle = kInvalidTick;
    }
    if (shutdown_) return;
    s.counters.executed++;
  }
  handler_(kind);
}

void CoalescingScheduler::shutdown() {
  TickHandle toCancel[2] = {kInvalidTick, kInvalidTick};
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutdown_) return;
    shutdown_ = true;
    for (int i = 0; i < 2; ++i) {
      if (slots_[i].armed) toCancel[i] = slots_[i].handle;
      slots_[i].armed = false;
      slots_[i].handle = kInvalidTick;
    }
  }
  for (TickHandle h : toCancel) {
    // A callback that already started cannot be cancelled; it sees
    // shutdown_ and returns without flushing.
    if (h != kInvalidTick) loop_.cancelScheduled(h);
  }
}

bool CoalescingScheduler::isScheduled(FlushKind kind) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return slot(kind).armed;
}

FlushCounters CoalescingScheduler::counters(FlushKind kind) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return slot(kind).counters;
}

} // namespace df
