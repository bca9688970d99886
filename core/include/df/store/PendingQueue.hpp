#pragma once
#include "df/data/Row.hpp"
#include "df/data/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace df {

struct PendingCorrection {
  Row row;
  std::uint64_t generation{0};  // store content generation at upsert time
};

// Delivery notifications waiting for the consumer loop.
// A queued correction has already been applied to the store (or fell out of
// its window); the queue never stages data.
class PendingQueue {
public:
  explicit PendingQueue(std::size_t maxCorrections = 0);

  void markAppendPending();
  bool consumeAppendFlag();
  bool isAppendPending() const;

  // Returns false when the oldest queued correction was dropped for room.
  bool enqueueCorrection(const Row& row, std::uint64_t generation);
  std::vector<PendingCorrection> drainCorrections();
  std::size_t correctionCount() const;
  std::size_t droppedCorrections() const;
  void clearCorrections();

private:
  std::atomic<bool> appendPending_{false};
  ThreadSafeQueue<PendingCorrection> corrections_;
};

} // namespace df
