#include "df/store/PendingQueue.hpp"

namespace df {

PendingQueue::PendingQueue(std::size_t maxCorrections)
    : corrections_(maxCorrections) {}

void PendingQueue::markAppendPending() { appendPending_.store(true); }

bool PendingQueue::consumeAppendFlag() { return appendPending_.exchange(false); }

bool PendingQueue::isAppendPending() const { return appendPending_.load(); }

bool PendingQueue::enqueueCorrection(const Row& row, std::uint64_t generation) {
  return corrections_.push(PendingCorrection{row, generation});
}

std::vector<PendingCorrection> PendingQueue::drainCorrections() {
  return corrections_.drain();
}

std::size_t PendingQueue::correctionCount() const { return corrections_.size(); }

std::size_t PendingQueue::droppedCorrections() const {
  return corrections_.droppedCount();
}

void PendingQueue::clearCorrections() { corrections_.clear(); }

} // namespace df
