#include "df/data/PollWorker.hpp"
#include "df/data/DataSource.hpp"
#include "df/debug/Stats.hpp"
#include "df/loop/CoalescingScheduler.hpp"
#include "df/store/PendingQueue.hpp"
#include "df/store/WindowedStore.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <string>

namespace df {

PollWorker::PollWorker(DataSource& source, WindowedStore& store,
                       PendingQueue& queue, CoalescingScheduler& scheduler,
                       const PollWorkerConfig& config)
  : source_(source), store_(store), queue_(queue), scheduler_(scheduler),
    config_(config) {}

PollWorker::~PollWorker() {
  stop();
  join();
}

bool PollWorker::fill() {
  Table t;
  try {
    t = source_.fetchInitial(config_.lookback);
  } catch (const std::exception& e) {
    resyncPending_.store(true);
    fail("SOURCE_FETCH_FAILED", "fetchInitial(" + std::to_string(config_.lookback) +
         ") failed: " + e.what());
    return false;
  }

  if (!validate(t)) {
    resyncPending_.store(true);
    fail("SOURCE_MALFORMED_BATCH", "fetchInitial returned a malformed batch (" +
         std::to_string(t.rows.size()) + " rows), retrying next cycle");
    return false;
  }

  store_.replace(t);
  queue_.clearCorrections();
  if (!t.rows.empty()) {
    lastKnown_.store(std::max(lastKnown_.load(), t.rows.back().index));
  }
  resyncPending_.store(false);
  resyncs_++;

  queue_.markAppendPending();
  scheduler_.requestFlush(FlushKind::Append);
  return true;
}

void PollWorker::start() {
  if (running_.load()) return;
  join();  // a previous loop may still be winding down
  running_.store(true);
  thread_ = std::thread(&PollWorker::run, this);
}

void PollWorker::stop() { running_.store(false); }

void PollWorker::join() {
  if (thread_.joinable()) thread_.join();
}

void PollWorker::run() {
  using Clock = std::chrono::steady_clock;
  const auto period = std::chrono::milliseconds(config_.timeoutMs);
  const auto slice = std::chrono::milliseconds(20);

  while (running_.load()) {
    pollOnce();

    auto deadline = Clock::now() + period;
    while (running_.load()) {
      auto now = Clock::now();
      if (now >= deadline) break;
      std::this_thread::sleep_for(
        std::min<Clock::duration>(deadline - now, slice));
    }
  }
}

std::size_t PollWorker::pollOnce() {
  if (resyncPending_.load()) {
    fill();
    return 0;
  }
  if (!newData_.exchange(false)) return 0;

  RowIndex position = lastKnown_.load();
  Table batch;
  try {
    batch = source_.fetchSince(position);
  } catch (const std::exception& e) {
    newData_.store(true);  // retry next cycle
    fail("SOURCE_FETCH_FAILED", "fetchSince(" + std::to_string(position) +
         ") failed: " + e.what());
    return 0;
  }
  fetchCycles_++;

  if (!validate(batch)) {
    newData_.store(true);
    fail("SOURCE_MALFORMED_BATCH", "fetchSince(" + std::to_string(position) +
         ") returned a malformed batch (" + std::to_string(batch.rows.size()) +
         " rows), dropped");
    return 0;
  }
  if (batch.rows.empty()) return 0;

  for (const auto& row : batch.rows) route(row);

  // Rejected rows count as seen; they are not fetched again.
  RowIndex tail = batch.rows.back().index;
  if (tail > lastKnown_.load()) lastKnown_.store(tail);

  // Only now may the source retire the revisions this batch carried.
  try {
    source_.acknowledge();
  } catch (const std::exception& e) {
    fail("SOURCE_FETCH_FAILED", std::string("acknowledge failed: ") + e.what() +
         " (revisions will be reported again)");
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[PollWorker] routed %zu rows since %lld\n",
                 batch.rows.size(), static_cast<long long>(position));
  }
  return batch.rows.size();
}

bool PollWorker::validate(const Table& batch) const {
  RowIndex prev = kNoPosition;
  for (const auto& row : batch.rows) {
    if (row.index < 0) return false;
    if (row.index <= prev) return false;  // must be strictly ascending
    prev = row.index;
  }
  return true;
}

void PollWorker::route(const Row& row) {
  UpsertResult res = store_.upsert(row);

  switch (res.kind) {
    case UpsertKind::Append:
      appended_++;
      queue_.markAppendPending();
      scheduler_.requestFlush(FlushKind::Append);
      break;

    case UpsertKind::Correction:
    case UpsertKind::Evicted:
      if (res.kind == UpsertKind::Evicted) evicted_++;
      else corrected_++;
      if (!queue_.enqueueCorrection(row, res.generation)) {
        dropped_++;
        std::fprintf(stderr, "[PollWorker] correction queue full, oldest "
                     "correction dropped\n");
      }
      scheduler_.requestFlush(FlushKind::Correction);
      break;

    case UpsertKind::Rejected:
      rejected_++;
      std::fprintf(stderr, "[PollWorker] row %lld dropped: %s: %s\n",
                   static_cast<long long>(row.index),
                   res.err.code.c_str(), res.err.message.c_str());
      break;
  }
}

void PollWorker::collect(SyncStats& out) const {
  out.fetchCycles += fetchCycles_.load();
  out.fetchErrors += fetchErrors_.load();
  out.resyncs += resyncs_.load();
  out.rowsAppended += appended_.load();
  out.rowsCorrected += corrected_.load();
  out.rowsEvicted += evicted_.load();
  out.rowsRejected += rejected_.load();
  out.correctionsDropped += dropped_.load();
}

SyncError PollWorker::lastError() const {
  std::lock_guard<std::mutex> lock(errMtx_);
  return lastError_;
}

void PollWorker::fail(const char* code, const std::string& message) {
  fetchErrors_++;
  std::fprintf(stderr, "[PollWorker] %s: %s\n", code, message.c_str());
  std::lock_guard<std::mutex> lock(errMtx_);
  lastError_ = {code, message};
}

} // namespace df
