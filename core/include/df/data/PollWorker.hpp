#pragma once
#include "df/data/Row.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace df {

class DataSource;
class WindowedStore;
class PendingQueue;
class CoalescingScheduler;
struct SyncStats;

struct PollWorkerConfig {
  std::size_t lookback{100};  // rows requested by fetchInitial
  int timeoutMs{1000};        // sleep between cycles
  bool verbose{false};
};

// Background puller. Each cycle: if new data was announced, fetch rows past
// the last known position, apply them to the store and ask the scheduler for
// the matching flush. Never calls a sink.
class PollWorker {
public:
  PollWorker(DataSource& source, WindowedStore& store, PendingQueue& queue,
             CoalescingScheduler& scheduler, const PollWorkerConfig& config);
  ~PollWorker();

  PollWorker(const PollWorker&) = delete;
  PollWorker& operator=(const PollWorker&) = delete;

  // fetchInitial + replace. On failure the store is left as is and the next
  // cycle retries. Returns true on success.
  bool fill();

  void start();
  // Cooperative: the loop exits at its next wake. Does not wait.
  void stop();
  // Waits for the loop to exit (at most one cycle plus one fetch).
  void join();
  bool isRunning() const { return running_.load(); }

  void notifyUpdate() { newData_.store(true); }
  bool updatePending() const { return newData_.load(); }

  RowIndex lastKnownPosition() const { return lastKnown_.load(); }
  void resetPosition(RowIndex position) { lastKnown_.store(position); }
  bool resyncPending() const { return resyncPending_.load(); }

  // Runs one cycle on the calling thread (what the loop does per wake).
  // Returns the number of rows routed.
  std::size_t pollOnce();

  // Adds this worker's counters into `out`.
  void collect(SyncStats& out) const;

  // Most recent fetch failure; empty code if none yet.
  SyncError lastError() const;

private:
  void run();
  // Indices must be >= 0 and strictly ascending.
  bool validate(const Table& batch) const;
  void route(const Row& row);
  void fail(const char* code, const std::string& message);

  DataSource& source_;
  WindowedStore& store_;
  PendingQueue& queue_;
  CoalescingScheduler& scheduler_;
  PollWorkerConfig config_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> newData_{false};
  std::atomic<bool> resyncPending_{false};
  std::atomic<RowIndex> lastKnown_{kNoPosition};

  mutable std::mutex errMtx_;
  SyncError lastError_;

  std::atomic<std::uint64_t> fetchCycles_{0};
  std::atomic<std::uint64_t> fetchErrors_{0};
  std::atomic<std::uint64_t> resyncs_{0};
  std::atomic<std::uint64_t> appended_{0};
  std::atomic<std::uint64_t> corrected_{0};
  std::atomic<std::uint64_t> evicted_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace df
