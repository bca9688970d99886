#pragma once
#include "df/data/PollWorker.hpp"
#include "df/data/Row.hpp"
#include "df/debug/Stats.hpp"
#include "df/loop/CoalescingScheduler.hpp"
#include "df/session/SyncEngineConfig.hpp"
#include "df/store/PendingQueue.hpp"
#include "df/store/WindowedStore.hpp"

#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace df {

class ConsumerLoop;
class DataSource;
class Sink;

// Keeps the sinks in sync with a windowed copy of a growing data source.
//
// Two threads touch an engine: the worker it owns, and the consumer loop's
// thread, where flushes run and sinks are called. Construct and destroy the
// engine on the consumer loop's thread. set(), notifyUpdate(),
// lastPosition(), stop() and stats() may be called from any thread.
//
// Sinks are not owned and must outlive the engine.
class SyncEngine {
public:
  // Fills the store from source.fetchInitial(lookback), applies the schema to
  // every sink, schedules the first append-flush and starts the worker.
  // Throws std::invalid_argument if cfg.lookback == 0 or cfg.timeoutMs <= 0.
  SyncEngine(ConsumerLoop& loop, DataSource& source, std::vector<Sink*> sinks,
             const SyncEngineConfig& cfg = {});
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Full resync: replaces the content, resets the sinks on the next
  // append-flush and streams the new content.
  void set(const Table& table);

  // New data is available; the worker pulls it on its next wake.
  void notifyUpdate();

  // Tail index of the store, kNoPosition if empty.
  RowIndex lastPosition() const;

  // Stops the worker at its next wake. Does not wait for it.
  void stop();
  bool isRunning() const;

  SyncStats stats() const;
  // Most recent sink exception, empty code if none.
  SyncError lastSinkError() const;
  const SyncEngineConfig& config() const { return config_; }
  std::size_t lookback() const { return config_.lookback; }

  // Read-only views for hosts and tests.
  const WindowedStore& store() const { return store_; }
  const PendingQueue& pending() const { return queue_; }
  const CoalescingScheduler& scheduler() const { return scheduler_; }
  const PollWorker& worker() const { return worker_; }

private:
  // Flush handlers; consumer loop thread only.
  void onFlush(FlushKind kind);
  void flushAppend();
  void flushCorrections();
  void applySchemaToSinks(const ColumnSchema& schema);
  void streamToSinks(const std::vector<Row>& rows, std::size_t retentionCap);
  void patchOrStream(const Row& row, std::size_t retentionCap);
  void sinkFailed(std::size_t sink, const std::string& what, const std::exception& e);

  SyncEngineConfig config_;
  std::vector<Sink*> sinks_;

  WindowedStore store_;
  PendingQueue queue_;
  CoalescingScheduler scheduler_;
  PollWorker worker_;

  // Consumer-side state.
  std::uint64_t appliedGeneration_{0};

  mutable std::mutex statsMtx_;
  SyncStats consumerStats_;
  SyncError lastSinkError_;
};

} // namespace df
