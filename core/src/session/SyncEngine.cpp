#include "df/session/SyncEngine.hpp"
#include "df/data/DataSource.hpp"
#include "df/loop/ConsumerLoop.hpp"
#include "df/sink/Sink.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace df {

static const SyncEngineConfig& checked(const SyncEngineConfig& cfg) {
  if (cfg.lookback == 0) throw std::invalid_argument("lookback must be > 0");
  if (cfg.timeoutMs <= 0) throw std::invalid_argument("timeoutMs must be > 0");
  return cfg;
}

static PollWorkerConfig workerConfig(const SyncEngineConfig& cfg) {
  PollWorkerConfig w;
  w.lookback = cfg.lookback;
  w.timeoutMs = cfg.timeoutMs;
  w.verbose = cfg.verbose;
  return w;
}

SyncEngine::SyncEngine(ConsumerLoop& loop, DataSource& source,
                       std::vector<Sink*> sinks, const SyncEngineConfig& cfg)
  : config_(checked(cfg)),
    sinks_(std::move(sinks)),
    store_(cfg.lookback),
    queue_(cfg.maxPendingCorrections),
    scheduler_(loop, [this](FlushKind kind) { onFlush(kind); }),
    worker_(source, store_, queue_, scheduler_, workerConfig(cfg)) {
  // 1. Initial fill. On failure the worker retries before its first poll.
  worker_.fill();

  // 2. Sinks learn the full column set before any incremental delivery.
  ColumnSchema schema = store_.schema();
  applySchemaToSinks(schema);
  appliedGeneration_ = schema.generation();

  // 3. Initial content goes out with the append-flush fill() scheduled.
  worker_.start();
}

SyncEngine::~SyncEngine() {
  worker_.stop();
  worker_.join();
  scheduler_.shutdown();
}

void SyncEngine::set(const Table& table) {
  store_.replace(table);
  queue_.clearCorrections();  // they refer to the old content

  RowIndex tail = store_.positionOfLastAppended();
  if (tail != kNoPosition) worker_.resetPosition(tail);

  {
    std::lock_guard<std::mutex> lock(statsMtx_);
    consumerStats_.resyncs++;
  }
  if (config_.verbose) {
    std::fprintf(stderr, "[SyncEngine] set: %zu rows, tail %lld\n",
                 table.rows.size(), static_cast<long long>(tail));
  }

  queue_.markAppendPending();
  scheduler_.requestFlush(FlushKind::Append);
}

void SyncEngine::notifyUpdate() { worker_.notifyUpdate(); }

RowIndex SyncEngine::lastPosition() const {
  return store_.positionOfLastAppended();
}

void SyncEngine::stop() { worker_.stop(); }

bool SyncEngine::isRunning() const { return worker_.isRunning(); }

SyncStats SyncEngine::stats() const {
  SyncStats out;
  {
    std::lock_guard<std::mutex> lock(statsMtx_);
    out = consumerStats_;
  }
  worker_.collect(out);

  FlushCounters a = scheduler_.counters(FlushKind::Append);
  FlushCounters c = scheduler_.counters(FlushKind::Correction);
  out.appendFlushes = a.executed;
  out.appendFlushesCoalesced = a.coalesced;
  out.correctionFlushes = c.executed;
  out.correctionFlushesCoalesced = c.coalesced;
  return out;
}

// ---- consumer loop side ----

void SyncEngine::onFlush(FlushKind kind) {
  if (kind == FlushKind::Append) flushAppend();
  else flushCorrections();
}

void SyncEngine::flushAppend() {
  queue_.consumeAppendFlag();
  AppendBatch batch = store_.takeUndelivered(appliedGeneration_);

  if (batch.schemaChanged) {
    applySchemaToSinks(batch.schema);
    appliedGeneration_ = batch.generation;
  }

  if (batch.empty()) {
    std::lock_guard<std::mutex> lock(statsMtx_);
    consumerStats_.emptyFlushes++;
    return;
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[SyncEngine] stream %zu rows [%lld..%lld] rollover %zu\n",
                 batch.rows.size(),
                 static_cast<long long>(batch.rows.front().index),
                 static_cast<long long>(batch.rows.back().index),
                 batch.retentionCap);
  }
  streamToSinks(batch.rows, batch.retentionCap);
}

void SyncEngine::flushCorrections() {
  // A replace the sinks have not seen yet goes out first, so a correction
  // never lands on a sink holding the previous content.
  if (store_.generation() != appliedGeneration_) flushAppend();

  std::vector<PendingCorrection> items = queue_.drainCorrections();
  if (items.empty()) {
    std::lock_guard<std::mutex> lock(statsMtx_);
    consumerStats_.emptyFlushes++;
    return;
  }

  std::size_t cap = store_.retentionCap();
  for (const auto& c : items) {
    if (c.generation != appliedGeneration_) {
      std::lock_guard<std::mutex> lock(statsMtx_);
      consumerStats_.correctionsDropped++;
      continue;
    }
    patchOrStream(c.row, cap);
  }
}

void SyncEngine::applySchemaToSinks(const ColumnSchema& schema) {
  if (config_.verbose) {
    std::fprintf(stderr, "[SyncEngine] schema: %zu columns (generation %llu)\n",
                 schema.size(),
                 static_cast<unsigned long long>(schema.generation()));
  }
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    try {
      sinks_[i]->applySchema(schema);
    } catch (const std::exception& e) {
      sinkFailed(i, "applySchema failed", e);
    }
  }
}

void SyncEngine::streamToSinks(const std::vector<Row>& rows,
                               std::size_t retentionCap) {
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    try {
      sinks_[i]->streamRows(rows, retentionCap);
      std::lock_guard<std::mutex> lock(statsMtx_);
      consumerStats_.rowsStreamed += rows.size();
    } catch (const std::exception& e) {
      sinkFailed(i, "streamRows failed", e);
    }
  }
}

void SyncEngine::patchOrStream(const Row& row, std::size_t retentionCap) {
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    Sink* sink = sinks_[i];
    try {
      if (sink->isVisible(row.index)) {
        if (config_.verbose) {
          std::fprintf(stderr, "[SyncEngine] patch row %lld on sink %zu\n",
                       static_cast<long long>(row.index), i);
        }
        sink->patchRow(row);
        std::lock_guard<std::mutex> lock(statsMtx_);
        consumerStats_.rowsPatched++;
      } else {
        // Trimmed out of (or never reached) this sink's window: re-append.
        if (config_.verbose) {
          std::fprintf(stderr, "[SyncEngine] stream corrected row %lld on sink %zu\n",
                       static_cast<long long>(row.index), i);
        }
        sink->streamRows({row}, retentionCap);
        std::lock_guard<std::mutex> lock(statsMtx_);
        consumerStats_.rowsStreamed++;
      }
    } catch (const std::exception& e) {
      sinkFailed(i, "correction of row " + std::to_string(row.index) + " failed", e);
    }
  }
}

void SyncEngine::sinkFailed(std::size_t sink, const std::string& what,
                            const std::exception& e) {
  std::string msg = "sink " + std::to_string(sink) + " " + what + ": " + e.what();
  std::fprintf(stderr, "[SyncEngine] SINK_FAILED: %s\n", msg.c_str());
  std::lock_guard<std::mutex> lock(statsMtx_);
  consumerStats_.sinkErrors++;
  lastSinkError_ = {"SINK_FAILED", msg};
}

SyncError SyncEngine::lastSinkError() const {
  std::lock_guard<std::mutex> lock(statsMtx_);
  return lastSinkError_;
}

} // namespace df
