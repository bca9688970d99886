#pragma once
#include "df/data/Row.hpp"
#include "df/store/ColumnSchema.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace df {

enum class UpsertKind : std::uint8_t {
  Append = 1,      // new to the store, or stored but not delivered yet
  Correction = 2,  // already delivered; sink must be patched
  Evicted = 3,     // older than the retained window; not stored
  Rejected = 4     // failed the schema check; store untouched
};

struct UpsertResult {
  UpsertKind kind{UpsertKind::Rejected};
  std::uint64_t generation{0};  // content generation the row was applied to
  SyncError err{};
};

struct AppendBatch {
  std::vector<Row> rows;          // ascending index
  std::size_t retentionCap{0};    // min(lookback, store size)
  std::uint64_t generation{0};
  bool schemaChanged{false};      // generation differs from the caller's
  ColumnSchema schema;            // set when schemaChanged

  bool empty() const { return rows.empty(); }
};

// Ordered, index-keyed rows with bounded retention.
// Every public method takes the store mutex; nothing leaves the store
// except copies.
class WindowedStore {
public:
  explicit WindowedStore(std::size_t lookback);

  // Swaps the whole content, rebuilds the schema, resets the delivered
  // position. Returns the new schema.
  ColumnSchema replace(const Table& table);

  UpsertResult upsert(const Row& row);

  // Tail index, kNoPosition if empty.
  RowIndex positionOfLastAppended() const;

  // Rows above the delivered position (at most min(lookback, size), newest
  // kept). Advances the delivered position to the last returned index.
  // The schema is copied in when `knownGeneration` is not the current one.
  AppendBatch takeUndelivered(std::uint64_t knownGeneration = 0);

  RowIndex lastDeliveredPosition() const;
  std::size_t retentionCap() const;
  std::size_t size() const;
  std::size_t lookback() const { return lookback_; }
  std::uint64_t generation() const;
  ColumnSchema schema() const;
  std::vector<Row> snapshot() const;
  std::optional<Row> find(RowIndex index) const;

private:
  void trimLocked();
  std::deque<Row>::iterator lowerBoundLocked(RowIndex index);
  std::deque<Row>::const_iterator lowerBoundLocked(RowIndex index) const;

  const std::size_t lookback_;

  mutable std::mutex mtx_;
  std::deque<Row> rows_;
  ColumnSchema schema_;
  RowIndex lastDelivered_{kNoPosition};
  std::uint64_t generation_{0};
};

} // namespace df
