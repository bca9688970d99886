#include "df/store/WindowedStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace df {

WindowedStore::WindowedStore(std::size_t lookback) : lookback_(lookback) {
  if (lookback_ == 0) throw std::invalid_argument("lookback must be > 0");
}

ColumnSchema WindowedStore::replace(const Table& table) {
  // Sort and dedupe outside the lock; last occurrence of an index wins.
  // Rows with a negative index are not addressable and are skipped.
  std::vector<Row> sorted;
  sorted.reserve(table.rows.size());
  for (const auto& r : table.rows) {
    if (r.index >= 0) sorted.push_back(r);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
    [](const Row& a, const Row& b) { return a.index < b.index; });

  std::deque<Row> fresh;
  for (auto& r : sorted) {
    if (!fresh.empty() && fresh.back().index == r.index) {
      fresh.back() = std::move(r);
    } else {
      fresh.push_back(std::move(r));
    }
  }
  while (fresh.size() > lookback_) fresh.pop_front();

  std::lock_guard<std::mutex> lock(mtx_);
  ++generation_;
  schema_ = ColumnSchema::fromTable(table, generation_);
  rows_ = std::move(fresh);
  lastDelivered_ = kNoPosition;
  return schema_;
}

UpsertResult WindowedStore::upsert(const Row& row) {
  UpsertResult res;
  if (row.index < 0) {
    res.err = {"ROW_INVALID_INDEX",
               "row index " + std::to_string(row.index) + " is negative"};
    return res;
  }

  std::lock_guard<std::mutex> lock(mtx_);
  res.generation = generation_;

  if (!schema_.check(row, &res.err)) return res;

  // Fast path: new tail.
  if (rows_.empty() || row.index > rows_.back().index) {
    rows_.push_back(row);
    trimLocked();
    res.kind = UpsertKind::Append;
    return res;
  }

  auto it = lowerBoundLocked(row.index);
  if (it != rows_.end() && it->index == row.index) {
    *it = row;
    res.kind = (row.index <= lastDelivered_) ? UpsertKind::Correction
                                             : UpsertKind::Append;
    return res;
  }

  // Missing index below the tail.
  if (it == rows_.begin() && rows_.size() >= lookback_) {
    res.kind = UpsertKind::Evicted;
    return res;
  }
  rows_.insert(it, row);
  trimLocked();
  res.kind = (row.index <= lastDelivered_) ? UpsertKind::Correction
                                           : UpsertKind::Append;
  return res;
}

RowIndex WindowedStore::positionOfLastAppended() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return rows_.empty() ? kNoPosition : rows_.back().index;
}

AppendBatch WindowedStore::takeUndelivered(std::uint64_t knownGeneration) {
  std::lock_guard<std::mutex> lock(mtx_);
  AppendBatch batch;
  batch.generation = generation_;
  if (knownGeneration != generation_) {
    batch.schemaChanged = true;
    batch.schema = schema_;
  }
  batch.retentionCap = std::min(lookback_, rows_.size());

  auto first = std::upper_bound(rows_.begin(), rows_.end(), lastDelivered_,
    [](RowIndex idx, const Row& r) { return idx < r.index; });
  std::size_t pending = static_cast<std::size_t>(rows_.end() - first);
  if (pending == 0) return batch;

  if (pending > batch.retentionCap) {
    first += static_cast<std::ptrdiff_t>(pending - batch.retentionCap);
  }
  batch.rows.assign(first, rows_.end());
  lastDelivered_ = batch.rows.back().index;
  return batch;
}

RowIndex WindowedStore::lastDeliveredPosition() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastDelivered_;
}

std::size_t WindowedStore::retentionCap() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::min(lookback_, rows_.size());
}

std::size_t WindowedStore::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return rows_.size();
}

std::uint64_t WindowedStore::generation() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return generation_;
}

ColumnSchema WindowedStore::schema() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return schema_;
}

std::vector<Row> WindowedStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::vector<Row>(rows_.begin(), rows_.end());
}

std::optional<Row> WindowedStore::find(RowIndex index) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = lowerBoundLocked(index);
  if (it == rows_.end() || it->index != index) return std::nullopt;
  return *it;
}

void WindowedStore::trimLocked() {
  while (rows_.size() > lookback_) rows_.pop_front();
}

std::deque<Row>::iterator WindowedStore::lowerBoundLocked(RowIndex index) {
  return std::lower_bound(rows_.begin(), rows_.end(), index,
    [](const Row& r, RowIndex idx) { return r.index < idx; });
}

std::deque<Row>::const_iterator WindowedStore::lowerBoundLocked(RowIndex index) const {
  return std::lower_bound(rows_.begin(), rows_.end(), index,
    [](const Row& r, RowIndex idx) { return r.index < idx; });
}

} // namespace df
