#include "df/data/MemoryDataSource.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace df {

MemoryDataSource::MemoryDataSource(std::vector<std::string> columns)
  : columns_(std::move(columns)) {}

void MemoryDataSource::setColumns(std::vector<std::string> columns) {
  std::lock_guard<std::mutex> lock(mtx_);
  columns_ = std::move(columns);
}

Table MemoryDataSource::fetchInitial(std::size_t back) {
  std::lock_guard<std::mutex> lock(mtx_);
  fetches_++;
  if (!failMessage_.empty()) {
    std::string msg = std::move(failMessage_);
    failMessage_.clear();
    throw std::runtime_error(msg);
  }

  Table t;
  t.columns = columns_;
  std::size_t skip = rows_.size() > back ? rows_.size() - back : 0;
  auto it = rows_.begin();
  std::advance(it, static_cast<std::ptrdiff_t>(skip));
  for (; it != rows_.end(); ++it) t.rows.push_back(it->second);

  if (!rows_.empty()) highWater_ = std::max(highWater_, rows_.rbegin()->first);
  revised_.clear();
  inFlight_.clear();
  return t;
}

Table MemoryDataSource::fetchSince(RowIndex position) {
  std::lock_guard<std::mutex> lock(mtx_);
  fetches_++;
  if (!failMessage_.empty()) {
    std::string msg = std::move(failMessage_);
    failMessage_.clear();
    throw std::runtime_error(msg);
  }

  Table t;
  t.columns = columns_;
  inFlight_.clear();
  for (const auto& [idx, serial] : revised_) {
    if (idx > position) break;
    auto it = rows_.find(idx);
    if (it == rows_.end()) continue;
    t.rows.push_back(it->second);
    inFlight_[idx] = serial;
  }

  for (auto it = rows_.upper_bound(position); it != rows_.end(); ++it) {
    t.rows.push_back(it->second);
  }
  if (!t.rows.empty()) highWater_ = std::max(highWater_, t.rows.back().index);

  if (corruptNext_) {
    corruptNext_ = false;
    std::reverse(t.rows.begin(), t.rows.end());
  }
  return t;
}

void MemoryDataSource::append(const Row& row) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (row.index <= highWater_) revised_[row.index] = ++revisionSerial_;
  rows_[row.index] = row;
}

void MemoryDataSource::acknowledge() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& [idx, serial] : inFlight_) {
    auto it = revised_.find(idx);
    // Revised again since it was handed out: keep reporting it.
    if (it != revised_.end() && it->second == serial) revised_.erase(it);
  }
  inFlight_.clear();
}

void MemoryDataSource::failNextFetch(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  failMessage_ = message.empty() ? "fetch failed" : message;
}

void MemoryDataSource::corruptNextFetch() {
  std::lock_guard<std::mutex> lock(mtx_);
  corruptNext_ = true;
}

std::size_t MemoryDataSource::rowCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return rows_.size();
}

std::size_t MemoryDataSource::fetchCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return fetches_;
}

} // namespace df
