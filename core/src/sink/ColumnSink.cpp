#include "df/sink/ColumnSink.hpp"

#include <algorithm>

namespace df {

ColumnSink::ColumnSink(const ColumnSinkConfig& config) : config_(config) {}

bool ColumnSink::wants(const std::string& name) const {
  if (config_.columns.empty()) return true;
  return std::find(config_.columns.begin(), config_.columns.end(), name) !=
         config_.columns.end();
}

void ColumnSink::applySchema(const ColumnSchema& schema) {
  schema_ = schema;
  columnNames_.clear();
  schemaPos_.clear();
  data_.clear();
  index_.clear();
  const auto& all = schema.columns();
  for (std::size_t i = 0; i < all.size(); ++i) {
    if (!wants(all[i])) continue;
    columnNames_.push_back(all[i]);
    schemaPos_.push_back(i);
    data_[all[i]];
  }
  schemaCount_++;
}

void ColumnSink::streamRows(const std::vector<Row>& rows, std::size_t retentionCap) {
  if (rows.empty()) return;
  for (const auto& row : rows) {
    index_.push_back(row.index);
    std::vector<double> values = schema_.dense(row);
    for (std::size_t c = 0; c < columnNames_.size(); ++c) {
      data_[columnNames_[c]].push_back(values[schemaPos_[c]]);
    }
  }
  // Rollover; a cap of 0 keeps everything.
  if (retentionCap > 0) keepLast(retentionCap);
  streamCount_++;
  streamedRows_ += static_cast<std::uint32_t>(rows.size());
}

bool ColumnSink::isVisible(RowIndex index) const {
  return positionOf(index) >= 0;
}

void ColumnSink::patchRow(const Row& row) {
  std::ptrdiff_t pos = positionOf(row.index);
  if (pos < 0) return;
  for (const auto& [name, value] : row.fields) {
    auto it = data_.find(name);
    if (it == data_.end()) continue;  // column not kept by this sink
    it->second[static_cast<std::size_t>(pos)] = value;
  }
  patchCount_++;
}

const std::vector<double>* ColumnSink::column(const std::string& name) const {
  auto it = data_.find(name);
  if (it == data_.end()) return nullptr;
  return &it->second;
}

void ColumnSink::keepLast(std::size_t n) {
  if (index_.size() <= n) return;
  auto excess = static_cast<std::ptrdiff_t>(index_.size() - n);
  index_.erase(index_.begin(), index_.begin() + excess);
  for (auto& [name, values] : data_) {
    values.erase(values.begin(), values.begin() + excess);
  }
}

std::ptrdiff_t ColumnSink::positionOf(RowIndex index) const {
  // Newest rows are the most likely targets; search from the tail.
  for (std::size_t i = index_.size(); i > 0; --i) {
    if (index_[i - 1] == index) return static_cast<std::ptrdiff_t>(i - 1);
  }
  return -1;
}

} // namespace df
