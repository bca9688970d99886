#pragma once
#include "df/data/Row.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace df {

// Known field names, fixed between two replace() calls.
// Rows are checked against it and rejected if they carry an unknown field;
// the schema never widens on its own.
class ColumnSchema {
public:
  ColumnSchema() = default;

  // Declared columns first, then fields seen on the rows (first-seen order).
  static ColumnSchema fromTable(const Table& table, std::uint64_t generation);

  bool contains(const std::string& name) const;
  const std::vector<std::string>& columns() const { return columns_; }
  std::size_t size() const { return columns_.size(); }
  bool empty() const { return columns_.empty(); }
  std::uint64_t generation() const { return generation_; }

  // ok when every field of `row` is known. Missing fields are fine.
  bool check(const Row& row, SyncError* err = nullptr) const;

  // Values in column order, kNullValue for absent fields.
  std::vector<double> dense(const Row& row) const;

private:
  void add(const std::string& name);

  std::vector<std::string> columns_;
  std::unordered_set<std::string> known_;
  std::uint64_t generation_{0};
};

} // namespace df
