#include "df/store/ColumnSchema.hpp"

namespace df {

ColumnSchema ColumnSchema::fromTable(const Table& table, std::uint64_t generation) {
  ColumnSchema s;
  s.generation_ = generation;
  for (const auto& name : table.columns) s.add(name);
  for (const auto& row : table.rows) {
    for (const auto& [name, value] : row.fields) s.add(name);
  }
  return s;
}

void ColumnSchema::add(const std::string& name) {
  if (known_.insert(name).second) columns_.push_back(name);
}

bool ColumnSchema::contains(const std::string& name) const {
  return known_.count(name) != 0;
}

bool ColumnSchema::check(const Row& row, SyncError* err) const {
  for (const auto& [name, value] : row.fields) {
    if (known_.count(name) != 0) continue;
    if (err) {
      err->code = "SCHEMA_UNKNOWN_FIELD";
      err->message = "row " + std::to_string(row.index) +
                     " carries unknown field '" + name + "'";
    }
    return false;
  }
  return true;
}

std::vector<double> ColumnSchema::dense(const Row& row) const {
  std::vector<double> out;
  out.reserve(columns_.size());
  for (const auto& name : columns_) out.push_back(row.get(name));
  return out;
}

} // namespace df
