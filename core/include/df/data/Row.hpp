#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace df {

using RowIndex = std::int64_t;

// Sentinel for "no position" (empty store, nothing delivered yet).
inline constexpr RowIndex kNoPosition = -1;

// Value stored for a field a row does not carry.
inline constexpr double kNullValue = std::numeric_limits<double>::quiet_NaN();

inline bool isNull(double v) { return std::isnan(v); }

struct Row {
  RowIndex index{kNoPosition};
  std::map<std::string, double> fields;

  // Returns kNullValue when the field is absent.
  double get(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? kNullValue : it->second;
  }

  bool has(const std::string& name) const {
    return fields.find(name) != fields.end();
  }
};

// What a data source hands back: declared columns plus rows.
// `columns` may be set with zero rows so an empty fetch still carries a schema.
struct Table {
  std::vector<std::string> columns;
  std::vector<Row> rows;

  bool empty() const { return rows.empty(); }
};

struct SyncError {
  std::string code;     // e.g. "SCHEMA_UNKNOWN_FIELD"
  std::string message;  // human text
};

} // namespace df
