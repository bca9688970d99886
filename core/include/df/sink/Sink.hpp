#pragma once
#include "df/data/Row.hpp"
#include "df/store/ColumnSchema.hpp"

#include <cstddef>
#include <vector>

namespace df {

// Presentation-facing receiver. All calls arrive on the consumer loop's thread.
class Sink {
public:
  virtual ~Sink() = default;

  // Full reset: drop retained data, adopt the column set.
  virtual void applySchema(const ColumnSchema& schema) = 0;

  // Append rows (ascending), then keep only the last `retentionCap` rows.
  virtual void streamRows(const std::vector<Row>& rows, std::size_t retentionCap) = 0;

  // Whether `index` is inside the retained window (patchable).
  virtual bool isVisible(RowIndex index) const = 0;

  // In-place correction; only valid when isVisible(row.index).
  virtual void patchRow(const Row& row) = 0;
};

} // namespace df
