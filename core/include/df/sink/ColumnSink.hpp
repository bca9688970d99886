#pragma once
#include "df/sink/Sink.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace df {

struct ColumnSinkConfig {
  // Columns this sink keeps; empty keeps every schema column.
  std::vector<std::string> columns;
};

// Column-oriented retained window, one value vector per column plus the
// index column. Rows stream in at the tail and roll off the head.
class ColumnSink : public Sink {
public:
  ColumnSink() = default;
  explicit ColumnSink(const ColumnSinkConfig& config);

  void applySchema(const ColumnSchema& schema) override;
  void streamRows(const std::vector<Row>& rows, std::size_t retentionCap) override;
  bool isVisible(RowIndex index) const override;
  void patchRow(const Row& row) override;

  const std::vector<std::string>& columns() const { return columnNames_; }
  const std::vector<RowIndex>& indices() const { return index_; }
  // nullptr for an unknown column.
  const std::vector<double>* column(const std::string& name) const;
  std::size_t rowCount() const { return index_.size(); }

  std::uint32_t schemaCount() const { return schemaCount_; }
  std::uint32_t streamCount() const { return streamCount_; }
  std::uint32_t patchCount() const { return patchCount_; }
  std::uint32_t streamedRows() const { return streamedRows_; }

private:
  bool wants(const std::string& name) const;
  void keepLast(std::size_t n);
  // Position of `index` in index_, or -1.
  std::ptrdiff_t positionOf(RowIndex index) const;

  ColumnSinkConfig config_;
  ColumnSchema schema_;
  std::vector<std::string> columnNames_;
  std::vector<std::size_t> schemaPos_;  // kept column -> position in schema_
  std::unordered_map<std::string, std::vector<double>> data_;
  std::vector<RowIndex> index_;

  std::uint32_t schemaCount_{0};
  std::uint32_t streamCount_{0};
  std::uint32_t patchCount_{0};
  std::uint32_t streamedRows_{0};
};

} // namespace df
