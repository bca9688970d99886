#pragma once
#include "df/data/DataSource.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace df {

// In-memory table the host (or a test) writes into from any thread.
class MemoryDataSource : public DataSource {
public:
  MemoryDataSource() = default;
  explicit MemoryDataSource(std::vector<std::string> columns);

  Table fetchInitial(std::size_t back) override;
  Table fetchSince(RowIndex position) override;
  void acknowledge() override;

  void setColumns(std::vector<std::string> columns);

  // Adds or overwrites a row. A row at or below the highest index already
  // fetched is reported as a revision by every fetchSince() until the batch
  // carrying it is acknowledged.
  void append(const Row& row);
  void revise(const Row& row) { append(row); }

  // Next fetch (either kind) throws std::runtime_error with `message`.
  void failNextFetch(const std::string& message);
  // Next fetchSince() returns its rows in descending order.
  void corruptNextFetch();

  std::size_t rowCount() const;
  std::size_t fetchCount() const;

private:
  mutable std::mutex mtx_;
  std::vector<std::string> columns_;
  std::map<RowIndex, Row> rows_;
  // index -> revision serial; inFlight_ holds what the last fetchSince()
  // handed out.
  std::map<RowIndex, std::uint64_t> revised_;
  std::map<RowIndex, std::uint64_t> inFlight_;
  std::uint64_t revisionSerial_{0};
  RowIndex highWater_{kNoPosition};
  std::string failMessage_;
  bool corruptNext_{false};
  std::size_t fetches_{0};
};

} // namespace df
