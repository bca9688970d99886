#pragma once
#include "df/data/Row.hpp"

#include <cstddef>

namespace df {

// Pull-based row source. Called from the engine's worker thread (and once
// from the constructing thread for the initial fill). Implementations may
// throw std::exception on failure; the engine drops that poll cycle.
class DataSource {
public:
  virtual ~DataSource() = default;

  // Up to `back` most recent rows, ascending index.
  virtual Table fetchInitial(std::size_t back) = 0;

  // Rows with index > position, ascending. Revised rows at or below
  // `position` may be included too (still ascending); they become corrections.
  // A revision stays in every fetchSince() result until acknowledge().
  virtual Table fetchSince(RowIndex position) = 0;

  // The last fetchSince() batch was applied. Revisions it carried are not
  // reported again unless revised once more. Not called for a batch that was
  // dropped, so a retry sees the same revisions.
  virtual void acknowledge() {}
};

} // namespace df
