#pragma once
#include <cstdint>

namespace df {

struct SyncStats {
  // Worker side
  std::uint64_t fetchCycles = 0;
  std::uint64_t fetchErrors = 0;      // thrown or malformed batches
  std::uint64_t resyncs = 0;          // replace() via set() or initial fill
  std::uint64_t rowsAppended = 0;
  std::uint64_t rowsCorrected = 0;
  std::uint64_t rowsEvicted = 0;      // corrections older than the window
  std::uint64_t rowsRejected = 0;     // schema violations, bad indices

  // Consumer side
  std::uint64_t appendFlushes = 0;
  std::uint64_t appendFlushesCoalesced = 0;
  std::uint64_t correctionFlushes = 0;
  std::uint64_t correctionFlushesCoalesced = 0;
  std::uint64_t emptyFlushes = 0;     // ran but had nothing to deliver
  std::uint64_t rowsStreamed = 0;
  std::uint64_t rowsPatched = 0;
  std::uint64_t sinkErrors = 0;
  std::uint64_t correctionsDropped = 0;  // stale generation or queue overflow
};

} // namespace df
