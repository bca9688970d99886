#pragma once
#include <cstddef>
#include <string>

namespace df {

struct SyncEngineConfig {
  std::size_t lookback{100};       // rows retained by the store and the sinks
  int timeoutMs{1000};             // worker poll period, > 0
  bool verbose{false};             // log every delivery to stderr
  std::size_t maxPendingCorrections{0};  // 0 = unbounded
};

// Serialize SyncEngineConfig to a JSON string.
std::string serializeSyncEngineConfig(const SyncEngineConfig& cfg);

// Fill `out` from JSON; absent keys keep their current value.
// Returns false on parse error or invalid values (out untouched).
bool deserializeSyncEngineConfig(const std::string& json, SyncEngineConfig& out);

} // namespace df
