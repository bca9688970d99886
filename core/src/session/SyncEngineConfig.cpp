#include "df/session/SyncEngineConfig.hpp"

#include <cstdint>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace df {

std::string serializeSyncEngineConfig(const SyncEngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("lookback", static_cast<std::uint64_t>(cfg.lookback), alloc);
  doc.AddMember("timeoutMs", cfg.timeoutMs, alloc);
  doc.AddMember("verbose", cfg.verbose, alloc);
  doc.AddMember("maxPendingCorrections",
                static_cast<std::uint64_t>(cfg.maxPendingCorrections), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeSyncEngineConfig(const std::string& json, SyncEngineConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  SyncEngineConfig cfg = out;

  if (doc.HasMember("lookback") && doc["lookback"].IsUint64())
    cfg.lookback = static_cast<std::size_t>(doc["lookback"].GetUint64());

  if (doc.HasMember("timeoutMs") && doc["timeoutMs"].IsInt())
    cfg.timeoutMs = doc["timeoutMs"].GetInt();

  if (doc.HasMember("verbose") && doc["verbose"].IsBool())
    cfg.verbose = doc["verbose"].GetBool();

  if (doc.HasMember("maxPendingCorrections") &&
      doc["maxPendingCorrections"].IsUint64())
    cfg.maxPendingCorrections =
        static_cast<std::size_t>(doc["maxPendingCorrections"].GetUint64());

  if (cfg.lookback == 0 || cfg.timeoutMs <= 0) return false;

  out = cfg;
  return true;
}

} // namespace df
