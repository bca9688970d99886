#include "df/sink/JsonMessageSink.hpp"
#include "df/data/RowJson.hpp"

#include <algorithm>
#include <utility>

namespace df {

JsonMessageSink::JsonMessageSink(std::string name, MessageFn onMessage)
  : name_(std::move(name)), onMessage_(std::move(onMessage)) {}

void JsonMessageSink::applySchema(const ColumnSchema& schema) {
  visible_.clear();

  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("sink");  w.String(name_.c_str());
  w.Key("kind");  w.String("schema");
  w.Key("columns");
  w.StartArray();
  for (const auto& c : schema.columns()) w.String(c.c_str());
  w.EndArray();
  w.EndObject();
  emit(sb.GetString());
}

void JsonMessageSink::streamRows(const std::vector<Row>& rows,
                                 std::size_t retentionCap) {
  if (rows.empty()) return;
  for (const auto& r : rows) visible_.push_back(r.index);
  if (retentionCap > 0) {
    while (visible_.size() > retentionCap) visible_.pop_front();
  }

  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("sink");      w.String(name_.c_str());
  w.Key("kind");      w.String("stream");
  w.Key("rollover");  w.Uint64(retentionCap);
  w.Key("rows");
  w.StartArray();
  for (const auto& r : rows) writeRowJson(w, r);
  w.EndArray();
  w.EndObject();
  emit(sb.GetString());
}

bool JsonMessageSink::isVisible(RowIndex index) const {
  return std::find(visible_.begin(), visible_.end(), index) != visible_.end();
}

void JsonMessageSink::patchRow(const Row& row) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("sink");  w.String(name_.c_str());
  w.Key("kind");  w.String("patch");
  w.Key("row");   writeRowJson(w, row);
  w.EndObject();
  emit(sb.GetString());
}

void JsonMessageSink::emit(const std::string& msg) {
  messages_++;
  if (onMessage_) onMessage_(msg);
}

} // namespace df
