#pragma once
#include "df/sink/Sink.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace df {

// Serializes every delivery into one JSON message and hands it to a callback:
//   {"sink":name,"kind":"schema","columns":[...]}
//   {"sink":name,"kind":"stream","rollover":N,"rows":[...]}
//   {"sink":name,"kind":"patch","row":{...}}
// Tracks the retained index window the same way a column sink would.
class JsonMessageSink : public Sink {
public:
  using MessageFn = std::function<void(const std::string&)>;

  JsonMessageSink(std::string name, MessageFn onMessage);

  void applySchema(const ColumnSchema& schema) override;
  void streamRows(const std::vector<Row>& rows, std::size_t retentionCap) override;
  bool isVisible(RowIndex index) const override;
  void patchRow(const Row& row) override;

  const std::string& name() const { return name_; }
  std::uint32_t messageCount() const { return messages_; }

private:
  void emit(const std::string& msg);

  std::string name_;
  MessageFn onMessage_;
  std::deque<RowIndex> visible_;
  std::uint32_t messages_{0};
};

} // namespace df
