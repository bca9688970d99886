#pragma once
#include "df/data/Row.hpp"

#include <string>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace df {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// {"index":N,"fields":{"name":value|null,...}}
void writeRowJson(JsonWriter& w, const Row& row);

std::string rowToJson(const Row& row);
std::string rowsToJson(const std::vector<Row>& rows);

// {"columns":[...],"rows":[<row>,...]}
std::string tableToJson(const Table& table);

// Returns false on parse error or on a malformed row (missing or non-integer
// index, non-numeric field). `out` is only written on success.
bool tableFromJson(const std::string& json, Table& out);

} // namespace df
