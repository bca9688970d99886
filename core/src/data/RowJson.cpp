#include "df/data/RowJson.hpp"

#include <rapidjson/document.h>

#include <utility>

namespace df {

void writeRowJson(JsonWriter& w, const Row& row) {
  w.StartObject();
  w.Key("index");  w.Int64(row.index);
  w.Key("fields");
  w.StartObject();
  for (const auto& [name, value] : row.fields) {
    w.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
    if (isNull(value)) w.Null();
    else w.Double(value);
  }
  w.EndObject();
  w.EndObject();
}

std::string rowToJson(const Row& row) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeRowJson(w, row);
  return sb.GetString();
}

std::string rowsToJson(const std::vector<Row>& rows) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartArray();
  for (const auto& r : rows) writeRowJson(w, r);
  w.EndArray();
  return sb.GetString();
}

std::string tableToJson(const Table& table) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("columns");
  w.StartArray();
  for (const auto& c : table.columns) w.String(c.c_str());
  w.EndArray();
  w.Key("rows");
  w.StartArray();
  for (const auto& r : table.rows) writeRowJson(w, r);
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

static bool parseRow(const rapidjson::Value& v, Row& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("index") || !v["index"].IsInt64()) return false;
  out.index = v["index"].GetInt64();
  out.fields.clear();

  if (!v.HasMember("fields")) return true;
  const auto& f = v["fields"];
  if (!f.IsObject()) return false;
  for (auto it = f.MemberBegin(); it != f.MemberEnd(); ++it) {
    std::string name(it->name.GetString(), it->name.GetStringLength());
    if (it->value.IsNull()) {
      out.fields[name] = kNullValue;
    } else if (it->value.IsNumber()) {
      out.fields[name] = it->value.GetDouble();
    } else {
      return false;
    }
  }
  return true;
}

bool tableFromJson(const std::string& json, Table& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  Table t;
  if (doc.HasMember("columns")) {
    if (!doc["columns"].IsArray()) return false;
    for (const auto& c : doc["columns"].GetArray()) {
      if (!c.IsString()) return false;
      t.columns.emplace_back(c.GetString(), c.GetStringLength());
    }
  }
  if (doc.HasMember("rows")) {
    if (!doc["rows"].IsArray()) return false;
    for (const auto& v : doc["rows"].GetArray()) {
      Row r;
      if (!parseRow(v, r)) return false;
      t.rows.push_back(std::move(r));
    }
  }

  out = std::move(t);
  return true;
}

} // namespace df
