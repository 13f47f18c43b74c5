#include <kgraph/codec.hpp>

#include <cmath>
#include <memory>
#include <sstream>

#include <kgraph/internal.hpp>

namespace kgraph::internal {

namespace {

Json::Value PropValueToJson(const PropValue& v) {
  switch (v.kind()) {
    case PropValue::Kind::kString: return Json::Value(v.AsString());
    case PropValue::Kind::kNumber: return Json::Value(v.AsNumber());
    case PropValue::Kind::kBool: return Json::Value(v.AsBool());
    case PropValue::Kind::kMap: return PropMapToJson(v.AsMap());
    case PropValue::Kind::kList: {
      Json::Value arr(Json::arrayValue);
      for (const auto& item : v.AsList()) arr.append(PropValueToJson(item));
      return arr;
    }
  }
  return Json::Value();
}

bool PropValueFromJson(const Json::Value& json, PropValue* out) {
  if (json.isBool()) {
    *out = PropValue(json.asBool());
  } else if (json.isNumeric()) {
    *out = PropValue(json.asDouble());
  } else if (json.isString()) {
    *out = PropValue(json.asString());
  } else if (json.isObject()) {
    PropMap map;
    if (!PropMapFromJson(json, &map)) return false;
    *out = PropValue(std::move(map));
  } else if (json.isArray()) {
    PropList list;
    list.reserve(json.size());
    for (const auto& item : json) {
      PropValue v;
      if (!PropValueFromJson(item, &v)) return false;
      list.push_back(std::move(v));
    }
    *out = PropValue(std::move(list));
  } else {
    return false;
  }
  return true;
}

Status ValidatePropValue(const std::string& path, const PropValue& v) {
  switch (v.kind()) {
    case PropValue::Kind::kString:
      return ValidateText(path, v.AsString());
    case PropValue::Kind::kNumber:
      if (!std::isfinite(v.AsNumber())) {
        return Status::Validation(path + " must be a finite number");
      }
      return Status::OK();
    case PropValue::Kind::kBool:
      return Status::OK();
    case PropValue::Kind::kMap:
      return ValidatePropMap(path, v.AsMap());
    case PropValue::Kind::kList: {
      const PropList& list = v.AsList();
      for (size_t i = 0; i < list.size(); ++i) {
        Status st = ValidatePropValue(path + "[" + std::to_string(i) + "]", list[i]);
        if (!st.ok()) return st;
      }
      return Status::OK();
    }
  }
  return Status::OK();
}

uint64_t ReadU64(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  return v.isUInt64() ? v.asUInt64() : 0;
}

}  // namespace

Json::Value PropMapToJson(const PropMap& map) {
  Json::Value obj(Json::objectValue);
  for (const auto& [key, value] : map) {
    obj[key] = PropValueToJson(value);
  }
  return obj;
}

bool PropMapFromJson(const Json::Value& json, PropMap* out) {
  if (!out) return false;
  out->clear();
  if (json.isNull()) return true;
  if (!json.isObject()) return false;
  for (const auto& key : json.getMemberNames()) {
    PropValue v;
    if (!PropValueFromJson(json[key], &v)) return false;
    out->emplace(key, std::move(v));
  }
  return true;
}

Status ValidatePropMap(std::string_view field, const PropMap& map) {
  for (const auto& [key, value] : map) {
    const std::string path = std::string(field) + "." + key;
    Status st = ValidateText(std::string(field) + " key", key);
    if (!st.ok()) return st;
    st = ValidatePropValue(path, value);
    if (!st.ok()) return st;
  }
  return Status::OK();
}

std::string ToCompactJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

bool ParseJson(std::string_view text, Json::Value* out, std::string* errors) {
  Json::CharReaderBuilder builder;
  std::istringstream stream{std::string(text)};
  std::string errs;
  bool ok = Json::parseFromStream(builder, stream, out, &errs);
  if (errors) *errors = errs;
  return ok;
}

std::string EncodeNode(const Node& node) {
  Json::Value obj(Json::objectValue);
  obj["type"] = node.node_type;
  obj["title"] = node.title;
  obj["description"] = node.description;
  obj["props"] = PropMapToJson(node.props);
  obj["metadata"] = PropMapToJson(node.metadata);
  if (!node.embedded_text_digest.empty()) obj["text_digest"] = node.embedded_text_digest;
  obj["created_at_us"] = static_cast<Json::UInt64>(node.created_at_us);
  obj["updated_at_us"] = static_cast<Json::UInt64>(node.updated_at_us);
  return ToCompactJson(obj);
}

Status DecodeNode(std::string_view slug, std::string_view bytes, Node* out) {
  Json::Value obj;
  std::string errs;
  if (!ParseJson(bytes, &obj, &errs) || !obj.isObject()) {
    return Status::StoreError("corrupt node record for " + std::string(slug) + ": " + errs);
  }

  Node node;
  node.slug = std::string(slug);
  node.node_type = obj["type"].asString();
  node.title = obj["title"].asString();
  node.description = obj["description"].asString();
  if (!PropMapFromJson(obj["props"], &node.props) ||
      !PropMapFromJson(obj["metadata"], &node.metadata)) {
    return Status::StoreError("corrupt props in node record for " + std::string(slug));
  }
  node.embedded_text_digest = obj.get("text_digest", "").asString();
  node.created_at_us = ReadU64(obj, "created_at_us");
  node.updated_at_us = ReadU64(obj, "updated_at_us");

  *out = std::move(node);
  return Status::OK();
}

std::string EncodeEdge(const Edge& edge) {
  Json::Value obj(Json::objectValue);
  obj["weight"] = edge.weight;
  obj["props"] = PropMapToJson(edge.props);
  obj["metadata"] = PropMapToJson(edge.metadata);
  obj["created_at_us"] = static_cast<Json::UInt64>(edge.created_at_us);
  obj["updated_at_us"] = static_cast<Json::UInt64>(edge.updated_at_us);
  return ToCompactJson(obj);
}

Status DecodeEdge(std::string_view src_slug, std::string_view dst_slug,
                  std::string_view edge_type, std::string_view bytes, Edge* out) {
  Json::Value obj;
  std::string errs;
  Edge edge;
  edge.src_slug = std::string(src_slug);
  edge.dst_slug = std::string(dst_slug);
  edge.edge_type = std::string(edge_type);
  if (!ParseJson(bytes, &obj, &errs) || !obj.isObject()) {
    return Status::StoreError("corrupt edge record for " + edge.Identity() + ": " + errs);
  }

  edge.weight = obj.get("weight", 1.0).asDouble();
  if (!PropMapFromJson(obj["props"], &edge.props) ||
      !PropMapFromJson(obj["metadata"], &edge.metadata)) {
    return Status::StoreError("corrupt props in edge record for " + edge.Identity());
  }
  edge.created_at_us = ReadU64(obj, "created_at_us");
  edge.updated_at_us = ReadU64(obj, "updated_at_us");

  *out = std::move(edge);
  return Status::OK();
}

std::string EncodeMutation(const MutationEntry& entry) {
  Json::Value obj(Json::objectValue);
  obj["op"] = std::string(MutationOpName(entry.op));
  obj["source"] = entry.source;
  obj["target"] = entry.target;
  obj["status"] = entry.success ? "success" : "failure";
  if (!entry.error.empty()) obj["error"] = entry.error;
  if (!entry.payload.empty()) obj["payload"] = entry.payload;
  obj["recorded_at_us"] = static_cast<Json::UInt64>(entry.recorded_at_us);
  return ToCompactJson(obj);
}

Status DecodeMutation(uint64_t seq, std::string_view bytes, MutationEntry* out) {
  Json::Value obj;
  std::string errs;
  if (!ParseJson(bytes, &obj, &errs) || !obj.isObject()) {
    return Status::StoreError("corrupt mutation log entry " + std::to_string(seq) + ": " + errs);
  }

  MutationEntry entry;
  entry.seq = seq;
  if (!ParseMutationOp(obj["op"].asString(), &entry.op)) {
    return Status::StoreError("unknown mutation op in entry " + std::to_string(seq));
  }
  entry.source = obj["source"].asString();
  entry.target = obj["target"].asString();
  entry.success = obj["status"].asString() == "success";
  entry.error = obj.get("error", "").asString();
  entry.payload = obj.get("payload", "").asString();
  entry.recorded_at_us = ReadU64(obj, "recorded_at_us");

  *out = std::move(entry);
  return Status::OK();
}

}  // namespace kgraph::internal
