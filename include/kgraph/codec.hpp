#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <json/json.h>

#include <kgraph/status.hpp>
#include <kgraph/types.hpp>

namespace kgraph::internal {

// Record encodings for the RocksDB column families. Records are compact JSON
// documents (jsoncpp); identity fields that already live in the key (slug,
// edge endpoints and type, log sequence) are not repeated in the value, and
// embeddings are stored separately as raw floats.

Json::Value PropMapToJson(const PropMap& map);

// Fails on JSON values with no PropValue counterpart (null).
bool PropMapFromJson(const Json::Value& json, PropMap* out);

// Validation error for anything PropMapToJson cannot write back losslessly:
// non-finite numbers, and keys or strings that are not UTF-8. `field` names
// the map in the message ("props", "metadata").
Status ValidatePropMap(std::string_view field, const PropMap& map);

std::string ToCompactJson(const Json::Value& value);
bool ParseJson(std::string_view text, Json::Value* out, std::string* errors = nullptr);

std::string EncodeNode(const Node& node);
Status DecodeNode(std::string_view slug, std::string_view bytes, Node* out);

std::string EncodeEdge(const Edge& edge);
Status DecodeEdge(std::string_view src_slug, std::string_view dst_slug,
                  std::string_view edge_type, std::string_view bytes, Edge* out);

std::string EncodeMutation(const MutationEntry& entry);
Status DecodeMutation(uint64_t seq, std::string_view bytes, MutationEntry* out);

}  // namespace kgraph::internal
