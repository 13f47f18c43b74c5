#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kgraph {

class PropValue;

/** Open key->value map for type-specific attributes (keys unique, order
 *  irrelevant). */
using PropMap = std::map<std::string, PropValue>;
using PropList = std::vector<PropValue>;

/**
 * A value in a props/metadata map: exactly one of string, number, boolean,
 * nested map or list. Copies are deep.
 */
class PropValue {
 public:
  enum class Kind : uint8_t { kString, kNumber, kBool, kMap, kList };

  PropValue();  // empty string
  PropValue(std::string value);
  PropValue(const char* value);
  PropValue(double value);
  PropValue(int value);
  PropValue(int64_t value);
  PropValue(bool value);
  explicit PropValue(PropMap value);
  explicit PropValue(PropList value);

  PropValue(const PropValue& other);
  PropValue(PropValue&& other) noexcept;
  PropValue& operator=(const PropValue& other);
  PropValue& operator=(PropValue&& other) noexcept;
  ~PropValue();

  Kind kind() const { return kind_; }
  bool IsString() const { return kind_ == Kind::kString; }
  bool IsNumber() const { return kind_ == Kind::kNumber; }
  bool IsBool() const { return kind_ == Kind::kBool; }
  bool IsMap() const { return kind_ == Kind::kMap; }
  bool IsList() const { return kind_ == Kind::kList; }

  // Accessors return a neutral value when the kind does not match.
  const std::string& AsString() const;
  double AsNumber() const;
  bool AsBool() const;
  const PropMap& AsMap() const;
  const PropList& AsList() const;

  bool operator==(const PropValue& other) const;
  bool operator!=(const PropValue& other) const { return !(*this == other); }

 private:
  Kind kind_ = Kind::kString;
  std::string string_;
  double number_ = 0.0;
  bool bool_ = false;
  std::unique_ptr<PropMap> map_;
  std::unique_ptr<PropList> list_;
};

/** Edge direction relative to the node being expanded. */
enum class Direction : uint8_t {
  kOutgoing,  // follow edges with src_slug == current
  kIncoming,  // follow edges with dst_slug == current
  kBoth
};

std::string_view DirectionName(Direction d);
bool ParseDirection(std::string_view name, Direction* out);

/** A canonical entity. */
struct Node {
  std::string slug;
  std::string node_type;
  std::string title;
  std::string description;
  PropMap props;
  PropMap metadata;
  // Empty means "not yet embedded".
  std::vector<float> embedding;
  // SHA-256 (hex) of the text the current embedding was computed from, when
  // it was computed by the engine's embedder. Empty otherwise.
  std::string embedded_text_digest;
  uint64_t created_at_us = 0;
  uint64_t updated_at_us = 0;

  bool HasEmbedding() const { return !embedding.empty(); }
};

/** A directed, typed, weighted relationship. */
struct Edge {
  std::string src_slug;
  std::string dst_slug;
  std::string edge_type;
  double weight = 1.0;
  PropMap props;
  PropMap metadata;
  uint64_t created_at_us = 0;
  uint64_t updated_at_us = 0;

  /** "src->dst:type", used as the mutation log target. */
  std::string Identity() const;
};

/**
 * Input to GraphStore::UpsertNode. Unset optionals leave the stored field as
 * is on update; on create they default to empty. node_type is required when
 * the node does not exist yet.
 */
struct NodeUpsert {
  std::string slug;
  std::optional<std::string> node_type;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<PropMap> props;
  std::optional<PropMap> metadata;
};

/** Input to GraphStore::CreateEdge. */
struct EdgeCreate {
  std::string src_slug;
  std::string dst_slug;
  std::string edge_type;
  double weight = 1.0;
  PropMap props;
  PropMap metadata;
};

/** Parameters of a bounded neighbor expansion. */
struct NeighborQuery {
  // Unset follows every edge type.
  std::optional<std::string> edge_type;
  Direction direction = Direction::kOutgoing;
  int max_depth = 1;
};

/** One node reached by a neighbor expansion. */
struct NeighborResult {
  std::string slug;
  std::string node_type;
  std::string title;
  std::string matched_edge_type;
  int hop_distance = 0;
};

/** Result of GraphStore::ShortestPath. path_length == path_edges.size(). */
struct PathResult {
  std::vector<std::string> path_nodes;
  std::vector<Edge> path_edges;
  int path_length = 0;
};

struct SearchOptions {
  std::optional<std::string> node_type;
  size_t limit = 10;
};

/** One similarity search hit, cosine similarity in [-1, 1]. */
struct SearchHit {
  std::string slug;
  std::string node_type;
  float similarity = 0.0f;
};

/** One entry of an assembled context. */
struct ContextItem {
  std::string slug;
  std::string node_type;
  std::string title;
  std::string description;
  float relevance_score = 0.0f;
  std::vector<NeighborResult> connected_nodes;
};

/** Mutation log operation kinds. */
enum class MutationOp : uint8_t {
  kNodeUpsert,
  kNodeEmbed,
  kNodeDelete,
  kEdgeCreate,
  kEdgeDelete,
  kBulkSync
};

std::string_view MutationOpName(MutationOp op);
bool ParseMutationOp(std::string_view name, MutationOp* out);

/** An append-only audit record. */
struct MutationEntry {
  uint64_t seq = 0;
  MutationOp op = MutationOp::kNodeUpsert;
  std::string source;
  std::string target;
  bool success = true;
  std::string error;
  // Compact JSON document; empty when the operation has nothing to add.
  std::string payload;
  uint64_t recorded_at_us = 0;
};

struct BulkSyncRequest {
  // Recorded as the mutation source; falls back to Options::mutation_source.
  std::string source;
  std::vector<NodeUpsert> nodes;
  std::vector<EdgeCreate> edges;
};

struct BulkSyncResult {
  uint64_t nodes_created = 0;
  uint64_t nodes_updated = 0;
  uint64_t edges_created = 0;
  uint64_t edges_skipped = 0;   // duplicates ignored
  uint64_t nodes_embedded = 0;  // auto-embeds that succeeded after commit
};

// ---------------------------------------------------------------------------
// Canonical taxonomy
// ---------------------------------------------------------------------------

/** The 15 node types of the canonical ontology. */
const std::vector<std::string>& CanonicalNodeTypes();

/** The 13 edge types of the canonical ontology. */
const std::vector<std::string>& CanonicalEdgeTypes();

}  // namespace kgraph
