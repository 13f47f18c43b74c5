#include <kgraph/types.hpp>

#include <utility>

namespace kgraph {

PropValue::PropValue() = default;

PropValue::PropValue(std::string value)
    : kind_(Kind::kString), string_(std::move(value)) {}

PropValue::PropValue(const char* value)
    : kind_(Kind::kString), string_(value ? value : "") {}

PropValue::PropValue(double value) : kind_(Kind::kNumber), number_(value) {}

PropValue::PropValue(int value)
    : kind_(Kind::kNumber), number_(static_cast<double>(value)) {}

PropValue::PropValue(int64_t value)
    : kind_(Kind::kNumber), number_(static_cast<double>(value)) {}

PropValue::PropValue(bool value) : kind_(Kind::kBool), bool_(value) {}

PropValue::PropValue(PropMap value)
    : kind_(Kind::kMap), map_(std::make_unique<PropMap>(std::move(value))) {}

PropValue::PropValue(PropList value)
    : kind_(Kind::kList), list_(std::make_unique<PropList>(std::move(value))) {}

PropValue::PropValue(const PropValue& other)
    : kind_(other.kind_),
      string_(other.string_),
      number_(other.number_),
      bool_(other.bool_),
      map_(other.map_ ? std::make_unique<PropMap>(*other.map_) : nullptr),
      list_(other.list_ ? std::make_unique<PropList>(*other.list_) : nullptr) {}

PropValue::PropValue(PropValue&& other) noexcept = default;

PropValue& PropValue::operator=(const PropValue& other) {
  if (this == &other) return *this;
  PropValue copy(other);
  *this = std::move(copy);
  return *this;
}

PropValue& PropValue::operator=(PropValue&& other) noexcept = default;

PropValue::~PropValue() = default;

const std::string& PropValue::AsString() const {
  static const std::string kEmpty;
  return kind_ == Kind::kString ? string_ : kEmpty;
}

double PropValue::AsNumber() const {
  return kind_ == Kind::kNumber ? number_ : 0.0;
}

bool PropValue::AsBool() const {
  return kind_ == Kind::kBool ? bool_ : false;
}

const PropMap& PropValue::AsMap() const {
  static const PropMap kEmpty;
  return (kind_ == Kind::kMap && map_) ? *map_ : kEmpty;
}

const PropList& PropValue::AsList() const {
  static const PropList kEmpty;
  return (kind_ == Kind::kList && list_) ? *list_ : kEmpty;
}

bool PropValue::operator==(const PropValue& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kString: return string_ == other.string_;
    case Kind::kNumber: return number_ == other.number_;
    case Kind::kBool: return bool_ == other.bool_;
    case Kind::kMap: return AsMap() == other.AsMap();
    case Kind::kList: return AsList() == other.AsList();
  }
  return false;
}

std::string_view DirectionName(Direction d) {
  switch (d) {
    case Direction::kOutgoing: return "outgoing";
    case Direction::kIncoming: return "incoming";
    case Direction::kBoth: return "both";
  }
  return "outgoing";
}

bool ParseDirection(std::string_view name, Direction* out) {
  if (!out) return false;
  if (name == "outgoing") {
    *out = Direction::kOutgoing;
  } else if (name == "incoming") {
    *out = Direction::kIncoming;
  } else if (name == "both") {
    *out = Direction::kBoth;
  } else {
    return false;
  }
  return true;
}

std::string Edge::Identity() const {
  return src_slug + "->" + dst_slug + ":" + edge_type;
}

std::string_view MutationOpName(MutationOp op) {
  switch (op) {
    case MutationOp::kNodeUpsert: return "node_upsert";
    case MutationOp::kNodeEmbed: return "node_embed";
    case MutationOp::kNodeDelete: return "node_delete";
    case MutationOp::kEdgeCreate: return "edge_create";
    case MutationOp::kEdgeDelete: return "edge_delete";
    case MutationOp::kBulkSync: return "bulk_sync";
  }
  return "node_upsert";
}

bool ParseMutationOp(std::string_view name, MutationOp* out) {
  if (!out) return false;
  static constexpr MutationOp kAll[] = {
      MutationOp::kNodeUpsert, MutationOp::kNodeEmbed, MutationOp::kNodeDelete,
      MutationOp::kEdgeCreate, MutationOp::kEdgeDelete, MutationOp::kBulkSync};
  for (MutationOp op : kAll) {
    if (MutationOpName(op) == name) {
      *out = op;
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& CanonicalNodeTypes() {
  static const std::vector<std::string> kTypes = {
      "product",    "service",   "database",        "schema",    "table",
      "workflow",   "repository", "spec_kit",       "module",    "dashboard",
      "agent",      "skill",     "worktree_branch", "migration", "deployment"};
  return kTypes;
}

const std::vector<std::string>& CanonicalEdgeTypes() {
  static const std::vector<std::string> kTypes = {
      "uses_service",    "depends_on",      "stores_data_in", "has_dashboard",
      "implements_spec", "merged_from",     "deployed_to",    "triggers_workflow",
      "has_migration",   "powers_agent",    "has_seed_data",  "enforces_rls",
      "validated_by"};
  return kTypes;
}

}  // namespace kgraph
