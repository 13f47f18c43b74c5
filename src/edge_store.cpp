#include <kgraph/graph_store.hpp>

#include <rocksdb/utilities/transaction.h>

#include <cmath>

#include <kgraph/codec.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/logging.hpp>
#include <kgraph/mutation_log.hpp>
#include <kgraph/op_scope.hpp>
#include <kgraph/snapshot_reader.hpp>
#include <kgraph/traversal.hpp>

namespace kgraph {

Status GraphStore::ValidateEdgeCreate(const EdgeCreate& create) const {
  Status st = internal::ValidateSlug(create.src_slug);
  if (!st.ok()) return st;
  st = internal::ValidateSlug(create.dst_slug);
  if (!st.ok()) return st;
  st = CheckEdgeType(create.edge_type);
  if (!st.ok()) return st;
  if (create.src_slug == create.dst_slug) {
    return Status::SelfLoop("edge from " + create.src_slug + " to itself");
  }
  if (!std::isfinite(create.weight)) {
    return Status::Validation("edge weight must be finite");
  }
  st = internal::ValidatePropMap("props", create.props);
  if (!st.ok()) return st;
  return internal::ValidatePropMap("metadata", create.metadata);
}

Status GraphStore::ApplyEdgeCreate(rocksdb::Transaction* txn, const EdgeCreate& create,
                                   uint64_t now_us, Edge* out, bool* duplicate) {
  rocksdb::ReadOptions ro;
  std::string raw;

  // Lock both endpoint keys in lexical order so concurrent creates between
  // the same pair, or a concurrent DeleteNode, serialize without deadlock.
  const bool src_first = create.src_slug < create.dst_slug;
  const std::string& first = src_first ? create.src_slug : create.dst_slug;
  const std::string& second = src_first ? create.dst_slug : create.src_slug;

  bool first_exists = false;
  bool second_exists = false;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(first), &raw);
  if (s.ok()) {
    first_exists = true;
  } else if (!s.IsNotFound()) {
    return Status::FromRocksDB(s);
  }
  s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(second), &raw);
  if (s.ok()) {
    second_exists = true;
  } else if (!s.IsNotFound()) {
    return Status::FromRocksDB(s);
  }

  if (!opt_.allow_dangling_edges) {
    const bool src_exists = src_first ? first_exists : second_exists;
    const bool dst_exists = src_first ? second_exists : first_exists;
    if (!src_exists) {
      return Status::DanglingReference("source node does not exist: " + create.src_slug);
    }
    if (!dst_exists) {
      return Status::DanglingReference("target node does not exist: " + create.dst_slug);
    }
  }

  const std::string out_key =
      internal::MakeEdgeKey(create.src_slug, create.dst_slug, create.edge_type);
  s = txn->GetForUpdate(ro, edges_out_cf_, rocksdb::Slice(out_key), &raw);
  if (s.ok()) {
    *duplicate = true;
    Edge existing;
    Status st = internal::DecodeEdge(create.src_slug, create.dst_slug, create.edge_type, raw,
                                     &existing);
    if (!st.ok()) return st;
    if (opt_.duplicate_edge_policy == DuplicateEdgePolicy::kReject) {
      return Status::DuplicateEdge("edge already exists: " + existing.Identity());
    }
    *out = std::move(existing);
    return Status::OK();
  }
  if (!s.IsNotFound()) return Status::FromRocksDB(s);

  Edge edge;
  edge.src_slug = create.src_slug;
  edge.dst_slug = create.dst_slug;
  edge.edge_type = create.edge_type;
  edge.weight = create.weight;
  edge.props = create.props;
  edge.metadata = create.metadata;
  edge.created_at_us = now_us;
  edge.updated_at_us = now_us;

  s = txn->Put(edges_out_cf_, rocksdb::Slice(out_key), rocksdb::Slice(internal::EncodeEdge(edge)));
  if (!s.ok()) return Status::FromRocksDB(s);
  s = txn->Put(edges_in_cf_,
               rocksdb::Slice(internal::MakeEdgeKey(edge.dst_slug, edge.src_slug, edge.edge_type)),
               rocksdb::Slice());
  if (!s.ok()) return Status::FromRocksDB(s);

  *duplicate = false;
  *out = std::move(edge);
  return Status::OK();
}

Status GraphStore::CreateEdge(const EdgeCreate& create, Edge* out) {
  internal::OpScope scope(opt_, "create_edge", "kgraph.CreateEdge");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  const std::string target =
      create.src_slug + "->" + create.dst_slug + ":" + create.edge_type;
  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kEdgeCreate, target, st);
    return scope.Finish(st);
  };

  Status st = ValidateEdgeCreate(create);
  if (!st.ok()) return fail(st);

  rocksdb::WriteOptions wo;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  Edge edge;
  bool duplicate = false;
  st = ApplyEdgeCreate(txn.get(), create, internal::WallClockMicros(), &edge, &duplicate);
  if (!st.ok()) return fail(st);

  MutationEntry entry;
  entry.op = MutationOp::kEdgeCreate;
  entry.source = opt_.mutation_source;
  entry.target = target;
  if (duplicate) {
    Json::Value payload(Json::objectValue);
    payload["duplicate"] = true;
    entry.payload = internal::ToCompactJson(payload);
  }
  st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  scope.Counter(duplicate ? "duplicate_total" : "created_total");
  if (duplicate) scope.Event("duplicate_ignored");

  if (out) *out = std::move(edge);
  return scope.Finish(Status::OK());
}

Status GraphStore::GetEdge(std::string_view src_slug, std::string_view dst_slug,
                           std::string_view edge_type, Edge* out) const {
  internal::OpScope scope(opt_, "get_edge", "kgraph.GetEdge");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  return scope.Finish(reader.GetEdge(std::string(src_slug), std::string(dst_slug),
                                     std::string(edge_type), out));
}

Status GraphStore::DeleteEdge(std::string_view src_slug, std::string_view dst_slug,
                              std::string_view edge_type) {
  internal::OpScope scope(opt_, "delete_edge", "kgraph.DeleteEdge");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  const std::string src(src_slug);
  const std::string dst(dst_slug);
  const std::string type(edge_type);
  const std::string target = src + "->" + dst + ":" + type;

  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kEdgeDelete, target, st);
    return scope.Finish(st);
  };

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  const std::string out_key = internal::MakeEdgeKey(src, dst, type);
  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, edges_out_cf_, rocksdb::Slice(out_key), &raw);
  if (s.IsNotFound()) return fail(Status::NotFound("edge not found: " + target));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  s = txn->Delete(edges_out_cf_, rocksdb::Slice(out_key));
  if (s.ok()) {
    s = txn->Delete(edges_in_cf_, rocksdb::Slice(internal::MakeEdgeKey(dst, src, type)));
  }
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  MutationEntry entry;
  entry.op = MutationOp::kEdgeDelete;
  entry.source = opt_.mutation_source;
  entry.target = target;
  Status st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);

  return scope.Finish(Status::OK());
}

Status GraphStore::NeighborsOf(std::string_view slug, Direction direction,
                               std::vector<Edge>* out) const {
  internal::OpScope scope(opt_, "neighbors_of", "kgraph.NeighborsOf");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  Status st = EdgesInDirection(reader, std::string(slug), direction, out);
  if (st.ok()) scope.Attr("edges", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

}  // namespace kgraph
