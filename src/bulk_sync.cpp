#include <kgraph/graph_store.hpp>

#include <rocksdb/utilities/transaction.h>

#include <algorithm>
#include <map>

#include <kgraph/codec.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/logging.hpp>
#include <kgraph/mutation_log.hpp>
#include <kgraph/op_scope.hpp>

namespace kgraph {

Status GraphStore::BulkSync(const BulkSyncRequest& request, BulkSyncResult* out) {
  internal::OpScope scope(opt_, "bulk_sync", "kgraph.BulkSync");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  std::string source = request.source.empty() ? opt_.mutation_source : request.source;
  const std::string target = std::to_string(request.nodes.size()) + " nodes, " +
                             std::to_string(request.edges.size()) + " edges";
  scope.Attr("nodes", static_cast<uint64_t>(request.nodes.size()));
  scope.Attr("edges", static_cast<uint64_t>(request.edges.size()));

  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kBulkSync, target, st, source);
    return scope.Finish(st);
  };

  // Reject the whole batch before touching the store.
  Status source_st = internal::ValidateText("source", source);
  if (!source_st.ok()) {
    source = opt_.mutation_source;
    return fail(source_st);
  }
  std::vector<std::string> slugs;
  for (const auto& upsert : request.nodes) {
    Status st = ValidateNodeUpsert(upsert);
    if (!st.ok()) return fail(st);
    slugs.push_back(upsert.slug);
  }
  for (const auto& create : request.edges) {
    Status st = ValidateEdgeCreate(create);
    if (!st.ok()) return fail(st);
    slugs.push_back(create.src_slug);
    slugs.push_back(create.dst_slug);
  }
  std::sort(slugs.begin(), slugs.end());
  slugs.erase(std::unique(slugs.begin(), slugs.end()), slugs.end());

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  // Take every node lock up front, in lexical order, so two overlapping
  // batches cannot deadlock.
  std::string raw;
  for (const auto& slug : slugs) {
    rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(slug), &raw);
    if (!s.ok() && !s.IsNotFound()) return fail(Status::FromRocksDB(s));
  }

  const uint64_t now_us = internal::WallClockMicros();
  BulkSyncResult result;
  std::map<std::string, Node> upserted;  // last write per slug
  std::vector<std::string> type_changed;

  for (const auto& upsert : request.nodes) {
    Node node;
    bool created = false;
    bool changed = false;
    Status st = ApplyNodeUpsert(txn.get(), upsert, now_us, &node, &created, &changed);
    if (!st.ok()) return fail(st);
    if (created) {
      ++result.nodes_created;
    } else {
      ++result.nodes_updated;
    }
    if (changed) type_changed.push_back(node.slug);
    upserted[node.slug] = std::move(node);
  }

  for (const auto& create : request.edges) {
    Edge edge;
    bool duplicate = false;
    Status st = ApplyEdgeCreate(txn.get(), create, now_us, &edge, &duplicate);
    if (!st.ok()) return fail(st);
    if (duplicate) {
      ++result.edges_skipped;
    } else {
      ++result.edges_created;
    }
  }

  Json::Value payload(Json::objectValue);
  payload["nodes_created"] = static_cast<Json::UInt64>(result.nodes_created);
  payload["nodes_updated"] = static_cast<Json::UInt64>(result.nodes_updated);
  payload["edges_created"] = static_cast<Json::UInt64>(result.edges_created);
  payload["edges_skipped"] = static_cast<Json::UInt64>(result.edges_skipped);

  MutationEntry entry;
  entry.op = MutationOp::kBulkSync;
  entry.source = source;
  entry.target = target;
  entry.payload = internal::ToCompactJson(payload);
  Status st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  for (const auto& slug : type_changed) SyncIndex(slug);

  for (auto& [slug, node] : upserted) {
    Status es = ReadEmbedding(ro, slug, &node.embedding);
    if (!es.ok() && !es.IsNotFound()) {
      KGRAPH_LOG_WARN("embedding read after bulk sync failed",
                      {StringField("slug", slug), StringField("error", es.ToString())});
      continue;
    }
    if (MaybeAutoEmbed(&node, source)) ++result.nodes_embedded;
  }

  KGRAPH_LOG_INFO("bulk sync committed",
                  {StringField("source", source),
                   IntField("nodes_created", static_cast<int64_t>(result.nodes_created)),
                   IntField("nodes_updated", static_cast<int64_t>(result.nodes_updated)),
                   IntField("edges_created", static_cast<int64_t>(result.edges_created)),
                   IntField("edges_skipped", static_cast<int64_t>(result.edges_skipped)),
                   IntField("nodes_embedded", static_cast<int64_t>(result.nodes_embedded))});

  scope.Counter("nodes_created_total", result.nodes_created);
  scope.Counter("edges_created_total", result.edges_created);

  if (out) *out = result;
  return scope.Finish(Status::OK());
}

}  // namespace kgraph
