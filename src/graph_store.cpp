#include <kgraph/graph_store.hpp>

#include <rocksdb/advanced_cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <algorithm>
#include <cmath>

#include <kgraph/codec.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/logging.hpp>
#include <kgraph/mutation_log.hpp>
#include <kgraph/op_scope.hpp>
#include <kgraph/similarity_index.hpp>
#include <kgraph/snapshot_reader.hpp>
#include <kgraph/version.hpp>

namespace kgraph {

namespace {

constexpr const char* kNodesCF       = "kgraph_nodes";
constexpr const char* kEmbeddingsCF  = "kgraph_embeddings";
constexpr const char* kEdgesOutCF    = "kgraph_edges_out";
constexpr const char* kEdgesInCF     = "kgraph_edges_in";
constexpr const char* kMutationLogCF = "kgraph_mutation_log";

// Lives in the default column family.
constexpr const char* kSchemaVersionKey = "kgraph.schema_version";

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

// Cut at a UTF-8 boundary at or below max_bytes.
std::string TruncateUtf8(const std::string& text, size_t max_bytes) {
  if (max_bytes == 0 || text.size() <= max_bytes) return text;
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  return text.substr(0, cut);
}

Status ValidateTypeList(const std::vector<std::string>& tags, const char* what) {
  for (const auto& tag : tags) {
    if (!internal::IsValidTypeTag(tag)) {
      return Status::Validation(std::string("invalid ") + what + " tag in Options: '" + tag + "'");
    }
  }
  return Status::OK();
}

}  // namespace

GraphStore::GraphStore(const Options& opt)
    : opt_(opt),
      node_types_(opt.node_types.begin(), opt.node_types.end()),
      edge_types_(opt.edge_types.begin(), opt.edge_types.end()) {}

GraphStore::~GraphStore() { Close(); }

Status GraphStore::Open(const std::string& db_path,
                        std::unique_ptr<GraphStore>* out,
                        const Options& opt) {
  if (!out) return Status::Validation("out is null");

  if (opt.embedding_dimension == 0) {
    return Status::Validation("embedding_dimension must be positive");
  }
  if (opt.max_traversal_depth < 1) {
    return Status::Validation("max_traversal_depth must be at least 1");
  }
  if (!(opt.index_compact_ratio > 0.0)) {
    return Status::Validation("index_compact_ratio must be positive");
  }
  if (opt.embedder && opt.embedder->Dimension() != opt.embedding_dimension) {
    return Status::DimensionMismatch(
        "embedder produces " + std::to_string(opt.embedder->Dimension()) +
        " dimensions but embedding_dimension is " + std::to_string(opt.embedding_dimension));
  }
  Status vs = ValidateTypeList(opt.node_types, "node type");
  if (!vs.ok()) return vs;
  vs = internal::ValidateText("mutation_source", opt.mutation_source);
  if (!vs.ok()) return vs;
  vs = ValidateTypeList(opt.edge_types, "edge type");
  if (!vs.ok()) return vs;

#ifndef KGRAPH_WITH_HNSWLIB
  // HNSW requested but not compiled in
  if (opt.index_type == SimilarityIndexType::kHNSW) {
    return Status::Validation(
        "HNSW index not enabled. Rebuild with KGRAPH_WITH_HNSWLIB=ON or use "
        "SimilarityIndexType::kExact");
  }
#endif

  auto store = std::unique_ptr<GraphStore>(new GraphStore(opt));

  // RocksDB options
  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  // Enable statistics for cache observability
  auto statistics = rocksdb::CreateDBStatistics();
  options.statistics = statistics;

  rocksdb::TransactionDBOptions txn_opts;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;
  store->statistics_ = statistics;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kNodesCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kEmbeddingsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kEdgesOutCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kEdgesInCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kMutationLogCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    KGRAPH_LOG_ERROR("failed to open graph store",
                     {StringField("path", db_path), StringField("error", s.ToString())});
    return Status::FromRocksDB(s);
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->nodes_cf_      = store->handles_[1];
  store->embeddings_cf_ = store->handles_[2];
  store->edges_out_cf_  = store->handles_[3];
  store->edges_in_cf_   = store->handles_[4];
  store->log_cf_        = store->handles_[5];

  // Schema version
  {
    const std::string expected = std::to_string(KGRAPH_SCHEMA_VERSION);
    std::string version;
    s = db->Get(rocksdb::ReadOptions(), store->handles_[0],
                rocksdb::Slice(kSchemaVersionKey), &version);
    if (s.IsNotFound()) {
      s = db->Put(rocksdb::WriteOptions(), store->handles_[0],
                  rocksdb::Slice(kSchemaVersionKey), rocksdb::Slice(expected));
      if (!s.ok()) {
        store->Close();
        return Status::FromRocksDB(s);
      }
    } else if (!s.ok()) {
      store->Close();
      return Status::FromRocksDB(s);
    } else if (version != expected) {
      store->Close();
      return Status::StoreError("unsupported schema version " + version + " (expected " +
                                expected + ")");
    }
  }

  store->log_ = std::make_unique<internal::MutationLog>(db, store->log_cf_);
  Status st = store->log_->Init();
  if (!st.ok()) {
    store->Close();
    return st;
  }

#ifdef KGRAPH_WITH_HNSWLIB
  if (opt.index_type == SimilarityIndexType::kHNSW) {
    store->index_ = internal::CreateHNSWIndex(
        opt.embedding_dimension,
        10000,  // Initial max elements (will grow as needed)
        opt.hnsw_m,
        opt.hnsw_ef_construction);
    store->index_->SetSearchParam("ef_search", opt.hnsw_ef_search);
  }
#endif
  if (!store->index_) {
    store->index_ = internal::CreateExactIndex(opt.embedding_dimension);
  }

  st = store->RebuildIndex();
  if (!st.ok()) {
    store->Close();
    return st;
  }

  KGRAPH_LOG_INFO("graph store opened",
                  {StringField("path", db_path),
                   IntField("schema_version", KGRAPH_SCHEMA_VERSION),
                   IntField("last_seq", static_cast<int64_t>(store->log_->LastSeq())),
                   IntField("indexed", static_cast<int64_t>(store->index_->Size()))});

  *out = std::move(store);
  return Status::OK();
}

void GraphStore::Close() {
  if (!db_) return;

  index_.reset();
  log_.reset();

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  nodes_cf_ = embeddings_cf_ = edges_out_cf_ = edges_in_cf_ = log_cf_ = nullptr;

  KGRAPH_LOG_DEBUG("graph store closed");
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Status GraphStore::CheckNodeType(std::string_view node_type) const {
  if (node_type.empty()) return Status::Validation("node_type is empty");
  if (node_types_.count(std::string(node_type))) return Status::OK();
  if (opt_.allow_custom_types && internal::IsValidTypeTag(node_type)) return Status::OK();
  return Status::Validation("unknown node type: " + std::string(node_type));
}

Status GraphStore::CheckEdgeType(std::string_view edge_type) const {
  if (edge_type.empty()) return Status::Validation("edge_type is empty");
  if (edge_types_.count(std::string(edge_type))) return Status::OK();
  if (opt_.allow_custom_types && internal::IsValidTypeTag(edge_type)) return Status::OK();
  return Status::Validation("unknown edge type: " + std::string(edge_type));
}

Status GraphStore::ValidateNodeUpsert(const NodeUpsert& upsert) const {
  Status st = internal::ValidateSlug(upsert.slug);
  if (!st.ok()) return st;
  if (upsert.node_type) {
    st = CheckNodeType(*upsert.node_type);
    if (!st.ok()) return st;
  }
  if (upsert.title) {
    st = internal::ValidateText("title", *upsert.title);
    if (!st.ok()) return st;
  }
  if (upsert.description) {
    st = internal::ValidateText("description", *upsert.description);
    if (!st.ok()) return st;
  }
  if (upsert.props) {
    st = internal::ValidatePropMap("props", *upsert.props);
    if (!st.ok()) return st;
  }
  if (upsert.metadata) return internal::ValidatePropMap("metadata", *upsert.metadata);
  return Status::OK();
}

// ---------------------------------------------------------------------------
// Shared write-path helpers
// ---------------------------------------------------------------------------

void GraphStore::RecordFailure(MutationOp op, const std::string& target,
                               const Status& status, const std::string& source) {
  if (status.IsStoreError()) {
    KGRAPH_LOG_ERROR("mutation failed",
                     {StringField("op", MutationOpName(op)), StringField("target", target),
                      StringField("error", status.ToString())});
  } else {
    KGRAPH_LOG_DEBUG("mutation rejected",
                     {StringField("op", MutationOpName(op)), StringField("target", target),
                      StringField("error", status.ToString())});
  }

  if (!log_) return;

  MutationEntry entry;
  entry.op = op;
  entry.source = source.empty() ? opt_.mutation_source : source;
  entry.target = internal::EscapeInvalidUtf8(target);
  entry.success = false;
  entry.error = internal::EscapeInvalidUtf8(status.ToString());

  Status st = log_->Append(&entry);
  if (!st.ok()) {
    KGRAPH_LOG_ERROR("mutation log append failed",
                     {StringField("op", MutationOpName(op)), StringField("target", target),
                      StringField("error", st.ToString())});
  }
}

Status GraphStore::ReadEmbedding(const rocksdb::ReadOptions& ro, const std::string& slug,
                                 std::vector<float>* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(ro, embeddings_cf_, rocksdb::Slice(slug), &raw);
  if (s.IsNotFound()) return Status::NotFound("no embedding for " + slug);
  if (!s.ok()) return Status::FromRocksDB(s);
  if (!internal::DeserializeEmbedding(raw, out)) {
    return Status::StoreError("corrupt embedding for " + slug);
  }
  return Status::OK();
}

std::string GraphStore::EmbedText(const Node& node) {
  if (node.title.empty() && node.description.empty()) return {};
  return node.title + " " + node.description;
}

Status GraphStore::ApplyNodeUpsert(rocksdb::Transaction* txn, const NodeUpsert& upsert,
                                   uint64_t now_us, Node* out, bool* created,
                                   bool* type_changed) {
  rocksdb::ReadOptions ro;
  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(upsert.slug), &raw);

  Node node;
  if (s.ok()) {
    Status st = internal::DecodeNode(upsert.slug, raw, &node);
    if (!st.ok()) return st;
    *created = false;
  } else if (s.IsNotFound()) {
    if (!upsert.node_type) {
      return Status::Validation("node_type is required to create node " + upsert.slug);
    }
    node.slug = upsert.slug;
    node.created_at_us = now_us;
    *created = true;
  } else {
    return Status::FromRocksDB(s);
  }

  const std::string old_type = node.node_type;
  if (upsert.node_type) node.node_type = *upsert.node_type;
  if (upsert.title) node.title = *upsert.title;
  if (upsert.description) node.description = *upsert.description;
  if (upsert.props) node.props = *upsert.props;
  if (upsert.metadata) node.metadata = *upsert.metadata;
  node.updated_at_us = now_us;
  *type_changed = !*created && old_type != node.node_type;

  s = txn->Put(nodes_cf_, rocksdb::Slice(node.slug), rocksdb::Slice(internal::EncodeNode(node)));
  if (!s.ok()) return Status::FromRocksDB(s);

  *out = std::move(node);
  return Status::OK();
}

// ---------------------------------------------------------------------------
// Similarity index maintenance
// ---------------------------------------------------------------------------

Status GraphStore::RebuildIndex() {
  const uint64_t start_us = internal::NowMicros();
  index_->Clear();

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(reader.read_options(), embeddings_cf_));

  uint64_t loaded = 0;
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    std::string slug(it->key().data(), it->key().size());

    std::vector<float> embedding;
    if (!internal::DeserializeEmbedding(
            std::string_view(it->value().data(), it->value().size()), &embedding)) {
      return Status::StoreError("corrupt embedding for " + slug);
    }
    if (embedding.size() != opt_.embedding_dimension) {
      return Status::DimensionMismatch(
          "stored embedding for " + slug + " has " + std::to_string(embedding.size()) +
          " dimensions, store opened with embedding_dimension " +
          std::to_string(opt_.embedding_dimension));
    }

    Node node;
    Status st = reader.GetNode(slug, &node);
    if (st.IsNotFound()) {
      KGRAPH_LOG_WARN("embedding without node skipped", {StringField("slug", slug)});
      continue;
    }
    if (!st.ok()) return st;

    if (!index_->Upsert(slug, node.node_type, embedding)) {
      return Status::StoreError("similarity index rejected embedding for " + slug);
    }
    ++loaded;
  }
  if (!it->status().ok()) return Status::FromRocksDB(it->status());

  KGRAPH_LOG_INFO("similarity index rebuilt",
                  {IntField("vectors", static_cast<int64_t>(loaded)),
                   StringField("backend",
                               opt_.index_type == SimilarityIndexType::kHNSW ? "hnsw" : "exact"),
                   IntField("elapsed_us", static_cast<int64_t>(internal::NowMicros() - start_us))});
  return Status::OK();
}

void GraphStore::SyncIndex(const std::string& slug) {
  std::lock_guard<std::mutex> lock(index_sync_mu_);
  if (!index_) return;

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);

  Node node;
  Status st = reader.GetNode(slug, &node);
  if (st.IsNotFound()) {
    index_->Remove(slug);
    MaybeCompactIndex();
    return;
  }
  if (!st.ok()) {
    KGRAPH_LOG_ERROR("similarity index sync failed",
                     {StringField("slug", slug), StringField("error", st.ToString())});
    return;
  }

  std::vector<float> embedding;
  st = ReadEmbedding(reader.read_options(), slug, &embedding);
  if (st.IsNotFound()) {
    index_->Remove(slug);
    MaybeCompactIndex();
    return;
  }
  if (!st.ok()) {
    KGRAPH_LOG_ERROR("similarity index sync failed",
                     {StringField("slug", slug), StringField("error", st.ToString())});
    return;
  }

  if (!index_->Upsert(slug, node.node_type, embedding)) {
    KGRAPH_LOG_ERROR("similarity index rejected embedding", {StringField("slug", slug)});
  }
  MaybeCompactIndex();
}

void GraphStore::MaybeCompactIndex() {
  const size_t deleted = index_->DeletedCount();
  if (deleted == 0) return;

  const size_t live = std::max<size_t>(index_->Size(), 1);
  if (static_cast<double>(deleted) <= opt_.index_compact_ratio * static_cast<double>(live)) {
    return;
  }

  const uint64_t start_us = internal::NowMicros();
  if (index_->Compact()) {
    const uint64_t dur_us = internal::NowMicros() - start_us;
    if (opt_.metrics) opt_.metrics->Histogram("kgraph.index.compact_us", dur_us);
    KGRAPH_LOG_INFO("similarity index compacted",
                    {IntField("removed", static_cast<int64_t>(deleted)),
                     IntField("live", static_cast<int64_t>(index_->Size())),
                     IntField("elapsed_us", static_cast<int64_t>(dur_us))});
  } else {
    KGRAPH_LOG_ERROR("similarity index compaction failed",
                     {IntField("deleted", static_cast<int64_t>(deleted))});
  }
}

// ---------------------------------------------------------------------------
// Auto-embedding
// ---------------------------------------------------------------------------

bool GraphStore::MaybeAutoEmbed(Node* node, const std::string& source) {
  if (!opt_.embedder || !opt_.auto_embed) return false;

  const std::string text = EmbedText(*node);
  if (text.empty()) return false;
  const std::string digest = internal::Sha256::Hex(text);

  // Caller-supplied vectors (no digest) and up-to-date ones are left alone.
  if (node->HasEmbedding() &&
      (node->embedded_text_digest.empty() || node->embedded_text_digest == digest)) {
    return false;
  }

  const uint64_t embed_start_us = internal::NowMicros();
  EmbeddingResult result = opt_.embedder->Embed(TruncateUtf8(text, opt_.embed_max_text_bytes));
  if (opt_.metrics) {
    opt_.metrics->Histogram("kgraph.auto_embed.embed_us", internal::NowMicros() - embed_start_us);
  }

  Status st;
  if (!result.success) {
    st = Status::EmbeddingFailed(result.error_message.empty() ? "embedder reported failure"
                                                              : result.error_message);
  } else {
    Status vs = internal::ValidateEmbedding(result.embedding, opt_.embedding_dimension);
    if (!vs.ok()) st = Status::EmbeddingFailed("embedder returned an unusable vector: " + vs.message());
  }
  if (!st.ok()) {
    if (opt_.metrics) opt_.metrics->Counter("kgraph.auto_embed.failed_total", 1);
    KGRAPH_LOG_WARN("auto-embed failed",
                    {StringField("slug", node->slug), StringField("error", st.message())});
    RecordFailure(MutationOp::kNodeEmbed, node->slug, st, source);
    return false;
  }

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) {
    RecordFailure(MutationOp::kNodeEmbed, node->slug,
                  Status::StoreError("BeginTransaction returned null"), source);
    return false;
  }

  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(node->slug), &raw);
  if (s.IsNotFound()) return false;  // deleted since the upsert committed
  if (!s.ok()) {
    txn.reset();
    RecordFailure(MutationOp::kNodeEmbed, node->slug, Status::FromRocksDB(s), source);
    return false;
  }

  Node current;
  st = internal::DecodeNode(node->slug, raw, &current);
  if (st.ok() && internal::Sha256::Hex(EmbedText(current)) != digest) {
    // A newer upsert changed the text; its own auto-embed will follow.
    return false;
  }

  const uint64_t now_us = internal::WallClockMicros();
  if (st.ok()) {
    current.embedded_text_digest = digest;
    current.updated_at_us = now_us;
    s = txn->Put(nodes_cf_, rocksdb::Slice(current.slug),
                 rocksdb::Slice(internal::EncodeNode(current)));
    if (s.ok()) {
      s = txn->Put(embeddings_cf_, rocksdb::Slice(current.slug),
                   rocksdb::Slice(internal::SerializeEmbedding(result.embedding)));
    }
    if (!s.ok()) st = Status::FromRocksDB(s);
  }

  if (st.ok()) {
    Json::Value payload(Json::objectValue);
    payload["auto"] = true;
    payload["dimension"] = static_cast<Json::UInt64>(result.embedding.size());

    MutationEntry entry;
    entry.op = MutationOp::kNodeEmbed;
    entry.source = source.empty() ? opt_.mutation_source : source;
    entry.target = current.slug;
    entry.payload = internal::ToCompactJson(payload);
    st = log_->CommitWith(txn.get(), &entry);
  }

  if (!st.ok()) {
    txn.reset();
    RecordFailure(MutationOp::kNodeEmbed, node->slug, st, source);
    return false;
  }

  SyncIndex(current.slug);
  if (opt_.metrics) opt_.metrics->Counter("kgraph.auto_embed.ok_total", 1);

  node->embedding = std::move(result.embedding);
  node->embedded_text_digest = digest;
  node->updated_at_us = now_us;
  return true;
}

// ---------------------------------------------------------------------------
// Node operations
// ---------------------------------------------------------------------------

Status GraphStore::UpsertNode(const NodeUpsert& upsert, Node* out) {
  internal::OpScope scope(opt_, "upsert_node", "kgraph.UpsertNode");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  scope.Attr("slug_bytes", static_cast<uint64_t>(upsert.slug.size()));

  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kNodeUpsert, upsert.slug, st);
    return scope.Finish(st);
  };

  Status st = ValidateNodeUpsert(upsert);
  if (!st.ok()) return fail(st);

  rocksdb::WriteOptions wo;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  Node node;
  bool created = false;
  bool type_changed = false;
  st = ApplyNodeUpsert(txn.get(), upsert, internal::WallClockMicros(), &node, &created,
                       &type_changed);
  if (!st.ok()) return fail(st);

  Json::Value payload(Json::objectValue);
  payload["created"] = created;
  if (type_changed) payload["type_changed"] = true;

  MutationEntry entry;
  entry.op = MutationOp::kNodeUpsert;
  entry.source = opt_.mutation_source;
  entry.target = node.slug;
  entry.payload = internal::ToCompactJson(payload);
  st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  scope.Counter(created ? "created_total" : "updated_total");
  scope.Attr("created", static_cast<uint64_t>(created ? 1 : 0));

  if (type_changed) SyncIndex(node.slug);

  rocksdb::ReadOptions ro;
  Status es = ReadEmbedding(ro, node.slug, &node.embedding);
  if (!es.ok() && !es.IsNotFound()) {
    KGRAPH_LOG_WARN("embedding read after upsert failed",
                    {StringField("slug", node.slug), StringField("error", es.ToString())});
  }

  if (MaybeAutoEmbed(&node, opt_.mutation_source)) scope.Event("auto_embed");

  if (out) *out = std::move(node);
  return scope.Finish(Status::OK());
}

Status GraphStore::GetNode(std::string_view slug, Node* out) const {
  internal::OpScope scope(opt_, "get_node", "kgraph.GetNode");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  const std::string key(slug);
  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);

  Node node;
  Status st = reader.GetNode(key, &node);
  if (!st.ok()) return scope.Finish(st);

  st = ReadEmbedding(reader.read_options(), key, &node.embedding);
  if (!st.ok() && !st.IsNotFound()) return scope.Finish(st);

  *out = std::move(node);
  return scope.Finish(Status::OK());
}

Status GraphStore::SetEmbedding(std::string_view slug, const std::vector<float>& embedding) {
  internal::OpScope scope(opt_, "set_embedding", "kgraph.SetEmbedding");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  const std::string key(slug);
  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kNodeEmbed, key, st);
    return scope.Finish(st);
  };

  Status st = internal::ValidateSlug(key);
  if (!st.ok()) return fail(st);
  st = internal::ValidateEmbedding(embedding, opt_.embedding_dimension);
  if (!st.ok()) return fail(st);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(key), &raw);
  if (s.IsNotFound()) return fail(Status::NotFound("node not found: " + key));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  Node node;
  st = internal::DecodeNode(key, raw, &node);
  if (!st.ok()) return fail(st);

  // A caller-supplied vector is never replaced by auto-embedding.
  node.embedded_text_digest.clear();
  node.updated_at_us = internal::WallClockMicros();

  s = txn->Put(nodes_cf_, rocksdb::Slice(key), rocksdb::Slice(internal::EncodeNode(node)));
  if (!s.ok()) return fail(Status::FromRocksDB(s));
  s = txn->Put(embeddings_cf_, rocksdb::Slice(key),
               rocksdb::Slice(internal::SerializeEmbedding(embedding)));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  Json::Value payload(Json::objectValue);
  payload["auto"] = false;
  payload["dimension"] = static_cast<Json::UInt64>(embedding.size());

  MutationEntry entry;
  entry.op = MutationOp::kNodeEmbed;
  entry.source = opt_.mutation_source;
  entry.target = key;
  entry.payload = internal::ToCompactJson(payload);
  st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  SyncIndex(key);
  return scope.Finish(Status::OK());
}

Status GraphStore::ClearEmbedding(std::string_view slug) {
  internal::OpScope scope(opt_, "clear_embedding", "kgraph.ClearEmbedding");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  const std::string key(slug);
  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kNodeEmbed, key, st);
    return scope.Finish(st);
  };

  Status st = internal::ValidateSlug(key);
  if (!st.ok()) return fail(st);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(key), &raw);
  if (s.IsNotFound()) return fail(Status::NotFound("node not found: " + key));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  Node node;
  st = internal::DecodeNode(key, raw, &node);
  if (!st.ok()) return fail(st);

  std::string existing;
  s = txn->GetForUpdate(ro, embeddings_cf_, rocksdb::Slice(key), &existing);
  const bool had_embedding = s.ok();
  if (!s.ok() && !s.IsNotFound()) return fail(Status::FromRocksDB(s));

  node.embedded_text_digest.clear();
  node.updated_at_us = internal::WallClockMicros();
  s = txn->Put(nodes_cf_, rocksdb::Slice(key), rocksdb::Slice(internal::EncodeNode(node)));
  if (!s.ok()) return fail(Status::FromRocksDB(s));
  if (had_embedding) {
    s = txn->Delete(embeddings_cf_, rocksdb::Slice(key));
    if (!s.ok()) return fail(Status::FromRocksDB(s));
  }

  Json::Value payload(Json::objectValue);
  payload["cleared"] = had_embedding;

  MutationEntry entry;
  entry.op = MutationOp::kNodeEmbed;
  entry.source = opt_.mutation_source;
  entry.target = key;
  entry.payload = internal::ToCompactJson(payload);
  st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  SyncIndex(key);
  return scope.Finish(Status::OK());
}

Status GraphStore::DeleteNode(std::string_view slug) {
  internal::OpScope scope(opt_, "delete_node", "kgraph.DeleteNode");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));

  const std::string key(slug);
  std::unique_ptr<rocksdb::Transaction> txn;
  auto fail = [&](const Status& st) -> Status {
    txn.reset();
    RecordFailure(MutationOp::kNodeDelete, key, st);
    return scope.Finish(st);
  };

  Status st = internal::ValidateSlug(key);
  if (!st.ok()) return fail(st);

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  txn.reset(db_->BeginTransaction(wo, to));
  if (!txn) return fail(Status::StoreError("BeginTransaction returned null"));

  // Holding the node lock keeps CreateEdge from adding incident edges.
  std::string raw;
  rocksdb::Status s = txn->GetForUpdate(ro, nodes_cf_, rocksdb::Slice(key), &raw);
  if (s.IsNotFound()) return fail(Status::NotFound("node not found: " + key));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  const std::string prefix = internal::EdgeKeyPrefix(key);
  rocksdb::Slice prefix_slice(prefix);

  // (out key, in key) pairs; collected first, deleted after the scans.
  std::vector<std::pair<std::string, std::string>> doomed;
  {
    std::unique_ptr<rocksdb::Iterator> it(txn->GetIterator(ro, edges_out_cf_));
    for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
      if (!it->key().starts_with(prefix_slice)) break;
      std::string src, dst, type;
      if (!internal::ParseEdgeKey(std::string_view(it->key().data(), it->key().size()),
                                  &src, &dst, &type)) {
        return fail(Status::StoreError("malformed edge key in kgraph_edges_out"));
      }
      doomed.emplace_back(internal::MakeEdgeKey(src, dst, type),
                          internal::MakeEdgeKey(dst, src, type));
    }
    if (!it->status().ok()) return fail(Status::FromRocksDB(it->status()));
  }
  {
    std::unique_ptr<rocksdb::Iterator> it(txn->GetIterator(ro, edges_in_cf_));
    for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
      if (!it->key().starts_with(prefix_slice)) break;
      std::string dst, src, type;
      if (!internal::ParseEdgeKey(std::string_view(it->key().data(), it->key().size()),
                                  &dst, &src, &type)) {
        return fail(Status::StoreError("malformed edge key in kgraph_edges_in"));
      }
      doomed.emplace_back(internal::MakeEdgeKey(src, dst, type),
                          internal::MakeEdgeKey(dst, src, type));
    }
    if (!it->status().ok()) return fail(Status::FromRocksDB(it->status()));
  }

  std::sort(doomed.begin(), doomed.end());
  doomed.erase(std::unique(doomed.begin(), doomed.end()), doomed.end());

  for (const auto& [out_key, in_key] : doomed) {
    s = txn->Delete(edges_out_cf_, rocksdb::Slice(out_key));
    if (s.ok()) s = txn->Delete(edges_in_cf_, rocksdb::Slice(in_key));
    if (!s.ok()) return fail(Status::FromRocksDB(s));
  }

  s = txn->Delete(embeddings_cf_, rocksdb::Slice(key));
  if (s.ok()) s = txn->Delete(nodes_cf_, rocksdb::Slice(key));
  if (!s.ok()) return fail(Status::FromRocksDB(s));

  Json::Value payload(Json::objectValue);
  payload["edges_removed"] = static_cast<Json::UInt64>(doomed.size());

  MutationEntry entry;
  entry.op = MutationOp::kNodeDelete;
  entry.source = opt_.mutation_source;
  entry.target = key;
  entry.payload = internal::ToCompactJson(payload);
  st = log_->CommitWith(txn.get(), &entry);
  if (!st.ok()) return fail(st);
  txn.reset();

  scope.Attr("edges_removed", static_cast<uint64_t>(doomed.size()));
  scope.Histogram("edges_removed", doomed.size());

  SyncIndex(key);
  return scope.Finish(Status::OK());
}

// ---------------------------------------------------------------------------
// Audit and stats
// ---------------------------------------------------------------------------

Status GraphStore::ReadMutationLog(uint64_t after_seq, uint64_t limit,
                                   std::vector<MutationEntry>* out) const {
  if (!db_) return Status::Validation("store is closed");
  if (!out) return Status::Validation("out is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  Status st = log_->Scan(after_seq, limit, snapshot, out);
  db_->ReleaseSnapshot(snapshot);
  return st;
}

Status GraphStore::CountNodes(uint64_t* out_count) const {
  if (!db_) return Status::Validation("store is closed");
  if (!out_count) return Status::Validation("out_count is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  uint64_t count = 0;
  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, nodes_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return Status::FromRocksDB(iter_status);

  *out_count = count;
  return Status::OK();
}

Status GraphStore::CountEdges(uint64_t* out_count) const {
  if (!db_) return Status::Validation("store is closed");
  if (!out_count) return Status::Validation("out_count is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  uint64_t count = 0;
  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, edges_out_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return Status::FromRocksDB(iter_status);

  *out_count = count;
  return Status::OK();
}

Status GraphStore::ListNodes(std::vector<std::string>* out_slugs,
                             uint64_t limit,
                             std::string_view prefix) const {
  if (!db_) return Status::Validation("store is closed");
  if (!out_slugs) return Status::Validation("out_slugs is null");

  out_slugs->clear();

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Slice prefix_slice(prefix.data(), prefix.size());

  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, nodes_cf_));
    if (prefix.empty()) {
      it->SeekToFirst();
    } else {
      it->Seek(prefix_slice);
    }

    for (; it->Valid(); it->Next()) {
      if (!prefix.empty() && !it->key().starts_with(prefix_slice)) break;
      out_slugs->emplace_back(it->key().data(), it->key().size());
      if (limit != 0 && out_slugs->size() >= limit) break;
    }

    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return Status::FromRocksDB(iter_status);

  return Status::OK();
}

size_t GraphStore::IndexedCount() const {
  return index_ ? index_->Size() : 0;
}

void GraphStore::EmitStoreMetrics() {
  if (!opt_.metrics || !db_) return;

  if (block_cache_) {
    opt_.metrics->Gauge("kgraph.cache.usage_bytes", static_cast<double>(block_cache_->GetUsage()));
    opt_.metrics->Gauge("kgraph.cache.capacity_bytes",
                        static_cast<double>(block_cache_->GetCapacity()));
  }

  // Block cache hit/miss from RocksDB statistics, as deltas since last call
  if (statistics_) {
    uint64_t hits = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_HIT);
    uint64_t misses = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_MISS);
    if (hits >= last_cache_hits_) {
      opt_.metrics->Counter("kgraph.cache.hit_total", hits - last_cache_hits_);
    }
    if (misses >= last_cache_misses_) {
      opt_.metrics->Counter("kgraph.cache.miss_total", misses - last_cache_misses_);
    }
    last_cache_hits_ = hits;
    last_cache_misses_ = misses;
  }

  if (index_) {
    opt_.metrics->Gauge("kgraph.index.live", static_cast<double>(index_->Size()));
    opt_.metrics->Gauge("kgraph.index.deleted", static_cast<double>(index_->DeletedCount()));
  }
}

}  // namespace kgraph
