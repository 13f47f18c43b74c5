#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/statistics.h>
#include <rocksdb/utilities/transaction_db.h>

#include <kgraph/embedder.hpp>
#include <kgraph/observability.hpp>
#include <kgraph/status.hpp>
#include <kgraph/types.hpp>

namespace kgraph {

namespace internal {
class MutationLog;
class SimilarityIndex;
}  // namespace internal

/** What CreateEdge does with an edge triple that already exists. */
enum class DuplicateEdgePolicy {
  kIgnore,  // OK, existing edge returned unchanged (default)
  kReject   // DuplicateEdgeError
};

/** Similarity index backend. */
enum class SimilarityIndexType {
  kHNSW,   // hnswlib - approximate, graph-based (requires KGRAPH_WITH_HNSWLIB)
  kExact   // brute force - exact, O(n) per query
};

/**
 * Options for a kgraph GraphStore.
 *
 * These are layered on top of RocksDB's Options/TransactionDBOptions. The store
 * creates its own column families and uses RocksDB TransactionDB for atomic
 * multi-key mutations.
 */
struct Options {
  // RocksDB performance knobs
  size_t block_cache_bytes = 256ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Transaction behavior. There is no internal retry: a lock wait that runs
  // past this surfaces as StoreError.
  int lock_timeout_ms = 2000;

  // ---------------------------------------------------------------------------
  // Graph rules
  // ---------------------------------------------------------------------------

  // Length of every stored embedding and every query vector.
  size_t embedding_dimension = 1536;

  // Accepted type tags. Default to the canonical taxonomy.
  std::vector<std::string> node_types = CanonicalNodeTypes();
  std::vector<std::string> edge_types = CanonicalEdgeTypes();

  // Accept any tag matching [a-z][a-z0-9_]* in addition to the lists above.
  bool allow_custom_types = false;

  // Allow edges whose endpoints are not (yet) nodes. Traversal skips them.
  bool allow_dangling_edges = false;

  DuplicateEdgePolicy duplicate_edge_policy = DuplicateEdgePolicy::kIgnore;

  // Upper bound on any traversal's max_depth.
  int max_traversal_depth = 5;

  // Direction followed by ShortestPath.
  Direction path_direction = Direction::kOutgoing;

  // ---------------------------------------------------------------------------
  // Embedding
  // ---------------------------------------------------------------------------

  // Optional. Required by SearchText and ContextFor, and for auto-embedding.
  std::shared_ptr<Embedder> embedder;

  // Embed title + " " + description after UpsertNode/BulkSync when the node
  // has no embedding or its auto-computed one is stale.
  bool auto_embed = true;

  // Maximum text bytes to embed (longer texts are truncated)
  size_t embed_max_text_bytes = 8192;

  // ---------------------------------------------------------------------------
  // Similarity index
  // ---------------------------------------------------------------------------

  SimilarityIndexType index_type = SimilarityIndexType::kHNSW;

  // HNSW-specific parameters (when index_type == kHNSW)
  int hnsw_m = 16;                 // Max connections per node
  int hnsw_ef_construction = 200;  // Build-time search depth
  int hnsw_ef_search = 50;         // Query-time search depth

  // Compact once soft-deleted entries exceed this fraction of live entries.
  double index_compact_ratio = 0.5;

  // ---------------------------------------------------------------------------
  // Audit and observability
  // ---------------------------------------------------------------------------

  // Recorded as the mutation log source unless a call supplies its own.
  std::string mutation_source = "engine";

  // If set, GraphStore operations will emit a small number of
  // counters/histograms and attach attributes/events to spans.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/**
 * kgraph::GraphStore
 *
 * A property graph (typed nodes, typed weighted directed edges) with
 * embedding similarity search, multi-hop traversal and context assembly,
 * backed by RocksDB TransactionDB.
 *
 * Every mutation runs in one pessimistic transaction together with its
 * mutation log record. Reads run against a snapshot. Thread-safe.
 */
class GraphStore {
 public:
  ~GraphStore();

  GraphStore(const GraphStore&) = delete;
  GraphStore& operator=(const GraphStore&) = delete;

  /**
   * Open or create a graph store at db_path.
   *
   * Creates the column families kgraph_nodes, kgraph_embeddings,
   * kgraph_edges_out, kgraph_edges_in and kgraph_mutation_log, checks the
   * schema version, and rebuilds the similarity index from stored embeddings.
   */
  static Status Open(const std::string& db_path,
                     std::unique_ptr<GraphStore>* out,
                     const Options& opt = Options{});

  /** Close the store and release RocksDB resources. Safe to call multiple times. */
  void Close();

  // ---------------------------------------------------------------------------
  // Nodes
  // ---------------------------------------------------------------------------

  /**
   * Create the node if absent, otherwise overwrite only the supplied fields.
   * Supplied props/metadata replace the stored map as a whole.
   * @param out Optional: the node as committed (embedding included).
   */
  Status UpsertNode(const NodeUpsert& upsert, Node* out = nullptr);

  Status GetNode(std::string_view slug, Node* out) const;

  /** Store a caller-computed embedding. DimensionMismatch on wrong length. */
  Status SetEmbedding(std::string_view slug, const std::vector<float>& embedding);

  /** Drop the node's embedding; it leaves search results. */
  Status ClearEmbedding(std::string_view slug);

  /** Delete the node and every incident edge in one transaction. */
  Status DeleteNode(std::string_view slug);

  // ---------------------------------------------------------------------------
  // Edges
  // ---------------------------------------------------------------------------

  /** @param out Optional: the stored edge (the existing one for an ignored duplicate). */
  Status CreateEdge(const EdgeCreate& create, Edge* out = nullptr);

  Status GetEdge(std::string_view src_slug, std::string_view dst_slug,
                 std::string_view edge_type, Edge* out) const;

  Status DeleteEdge(std::string_view src_slug, std::string_view dst_slug,
                    std::string_view edge_type);

  /** Direct edge lookup, no traversal. kBoth lists outgoing edges first. */
  Status NeighborsOf(std::string_view slug, Direction direction,
                     std::vector<Edge>* out) const;

  // ---------------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------------

  /** Indexed similarity search. ValidationError for limit == 0. */
  Status Search(const std::vector<float>& query, const SearchOptions& options,
                std::vector<SearchHit>* out) const;

  /** Embed text with the configured embedder, then Search. */
  Status SearchText(std::string_view text, const SearchOptions& options,
                    std::vector<SearchHit>* out) const;

  /** Exhaustive scan of stored embeddings. limit == 0 returns every eligible node. */
  Status SearchExact(const std::vector<float>& query, const SearchOptions& options,
                     std::vector<SearchHit>* out) const;

  Status Neighbors(std::string_view start, const NeighborQuery& query,
                   std::vector<NeighborResult>* out) const;

  Status ShortestPath(std::string_view src_slug, std::string_view dst_slug,
                      int max_depth, PathResult* out) const;

  /** Embed the task, search, and attach one-hop neighborhoods. */
  Status ContextFor(std::string_view task_description, size_t max_nodes,
                    std::vector<ContextItem>* out) const;

  Status ContextForVector(const std::vector<float>& query, size_t max_nodes,
                          std::vector<ContextItem>* out) const;

  // ---------------------------------------------------------------------------
  // Bulk and audit
  // ---------------------------------------------------------------------------

  /** Apply every upsert and edge create in one transaction (all-or-nothing). */
  Status BulkSync(const BulkSyncRequest& request, BulkSyncResult* out = nullptr);

  /** Log entries with seq > after_seq, ascending; limit 0 = no limit. */
  Status ReadMutationLog(uint64_t after_seq, uint64_t limit,
                         std::vector<MutationEntry>* out) const;

  // ---------------------------------------------------------------------------
  // Stats
  // ---------------------------------------------------------------------------

  Status CountNodes(uint64_t* out_count) const;
  Status CountEdges(uint64_t* out_count) const;

  Status ListNodes(std::vector<std::string>* out_slugs,
                   uint64_t limit = 0,
                   std::string_view prefix = {}) const;

  /** Number of vectors currently searchable. */
  size_t IndexedCount() const;

  /** Emit cache and index gauges to the metrics sink. Call periodically.
   *  Metrics emitted:
   *   - kgraph.cache.hit_total / kgraph.cache.miss_total (counter deltas)
   *   - kgraph.cache.usage_bytes, kgraph.cache.capacity_bytes (gauges)
   *   - kgraph.index.live, kgraph.index.deleted (gauges)
   */
  void EmitStoreMetrics();

 private:
  explicit GraphStore(const Options& opt);

  // Validation against Options.
  Status CheckNodeType(std::string_view node_type) const;
  Status CheckEdgeType(std::string_view edge_type) const;
  Status ValidateNodeUpsert(const NodeUpsert& upsert) const;
  Status ValidateEdgeCreate(const EdgeCreate& create) const;

  // Transaction bodies shared by the single-item calls and BulkSync.
  // The caller owns the transaction and commits it.
  Status ApplyNodeUpsert(rocksdb::Transaction* txn, const NodeUpsert& upsert,
                         uint64_t now_us, Node* out, bool* created,
                         bool* type_changed);
  Status ApplyEdgeCreate(rocksdb::Transaction* txn, const EdgeCreate& create,
                         uint64_t now_us, Edge* out, bool* duplicate);

  // Log a failed mutation with its own write. Never fails the caller.
  void RecordFailure(MutationOp op, const std::string& target, const Status& status,
                     const std::string& source = {});

  // Bring the index entry for slug in line with the committed state.
  void SyncIndex(const std::string& slug);
  void MaybeCompactIndex();
  Status RebuildIndex();

  // Auto-embed after a committed upsert. Returns true if a vector was stored.
  // node carries the stored embedding on entry and the new one on success.
  bool MaybeAutoEmbed(Node* node, const std::string& source);

  Status ReadEmbedding(const rocksdb::ReadOptions& ro, const std::string& slug,
                       std::vector<float>* out) const;

  static std::string EmbedText(const Node& node);

  Options opt_;
  std::set<std::string> node_types_;
  std::set<std::string> edge_types_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;

  // Cache and statistics for observability
  std::shared_ptr<rocksdb::Cache> block_cache_;
  std::shared_ptr<rocksdb::Statistics> statistics_;
  uint64_t last_cache_hits_ = 0;
  uint64_t last_cache_misses_ = 0;

  rocksdb::ColumnFamilyHandle* nodes_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* embeddings_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* edges_out_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* edges_in_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* log_cf_ = nullptr;

  std::unique_ptr<internal::MutationLog> log_;
  std::unique_ptr<internal::SimilarityIndex> index_;

  // Serializes "read committed state, apply to index" so that two writers
  // cannot apply their views out of order.
  std::mutex index_sync_mu_;
};

}  // namespace kgraph
