#include <kgraph/graph_store.hpp>

#include <algorithm>

#include <kgraph/context_assembler.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/op_scope.hpp>
#include <kgraph/similarity_index.hpp>
#include <kgraph/snapshot_reader.hpp>
#include <kgraph/traversal.hpp>

namespace kgraph {

namespace {

Status IndexedSearch(const internal::SimilarityIndex& index, size_t dimension,
                     const std::vector<float>& query, const SearchOptions& options,
                     std::vector<SearchHit>* out) {
  if (options.limit == 0) return Status::Validation("limit must be at least 1");
  Status st = internal::ValidateEmbedding(query, dimension);
  if (!st.ok()) return st;

  const std::string* type_filter = options.node_type ? &*options.node_type : nullptr;
  *out = index.Search(query, options.limit, type_filter);
  return Status::OK();
}

// Embed a query text. A vector the index cannot use counts as an embedder
// failure, not a caller error.
Status EmbedQuery(const Embedder* embedder, size_t dimension, std::string_view text,
                  std::vector<float>* out) {
  if (!embedder) return Status::Validation("no embedder configured");

  EmbeddingResult result = embedder->Embed(text);
  if (!result.success) {
    return Status::EmbeddingFailed(result.error_message.empty() ? "embedder reported failure"
                                                                : result.error_message);
  }
  Status st = internal::ValidateEmbedding(result.embedding, dimension);
  if (!st.ok()) {
    return Status::EmbeddingFailed("embedder returned an unusable vector: " + st.message());
  }
  *out = std::move(result.embedding);
  return Status::OK();
}

}  // namespace

Status GraphStore::Search(const std::vector<float>& query, const SearchOptions& options,
                          std::vector<SearchHit>* out) const {
  internal::OpScope scope(opt_, "search", "kgraph.Search");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  Status st = IndexedSearch(*index_, opt_.embedding_dimension, query, options, out);
  if (st.ok()) scope.Attr("hits", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

Status GraphStore::SearchText(std::string_view text, const SearchOptions& options,
                              std::vector<SearchHit>* out) const {
  internal::OpScope scope(opt_, "search_text", "kgraph.SearchText");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));
  if (options.limit == 0) return scope.Finish(Status::Validation("limit must be at least 1"));

  std::vector<float> query;
  const uint64_t embed_start_us = internal::NowMicros();
  Status st = EmbedQuery(opt_.embedder.get(), opt_.embedding_dimension, text, &query);
  scope.Histogram("embed_us", internal::NowMicros() - embed_start_us);
  if (!st.ok()) return scope.Finish(st);

  st = IndexedSearch(*index_, opt_.embedding_dimension, query, options, out);
  if (st.ok()) scope.Attr("hits", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

Status GraphStore::SearchExact(const std::vector<float>& query, const SearchOptions& options,
                               std::vector<SearchHit>* out) const {
  internal::OpScope scope(opt_, "search_exact", "kgraph.SearchExact");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  Status st = internal::ValidateEmbedding(query, opt_.embedding_dimension);
  if (!st.ok()) return scope.Finish(st);

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  const std::vector<float> unit_query = internal::Normalized(query);

  std::vector<SearchHit> hits;
  uint64_t scanned = 0;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(reader.read_options(), embeddings_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++scanned;
      std::string slug(it->key().data(), it->key().size());

      std::vector<float> embedding;
      if (!internal::DeserializeEmbedding(
              std::string_view(it->value().data(), it->value().size()), &embedding)) {
        return scope.Finish(Status::StoreError("corrupt embedding for " + slug));
      }
      if (embedding.size() != unit_query.size()) continue;

      Node node;
      st = reader.GetNode(slug, &node);
      if (st.IsNotFound()) continue;
      if (!st.ok()) return scope.Finish(st);
      if (options.node_type && node.node_type != *options.node_type) continue;

      SearchHit hit;
      hit.slug = std::move(slug);
      hit.node_type = std::move(node.node_type);
      hit.similarity = internal::Dot(unit_query, internal::Normalized(embedding));
      hits.push_back(std::move(hit));
    }
    if (!it->status().ok()) return scope.Finish(Status::FromRocksDB(it->status()));
  }

  internal::SortHits(&hits);
  if (options.limit != 0 && hits.size() > options.limit) hits.resize(options.limit);

  scope.Histogram("scanned", scanned);
  scope.Attr("hits", static_cast<uint64_t>(hits.size()));
  *out = std::move(hits);
  return scope.Finish(Status::OK());
}

Status GraphStore::Neighbors(std::string_view start, const NeighborQuery& query,
                             std::vector<NeighborResult>* out) const {
  internal::OpScope scope(opt_, "neighbors", "kgraph.Neighbors");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));
  scope.Attr("max_depth", static_cast<uint64_t>(std::max(query.max_depth, 0)));

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  Status st = kgraph::Neighbors(reader, std::string(start), query, opt_.max_traversal_depth, out);
  if (st.ok()) scope.Attr("reached", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

Status GraphStore::ShortestPath(std::string_view src_slug, std::string_view dst_slug,
                                int max_depth, PathResult* out) const {
  internal::OpScope scope(opt_, "shortest_path", "kgraph.ShortestPath");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  Status st = kgraph::ShortestPath(reader, std::string(src_slug), std::string(dst_slug),
                                   max_depth, opt_.path_direction, opt_.max_traversal_depth, out);
  if (st.ok()) scope.Attr("path_length", static_cast<uint64_t>(out->path_length));
  return scope.Finish(st);
}

Status GraphStore::ContextFor(std::string_view task_description, size_t max_nodes,
                              std::vector<ContextItem>* out) const {
  internal::OpScope scope(opt_, "context_for", "kgraph.ContextFor");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));
  if (max_nodes == 0) return scope.Finish(Status::Validation("max_nodes must be at least 1"));

  std::vector<float> query;
  Status st = EmbedQuery(opt_.embedder.get(), opt_.embedding_dimension, task_description, &query);
  if (!st.ok()) return scope.Finish(st);

  SearchOptions search;
  search.limit = max_nodes;
  std::vector<SearchHit> hits;
  st = IndexedSearch(*index_, opt_.embedding_dimension, query, search, &hits);
  if (!st.ok()) return scope.Finish(st);

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  st = ContextAssembler(reader).Assemble(hits, out);
  if (st.ok()) scope.Attr("items", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

Status GraphStore::ContextForVector(const std::vector<float>& query, size_t max_nodes,
                                    std::vector<ContextItem>* out) const {
  internal::OpScope scope(opt_, "context_for_vector", "kgraph.ContextForVector");
  if (!db_) return scope.Finish(Status::Validation("store is closed"));
  if (!out) return scope.Finish(Status::Validation("out is null"));
  if (max_nodes == 0) return scope.Finish(Status::Validation("max_nodes must be at least 1"));

  SearchOptions search;
  search.limit = max_nodes;
  std::vector<SearchHit> hits;
  Status st = IndexedSearch(*index_, opt_.embedding_dimension, query, search, &hits);
  if (!st.ok()) return scope.Finish(st);

  internal::SnapshotGraphReader reader(db_, nodes_cf_, edges_out_cf_, edges_in_cf_);
  st = ContextAssembler(reader).Assemble(hits, out);
  if (st.ok()) scope.Attr("items", static_cast<uint64_t>(out->size()));
  return scope.Finish(st);
}

}  // namespace kgraph
