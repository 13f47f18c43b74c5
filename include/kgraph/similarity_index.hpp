#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <kgraph/types.hpp>

namespace kgraph::internal {

/**
 * In-memory nearest-neighbour index over node embeddings, keyed by slug.
 *
 * Vectors are normalized on insert, so similarity is cosine similarity.
 * Search results are ordered by descending similarity, ties broken by
 * ascending slug. Implementations are internally synchronized.
 */
class SimilarityIndex {
 public:
  virtual ~SimilarityIndex() = default;

  // Insert or replace the vector for slug. Returns false on a dimension
  // mismatch or a backend failure.
  virtual bool Upsert(const std::string& slug, const std::string& node_type,
                      const std::vector<float>& embedding) = 0;

  // Returns false if slug was not indexed.
  virtual bool Remove(const std::string& slug) = 0;

  // k == 0 returns every live entry that passes the filter.
  virtual std::vector<SearchHit> Search(const std::vector<float>& query, size_t k,
                                        const std::string* node_type) const = 0;

  virtual bool Contains(const std::string& slug) const = 0;

  // Stats
  virtual size_t Size() const = 0;
  virtual size_t Dimension() const = 0;
  virtual size_t DeletedCount() const = 0;

  // Set search parameters (e.g., ef_search for HNSW)
  virtual void SetSearchParam(const std::string& key, int value) = 0;

  // Rebuild without soft-deleted entries. Returns true on success.
  virtual bool Compact() = 0;

  virtual void Clear() = 0;
};

// Brute-force scan. Exact results; O(n) per query.
std::unique_ptr<SimilarityIndex> CreateExactIndex(size_t dimension);

#ifdef KGRAPH_WITH_HNSWLIB
// Factory function for HNSW index (hnswlib, inner-product space)
// - dimension: embedding dimension
// - max_elements: initial capacity (will grow automatically)
// - m: max connections per node (default 16)
// - ef_construction: build-time search depth (default 200)
std::unique_ptr<SimilarityIndex> CreateHNSWIndex(
    size_t dimension,
    size_t max_elements = 10000,
    int m = 16,
    int ef_construction = 200);
#endif

// Shared ordering for search hits.
void SortHits(std::vector<SearchHit>* hits);

}  // namespace kgraph::internal
