#pragma once

#include <vector>

#include <kgraph/status.hpp>
#include <kgraph/traversal.hpp>
#include <kgraph/types.hpp>

namespace kgraph {

/**
 * Fuses semantic and relational retrieval: turns similarity hits into
 * context items, each carrying its one-hop neighborhood (both directions,
 * every edge type).
 *
 * Items keep the hit's similarity as relevance_score and are ordered by
 * descending relevance, ties by slug. Neighbors are attached as found and not
 * re-ranked. A hit whose node no longer exists in the reader's view is
 * dropped.
 */
class ContextAssembler {
 public:
  explicit ContextAssembler(const GraphReader& reader) : reader_(reader) {}

  Status Assemble(const std::vector<SearchHit>& hits, std::vector<ContextItem>* out) const;

 private:
  const GraphReader& reader_;
};

}  // namespace kgraph
