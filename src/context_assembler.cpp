#include <kgraph/context_assembler.hpp>

#include <algorithm>

namespace kgraph {

Status ContextAssembler::Assemble(const std::vector<SearchHit>& hits,
                                  std::vector<ContextItem>* out) const {
  if (!out) return Status::Validation("out is null");
  out->clear();
  out->reserve(hits.size());

  NeighborQuery one_hop;
  one_hop.direction = Direction::kBoth;
  one_hop.max_depth = 1;

  for (const auto& hit : hits) {
    Node node;
    Status st = reader_.GetNode(hit.slug, &node);
    if (st.IsNotFound()) continue;
    if (!st.ok()) return st;

    ContextItem item;
    item.slug = node.slug;
    item.node_type = node.node_type;
    item.title = node.title;
    item.description = node.description;
    item.relevance_score = hit.similarity;

    st = Neighbors(reader_, node.slug, one_hop, one_hop.max_depth, &item.connected_nodes);
    if (st.IsNotFound()) continue;
    if (!st.ok()) return st;

    out->push_back(std::move(item));
  }

  std::stable_sort(out->begin(), out->end(), [](const ContextItem& a, const ContextItem& b) {
    if (a.relevance_score != b.relevance_score) return a.relevance_score > b.relevance_score;
    return a.slug < b.slug;
  });
  return Status::OK();
}

}  // namespace kgraph
