#include <kgraph/traversal.hpp>

#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace kgraph {

namespace {

Status CheckDepth(int max_depth, int depth_limit) {
  if (max_depth < 1) {
    return Status::Validation("max_depth must be at least 1");
  }
  if (max_depth > depth_limit) {
    return Status::DepthLimitExceeded("max_depth " + std::to_string(max_depth) +
                                      " exceeds the limit of " +
                                      std::to_string(depth_limit));
  }
  return Status::OK();
}

const std::string& OtherEnd(const Edge& e, const std::string& current) {
  return e.src_slug == current ? e.dst_slug : e.src_slug;
}

}  // namespace

Status EdgesInDirection(const GraphReader& reader, const std::string& slug,
                        Direction direction, std::vector<Edge>* out) {
  if (!out) return Status::Validation("out is null");
  out->clear();

  if (direction == Direction::kOutgoing || direction == Direction::kBoth) {
    Status st = reader.OutgoingEdges(slug, out);
    if (!st.ok()) return st;
  }
  if (direction == Direction::kIncoming || direction == Direction::kBoth) {
    std::vector<Edge> incoming;
    Status st = reader.IncomingEdges(slug, &incoming);
    if (!st.ok()) return st;
    out->insert(out->end(), std::make_move_iterator(incoming.begin()),
                std::make_move_iterator(incoming.end()));
  }
  return Status::OK();
}

Status Neighbors(const GraphReader& reader, const std::string& start,
                 const NeighborQuery& query, int depth_limit,
                 std::vector<NeighborResult>* out) {
  if (!out) return Status::Validation("out is null");
  out->clear();

  Status st = CheckDepth(query.max_depth, depth_limit);
  if (!st.ok()) return st;

  Node node;
  st = reader.GetNode(start, &node);
  if (!st.ok()) return st;

  std::unordered_set<std::string> visited{start};
  std::vector<std::string> frontier{start};
  std::vector<Edge> edges;

  for (int depth = 1; depth <= query.max_depth && !frontier.empty(); ++depth) {
    std::vector<std::string> next;

    for (const auto& current : frontier) {
      st = EdgesInDirection(reader, current, query.direction, &edges);
      if (!st.ok()) return st;

      for (const auto& e : edges) {
        if (query.edge_type && e.edge_type != *query.edge_type) continue;

        const std::string& other = OtherEnd(e, current);
        if (!visited.insert(other).second) continue;

        // Dangling endpoints are skipped but stay visited.
        st = reader.GetNode(other, &node);
        if (st.IsNotFound()) continue;
        if (!st.ok()) return st;

        NeighborResult r;
        r.slug = other;
        r.node_type = node.node_type;
        r.title = node.title;
        r.matched_edge_type = e.edge_type;
        r.hop_distance = depth;
        out->push_back(std::move(r));
        next.push_back(other);
      }
    }

    frontier = std::move(next);
  }

  std::sort(out->begin(), out->end(), [](const NeighborResult& a, const NeighborResult& b) {
    if (a.hop_distance != b.hop_distance) return a.hop_distance < b.hop_distance;
    return a.slug < b.slug;
  });
  return Status::OK();
}

Status ShortestPath(const GraphReader& reader, const std::string& src,
                    const std::string& dst, int max_depth, Direction direction,
                    int depth_limit, PathResult* out) {
  if (!out) return Status::Validation("out is null");
  *out = PathResult{};

  Status st = CheckDepth(max_depth, depth_limit);
  if (!st.ok()) return st;

  Node node;
  st = reader.GetNode(src, &node);
  if (!st.ok()) return st;
  st = reader.GetNode(dst, &node);
  if (!st.ok()) return st;

  if (src == dst) {
    out->path_nodes.push_back(src);
    return Status::OK();
  }

  // parent[slug] = (previous slug, edge used to reach slug)
  std::unordered_map<std::string, std::pair<std::string, Edge>> parent;
  std::unordered_set<std::string> visited{src};
  std::vector<std::string> frontier{src};
  std::vector<Edge> edges;
  bool found = false;

  for (int depth = 1; depth <= max_depth && !frontier.empty() && !found; ++depth) {
    std::vector<std::string> next;

    for (const auto& current : frontier) {
      st = EdgesInDirection(reader, current, direction, &edges);
      if (!st.ok()) return st;

      for (const auto& e : edges) {
        const std::string& other = OtherEnd(e, current);
        if (!visited.insert(other).second) continue;

        if (other != dst) {
          st = reader.GetNode(other, &node);
          if (st.IsNotFound()) continue;
          if (!st.ok()) return st;
        }

        parent.emplace(other, std::make_pair(current, e));
        if (other == dst) {
          found = true;
          break;
        }
        next.push_back(other);
      }
      if (found) break;
    }

    frontier = std::move(next);
  }

  if (!found) {
    return Status::NotFound("no path from " + src + " to " + dst + " within " +
                            std::to_string(max_depth) + " hops");
  }

  for (std::string at = dst; at != src;) {
    const auto& step = parent.at(at);
    out->path_nodes.push_back(at);
    out->path_edges.push_back(step.second);
    at = step.first;
  }
  out->path_nodes.push_back(src);
  std::reverse(out->path_nodes.begin(), out->path_nodes.end());
  std::reverse(out->path_edges.begin(), out->path_edges.end());
  out->path_length = static_cast<int>(out->path_edges.size());
  return Status::OK();
}

}  // namespace kgraph
