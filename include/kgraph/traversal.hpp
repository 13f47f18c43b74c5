#pragma once

#include <string>
#include <vector>

#include <kgraph/status.hpp>
#include <kgraph/types.hpp>

namespace kgraph {

/**
 * Read-only view of a graph, as seen by the traversal algorithms.
 *
 * GraphStore supplies one bound to a RocksDB snapshot so that a whole
 * traversal observes a single consistent graph; tests supply an in-memory
 * one.
 */
class GraphReader {
 public:
  virtual ~GraphReader() = default;

  /** NotFound if slug is not a node. The embedding need not be loaded. */
  virtual Status GetNode(const std::string& slug, Node* out) const = 0;

  /** Edges with src_slug == slug, in (dst_slug, edge_type) order. */
  virtual Status OutgoingEdges(const std::string& slug, std::vector<Edge>* out) const = 0;

  /** Edges with dst_slug == slug, in (src_slug, edge_type) order. */
  virtual Status IncomingEdges(const std::string& slug, std::vector<Edge>* out) const = 0;
};

/** Outgoing then incoming edges of slug, per direction. */
Status EdgesInDirection(const GraphReader& reader, const std::string& slug,
                        Direction direction, std::vector<Edge>* out);

/**
 * Breadth-first neighbor expansion from `start`.
 *
 * Each reachable node is reported once with its minimum hop distance; the
 * start node is never reported, even through a cycle. Edge endpoints that are
 * not nodes are neither reported nor expanded. Results are ordered by
 * (hop_distance, slug).
 *
 * Errors: ValidationError if query.max_depth < 1, DepthLimitExceeded if it is
 * above depth_limit, NotFound if start is not a node.
 */
Status Neighbors(const GraphReader& reader, const std::string& start,
                 const NeighborQuery& query, int depth_limit,
                 std::vector<NeighborResult>* out);

/**
 * Minimum-hop path from src to dst following edges of any type in
 * `direction`. path_edges are the stored edges, so for kIncoming each edge
 * points from path_nodes[i + 1] to path_nodes[i].
 *
 * src == dst yields a zero-length path. NotFound if either endpoint is
 * missing or dst is not reachable within max_depth hops.
 */
Status ShortestPath(const GraphReader& reader, const std::string& src,
                    const std::string& dst, int max_depth, Direction direction,
                    int depth_limit, PathResult* out);

}  // namespace kgraph
