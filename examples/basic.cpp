#include <kgraph/config.hpp>
#include <kgraph/graph_store.hpp>

#include <iostream>
#include <stdexcept>

namespace {

kgraph::NodeUpsert Node(const std::string& slug, const std::string& type,
                        const std::string& title) {
  kgraph::NodeUpsert u;
  u.slug = slug;
  u.node_type = type;
  u.title = title;
  return u;
}

kgraph::EdgeCreate Edge(const std::string& src, const std::string& dst,
                        const std::string& type) {
  kgraph::EdgeCreate e;
  e.src_slug = src;
  e.dst_slug = dst;
  e.edge_type = type;
  return e;
}

}  // namespace

// Usage: kgraph_basic [config.yaml]
int main(int argc, char** argv) {
  kgraph::EngineConfig config;
  config.db_path = "./kgraph_db";
  config.store.embedding_dimension = 4;
  config.store.index_type = kgraph::SimilarityIndexType::kExact;
  if (argc > 1) {
    try {
      config = kgraph::EngineConfig::LoadFromFile(argv[1]);
      config.Validate();
    } catch (const std::runtime_error& e) {
      std::cerr << "Config error: " << e.what() << "\n";
      return 1;
    }
  }
  kgraph::InitializeLogging(config.logging);

  std::unique_ptr<kgraph::GraphStore> db;
  auto s = kgraph::GraphStore::Open(config.db_path, &db, config.store);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  kgraph::BulkSyncRequest seed;
  seed.source = "kgraph_basic";
  seed.nodes = {Node("repo:kg", "repository", "kgraph"),
                Node("service:api", "service", "Graph API"),
                Node("database:main", "database", "Primary database"),
                Node("schema:kg", "schema", "Knowledge graph schema")};
  seed.edges = {Edge("repo:kg", "service:api", "uses_service"),
                Edge("service:api", "database:main", "stores_data_in"),
                Edge("database:main", "schema:kg", "depends_on")};

  kgraph::BulkSyncResult seeded;
  s = db->BulkSync(seed, &seeded);
  if (!s.ok()) {
    std::cerr << "BulkSync failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "created " << seeded.nodes_created << " nodes, " << seeded.edges_created
            << " edges\n";

  kgraph::NeighborQuery q;
  q.max_depth = 2;
  std::vector<kgraph::NeighborResult> neighbors;
  s = db->Neighbors("repo:kg", q, &neighbors);
  if (!s.ok()) {
    std::cerr << "Neighbors failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& n : neighbors) {
    std::cout << "  " << n.slug << " (" << n.node_type << ") via " << n.matched_edge_type
              << " hops=" << n.hop_distance << "\n";
  }

  kgraph::PathResult path;
  s = db->ShortestPath("repo:kg", "schema:kg", config.store.max_traversal_depth, &path);
  if (s.ok()) {
    std::cout << "path:";
    for (const auto& slug : path.path_nodes) std::cout << " " << slug;
    std::cout << " (length " << path.path_length << ")\n";
  } else {
    std::cerr << "ShortestPath failed: " << s.ToString() << "\n";
  }

  // A self-loop is refused and recorded in the mutation log.
  s = db->CreateEdge(Edge("service:api", "service:api", "depends_on"));
  std::cout << "self-loop: " << s.ToString() << "\n";

  // Deleting a node cascades to its edges.
  s = db->DeleteNode("database:main");
  if (!s.ok()) std::cerr << "DeleteNode failed: " << s.ToString() << "\n";

  s = db->ShortestPath("repo:kg", "schema:kg", config.store.max_traversal_depth, &path);
  std::cout << "path after delete: " << s.ToString() << "\n";

  std::vector<kgraph::MutationEntry> log;
  s = db->ReadMutationLog(0, 0, &log);
  if (!s.ok()) {
    std::cerr << "ReadMutationLog failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& e : log) {
    std::cout << "#" << e.seq << " " << kgraph::MutationOpName(e.op) << " " << e.target
              << (e.success ? "" : " FAILED: " + e.error) << "\n";
  }

  std::cout << "done\n";
  return 0;
}
