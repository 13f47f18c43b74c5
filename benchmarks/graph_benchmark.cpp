// Performance benchmarks for kgraph GraphStore
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound operations (SHA-256, record codec, similarity)
//    - No I/O, no database operations
// 2. MACROBENCHMARKS: GraphStore operations (upsert, edges, traversal, search)
//    - Full database operations with I/O
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed graph shapes for reproducible results

#include <benchmark/benchmark.h>

#include <kgraph/codec.hpp>
#include <kgraph/graph_store.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/similarity_index.hpp>

#include <cstdio>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr size_t kDim = 384;

std::vector<float> RandomVector(std::mt19937& gen, size_t dim) {
  std::normal_distribution<float> dis(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dis(gen);
  return v;
}

kgraph::NodeUpsert MakeNode(const std::string& slug, const std::string& title = "") {
  kgraph::NodeUpsert u;
  u.slug = slug;
  u.node_type = "service";
  if (!title.empty()) u.title = title;
  return u;
}

kgraph::EdgeCreate MakeEdge(const std::string& src, const std::string& dst) {
  kgraph::EdgeCreate e;
  e.src_slug = src;
  e.dst_slug = dst;
  e.edge_type = "depends_on";
  return e;
}

// =============================================================================
// Benchmark Fixtures and Helpers
// =============================================================================

class GraphBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";
    test_dir_ = temp_base / ("kgraph_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_, ec);
    db_path_ = (test_dir_ / "bench_db").string();
  }

  void TearDown(const benchmark::State& state) override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  kgraph::Status OpenStore() {
    kgraph::Options opt;
    opt.embedding_dimension = kDim;
    opt.index_type = kgraph::SimilarityIndexType::kExact;
    return kgraph::GraphStore::Open(db_path_, &store_, opt);
  }

  // slug0 -> slug1 -> ... plus a shortcut every tenth node, so traversal
  // frontiers fan out a little.
  void BuildChain(int nodes) {
    kgraph::BulkSyncRequest request;
    for (int i = 0; i < nodes; ++i) request.nodes.push_back(MakeNode(Slug(i)));
    for (int i = 1; i < nodes; ++i) request.edges.push_back(MakeEdge(Slug(i - 1), Slug(i)));
    for (int i = 10; i < nodes; i += 10) request.edges.push_back(MakeEdge(Slug(i - 10), Slug(i)));
    auto st = store_->BulkSync(request);
    if (!st.ok()) std::fprintf(stderr, "seed failed: %s\n", st.ToString().c_str());
  }

  static std::string Slug(int i) { return "node:" + std::to_string(i); }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<kgraph::GraphStore> store_;
  std::mt19937 gen_{42};
};

// =============================================================================
// PART 1: MICROBENCHMARKS - CPU-bound operations without I/O
// =============================================================================

static void BM_SHA256_Hex(benchmark::State& state) {
  std::string data(state.range(0), 'x');
  for (auto _ : state) {
    auto digest = kgraph::internal::Sha256::Hex(data);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SHA256_Hex)->Range(64, 8192);

static void BM_EdgeKey_MakeAndParse(benchmark::State& state) {
  std::string first, second, type;
  for (auto _ : state) {
    auto key = kgraph::internal::MakeEdgeKey("service:billing-api", "database:ledger",
                                             "stores_data_in");
    kgraph::internal::ParseEdgeKey(key, &first, &second, &type);
    benchmark::DoNotOptimize(second);
  }
}
BENCHMARK(BM_EdgeKey_MakeAndParse);

static void BM_Node_Encode(benchmark::State& state) {
  kgraph::Node node;
  node.slug = "service:billing-api";
  node.node_type = "service";
  node.title = "Billing API";
  node.description = "Charges customers and records invoices";
  node.props["owner"] = "payments";
  node.props["replicas"] = 3;
  node.props["public"] = true;

  for (auto _ : state) {
    auto encoded = kgraph::internal::EncodeNode(node);
    benchmark::DoNotOptimize(encoded);
  }
}
BENCHMARK(BM_Node_Encode);

static void BM_Node_Decode(benchmark::State& state) {
  kgraph::Node node;
  node.slug = "service:billing-api";
  node.node_type = "service";
  node.title = "Billing API";
  node.props["owner"] = "payments";
  node.props["replicas"] = 3;
  const std::string encoded = kgraph::internal::EncodeNode(node);

  kgraph::Node result;
  for (auto _ : state) {
    auto st = kgraph::internal::DecodeNode(node.slug, encoded, &result);
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK(BM_Node_Decode);

static void BM_Embedding_Serialize(benchmark::State& state) {
  std::mt19937 gen(7);
  auto embedding = RandomVector(gen, kDim);
  for (auto _ : state) {
    auto serialized = kgraph::internal::SerializeEmbedding(embedding);
    benchmark::DoNotOptimize(serialized);
  }
}
BENCHMARK(BM_Embedding_Serialize);

static void BM_CosineSimilarity(benchmark::State& state) {
  std::mt19937 gen(7);
  auto a = RandomVector(gen, kDim);
  auto b = RandomVector(gen, kDim);
  for (auto _ : state) {
    float sim = kgraph::internal::CosineSimilarity(a, b);
    benchmark::DoNotOptimize(sim);
  }
}
BENCHMARK(BM_CosineSimilarity);

static void BM_ExactIndex_Search(benchmark::State& state) {
  std::mt19937 gen(7);
  auto index = kgraph::internal::CreateExactIndex(kDim);
  for (int i = 0; i < state.range(0); ++i) {
    index->Upsert("node:" + std::to_string(i), "service", RandomVector(gen, kDim));
  }
  auto query = RandomVector(gen, kDim);

  for (auto _ : state) {
    auto hits = index->Search(query, 10, nullptr);
    benchmark::DoNotOptimize(hits);
  }
}
BENCHMARK(BM_ExactIndex_Search)->Range(256, 16384);

#ifdef KGRAPH_WITH_HNSWLIB
static void BM_HNSWIndex_Search(benchmark::State& state) {
  std::mt19937 gen(7);
  auto index = kgraph::internal::CreateHNSWIndex(kDim, static_cast<size_t>(state.range(0)));
  for (int i = 0; i < state.range(0); ++i) {
    index->Upsert("node:" + std::to_string(i), "service", RandomVector(gen, kDim));
  }
  auto query = RandomVector(gen, kDim);

  for (auto _ : state) {
    auto hits = index->Search(query, 10, nullptr);
    benchmark::DoNotOptimize(hits);
  }
}
BENCHMARK(BM_HNSWIndex_Search)->Range(256, 16384);
#endif

// =============================================================================
// PART 2: MACROBENCHMARKS - GraphStore operations with I/O
// =============================================================================

BENCHMARK_DEFINE_F(GraphBenchmark, UpsertNode_New)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  int64_t id = 0;
  for (auto _ : state) {
    auto st = store_->UpsertNode(MakeNode("node:" + std::to_string(id++), "title"));
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, UpsertNode_New);

BENCHMARK_DEFINE_F(GraphBenchmark, UpsertNode_Update)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  store_->UpsertNode(MakeNode("node:hot"));
  int64_t version = 0;
  for (auto _ : state) {
    auto st = store_->UpsertNode(MakeNode("node:hot", "v" + std::to_string(version++)));
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, UpsertNode_Update);

BENCHMARK_DEFINE_F(GraphBenchmark, CreateEdge)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const int kNodes = 1000;
  BuildChain(kNodes);
  std::uniform_int_distribution<> dis(0, kNodes - 1);
  for (auto _ : state) {
    int a = dis(gen_);
    int b = dis(gen_);
    if (a == b) b = (b + 1) % kNodes;
    auto st = store_->CreateEdge(MakeEdge(Slug(a), Slug(b)));
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, CreateEdge);

BENCHMARK_DEFINE_F(GraphBenchmark, Neighbors_Depth)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  BuildChain(1000);
  kgraph::NeighborQuery q;
  q.max_depth = static_cast<int>(state.range(0));
  std::vector<kgraph::NeighborResult> out;
  for (auto _ : state) {
    auto st = store_->Neighbors(Slug(100), q, &out);
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, Neighbors_Depth)->DenseRange(1, 5);

BENCHMARK_DEFINE_F(GraphBenchmark, ShortestPath)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  BuildChain(1000);
  kgraph::PathResult path;
  for (auto _ : state) {
    auto st = store_->ShortestPath(Slug(500), Slug(530), 5, &path);
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, ShortestPath);

BENCHMARK_DEFINE_F(GraphBenchmark, Search)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const int kNodes = static_cast<int>(state.range(0));
  BuildChain(kNodes);
  for (int i = 0; i < kNodes; ++i) store_->SetEmbedding(Slug(i), RandomVector(gen_, kDim));
  auto query = RandomVector(gen_, kDim);

  kgraph::SearchOptions options;
  std::vector<kgraph::SearchHit> hits;
  for (auto _ : state) {
    auto st = store_->Search(query, options, &hits);
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, Search)->Arg(1000)->Arg(5000);

BENCHMARK_DEFINE_F(GraphBenchmark, ContextForVector)(benchmark::State& state) {
  if (!OpenStore().ok()) {
    state.SkipWithError("open failed");
    return;
  }
  const int kNodes = 1000;
  BuildChain(kNodes);
  for (int i = 0; i < kNodes; ++i) store_->SetEmbedding(Slug(i), RandomVector(gen_, kDim));
  auto query = RandomVector(gen_, kDim);

  std::vector<kgraph::ContextItem> items;
  for (auto _ : state) {
    auto st = store_->ContextForVector(query, 10, &items);
    benchmark::DoNotOptimize(st);
  }
}
BENCHMARK_REGISTER_F(GraphBenchmark, ContextForVector);

}  // namespace

BENCHMARK_MAIN();
