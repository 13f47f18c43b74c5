// Tests for GraphStore::BulkSync
// Tests: all-or-nothing application, counts, single log entry, auto-embed

#include <gtest/gtest.h>

#include <kgraph/codec.hpp>
#include <kgraph/graph_store.hpp>
#include <kgraph/test_utils.hpp>

#include <cmath>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kgraph {
namespace {

using kgraph::testing::DeterministicEmbedder;

constexpr size_t kDim = 4;

NodeUpsert MakeNode(const std::string& slug, const std::string& type,
                    const std::string& title = "") {
  NodeUpsert u;
  u.slug = slug;
  u.node_type = type;
  if (!title.empty()) u.title = title;
  return u;
}

EdgeCreate MakeEdge(const std::string& src, const std::string& dst,
                    const std::string& type = "depends_on") {
  EdgeCreate e;
  e.src_slug = src;
  e.dst_slug = dst;
  e.edge_type = type;
  return e;
}

class BulkSyncTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("kgraph_bulk_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "test_db").string();
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  Status OpenStore(std::shared_ptr<Embedder> embedder = nullptr) {
    Options opt;
    opt.embedding_dimension = kDim;
    opt.index_type = SimilarityIndexType::kExact;
    opt.block_cache_bytes = 8ull * 1024 * 1024;
    opt.embedder = std::move(embedder);
    return GraphStore::Open(db_path_, &store_, opt);
  }

  uint64_t NodeCount() {
    uint64_t n = 0;
    EXPECT_TRUE(store_->CountNodes(&n).ok());
    return n;
  }

  uint64_t EdgeCount() {
    uint64_t n = 0;
    EXPECT_TRUE(store_->CountEdges(&n).ok());
    return n;
  }

  std::vector<MutationEntry> ReadLog() {
    std::vector<MutationEntry> entries;
    EXPECT_TRUE(store_->ReadMutationLog(0, 0, &entries).ok());
    return entries;
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<GraphStore> store_;
};

TEST_F(BulkSyncTest, AppliesNodesAndEdgesWithOneLogEntry) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->UpsertNode(MakeNode("repo:kg", "repository")).ok());

  BulkSyncRequest request;
  request.source = "seed-loader";
  request.nodes = {MakeNode("repo:kg", "repository", "kg"), MakeNode("schema:kg", "schema"),
                   MakeNode("table:nodes", "table")};
  // Edges may reference nodes created earlier in the same batch.
  request.edges = {MakeEdge("repo:kg", "schema:kg"), MakeEdge("schema:kg", "table:nodes"),
                   MakeEdge("repo:kg", "schema:kg")};

  BulkSyncResult result;
  ASSERT_TRUE(store_->BulkSync(request, &result).ok());
  EXPECT_EQ(result.nodes_created, 2u);
  EXPECT_EQ(result.nodes_updated, 1u);
  EXPECT_EQ(result.edges_created, 2u);
  EXPECT_EQ(result.edges_skipped, 1u);
  EXPECT_EQ(result.nodes_embedded, 0u);

  EXPECT_EQ(NodeCount(), 3u);
  EXPECT_EQ(EdgeCount(), 2u);

  auto log = ReadLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[1].op, MutationOp::kBulkSync);
  EXPECT_EQ(log[1].source, "seed-loader");
  EXPECT_TRUE(log[1].success);

  Json::Value payload;
  ASSERT_TRUE(internal::ParseJson(log[1].payload, &payload));
  EXPECT_EQ(payload["nodes_created"].asUInt64(), 2u);
  EXPECT_EQ(payload["edges_skipped"].asUInt64(), 1u);

  Node node;
  ASSERT_TRUE(store_->GetNode("repo:kg", &node).ok());
  EXPECT_EQ(node.title, "kg");
}

TEST_F(BulkSyncTest, FailureAppliesNothing) {
  ASSERT_TRUE(OpenStore().ok());

  BulkSyncRequest request;
  request.nodes = {MakeNode("a", "service"), MakeNode("b", "service")};
  request.edges = {MakeEdge("a", "b"), MakeEdge("b", "ghost")};

  Status st = store_->BulkSync(request);
  EXPECT_TRUE(st.IsDanglingReference());
  EXPECT_EQ(NodeCount(), 0u);
  EXPECT_EQ(EdgeCount(), 0u);

  auto log = ReadLog();
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].op, MutationOp::kBulkSync);
  EXPECT_FALSE(log[0].success);
  EXPECT_EQ(log[0].source, "engine");
}

TEST_F(BulkSyncTest, ValidationFailureRejectsWholeBatch) {
  ASSERT_TRUE(OpenStore().ok());

  BulkSyncRequest request;
  request.nodes = {MakeNode("a", "service"), MakeNode("bad slug", "service")};
  EXPECT_TRUE(store_->BulkSync(request).IsValidationError());

  request.nodes = {MakeNode("a", "service")};
  request.edges = {MakeEdge("a", "a")};
  EXPECT_TRUE(store_->BulkSync(request).IsSelfLoop());

  request.nodes = {MakeNode("a", "service"), MakeNode("b", "service")};
  request.edges = {MakeEdge("a", "b")};
  request.edges[0].props = PropMap{{"w", PropValue(std::nan(""))}};
  EXPECT_TRUE(store_->BulkSync(request).IsValidationError());

  request.edges.clear();
  request.nodes[1].title = std::string("caf\xE9");
  EXPECT_TRUE(store_->BulkSync(request).IsValidationError());

  request.nodes[1].title = std::string("B");
  request.source = "sync\xFF";
  EXPECT_TRUE(store_->BulkSync(request).IsValidationError());

  EXPECT_EQ(NodeCount(), 0u);
}

TEST_F(BulkSyncTest, AutoEmbedsAfterCommit) {
  auto embedder = std::make_shared<DeterministicEmbedder>(kDim);
  ASSERT_TRUE(OpenStore(embedder).ok());

  BulkSyncRequest request;
  request.nodes = {MakeNode("a", "service", "Alpha"), MakeNode("b", "service", "Beta"),
                   MakeNode("c", "service")};
  BulkSyncResult result;
  ASSERT_TRUE(store_->BulkSync(request, &result).ok());

  // "c" has no text.
  EXPECT_EQ(result.nodes_embedded, 2u);
  EXPECT_EQ(embedder->CallCount(), 2u);
  EXPECT_EQ(store_->IndexedCount(), 2u);

  // Unchanged text is not embedded again.
  ASSERT_TRUE(store_->BulkSync(request, &result).ok());
  EXPECT_EQ(result.nodes_updated, 3u);
  EXPECT_EQ(result.nodes_embedded, 0u);
  EXPECT_EQ(embedder->CallCount(), 2u);
}

TEST_F(BulkSyncTest, EmptyRequestIsLogged) {
  ASSERT_TRUE(OpenStore().ok());
  BulkSyncResult result;
  ASSERT_TRUE(store_->BulkSync(BulkSyncRequest{}, &result).ok());
  EXPECT_EQ(result.nodes_created, 0u);
  ASSERT_EQ(ReadLog().size(), 1u);
}

}  // namespace
}  // namespace kgraph
