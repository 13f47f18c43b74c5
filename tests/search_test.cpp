// Tests for similarity search, text search, auto-embedding and context
// assembly through GraphStore

#include <gtest/gtest.h>

#include <kgraph/graph_store.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/test_utils.hpp>

#include <filesystem>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace kgraph {
namespace {

using kgraph::testing::AxisVector;
using kgraph::testing::DeterministicEmbedder;
using kgraph::testing::FailingEmbedder;
using kgraph::testing::MixVector;
using kgraph::testing::RecordingMetrics;

constexpr size_t kDim = 4;

class SearchTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("kgraph_search_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "test_db").string();
    embedder_ = std::make_shared<DeterministicEmbedder>(kDim);
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  Options TestOptions(bool with_embedder = false) {
    Options opt;
    opt.embedding_dimension = kDim;
    opt.index_type = SimilarityIndexType::kExact;
    opt.block_cache_bytes = 8ull * 1024 * 1024;
    if (with_embedder) opt.embedder = embedder_;
    return opt;
  }

  Status OpenStore(const Options& opt) { return GraphStore::Open(db_path_, &store_, opt); }

  void AddNode(const std::string& slug, const std::string& type,
               const std::vector<float>& embedding = {}) {
    NodeUpsert u;
    u.slug = slug;
    u.node_type = type;
    ASSERT_TRUE(store_->UpsertNode(u).ok());
    if (!embedding.empty()) ASSERT_TRUE(store_->SetEmbedding(slug, embedding).ok());
  }

  Status UpsertText(const std::string& slug, const std::string& title,
                    const std::string& description, Node* out = nullptr) {
    NodeUpsert u;
    u.slug = slug;
    u.node_type = "service";
    u.title = title;
    u.description = description;
    return store_->UpsertNode(u, out);
  }

  static std::vector<std::string> Slugs(const std::vector<SearchHit>& hits) {
    std::vector<std::string> slugs;
    for (const auto& h : hits) slugs.push_back(h.slug);
    return slugs;
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::shared_ptr<DeterministicEmbedder> embedder_;
  std::unique_ptr<GraphStore> store_;
};

// =============================================================================
// Search
// =============================================================================

TEST_F(SearchTest, OrderedBySimilarityWithLimit) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  AddNode("best", "service", MixVector(kDim, {{0, 1.0f}, {1, 0.1f}}));
  AddNode("good", "service", MixVector(kDim, {{0, 1.0f}, {1, 0.5f}}));
  AddNode("poor", "database", MixVector(kDim, {{0, 0.1f}, {1, 1.0f}}));
  AddNode("unembedded", "service");

  std::vector<SearchHit> hits;
  SearchOptions opts;
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), opts, &hits).ok());
  EXPECT_EQ(Slugs(hits), (std::vector<std::string>{"best", "good", "poor"}));
  EXPECT_GE(hits[0].similarity, hits[1].similarity);
  EXPECT_GE(hits[1].similarity, hits[2].similarity);

  opts.limit = 2;
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), opts, &hits).ok());
  EXPECT_EQ(hits.size(), 2u);

  opts.limit = 10;
  opts.node_type = "database";
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), opts, &hits).ok());
  EXPECT_EQ(Slugs(hits), (std::vector<std::string>{"poor"}));
}

TEST_F(SearchTest, EqualSimilarityOrderedBySlug) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  AddNode("zeta", "service", AxisVector(kDim, 0));
  AddNode("alpha", "service", AxisVector(kDim, 0));

  std::vector<SearchHit> hits;
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), SearchOptions{}, &hits).ok());
  EXPECT_EQ(Slugs(hits), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(SearchTest, QueryValidation) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  std::vector<SearchHit> hits;

  EXPECT_TRUE(store_->Search({1.0f, 0.0f}, SearchOptions{}, &hits).IsDimensionMismatch());
  EXPECT_TRUE(store_->Search(std::vector<float>(kDim, 0.0f), SearchOptions{}, &hits)
                  .IsValidationError());

  SearchOptions zero;
  zero.limit = 0;
  EXPECT_TRUE(store_->Search(AxisVector(kDim, 0), zero, &hits).IsValidationError());
  EXPECT_TRUE(store_->Search(AxisVector(kDim, 0), SearchOptions{}, nullptr).IsValidationError());
}

TEST_F(SearchTest, TypeChangeMovesNodeBetweenFilters) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  AddNode("x", "service", AxisVector(kDim, 0));

  NodeUpsert retype;
  retype.slug = "x";
  retype.node_type = "database";
  ASSERT_TRUE(store_->UpsertNode(retype).ok());

  SearchOptions opts;
  opts.node_type = "database";
  std::vector<SearchHit> hits;
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), opts, &hits).ok());
  EXPECT_EQ(Slugs(hits), (std::vector<std::string>{"x"}));

  opts.node_type = "service";
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 0), opts, &hits).ok());
  EXPECT_TRUE(hits.empty());
}

TEST_F(SearchTest, ExactScanReturnsEveryEligibleNode) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  for (size_t i = 0; i < 12; ++i) {
    AddNode("n" + std::to_string(i), i % 3 == 0 ? "table" : "service",
            MixVector(kDim, {{i % kDim, 1.0f}, {(i + 1) % kDim, 0.25f}}));
  }
  AddNode("bare", "service");

  SearchOptions all;
  all.limit = 0;
  std::vector<SearchHit> exact;
  ASSERT_TRUE(store_->SearchExact(AxisVector(kDim, 1), all, &exact).ok());
  EXPECT_EQ(exact.size(), 12u);

  SearchOptions top;
  top.limit = 5;
  std::vector<SearchHit> indexed;
  ASSERT_TRUE(store_->Search(AxisVector(kDim, 1), top, &indexed).ok());
  std::set<std::string> exact_slugs;
  for (const auto& h : exact) exact_slugs.insert(h.slug);
  for (const auto& h : indexed) EXPECT_TRUE(exact_slugs.count(h.slug)) << h.slug;

  // With an exact index both paths agree on the top results.
  std::vector<SearchHit> exact_top;
  ASSERT_TRUE(store_->SearchExact(AxisVector(kDim, 1), top, &exact_top).ok());
  EXPECT_EQ(Slugs(exact_top), Slugs(indexed));

  all.node_type = "table";
  ASSERT_TRUE(store_->SearchExact(AxisVector(kDim, 1), all, &exact).ok());
  EXPECT_EQ(exact.size(), 4u);
}

// =============================================================================
// Text search
// =============================================================================

TEST_F(SearchTest, SearchTextRequiresEmbedder) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  std::vector<SearchHit> hits;
  EXPECT_TRUE(store_->SearchText("anything", SearchOptions{}, &hits).IsValidationError());
}

TEST_F(SearchTest, SearchTextEmbedsQuery) {
  Options opt = TestOptions(true);
  opt.auto_embed = false;
  ASSERT_TRUE(OpenStore(opt).ok());
  AddNode("billing", "service", AxisVector(kDim, 3));
  AddNode("auth", "service", AxisVector(kDim, 1));
  embedder_->RegisterEmbedding("invoices", MixVector(kDim, {{3, 1.0f}, {1, 0.2f}}));

  std::vector<SearchHit> hits;
  ASSERT_TRUE(store_->SearchText("invoices", SearchOptions{}, &hits).ok());
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].slug, "billing");
}

TEST_F(SearchTest, SearchTextEmbedderFailure) {
  Options opt = TestOptions();
  opt.embedder = std::make_shared<FailingEmbedder>(kDim);
  ASSERT_TRUE(OpenStore(opt).ok());
  std::vector<SearchHit> hits;
  EXPECT_TRUE(store_->SearchText("q", SearchOptions{}, &hits).IsEmbeddingFailed());

  opt.embedder = std::make_shared<FailingEmbedder>(kDim, /*wrong_dimension=*/true);
  store_.reset();
  ASSERT_TRUE(OpenStore(opt).ok());
  EXPECT_TRUE(store_->SearchText("q", SearchOptions{}, &hits).IsEmbeddingFailed());
}

// =============================================================================
// Auto-embedding
// =============================================================================

TEST_F(SearchTest, UpsertEmbedsTitleAndDescription) {
  ASSERT_TRUE(OpenStore(TestOptions(true)).ok());
  embedder_->RegisterEmbedding("Billing API charges customers", AxisVector(kDim, 2));

  Node out;
  ASSERT_TRUE(UpsertText("svc:billing", "Billing API", "charges customers", &out).ok());
  EXPECT_EQ(out.embedding, AxisVector(kDim, 2));
  EXPECT_EQ(out.embedded_text_digest,
            internal::Sha256::Hex("Billing API charges customers"));

  Node stored;
  ASSERT_TRUE(store_->GetNode("svc:billing", &stored).ok());
  EXPECT_EQ(stored.embedding, AxisVector(kDim, 2));
  EXPECT_EQ(store_->IndexedCount(), 1u);

  std::vector<MutationEntry> log;
  ASSERT_TRUE(store_->ReadMutationLog(0, 0, &log).ok());
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].op, MutationOp::kNodeUpsert);
  EXPECT_EQ(log[1].op, MutationOp::kNodeEmbed);
  EXPECT_TRUE(log[1].success);
}

TEST_F(SearchTest, ReEmbedsOnlyWhenTextChanges) {
  ASSERT_TRUE(OpenStore(TestOptions(true)).ok());
  ASSERT_TRUE(UpsertText("s", "Title", "one").ok());
  EXPECT_EQ(embedder_->CallCount(), 1u);

  // Same text, other fields changed.
  NodeUpsert meta;
  meta.slug = "s";
  meta.metadata = PropMap{{"owner", PropValue("team-a")}};
  ASSERT_TRUE(store_->UpsertNode(meta).ok());
  EXPECT_EQ(embedder_->CallCount(), 1u);

  ASSERT_TRUE(UpsertText("s", "Title", "two").ok());
  EXPECT_EQ(embedder_->CallCount(), 2u);
  EXPECT_EQ(embedder_->EmbeddedTexts().back(), "Title two");
}

TEST_F(SearchTest, CallerSuppliedEmbeddingIsNeverReplaced) {
  ASSERT_TRUE(OpenStore(TestOptions(true)).ok());
  ASSERT_TRUE(UpsertText("s", "Title", "one").ok());
  ASSERT_TRUE(store_->SetEmbedding("s", AxisVector(kDim, 3)).ok());
  const uint64_t calls = embedder_->CallCount();

  ASSERT_TRUE(UpsertText("s", "Title", "changed").ok());
  EXPECT_EQ(embedder_->CallCount(), calls);

  Node node;
  ASSERT_TRUE(store_->GetNode("s", &node).ok());
  EXPECT_EQ(node.embedding, AxisVector(kDim, 3));
}

TEST_F(SearchTest, EmptyTextIsNotEmbedded) {
  ASSERT_TRUE(OpenStore(TestOptions(true)).ok());
  ASSERT_TRUE(UpsertText("s", "", "").ok());
  EXPECT_EQ(embedder_->CallCount(), 0u);
  EXPECT_EQ(store_->IndexedCount(), 0u);
}

TEST_F(SearchTest, AutoEmbedDisabled) {
  Options opt = TestOptions(true);
  opt.auto_embed = false;
  ASSERT_TRUE(OpenStore(opt).ok());
  ASSERT_TRUE(UpsertText("s", "Title", "text").ok());
  EXPECT_EQ(embedder_->CallCount(), 0u);
}

TEST_F(SearchTest, LongTextTruncatedAtCharacterBoundary) {
  Options opt = TestOptions(true);
  opt.embed_max_text_bytes = 7;
  ASSERT_TRUE(OpenStore(opt).ok());

  // Bytes 6-7 are a two-byte character; a 7-byte cut would split it.
  ASSERT_TRUE(UpsertText("s", "Caf\xC3\xA9", "\xC3\xA9t\xC3\xA9").ok());
  ASSERT_EQ(embedder_->EmbeddedTexts().size(), 1u);
  EXPECT_EQ(embedder_->EmbeddedTexts()[0], "Caf\xC3\xA9 ");
}

TEST_F(SearchTest, FailedAutoEmbedKeepsUpsertAndLogsFailure) {
  Options opt = TestOptions();
  opt.embedder = std::make_shared<FailingEmbedder>(kDim);
  ASSERT_TRUE(OpenStore(opt).ok());

  Node out;
  ASSERT_TRUE(UpsertText("s", "Title", "text", &out).ok());
  EXPECT_FALSE(out.HasEmbedding());

  Node stored;
  ASSERT_TRUE(store_->GetNode("s", &stored).ok());
  EXPECT_FALSE(stored.HasEmbedding());
  EXPECT_EQ(store_->IndexedCount(), 0u);

  std::vector<MutationEntry> log;
  ASSERT_TRUE(store_->ReadMutationLog(0, 0, &log).ok());
  ASSERT_EQ(log.size(), 2u);
  EXPECT_TRUE(log[0].success);
  EXPECT_EQ(log[1].op, MutationOp::kNodeEmbed);
  EXPECT_FALSE(log[1].success);
  EXPECT_NE(log[1].error.find("embedding service unavailable"), std::string::npos);
}

TEST_F(SearchTest, WrongDimensionFromEmbedderIsNotStored) {
  Options opt = TestOptions();
  opt.embedder = std::make_shared<FailingEmbedder>(kDim, /*wrong_dimension=*/true);
  ASSERT_TRUE(OpenStore(opt).ok());

  ASSERT_TRUE(UpsertText("s", "Title", "text").ok());
  Node stored;
  ASSERT_TRUE(store_->GetNode("s", &stored).ok());
  EXPECT_FALSE(stored.HasEmbedding());
}

// =============================================================================
// Context
// =============================================================================

TEST_F(SearchTest, ContextForVectorAttachesNeighbors) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  AddNode("a", "service", AxisVector(kDim, 0));
  AddNode("b", "service", MixVector(kDim, {{0, 1.0f}, {1, 1.0f}}));
  AddNode("c", "database");

  EdgeCreate e;
  e.src_slug = "a";
  e.dst_slug = "c";
  e.edge_type = "stores_data_in";
  ASSERT_TRUE(store_->CreateEdge(e).ok());

  std::vector<ContextItem> items;
  ASSERT_TRUE(store_->ContextForVector(AxisVector(kDim, 0), 20, &items).ok());
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].slug, "a");
  EXPECT_GT(items[0].relevance_score, items[1].relevance_score);
  ASSERT_EQ(items[0].connected_nodes.size(), 1u);
  EXPECT_EQ(items[0].connected_nodes[0].slug, "c");
  EXPECT_EQ(items[0].connected_nodes[0].matched_edge_type, "stores_data_in");
  EXPECT_TRUE(items[1].connected_nodes.empty());

  ASSERT_TRUE(store_->ContextForVector(AxisVector(kDim, 0), 1, &items).ok());
  EXPECT_EQ(items.size(), 1u);
  EXPECT_TRUE(store_->ContextForVector(AxisVector(kDim, 0), 0, &items).IsValidationError());
}

TEST_F(SearchTest, ContextForNeedsWorkingEmbedder) {
  ASSERT_TRUE(OpenStore(TestOptions()).ok());
  std::vector<ContextItem> items;
  EXPECT_TRUE(store_->ContextFor("task", 5, &items).IsValidationError());

  Options opt = TestOptions();
  opt.embedder = std::make_shared<FailingEmbedder>(kDim);
  store_.reset();
  ASSERT_TRUE(OpenStore(opt).ok());
  EXPECT_TRUE(store_->ContextFor("task", 5, &items).IsEmbeddingFailed());
}

TEST_F(SearchTest, ContextOperationsReportSeparateMetrics) {
  auto metrics = std::make_shared<RecordingMetrics>();
  Options opt = TestOptions(true);
  opt.metrics = metrics;
  ASSERT_TRUE(OpenStore(opt).ok());
  AddNode("a", "service", AxisVector(kDim, 0));

  std::vector<ContextItem> items;
  ASSERT_TRUE(store_->ContextFor("task", 5, &items).ok());
  ASSERT_TRUE(store_->ContextForVector(AxisVector(kDim, 0), 5, &items).ok());
  ASSERT_TRUE(store_->ContextForVector(AxisVector(kDim, 0), 5, &items).ok());
  EXPECT_TRUE(store_->ContextForVector({1.0f}, 5, &items).IsDimensionMismatch());

  EXPECT_EQ(metrics->CounterValue("kgraph.context_for.calls"), 1u);
  EXPECT_EQ(metrics->HistogramCount("kgraph.context_for.latency_us"), 1u);
  EXPECT_EQ(metrics->CounterValue("kgraph.context_for_vector.calls"), 3u);
  EXPECT_EQ(metrics->CounterValue("kgraph.context_for_vector.ok_total"), 2u);
  EXPECT_EQ(metrics->HistogramCount("kgraph.context_for_vector.latency_us"), 3u);
}

}  // namespace
}  // namespace kgraph
