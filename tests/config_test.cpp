// Unit tests for kgraph/config.hpp
// Tests: file parsing, list and enum values, unknown keys, validation

#include <gtest/gtest.h>

#include <kgraph/config.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace kgraph {
namespace {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    test_dir_ = std::filesystem::temp_directory_path() /
                ("kgraph_config_" + std::to_string(dis(gen)));
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::string WriteConfig(const std::string& contents) {
    std::string path = (test_dir_ / "kgraph.yaml").string();
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
  }

  std::string LoadError(const std::string& contents) {
    try {
      EngineConfig::LoadFromFile(WriteConfig(contents));
    } catch (const std::runtime_error& e) {
      return e.what();
    }
    return "";
  }

  std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, ParsesAllSections) {
  auto path = WriteConfig(
      "# kgraph engine\n"
      "store:\n"
      "  path: \"/var/lib/kgraph\"\n"
      "  block_cache_bytes: 1048576\n"
      "  bloom_bits_per_key: 8\n"
      "  lock_timeout_ms: 500\n"
      "  mutation_source: ingest\n"
      "\n"
      "graph:\n"
      "  embedding_dimension: 384\n"
      "  node_types: service, database ,table\n"
      "  edge_types: depends_on\n"
      "  allow_custom_types: yes\n"
      "  allow_dangling_edges: true\n"
      "  duplicate_edge_policy: reject\n"
      "  max_traversal_depth: 3\n"
      "  path_direction: both\n"
      "  auto_embed: false\n"
      "  embed_max_text_bytes: 2048\n"
      "index:\n"
      "  type: exact\n"
      "  m: 32\n"
      "  ef_construction: 100\n"
      "  ef_search: 64\n"
      "  compact_ratio: 0.25\n"
      "logging:\n"
      "  level: debug\n"
      "  pattern: '[%H:%M:%S] %v'\n");

  EngineConfig config = EngineConfig::LoadFromFile(path);
  EXPECT_EQ(config.db_path, "/var/lib/kgraph");
  EXPECT_EQ(config.store.block_cache_bytes, 1048576u);
  EXPECT_EQ(config.store.bloom_bits_per_key, 8);
  EXPECT_EQ(config.store.lock_timeout_ms, 500);
  EXPECT_EQ(config.store.mutation_source, "ingest");

  EXPECT_EQ(config.store.embedding_dimension, 384u);
  EXPECT_EQ(config.store.node_types, (std::vector<std::string>{"service", "database", "table"}));
  EXPECT_EQ(config.store.edge_types, (std::vector<std::string>{"depends_on"}));
  EXPECT_TRUE(config.store.allow_custom_types);
  EXPECT_TRUE(config.store.allow_dangling_edges);
  EXPECT_EQ(config.store.duplicate_edge_policy, DuplicateEdgePolicy::kReject);
  EXPECT_EQ(config.store.max_traversal_depth, 3);
  EXPECT_EQ(config.store.path_direction, Direction::kBoth);
  EXPECT_FALSE(config.store.auto_embed);
  EXPECT_EQ(config.store.embed_max_text_bytes, 2048u);

  EXPECT_EQ(config.store.index_type, SimilarityIndexType::kExact);
  EXPECT_EQ(config.store.hnsw_m, 32);
  EXPECT_EQ(config.store.hnsw_ef_construction, 100);
  EXPECT_EQ(config.store.hnsw_ef_search, 64);
  EXPECT_DOUBLE_EQ(config.store.index_compact_ratio, 0.25);

  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.pattern, "[%H:%M:%S] %v");

  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, DefaultsSurviveMinimalFile) {
  EngineConfig config = EngineConfig::LoadFromFile(WriteConfig("db_path: /tmp/kg\n"));
  EXPECT_EQ(config.db_path, "/tmp/kg");
  EXPECT_EQ(config.store.embedding_dimension, 1536u);
  EXPECT_EQ(config.store.node_types.size(), 15u);
  EXPECT_EQ(config.store.edge_types.size(), 13u);
  EXPECT_EQ(config.store.duplicate_edge_policy, DuplicateEdgePolicy::kIgnore);
  EXPECT_EQ(config.store.path_direction, Direction::kOutgoing);
  EXPECT_EQ(config.store.max_traversal_depth, 5);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(EngineConfig::LoadFromFile((test_dir_ / "absent.yaml").string()),
               std::runtime_error);
}

TEST_F(ConfigTest, UnknownKeysAndSectionsAreRejected) {
  EXPECT_EQ(LoadError("graph:\n  embeding_dimension: 4\n"),
            "Unknown config key: graph.embeding_dimension");
  EXPECT_EQ(LoadError("server:\n  port: 80\n"), "Unknown config section: server");
  EXPECT_EQ(LoadError("verbose: true\n"), "Unknown config key: verbose");
}

TEST_F(ConfigTest, MalformedValuesNameTheKey) {
  EXPECT_EQ(LoadError("graph:\n  embedding_dimension: -4\n"),
            "Invalid value for graph.embedding_dimension: '-4' (expected an unsigned integer)");
  EXPECT_EQ(LoadError("graph:\n  path_direction: sideways\n"),
            "Invalid value for graph.path_direction: 'sideways' "
            "(expected outgoing, incoming or both)");
  EXPECT_EQ(LoadError("index:\n  type: annoy\n"),
            "Invalid value for index.type: 'annoy' (expected hnsw or exact)");
  EXPECT_EQ(LoadError("graph:\n  auto_embed: maybe\n"),
            "Invalid value for graph.auto_embed: 'maybe' (expected true or false)");
  EXPECT_FALSE(LoadError("index:\n  compact_ratio: 0.5x\n").empty());
}

TEST_F(ConfigTest, LineWithoutColonReportsLine) {
  auto path = WriteConfig("store:\n  path /tmp/kg\n");
  try {
    EngineConfig::LoadFromFile(path);
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_EQ(std::string(e.what()), path + ":2: expected 'key: value'");
  }
}

TEST_F(ConfigTest, ValidateRejectsBadSettings) {
  EngineConfig config;
  EXPECT_THROW(config.Validate(), std::runtime_error);  // no path

  config.db_path = "/tmp/kg";
  EXPECT_NO_THROW(config.Validate());

  EngineConfig bad = config;
  bad.store.embedding_dimension = 0;
  EXPECT_THROW(bad.Validate(), std::runtime_error);

  bad = config;
  bad.store.max_traversal_depth = 0;
  EXPECT_THROW(bad.Validate(), std::runtime_error);

  bad = config;
  bad.store.node_types = {"Service"};
  EXPECT_THROW(bad.Validate(), std::runtime_error);

  bad = config;
  bad.store.edge_types.clear();
  EXPECT_THROW(bad.Validate(), std::runtime_error);
  bad.store.allow_custom_types = true;
  EXPECT_NO_THROW(bad.Validate());

  bad = config;
  bad.store.hnsw_m = 1;
  EXPECT_THROW(bad.Validate(), std::runtime_error);

  bad = config;
  bad.store.index_compact_ratio = 0.0;
  EXPECT_THROW(bad.Validate(), std::runtime_error);

  bad = config;
  bad.logging.level = "chatty";
  EXPECT_THROW(bad.Validate(), std::runtime_error);
}

}  // namespace
}  // namespace kgraph
