#pragma once

#include <kgraph/embedder.hpp>
#include <kgraph/internal.hpp>
#include <kgraph/observability.hpp>
#include <kgraph/traversal.hpp>

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kgraph::testing {

// =============================================================================
// Vector helpers
// =============================================================================

// Unit vector along one axis.
inline std::vector<float> AxisVector(size_t dimension, size_t axis) {
  std::vector<float> v(dimension, 0.0f);
  v[axis % dimension] = 1.0f;
  return v;
}

// Weighted sum of axis vectors; not normalized.
inline std::vector<float> MixVector(size_t dimension,
                                    std::initializer_list<std::pair<size_t, float>> parts) {
  std::vector<float> v(dimension, 0.0f);
  for (const auto& [axis, weight] : parts) v[axis % dimension] += weight;
  return v;
}

// =============================================================================
// Deterministic Embedder for Semantic Testing
// =============================================================================

/**
 * Deterministic embedder that generates reproducible embeddings from text.
 *
 * Embedding generation strategy:
 * - Hash the input text to generate a seed
 * - Use the seed to generate a deterministic vector
 * - Normalize to unit length
 *
 * RegisterEmbedding pins the vector for an exact text.
 */
class DeterministicEmbedder : public Embedder {
 public:
  explicit DeterministicEmbedder(size_t dimension = 8) : dimension_(dimension) {}

  EmbeddingResult Embed(std::string_view text) const override {
    calls_.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      texts_.emplace_back(text);
    }
    EmbeddingResult result;
    result.embedding = GenerateEmbedding(text);
    result.success = true;
    return result;
  }

  size_t Dimension() const override { return dimension_; }

  // Register a custom embedding for a specific text (for precise test control)
  void RegisterEmbedding(const std::string& text, std::vector<float> embedding) {
    std::lock_guard<std::mutex> lock(mutex_);
    custom_embeddings_[text] = std::move(embedding);
  }

  uint64_t CallCount() const { return calls_.load(); }

  // Texts passed to Embed, in call order.
  std::vector<std::string> EmbeddedTexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return texts_;
  }

 private:
  std::vector<float> GenerateEmbedding(std::string_view text) const {
    // Check for custom embedding first
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = custom_embeddings_.find(std::string(text));
      if (it != custom_embeddings_.end()) {
        return it->second;
      }
    }

    std::vector<float> embedding(dimension_);

    uint64_t hash = 14695981039346656037ULL;  // FNV-1a offset basis
    for (char c : text) {
      hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
      hash *= 1099511628211ULL;  // FNV-1a prime
    }

    // Generate embedding components using LCG seeded by hash
    uint64_t state = hash;
    float norm = 0.0f;
    for (size_t i = 0; i < dimension_; ++i) {
      state = state * 6364136223846793005ULL + 1442695040888963407ULL;
      // Convert to float in [-1, 1]
      embedding[i] = (static_cast<float>(state >> 33) / static_cast<float>(1ULL << 31)) - 1.0f;
      norm += embedding[i] * embedding[i];
    }

    norm = std::sqrt(norm);
    if (norm > 1e-6f) {
      for (float& v : embedding) {
        v /= norm;
      }
    }

    return embedding;
  }

  size_t dimension_;
  mutable std::atomic<uint64_t> calls_{0};
  mutable std::mutex mutex_;
  mutable std::vector<std::string> texts_;
  std::unordered_map<std::string, std::vector<float>> custom_embeddings_;
};

/**
 * Embedder that always fails, or (with wrong_dimension) succeeds with a
 * vector of the wrong length.
 */
class FailingEmbedder : public Embedder {
 public:
  explicit FailingEmbedder(size_t dimension = 8, bool wrong_dimension = false)
      : dimension_(dimension), wrong_dimension_(wrong_dimension) {}

  EmbeddingResult Embed(std::string_view) const override {
    calls_.fetch_add(1);
    EmbeddingResult result;
    if (wrong_dimension_) {
      result.embedding.assign(dimension_ + 1, 0.5f);
      result.success = true;
    } else {
      result.success = false;
      result.error_message = "embedding service unavailable";
    }
    return result;
  }

  size_t Dimension() const override { return dimension_; }

  uint64_t CallCount() const { return calls_.load(); }

 private:
  size_t dimension_;
  bool wrong_dimension_;
  mutable std::atomic<uint64_t> calls_{0};
};

// =============================================================================
// In-memory graph for traversal tests
// =============================================================================

/**
 * GraphReader over plain maps. Edge order matches the store's key order.
 */
class InMemoryGraph : public GraphReader {
 public:
  void AddNode(const std::string& slug, const std::string& node_type = "service",
               const std::string& title = "") {
    Node node;
    node.slug = slug;
    node.node_type = node_type;
    node.title = title.empty() ? slug : title;
    nodes_[slug] = std::move(node);
  }

  void AddEdge(const std::string& src, const std::string& dst,
               const std::string& edge_type = "depends_on", double weight = 1.0) {
    Edge edge;
    edge.src_slug = src;
    edge.dst_slug = dst;
    edge.edge_type = edge_type;
    edge.weight = weight;
    edges_[std::make_tuple(src, dst, edge_type)] = std::move(edge);
  }

  Status GetNode(const std::string& slug, Node* out) const override {
    auto it = nodes_.find(slug);
    if (it == nodes_.end()) return Status::NotFound("node not found: " + slug);
    *out = it->second;
    return Status::OK();
  }

  Status OutgoingEdges(const std::string& slug, std::vector<Edge>* out) const override {
    out->clear();
    for (const auto& [key, edge] : edges_) {
      if (std::get<0>(key) == slug) out->push_back(edge);
    }
    return Status::OK();
  }

  Status IncomingEdges(const std::string& slug, std::vector<Edge>* out) const override {
    out->clear();
    std::map<std::tuple<std::string, std::string>, Edge> ordered;
    for (const auto& [key, edge] : edges_) {
      if (std::get<1>(key) == slug) ordered[std::make_tuple(std::get<0>(key), std::get<2>(key))] = edge;
    }
    for (auto& [key, edge] : ordered) out->push_back(std::move(edge));
    return Status::OK();
  }

 private:
  std::map<std::string, Node> nodes_;
  std::map<std::tuple<std::string, std::string, std::string>, Edge> edges_;
};

// =============================================================================
// Recording metrics sink
// =============================================================================

class RecordingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[std::string(name)].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[std::string(name)] = value;
  }

  uint64_t CounterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  size_t HistogramCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? 0 : it->second.size();
  }

  bool HasGauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gauges_.count(name) > 0;
  }

  double GaugeValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    return it == gauges_.end() ? 0.0 : it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, std::vector<uint64_t>> histograms_;
  std::map<std::string, double> gauges_;
};

// =============================================================================
// Test Result Aggregation (for thread-safe assertions)
// =============================================================================

/**
 * Thread-safe result collector for concurrent tests.
 * Collects results from multiple threads for assertion on main thread.
 */
class TestResultCollector {
 public:
  void RecordSuccess() {
    success_count_.fetch_add(1);
  }

  void RecordFailure(const std::string& message = "") {
    failure_count_.fetch_add(1);
    if (!message.empty()) {
      std::lock_guard<std::mutex> lock(mutex_);
      failure_messages_.push_back(message);
    }
  }

  uint64_t SuccessCount() const { return success_count_.load(); }
  uint64_t FailureCount() const { return failure_count_.load(); }

  bool AllSucceeded() const { return FailureCount() == 0; }

  std::vector<std::string> GetFailureMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
  }

 private:
  std::atomic<uint64_t> success_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> failure_messages_;
};

// Use this instead of ASSERT_*/EXPECT_* inside threads
#define CHECK_AND_RECORD(collector, condition, fail_msg) \
  do { \
    if (condition) { \
      (collector).RecordSuccess(); \
    } else { \
      (collector).RecordFailure(fail_msg); \
    } \
  } while (0)

}  // namespace kgraph::testing
