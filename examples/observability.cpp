#include <kgraph/graph_store.hpp>
#include <kgraph/logging.hpp>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Groups the store's "kgraph.<op>.<metric>" names by operation and prints one
// row per op: calls, outcome counters, and latency percentiles.
//
// A real deployment would forward to Prometheus, OpenTelemetry, StatsD, etc.
class PerOpMetrics final : public kgraph::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto [op, metric] = Split(name);
    ops_[op].counters[metric] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto [op, metric] = Split(name);
    ops_[op].samples[metric].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[std::string(name)] = value;
  }

  void Report(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    os << "\n" << std::left << std::setw(18) << "operation" << std::setw(8) << "calls"
       << std::setw(10) << "p50_us" << std::setw(10) << "max_us" << "outcomes\n";
    for (const auto& [op, stats] : ops_) {
      auto calls = stats.counters.find("calls");
      if (calls == stats.counters.end()) continue;  // index/cache internals

      uint64_t p50 = 0;
      uint64_t max = 0;
      auto lat = stats.samples.find("latency_us");
      if (lat != stats.samples.end() && !lat->second.empty()) {
        std::vector<uint64_t> sorted = lat->second;
        std::sort(sorted.begin(), sorted.end());
        p50 = sorted[sorted.size() / 2];
        max = sorted.back();
      }

      os << std::setw(18) << op << std::setw(8) << calls->second << std::setw(10) << p50
         << std::setw(10) << max;
      for (const auto& [metric, count] : stats.counters) {
        if (metric == "calls") continue;
        os << metric << "=" << count << " ";
      }
      os << "\n";
    }

    os << "\n";
    for (const auto& [name, value] : gauges_) {
      os << name << " = " << value << "\n";
    }
  }

 private:
  struct OpStats {
    std::map<std::string, uint64_t> counters;
    std::map<std::string, std::vector<uint64_t>> samples;
  };

  // "kgraph.create_edge.latency_us" -> {"create_edge", "latency_us"}
  static std::pair<std::string, std::string> Split(std::string_view name) {
    if (name.substr(0, 7) == "kgraph.") name.remove_prefix(7);
    size_t dot = name.find('.');
    if (dot == std::string_view::npos) return {std::string(name), ""};
    return {std::string(name.substr(0, dot)), std::string(name.substr(dot + 1))};
  }

  mutable std::mutex mu_;
  std::map<std::string, OpStats> ops_;
  std::map<std::string, double> gauges_;
};

// Spans go to the kgraph logger at debug level; failed ones at warn.
class LoggingSpan final : public kgraph::TraceSpan {
 public:
  explicit LoggingSpan(std::string_view name) : name_(name) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    fields_.push_back(kgraph::IntField(key, static_cast<int64_t>(value)));
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    fields_.push_back(kgraph::StringField(key, value));
  }

  void AddEvent(std::string_view name) override {
    fields_.push_back(kgraph::StringField("event", name));
  }

  void End(const kgraph::Status& status) override {
    std::string line = "span " + name_;
    for (const auto& f : fields_) line += " " + f.key + "=" + f.value;
    if (status.ok()) {
      KGRAPH_LOG_DEBUG(line);
    } else {
      KGRAPH_LOG_WARN(line, {kgraph::StringField("error", status.message())});
    }
  }

 private:
  std::string name_;
  std::vector<kgraph::LogField> fields_;
};

class LoggingTracer final : public kgraph::Tracer {
 public:
  std::unique_ptr<kgraph::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<LoggingSpan>(name);
  }
};

}  // namespace

int main() {
  kgraph::LoggingConfig logging;
  logging.level = "debug";
  kgraph::InitializeLogging(logging);

  auto metrics = std::make_shared<PerOpMetrics>();

  kgraph::Options opt;
  opt.embedding_dimension = 3;
  opt.index_type = kgraph::SimilarityIndexType::kExact;
  opt.metrics = metrics;
  opt.tracer = std::make_shared<LoggingTracer>();

  std::unique_ptr<kgraph::GraphStore> db;
  auto s = kgraph::GraphStore::Open("./kgraph_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  // A few ops to generate signals. Some of them are expected to fail.
  kgraph::NodeUpsert svc;
  svc.slug = "service:api";
  svc.node_type = "service";
  svc.title = "Graph API";
  s = db->UpsertNode(svc);
  if (!s.ok()) std::cerr << "UpsertNode failed: " << s.ToString() << "\n";

  kgraph::NodeUpsert dbnode;
  dbnode.slug = "database:main";
  dbnode.node_type = "database";
  s = db->UpsertNode(dbnode);
  if (!s.ok()) std::cerr << "UpsertNode failed: " << s.ToString() << "\n";

  s = db->SetEmbedding("service:api", {1.0f, 0.0f, 0.0f});
  if (!s.ok()) std::cerr << "SetEmbedding failed: " << s.ToString() << "\n";

  kgraph::EdgeCreate edge;
  edge.src_slug = "service:api";
  edge.dst_slug = "database:main";
  edge.edge_type = "stores_data_in";
  s = db->CreateEdge(edge);
  if (!s.ok()) std::cerr << "CreateEdge failed: " << s.ToString() << "\n";
  s = db->CreateEdge(edge);  // duplicate, ignored
  if (!s.ok()) std::cerr << "CreateEdge failed: " << s.ToString() << "\n";

  edge.dst_slug = "database:missing";
  s = db->CreateEdge(edge);  // dangling reference

  std::vector<kgraph::SearchHit> hits;
  s = db->Search({0.9f, 0.1f, 0.0f}, kgraph::SearchOptions{}, &hits);
  if (!s.ok()) std::cerr << "Search failed: " << s.ToString() << "\n";

  kgraph::NeighborQuery q;
  q.max_depth = 9;  // over the limit
  std::vector<kgraph::NeighborResult> neighbors;
  s = db->Neighbors("service:api", q, &neighbors);

  db->EmitStoreMetrics();
  metrics->Report(std::cout);
  return 0;
}
