#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <kgraph/graph_store.hpp>
#include <kgraph/internal.hpp>

namespace kgraph::internal {

/**
 * Per-call observability for a public GraphStore operation.
 *
 * On construction emits kgraph.<op>.calls and starts span "kgraph.<Op>";
 * Finish() emits kgraph.<op>.latency_us, one kgraph.<op>.<code>_total
 * outcome counter, and ends the span with the returned status.
 */
class OpScope {
 public:
  OpScope(const Options& opt, std::string_view op, std::string_view span_name)
      : opt_(opt), op_(op), start_us_(NowMicros()) {
    Counter("calls");
    if (opt_.tracer) span_ = opt_.tracer->StartSpan(span_name);
  }

  OpScope(const OpScope&) = delete;
  OpScope& operator=(const OpScope&) = delete;

  void Attr(std::string_view key, uint64_t value) {
    if (span_) span_->SetAttribute(key, value);
  }

  void Attr(std::string_view key, std::string_view value) {
    if (span_) span_->SetAttribute(key, value);
  }

  void Event(std::string_view name) {
    if (span_) span_->AddEvent(name);
  }

  void Counter(std::string_view suffix, uint64_t delta = 1) {
    if (opt_.metrics) opt_.metrics->Counter(MetricName(suffix), delta);
  }

  void Histogram(std::string_view suffix, uint64_t value) {
    if (opt_.metrics) opt_.metrics->Histogram(MetricName(suffix), value);
  }

  Status Finish(const Status& st) {
    const uint64_t dur_us = NowMicros() - start_us_;
    Histogram("latency_us", dur_us);

    std::string outcome(st.CodeName());
    outcome += "_total";
    Counter(outcome);

    if (span_) {
      span_->SetAttribute("latency_us", dur_us);
      span_->SetAttribute("status", st.CodeName());
      span_->End(st);
      span_.reset();
    }
    return st;
  }

 private:
  std::string MetricName(std::string_view suffix) const {
    std::string name = "kgraph.";
    name.append(op_);
    name.push_back('.');
    name.append(suffix);
    return name;
  }

  const Options& opt_;
  std::string_view op_;
  uint64_t start_us_;
  std::unique_ptr<TraceSpan> span_;
};

}  // namespace kgraph::internal
