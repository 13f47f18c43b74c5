#include <kgraph/similarity_index.hpp>

#ifdef KGRAPH_WITH_HNSWLIB

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <unordered_set>

#include <kgraph/internal.hpp>

namespace kgraph::internal {

namespace {

// HNSW implementation using hnswlib. Vectors are stored unit length in an
// inner-product space, so distance == 1 - cosine similarity.
class HNSWIndex : public SimilarityIndex {
 public:
  HNSWIndex(size_t dimension, size_t max_elements, int m, int ef_construction)
      : dimension_(dimension),
        max_elements_(std::max<size_t>(max_elements, 16)),
        m_(m),
        ef_construction_(ef_construction),
        ef_search_(50) {
    space_ = std::make_unique<hnswlib::InnerProductSpace>(dimension);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), max_elements_, m, ef_construction);
    index_->setEf(ef_search_);
  }

  bool Upsert(const std::string& slug, const std::string& node_type,
              const std::vector<float>& embedding) override {
    if (embedding.size() != dimension_) return false;
    const std::vector<float> unit = Normalized(embedding);

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = slug_to_label_.find(slug);
    if (existing != slug_to_label_.end()) {
      hnswlib::labeltype old_label = existing->second;
      // Same vector: only the type tag moved.
      try {
        if (index_->getDataByLabel<float>(old_label) == unit) {
          labels_[old_label].node_type = node_type;
          return true;
        }
      } catch (const std::exception&) {
        return false;
      }
      SoftDeleteLocked(old_label);
    }

    // Grow index if needed
    if (current_count_ >= max_elements_) {
      size_t new_max = max_elements_ * 2;
      try {
        index_->resizeIndex(new_max);
      } catch (const std::exception&) {
        return false;
      }
      max_elements_ = new_max;
    }

    // Use internal label (sequential ID)
    hnswlib::labeltype label = current_count_;

    try {
      index_->addPoint(unit.data(), label);
    } catch (const std::exception&) {
      return false;
    }

    labels_[label] = LabelEntry{slug, node_type};
    slug_to_label_[slug] = label;
    current_count_++;
    return true;
  }

  bool Remove(const std::string& slug) override {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slug_to_label_.find(slug);
    if (it == slug_to_label_.end()) {
      return false;
    }
    SoftDeleteLocked(it->second);
    return true;
  }

  std::vector<SearchHit> Search(const std::vector<float>& query, size_t k,
                                const std::string* node_type) const override {
    if (query.size() != dimension_) return {};
    const std::vector<float> q = Normalized(query);

    std::lock_guard<std::mutex> lock(mutex_);

    const size_t live = slug_to_label_.size();
    if (live == 0) return {};
    size_t search_k = (k == 0) ? live : std::min(k, live);

    // ef must cover k, otherwise hnswlib silently returns fewer results.
    index_->setEf(std::max(static_cast<size_t>(ef_search_), search_k));

    LiveFilter filter(this, node_type);
    std::priority_queue<std::pair<float, hnswlib::labeltype>> result;
    try {
      result = index_->searchKnn(q.data(), search_k, &filter);
    } catch (const std::exception&) {
      index_->setEf(ef_search_);
      return {};
    }
    index_->setEf(ef_search_);

    std::vector<SearchHit> hits;
    hits.reserve(result.size());
    while (!result.empty()) {
      auto [distance, label] = result.top();
      result.pop();

      auto it = labels_.find(label);
      if (it == labels_.end()) continue;
      hits.push_back({it->second.slug, it->second.node_type, 1.0f - distance});
    }

    SortHits(&hits);
    return hits;
  }

  bool Contains(const std::string& slug) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return slug_to_label_.count(slug) > 0;
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return slug_to_label_.size();
  }

  size_t Dimension() const override {
    return dimension_;
  }

  size_t DeletedCount() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return deleted_labels_.size();
  }

  void SetSearchParam(const std::string& key, int value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (key == "ef_search" || key == "ef") {
      ef_search_ = value;
      index_->setEf(value);
    }
  }

  bool Compact() override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (deleted_labels_.empty()) {
      return true;  // Nothing to compact
    }

    try {
      // Build a new index with only live entries
      auto new_space = std::make_unique<hnswlib::InnerProductSpace>(dimension_);
      size_t live_count = slug_to_label_.size();
      size_t new_max = std::max(live_count * 2, static_cast<size_t>(16));

      auto new_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
          new_space.get(), new_max, m_, ef_construction_);
      new_index->setEf(ef_search_);

      std::unordered_map<hnswlib::labeltype, LabelEntry> new_labels;
      std::unordered_map<std::string, hnswlib::labeltype> new_slug_to_label;

      hnswlib::labeltype new_label = 0;
      for (const auto& [slug, old_label] : slug_to_label_) {
        std::vector<float> embedding = index_->getDataByLabel<float>(old_label);
        if (embedding.empty()) continue;

        new_index->addPoint(embedding.data(), new_label);
        new_labels[new_label] = labels_[old_label];
        new_slug_to_label[slug] = new_label;
        new_label++;
      }

      // Swap in the new data structures
      index_ = std::move(new_index);
      space_ = std::move(new_space);
      labels_ = std::move(new_labels);
      slug_to_label_ = std::move(new_slug_to_label);
      deleted_labels_.clear();
      current_count_ = new_label;
      max_elements_ = new_max;

      return true;
    } catch (const std::exception&) {
      return false;
    }
  }

  void Clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), max_elements_, m_, ef_construction_);
    index_->setEf(ef_search_);
    labels_.clear();
    slug_to_label_.clear();
    deleted_labels_.clear();
    current_count_ = 0;
  }

 private:
  struct LabelEntry {
    std::string slug;
    std::string node_type;
  };

  // Admits live labels, optionally of one node type. Runs under mutex_.
  class LiveFilter : public hnswlib::BaseFilterFunctor {
   public:
    LiveFilter(const HNSWIndex* owner, const std::string* node_type)
        : owner_(owner), node_type_(node_type) {}

    bool operator()(hnswlib::labeltype id) override {
      if (owner_->deleted_labels_.count(id)) return false;
      if (!node_type_) return true;
      auto it = owner_->labels_.find(id);
      return it != owner_->labels_.end() && it->second.node_type == *node_type_;
    }

   private:
    const HNSWIndex* owner_;
    const std::string* node_type_;
  };

  // caller must hold mutex
  void SoftDeleteLocked(hnswlib::labeltype label) {
    auto it = labels_.find(label);
    if (it != labels_.end()) {
      slug_to_label_.erase(it->second.slug);
      labels_.erase(it);
    }
    if (deleted_labels_.insert(label).second) {
      index_->markDelete(label);
    }
  }

  size_t dimension_;
  size_t max_elements_;
  int m_;
  int ef_construction_;
  int ef_search_;

  std::unique_ptr<hnswlib::InnerProductSpace> space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;

  std::unordered_map<hnswlib::labeltype, LabelEntry> labels_;
  std::unordered_map<std::string, hnswlib::labeltype> slug_to_label_;
  std::unordered_set<hnswlib::labeltype> deleted_labels_;

  size_t current_count_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace

std::unique_ptr<SimilarityIndex> CreateHNSWIndex(
    size_t dimension,
    size_t max_elements,
    int m,
    int ef_construction) {
  return std::make_unique<HNSWIndex>(dimension, max_elements, m, ef_construction);
}

}  // namespace kgraph::internal

#endif  // KGRAPH_WITH_HNSWLIB
