#include <kgraph/similarity_index.hpp>

#include <algorithm>
#include <map>
#include <mutex>

#include <kgraph/internal.hpp>

namespace kgraph::internal {

void SortHits(std::vector<SearchHit>* hits) {
  std::sort(hits->begin(), hits->end(), [](const SearchHit& a, const SearchHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.slug < b.slug;
  });
}

namespace {

class ExactIndex : public SimilarityIndex {
 public:
  explicit ExactIndex(size_t dimension) : dimension_(dimension) {}

  bool Upsert(const std::string& slug, const std::string& node_type,
              const std::vector<float>& embedding) override {
    if (embedding.size() != dimension_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[slug] = Entry{node_type, Normalized(embedding)};
    return true;
  }

  bool Remove(const std::string& slug) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(slug) > 0;
  }

  std::vector<SearchHit> Search(const std::vector<float>& query, size_t k,
                                const std::string* node_type) const override {
    if (query.size() != dimension_) return {};
    const std::vector<float> q = Normalized(query);

    std::vector<SearchHit> hits;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hits.reserve(entries_.size());
      for (const auto& [slug, entry] : entries_) {
        if (node_type && entry.node_type != *node_type) continue;
        hits.push_back({slug, entry.node_type, Dot(q, entry.vector)});
      }
    }

    if (k != 0 && hits.size() > k) {
      auto cmp = [](const SearchHit& a, const SearchHit& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.slug < b.slug;
      };
      std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k),
                        hits.end(), cmp);
      hits.resize(k);
    } else {
      SortHits(&hits);
    }
    return hits;
  }

  bool Contains(const std::string& slug) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(slug) > 0;
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  size_t Dimension() const override { return dimension_; }

  size_t DeletedCount() const override { return 0; }

  void SetSearchParam(const std::string&, int) override {}

  bool Compact() override { return true; }

  void Clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

 private:
  struct Entry {
    std::string node_type;
    std::vector<float> vector;  // unit length
  };

  size_t dimension_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

}  // namespace

std::unique_ptr<SimilarityIndex> CreateExactIndex(size_t dimension) {
  return std::make_unique<ExactIndex>(dimension);
}

}  // namespace kgraph::internal
