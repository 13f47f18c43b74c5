#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kgraph {

// Result of embedding computation
struct EmbeddingResult {
  std::vector<float> embedding;
  bool success = false;
  std::string error_message;
};

/**
 * Text -> vector collaborator. The engine never ships a model; callers plug
 * one in through Options::embedder.
 *
 * Implementations must be safe to call from several threads at once. A failed
 * call reports success == false and leaves embedding empty.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Input is UTF-8 text.
  virtual EmbeddingResult Embed(std::string_view text) const = 0;

  // Length of every vector this embedder returns.
  virtual size_t Dimension() const = 0;
};

}  // namespace kgraph
