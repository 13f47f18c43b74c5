#pragma once

#include <kgraph/graph_store.hpp>
#include <kgraph/logging.hpp>

#include <string>

namespace kgraph {

/**
 * Engine configuration: where the store lives, its Options, and logging.
 *
 * The file format is a flat sectioned "key: value" file:
 *
 *   store:
 *     path: /var/lib/kgraph
 *     block_cache_bytes: 268435456
 *   graph:
 *     embedding_dimension: 1536
 *     node_types: product, service, database
 *   index:
 *     type: hnsw
 *   logging:
 *     level: info
 *
 * Runtime-only Options (embedder, metrics, tracer) are not configurable here.
 */
struct EngineConfig {
  std::string db_path;
  Options store;
  LoggingConfig logging;

  /**
   * Load configuration from a file.
   * @throws std::runtime_error if the file cannot be read, a key is unknown,
   *         or a value does not parse.
   */
  static EngineConfig LoadFromFile(const std::string& path);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace kgraph
