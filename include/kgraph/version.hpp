#pragma once

#define KGRAPH_VERSION_MAJOR 0
#define KGRAPH_VERSION_MINOR 1
#define KGRAPH_VERSION_PATCH 0

#define KGRAPH_VERSION_STRING "0.1.0"

#define KGRAPH_VERSION \
  (KGRAPH_VERSION_MAJOR * 10000 + KGRAPH_VERSION_MINOR * 100 + KGRAPH_VERSION_PATCH)

// On-disk layout version, stored in the default column family.
#define KGRAPH_SCHEMA_VERSION 1

namespace kgraph {

inline const char* Version() { return KGRAPH_VERSION_STRING; }

}  // namespace kgraph
