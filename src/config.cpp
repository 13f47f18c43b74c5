#include <kgraph/config.hpp>

#include <fstream>
#include <stdexcept>

#include <kgraph/internal.hpp>

namespace kgraph {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

[[noreturn]] void BadValue(const std::string& section, const std::string& key,
                           const std::string& value, const std::string& expected) {
  throw std::runtime_error("Invalid value for " + section + "." + key + ": '" + value +
                           "' (expected " + expected + ")");
}

uint64_t ParseUnsigned(const std::string& section, const std::string& key,
                       const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    BadValue(section, key, value, "an unsigned integer");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    BadValue(section, key, value, "an unsigned integer");
  }
}

int ParseInt(const std::string& section, const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != value.size()) BadValue(section, key, value, "an integer");
    return parsed;
  } catch (const std::logic_error&) {
    BadValue(section, key, value, "an integer");
  }
}

double ParseDouble(const std::string& section, const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    double parsed = std::stod(value, &used);
    if (used != value.size()) BadValue(section, key, value, "a number");
    return parsed;
  } catch (const std::logic_error&) {
    BadValue(section, key, value, "a number");
  }
}

bool ParseBool(const std::string& section, const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  BadValue(section, key, value, "true or false");
}

std::vector<std::string> ParseList(const std::string& value) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t comma = value.find(',', pos);
    if (comma == std::string::npos) comma = value.size();
    std::string item = Trim(value.substr(pos, comma - pos));
    if (!item.empty()) items.push_back(std::move(item));
    pos = comma + 1;
  }
  return items;
}

[[noreturn]] void UnknownKey(const std::string& section, const std::string& key) {
  if (section.empty()) throw std::runtime_error("Unknown config key: " + key);
  throw std::runtime_error("Unknown config key: " + section + "." + key);
}

void ApplyStoreKey(EngineConfig* config, const std::string& key, const std::string& value) {
  const std::string section = "store";
  if (key == "path") {
    config->db_path = value;
  } else if (key == "block_cache_bytes") {
    config->store.block_cache_bytes = ParseUnsigned(section, key, value);
  } else if (key == "bloom_bits_per_key") {
    config->store.bloom_bits_per_key = ParseInt(section, key, value);
  } else if (key == "lock_timeout_ms") {
    config->store.lock_timeout_ms = ParseInt(section, key, value);
  } else if (key == "mutation_source") {
    config->store.mutation_source = value;
  } else {
    UnknownKey(section, key);
  }
}

void ApplyGraphKey(EngineConfig* config, const std::string& key, const std::string& value) {
  const std::string section = "graph";
  Options& opt = config->store;
  if (key == "embedding_dimension") {
    opt.embedding_dimension = ParseUnsigned(section, key, value);
  } else if (key == "node_types") {
    opt.node_types = ParseList(value);
  } else if (key == "edge_types") {
    opt.edge_types = ParseList(value);
  } else if (key == "allow_custom_types") {
    opt.allow_custom_types = ParseBool(section, key, value);
  } else if (key == "allow_dangling_edges") {
    opt.allow_dangling_edges = ParseBool(section, key, value);
  } else if (key == "duplicate_edge_policy") {
    if (value == "ignore") {
      opt.duplicate_edge_policy = DuplicateEdgePolicy::kIgnore;
    } else if (value == "reject") {
      opt.duplicate_edge_policy = DuplicateEdgePolicy::kReject;
    } else {
      BadValue(section, key, value, "ignore or reject");
    }
  } else if (key == "max_traversal_depth") {
    opt.max_traversal_depth = ParseInt(section, key, value);
  } else if (key == "path_direction") {
    if (!ParseDirection(value, &opt.path_direction)) {
      BadValue(section, key, value, "outgoing, incoming or both");
    }
  } else if (key == "auto_embed") {
    opt.auto_embed = ParseBool(section, key, value);
  } else if (key == "embed_max_text_bytes") {
    opt.embed_max_text_bytes = ParseUnsigned(section, key, value);
  } else {
    UnknownKey(section, key);
  }
}

void ApplyIndexKey(EngineConfig* config, const std::string& key, const std::string& value) {
  const std::string section = "index";
  Options& opt = config->store;
  if (key == "type") {
    if (value == "hnsw") {
      opt.index_type = SimilarityIndexType::kHNSW;
    } else if (value == "exact") {
      opt.index_type = SimilarityIndexType::kExact;
    } else {
      BadValue(section, key, value, "hnsw or exact");
    }
  } else if (key == "m") {
    opt.hnsw_m = ParseInt(section, key, value);
  } else if (key == "ef_construction") {
    opt.hnsw_ef_construction = ParseInt(section, key, value);
  } else if (key == "ef_search") {
    opt.hnsw_ef_search = ParseInt(section, key, value);
  } else if (key == "compact_ratio") {
    opt.index_compact_ratio = ParseDouble(section, key, value);
  } else {
    UnknownKey(section, key);
  }
}

void ApplyLoggingKey(EngineConfig* config, const std::string& key, const std::string& value) {
  if (key == "level") {
    config->logging.level = value;
  } else if (key == "pattern") {
    config->logging.pattern = value;
  } else {
    UnknownKey("logging", key);
  }
}

void ValidateTags(const std::vector<std::string>& tags, const char* key) {
  for (const auto& tag : tags) {
    if (!internal::IsValidTypeTag(tag)) {
      throw std::runtime_error(std::string("Invalid type tag in graph.") + key + ": '" + tag +
                               "' (must match [a-z][a-z0-9_]*)");
    }
  }
}

}  // namespace

EngineConfig EngineConfig::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  EngineConfig config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      if (key != "store" && key != "graph" && key != "index" && key != "logging") {
        throw std::runtime_error("Unknown config section: " + key);
      }
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "store") {
      ApplyStoreKey(&config, key, value);
    } else if (current_section == "graph") {
      ApplyGraphKey(&config, key, value);
    } else if (current_section == "index") {
      ApplyIndexKey(&config, key, value);
    } else if (current_section == "logging") {
      ApplyLoggingKey(&config, key, value);
    } else if (key == "db_path") {
      // Top-level keys
      config.db_path = value;
    } else {
      UnknownKey(current_section, key);
    }
  }

  return config;
}

void EngineConfig::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("store.path is required");
  }

  if (store.embedding_dimension == 0) {
    throw std::runtime_error("graph.embedding_dimension must be positive");
  }
  if (store.max_traversal_depth < 1) {
    throw std::runtime_error("graph.max_traversal_depth must be at least 1");
  }
  if (store.embed_max_text_bytes == 0) {
    throw std::runtime_error("graph.embed_max_text_bytes must be positive");
  }
  if (store.lock_timeout_ms <= 0) {
    throw std::runtime_error("store.lock_timeout_ms must be positive");
  }
  if (store.bloom_bits_per_key < 0) {
    throw std::runtime_error("store.bloom_bits_per_key must not be negative");
  }

  ValidateTags(store.node_types, "node_types");
  ValidateTags(store.edge_types, "edge_types");
  if (!store.allow_custom_types && (store.node_types.empty() || store.edge_types.empty())) {
    throw std::runtime_error(
        "graph.node_types and graph.edge_types must not be empty unless "
        "graph.allow_custom_types is true");
  }

  if (store.hnsw_m < 2 || store.hnsw_ef_construction < 1 || store.hnsw_ef_search < 1) {
    throw std::runtime_error("index.m must be at least 2; ef_construction and ef_search at least 1");
  }
  if (!(store.index_compact_ratio > 0.0)) {
    throw std::runtime_error("index.compact_ratio must be positive");
  }

  // Validate log level
  if (logging.level != "debug" && logging.level != "info" &&
      logging.level != "warn" && logging.level != "error") {
    throw std::runtime_error("Invalid logging.level: " + logging.level +
                             " (must be debug, info, warn, or error)");
  }
}

}  // namespace kgraph
