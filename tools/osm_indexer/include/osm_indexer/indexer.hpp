#pragma once

#include <filesystem>

namespace rtreedb::osm_indexer {

struct IndexerConfig {
  std::filesystem::path input_pbf;
  std::filesystem::path index_directory;
  int min_node_entries = 8;
  int max_node_entries = 32;
  bool index_ways = false;
  bool linear_split = false;
  bool force_rebuild = false;
  bool quiet = false;
};

// Nodes are indexed as points keyed by their OSM id. Ways, when enabled, are
// indexed as the bounding box of their node locations keyed by -(way id).
int run_indexer(const IndexerConfig& config);

}  // namespace rtreedb::osm_indexer
