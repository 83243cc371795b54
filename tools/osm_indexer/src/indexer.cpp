#include "osm_indexer/indexer.hpp"

#include "rtree/rtree.hpp"
#include "storage/file_page_store.hpp"

#include <osmium/handler.hpp>
#include <osmium/io/pbf_input.hpp>
#include <osmium/io/reader.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/visitor.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rtreedb::osm_indexer {
namespace {

using osm_id = osmium::object_id_type;

struct IndexStats {
  std::size_t nodes = 0;
  std::size_t ways = 0;
  std::size_t ways_without_locations = 0;
};

class NodeIndexer final : public osmium::handler::Handler {
 public:
  NodeIndexer(RTree& tree, IndexStats& stats, bool keep_locations)
      : tree_(tree), stats_(stats), keep_locations_(keep_locations) {}

  void node(const osmium::Node& node) {
    if (!node.location().valid()) {
      return;
    }

    const double lon = node.location().lon();
    const double lat = node.location().lat();
    tree_.add(node.id(), Rectangle(Point(lon, lat)));
    ++stats_.nodes;

    if (keep_locations_) {
      locations_.emplace(node.id(), std::make_pair(lon, lat));
    }
  }

  [[nodiscard]] const std::unordered_map<osm_id, std::pair<double, double>>& locations() const {
    return locations_;
  }

 private:
  RTree& tree_;
  IndexStats& stats_;
  bool keep_locations_;
  std::unordered_map<osm_id, std::pair<double, double>> locations_;
};

class WayIndexer final : public osmium::handler::Handler {
 public:
  WayIndexer(RTree& tree, IndexStats& stats,
             const std::unordered_map<osm_id, std::pair<double, double>>& locations)
      : tree_(tree), stats_(stats), locations_(locations) {}

  void way(const osmium::Way& way) {
    bool found = false;
    double min_lon = 0.0;
    double min_lat = 0.0;
    double max_lon = 0.0;
    double max_lat = 0.0;

    for (const auto& node_ref : way.nodes()) {
      const auto it = locations_.find(node_ref.ref());
      if (it == locations_.end()) {
        continue;
      }
      const auto [lon, lat] = it->second;
      if (!found) {
        min_lon = max_lon = lon;
        min_lat = max_lat = lat;
        found = true;
      } else {
        min_lon = std::min(min_lon, lon);
        min_lat = std::min(min_lat, lat);
        max_lon = std::max(max_lon, lon);
        max_lat = std::max(max_lat, lat);
      }
    }

    if (!found) {
      ++stats_.ways_without_locations;
      return;
    }

    tree_.add(-way.id(), Rectangle(min_lon, min_lat, max_lon, max_lat));
    ++stats_.ways;
  }

 private:
  RTree& tree_;
  IndexStats& stats_;
  const std::unordered_map<osm_id, std::pair<double, double>>& locations_;
};

IndexStats build_index(const fs::path& input, RTree& tree, bool index_ways) {
  IndexStats stats;

  NodeIndexer node_handler{tree, stats, index_ways};
  {
    osmium::io::Reader node_reader{input, osmium::osm_entity_bits::node};
    osmium::apply(node_reader, node_handler);
    node_reader.close();
  }

  if (index_ways) {
    osmium::io::Reader way_reader{input, osmium::osm_entity_bits::way};
    WayIndexer way_handler{tree, stats, node_handler.locations()};
    osmium::apply(way_reader, way_handler);
    way_reader.close();
  }

  return stats;
}

}  // namespace

int run_indexer(const IndexerConfig& config) {
  if (config.input_pbf.empty()) {
    std::cerr << "[osm_indexer] Missing --input argument" << std::endl;
    return 1;
  }

  if (!fs::exists(config.input_pbf)) {
    std::cerr << "[osm_indexer] Input file does not exist: " << config.input_pbf << std::endl;
    return 1;
  }

  fs::path output_dir = config.index_directory;
  if (output_dir.empty()) {
    output_dir = fs::current_path() / (config.input_pbf.stem().string() + ".rtree");
  }

  const fs::path data_path = output_dir / "index.dat";
  const fs::path header_path = output_dir / "index.res";

  if (fs::exists(header_path) && !config.force_rebuild) {
    if (!config.quiet) {
      std::cout << "[osm_indexer] Existing index found; skipping " << output_dir << std::endl;
    }
    return 0;
  }

  try {
    fs::create_directories(output_dir);
    fs::remove(header_path);
  } catch (const std::exception& ex) {
    std::cerr << "[osm_indexer] Failed to prepare output directory: " << ex.what() << std::endl;
    return 1;
  }

  if (!config.quiet) {
    std::cout << "[osm_indexer] Indexing " << config.input_pbf << " -> " << output_dir << std::endl;
  }

  const auto start_time = std::chrono::steady_clock::now();

  IndexStats stats;
  try {
    storage::FilePageStore::Config store_config;
    store_config.truncate = true;
    storage::FilePageStore store(data_path, 2, static_cast<std::size_t>(config.max_node_entries), store_config);

    RTree::Options options;
    options.split_algorithm = config.linear_split ? SplitAlgorithm::kLinear : SplitAlgorithm::kQuadratic;
    options.verbose = !config.quiet;
    RTree tree(2, store, header_path, options);
    tree.init(StorageKind::kDisk, config.min_node_entries, config.max_node_entries);

    stats = build_index(config.input_pbf, tree, config.index_ways);
    tree.close();
    store.close();
  } catch (const std::exception& ex) {
    std::cerr << "[osm_indexer] Indexing failed: " << ex.what() << std::endl;
    return 1;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time);

  if (!config.quiet) {
    std::cout << "[osm_indexer] Indexed " << stats.nodes << " nodes, " << stats.ways << " ways in "
              << elapsed.count() << "ms" << std::endl;
    if (stats.ways_without_locations > 0) {
      std::cerr << "Warning: " << stats.ways_without_locations
                << " ways had no node locations and were skipped." << std::endl;
    }
  }

  return 0;
}

}  // namespace rtreedb::osm_indexer
