#include "osm_indexer/indexer.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "Usage: osm_indexer --input <file.osm.pbf> [options]\n"
               "\n"
               "Options:\n"
               "  -i, --input <path>        Path to the source .osm.pbf file\n"
               "  -o, --output-dir <path>   Index directory (default: <input stem>.rtree)\n"
               "  -w, --ways                Also index way bounding boxes\n"
               "      --min <m>             Minimum node entries (default: 8)\n"
               "      --max <M>             Maximum node entries (default: 32)\n"
               "      --linear              Use the linear split\n"
               "  -f, --force               Rebuild even if an index already exists\n"
               "  -q, --quiet               Suppress progress logging\n"
               "  -h, --help                Show this help text\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  rtreedb::osm_indexer::IndexerConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "-i" || arg == "--input") {
      if (i + 1 >= argc) {
        std::cerr << "[osm_indexer] Missing value for --input" << std::endl;
        return 1;
      }
      config.input_pbf = fs::path(argv[++i]);
    } else if (arg == "-o" || arg == "--output-dir") {
      if (i + 1 >= argc) {
        std::cerr << "[osm_indexer] Missing value for --output-dir" << std::endl;
        return 1;
      }
      config.index_directory = fs::path(argv[++i]);
    } else if (arg == "--min" || arg == "--max") {
      if (i + 1 >= argc) {
        std::cerr << "[osm_indexer] Missing value for " << arg << std::endl;
        return 1;
      }
      try {
        const int value = std::stoi(argv[++i]);
        (arg == "--min" ? config.min_node_entries : config.max_node_entries) = value;
      } catch (const std::exception&) {
        std::cerr << "[osm_indexer] Invalid value for " << arg << ": " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "-w" || arg == "--ways") {
      config.index_ways = true;
    } else if (arg == "--linear") {
      config.linear_split = true;
    } else if (arg == "-f" || arg == "--force") {
      config.force_rebuild = true;
    } else if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
    } else {
      std::cerr << "[osm_indexer] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  return rtreedb::osm_indexer::run_indexer(config);
}
