#include "rtree_tool/tool.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <stdexcept>
#include <string_view>

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "Usage: rtree_tool <command> --index <dir> [options]\n"
               "\n"
               "Commands:\n"
               "  build       Index every line of --input (d values = point, 2d values = box)\n"
               "  query       List entries intersecting --rect\n"
               "  contains    List entries inside --rect\n"
               "  nearest     List entries nearest to --point\n"
               "  delete      Remove the entry with --id and --rect\n"
               "  dump        Print the tree\n"
               "  check       Verify the tree invariants\n"
               "  stats       Print header and store statistics\n"
               "\n"
               "Options:\n"
               "  -x, --index <dir>         Directory holding index.dat and index.res\n"
               "  -i, --input <path>        Coordinate file for build\n"
               "  -d, --dims <n>            Number of dimensions (default: 2)\n"
               "      --min <m>             Minimum node entries for build (default: 2)\n"
               "      --max <M>             Maximum node entries for build (default: 8)\n"
               "      --linear              Use the linear split for build\n"
               "  -r, --rect <values>       min..., max... (or a single point)\n"
               "  -p, --point <values>      Query point for nearest\n"
               "      --max-distance <v>    Upper bound for nearest\n"
               "      --id <n>              Entry id for delete\n"
               "  -l, --level <n>           Lowest level printed by dump (default: 0)\n"
               "  -q, --quiet               Suppress progress logging\n"
               "  -h, --help                Show this help text\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  rtreedb::tool::ToolConfig config;

  if (argc < 2) {
    print_usage();
    return 1;
  }

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg(argv[i]);
      const auto value = [&](const char* name) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(std::string("Missing value for ") + name);
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      }
      if (i == 1 && !arg.empty() && arg[0] != '-') {
        config.command = rtreedb::tool::parse_command(std::string(arg));
        if (config.command == rtreedb::tool::Command::kNone) {
          std::cerr << "[rtree_tool] Unknown command: " << arg << "\n";
          print_usage();
          return 1;
        }
      } else if (arg == "-x" || arg == "--index") {
        config.index_directory = fs::path(value("--index"));
      } else if (arg == "-i" || arg == "--input") {
        config.input = fs::path(value("--input"));
      } else if (arg == "-d" || arg == "--dims") {
        config.dimensions = static_cast<std::size_t>(std::stoul(value("--dims")));
      } else if (arg == "--min") {
        config.min_node_entries = std::stoi(value("--min"));
      } else if (arg == "--max") {
        config.max_node_entries = std::stoi(value("--max"));
      } else if (arg == "--linear") {
        config.linear_split = true;
      } else if (arg == "-r" || arg == "--rect") {
        config.rect = rtreedb::tool::parse_values(value("--rect"));
      } else if (arg == "-p" || arg == "--point") {
        config.point = rtreedb::tool::parse_values(value("--point"));
      } else if (arg == "--max-distance") {
        config.max_distance = std::stod(value("--max-distance"));
      } else if (arg == "--id") {
        config.id = std::stoll(value("--id"));
        config.has_id = true;
      } else if (arg == "-l" || arg == "--level") {
        config.min_level = std::stoi(value("--level"));
      } else if (arg == "-q" || arg == "--quiet") {
        config.quiet = true;
      } else {
        std::cerr << "[rtree_tool] Unrecognized argument: " << arg << "\n";
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "[rtree_tool] " << ex.what() << std::endl;
    return 1;
  }

  return rtreedb::tool::run_tool(config);
}
