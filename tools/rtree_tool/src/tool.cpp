#include "rtree_tool/tool.hpp"

#include "rtree/rtree.hpp"
#include "rtree/tree_header.hpp"
#include "storage/file_page_store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace rtreedb::tool {
namespace {

constexpr const char* kDataFile = "index.dat";
constexpr const char* kHeaderFile = "index.res";

// Page store and tree opened together over one index directory.
struct OpenIndex {
  std::unique_ptr<storage::FilePageStore> store;
  std::unique_ptr<RTree> tree;

  void close() {
    tree->close();
    store->close();
  }
};

RTree::Options tree_options(const ToolConfig& config) {
  RTree::Options options;
  options.split_algorithm = config.linear_split ? SplitAlgorithm::kLinear : SplitAlgorithm::kQuadratic;
  options.verbose = !config.quiet;
  options.log_callback = [quiet = config.quiet](const std::string& message, bool is_error) {
    if (is_error) {
      std::cerr << "[rtree_tool] " << message << std::endl;
    } else if (!quiet) {
      std::cout << "[rtree_tool] " << message << std::endl;
    }
  };
  return options;
}

OpenIndex create_index(const ToolConfig& config) {
  const fs::path dir = config.index_directory;
  fs::create_directories(dir);
  fs::remove(dir / kHeaderFile);

  storage::FilePageStore::Config store_config;
  store_config.truncate = true;

  OpenIndex index;
  index.store = std::make_unique<storage::FilePageStore>(
      dir / kDataFile, config.dimensions, static_cast<std::size_t>(config.max_node_entries), store_config);
  index.tree = std::make_unique<RTree>(config.dimensions, *index.store, dir / kHeaderFile, tree_options(config));
  index.tree->init(StorageKind::kDisk, config.min_node_entries, config.max_node_entries);
  return index;
}

OpenIndex open_index(const ToolConfig& config) {
  const fs::path dir = config.index_directory;
  if (!fs::exists(dir / kHeaderFile)) {
    throw std::runtime_error("No index found in " + dir.string());
  }

  // The page size depends on the persisted fan-out.
  const TreeHeader header = tree_header::read(dir / kHeaderFile);
  if (header.max_node_entries < 2) {
    throw ConfigurationError("Index header carries an invalid fan-out");
  }

  OpenIndex index;
  index.store = std::make_unique<storage::FilePageStore>(
      dir / kDataFile, config.dimensions, static_cast<std::size_t>(header.max_node_entries));
  index.tree = std::make_unique<RTree>(config.dimensions, *index.store, dir / kHeaderFile, tree_options(config));
  index.tree->init(StorageKind::kDisk, header.min_node_entries, header.max_node_entries);
  return index;
}

Rectangle rect_from(const std::vector<double>& values, std::size_t dimensions) {
  if (values.size() == dimensions) {
    return Rectangle(Point(values));
  }
  if (values.size() == 2 * dimensions) {
    return Rectangle(std::vector<double>(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(dimensions)),
                     std::vector<double>(values.begin() + static_cast<std::ptrdiff_t>(dimensions), values.end()));
  }
  throw std::invalid_argument("Expected " + std::to_string(dimensions) + " or " + std::to_string(2 * dimensions) +
                              " coordinates, got " + std::to_string(values.size()));
}

void print_entries(const std::vector<Entry>& entries) {
  for (const auto& entry : entries) {
    std::cout << entry.id << '\t' << entry.mbr.to_string() << '\n';
  }
  std::cout << entries.size() << " result(s)" << std::endl;
}

int run_build(const ToolConfig& config) {
  if (config.input.empty()) {
    std::cerr << "[rtree_tool] Missing --input argument" << std::endl;
    return 1;
  }
  std::ifstream in(config.input);
  if (!in) {
    std::cerr << "[rtree_tool] Cannot open input file: " << config.input << std::endl;
    return 1;
  }

  const auto start_time = std::chrono::steady_clock::now();
  OpenIndex index = create_index(config);

  std::string line;
  std::size_t line_number = 0;
  EntryId next_id = 1;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    try {
      index.tree->add(next_id, rect_from(parse_values(line), config.dimensions));
    } catch (const std::invalid_argument& ex) {
      throw std::runtime_error("Line " + std::to_string(line_number) + ": " + ex.what());
    } catch (const GeometryError& ex) {
      throw std::runtime_error("Line " + std::to_string(line_number) + ": " + ex.what());
    }
    ++next_id;
  }

  const std::int64_t size = index.tree->size();
  const int height = index.tree->height();
  index.close();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time);
  if (!config.quiet) {
    std::cout << "[rtree_tool] Indexed " << size << " entries, height " << height << " in "
              << elapsed.count() << "ms" << std::endl;
  }
  return 0;
}

int run_query(const ToolConfig& config) {
  if (config.rect.empty()) {
    std::cerr << "[rtree_tool] Missing --rect argument" << std::endl;
    return 1;
  }
  OpenIndex index = open_index(config);
  const Rectangle rect = rect_from(config.rect, config.dimensions);
  print_entries(config.command == Command::kContains ? index.tree->contains(rect) : index.tree->intersects(rect));
  index.close();
  return 0;
}

int run_nearest(const ToolConfig& config) {
  if (config.point.size() != config.dimensions) {
    std::cerr << "[rtree_tool] --point needs " << config.dimensions << " coordinates" << std::endl;
    return 1;
  }
  OpenIndex index = open_index(config);
  print_entries(index.tree->nearest(Point(config.point), config.max_distance));
  index.close();
  return 0;
}

int run_delete(const ToolConfig& config) {
  if (!config.has_id || config.rect.empty()) {
    std::cerr << "[rtree_tool] delete needs --id and --rect" << std::endl;
    return 1;
  }
  OpenIndex index = open_index(config);
  const bool removed = index.tree->remove(rect_from(config.rect, config.dimensions), config.id);
  index.close();

  if (!removed) {
    std::cerr << "[rtree_tool] Entry " << config.id << " not found" << std::endl;
    return 1;
  }
  if (!config.quiet) {
    std::cout << "[rtree_tool] Removed entry " << config.id << std::endl;
  }
  return 0;
}

int run_dump(const ToolConfig& config) {
  OpenIndex index = open_index(config);
  std::cout << index.tree->to_string(config.min_level);
  index.close();
  return 0;
}

int run_check(const ToolConfig& config) {
  OpenIndex index = open_index(config);
  try {
    index.tree->check_consistency();
  } catch (const ConsistencyError& ex) {
    std::cerr << "[rtree_tool] Index is inconsistent: " << ex.what() << std::endl;
    index.close();
    return 1;
  }
  std::cout << "[rtree_tool] Index is consistent (" << index.tree->size() << " entries)" << std::endl;
  index.close();
  return 0;
}

int run_stats(const ToolConfig& config) {
  OpenIndex index = open_index(config);
  RTree& tree = *index.tree;

  std::size_t leaves = 0;
  std::size_t parents = 0;
  LevelIterator leaf_iterator = tree.level_iterator();
  while (leaf_iterator.has_next_leaf()) {
    (void)leaf_iterator.next_leaf();
    ++leaves;
  }
  if (tree.height() > 1) {
    LevelIterator parent_iterator = tree.level_iterator();
    while (parent_iterator.has_next_parent_of_leaves()) {
      (void)parent_iterator.next_parent_of_leaves();
      ++parents;
    }
  }

  std::cout << "version          " << RTree::version() << '\n'
            << "dimensions       " << tree.dimensions() << '\n'
            << "entries          " << tree.size() << '\n'
            << "height           " << tree.height() << '\n'
            << "fan-out          " << tree.min_node_entries() << ".." << tree.max_node_entries() << '\n'
            << "root node        " << tree.root_node_id() << '\n'
            << "highest node id  " << tree.highest_used_node_id() << '\n'
            << "free node ids    " << tree.free_node_ids().size() << '\n'
            << "leaves           " << leaves << '\n'
            << "leaf parents     " << parents << '\n';
  if (const auto bounds = tree.get_bounds()) {
    std::cout << "bounds           " << bounds->to_string() << '\n';
  }
  std::cout << "store            " << index.store->info() << std::endl;

  index.close();
  return 0;
}

const char* command_name(Command command) {
  switch (command) {
    case Command::kBuild: return "build";
    case Command::kQuery: return "query";
    case Command::kContains: return "contains";
    case Command::kNearest: return "nearest";
    case Command::kDelete: return "delete";
    case Command::kDump: return "dump";
    case Command::kCheck: return "check";
    case Command::kStats: return "stats";
    case Command::kNone: break;
  }
  return "none";
}

}  // namespace

Command parse_command(const std::string& name) {
  if (name == "build") return Command::kBuild;
  if (name == "query") return Command::kQuery;
  if (name == "contains") return Command::kContains;
  if (name == "nearest") return Command::kNearest;
  if (name == "delete") return Command::kDelete;
  if (name == "dump") return Command::kDump;
  if (name == "check") return Command::kCheck;
  if (name == "stats") return Command::kStats;
  return Command::kNone;
}

std::vector<double> parse_values(const std::string& text) {
  std::string normalized(text);
  for (char& c : normalized) {
    if (c == ',') {
      c = ' ';
    }
  }

  std::vector<double> values;
  std::istringstream in(normalized);
  std::string token;
  while (in >> token) {
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
      throw std::invalid_argument("Not a number: " + token);
    }
    values.push_back(value);
  }
  return values;
}

int run_tool(const ToolConfig& config) {
  if (config.command == Command::kNone) {
    std::cerr << "[rtree_tool] Missing command" << std::endl;
    return 1;
  }
  if (config.index_directory.empty()) {
    std::cerr << "[rtree_tool] Missing --index argument" << std::endl;
    return 1;
  }
  if (config.dimensions == 0) {
    std::cerr << "[rtree_tool] --dims must be positive" << std::endl;
    return 1;
  }

  try {
    switch (config.command) {
      case Command::kBuild: return run_build(config);
      case Command::kQuery:
      case Command::kContains: return run_query(config);
      case Command::kNearest: return run_nearest(config);
      case Command::kDelete: return run_delete(config);
      case Command::kDump: return run_dump(config);
      case Command::kCheck: return run_check(config);
      case Command::kStats: return run_stats(config);
      case Command::kNone: break;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[rtree_tool] " << command_name(config.command) << " failed: " << ex.what() << std::endl;
    return 1;
  }
  return 1;
}

}  // namespace rtreedb::tool
