#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace rtreedb::tool {

enum class Command {
  kNone,
  kBuild,
  kQuery,
  kContains,
  kNearest,
  kDelete,
  kDump,
  kCheck,
  kStats
};

struct ToolConfig {
  Command command = Command::kNone;
  std::filesystem::path input;
  std::filesystem::path index_directory;
  std::size_t dimensions = 2;
  int min_node_entries = 2;
  int max_node_entries = 8;
  bool linear_split = false;
  std::vector<double> rect;
  std::vector<double> point;
  double max_distance = std::numeric_limits<double>::infinity();
  std::int64_t id = 0;
  bool has_id = false;
  int min_level = 0;
  bool quiet = false;
};

// Maps "build", "query", ... to a Command; kNone when unknown.
Command parse_command(const std::string& name);

// Parses a comma or whitespace separated list of numbers. Throws
// std::invalid_argument on anything that is not a number.
std::vector<double> parse_values(const std::string& text);

int run_tool(const ToolConfig& config);

}  // namespace rtreedb::tool
