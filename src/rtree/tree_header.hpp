#pragma once

#include <cstdint>
#include <filesystem>

#include "node.hpp"

namespace rtreedb {

// Tree state persisted by save() and read back on reopen. On disk: six
// big-endian int32 values followed by max_node_entries scratch bytes.
struct TreeHeader {
    NodeId root_node_id = 1;
    std::int32_t max_node_entries = 0;
    std::int32_t min_node_entries = 0;
    std::int32_t size = 0;
    std::int32_t tree_height = 1;
    NodeId highest_used_node_id = 1;
};

namespace tree_header {

// Throws StorageError on I/O failure.
void write(const std::filesystem::path& path, const TreeHeader& header);

// Throws StorageError when the file is missing or short.
[[nodiscard]] TreeHeader read(const std::filesystem::path& path);

} // namespace tree_header
} // namespace rtreedb
