#include "tree_header.hpp"

#include "../storage/page_codec.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace rtreedb::tree_header {

using storage::page_codec::read_exact;
using storage::page_codec::read_i32;
using storage::page_codec::write_exact;
using storage::page_codec::write_i32;

void write(const std::filesystem::path& path, const TreeHeader& header) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
        throw StorageError("Failed to open header file " + path.string() + " for writing");
    }

    // entry status scratch: all entries assigned once a split completes
    const std::vector<char> scratch(static_cast<std::size_t>(header.max_node_entries), 0);

    const bool ok = write_i32(out, header.root_node_id) &&
                    write_i32(out, header.max_node_entries) &&
                    write_i32(out, header.min_node_entries) &&
                    write_i32(out, header.size) &&
                    write_i32(out, header.tree_height) &&
                    write_i32(out, header.highest_used_node_id) &&
                    write_exact(out, scratch.data(), scratch.size());
    out.flush();
    if (!ok || !out.good()) {
        throw StorageError("Failed to write header file " + path.string());
    }
}

TreeHeader read(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        throw StorageError("Failed to open header file " + path.string());
    }

    TreeHeader header;
    const bool ok = read_i32(in, header.root_node_id) &&
                    read_i32(in, header.max_node_entries) &&
                    read_i32(in, header.min_node_entries) &&
                    read_i32(in, header.size) &&
                    read_i32(in, header.tree_height) &&
                    read_i32(in, header.highest_used_node_id);
    if (!ok) {
        throw StorageError("Header file " + path.string() + " is truncated");
    }

    if (header.max_node_entries > 0) {
        std::vector<char> scratch(static_cast<std::size_t>(header.max_node_entries));
        if (!read_exact(in, scratch.data(), scratch.size())) {
            throw StorageError("Header file " + path.string() + " is missing its entry status block");
        }
    }

    return header;
}

} // namespace rtreedb::tree_header
