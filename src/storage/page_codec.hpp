#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

#include "../rtree/node.hpp"

namespace rtreedb::storage::page_codec {

using Bytes = std::vector<unsigned char>;

// node_id, level, entry_count, dimensions
constexpr std::size_t kNodeHeaderSize = 4 * sizeof(std::int32_t);

// Bytes needed for a node of `max_entries` entries in `dimensions` dimensions.
[[nodiscard]] std::size_t page_size(std::size_t dimensions, std::size_t max_entries);
[[nodiscard]] std::size_t entry_size(std::size_t dimensions);

// Big-endian primitives over a byte buffer
void append_i32(Bytes& out, std::int32_t value);
void append_i64(Bytes& out, std::int64_t value);
void append_f64(Bytes& out, double value);
std::int32_t read_i32(const unsigned char*& ptr);
std::int64_t read_i64(const unsigned char*& ptr);
double read_f64(const unsigned char*& ptr);

// Big-endian primitives over streams
bool write_i32(std::ostream& out, std::int32_t value);
bool read_i32(std::istream& in, std::int32_t& value);
bool write_exact(std::ostream& out, const char* buffer, std::size_t length);
bool read_exact(std::istream& in, char* buffer, std::size_t length);

// Serializes `node` into exactly `page_bytes` bytes, zero padded.
[[nodiscard]] Bytes encode_node(const Node& node, std::size_t dimensions, std::size_t page_bytes);

// Throws StorageError on a page that cannot hold a valid node.
[[nodiscard]] Node decode_node(const unsigned char* data, std::size_t size,
                               std::size_t dimensions, std::size_t max_entries);

} // namespace rtreedb::storage::page_codec
