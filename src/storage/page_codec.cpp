#include "page_codec.hpp"

#include <cstring>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace rtreedb::storage::page_codec {

namespace {

void append_u64(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<unsigned char>((value >> shift) & 0xFFU));
    }
}

std::uint64_t read_u64(const unsigned char*& ptr) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | ptr[i];
    }
    ptr += 8;
    return value;
}

std::vector<double> read_coordinates(const unsigned char*& ptr, std::size_t dimensions) {
    std::vector<double> coords(dimensions);
    for (auto& coord : coords) {
        coord = read_f64(ptr);
    }
    return coords;
}

Rectangle read_rectangle(const unsigned char*& ptr, std::size_t dimensions) {
    auto min = read_coordinates(ptr, dimensions);
    auto max = read_coordinates(ptr, dimensions);
    return Rectangle(std::move(min), std::move(max));
}

void append_rectangle(Bytes& out, const Rectangle& rect) {
    for (const double value : rect.min()) {
        append_f64(out, value);
    }
    for (const double value : rect.max()) {
        append_f64(out, value);
    }
}

} // namespace

std::size_t entry_size(std::size_t dimensions) {
    return sizeof(std::int64_t) + sizeof(double) + 2 * dimensions * sizeof(double);
}

std::size_t page_size(std::size_t dimensions, std::size_t max_entries) {
    return kNodeHeaderSize + 2 * dimensions * sizeof(double) + max_entries * entry_size(dimensions);
}

void append_i32(Bytes& out, std::int32_t value) {
    const auto raw = static_cast<std::uint32_t>(value);
    out.push_back(static_cast<unsigned char>((raw >> 24) & 0xFFU));
    out.push_back(static_cast<unsigned char>((raw >> 16) & 0xFFU));
    out.push_back(static_cast<unsigned char>((raw >> 8) & 0xFFU));
    out.push_back(static_cast<unsigned char>(raw & 0xFFU));
}

void append_i64(Bytes& out, std::int64_t value) {
    append_u64(out, static_cast<std::uint64_t>(value));
}

void append_f64(Bytes& out, double value) {
    std::uint64_t raw = 0;
    std::memcpy(&raw, &value, sizeof(raw));
    append_u64(out, raw);
}

std::int32_t read_i32(const unsigned char*& ptr) {
    const std::uint32_t raw = (static_cast<std::uint32_t>(ptr[0]) << 24) |
                              (static_cast<std::uint32_t>(ptr[1]) << 16) |
                              (static_cast<std::uint32_t>(ptr[2]) << 8) |
                              static_cast<std::uint32_t>(ptr[3]);
    ptr += 4;
    return static_cast<std::int32_t>(raw);
}

std::int64_t read_i64(const unsigned char*& ptr) {
    return static_cast<std::int64_t>(read_u64(ptr));
}

double read_f64(const unsigned char*& ptr) {
    const std::uint64_t raw = read_u64(ptr);
    double value = 0.0;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

bool write_exact(std::ostream& out, const char* buffer, std::size_t length) {
    out.write(buffer, static_cast<std::streamsize>(length));
    return out.good();
}

bool read_exact(std::istream& in, char* buffer, std::size_t length) {
    in.read(buffer, static_cast<std::streamsize>(length));
    return in.good();
}

bool write_i32(std::ostream& out, std::int32_t value) {
    Bytes bytes;
    append_i32(bytes, value);
    return write_exact(out, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

bool read_i32(std::istream& in, std::int32_t& value) {
    unsigned char buffer[4];
    if (!read_exact(in, reinterpret_cast<char*>(buffer), sizeof(buffer))) {
        return false;
    }
    const unsigned char* ptr = buffer;
    value = read_i32(ptr);
    return true;
}

Bytes encode_node(const Node& node, std::size_t dimensions, std::size_t page_bytes) {
    Bytes out;
    out.reserve(page_bytes);

    append_i32(out, node.id());
    append_i32(out, node.level());
    append_i32(out, static_cast<std::int32_t>(node.entry_count()));
    append_i32(out, static_cast<std::int32_t>(dimensions));

    if (node.empty()) {
        out.resize(out.size() + 2 * dimensions * sizeof(double), 0);
    } else {
        append_rectangle(out, node.mbr());
    }

    for (const auto& entry : node.entries()) {
        if (entry.mbr.dimension() != dimensions) {
            throw StorageError("Node " + std::to_string(node.id()) + " holds a " +
                               std::to_string(entry.mbr.dimension()) + "-dimensional entry, page expects " +
                               std::to_string(dimensions));
        }
        append_i64(out, entry.id);
        append_f64(out, entry.aggregate);
        append_rectangle(out, entry.mbr);
    }

    if (out.size() > page_bytes) {
        throw StorageError("Node " + std::to_string(node.id()) + " needs " + std::to_string(out.size()) +
                           " bytes, page size is " + std::to_string(page_bytes));
    }
    out.resize(page_bytes, 0);
    return out;
}

Node decode_node(const unsigned char* data, std::size_t size, std::size_t dimensions, std::size_t max_entries) {
    const std::size_t fixed = kNodeHeaderSize + 2 * dimensions * sizeof(double);
    if (size < fixed) {
        throw StorageError("Corrupt page: " + std::to_string(size) + " bytes is shorter than a node header");
    }

    const unsigned char* ptr = data;
    const NodeId id = read_i32(ptr);
    const std::int32_t level = read_i32(ptr);
    const std::int32_t count = read_i32(ptr);
    const std::int32_t stored_dimensions = read_i32(ptr);

    if (level < 1) {
        throw StorageError("Corrupt page for node " + std::to_string(id) + ": level " + std::to_string(level));
    }
    if (count < 0 || static_cast<std::size_t>(count) > max_entries) {
        throw StorageError("Corrupt page for node " + std::to_string(id) + ": entry count " + std::to_string(count));
    }
    if (static_cast<std::size_t>(stored_dimensions) != dimensions) {
        throw StorageError("Corrupt page for node " + std::to_string(id) + ": " +
                           std::to_string(stored_dimensions) + " dimensions, expected " + std::to_string(dimensions));
    }
    if (fixed + static_cast<std::size_t>(count) * entry_size(dimensions) > size) {
        throw StorageError("Corrupt page for node " + std::to_string(id) + ": entries overrun the page");
    }

    try {
        Rectangle mbr;
        if (count == 0) {
            ptr += 2 * dimensions * sizeof(double);
        } else {
            mbr = read_rectangle(ptr, dimensions);
        }

        std::vector<Entry> entries;
        entries.reserve(static_cast<std::size_t>(count));
        for (std::int32_t i = 0; i < count; ++i) {
            const EntryId entry_id = read_i64(ptr);
            const double aggregate = read_f64(ptr);
            entries.emplace_back(entry_id, read_rectangle(ptr, dimensions), aggregate);
        }

        return Node::restore(id, level, max_entries, std::move(entries), std::move(mbr));
    } catch (const GeometryError& ex) {
        throw StorageError("Corrupt page for node " + std::to_string(id) + ": " + ex.what());
    }
}

} // namespace rtreedb::storage::page_codec
