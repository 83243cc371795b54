#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../include/rectangle.hpp"

namespace rtreedb {

class Aggregator;

using NodeId = std::int32_t;
using EntryId = std::int64_t;

// In a leaf `id` names an external data object, in an internal node it is
// the id of the child node.
struct Entry {
    EntryId id = 0;
    Rectangle mbr;
    double aggregate = 0.0;

    Entry() = default;

    Entry(EntryId entry_id, Rectangle bounds, double value = 0.0)
        : id(entry_id)
        , mbr(std::move(bounds))
        , aggregate(value) {}
};

// A fixed-capacity page of entries with a cached MBR.
// Level 1 is a leaf; the root sits at level tree_height.
class Node {
public:
    Node() = default;
    Node(NodeId id, int level, std::size_t capacity);

    // Rebuilds a node read back from a page, keeping the stored MBR as is.
    static Node restore(NodeId id, int level, std::size_t capacity,
                        std::vector<Entry> entries, Rectangle mbr);

    [[nodiscard]] NodeId id() const noexcept { return id_; }
    [[nodiscard]] int level() const noexcept { return level_; }
    [[nodiscard]] bool is_leaf() const noexcept { return level_ == 1; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t entry_count() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool full() const noexcept { return entries_.size() >= capacity_; }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const Entry& entry(std::size_t index) const;

    // Meaningless while the node is empty.
    [[nodiscard]] const Rectangle& mbr() const noexcept { return mbr_; }

    void add_entry(Entry entry);

    // Moves the last entry into the vacated slot.
    void delete_entry(std::size_t index);

    // Replaces the content wholesale, used after a split.
    void assign_entries(std::vector<Entry> entries);

    // Tightens entry `index` to a child's new MBR and aggregate.
    void update_entry(std::size_t index, const Rectangle& mbr, double aggregate);

    // Index of the entry matching (id, mbr) exactly, or -1.
    [[nodiscard]] int find_entry(EntryId id, const Rectangle& mbr) const;

    void clear();

    void recalculate_mbr();
    [[nodiscard]] Rectangle calculate_mbr() const;

    [[nodiscard]] double aggregate(const Aggregator* aggregator) const;

    [[nodiscard]] std::string to_string() const;

private:
    NodeId id_ = 0;
    int level_ = 1;
    std::size_t capacity_ = 0;
    std::vector<Entry> entries_;
    Rectangle mbr_;
};

} // namespace rtreedb
