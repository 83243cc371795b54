#include "node.hpp"

#include "aggregator.hpp"

#include <sstream>
#include <utility>

namespace rtreedb {

Node::Node(NodeId id, int level, std::size_t capacity)
    : id_(id)
    , level_(level)
    , capacity_(capacity) {
    entries_.reserve(capacity);
}

Node Node::restore(NodeId id, int level, std::size_t capacity,
                   std::vector<Entry> entries, Rectangle mbr) {
    if (entries.size() > capacity) {
        throw StorageError("Node " + std::to_string(id) + " holds " + std::to_string(entries.size()) +
                           " entries, capacity is " + std::to_string(capacity));
    }
    Node node(id, level, capacity);
    node.entries_ = std::move(entries);
    node.mbr_ = std::move(mbr);
    return node;
}

const Entry& Node::entry(std::size_t index) const {
    if (index >= entries_.size()) {
        throw RTreeError("Node " + std::to_string(id_) + ": entry " + std::to_string(index) +
                         " out of range (count " + std::to_string(entries_.size()) + ")");
    }
    return entries_[index];
}

void Node::add_entry(Entry entry) {
    if (full()) {
        throw RTreeError("Node " + std::to_string(id_) + " is full (" + std::to_string(capacity_) + " entries)");
    }
    if (entries_.empty()) {
        mbr_ = entry.mbr;
    } else {
        mbr_.union_in_place(entry.mbr);
    }
    entries_.push_back(std::move(entry));
}

void Node::delete_entry(std::size_t index) {
    if (index >= entries_.size()) {
        throw RTreeError("Node " + std::to_string(id_) + ": cannot delete entry " + std::to_string(index));
    }
    const Rectangle removed = entries_[index].mbr;
    if (index + 1 != entries_.size()) {
        entries_[index] = std::move(entries_.back());
    }
    entries_.pop_back();

    // Only an entry lying on the boundary can shrink the MBR.
    if (entries_.empty() || removed.edge_overlaps(mbr_)) {
        recalculate_mbr();
    }
}

void Node::assign_entries(std::vector<Entry> entries) {
    if (entries.size() > capacity_) {
        throw RTreeError("Node " + std::to_string(id_) + " cannot hold " + std::to_string(entries.size()) + " entries");
    }
    entries_ = std::move(entries);
    recalculate_mbr();
}

void Node::update_entry(std::size_t index, const Rectangle& mbr, double aggregate) {
    if (index >= entries_.size()) {
        throw RTreeError("Node " + std::to_string(id_) + ": cannot update entry " + std::to_string(index));
    }
    entries_[index].aggregate = aggregate;
    if (entries_[index].mbr == mbr) {
        return;
    }
    entries_[index].mbr = mbr;
    recalculate_mbr();
}

int Node::find_entry(EntryId id, const Rectangle& mbr) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].id == id && entries_[i].mbr == mbr) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void Node::clear() {
    entries_.clear();
    mbr_ = Rectangle();
}

void Node::recalculate_mbr() {
    mbr_ = calculate_mbr();
}

Rectangle Node::calculate_mbr() const {
    if (entries_.empty()) {
        return Rectangle();
    }
    Rectangle result = entries_.front().mbr;
    for (std::size_t i = 1; i < entries_.size(); ++i) {
        result.union_in_place(entries_[i].mbr);
    }
    return result;
}

double Node::aggregate(const Aggregator* aggregator) const {
    if (!aggregator) {
        return 0.0;
    }
    double value = aggregator->identity();
    for (const auto& entry : entries_) {
        value = aggregator->merge(value, entry.aggregate);
    }
    return value;
}

std::string Node::to_string() const {
    std::ostringstream out;
    out << "Node[" << id_ << "] level=" << level_ << " count=" << entries_.size();
    if (!entries_.empty()) {
        out << " mbr=" << mbr_.to_string();
    }
    return out.str();
}

} // namespace rtreedb
