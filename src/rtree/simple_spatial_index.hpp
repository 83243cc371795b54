#pragma once

#include <algorithm>
#include <limits>
#include <vector>

#include "node.hpp"

namespace rtreedb {

// Linear-scan index with the same query semantics as RTree. Used as the
// reference in validation tests and as the baseline in the benchmark.
class SimpleSpatialIndex {
public:
    SimpleSpatialIndex() = default;

    void insert(EntryId id, const Rectangle& bounds) {
        items_.emplace_back(id, bounds);
    }

    // Removes one entry matching (id, bounds); false if there is none.
    bool remove(const Rectangle& bounds, EntryId id) {
        auto it = std::find_if(items_.begin(), items_.end(), [&](const Entry& item) {
            return item.id == id && item.mbr == bounds;
        });
        if (it == items_.end()) {
            return false;
        }
        items_.erase(it);
        return true;
    }

    std::vector<EntryId> intersects(const Rectangle& bounds) const {
        std::vector<EntryId> results;
        for (const auto& item : items_) {
            if (bounds.intersects(item.mbr)) {
                results.push_back(item.id);
            }
        }
        return results;
    }

    std::vector<EntryId> contains(const Rectangle& bounds) const {
        std::vector<EntryId> results;
        for (const auto& item : items_) {
            if (bounds.contains(item.mbr)) {
                results.push_back(item.id);
            }
        }
        return results;
    }

    // Every item at the minimum distance, ties included.
    std::vector<EntryId> nearest(const Point& point,
                                 double max_distance = std::numeric_limits<double>::infinity()) const {
        std::vector<EntryId> results;
        double best = max_distance;
        for (const auto& item : items_) {
            const double distance = item.mbr.distance(point);
            if (distance < best) {
                results.clear();
                best = distance;
            }
            if (distance <= best) {
                results.push_back(item.id);
            }
        }
        return results;
    }

    void clear() { items_.clear(); }

    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] const std::vector<Entry>& items() const { return items_; }

private:
    std::vector<Entry> items_;
};

} // namespace rtreedb
