#pragma once

#include <deque>
#include <utility>

#include "node.hpp"

namespace rtreedb {

namespace storage {
class PageStore;
}

// Breadth-first cursor over the nodes of one level, for bulk scans that do
// not need the whole tree in memory. Each iterator owns its queue.
class LevelIterator {
public:
    LevelIterator(storage::PageStore& store, NodeId root_node_id, int tree_height);

    void reset();

    [[nodiscard]] bool has_next_leaf() const { return has_next(1); }
    Node next_leaf() { return next(1); }

    [[nodiscard]] bool has_next_parent_of_leaves() const { return has_next(2); }
    Node next_parent_of_leaves() { return next(2); }

private:
    [[nodiscard]] bool has_next(int level) const;
    Node next(int level);

    storage::PageStore* store_;
    NodeId root_node_id_;
    int tree_height_;
    std::deque<std::pair<NodeId, int>> queue_;
};

} // namespace rtreedb
