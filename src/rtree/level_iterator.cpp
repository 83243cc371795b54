#include "level_iterator.hpp"

#include "../storage/page_store.hpp"

#include <string>

namespace rtreedb {

LevelIterator::LevelIterator(storage::PageStore& store, NodeId root_node_id, int tree_height)
    : store_(&store)
    , root_node_id_(root_node_id)
    , tree_height_(tree_height) {
    reset();
}

void LevelIterator::reset() {
    queue_.clear();
    queue_.emplace_back(root_node_id_, tree_height_);
}

bool LevelIterator::has_next(int level) const {
    return !queue_.empty() && queue_.front().second >= level;
}

Node LevelIterator::next(int level) {
    if (!has_next(level)) {
        throw RTreeError("No more nodes at level " + std::to_string(level));
    }

    Node node = store_->get_node(queue_.front().first);
    queue_.pop_front();

    while (node.level() != level) {
        for (const auto& entry : node.entries()) {
            queue_.emplace_back(static_cast<NodeId>(entry.id), node.level() - 1);
        }
        if (queue_.empty()) {
            throw RTreeError("Node " + std::to_string(node.id()) + " at level " + std::to_string(node.level()) +
                             " has no children to descend into");
        }
        node = store_->get_node(queue_.front().first);
        queue_.pop_front();
    }

    return node;
}

} // namespace rtreedb
