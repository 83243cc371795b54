#pragma once

#include <string>

#include "../rtree/node.hpp"

namespace rtreedb::storage {

// Where the tree keeps its nodes. The tree owns id allocation; a store only
// reads and writes whatever ids it is given.
class PageStore {
public:
    virtual ~PageStore() = default;

    // Throws NodeNotFoundError when nothing was ever stored under `id`.
    [[nodiscard]] virtual Node get_node(NodeId id) = 0;

    virtual void store(NodeId id, const Node& node) = 0;

    virtual void flush() = 0;

    // Flushes and releases resources. Safe to call twice.
    virtual void close() = 0;

    [[nodiscard]] virtual std::string info() const = 0;
};

} // namespace rtreedb::storage
