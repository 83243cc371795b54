#include "memory_page_store.hpp"

#include <sstream>

namespace rtreedb::storage {

Node MemoryPageStore::get_node(NodeId id) {
    const auto it = pages_.find(id);
    if (it == pages_.end()) {
        throw NodeNotFoundError(id);
    }
    ++reads_;
    return it->second;
}

void MemoryPageStore::store(NodeId id, const Node& node) {
    pages_.insert_or_assign(id, node);
    ++writes_;
}

std::string MemoryPageStore::info() const {
    std::ostringstream out;
    out << "MemoryPageStore pages=" << pages_.size()
        << " reads=" << reads_
        << " writes=" << writes_;
    return out.str();
}

} // namespace rtreedb::storage
