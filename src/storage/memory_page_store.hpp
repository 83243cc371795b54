#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "page_store.hpp"

namespace rtreedb::storage {

class MemoryPageStore final : public PageStore {
public:
    MemoryPageStore() = default;

    [[nodiscard]] Node get_node(NodeId id) override;
    void store(NodeId id, const Node& node) override;
    void flush() override {}
    // Pages live as long as the store object; a closed tree can be reopened on it.
    void close() override {}
    [[nodiscard]] std::string info() const override;

    [[nodiscard]] std::size_t page_count() const noexcept { return pages_.size(); }
    [[nodiscard]] std::size_t reads() const noexcept { return reads_; }
    [[nodiscard]] std::size_t writes() const noexcept { return writes_; }

private:
    std::unordered_map<NodeId, Node> pages_;
    std::size_t reads_ = 0;
    std::size_t writes_ = 0;
};

} // namespace rtreedb::storage
