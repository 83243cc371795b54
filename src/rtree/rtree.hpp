#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "../include/rectangle.hpp"
#include "aggregator.hpp"
#include "level_iterator.hpp"
#include "node.hpp"
#include "split.hpp"

namespace rtreedb {

namespace storage {
class PageStore;
}

enum class StorageKind {
    kMemory,
    kDisk
};

// Guttman R-tree over a page store. Nodes are only ever reached through
// the store; the tree keeps the header state and the node id allocator.
class RTree {
public:
    using LogCallback = std::function<void(const std::string& message, bool is_error)>;

    struct Options {
        SplitAlgorithm split_algorithm = SplitAlgorithm::kQuadratic;
        // Not owned; must outlive the tree.
        const Aggregator* aggregator = nullptr;
        bool check_consistency_after_mutation = false;
        bool rebuild_free_list_on_open = true;
        bool verbose = false;
        LogCallback log_callback;
    };

    static constexpr const char* kVersion = "RTree-1.0b2p1";

    RTree(std::size_t dimensions, storage::PageStore& store, std::filesystem::path header_path);
    RTree(std::size_t dimensions, storage::PageStore& store, std::filesystem::path header_path, Options options);

    RTree(const RTree&) = delete;
    RTree& operator=(const RTree&) = delete;

    // kDisk reopens an existing header file, keeping its fan-out. Throws
    // ConfigurationError unless max >= 2 and 1 <= min <= max / 2.
    void init(StorageKind kind, int min_node_entries, int max_node_entries);

    void add(EntryId id, const Rectangle& rect);
    void add(EntryId id, const Rectangle& rect, double value);

    // Removes the entry matching both `rect` and `id`. False when absent.
    bool remove(const Rectangle& rect, EntryId id);

    std::vector<Entry> intersects(const Rectangle& rect);
    std::vector<Entry> contains(const Rectangle& rect);

    // All entries at the minimum distance from `point`, ties included.
    // Entries further away than `max_distance` are never returned.
    std::vector<Entry> nearest(const Point& point,
                               double max_distance = std::numeric_limits<double>::infinity());

    [[nodiscard]] std::int64_t size() const;

    // std::nullopt while the tree is empty.
    [[nodiscard]] std::optional<Rectangle> get_bounds();

    // Aggregate over every data entry; the identity when the tree is empty.
    // Throws RTreeError when no aggregator is installed.
    [[nodiscard]] double root_aggregate();

    void save();
    void close();

    // Throws ConsistencyError describing the first violation found.
    void check_consistency();

    [[nodiscard]] LevelIterator level_iterator();
    [[nodiscard]] std::size_t num_leaf_entries();
    [[nodiscard]] Node get_node(NodeId id);
    [[nodiscard]] std::string to_string(int min_level = 0);

    [[nodiscard]] static std::string version() { return kVersion; }

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }
    [[nodiscard]] std::size_t dimensions() const noexcept { return dimensions_; }
    [[nodiscard]] int height() const;
    [[nodiscard]] NodeId root_node_id() const;
    [[nodiscard]] NodeId highest_used_node_id() const;
    [[nodiscard]] std::vector<NodeId> free_node_ids() const;
    [[nodiscard]] int max_node_entries() const;
    [[nodiscard]] int min_node_entries() const;
    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    // One step of a root-to-node descent: the node visited and the index of
    // the entry followed out of it.
    struct PathStep {
        NodeId node_id;
        std::size_t entry_index;
    };
    using Path = std::vector<PathStep>;

    void ensure_initialized() const;
    void check_dimension(std::size_t dimension, const char* what) const;
    static void validate_fanout(int min_node_entries, int max_node_entries);

    void init_fresh(int min_node_entries, int max_node_entries);
    void load_header();
    void rebuild_free_list();

    NodeId next_node_id();
    void store_node(const Node& node);
    [[nodiscard]] Entry entry_for(const Node& child) const;

    void insert_entry(Entry entry, int level);
    Node choose_node(const Rectangle& rect, int level, Path& path);
    Node split_node(Node& node, Entry entry);
    std::optional<Node> adjust_tree(Node node, std::optional<Node> sibling, Path& path);
    void grow_root(const Node& sibling);

    void condense_tree(Node leaf, Path& path);
    void shrink_root();

    void intersects_node(const Rectangle& rect, const Node& node, std::vector<Entry>& results);
    double nearest_node(const Point& point, const Node& node, double nearest_distance,
                        std::vector<Entry>& results);

    std::size_t check_node(NodeId node_id, int expected_level, const Entry* parent_entry);
    [[noreturn]] void fail_consistency(const std::string& message) const;

    void append_node_string(std::string& out, NodeId node_id, int min_level, int indent);

    void log_message(const std::string& message, bool is_error = false) const;

    std::size_t dimensions_;
    storage::PageStore* store_;
    std::filesystem::path header_path_;
    Options options_;

    bool initialized_ = false;
    StorageKind kind_ = StorageKind::kMemory;
    int max_node_entries_ = 0;
    int min_node_entries_ = 0;
    NodeId root_node_id_ = 1;
    int tree_height_ = 1;
    NodeId highest_used_node_id_ = 1;
    std::int64_t size_ = 0;
    std::vector<NodeId> free_node_ids_;
};

} // namespace rtreedb
