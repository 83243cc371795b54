#include "rtree.hpp"

#include "../storage/page_store.hpp"
#include "tree_header.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace rtreedb {

RTree::RTree(std::size_t dimensions, storage::PageStore& store, std::filesystem::path header_path)
    : RTree(dimensions, store, std::move(header_path), Options()) {}

RTree::RTree(std::size_t dimensions, storage::PageStore& store, std::filesystem::path header_path,
             Options options)
    : dimensions_(dimensions)
    , store_(&store)
    , header_path_(std::move(header_path))
    , options_(std::move(options)) {
    if (dimensions_ == 0) {
        throw ConfigurationError("RTree needs at least one dimension");
    }
}

void RTree::log_message(const std::string& message, bool is_error) const {
    if (options_.log_callback) {
        options_.log_callback(message, is_error);
    } else if (is_error) {
        std::cerr << "[RTree ERROR] " << message << std::endl;
    } else if (options_.verbose) {
        std::cout << "[RTree INFO] " << message << std::endl;
    }
}

void RTree::ensure_initialized() const {
    if (!initialized_) {
        throw RTreeError("RTree is not initialized");
    }
}

void RTree::check_dimension(std::size_t dimension, const char* what) const {
    if (dimension != dimensions_) {
        throw GeometryError(std::string(what) + " has " + std::to_string(dimension) +
                            " dimensions, index has " + std::to_string(dimensions_));
    }
}

void RTree::validate_fanout(int min_node_entries, int max_node_entries) {
    if (max_node_entries < 2) {
        throw ConfigurationError("max_node_entries must be at least 2, got " + std::to_string(max_node_entries));
    }
    if (min_node_entries < 1 || min_node_entries > max_node_entries / 2) {
        throw ConfigurationError("min_node_entries must be between 1 and " + std::to_string(max_node_entries / 2) +
                                 ", got " + std::to_string(min_node_entries));
    }
}

void RTree::init(StorageKind kind, int min_node_entries, int max_node_entries) {
    validate_fanout(min_node_entries, max_node_entries);
    if (kind == StorageKind::kDisk && header_path_.empty()) {
        throw ConfigurationError("Disk storage needs a header path");
    }

    kind_ = kind;
    if (kind == StorageKind::kDisk && std::filesystem::exists(header_path_)) {
        load_header();
    } else {
        init_fresh(min_node_entries, max_node_entries);
    }
    initialized_ = true;

    log_message("Initialized " + std::to_string(dimensions_) + "-d tree (m=" + std::to_string(min_node_entries_) +
                ", M=" + std::to_string(max_node_entries_) + ", height=" + std::to_string(tree_height_) +
                ", size=" + std::to_string(size_) + ") on " + store_->info());
}

void RTree::init_fresh(int min_node_entries, int max_node_entries) {
    if (kind_ == StorageKind::kDisk) {
        const auto parent = header_path_.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StorageError("Failed to create directory " + parent.string() + ": " + ec.message());
            }
        }
    }

    max_node_entries_ = max_node_entries;
    min_node_entries_ = min_node_entries;
    root_node_id_ = 1;
    tree_height_ = 1;
    highest_used_node_id_ = 1;
    size_ = 0;
    free_node_ids_.clear();

    store_node(Node(root_node_id_, 1, static_cast<std::size_t>(max_node_entries_)));
}

void RTree::load_header() {
    const TreeHeader header = tree_header::read(header_path_);
    try {
        validate_fanout(header.min_node_entries, header.max_node_entries);
    } catch (const ConfigurationError& ex) {
        throw ConfigurationError("Header " + header_path_.string() + ": " + ex.what());
    }
    if (header.tree_height < 1 || header.size < 0 || header.root_node_id < 1 ||
        header.highest_used_node_id < header.root_node_id) {
        throw StorageError("Header " + header_path_.string() + " holds an invalid tree state");
    }

    max_node_entries_ = header.max_node_entries;
    min_node_entries_ = header.min_node_entries;
    root_node_id_ = header.root_node_id;
    tree_height_ = header.tree_height;
    highest_used_node_id_ = header.highest_used_node_id;
    size_ = header.size;
    free_node_ids_.clear();

    const Node root = store_->get_node(root_node_id_);
    if (root.level() != tree_height_) {
        throw StorageError("Root node " + std::to_string(root_node_id_) + " is at level " +
                           std::to_string(root.level()) + ", header says " + std::to_string(tree_height_));
    }

    if (options_.rebuild_free_list_on_open) {
        rebuild_free_list();
    }
}

void RTree::rebuild_free_list() {
    std::unordered_set<NodeId> reachable;
    std::deque<NodeId> queue{root_node_id_};
    while (!queue.empty()) {
        const Node node = store_->get_node(queue.front());
        queue.pop_front();
        reachable.insert(node.id());
        if (!node.is_leaf()) {
            for (const auto& entry : node.entries()) {
                queue.push_back(static_cast<NodeId>(entry.id));
            }
        }
    }

    free_node_ids_.clear();
    for (NodeId id = highest_used_node_id_; id >= 1; --id) {
        if (reachable.count(id) == 0) {
            free_node_ids_.push_back(id);
        }
    }
    if (!free_node_ids_.empty()) {
        log_message("Recovered " + std::to_string(free_node_ids_.size()) + " free node ids");
    }
}

NodeId RTree::next_node_id() {
    if (!free_node_ids_.empty()) {
        const NodeId id = free_node_ids_.back();
        free_node_ids_.pop_back();
        return id;
    }
    return ++highest_used_node_id_;
}

void RTree::store_node(const Node& node) {
    store_->store(node.id(), node);
}

Entry RTree::entry_for(const Node& child) const {
    return Entry(child.id(), child.mbr(), child.aggregate(options_.aggregator));
}

void RTree::add(EntryId id, const Rectangle& rect) {
    add(id, rect, 0.0);
}

void RTree::add(EntryId id, const Rectangle& rect, double value) {
    ensure_initialized();
    check_dimension(rect.dimension(), "Rectangle");

    const double stored = options_.aggregator ? options_.aggregator->leaf_value(value) : value;
    insert_entry(Entry(id, rect, stored), 1);
    ++size_;

    if (options_.check_consistency_after_mutation) {
        check_consistency();
    }
}

void RTree::insert_entry(Entry entry, int level) {
    Path path;
    Node node = choose_node(entry.mbr, level, path);

    std::optional<Node> sibling;
    if (!node.full()) {
        node.add_entry(std::move(entry));
        store_node(node);
    } else {
        sibling = split_node(node, std::move(entry));
    }

    std::optional<Node> root_sibling = adjust_tree(std::move(node), std::move(sibling), path);
    if (root_sibling) {
        grow_root(*root_sibling);
    }
}

Node RTree::choose_node(const Rectangle& rect, int level, Path& path) {
    Node node = store_->get_node(root_node_id_);

    while (node.level() != level) {
        if (node.level() < level || node.empty()) {
            throw RTreeError("Cannot descend from node " + std::to_string(node.id()) + " at level " +
                             std::to_string(node.level()) + " to level " + std::to_string(level));
        }

        // Least enlargement, then smallest area, then first seen.
        std::size_t best = 0;
        double best_enlargement = node.entry(0).mbr.enlargement(rect);
        double best_area = node.entry(0).mbr.area();
        for (std::size_t i = 1; i < node.entry_count(); ++i) {
            const Rectangle& candidate = node.entry(i).mbr;
            const double enlargement = candidate.enlargement(rect);
            const double area = candidate.area();
            if (enlargement < best_enlargement || (enlargement == best_enlargement && area < best_area)) {
                best = i;
                best_enlargement = enlargement;
                best_area = area;
            }
        }

        path.push_back({node.id(), best});
        node = store_->get_node(static_cast<NodeId>(node.entry(best).id));
    }

    return node;
}

Node RTree::split_node(Node& node, Entry entry) {
    std::vector<Entry> entries = node.entries();
    entries.push_back(std::move(entry));

    auto result = split::split_entries(std::move(entries), static_cast<std::size_t>(min_node_entries_),
                                       options_.split_algorithm);

    Node sibling(next_node_id(), node.level(), static_cast<std::size_t>(max_node_entries_));
    node.assign_entries(std::move(result.original));
    sibling.assign_entries(std::move(result.sibling));

    store_node(node);
    store_node(sibling);
    return sibling;
}

std::optional<Node> RTree::adjust_tree(Node node, std::optional<Node> sibling, Path& path) {
    while (!path.empty()) {
        const PathStep step = path.back();
        path.pop_back();

        Node parent = store_->get_node(step.node_id);
        if (parent.entry(step.entry_index).id != node.id()) {
            throw RTreeError("Entry " + std::to_string(step.entry_index) + " of node " +
                             std::to_string(parent.id()) + " should point to node " + std::to_string(node.id()));
        }
        parent.update_entry(step.entry_index, node.mbr(), node.aggregate(options_.aggregator));

        std::optional<Node> parent_sibling;
        if (sibling && !parent.full()) {
            parent.add_entry(entry_for(*sibling));
            store_node(parent);
        } else if (sibling) {
            parent_sibling = split_node(parent, entry_for(*sibling));
        } else {
            store_node(parent);
        }

        node = std::move(parent);
        sibling = std::move(parent_sibling);
    }

    return sibling;
}

void RTree::grow_root(const Node& sibling) {
    const Node old_root = store_->get_node(root_node_id_);

    ++tree_height_;
    Node root(next_node_id(), tree_height_, static_cast<std::size_t>(max_node_entries_));
    root.add_entry(entry_for(old_root));
    root.add_entry(entry_for(sibling));
    store_node(root);

    root_node_id_ = root.id();
    log_message("Root split, new root " + std::to_string(root_node_id_) + " at height " +
                std::to_string(tree_height_));
}

bool RTree::remove(const Rectangle& rect, EntryId id) {
    ensure_initialized();
    check_dimension(rect.dimension(), "Rectangle");

    // Depth-first search for the leaf, following only entries that contain
    // `rect`. Each frame remembers the last entry it descended through.
    struct Frame {
        NodeId node_id;
        int last_checked;
    };
    std::vector<Frame> stack{{root_node_id_, -1}};

    std::optional<Node> leaf;
    int found = -1;
    while (!stack.empty()) {
        Node node = store_->get_node(stack.back().node_id);
        const int start = stack.back().last_checked + 1;

        if (!node.is_leaf()) {
            bool descended = false;
            for (int i = start; i < static_cast<int>(node.entry_count()); ++i) {
                const Entry& entry = node.entry(static_cast<std::size_t>(i));
                if (entry.mbr.contains(rect)) {
                    stack.back().last_checked = i;
                    stack.push_back({static_cast<NodeId>(entry.id), -1});
                    descended = true;
                    break;
                }
            }
            if (descended) {
                continue;
            }
        } else {
            found = node.find_entry(id, rect);
            if (found != -1) {
                leaf = std::move(node);
                stack.pop_back();
                break;
            }
        }
        stack.pop_back();
    }

    if (!leaf) {
        return false;
    }

    leaf->delete_entry(static_cast<std::size_t>(found));
    store_node(*leaf);

    Path path;
    path.reserve(stack.size());
    for (const auto& frame : stack) {
        path.push_back({frame.node_id, static_cast<std::size_t>(frame.last_checked)});
    }
    condense_tree(std::move(*leaf), path);
    --size_;

    shrink_root();

    if (options_.check_consistency_after_mutation) {
        check_consistency();
    }
    return true;
}

void RTree::condense_tree(Node leaf, Path& path) {
    std::vector<NodeId> eliminated;
    Node node = std::move(leaf);

    while (!path.empty()) {
        const PathStep step = path.back();
        path.pop_back();

        Node parent = store_->get_node(step.node_id);
        if (parent.entry(step.entry_index).id != node.id()) {
            throw RTreeError("Entry " + std::to_string(step.entry_index) + " of node " +
                             std::to_string(parent.id()) + " should point to node " + std::to_string(node.id()));
        }

        if (node.entry_count() < static_cast<std::size_t>(min_node_entries_)) {
            parent.delete_entry(step.entry_index);
            eliminated.push_back(node.id());
        } else {
            parent.update_entry(step.entry_index, node.mbr(), node.aggregate(options_.aggregator));
        }
        store_node(parent);
        node = std::move(parent);
    }

    // Orphans go back in at the level they came from, most recently
    // eliminated first.
    while (!eliminated.empty()) {
        const NodeId id = eliminated.back();
        eliminated.pop_back();

        Node orphan = store_->get_node(id);
        for (const auto& entry : orphan.entries()) {
            insert_entry(entry, orphan.level());
        }
        orphan.clear();
        store_node(orphan);
        free_node_ids_.push_back(id);
    }
}

void RTree::shrink_root() {
    Node root = store_->get_node(root_node_id_);
    while (tree_height_ > 1 && root.entry_count() == 1) {
        const NodeId child = static_cast<NodeId>(root.entry(0).id);
        const NodeId old_root = root.id();

        root.clear();
        store_node(root);
        free_node_ids_.push_back(old_root);

        root_node_id_ = child;
        --tree_height_;
        root = store_->get_node(root_node_id_);
        log_message("Root " + std::to_string(old_root) + " collapsed into " + std::to_string(child) +
                    ", height " + std::to_string(tree_height_));
    }
}

std::vector<Entry> RTree::intersects(const Rectangle& rect) {
    ensure_initialized();
    check_dimension(rect.dimension(), "Rectangle");

    std::vector<Entry> results;
    const Node root = store_->get_node(root_node_id_);
    intersects_node(rect, root, results);
    return results;
}

void RTree::intersects_node(const Rectangle& rect, const Node& node, std::vector<Entry>& results) {
    for (const auto& entry : node.entries()) {
        if (!rect.intersects(entry.mbr)) {
            continue;
        }
        if (node.is_leaf()) {
            results.push_back(entry);
        } else {
            const Node child = store_->get_node(static_cast<NodeId>(entry.id));
            intersects_node(rect, child, results);
        }
    }
}

std::vector<Entry> RTree::contains(const Rectangle& rect) {
    ensure_initialized();
    check_dimension(rect.dimension(), "Rectangle");

    std::vector<Entry> results;
    std::vector<NodeId> stack{root_node_id_};
    while (!stack.empty()) {
        const Node node = store_->get_node(stack.back());
        stack.pop_back();

        for (const auto& entry : node.entries()) {
            if (node.is_leaf()) {
                if (rect.contains(entry.mbr)) {
                    results.push_back(entry);
                }
            } else if (rect.intersects(entry.mbr)) {
                stack.push_back(static_cast<NodeId>(entry.id));
            }
        }
    }
    return results;
}

std::vector<Entry> RTree::nearest(const Point& point, double max_distance) {
    ensure_initialized();
    check_dimension(point.dimension(), "Point");

    std::vector<Entry> results;
    const Node root = store_->get_node(root_node_id_);
    nearest_node(point, root, max_distance, results);
    return results;
}

// Returns the distance of the closest entries collected so far. Subtrees
// further away than that are never opened.
double RTree::nearest_node(const Point& point, const Node& node, double nearest_distance,
                           std::vector<Entry>& results) {
    for (const auto& entry : node.entries()) {
        const double distance = entry.mbr.distance(point);
        if (node.is_leaf()) {
            if (distance < nearest_distance) {
                results.clear();
                nearest_distance = distance;
            }
            if (distance <= nearest_distance) {
                results.push_back(entry);
            }
        } else if (distance <= nearest_distance) {
            const Node child = store_->get_node(static_cast<NodeId>(entry.id));
            nearest_distance = nearest_node(point, child, nearest_distance, results);
        }
    }
    return nearest_distance;
}

std::int64_t RTree::size() const {
    ensure_initialized();
    return size_;
}

std::optional<Rectangle> RTree::get_bounds() {
    ensure_initialized();
    const Node root = store_->get_node(root_node_id_);
    if (root.empty()) {
        return std::nullopt;
    }
    return root.mbr();
}

double RTree::root_aggregate() {
    ensure_initialized();
    if (!options_.aggregator) {
        throw RTreeError("No aggregator configured");
    }
    return store_->get_node(root_node_id_).aggregate(options_.aggregator);
}

void RTree::save() {
    ensure_initialized();
    if (kind_ != StorageKind::kDisk) {
        return;
    }
    if (size_ > std::numeric_limits<std::int32_t>::max()) {
        throw StorageError("Tree size " + std::to_string(size_) + " does not fit the header format");
    }

    TreeHeader header;
    header.root_node_id = root_node_id_;
    header.max_node_entries = max_node_entries_;
    header.min_node_entries = min_node_entries_;
    header.size = static_cast<std::int32_t>(size_);
    header.tree_height = tree_height_;
    header.highest_used_node_id = highest_used_node_id_;
    tree_header::write(header_path_, header);
    log_message("Saved header " + header_path_.string());
}

void RTree::close() {
    if (!initialized_) {
        return;
    }
    store_->close();
    save();
    initialized_ = false;
    log_message("Closed tree");
}

void RTree::fail_consistency(const std::string& message) const {
    log_message("Consistency check failed: " + message, true);
    throw ConsistencyError(message);
}

void RTree::check_consistency() {
    ensure_initialized();
    const std::size_t leaf_entries = check_node(root_node_id_, tree_height_, nullptr);
    if (static_cast<std::int64_t>(leaf_entries) != size_) {
        fail_consistency("Tree holds " + std::to_string(leaf_entries) + " data entries, size is " +
                         std::to_string(size_));
    }
}

// Verifies the subtree under `node_id` and returns its data entry count.
std::size_t RTree::check_node(NodeId node_id, int expected_level, const Entry* parent_entry) {
    Node node;
    try {
        node = store_->get_node(node_id);
    } catch (const NodeNotFoundError& ex) {
        fail_consistency(std::string("Missing node: ") + ex.what());
    }

    const std::string where = "Node " + std::to_string(node_id);
    if (node.id() != node_id) {
        fail_consistency(where + " was read back as node " + std::to_string(node.id()));
    }
    if (node.level() != expected_level) {
        fail_consistency(where + " is at level " + std::to_string(node.level()) + ", expected " +
                         std::to_string(expected_level));
    }

    const bool is_root = parent_entry == nullptr;
    const auto count = node.entry_count();
    if (count > static_cast<std::size_t>(max_node_entries_)) {
        fail_consistency(where + " holds " + std::to_string(count) + " entries, max is " +
                         std::to_string(max_node_entries_));
    }
    if (!is_root && count < static_cast<std::size_t>(min_node_entries_)) {
        fail_consistency(where + " holds " + std::to_string(count) + " entries, min is " +
                         std::to_string(min_node_entries_));
    }
    if (is_root && !node.is_leaf() && count < 2) {
        fail_consistency("Internal root " + std::to_string(node_id) + " holds " + std::to_string(count) +
                         " entries");
    }

    if (count > 0 && node.calculate_mbr() != node.mbr()) {
        fail_consistency(where + " MBR " + node.mbr().to_string() + " should be " +
                         node.calculate_mbr().to_string());
    }

    if (parent_entry) {
        if (parent_entry->mbr != node.mbr()) {
            fail_consistency("Parent entry for " + where + " has MBR " + parent_entry->mbr.to_string() +
                             ", node has " + node.mbr().to_string());
        }
        if (options_.aggregator) {
            const double expected = node.aggregate(options_.aggregator);
            const double tolerance = 1e-9 * std::max(1.0, std::abs(expected));
            if (std::abs(parent_entry->aggregate - expected) > tolerance) {
                fail_consistency("Parent entry for " + where + " has aggregate " +
                                 std::to_string(parent_entry->aggregate) + ", expected " +
                                 std::to_string(expected));
            }
        }
    }

    if (node.is_leaf()) {
        return count;
    }

    std::size_t leaf_entries = 0;
    for (const auto& entry : node.entries()) {
        leaf_entries += check_node(static_cast<NodeId>(entry.id), expected_level - 1, &entry);
    }
    return leaf_entries;
}

LevelIterator RTree::level_iterator() {
    ensure_initialized();
    return LevelIterator(*store_, root_node_id_, tree_height_);
}

std::size_t RTree::num_leaf_entries() {
    std::size_t leaves = 0;
    auto it = level_iterator();
    while (it.has_next_leaf()) {
        (void)it.next_leaf();
        ++leaves;
    }
    return leaves;
}

Node RTree::get_node(NodeId id) {
    ensure_initialized();
    return store_->get_node(id);
}

std::string RTree::to_string(int min_level) {
    ensure_initialized();
    std::string out;
    append_node_string(out, root_node_id_, min_level, 0);
    return out;
}

void RTree::append_node_string(std::string& out, NodeId node_id, int min_level, int indent) {
    const Node node = store_->get_node(node_id);
    const std::string pad(static_cast<std::size_t>(indent) * 2, ' ');
    out += pad + node.to_string() + '\n';

    if (node.is_leaf()) {
        for (const auto& entry : node.entries()) {
            out += pad + "  Entry[" + std::to_string(entry.id) + "] " + entry.mbr.to_string() + '\n';
        }
        return;
    }
    if (node.level() - 1 < min_level) {
        return;
    }
    for (const auto& entry : node.entries()) {
        append_node_string(out, static_cast<NodeId>(entry.id), min_level, indent + 1);
    }
}

int RTree::height() const {
    ensure_initialized();
    return tree_height_;
}

NodeId RTree::root_node_id() const {
    ensure_initialized();
    return root_node_id_;
}

NodeId RTree::highest_used_node_id() const {
    ensure_initialized();
    return highest_used_node_id_;
}

std::vector<NodeId> RTree::free_node_ids() const {
    ensure_initialized();
    return free_node_ids_;
}

int RTree::max_node_entries() const {
    ensure_initialized();
    return max_node_entries_;
}

int RTree::min_node_entries() const {
    ensure_initialized();
    return min_node_entries_;
}

} // namespace rtreedb
