#include "rtree.hpp"
#include "../storage/memory_page_store.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rtreedb {

namespace rtree_tests {

struct TestTree {
    storage::MemoryPageStore store;
    RTree tree;

    explicit TestTree(int min_entries = 2, int max_entries = 4, RTree::Options options = {},
                      std::size_t dimensions = 2)
        : tree(dimensions, store, {}, std::move(options)) {
        tree.init(StorageKind::kMemory, min_entries, max_entries);
    }
};

std::set<EntryId> ids_of(const std::vector<Entry>& entries) {
    std::set<EntryId> ids;
    for (const auto& entry : entries) {
        ids.insert(entry.id);
    }
    return ids;
}

Rectangle unit_square(double x, double y) {
    return Rectangle(x, y, x + 1.0, y + 1.0);
}

bool consistent(RTree& tree) {
    try {
        tree.check_consistency();
        return true;
    } catch (const ConsistencyError& ex) {
        std::cerr << "Consistency check failed: " << ex.what() << std::endl;
        return false;
    }
}

bool test_uninitialized_tree_rejects_operations() {
    storage::MemoryPageStore store;
    RTree tree(2, store, {});

    try {
        tree.add(1, unit_square(0, 0));
        std::cerr << "add() before init() should throw" << std::endl;
        return false;
    } catch (const ConfigurationError&) {
        std::cerr << "Wrong error kind before init()" << std::endl;
        return false;
    } catch (const RTreeError&) {
    }

    try {
        (void)tree.size();
        return false;
    } catch (const RTreeError&) {
    }
    return !tree.is_initialized();
}

bool test_invalid_fanout_rejected() {
    const std::pair<int, int> invalid[] = {{3, 4}, {0, 4}, {1, 1}, {2, 3}, {-1, 10}};

    for (const auto& [min_entries, max_entries] : invalid) {
        storage::MemoryPageStore store;
        RTree tree(2, store, {});
        try {
            tree.init(StorageKind::kMemory, min_entries, max_entries);
            std::cerr << "init(" << min_entries << ", " << max_entries << ") should fail" << std::endl;
            return false;
        } catch (const ConfigurationError&) {
        }
        if (tree.is_initialized() || store.page_count() != 0) {
            std::cerr << "Failed init left state behind" << std::endl;
            return false;
        }
    }

    storage::MemoryPageStore store;
    RTree tree(2, store, {});
    tree.init(StorageKind::kMemory, 1, 2);
    return tree.is_initialized() && tree.max_node_entries() == 2 && tree.min_node_entries() == 1;
}

bool test_empty_tree() {
    TestTree t;
    return t.tree.size() == 0 && t.tree.height() == 1 && !t.tree.get_bounds().has_value() &&
           t.tree.intersects(Rectangle(-10, -10, 10, 10)).empty() &&
           t.tree.contains(Rectangle(-10, -10, 10, 10)).empty() &&
           t.tree.nearest(Point(0, 0)).empty() && consistent(t.tree);
}

bool test_five_disjoint_squares_split_once() {
    TestTree t(2, 4);
    for (int i = 0; i < 5; ++i) {
        t.tree.add(i + 1, unit_square(2.0 * i, 0.0));
    }

    if (t.tree.height() != 2) {
        std::cerr << "Expected height 2, got " << t.tree.height() << std::endl;
        return false;
    }

    const Node root = t.tree.get_node(t.tree.root_node_id());
    if (root.entry_count() != 2) {
        std::cerr << "Expected a root with 2 entries, got " << root.entry_count() << std::endl;
        return false;
    }

    std::size_t total = 0;
    for (const auto& entry : root.entries()) {
        const Node leaf = t.tree.get_node(static_cast<NodeId>(entry.id));
        if (!leaf.is_leaf() || leaf.entry_count() < 2 || leaf.entry_count() > 4) {
            std::cerr << "Leaf " << leaf.id() << " holds " << leaf.entry_count() << " entries" << std::endl;
            return false;
        }
        total += leaf.entry_count();
    }
    if (total != 5 || t.tree.num_leaf_entries() != 2 || !consistent(t.tree)) {
        return false;
    }

    if (!t.tree.remove(unit_square(4.0, 0.0), 3)) {
        std::cerr << "Entry 3 should be removable" << std::endl;
        return false;
    }

    const auto remaining = ids_of(t.tree.intersects(Rectangle(-100, -100, 100, 100)));
    return t.tree.size() == 4 && remaining == std::set<EntryId>{1, 2, 4, 5} && consistent(t.tree);
}

bool test_size_tracks_adds_and_removes() {
    TestTree t(2, 6);
    for (int i = 0; i < 100; ++i) {
        t.tree.add(i, unit_square(i % 10 * 3.0, i / 10 * 3.0));
    }

    int removed = 0;
    for (int i = 0; i < 100; i += 3) {
        if (t.tree.remove(unit_square(i % 10 * 3.0, i / 10 * 3.0), i)) {
            ++removed;
        }
    }
    if (removed != 34) {
        std::cerr << "Expected 34 removals, got " << removed << std::endl;
        return false;
    }

    // Already gone, and wrong rectangle for a live id.
    if (t.tree.remove(unit_square(0, 0), 0) || t.tree.remove(unit_square(50, 50), 1)) {
        std::cerr << "Removing a missing entry should return false" << std::endl;
        return false;
    }

    return t.tree.size() == 66 && t.tree.intersects(Rectangle(-1, -1, 100, 100)).size() == 66 &&
           consistent(t.tree);
}

bool test_remove_missing_entry_leaves_tree_unchanged() {
    TestTree t(2, 4);
    for (int i = 0; i < 40; ++i) {
        t.tree.add(i, unit_square(i * 1.5, (i % 7) * 2.0));
    }

    const std::string before = t.tree.to_string();
    const auto writes_before = t.store.writes();

    if (t.tree.remove(unit_square(3.0, 0.0), 999) || t.tree.remove(Rectangle(500, 500, 501, 501), 5)) {
        return false;
    }
    if (t.store.writes() != writes_before || t.tree.to_string() != before) {
        std::cerr << "A failed remove modified the tree" << std::endl;
        return false;
    }
    return t.tree.size() == 40;
}

bool test_contains_is_subset_of_intersects() {
    TestTree t(3, 8);
    int id = 0;
    for (int x = 0; x < 20; ++x) {
        for (int y = 0; y < 20; ++y) {
            t.tree.add(id++, Rectangle(x, y, x + 0.5 + (x % 3), y + 0.5 + (y % 2)));
        }
    }

    const Rectangle queries[] = {
        Rectangle(5, 5, 10, 10),
        Rectangle(0, 0, 1, 1),
        Rectangle(-5, -5, 30, 30),
        Rectangle(12.2, 3.1, 12.3, 3.2),
    };

    for (const auto& query : queries) {
        const auto contained = ids_of(t.tree.contains(query));
        const auto touched = ids_of(t.tree.intersects(query));
        if (!std::includes(touched.begin(), touched.end(), contained.begin(), contained.end())) {
            std::cerr << "contains() returned entries outside intersects() for " << query.to_string() << std::endl;
            return false;
        }
    }

    if (t.tree.contains(Rectangle(-5, -5, 30, 30)).size() != 400) {
        return false;
    }
    for (const auto& entry : t.tree.contains(Rectangle(5, 5, 10, 10))) {
        if (!Rectangle(5, 5, 10, 10).contains(entry.mbr)) {
            return false;
        }
    }
    return true;
}

bool test_nearest_returns_all_ties() {
    TestTree t(2, 4);
    t.tree.add(1, Rectangle(Point(3, 0)));
    t.tree.add(2, Rectangle(Point(-3, 0)));
    t.tree.add(3, Rectangle(Point(0, 3)));
    t.tree.add(4, Rectangle(Point(0, -3)));
    t.tree.add(5, Rectangle(Point(5, 5)));
    t.tree.add(6, Rectangle(Point(-10, 7)));

    const auto nearest = ids_of(t.tree.nearest(Point(0, 0)));
    if (nearest != std::set<EntryId>{1, 2, 3, 4}) {
        std::cerr << "Expected the four equidistant points" << std::endl;
        return false;
    }

    if (!t.tree.nearest(Point(0, 0), 2.9).empty()) {
        std::cerr << "Nothing lies within 2.9 of the origin" << std::endl;
        return false;
    }
    if (ids_of(t.tree.nearest(Point(0, 0), 3.0)) != nearest) {
        return false;
    }
    return ids_of(t.tree.nearest(Point(5.5, 5.0))) == std::set<EntryId>{5};
}

bool test_nearest_inside_rectangle() {
    TestTree t(2, 4);
    t.tree.add(1, Rectangle(0, 0, 10, 10));
    t.tree.add(2, Rectangle(2, 2, 3, 3));
    t.tree.add(3, Rectangle(20, 20, 21, 21));

    const auto result = t.tree.nearest(Point(2.5, 2.5));
    return ids_of(result) == std::set<EntryId>{1, 2};
}

bool test_condense_reinserts_orphans_at_their_level() {
    RTree::Options options;
    options.check_consistency_after_mutation = true;
    TestTree t(2, 4, options);

    std::vector<std::pair<EntryId, Rectangle>> items;
    for (int x = 0; x < 12; ++x) {
        for (int y = 0; y < 12; ++y) {
            items.emplace_back(x * 12 + y, unit_square(x * 2.0, y * 2.0));
        }
    }
    for (const auto& [id, rect] : items) {
        t.tree.add(id, rect);
    }
    if (t.tree.height() < 4) {
        std::cerr << "Expected at least four levels, got " << t.tree.height() << std::endl;
        return false;
    }

    // Clearing one corner block at a time collapses whole subtrees, so
    // orphans from internal levels are reinserted along with leaf entries.
    std::vector<std::pair<EntryId, Rectangle>> order = items;
    std::stable_sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
        return a.second.min()[0] + a.second.min()[1] < b.second.min()[0] + b.second.min()[1];
    });

    std::set<EntryId> live;
    for (const auto& item : items) {
        live.insert(item.first);
    }

    for (std::size_t i = 0; i < order.size(); ++i) {
        if (!t.tree.remove(order[i].second, order[i].first)) {
            std::cerr << "Failed to remove entry " << order[i].first << std::endl;
            return false;
        }
        live.erase(order[i].first);

        if (i % 16 == 0 && ids_of(t.tree.intersects(Rectangle(-1, -1, 30, 30))) != live) {
            std::cerr << "Live entries diverged after " << i + 1 << " removals" << std::endl;
            return false;
        }
    }

    return t.tree.size() == 0 && t.tree.height() == 1 && !t.tree.get_bounds().has_value();
}

bool test_freed_node_ids_are_reused() {
    TestTree t(2, 4);
    std::vector<Rectangle> rects;
    for (int i = 0; i < 64; ++i) {
        rects.push_back(unit_square((i % 8) * 2.0, (i / 8) * 2.0));
        t.tree.add(i, rects.back());
    }

    for (int i = 0; i < 64; ++i) {
        if (!t.tree.remove(rects[static_cast<std::size_t>(i)], i)) {
            return false;
        }
    }

    // Every allocated id except the root's is either live or free.
    const NodeId highest = t.tree.highest_used_node_id();
    const auto free_ids = t.tree.free_node_ids();
    if (static_cast<NodeId>(free_ids.size()) != highest - 1) {
        std::cerr << "Expected " << highest - 1 << " free ids, got " << free_ids.size() << std::endl;
        return false;
    }
    if (std::find(free_ids.begin(), free_ids.end(), t.tree.root_node_id()) != free_ids.end()) {
        std::cerr << "Root id is on the free list" << std::endl;
        return false;
    }

    for (int i = 0; i < 12; ++i) {
        t.tree.add(i, rects[static_cast<std::size_t>(i)]);
    }
    if (t.tree.highest_used_node_id() != highest) {
        std::cerr << "New nodes should come from the free list" << std::endl;
        return false;
    }
    return consistent(t.tree);
}

bool test_sum_and_count_aggregates() {
    SumAggregator sum;
    RTree::Options options;
    options.aggregator = &sum;
    options.check_consistency_after_mutation = true;
    TestTree t(2, 4, options);

    double expected = 0.0;
    for (int i = 0; i < 50; ++i) {
        t.tree.add(i, unit_square(i * 1.5, 0), static_cast<double>(i));
        expected += i;
    }
    if (std::abs(t.tree.root_aggregate() - expected) > 1e-9) {
        std::cerr << "Sum aggregate " << t.tree.root_aggregate() << ", expected " << expected << std::endl;
        return false;
    }

    for (int i = 0; i < 50; i += 2) {
        (void)t.tree.remove(unit_square(i * 1.5, 0), i);
        expected -= i;
    }
    if (std::abs(t.tree.root_aggregate() - expected) > 1e-9) {
        return false;
    }

    CountAggregator count;
    RTree::Options count_options;
    count_options.aggregator = &count;
    TestTree counted(2, 4, count_options);
    for (int i = 0; i < 30; ++i) {
        counted.tree.add(i, unit_square(0, i * 2.0), 99.0);
    }
    return counted.tree.root_aggregate() == 30.0 && consistent(counted.tree);
}

bool test_max_aggregate_drops_removed_maximum() {
    MaxAggregator max;
    RTree::Options options;
    options.aggregator = &max;
    TestTree t(2, 4, options);

    for (int i = 0; i < 20; ++i) {
        t.tree.add(i, unit_square(i * 2.0, i * 2.0), static_cast<double>(i));
    }
    if (t.tree.root_aggregate() != 19.0) {
        return false;
    }

    (void)t.tree.remove(unit_square(38.0, 38.0), 19);
    (void)t.tree.remove(unit_square(36.0, 36.0), 18);
    return t.tree.root_aggregate() == 17.0 && consistent(t.tree);
}

bool test_level_iterator() {
    TestTree t(2, 4);
    for (int i = 0; i < 30; ++i) {
        t.tree.add(i, unit_square(i * 2.0, 0));
    }

    auto leaves = t.tree.level_iterator();
    auto parents = t.tree.level_iterator();

    std::size_t leaf_count = 0;
    std::size_t entry_count = 0;
    while (leaves.has_next_leaf()) {
        const Node leaf = leaves.next_leaf();
        if (!leaf.is_leaf()) {
            return false;
        }
        ++leaf_count;
        entry_count += leaf.entry_count();
    }
    if (entry_count != 30 || leaf_count != t.tree.num_leaf_entries()) {
        std::cerr << "Leaf scan saw " << entry_count << " entries in " << leaf_count << " leaves" << std::endl;
        return false;
    }

    std::size_t parent_count = 0;
    while (parents.has_next_parent_of_leaves()) {
        if (parents.next_parent_of_leaves().level() != 2) {
            return false;
        }
        ++parent_count;
    }
    if (parent_count == 0) {
        return false;
    }

    try {
        (void)leaves.next_leaf();
        std::cerr << "Exhausted iterator should throw" << std::endl;
        return false;
    } catch (const RTreeError&) {
    }

    leaves.reset();
    return leaves.has_next_leaf();
}

bool test_linear_split_tree() {
    RTree::Options options;
    options.split_algorithm = SplitAlgorithm::kLinear;
    TestTree t(3, 10, options);

    for (int i = 0; i < 500; ++i) {
        const double x = std::fmod(i * 37.0, 200.0);
        const double y = std::fmod(i * 91.0, 170.0);
        t.tree.add(i, Rectangle(x, y, x + 2.0, y + 3.0));
    }
    for (int i = 0; i < 500; i += 5) {
        const double x = std::fmod(i * 37.0, 200.0);
        const double y = std::fmod(i * 91.0, 170.0);
        if (!t.tree.remove(Rectangle(x, y, x + 2.0, y + 3.0), i)) {
            return false;
        }
    }
    return t.tree.size() == 400 && t.tree.intersects(Rectangle(-1, -1, 250, 250)).size() == 400 &&
           consistent(t.tree);
}

bool test_duplicate_rectangles() {
    TestTree t(2, 4);
    const Rectangle shared(10, 10, 15, 15);
    for (int i = 0; i < 25; ++i) {
        t.tree.add(i, shared);
    }

    if (!t.tree.remove(shared, 13) || t.tree.remove(shared, 13)) {
        return false;
    }
    const auto ids = ids_of(t.tree.intersects(Rectangle(11, 11, 12, 12)));
    return ids.size() == 24 && ids.count(13) == 0 && consistent(t.tree);
}

bool test_dimension_mismatch_rejected() {
    TestTree t(2, 4);
    const Rectangle cube(std::vector<double>{0, 0, 0}, std::vector<double>{1, 1, 1});
    try {
        t.tree.add(1, cube);
        return false;
    } catch (const GeometryError&) {
    }
    try {
        (void)t.tree.nearest(Point(std::vector<double>{1.0}));
        return false;
    } catch (const GeometryError&) {
    }
    return t.tree.size() == 0;
}

bool test_three_dimensional_tree() {
    TestTree t(2, 5, {}, 3);
    int id = 0;
    for (int x = 0; x < 5; ++x) {
        for (int y = 0; y < 5; ++y) {
            for (int z = 0; z < 5; ++z) {
                t.tree.add(id++, Rectangle(std::vector<double>{x * 2.0, y * 2.0, z * 2.0},
                                           std::vector<double>{x * 2.0 + 1, y * 2.0 + 1, z * 2.0 + 1}));
            }
        }
    }

    const Rectangle slab(std::vector<double>{-1, -1, 3.5}, std::vector<double>{20, 20, 5.5});
    const auto bounds = t.tree.get_bounds();
    return t.tree.intersects(slab).size() == 25 && bounds.has_value() &&
           *bounds == Rectangle(std::vector<double>{0, 0, 0}, std::vector<double>{9, 9, 9}) &&
           t.tree.nearest(Point(std::vector<double>{4.5, 4.5, 4.5})).size() == 1 && consistent(t.tree);
}

bool test_consistency_check_detects_stale_mbr() {
    std::vector<std::string> errors;
    RTree::Options options;
    options.log_callback = [&errors](const std::string& message, bool is_error) {
        if (is_error) {
            errors.push_back(message);
        }
    };
    TestTree t(2, 4, options);
    for (int i = 0; i < 12; ++i) {
        t.tree.add(i, unit_square(i * 2.0, 0));
    }

    const Node root = t.tree.get_node(t.tree.root_node_id());
    const Node child = t.tree.get_node(static_cast<NodeId>(root.entry(0).id));
    t.store.store(child.id(), Node::restore(child.id(), child.level(), child.capacity(), child.entries(),
                                            Rectangle(-50, -50, -40, -40)));

    try {
        t.tree.check_consistency();
        std::cerr << "Stale MBR went unnoticed" << std::endl;
        return false;
    } catch (const ConsistencyError&) {
    }
    return errors.size() == 1;
}

bool test_dump_and_version() {
    TestTree t(2, 4);
    for (int i = 0; i < 9; ++i) {
        t.tree.add(i, unit_square(i * 2.0, 0));
    }

    const std::string full = t.tree.to_string();
    const std::string top = t.tree.to_string(t.tree.height());
    if (full.find("Node[" + std::to_string(t.tree.root_node_id()) + "]") != 0) {
        std::cerr << "Dump should start with the root:\n" << full << std::endl;
        return false;
    }
    if (full.find("Entry[8]") == std::string::npos || top.find("Entry[") != std::string::npos) {
        std::cerr << "Unexpected dump depth" << std::endl;
        return false;
    }
    return RTree::version() == "RTree-1.0b2p1";
}

bool test_close_and_reinit_memory_tree() {
    TestTree t(2, 4);
    t.tree.add(1, unit_square(0, 0));
    t.tree.save();
    t.tree.close();
    t.tree.close();

    try {
        (void)t.tree.intersects(unit_square(0, 0));
        return false;
    } catch (const RTreeError&) {
    }

    t.tree.init(StorageKind::kMemory, 2, 4);
    return t.tree.size() == 0 && t.tree.intersects(unit_square(0, 0)).empty();
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"uninitialized_tree_rejects_operations", &test_uninitialized_tree_rejects_operations},
        {"invalid_fanout_rejected", &test_invalid_fanout_rejected},
        {"empty_tree", &test_empty_tree},
        {"five_disjoint_squares_split_once", &test_five_disjoint_squares_split_once},
        {"size_tracks_adds_and_removes", &test_size_tracks_adds_and_removes},
        {"remove_missing_entry_leaves_tree_unchanged", &test_remove_missing_entry_leaves_tree_unchanged},
        {"contains_is_subset_of_intersects", &test_contains_is_subset_of_intersects},
        {"nearest_returns_all_ties", &test_nearest_returns_all_ties},
        {"nearest_inside_rectangle", &test_nearest_inside_rectangle},
        {"condense_reinserts_orphans_at_their_level", &test_condense_reinserts_orphans_at_their_level},
        {"freed_node_ids_are_reused", &test_freed_node_ids_are_reused},
        {"sum_and_count_aggregates", &test_sum_and_count_aggregates},
        {"max_aggregate_drops_removed_maximum", &test_max_aggregate_drops_removed_maximum},
        {"level_iterator", &test_level_iterator},
        {"linear_split_tree", &test_linear_split_tree},
        {"duplicate_rectangles", &test_duplicate_rectangles},
        {"dimension_mismatch_rejected", &test_dimension_mismatch_rejected},
        {"three_dimensional_tree", &test_three_dimensional_tree},
        {"consistency_check_detects_stale_mbr", &test_consistency_check_detects_stale_mbr},
        {"dump_and_version", &test_dump_and_version},
        {"close_and_reinit_memory_tree", &test_close_and_reinit_memory_tree},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        try {
            if (!fn()) {
                std::cerr << "Test failed: " << name << std::endl;
                all_passed = false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Test failed: " << name << " threw " << ex.what() << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace rtree_tests

} // namespace rtreedb

int main() {
    if (rtreedb::rtree_tests::run_all_tests()) {
        std::cout << "All RTree tests passed" << std::endl;
        return 0;
    }

    std::cerr << "RTree tests failed" << std::endl;
    return 1;
}
