#include "split.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <utility>
#include <vector>

namespace rtreedb {

namespace split_tests {

std::vector<EntryId> ids_of(const std::vector<Entry>& entries) {
    std::vector<EntryId> ids;
    for (const auto& entry : entries) {
        ids.push_back(entry.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool test_quadratic_seeds_pick_most_wasteful_pair() {
    const std::vector<Entry> entries = {
        Entry(1, Rectangle(0, 0, 1, 1)),
        Entry(2, Rectangle(10, 10, 11, 11)),
        Entry(3, Rectangle(0.5, 0, 1.5, 1)),
        Entry(4, Rectangle(10.5, 10, 11.5, 11)),
        Entry(5, Rectangle(5, 5, 6, 6)),
    };

    const auto seeds = split::pick_seeds_quadratic(entries);
    if (seeds.original != 3 || seeds.sibling != 0) {
        std::cerr << "Expected seeds (3, 0), got (" << seeds.original << ", " << seeds.sibling << ")" << std::endl;
        return false;
    }
    return true;
}

bool test_quadratic_split_groups_clusters() {
    std::vector<Entry> entries = {
        Entry(1, Rectangle(0, 0, 1, 1)),
        Entry(2, Rectangle(10, 10, 11, 11)),
        Entry(3, Rectangle(0.5, 0, 1.5, 1)),
        Entry(4, Rectangle(10.5, 10, 11.5, 11)),
        Entry(5, Rectangle(5, 5, 6, 6)),
    };

    const auto result = split::split_entries(std::move(entries), 2, SplitAlgorithm::kQuadratic);
    if (ids_of(result.original) != std::vector<EntryId>{2, 4}) {
        std::cerr << "Original group should hold entries 2 and 4" << std::endl;
        return false;
    }
    if (ids_of(result.sibling) != std::vector<EntryId>{1, 3, 5}) {
        std::cerr << "Sibling group should hold entries 1, 3 and 5" << std::endl;
        return false;
    }
    return true;
}

bool test_remaining_entries_assigned_en_masse() {
    std::vector<Entry> entries = {
        Entry(1, Rectangle(0, 0, 1, 1)),
        Entry(2, Rectangle(0.1, 0, 1.1, 1)),
        Entry(3, Rectangle(0.2, 0, 1.2, 1)),
        Entry(4, Rectangle(100, 100, 101, 101)),
        Entry(5, Rectangle(0.3, 0, 1.3, 1)),
    };

    // Everything prefers the group seeded by entry 1, so the last entry is
    // forced into the group of the outlier to keep it at the minimum.
    const auto result = split::split_entries(std::move(entries), 2, SplitAlgorithm::kQuadratic);
    if (ids_of(result.original) != std::vector<EntryId>{4, 5}) {
        std::cerr << "Outlier group should be topped up with entry 5" << std::endl;
        return false;
    }
    return ids_of(result.sibling) == std::vector<EntryId>{1, 2, 3};
}

bool test_linear_seeds_use_normalized_separation() {
    const std::vector<Entry> entries = {
        Entry(1, Rectangle(0, 0, 1, 1)),
        Entry(2, Rectangle(2, 0, 3, 1)),
        Entry(3, Rectangle(4, 0, 5, 1)),
        Entry(4, Rectangle(9, 0, 10, 1)),
    };

    const auto seeds = split::pick_seeds_linear(entries);
    if (seeds.original != 0 || seeds.sibling != 3) {
        std::cerr << "Expected linear seeds (0, 3), got (" << seeds.original << ", " << seeds.sibling << ")"
                  << std::endl;
        return false;
    }
    return true;
}

bool test_linear_seeds_fallback_for_identical_entries() {
    std::vector<Entry> entries;
    for (EntryId id = 1; id <= 5; ++id) {
        entries.emplace_back(id, Rectangle(3, 3, 3, 3));
    }

    const auto seeds = split::pick_seeds_linear(entries);
    return seeds.original == 0 && seeds.sibling == 4;
}

bool test_split_rejects_single_entry() {
    try {
        (void)split::split_entries({Entry(1, Rectangle(0, 0, 1, 1))}, 1, SplitAlgorithm::kQuadratic);
    } catch (const RTreeError&) {
        return true;
    }
    std::cerr << "Splitting one entry should throw" << std::endl;
    return false;
}

bool test_random_splits_respect_minimum() {
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> coord(-100.0, 100.0);
    std::uniform_real_distribution<double> span(0.0, 15.0);

    for (const auto algorithm : {SplitAlgorithm::kQuadratic, SplitAlgorithm::kLinear}) {
        for (int trial = 0; trial < 200; ++trial) {
            const std::size_t max_entries = 2 + static_cast<std::size_t>(trial % 15);
            const std::size_t min_entries = 1 + static_cast<std::size_t>(trial) % (max_entries / 2);

            std::vector<Entry> entries;
            for (std::size_t i = 0; i <= max_entries; ++i) {
                const double x = coord(rng);
                const double y = coord(rng);
                entries.emplace_back(static_cast<EntryId>(i), Rectangle(x, y, x + span(rng), y + span(rng)));
            }

            const auto result = split::split_entries(entries, min_entries, algorithm);
            if (result.original.size() < min_entries || result.sibling.size() < min_entries ||
                result.original.size() > max_entries || result.sibling.size() > max_entries) {
                std::cerr << "Split of " << entries.size() << " entries with min " << min_entries
                          << " produced groups of " << result.original.size() << " and "
                          << result.sibling.size() << std::endl;
                return false;
            }

            std::vector<EntryId> all = ids_of(result.original);
            const auto sibling_ids = ids_of(result.sibling);
            all.insert(all.end(), sibling_ids.begin(), sibling_ids.end());
            std::sort(all.begin(), all.end());
            if (all != ids_of(entries)) {
                std::cerr << "Split lost or duplicated entries" << std::endl;
                return false;
            }
        }
    }
    return true;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"quadratic_seeds_pick_most_wasteful_pair", &test_quadratic_seeds_pick_most_wasteful_pair},
        {"quadratic_split_groups_clusters", &test_quadratic_split_groups_clusters},
        {"remaining_entries_assigned_en_masse", &test_remaining_entries_assigned_en_masse},
        {"linear_seeds_use_normalized_separation", &test_linear_seeds_use_normalized_separation},
        {"linear_seeds_fallback_for_identical_entries", &test_linear_seeds_fallback_for_identical_entries},
        {"split_rejects_single_entry", &test_split_rejects_single_entry},
        {"random_splits_respect_minimum", &test_random_splits_respect_minimum},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace split_tests

} // namespace rtreedb

int main() {
    if (rtreedb::split_tests::run_all_tests()) {
        std::cout << "All split tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Split tests failed" << std::endl;
    return 1;
}
