#pragma once

#include <cstddef>
#include <vector>

#include "node.hpp"

namespace rtreedb {

enum class SplitAlgorithm {
    kQuadratic,
    kLinear
};

namespace split {

// Indices into the entry list handed to the split. `sibling` seeds the new
// node, `original` stays with the node being split.
struct Seeds {
    std::size_t original = 0;
    std::size_t sibling = 0;
};

struct SplitResult {
    std::vector<Entry> original;
    std::vector<Entry> sibling;
};

// `entries` holds the max_entries entries of the full node followed by the
// entry that did not fit.
[[nodiscard]] Seeds pick_seeds_quadratic(const std::vector<Entry>& entries);
[[nodiscard]] Seeds pick_seeds_linear(const std::vector<Entry>& entries);

// Distributes max_entries + 1 entries over two groups of at least
// min_entries each.
[[nodiscard]] SplitResult split_entries(std::vector<Entry> entries,
                                        std::size_t min_entries,
                                        SplitAlgorithm algorithm);

} // namespace split
} // namespace rtreedb
