#include "split.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace rtreedb::split {

namespace {

struct Group {
    std::vector<Entry> entries;
    Rectangle mbr;

    void add(Entry entry) {
        if (entries.empty()) {
            mbr = entry.mbr;
        } else {
            mbr.union_in_place(entry.mbr);
        }
        entries.push_back(std::move(entry));
    }
};

enum class Target {
    kOriginal,
    kSibling
};

// Guttman's PickNext: the unassigned entry with the strongest preference for
// one group, placed by least enlargement, then smaller area, then fewer entries.
std::pair<std::size_t, Target> pick_next(const std::vector<Entry>& entries,
                                         const std::vector<bool>& assigned,
                                         const Group& original,
                                         const Group& sibling) {
    double max_difference = -std::numeric_limits<double>::infinity();
    std::size_t next = 0;
    Target target = Target::kOriginal;

    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (assigned[i]) {
            continue;
        }

        const double original_increase = original.mbr.enlargement(entries[i].mbr);
        const double sibling_increase = sibling.mbr.enlargement(entries[i].mbr);
        const double difference = std::abs(original_increase - sibling_increase);

        if (difference > max_difference) {
            next = i;
            max_difference = difference;

            const double original_area = original.mbr.area();
            const double sibling_area = sibling.mbr.area();
            if (original_increase < sibling_increase) {
                target = Target::kOriginal;
            } else if (sibling_increase < original_increase) {
                target = Target::kSibling;
            } else if (original_area < sibling_area) {
                target = Target::kOriginal;
            } else if (sibling_area < original_area) {
                target = Target::kSibling;
            } else if (sibling.entries.size() < original.entries.size()) {
                target = Target::kSibling;
            } else {
                target = Target::kOriginal;
            }
        }
    }

    return {next, target};
}

} // namespace

Seeds pick_seeds_quadratic(const std::vector<Entry>& entries) {
    const std::size_t incoming = entries.size() - 1;
    Seeds seeds{0, incoming};
    double max_waste = -std::numeric_limits<double>::infinity();

    // The incoming entry against every existing one first, then every
    // existing pair; the first pair with the largest waste wins.
    const Rectangle& incoming_mbr = entries[incoming].mbr;
    const double incoming_area = incoming_mbr.area();
    for (std::size_t i = 0; i < incoming; ++i) {
        const double waste = incoming_mbr.enlargement(entries[i].mbr) - incoming_area - entries[i].mbr.area();
        if (waste > max_waste) {
            max_waste = waste;
            seeds = Seeds{i, incoming};
        }
    }

    for (std::size_t i = 0; i < incoming; ++i) {
        const double area_i = entries[i].mbr.area();
        for (std::size_t v = i + 1; v < incoming; ++v) {
            const double waste = entries[i].mbr.enlargement(entries[v].mbr) - area_i - entries[v].mbr.area();
            if (waste > max_waste) {
                max_waste = waste;
                seeds = Seeds{v, i};
            }
        }
    }

    return seeds;
}

Seeds pick_seeds_linear(const std::vector<Entry>& entries) {
    const std::size_t incoming = entries.size() - 1;
    Seeds seeds{0, incoming};
    double max_separation = 0.0;

    Rectangle extent = entries.front().mbr;
    for (const auto& entry : entries) {
        extent.union_in_place(entry.mbr);
    }

    for (std::size_t d = 0; d < extent.dimension(); ++d) {
        const double width = extent.max()[d] - extent.min()[d];
        if (width <= 0.0) {
            continue;
        }

        std::size_t highest_low = 0;
        for (std::size_t i = 1; i < entries.size(); ++i) {
            if (entries[i].mbr.min()[d] >= entries[highest_low].mbr.min()[d]) {
                highest_low = i;
            }
        }

        std::size_t lowest_high = highest_low == 0 ? 1 : 0;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (i == highest_low) {
                continue;
            }
            if (entries[i].mbr.max()[d] < entries[lowest_high].mbr.max()[d]) {
                lowest_high = i;
            }
        }

        const double separation =
            (entries[highest_low].mbr.min()[d] - entries[lowest_high].mbr.max()[d]) / width;
        if (separation > max_separation) {
            max_separation = separation;
            seeds = Seeds{lowest_high, highest_low};
        }
    }

    return seeds;
}

SplitResult split_entries(std::vector<Entry> entries, std::size_t min_entries, SplitAlgorithm algorithm) {
    if (entries.size() < 2) {
        throw RTreeError("Cannot split fewer than two entries");
    }

    const Seeds seeds = algorithm == SplitAlgorithm::kLinear
        ? pick_seeds_linear(entries)
        : pick_seeds_quadratic(entries);

    std::vector<bool> assigned(entries.size(), false);
    Group original;
    Group sibling;
    original.add(entries[seeds.original]);
    sibling.add(entries[seeds.sibling]);
    assigned[seeds.original] = true;
    assigned[seeds.sibling] = true;

    std::size_t remaining = entries.size() - 2;
    while (remaining > 0) {
        // If one group needs every remaining entry to reach the minimum, hand them over.
        if (original.entries.size() + remaining == min_entries) {
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (!assigned[i]) {
                    assigned[i] = true;
                    original.add(std::move(entries[i]));
                }
            }
            break;
        }
        if (sibling.entries.size() + remaining == min_entries) {
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (!assigned[i]) {
                    assigned[i] = true;
                    sibling.add(std::move(entries[i]));
                }
            }
            break;
        }

        const auto [next, target] = pick_next(entries, assigned, original, sibling);
        assigned[next] = true;
        if (target == Target::kOriginal) {
            original.add(std::move(entries[next]));
        } else {
            sibling.add(std::move(entries[next]));
        }
        --remaining;
    }

    return SplitResult{std::move(original.entries), std::move(sibling.entries)};
}

} // namespace rtreedb::split
