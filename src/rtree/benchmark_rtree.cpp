#include "rtree.hpp"
#include "simple_spatial_index.hpp"
#include "../storage/file_page_store.hpp"
#include "../storage/memory_page_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace rtreedb::benchmarks {

struct BenchmarkConfig {
    std::string label;
    std::size_t item_count;
    std::size_t query_count;
    double region_span;
    double query_span;
};

struct BenchmarkResult {
    std::string label;
    std::string index_name;
    std::size_t item_count{};
    std::size_t query_count{};
    double build_ms{};
    double query_ms{};
    double nearest_ms{};
    double avg_results{};
    std::size_t max_results{};
};

namespace detail {

constexpr double kWorldMin = -1000.0;
constexpr double kWorldMax = 1000.0;

struct ItemGenerator {
    std::mt19937_64 rng;
    std::uniform_real_distribution<double> coord_dist;
    std::uniform_real_distribution<double> span_dist;

    explicit ItemGenerator(std::uint64_t seed)
        : rng(seed)
        , coord_dist(kWorldMin, kWorldMax)
        , span_dist(5.0, 25.0) {}

    Rectangle next_box() {
        const double min_x = coord_dist(rng);
        const double min_y = coord_dist(rng);
        const double span_x = span_dist(rng);
        const double span_y = span_dist(rng);
        return Rectangle(min_x, min_y, min_x + span_x, min_y + span_y);
    }

    Rectangle next_query(double center_span, double window_span) {
        std::uniform_real_distribution<double> center_dist(-center_span, center_span);
        const double cx = center_dist(rng);
        const double cy = center_dist(rng);
        const double half = window_span * 0.5;
        return Rectangle(cx - half, cy - half, cx + half, cy + half);
    }
};

// Uniform insert/query surface over the indexes being compared.
class LinearScanAdapter {
public:
    static constexpr const char* name() { return "SimpleSpatialIndex"; }

    void insert(EntryId id, const Rectangle& box) { index_.insert(id, box); }
    std::size_t query(const Rectangle& box) const { return index_.intersects(box).size(); }
    std::size_t nearest(const Point& point) const { return index_.nearest(point).size(); }

private:
    SimpleSpatialIndex index_;
};

class MemoryTreeAdapter {
public:
    static constexpr const char* name() { return "RTree (memory)"; }

    MemoryTreeAdapter()
        : tree_(2, store_, {}) {
        tree_.init(StorageKind::kMemory, 8, 32);
    }

    void insert(EntryId id, const Rectangle& box) { tree_.add(id, box); }
    std::size_t query(const Rectangle& box) { return tree_.intersects(box).size(); }
    std::size_t nearest(const Point& point) { return tree_.nearest(point).size(); }

private:
    storage::MemoryPageStore store_;
    RTree tree_;
};

class FileTreeAdapter {
public:
    static constexpr const char* name() { return "RTree (file)"; }

    FileTreeAdapter()
        : dir_(std::filesystem::temp_directory_path() / "rtreedb_benchmark") {
        std::filesystem::remove_all(dir_);
        storage::FilePageStore::Config config;
        config.truncate = true;
        config.cache_capacity = 1024;
        store_ = std::make_unique<storage::FilePageStore>(dir_ / "index.dat", 2, 32, config);
        tree_ = std::make_unique<RTree>(2, *store_, dir_ / "index.res");
        tree_->init(StorageKind::kDisk, 8, 32);
    }

    ~FileTreeAdapter() {
        try {
            tree_->close();
        } catch (const std::exception& ex) {
            std::cerr << "[benchmark] failed to close " << dir_.string() << ": " << ex.what() << std::endl;
        }
        tree_.reset();
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FileTreeAdapter(const FileTreeAdapter&) = delete;
    FileTreeAdapter& operator=(const FileTreeAdapter&) = delete;

    void insert(EntryId id, const Rectangle& box) { tree_->add(id, box); }
    std::size_t query(const Rectangle& box) { return tree_->intersects(box).size(); }
    std::size_t nearest(const Point& point) { return tree_->nearest(point).size(); }

private:
    std::filesystem::path dir_;
    std::unique_ptr<storage::FilePageStore> store_;
    std::unique_ptr<RTree> tree_;
};

template <typename Adapter>
BenchmarkResult execute(const BenchmarkConfig& cfg, const std::vector<Rectangle>& boxes,
                        const std::vector<Rectangle>& queries) {
    Adapter index;

    const auto build_start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < boxes.size(); ++i) {
        index.insert(static_cast<EntryId>(i + 1), boxes[i]);
    }
    const auto build_end = std::chrono::steady_clock::now();

    std::vector<std::size_t> query_hit_counts(queries.size(), 0);
    const auto query_start = std::chrono::steady_clock::now();
    for (std::size_t q = 0; q < queries.size(); ++q) {
        query_hit_counts[q] = index.query(queries[q]);
    }
    const auto query_end = std::chrono::steady_clock::now();

    std::size_t nearest_hits = 0;
    const auto nearest_start = std::chrono::steady_clock::now();
    for (const auto& query : queries) {
        nearest_hits += index.nearest(Point(query.min()[0], query.min()[1]));
    }
    const auto nearest_end = std::chrono::steady_clock::now();
    (void)nearest_hits;

    const double build_ms = std::chrono::duration<double, std::milli>(build_end - build_start).count();
    const double query_ms = std::chrono::duration<double, std::milli>(query_end - query_start).count();
    const double nearest_ms = std::chrono::duration<double, std::milli>(nearest_end - nearest_start).count();

    const auto max_it = std::max_element(query_hit_counts.begin(), query_hit_counts.end());
    const double avg_hits = std::accumulate(query_hit_counts.begin(), query_hit_counts.end(), 0.0)
        / static_cast<double>(std::max<std::size_t>(1, queries.size()));

    return {
        cfg.label,
        Adapter::name(),
        boxes.size(),
        queries.size(),
        build_ms,
        query_ms,
        nearest_ms,
        avg_hits,
        max_it == query_hit_counts.end() ? 0 : *max_it
    };
}

} // namespace detail

class BenchmarkRunner {
public:
    explicit BenchmarkRunner(std::uint64_t seed = std::random_device{}())
        : generator_(seed) {}

    void add_config(BenchmarkConfig cfg) { configs_.push_back(std::move(cfg)); }

    [[nodiscard]] std::vector<BenchmarkResult> run() {
        std::vector<BenchmarkResult> results;

        for (const auto& cfg : configs_) {
            std::vector<Rectangle> boxes;
            std::vector<Rectangle> queries;
            boxes.reserve(cfg.item_count);
            queries.reserve(cfg.query_count);
            for (std::size_t i = 0; i < cfg.item_count; ++i) {
                boxes.push_back(generator_.next_box());
            }
            for (std::size_t q = 0; q < cfg.query_count; ++q) {
                queries.push_back(generator_.next_query(cfg.region_span, cfg.query_span));
            }

            results.push_back(detail::execute<detail::LinearScanAdapter>(cfg, boxes, queries));
            results.push_back(detail::execute<detail::MemoryTreeAdapter>(cfg, boxes, queries));
            results.push_back(detail::execute<detail::FileTreeAdapter>(cfg, boxes, queries));
        }

        return results;
    }

private:
    std::vector<BenchmarkConfig> configs_;
    detail::ItemGenerator generator_;
};

void print_results(const std::vector<BenchmarkResult>& results) {
    std::cout << std::left
              << std::setw(12) << "Scenario"
              << std::setw(22) << "Index"
              << std::setw(10) << "Items"
              << std::setw(10) << "Queries"
              << std::setw(12) << "Build(ms)"
              << std::setw(12) << "Query(ms)"
              << std::setw(14) << "Nearest(ms)"
              << std::setw(12) << "Avg Hits"
              << std::setw(12) << "Max Hits"
              << '\n';
    std::cout << std::string(116, '-') << '\n';

    for (const auto& result : results) {
        std::cout << std::left
                  << std::setw(12) << result.label
                  << std::setw(22) << result.index_name
                  << std::setw(10) << result.item_count
                  << std::setw(10) << result.query_count
                  << std::setw(12) << std::fixed << std::setprecision(3) << result.build_ms
                  << std::setw(12) << std::fixed << std::setprecision(3) << result.query_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << result.nearest_ms
                  << std::setw(12) << std::fixed << std::setprecision(2) << result.avg_results
                  << std::setw(12) << result.max_results
                  << '\n';
    }
}

} // namespace rtreedb::benchmarks

int main() {
    using namespace rtreedb::benchmarks;

    try {
        BenchmarkRunner runner(42);
        runner.add_config({"sparse", 5'000, 1'000, 900.0, 40.0});
        runner.add_config({"medium", 50'000, 2'000, 900.0, 60.0});
        runner.add_config({"dense", 200'000, 2'000, 400.0, 20.0});

        print_results(runner.run());
    } catch (const std::exception& ex) {
        std::cerr << "[benchmark] failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
