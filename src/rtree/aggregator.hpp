#pragma once

#include <algorithm>
#include <limits>
#include <string>

namespace rtreedb {

// Optional per-entry aggregate carried up the tree next to the MBRs.
// An internal entry holds the merge of every entry of the child it points to.
class Aggregator {
public:
    virtual ~Aggregator() = default;

    [[nodiscard]] virtual double identity() const = 0;
    [[nodiscard]] virtual double merge(double accumulated, double value) const = 0;

    // Value stored for a data entry inserted with `value`.
    [[nodiscard]] virtual double leaf_value(double value) const { return value; }

    [[nodiscard]] virtual std::string name() const = 0;
};

class MaxAggregator final : public Aggregator {
public:
    [[nodiscard]] double identity() const override { return std::numeric_limits<double>::lowest(); }
    [[nodiscard]] double merge(double accumulated, double value) const override {
        return std::max(accumulated, value);
    }
    [[nodiscard]] std::string name() const override { return "max"; }
};

class MinAggregator final : public Aggregator {
public:
    [[nodiscard]] double identity() const override { return std::numeric_limits<double>::max(); }
    [[nodiscard]] double merge(double accumulated, double value) const override {
        return std::min(accumulated, value);
    }
    [[nodiscard]] std::string name() const override { return "min"; }
};

class SumAggregator final : public Aggregator {
public:
    [[nodiscard]] double identity() const override { return 0.0; }
    [[nodiscard]] double merge(double accumulated, double value) const override {
        return accumulated + value;
    }
    [[nodiscard]] std::string name() const override { return "sum"; }
};

// Counts data entries below each internal entry.
class CountAggregator final : public Aggregator {
public:
    [[nodiscard]] double identity() const override { return 0.0; }
    [[nodiscard]] double merge(double accumulated, double value) const override {
        return accumulated + value;
    }
    [[nodiscard]] double leaf_value(double) const override { return 1.0; }
    [[nodiscard]] std::string name() const override { return "count"; }
};

} // namespace rtreedb
