#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace rtreedb {

struct Point {
    std::vector<double> coordinates;

    Point() = default;

    explicit Point(std::vector<double> coords)
        : coordinates(std::move(coords)) {}

    Point(double x, double y)
        : coordinates{x, y} {}

    [[nodiscard]] std::size_t dimension() const { return coordinates.size(); }
};

// Axis-aligned box with min[i] <= max[i] in every dimension.
class Rectangle {
public:
    Rectangle() = default;

    Rectangle(std::vector<double> min, std::vector<double> max)
        : min_(std::move(min))
        , max_(std::move(max)) {
        if (min_.size() != max_.size()) {
            throw GeometryError("Rectangle min and max arrays must be of the same length");
        }
        for (std::size_t i = 0; i < min_.size(); ++i) {
            if (min_[i] > max_[i]) {
                throw GeometryError("Rectangle min exceeds max in dimension " + std::to_string(i));
            }
        }
    }

    Rectangle(double min_x, double min_y, double max_x, double max_y)
        : Rectangle(std::vector<double>{min_x, min_y}, std::vector<double>{max_x, max_y}) {}

    explicit Rectangle(const Point& point)
        : min_(point.coordinates)
        , max_(point.coordinates) {}

    [[nodiscard]] std::size_t dimension() const { return min_.size(); }
    [[nodiscard]] const std::vector<double>& min() const { return min_; }
    [[nodiscard]] const std::vector<double>& max() const { return max_; }

    [[nodiscard]] Rectangle copy() const { return *this; }

    [[nodiscard]] bool intersects(const Rectangle& other) const {
        for (std::size_t i = 0; i < dimension(); ++i) {
            if (max_[i] < other.min_[i] || min_[i] > other.max_[i]) {
                return false;
            }
        }
        return true;
    }

    // True if this rectangle encloses other.
    [[nodiscard]] bool contains(const Rectangle& other) const {
        for (std::size_t i = 0; i < dimension(); ++i) {
            if (max_[i] < other.max_[i] || min_[i] > other.min_[i]) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool contained_by(const Rectangle& other) const {
        return other.contains(*this);
    }

    [[nodiscard]] bool edge_overlaps(const Rectangle& other) const {
        for (std::size_t i = 0; i < dimension(); ++i) {
            if (min_[i] == other.min_[i] || max_[i] == other.max_[i]) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] double area() const {
        double result = 1.0;
        for (std::size_t i = 0; i < dimension(); ++i) {
            result *= (max_[i] - min_[i]);
        }
        return result;
    }

    // Area increase needed for this rectangle to absorb other.
    [[nodiscard]] double enlargement(const Rectangle& other) const {
        double enlarged = 1.0;
        for (std::size_t i = 0; i < dimension(); ++i) {
            enlarged *= (std::max(max_[i], other.max_[i]) - std::min(min_[i], other.min_[i]));
        }
        return enlarged - area();
    }

    // 0 when the point is inside, otherwise the distance to the nearest face.
    [[nodiscard]] double distance(const Point& point) const {
        double distance_squared = 0.0;
        for (std::size_t i = 0; i < dimension(); ++i) {
            const double greatest_min = std::max(min_[i], point.coordinates[i]);
            const double least_max = std::min(max_[i], point.coordinates[i]);
            if (greatest_min > least_max) {
                distance_squared += (greatest_min - least_max) * (greatest_min - least_max);
            }
        }
        return std::sqrt(distance_squared);
    }

    [[nodiscard]] double distance(const Rectangle& other) const {
        double distance_squared = 0.0;
        for (std::size_t i = 0; i < dimension(); ++i) {
            const double greatest_min = std::max(min_[i], other.min_[i]);
            const double least_max = std::min(max_[i], other.max_[i]);
            if (greatest_min > least_max) {
                distance_squared += (greatest_min - least_max) * (greatest_min - least_max);
            }
        }
        return std::sqrt(distance_squared);
    }

    [[nodiscard]] double furthest_distance(const Point& point) const {
        double value = 0.0;
        for (std::size_t d = 0; d < dimension(); ++d) {
            const double middle = min_[d] + (max_[d] - min_[d]) / 2.0;
            const double delta = point.coordinates[d] < middle
                ? max_[d] - point.coordinates[d]
                : point.coordinates[d] - min_[d];
            value += delta * delta;
        }
        return std::sqrt(value);
    }

    // Largest furthest_distance over the corners of other.
    [[nodiscard]] double furthest_distance(const Rectangle& other) const {
        const std::size_t corners = std::size_t{1} << dimension();
        Point corner(std::vector<double>(dimension(), 0.0));
        double max_distance = 0.0;
        for (std::size_t mask = 0; mask < corners; ++mask) {
            for (std::size_t d = 0; d < dimension(); ++d) {
                corner.coordinates[d] = ((mask >> d) & 1U) == 0 ? other.min_[d] : other.max_[d];
            }
            max_distance = std::max(max_distance, furthest_distance(corner));
        }
        return max_distance;
    }

    void union_in_place(const Rectangle& other) {
        for (std::size_t i = 0; i < dimension(); ++i) {
            min_[i] = std::min(min_[i], other.min_[i]);
            max_[i] = std::max(max_[i], other.max_[i]);
        }
    }

    [[nodiscard]] Rectangle union_with(const Rectangle& other) const {
        Rectangle result = *this;
        result.union_in_place(other);
        return result;
    }

    bool operator==(const Rectangle& other) const {
        return min_ == other.min_ && max_ == other.max_;
    }

    bool operator!=(const Rectangle& other) const { return !(*this == other); }

    [[nodiscard]] std::string to_string() const {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2);
        out << '(';
        for (std::size_t i = 0; i < dimension(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << min_[i];
        }
        out << "), (";
        for (std::size_t i = 0; i < dimension(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << max_[i];
        }
        out << ')';
        return out.str();
    }

private:
    std::vector<double> min_;
    std::vector<double> max_;
};

} // namespace rtreedb
