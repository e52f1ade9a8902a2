#pragma once

#include <cstddef>
#include <cstdint>
#include <cmath>
#include <vector>

namespace knowmap {

// 2D point in normalized map space; valid coordinates lie in [0, 1] x [0, 1]
struct Point2D {
    double x = 0.0;
    double y = 0.0;

    constexpr Point2D() noexcept = default;
    constexpr Point2D(double x_, double y_) noexcept : x(x_), y(y_) {}

    constexpr Point2D operator+(const Point2D& o) const noexcept { return {x + o.x, y + o.y}; }
    constexpr Point2D operator-(const Point2D& o) const noexcept { return {x - o.x, y - o.y}; }
    constexpr Point2D operator*(double s) const noexcept { return {x * s, y * s}; }

    Point2D& operator+=(const Point2D& o) noexcept {
        x += o.x;
        y += o.y;
        return *this;
    }

    double norm() const noexcept { return std::sqrt(x * x + y * y); }
    constexpr double squared_norm() const noexcept { return x * x + y * y; }

    constexpr bool in_unit_square() const noexcept {
        return x >= 0.0 && x <= 1.0 && y >= 0.0 && y <= 1.0;
    }
};

constexpr bool operator==(const Point2D& lhs, const Point2D& rhs) noexcept {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

constexpr bool operator!=(const Point2D& lhs, const Point2D& rhs) noexcept {
    return !(lhs == rhs);
}

// Lexicographic order, used to count distinct coordinates
constexpr bool operator<(const Point2D& lhs, const Point2D& rhs) noexcept {
    if (lhs.x != rhs.x) return lhs.x < rhs.x;
    return lhs.y < rhs.y;
}

inline double distance(const Point2D& a, const Point2D& b) noexcept {
    return (a - b).norm();
}

constexpr double squared_distance(const Point2D& a, const Point2D& b) noexcept {
    return (a - b).squared_norm();
}

inline Point2D clamp_unit(const Point2D& p) noexcept {
    return {std::fmin(1.0, std::fmax(0.0, p.x)), std::fmin(1.0, std::fmax(0.0, p.y))};
}

// Ordered point sequence; the position is the stable identity of a point
using PointSet = std::vector<Point2D>;

namespace constants {
    constexpr int DEFAULT_GRID_SIZE = 50;        // density statistics grid (50 x 50)
    constexpr double TOP_FRACTION = 0.10;        // "densest decile" of cells
    constexpr size_t UNASSIGNED = static_cast<size_t>(-1);
}

} // namespace knowmap
