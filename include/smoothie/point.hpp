#pragma once

#include <cmath>

namespace smoothie
{

// A 2D sample, e.g. a gaze coordinate in screen pixels.
struct Point2
{
    double x = 0.0;
    double y = 0.0;

    constexpr Point2() = default;
    constexpr Point2(double x_, double y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Point2&) const = default;
};

// Euclidean distance between two samples.
inline double distance(const Point2& a, const Point2& b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

inline bool is_finite(const Point2& p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

}   // namespace smoothie
