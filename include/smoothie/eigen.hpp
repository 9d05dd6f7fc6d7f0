#pragma once

// ─── smoothie ↔ Eigen ───────────────────────────────────────────────────────
//
// Feed Eigen vectors straight into a smoother.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DSMOOTHIE_USE_EIGEN=ON
//
// Usage:
//
//   #include <smoothie/eigen.hpp>
//
//   smoothie::Smoother2D gaze = ...;
//   Eigen::Vector2d p = tracker.sample();
//   Eigen::Vector2d smoothed = smoothie::add_and_get(gaze, p);
//
//   Eigen::VectorXd trace = recording.col(0);
//   Eigen::VectorXd filtered = smoothie::smooth(pressure_smoother, trace);
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <smoothie/point.hpp>
#include <smoothie/smoother.hpp>

namespace smoothie
{

inline Point2 to_point(const Eigen::Vector2d& v)
{
    return {v.x(), v.y()};
}

inline Eigen::Vector2d to_eigen(const Point2& p)
{
    return {p.x, p.y};
}

inline Eigen::Vector2d add_and_get(Smoother2D& smoother, const Eigen::Vector2d& sample)
{
    return to_eigen(smoother.add_and_get(to_point(sample)));
}

// Runs every coefficient of `samples` through the smoother, in order.
template <typename Derived>
Eigen::VectorXd smooth(Smoother1D& smoother, const Eigen::MatrixBase<Derived>& samples)
{
    static_assert(Derived::ColsAtCompileTime == 1 || Derived::ColsAtCompileTime == Eigen::Dynamic,
                  "smoothie::smooth expects a column vector expression");

    Eigen::VectorXd out(samples.size());
    for (Eigen::Index i = 0; i < samples.size(); ++i)
        out[i] = smoother.add_and_get(static_cast<double>(samples(i)));
    return out;
}

}   // namespace smoothie
