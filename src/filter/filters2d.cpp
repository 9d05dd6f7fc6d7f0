#include <algorithm>
#include <smoothie/error.hpp>
#include <smoothie/filters2d.hpp>
#include <smoothie/logger.hpp>
#include <sstream>

#include "filter/window_stats.hpp"

namespace smoothie
{

// ─── Axis pair ──────────────────────────────────────────────────────────────

AxisPairFilter2D::AxisPairFilter2D(std::unique_ptr<Filter1D> x, std::unique_ptr<Filter1D> y)
    : x_(std::move(x)), y_(std::move(y))
{
    if (!x_ || !y_)
        detail::throw_configuration_error("AxisPair", "both axis filters are required");

    SMOOTHIE_LOG_DEBUG("filter", "AxisPair created, x={} y={}", x_->description(), y_->description());
}

std::size_t AxisPairFilter2D::window_size() const
{
    return std::max(x_->window_size(), y_->window_size());
}

std::string AxisPairFilter2D::description() const
{
    return "AxisPair(x=" + x_->description() + ", y=" + y_->description() + ")";
}

// ─── Fixation smooth ────────────────────────────────────────────────────────

FixationSmoothFilter2D::FixationSmoothFilter2D(double threshold)
    : threshold_(checks::threshold("FixationSmooth2D", threshold))
{
    SMOOTHIE_LOG_DEBUG("filter", "FixationSmooth2D created, threshold={}", threshold_);
}

Point2 FixationSmoothFilter2D::update(Point2 sample)
{
    if (reference_ && distance(sample, *reference_) < threshold_)
        return *reference_;

    reference_ = sample;
    return sample;
}

std::string FixationSmoothFilter2D::description() const
{
    std::ostringstream ss;
    ss << "FixationSmooth2D(threshold=" << threshold_ << ")";
    return ss.str();
}

}   // namespace smoothie
