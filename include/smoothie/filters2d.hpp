#pragma once

#include <memory>
#include <optional>
#include <smoothie/filter.hpp>
#include <smoothie/point.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace smoothie
{

// ─── Axis pair ──────────────────────────────────────────────────────────────
// 2D filter built from two independent 1D filters, one per axis. Use it for
// every filter whose 2D behaviour is the per-axis behaviour (offset, moving
// averages, Gaussian, median, exponential, cumulative, multi-pass).

class AxisPairFilter2D final : public Filter2D
{
   public:
    AxisPairFilter2D(std::unique_ptr<Filter1D> x, std::unique_ptr<Filter1D> y);

    Point2 update(Point2 sample) override
    {
        return {x_->update(sample.x), y_->update(sample.y)};
    }

    void reset() override
    {
        x_->reset();
        y_->reset();
    }

    // Name of the x-axis filter; both axes normally share a type.
    std::string_view name() const override { return x_->name(); }
    std::size_t      window_size() const override;
    std::string      description() const override;

    const Filter1D& x_filter() const { return *x_; }
    const Filter1D& y_filter() const { return *y_; }

   private:
    std::unique_ptr<Filter1D> x_;
    std::unique_ptr<Filter1D> y_;
};

// Builds an AxisPairFilter2D holding two F instances constructed from the
// same arguments.
template <typename F, typename... Args>
[[nodiscard]] std::unique_ptr<AxisPairFilter2D> make_axis_pair(const Args&... args)
{
    static_assert(std::is_base_of_v<Filter1D, F>, "F must be a 1D filter");
    return std::make_unique<AxisPairFilter2D>(std::make_unique<F>(args...),
                                              std::make_unique<F>(args...));
}

// ─── Fixation smooth (native 2D) ────────────────────────────────────────────

/// Deadband on the Euclidean distance between the sample and the held
/// reference point. Within `threshold` the reference is returned unchanged;
/// at distance >= threshold the sample becomes the new reference. The axes
/// are never thresholded independently.
class FixationSmoothFilter2D final : public Filter2D
{
   public:
    explicit FixationSmoothFilter2D(double threshold);

    Point2           update(Point2 sample) override;
    void             reset() override { reference_.reset(); }
    std::string_view name() const override { return "FixationSmooth"; }
    std::string      description() const override;

    double                threshold() const { return threshold_; }
    std::optional<Point2> reference() const { return reference_; }

   private:
    double                threshold_;
    std::optional<Point2> reference_;
};

}   // namespace smoothie
