#pragma once

#include <cstddef>
#include <smoothie/fwd.hpp>
#include <smoothie/point.hpp>
#include <string>
#include <string_view>

namespace smoothie
{

// ─── Filter interfaces ──────────────────────────────────────────────────────
// A filter consumes one sample per update() and returns one smoothed sample.
// Each instance owns its state exclusively; update() reads and writes only
// that state. The interfaces carry no data of their own.

class FilterBase
{
   public:
    virtual ~FilterBase() = default;

    FilterBase()                             = default;
    FilterBase(const FilterBase&)            = delete;
    FilterBase& operator=(const FilterBase&) = delete;

    virtual Dimension dimension() const = 0;

    // Clears all internal state, as if newly constructed.
    virtual void reset() = 0;

    // Short type name, e.g. "SimpleMovingAverage".
    virtual std::string_view name() const = 0;

    // Number of samples the filter looks back over (1 for unwindowed filters).
    virtual std::size_t window_size() const { return 1; }

    // Human-readable description including parameters.
    virtual std::string description() const { return std::string(name()); }
};

class Filter1D : public FilterBase
{
   public:
    using sample_type = double;

    static constexpr Dimension kDimension = Dimension::One;

    Dimension dimension() const final { return kDimension; }

    virtual double update(double sample) = 0;
};

class Filter2D : public FilterBase
{
   public:
    using sample_type = Point2;

    static constexpr Dimension kDimension = Dimension::Two;

    Dimension dimension() const final { return kDimension; }

    virtual Point2 update(Point2 sample) = 0;
};

const char* dimension_name(Dimension dim);

}   // namespace smoothie
