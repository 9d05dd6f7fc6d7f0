#pragma once

#include <memory>
#include <smoothie/filter.hpp>
#include <smoothie/filter_config.hpp>
#include <smoothie/smoother.hpp>
#include <span>

namespace smoothie
{

// ─── Smoother builder ───────────────────────────────────────────────────────
// Fluent construction of a smoother:
//
//   auto gaze = SmootherBuilder2D()
//                   .attach(FilterConfig{FilterType::MedianAverage, {.window_size = 5}})
//                   .attach(std::make_unique<FixationSmoothFilter2D>(12.0))
//                   .build();
//
// build() moves the filters out; the builder is empty afterwards.

template <typename FilterT>
class BasicSmootherBuilder
{
   public:
    using smoother_type = BasicSmoother<FilterT>;

    BasicSmootherBuilder& attach(std::unique_ptr<FilterT> filter)
    {
        smoother_.attach(std::move(filter));
        return *this;
    }

    BasicSmootherBuilder& attach(const FilterConfig& config);

    std::size_t filter_count() const { return smoother_.filter_count(); }

    // Throws ConfigurationError when no filter was attached.
    [[nodiscard]] smoother_type build();

   private:
    smoother_type smoother_;
};

extern template class BasicSmootherBuilder<Filter1D>;
extern template class BasicSmootherBuilder<Filter2D>;

// Builds a smoother from an ordered list of filter configurations.
[[nodiscard]] Smoother1D make_smoother_1d(std::span<const FilterConfig> configs);
[[nodiscard]] Smoother2D make_smoother_2d(std::span<const FilterConfig> configs);

}   // namespace smoothie
