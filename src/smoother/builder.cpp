#include <smoothie/builder.hpp>
#include <smoothie/error.hpp>
#include <smoothie/logger.hpp>
#include <type_traits>

namespace smoothie
{

template <typename FilterT>
BasicSmootherBuilder<FilterT>& BasicSmootherBuilder<FilterT>::attach(const FilterConfig& config)
{
    if constexpr (std::is_same_v<FilterT, Filter1D>)
        smoother_.attach(make_filter_1d(config));
    else
        smoother_.attach(make_filter_2d(config));
    return *this;
}

template <typename FilterT>
typename BasicSmootherBuilder<FilterT>::smoother_type BasicSmootherBuilder<FilterT>::build()
{
    if (smoother_.empty())
        detail::throw_configuration_error("SmootherBuilder", "a smoother needs at least one filter");

    SMOOTHIE_LOG_DEBUG("smoother",
                       "built {} smoother: {}",
                       dimension_name(FilterT::kDimension),
                       smoother_.description());
    return std::move(smoother_);
}

template class BasicSmootherBuilder<Filter1D>;
template class BasicSmootherBuilder<Filter2D>;

namespace
{

template <typename FilterT>
BasicSmoother<FilterT> build_from_configs(std::span<const FilterConfig> configs)
{
    BasicSmootherBuilder<FilterT> builder;
    for (const auto& config : configs)
        builder.attach(config);
    return builder.build();
}

}   // namespace

Smoother1D make_smoother_1d(std::span<const FilterConfig> configs)
{
    return build_from_configs<Filter1D>(configs);
}

Smoother2D make_smoother_2d(std::span<const FilterConfig> configs)
{
    return build_from_configs<Filter2D>(configs);
}

}   // namespace smoothie
