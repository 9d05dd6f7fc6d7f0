#include "filter/window_stats.hpp"

#include <algorithm>
#include <cmath>
#include <smoothie/error.hpp>
#include <smoothie/logger.hpp>

namespace smoothie::stats
{

void CompensatedSum::add(double v)
{
    const double t = sum_ + v;
    if (std::abs(sum_) >= std::abs(v))
        compensation_ += (sum_ - t) + v;
    else
        compensation_ += (v - t) + sum_;
    sum_ = t;
}

double mean(std::span<const double> values)
{
    CompensatedSum sum;
    for (double v : values)
        sum.add(v);
    return sum.value() / static_cast<double>(values.size());
}

double weighted_mean(std::span<const double> values, std::span<const double> weights)
{
    CompensatedSum acc;
    CompensatedSum w_sum;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        acc.add(values[i] * weights[i]);
        w_sum.add(weights[i]);
    }
    return acc.value() / w_sum.value();
}

double linear_weighted_mean(std::span<const double> values)
{
    const std::size_t n = values.size();

    CompensatedSum acc;
    for (std::size_t i = 0; i < n; ++i)
        acc.add(values[i] * static_cast<double>(i + 1));

    // 1 + 2 + ... + n
    const double w_sum = static_cast<double>(n) * static_cast<double>(n + 1) / 2.0;
    return acc.value() / w_sum;
}

double median(std::span<const double> values, std::vector<double>& scratch)
{
    scratch.assign(values.begin(), values.end());

    const std::size_t n   = scratch.size();
    const std::size_t mid = n / 2;
    const auto        mid_it = scratch.begin() + static_cast<std::ptrdiff_t>(mid);

    std::nth_element(scratch.begin(), mid_it, scratch.end());
    const double upper = *mid_it;
    if (n % 2 == 1)
        return upper;

    // nth_element leaves everything below mid <= upper; the lower middle
    // value is the largest of that half.
    const double lower = *std::max_element(scratch.begin(), mid_it);
    return lower + (upper - lower) / 2.0;
}

}   // namespace smoothie::stats

namespace smoothie::checks
{

std::size_t window_size(std::string_view component, std::size_t window)
{
    if (window < 1)
        detail::throw_configuration_error(component, "window_size must be at least 1");
    return window;
}

double alpha(std::string_view component, double alpha)
{
    if (!(alpha > 0.0 && alpha <= 1.0))
    {
        detail::throw_configuration_error(
            component, Logger::format_message("alpha must lie in (0, 1], got {}", alpha));
    }
    return alpha;
}

double std_dev(std::string_view component, double std_dev)
{
    if (!(std_dev > 0.0) || !std::isfinite(std_dev))
    {
        detail::throw_configuration_error(
            component, Logger::format_message("std_dev must be positive, got {}", std_dev));
    }
    return std_dev;
}

double threshold(std::string_view component, double threshold)
{
    if (!(threshold >= 0.0) || !std::isfinite(threshold))
    {
        detail::throw_configuration_error(
            component, Logger::format_message("threshold must be non-negative, got {}", threshold));
    }
    return threshold;
}

double finite(std::string_view component, std::string_view what, double value)
{
    if (!std::isfinite(value))
    {
        detail::throw_configuration_error(
            component, Logger::format_message("{} must be finite, got {}", what, value));
    }
    return value;
}

std::size_t num_passes(std::string_view component, std::size_t passes)
{
    if (passes < 1)
        detail::throw_configuration_error(component, "num_passes must be at least 1");
    return passes;
}

}   // namespace smoothie::checks
