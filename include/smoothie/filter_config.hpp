#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <smoothie/filter.hpp>
#include <smoothie/filters1d.hpp>
#include <string>
#include <string_view>

namespace smoothie
{

// ─── Filter types ───────────────────────────────────────────────────────────

enum class FilterType
{
    Offset,                     // input + offset
    SimpleMovingAverage,        // mean of the window
    WeightedMovingAverage,      // linear weights, newest heaviest
    GaussianAverage,            // causal Gaussian kernel
    MedianAverage,              // median of the window
    ExponentialMovingAverage,   // recursive, alpha in (0, 1]
    CumulativeMovingAverage,    // running mean, unbounded
    FixationSmooth,             // deadband around a held reference
    MultiPassMovingAverage,     // N chained windowed averages
};

// ─── Filter parameters ──────────────────────────────────────────────────────
// Each filter type reads only the fields it needs. The *_y fields apply to
// the y axis of a 2D axis pair and default to the x value when unset.
// FixationSmooth in 2D uses `threshold` as a Euclidean radius and ignores
// the per-axis fields.

struct FilterParams
{
    std::size_t window_size = 1;
    double      offset      = 0.0;
    double      alpha       = 0.5;
    double      threshold   = 0.0;

    std::optional<double> std_dev;   // GaussianAverage; default window_size / 3

    std::size_t       num_passes = 1;
    MovingAverageType pass_type  = MovingAverageType::Simple;

    std::optional<std::size_t>       window_size_y;
    std::optional<double>            offset_y;
    std::optional<double>            alpha_y;
    std::optional<double>            std_dev_y;
    std::optional<std::size_t>       num_passes_y;
    std::optional<MovingAverageType> pass_type_y;
};

struct FilterConfig
{
    FilterType   type = FilterType::SimpleMovingAverage;
    FilterParams params;
};

// ─── Factory ────────────────────────────────────────────────────────────────
// All factories validate eagerly and throw ConfigurationError on bad
// parameters; no value is clamped.

[[nodiscard]] std::unique_ptr<Filter1D>   make_filter_1d(const FilterConfig& config);
[[nodiscard]] std::unique_ptr<Filter2D>   make_filter_2d(const FilterConfig& config);
[[nodiscard]] std::unique_ptr<FilterBase> make_filter(const FilterConfig& config, Dimension dim);

// Canonical name, e.g. "GaussianAverage".
const char* filter_type_name(FilterType type);

// Accepts the canonical names (case-insensitive).
std::optional<FilterType> parse_filter_type(std::string_view text);

// e.g. "GaussianAverage{window_size=5, std_dev=1.5}"
std::string describe(const FilterConfig& config);

}   // namespace smoothie
