#include <algorithm>
#include <array>
#include <cctype>
#include <smoothie/error.hpp>
#include <smoothie/filter_config.hpp>
#include <smoothie/filters2d.hpp>
#include <smoothie/logger.hpp>
#include <sstream>

namespace smoothie
{

namespace
{

enum class Axis
{
    X,
    Y,
};

template <typename T>
T pick(Axis axis, const T& x_value, const std::optional<T>& y_value)
{
    return (axis == Axis::Y && y_value) ? *y_value : x_value;
}

std::optional<double> pick_std_dev(Axis axis, const FilterParams& p)
{
    if (axis == Axis::Y && p.std_dev_y)
        return p.std_dev_y;
    return p.std_dev;
}

std::unique_ptr<Filter1D> make_axis_filter(const FilterConfig& config, Axis axis)
{
    const FilterParams& p      = config.params;
    const std::size_t   window = pick(axis, p.window_size, p.window_size_y);

    switch (config.type)
    {
        case FilterType::Offset:
            return std::make_unique<OffsetFilter1D>(pick(axis, p.offset, p.offset_y));
        case FilterType::SimpleMovingAverage:
            return std::make_unique<SimpleMovingAverageFilter1D>(window);
        case FilterType::WeightedMovingAverage:
            return std::make_unique<WeightedMovingAverageFilter1D>(window);
        case FilterType::GaussianAverage:
            return std::make_unique<GaussianAverageFilter1D>(window, pick_std_dev(axis, p));
        case FilterType::MedianAverage:
            return std::make_unique<MedianAverageFilter1D>(window);
        case FilterType::ExponentialMovingAverage:
            return std::make_unique<ExponentialMovingAverageFilter1D>(pick(axis, p.alpha, p.alpha_y));
        case FilterType::CumulativeMovingAverage:
            return std::make_unique<CumulativeMovingAverageFilter1D>();
        case FilterType::FixationSmooth:
            return std::make_unique<FixationSmoothFilter1D>(p.threshold);
        case FilterType::MultiPassMovingAverage:
            return std::make_unique<MultiPassMovingAverageFilter1D>(
                window,
                pick(axis, p.num_passes, p.num_passes_y),
                pick(axis, p.pass_type, p.pass_type_y));
    }
    detail::throw_configuration_error("FilterConfig", "unknown filter type");
}

constexpr std::array<FilterType, 9> kAllTypes = {
    FilterType::Offset,
    FilterType::SimpleMovingAverage,
    FilterType::WeightedMovingAverage,
    FilterType::GaussianAverage,
    FilterType::MedianAverage,
    FilterType::ExponentialMovingAverage,
    FilterType::CumulativeMovingAverage,
    FilterType::FixationSmooth,
    FilterType::MultiPassMovingAverage,
};

std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}   // namespace

// ─── Factory ────────────────────────────────────────────────────────────────

std::unique_ptr<Filter1D> make_filter_1d(const FilterConfig& config)
{
    return make_axis_filter(config, Axis::X);
}

std::unique_ptr<Filter2D> make_filter_2d(const FilterConfig& config)
{
    if (config.type == FilterType::FixationSmooth)
        return std::make_unique<FixationSmoothFilter2D>(config.params.threshold);

    return std::make_unique<AxisPairFilter2D>(make_axis_filter(config, Axis::X),
                                              make_axis_filter(config, Axis::Y));
}

std::unique_ptr<FilterBase> make_filter(const FilterConfig& config, Dimension dim)
{
    switch (dim)
    {
        case Dimension::One:
            return make_filter_1d(config);
        case Dimension::Two:
            return make_filter_2d(config);
    }
    detail::throw_configuration_error(
        "FilterConfig",
        Logger::format_message("unsupported dimension {}", static_cast<int>(dim)));
}

// ─── Names ──────────────────────────────────────────────────────────────────

const char* filter_type_name(FilterType type)
{
    switch (type)
    {
        case FilterType::Offset:
            return "Offset";
        case FilterType::SimpleMovingAverage:
            return "SimpleMovingAverage";
        case FilterType::WeightedMovingAverage:
            return "WeightedMovingAverage";
        case FilterType::GaussianAverage:
            return "GaussianAverage";
        case FilterType::MedianAverage:
            return "MedianAverage";
        case FilterType::ExponentialMovingAverage:
            return "ExponentialMovingAverage";
        case FilterType::CumulativeMovingAverage:
            return "CumulativeMovingAverage";
        case FilterType::FixationSmooth:
            return "FixationSmooth";
        case FilterType::MultiPassMovingAverage:
            return "MultiPassMovingAverage";
    }
    return "Unknown";
}

std::optional<FilterType> parse_filter_type(std::string_view text)
{
    const std::string wanted = to_lower(text);
    for (FilterType type : kAllTypes)
    {
        if (to_lower(filter_type_name(type)) == wanted)
            return type;
    }
    return std::nullopt;
}

std::string describe(const FilterConfig& config)
{
    const FilterParams& p = config.params;

    std::ostringstream ss;
    ss << filter_type_name(config.type) << "{";
    switch (config.type)
    {
        case FilterType::Offset:
            ss << "offset=" << p.offset;
            if (p.offset_y)
                ss << ", offset_y=" << *p.offset_y;
            break;
        case FilterType::SimpleMovingAverage:
        case FilterType::WeightedMovingAverage:
        case FilterType::MedianAverage:
            ss << "window_size=" << p.window_size;
            if (p.window_size_y)
                ss << ", window_size_y=" << *p.window_size_y;
            break;
        case FilterType::GaussianAverage:
            ss << "window_size=" << p.window_size;
            if (p.std_dev)
                ss << ", std_dev=" << *p.std_dev;
            if (p.window_size_y)
                ss << ", window_size_y=" << *p.window_size_y;
            if (p.std_dev_y)
                ss << ", std_dev_y=" << *p.std_dev_y;
            break;
        case FilterType::ExponentialMovingAverage:
            ss << "alpha=" << p.alpha;
            if (p.alpha_y)
                ss << ", alpha_y=" << *p.alpha_y;
            break;
        case FilterType::CumulativeMovingAverage:
            break;
        case FilterType::FixationSmooth:
            ss << "threshold=" << p.threshold;
            break;
        case FilterType::MultiPassMovingAverage:
            ss << "window_size=" << p.window_size << ", num_passes=" << p.num_passes
               << ", pass_type=" << moving_average_type_name(p.pass_type);
            break;
    }
    ss << "}";
    return ss.str();
}

}   // namespace smoothie
