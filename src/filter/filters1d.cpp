#include <cmath>
#include <smoothie/filters1d.hpp>
#include <smoothie/logger.hpp>
#include <sstream>

#include "filter/window_stats.hpp"

namespace smoothie
{

const char* moving_average_type_name(MovingAverageType type)
{
    switch (type)
    {
        case MovingAverageType::Simple:
            return "Simple";
        case MovingAverageType::Weighted:
            return "Weighted";
        case MovingAverageType::Gaussian:
            return "Gaussian";
        case MovingAverageType::Median:
            return "Median";
        case MovingAverageType::Exponential:
            return "Exponential";
    }
    return "Unknown";
}

// ─── Offset ─────────────────────────────────────────────────────────────────

OffsetFilter1D::OffsetFilter1D(double offset) : offset_(checks::finite("Offset", "offset", offset))
{
}

std::string OffsetFilter1D::description() const
{
    std::ostringstream ss;
    ss << "Offset(offset=" << offset_ << ")";
    return ss.str();
}

// ─── Simple moving average ──────────────────────────────────────────────────

SimpleMovingAverageFilter1D::SimpleMovingAverageFilter1D(std::size_t window_size)
    : window_(checks::window_size("SimpleMovingAverage", window_size))
{
    SMOOTHIE_LOG_DEBUG("filter", "SimpleMovingAverage created, window={}", window_size);
}

double SimpleMovingAverageFilter1D::update(double sample)
{
    window_.push(sample);
    return stats::mean(window_.contents());
}

std::string SimpleMovingAverageFilter1D::description() const
{
    return "SimpleMovingAverage(window=" + std::to_string(window_.capacity()) + ")";
}

// ─── Weighted moving average ────────────────────────────────────────────────

WeightedMovingAverageFilter1D::WeightedMovingAverageFilter1D(std::size_t window_size)
    : window_(checks::window_size("WeightedMovingAverage", window_size))
{
    SMOOTHIE_LOG_DEBUG("filter", "WeightedMovingAverage created, window={}", window_size);
}

double WeightedMovingAverageFilter1D::update(double sample)
{
    window_.push(sample);
    return stats::linear_weighted_mean(window_.contents());
}

std::string WeightedMovingAverageFilter1D::description() const
{
    return "WeightedMovingAverage(window=" + std::to_string(window_.capacity()) + ")";
}

// ─── Gaussian average ───────────────────────────────────────────────────────

GaussianAverageFilter1D::GaussianAverageFilter1D(std::size_t           window_size,
                                                 std::optional<double> std_dev)
    : window_(checks::window_size("GaussianAverage", window_size)),
      std_dev_(checks::std_dev("GaussianAverage",
                               std_dev.value_or(static_cast<double>(window_size) / 3.0)))
{
    const std::size_t w = window_size;
    const double step = (w > 1) ? static_cast<double>(w) / static_cast<double>(w - 1) : 0.0;

    weights_.resize(w);
    for (std::size_t i = 0; i < w; ++i)
    {
        // i = 0 is the oldest slot, i = w - 1 the newest (distance 0).
        // Scale before squaring: sigma^2 underflows for tiny sigma.
        const double z = static_cast<double>(w - 1 - i) * step / std_dev_;
        weights_[i]    = std::exp(-0.5 * z * z);
    }

    SMOOTHIE_LOG_DEBUG(
        "filter", "GaussianAverage created, window={} std_dev={}", window_size, std_dev_);
}

double GaussianAverageFilter1D::update(double sample)
{
    window_.push(sample);

    // Align the kernel's newest end with the newest sample. The newest
    // weight is exp(0) = 1, so the weight sum is never zero.
    const auto        values = window_.contents();
    const std::size_t skip   = weights_.size() - values.size();
    return stats::weighted_mean(values, std::span<const double>(weights_).subspan(skip));
}

std::string GaussianAverageFilter1D::description() const
{
    std::ostringstream ss;
    ss << "GaussianAverage(window=" << window_.capacity() << ", std_dev=" << std_dev_ << ")";
    return ss.str();
}

// ─── Median ─────────────────────────────────────────────────────────────────

MedianAverageFilter1D::MedianAverageFilter1D(std::size_t window_size)
    : window_(checks::window_size("MedianAverage", window_size))
{
    scratch_.reserve(window_size);
    SMOOTHIE_LOG_DEBUG("filter", "MedianAverage created, window={}", window_size);
}

double MedianAverageFilter1D::update(double sample)
{
    window_.push(sample);
    return stats::median(window_.contents(), scratch_);
}

std::string MedianAverageFilter1D::description() const
{
    return "MedianAverage(window=" + std::to_string(window_.capacity()) + ")";
}

// ─── Exponential moving average ─────────────────────────────────────────────

ExponentialMovingAverageFilter1D::ExponentialMovingAverageFilter1D(double alpha)
    : alpha_(checks::alpha("ExponentialMovingAverage", alpha))
{
    SMOOTHIE_LOG_DEBUG("filter", "ExponentialMovingAverage created, alpha={}", alpha_);
}

double ExponentialMovingAverageFilter1D::update(double sample)
{
    if (!state_)
    {
        state_ = sample;
        return sample;
    }

    state_ = alpha_ * sample + (1.0 - alpha_) * *state_;
    return *state_;
}

std::string ExponentialMovingAverageFilter1D::description() const
{
    std::ostringstream ss;
    ss << "ExponentialMovingAverage(alpha=" << alpha_ << ")";
    return ss.str();
}

// ─── Cumulative moving average ──────────────────────────────────────────────

double CumulativeMovingAverageFilter1D::update(double sample)
{
    ++count_;
    mean_ += (sample - mean_) / static_cast<double>(count_);
    return mean_;
}

// ─── Fixation smooth ────────────────────────────────────────────────────────

FixationSmoothFilter1D::FixationSmoothFilter1D(double threshold)
    : threshold_(checks::threshold("FixationSmooth", threshold))
{
    SMOOTHIE_LOG_DEBUG("filter", "FixationSmooth created, threshold={}", threshold_);
}

double FixationSmoothFilter1D::update(double sample)
{
    if (reference_ && std::abs(sample - *reference_) < threshold_)
        return *reference_;

    reference_ = sample;
    return sample;
}

std::string FixationSmoothFilter1D::description() const
{
    std::ostringstream ss;
    ss << "FixationSmooth(threshold=" << threshold_ << ")";
    return ss.str();
}

// ─── Multi-pass moving average ──────────────────────────────────────────────

MultiPassMovingAverageFilter1D::MultiPassMovingAverageFilter1D(std::size_t       window_size,
                                                               std::size_t       num_passes,
                                                               MovingAverageType type)
    : window_size_(checks::window_size("MultiPassMovingAverage", window_size)), type_(type)
{
    checks::num_passes("MultiPassMovingAverage", num_passes);

    for (std::size_t i = 0; i < num_passes; ++i)
        passes_.attach(make_windowed_average(type, window_size));

    SMOOTHIE_LOG_DEBUG("filter",
                       "MultiPassMovingAverage created, {} x {} window={}",
                       num_passes,
                       moving_average_type_name(type),
                       window_size);
}

std::string MultiPassMovingAverageFilter1D::description() const
{
    return "MultiPassMovingAverage(type=" + std::string(moving_average_type_name(type_))
           + ", window=" + std::to_string(window_size_)
           + ", passes=" + std::to_string(passes_.filter_count()) + ")";
}

// ─── Factory ────────────────────────────────────────────────────────────────

std::unique_ptr<Filter1D> make_windowed_average(MovingAverageType type, std::size_t window_size)
{
    switch (type)
    {
        case MovingAverageType::Simple:
            return std::make_unique<SimpleMovingAverageFilter1D>(window_size);
        case MovingAverageType::Weighted:
            return std::make_unique<WeightedMovingAverageFilter1D>(window_size);
        case MovingAverageType::Gaussian:
            return std::make_unique<GaussianAverageFilter1D>(window_size);
        case MovingAverageType::Median:
            return std::make_unique<MedianAverageFilter1D>(window_size);
        case MovingAverageType::Exponential:
            break;
    }
    detail::throw_configuration_error(
        "MultiPassMovingAverage",
        Logger::format_message("{} is not a windowed average", moving_average_type_name(type)));
}

}   // namespace smoothie
