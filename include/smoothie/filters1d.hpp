#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <smoothie/filter.hpp>
#include <smoothie/smoother.hpp>
#include <smoothie/window_buffer.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace smoothie
{

// Moving average kinds, named as in FilterType. Exponential has no window:
// make_windowed_average(), MultiPassMovingAverageFilter1D and a
// MultiPassMovingAverage FilterConfig with pass_type = Exponential all
// raise ConfigurationError. It exists so configs can name every average.
enum class MovingAverageType
{
    Simple,
    Weighted,
    Gaussian,
    Median,
    Exponential,
};

const char* moving_average_type_name(MovingAverageType type);

// ─── Offset ─────────────────────────────────────────────────────────────────

/// Adds a constant to every sample. Stateless.
class OffsetFilter1D final : public Filter1D
{
   public:
    explicit OffsetFilter1D(double offset);

    double           update(double sample) override { return sample + offset_; }
    void             reset() override {}
    std::string_view name() const override { return "Offset"; }
    std::string      description() const override;

    double offset() const { return offset_; }

   private:
    double offset_;
};

// ─── Windowed averages ──────────────────────────────────────────────────────
// All windowed filters compute their statistic over the samples currently
// buffered. Before the window fills they use the partial window as-is:
// no zero padding and no waiting.

/// Arithmetic mean of the last `window_size` samples.
class SimpleMovingAverageFilter1D final : public Filter1D
{
   public:
    explicit SimpleMovingAverageFilter1D(std::size_t window_size);

    double           update(double sample) override;
    void             reset() override { window_.clear(); }
    std::string_view name() const override { return "SimpleMovingAverage"; }
    std::size_t      window_size() const override { return window_.capacity(); }
    std::string      description() const override;

   private:
    WindowBuffer<double> window_;
};

/// Linearly weighted mean: with n samples buffered the newest weighs n and
/// the oldest weighs 1, normalised over the n present samples.
class WeightedMovingAverageFilter1D final : public Filter1D
{
   public:
    explicit WeightedMovingAverageFilter1D(std::size_t window_size);

    double           update(double sample) override;
    void             reset() override { window_.clear(); }
    std::string_view name() const override { return "WeightedMovingAverage"; }
    std::size_t      window_size() const override { return window_.capacity(); }
    std::string      description() const override;

   private:
    WindowBuffer<double> window_;
};

/// Causal Gaussian-weighted mean. The kernel is centred on the newest sample;
/// older samples sit at distances 0, s, 2s, ... with s = W / (W - 1), so the
/// oldest full-window sample is W away. Weight = exp(-d^2 / (2 sigma^2)).
/// A partial window uses the newest-aligned tail of the kernel, renormalised.
class GaussianAverageFilter1D final : public Filter1D
{
   public:
    // std_dev defaults to window_size / 3.
    explicit GaussianAverageFilter1D(std::size_t           window_size,
                                     std::optional<double> std_dev = std::nullopt);

    double           update(double sample) override;
    void             reset() override { window_.clear(); }
    std::string_view name() const override { return "GaussianAverage"; }
    std::size_t      window_size() const override { return window_.capacity(); }
    std::string      description() const override;

    double std_dev() const { return std_dev_; }

    // Full-window kernel, oldest first (unnormalised, newest weight is 1).
    std::span<const double> weights() const { return weights_; }

   private:
    WindowBuffer<double> window_;
    double               std_dev_;
    std::vector<double>  weights_;
};

/// Median of the buffered samples; an even count averages the two middle
/// values.
class MedianAverageFilter1D final : public Filter1D
{
   public:
    explicit MedianAverageFilter1D(std::size_t window_size);

    double           update(double sample) override;
    void             reset() override { window_.clear(); }
    std::string_view name() const override { return "MedianAverage"; }
    std::size_t      window_size() const override { return window_.capacity(); }
    std::string      description() const override;

   private:
    WindowBuffer<double> window_;
    std::vector<double>  scratch_;   // reserved to window size, reused every update
};

// ─── Recursive estimators ───────────────────────────────────────────────────

/// state = alpha * sample + (1 - alpha) * state. The first sample seeds the
/// state and is returned unchanged. alpha must lie in (0, 1].
class ExponentialMovingAverageFilter1D final : public Filter1D
{
   public:
    explicit ExponentialMovingAverageFilter1D(double alpha);

    double           update(double sample) override;
    void             reset() override { state_.reset(); }
    std::string_view name() const override { return "ExponentialMovingAverage"; }
    std::string      description() const override;

    double alpha() const { return alpha_; }

   private:
    double                alpha_;
    std::optional<double> state_;
};

/// Running mean of every sample seen since construction or reset().
class CumulativeMovingAverageFilter1D final : public Filter1D
{
   public:
    CumulativeMovingAverageFilter1D() = default;

    double update(double sample) override;
    void   reset() override
    {
        mean_  = 0.0;
        count_ = 0;
    }
    std::string_view name() const override { return "CumulativeMovingAverage"; }

    std::size_t count() const { return count_; }

   private:
    double      mean_  = 0.0;
    std::size_t count_ = 0;
};

// ─── Deadband ───────────────────────────────────────────────────────────────

/// Holds a reference value and outputs it while samples stay closer than
/// `threshold`. A sample at distance >= threshold becomes the new reference
/// and is output as-is. The first sample seeds the reference.
class FixationSmoothFilter1D final : public Filter1D
{
   public:
    explicit FixationSmoothFilter1D(double threshold);

    double           update(double sample) override;
    void             reset() override { reference_.reset(); }
    std::string_view name() const override { return "FixationSmooth"; }
    std::string      description() const override;

    double                threshold() const { return threshold_; }
    std::optional<double> reference() const { return reference_; }

   private:
    double                threshold_;
    std::optional<double> reference_;
};

// ─── Composite ──────────────────────────────────────────────────────────────

/// Chains `num_passes` independent moving averages of one type; pass k+1
/// consumes the output of pass k.
class MultiPassMovingAverageFilter1D final : public Filter1D
{
   public:
    MultiPassMovingAverageFilter1D(std::size_t       window_size,
                                   std::size_t       num_passes,
                                   MovingAverageType type = MovingAverageType::Simple);

    double           update(double sample) override { return passes_.add_and_get(sample); }
    void             reset() override { passes_.reset(); }
    std::string_view name() const override { return "MultiPassMovingAverage"; }
    std::size_t      window_size() const override { return window_size_; }
    std::string      description() const override;

    std::size_t       num_passes() const { return passes_.filter_count(); }
    MovingAverageType pass_type() const { return type_; }

   private:
    std::size_t       window_size_;
    MovingAverageType type_;
    Smoother1D        passes_;
};

// Creates a windowed average of the given type. Gaussian uses the default
// std_dev. Exponential is not windowed and raises ConfigurationError.
[[nodiscard]] std::unique_ptr<Filter1D> make_windowed_average(MovingAverageType type,
                                                              std::size_t       window_size);

}   // namespace smoothie
