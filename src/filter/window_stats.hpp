#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace smoothie::stats
{

// Neumaier-compensated accumulator.
class CompensatedSum
{
   public:
    void add(double v);
    double value() const { return sum_ + compensation_; }

   private:
    double sum_          = 0.0;
    double compensation_ = 0.0;
};

// Arithmetic mean. values must be non-empty.
double mean(std::span<const double> values);

// sum(v[i] * w[i]) / sum(w[i]). Sizes must match, weights must be positive.
double weighted_mean(std::span<const double> values, std::span<const double> weights);

// Weights 1, 2, ..., n from oldest to newest. values must be non-empty.
double linear_weighted_mean(std::span<const double> values);

// Median; even sizes average the two middle values. `scratch` is reused and
// does not reallocate when its capacity already covers values.size().
double median(std::span<const double> values, std::vector<double>& scratch);

}   // namespace smoothie::stats

namespace smoothie::checks
{

// Parameter validation shared by the filter constructors. Each returns its
// argument on success and throws ConfigurationError otherwise.
std::size_t window_size(std::string_view component, std::size_t window);
double      alpha(std::string_view component, double alpha);
double      std_dev(std::string_view component, double std_dev);
double      threshold(std::string_view component, double threshold);
double      finite(std::string_view component, std::string_view what, double value);
std::size_t num_passes(std::string_view component, std::size_t passes);

}   // namespace smoothie::checks
