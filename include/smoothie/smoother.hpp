#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <smoothie/error.hpp>
#include <smoothie/filter.hpp>
#include <smoothie/logger.hpp>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace smoothie
{

// ─── Smoother ───────────────────────────────────────────────────────────────
// An ordered chain of filters of one dimensionality. add() feeds a sample
// through every filter in attachment order, each filter consuming the
// previous filter's output, and caches the final output for get().
//
// Single writer: add(), add_and_get(), attach() and reset() must not run
// concurrently with each other or with get() on the same instance.

template <typename FilterT>
class BasicSmoother
{
    static_assert(std::is_base_of_v<FilterBase, FilterT>, "FilterT must be a filter interface");

   public:
    using filter_type = FilterT;
    using sample_type = typename FilterT::sample_type;

    BasicSmoother() = default;

    BasicSmoother(BasicSmoother&&) noexcept            = default;
    BasicSmoother& operator=(BasicSmoother&&) noexcept = default;

    // Appends a filter to the end of the chain. Takes exclusive ownership.
    BasicSmoother& attach(std::unique_ptr<FilterT> filter)
    {
        if (!filter)
            detail::throw_configuration_error("Smoother", "cannot attach a null filter");

        SMOOTHIE_LOG_DEBUG("smoother",
                           "{} smoother: attached {} at position {}",
                           dimension_name(FilterT::kDimension),
                           filter->description(),
                           filters_.size());
        filters_.push_back(std::move(filter));
        return *this;
    }

    // Type-erased attach; the filter's dimensionality must match this
    // smoother's, otherwise ConfigurationError.
    BasicSmoother& attach_any(std::unique_ptr<FilterBase> filter)
    {
        if (!filter)
            detail::throw_configuration_error("Smoother", "cannot attach a null filter");

        auto* typed = dynamic_cast<FilterT*>(filter.get());
        if (filter->dimension() != FilterT::kDimension || !typed)
        {
            detail::throw_configuration_error(
                "Smoother",
                Logger::format_message("cannot attach {} filter {} to a {} smoother",
                                       dimension_name(filter->dimension()),
                                       filter->description(),
                                       dimension_name(FilterT::kDimension)));
        }

        std::unique_ptr<FilterT> owned(static_cast<FilterT*>(filter.release()));
        return attach(std::move(owned));
    }

    void add(const sample_type& sample)
    {
        sample_type value = sample;
        for (auto& filter : filters_)
            value = filter->update(value);
        last_ = value;
    }

    // Last smoothed value. Throws StateError if no sample was added since
    // construction or the last reset().
    const sample_type& get() const
    {
        if (!last_)
            throw StateError("Smoother::get() called before any sample was added");
        return *last_;
    }

    sample_type add_and_get(const sample_type& sample)
    {
        add(sample);
        return *last_;
    }

    // Resets every filter in attachment order and forgets the cached value.
    void reset()
    {
        for (auto& filter : filters_)
            filter->reset();
        last_.reset();
        SMOOTHIE_LOG_DEBUG("smoother",
                           "{} smoother reset ({} filters)",
                           dimension_name(FilterT::kDimension),
                           filters_.size());
    }

    // Feeds every sample of a recorded sequence and returns all outputs.
    [[nodiscard]] std::vector<sample_type> smooth(std::span<const sample_type> samples)
    {
        std::vector<sample_type> out;
        out.reserve(samples.size());
        for (const auto& s : samples)
            out.push_back(add_and_get(s));
        return out;
    }

    bool        has_value() const { return last_.has_value(); }
    std::size_t filter_count() const { return filters_.size(); }
    bool        empty() const { return filters_.empty(); }

    const FilterT& filter(std::size_t index) const { return *filters_.at(index); }
    FilterT&       filter(std::size_t index) { return *filters_.at(index); }

    static constexpr Dimension dimension() { return FilterT::kDimension; }

    // "A -> B -> C", or "identity" for an empty chain.
    std::string description() const
    {
        if (filters_.empty())
            return "identity";

        std::string out;
        for (std::size_t i = 0; i < filters_.size(); ++i)
        {
            if (i > 0)
                out += " -> ";
            out += filters_[i]->description();
        }
        return out;
    }

   private:
    std::vector<std::unique_ptr<FilterT>> filters_;
    std::optional<sample_type>            last_;
};

extern template class BasicSmoother<Filter1D>;
extern template class BasicSmoother<Filter2D>;

}   // namespace smoothie
