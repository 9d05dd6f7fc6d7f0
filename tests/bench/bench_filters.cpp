#include <benchmark/benchmark.h>
#include <cmath>
#include <memory>
#include <smoothie/smoothie.hpp>
#include <vector>

using namespace smoothie;

// --- Helpers ---

static std::vector<double> make_noisy_sine(std::size_t n)
{
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = std::sin(static_cast<double>(i) * 0.01) * 100.0 + ((i % 3 == 0) ? 2.0 : -1.0);
    return v;
}

static std::vector<Point2> make_gaze(std::size_t n)
{
    std::vector<Point2> v(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        // Fixations of ~200 samples with small jitter, then a saccade.
        const double fx = static_cast<double>((i / 200) % 7) * 150.0;
        const double fy = static_cast<double>((i / 200) % 5) * 90.0;
        v[i]            = {fx + ((i % 4) - 1.5), fy + ((i % 5) - 2.0)};
    }
    return v;
}

template <typename FilterT>
static void run_filter(benchmark::State& state, FilterT& filter, const std::vector<double>& input)
{
    for (auto _ : state)
    {
        for (double x : input)
            benchmark::DoNotOptimize(filter.update(x));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

// --- Windowed averages ---

static void BM_SimpleMovingAverage(benchmark::State& state)
{
    auto                        input = make_noisy_sine(100'000);
    SimpleMovingAverageFilter1D f(static_cast<std::size_t>(state.range(0)));
    run_filter(state, f, input);
}
BENCHMARK(BM_SimpleMovingAverage)->Arg(4)->Arg(16)->Arg(64)->Arg(256);

static void BM_WeightedMovingAverage(benchmark::State& state)
{
    auto                          input = make_noisy_sine(100'000);
    WeightedMovingAverageFilter1D f(static_cast<std::size_t>(state.range(0)));
    run_filter(state, f, input);
}
BENCHMARK(BM_WeightedMovingAverage)->Arg(4)->Arg(16)->Arg(64)->Arg(256);

static void BM_GaussianAverage(benchmark::State& state)
{
    auto                    input = make_noisy_sine(100'000);
    GaussianAverageFilter1D f(static_cast<std::size_t>(state.range(0)));
    run_filter(state, f, input);
}
BENCHMARK(BM_GaussianAverage)->Arg(4)->Arg(16)->Arg(64)->Arg(256);

static void BM_MedianAverage(benchmark::State& state)
{
    auto                  input = make_noisy_sine(100'000);
    MedianAverageFilter1D f(static_cast<std::size_t>(state.range(0)));
    run_filter(state, f, input);
}
BENCHMARK(BM_MedianAverage)->Arg(3)->Arg(9)->Arg(31)->Arg(101);

static void BM_MultiPass_3x16(benchmark::State& state)
{
    auto                           input = make_noisy_sine(100'000);
    MultiPassMovingAverageFilter1D f(16, 3);
    run_filter(state, f, input);
}
BENCHMARK(BM_MultiPass_3x16);

// --- Recursive ---

static void BM_ExponentialMovingAverage(benchmark::State& state)
{
    auto                             input = make_noisy_sine(100'000);
    ExponentialMovingAverageFilter1D f(0.2);
    run_filter(state, f, input);
}
BENCHMARK(BM_ExponentialMovingAverage);

static void BM_CumulativeMovingAverage(benchmark::State& state)
{
    auto                            input = make_noisy_sine(100'000);
    CumulativeMovingAverageFilter1D f;
    run_filter(state, f, input);
}
BENCHMARK(BM_CumulativeMovingAverage);

// --- Pipelines ---

static void BM_GazePipeline(benchmark::State& state)
{
    auto gaze = make_gaze(100'000);
    auto s    = SmootherBuilder2D()
                 .attach(FilterConfig{FilterType::MedianAverage, {.window_size = 5}})
                 .attach(FilterConfig{FilterType::FixationSmooth, {.threshold = 12.0}})
                 .attach(FilterConfig{FilterType::ExponentialMovingAverage, {.alpha = 0.4}})
                 .build();

    for (auto _ : state)
    {
        for (const auto& p : gaze)
            benchmark::DoNotOptimize(s.add_and_get(p));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(gaze.size()));
}
BENCHMARK(BM_GazePipeline);

static void BM_SmoothRecording_1D(benchmark::State& state)
{
    auto input = make_noisy_sine(static_cast<std::size_t>(state.range(0)));
    auto s     = SmootherBuilder1D()
                 .attach(FilterConfig{FilterType::GaussianAverage, {.window_size = 9}})
                 .attach(FilterConfig{FilterType::ExponentialMovingAverage, {.alpha = 0.5}})
                 .build();

    for (auto _ : state)
    {
        s.reset();
        auto out = s.smooth(input);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SmoothRecording_1D)->Arg(1'000)->Arg(100'000)->Arg(1'000'000);

BENCHMARK_MAIN();
