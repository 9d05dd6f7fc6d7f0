// Smooths a synthetic eye-tracker stream: a median removes blink spikes,
// a fixation deadband holds the cursor still while the eye dwells, and an
// exponential average softens the jumps between fixations.

#include <cmath>
#include <cstdio>
#include <smoothie/smoothie.hpp>
#include <vector>

using namespace smoothie;

static std::vector<Point2> record_gaze()
{
    const Point2 targets[] = {{320.0, 240.0}, {900.0, 260.0}, {610.0, 700.0}};

    std::vector<Point2> samples;
    for (const auto& target : targets)
    {
        for (int i = 0; i < 30; ++i)
        {
            const double jitter_x = 3.0 * std::sin(i * 1.7);
            const double jitter_y = 2.5 * std::cos(i * 2.3);
            samples.push_back({target.x + jitter_x, target.y + jitter_y});
        }
        // Tracker loses the pupil for one frame.
        samples.push_back({0.0, 0.0});
    }
    return samples;
}

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());
    configure_logger_from_env();

    const std::vector<FilterConfig> pipeline = {
        {FilterType::MedianAverage, {.window_size = 5}},
        {FilterType::FixationSmooth, {.threshold = 25.0}},
        {FilterType::ExponentialMovingAverage, {.alpha = 0.6}},
    };

    for (const auto& config : pipeline)
        SMOOTHIE_LOG_INFO("example", "stage: {}", describe(config));

    Smoother2D gaze;
    try
    {
        gaze = make_smoother_2d(pipeline);
    }
    catch (const ConfigurationError& e)
    {
        SMOOTHIE_LOG_ERROR("example", "invalid pipeline: {}", e.what());
        return 1;
    }

    SMOOTHIE_LOG_INFO("example", "pipeline: {}", gaze.description());

    const auto raw      = record_gaze();
    const auto smoothed = gaze.smooth(raw);

    std::printf("%6s %10s %10s %10s %10s\n", "i", "raw.x", "raw.y", "out.x", "out.y");
    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        std::printf("%6zu %10.2f %10.2f %10.2f %10.2f\n",
                    i,
                    raw[i].x,
                    raw[i].y,
                    smoothed[i].x,
                    smoothed[i].y);
    }

    gaze.reset();
    SMOOTHIE_LOG_INFO("example", "reset, has_value={}", gaze.has_value());
    return 0;
}
