#include <chrono>
#include <smoothie/filters1d.hpp>
#include <smoothie/logger.hpp>
#include <smoothie/smoother.hpp>
#include <thread>

using namespace smoothie;

int main()
{
    // Console output, plus a file for the debug trail
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().add_sink(sinks::file_sink("smoothie_example.log"));

    SMOOTHIE_LOG_INFO("example", "Logger example starting up");

    // Filter construction and attach are logged at debug level
    Smoother1D pressure;
    pressure.attach(std::make_unique<MedianAverageFilter1D>(3));
    pressure.attach(std::make_unique<ExponentialMovingAverageFilter1D>(0.3));

    // Configuration errors are logged on the "config" category before the throw
    try
    {
        GaussianAverageFilter1D bad(5, -1.0);
    }
    catch (const ConfigurationError& e)
    {
        SMOOTHIE_LOG_WARN("example", "rejected as expected: {}", e.what());
    }

    SMOOTHIE_LOG_DEBUG_HERE("example", "Logging with source location");

    // One smoother per thread; the logger itself is shared
    auto worker = [](int id)
    {
        Smoother1D s;
        s.attach(std::make_unique<SimpleMovingAverageFilter1D>(4));
        for (int i = 0; i < 5; ++i)
        {
            double v = s.add_and_get(static_cast<double>(id * 10 + i));
            SMOOTHIE_LOG_DEBUG("worker", "Worker {} iteration {} -> {}", id, i, v);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    pressure.reset();
    SMOOTHIE_LOG_INFO("example", "Logger example completed");

    return 0;
}
