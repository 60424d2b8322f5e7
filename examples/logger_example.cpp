#include <chrono>
#include <expgrad/expgrad.hpp>
#include <thread>

using namespace expgrad;

int main()
{
    // Initialize logger with console output
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("expgrad_example.log"));

    EXPGRAD_LOG_INFO("example", "Logger example starting up");
    EXPGRAD_LOG_TRACE("example", "This is a trace message");

    // Independent call sites may subdivide concurrently; only the logger is shared.
    auto worker = [](int id)
    {
        const Gradient stops = make_gradient({colors::black, colors::orange, colors::white});
        for (int i = 1; i <= 3; ++i)
        {
            const Gradient dense = subdivide(stops, 1.0f + static_cast<float>(id), 8 * i);
            EXPGRAD_LOG_DEBUG("worker", "Worker {} pass {}: {} stops", id, i, dense.size());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    try
    {
        (void)subdivide(make_gradient({colors::red, colors::blue}), 2.0f, 0);
    }
    catch (const InvalidParameter& e)
    {
        EXPGRAD_LOG_ERROR("example", "Rejected: {}", e.what());
    }

    EXPGRAD_LOG_INFO("example", "Logger example completed");
    return 0;
}
