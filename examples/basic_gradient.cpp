#include <cstdio>
#include <expgrad/expgrad.hpp>

using namespace expgrad;

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Standard linear gradient next to the eased one
    const Gradient linear = make_gradient({colors::blue, colors::purple});
    ExponentialGradient eased({colors::blue, colors::purple},
                              unit_point::leading,
                              unit_point::trailing,
                              2.5f,
                              64);

    LinearGradient resolved;
    try
    {
        resolved = eased.resolve();
    }
    catch (const InvalidParameter& e)
    {
        EXPGRAD_LOG_ERROR("example", "Cannot resolve gradient: {}", e.what());
        return 1;
    }

    std::printf("location   linear.r   eased.r\n");
    for (int i = 0; i <= 10; ++i)
    {
        const float loc = static_cast<float>(i) / 10.0f;
        std::printf("%8.2f %10.4f %9.4f\n",
                    static_cast<double>(loc),
                    static_cast<double>(sample(linear, loc).r),
                    static_cast<double>(sample(resolved.stops, loc).r));
    }

    if (!SvgExporter::write_svg("basic_gradient.svg", resolved, 640, 80))
        return 1;
    EXPGRAD_LOG_INFO("example", "Wrote basic_gradient.svg with {} stops", resolved.stops.size());

#ifdef EXPGRAD_USE_STB
    const auto pixels = rasterize(resolved, 640, 80);
    if (!ImageExporter::write_png("basic_gradient.png", pixels.data(), 640, 80))
        return 1;
#endif

    return 0;
}
