#include <expgrad/channels.hpp>
#include <expgrad/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace expgrad;

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    const CssColorAdapter css;
    std::vector<NativeStop<std::string>> stops = {
        {"transparent", 0.0f},
        {"rgba(0, 0, 255, 0.5)", 0.3f},
        {"#00f", 0.7f},
        {"purple", 1.0f},
    };

    for (const auto& stop : subdivide(css, stops, 1.5f, 4))
        std::cout << stop.location << "\t" << stop.color << "\n";

    // A pattern fill has no channels; the failure is explicit.
    stops[1].color = "url(#hatch)";
    try
    {
        (void)subdivide(css, stops, 1.5f, 4);
    }
    catch (const UnsupportedColorFormat& e)
    {
        EXPGRAD_LOG_WARN("example", "Falling back to flat fill: {}", e.what());
    }
    return 0;
}
