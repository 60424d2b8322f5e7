#include "cli/cli_config.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string_view>

namespace expgrad::cli
{

namespace
{

struct NamedPoint
{
    std::string_view name;
    UnitPoint point;
};

constexpr long MAX_SUBDIVISIONS = 1L << 20;

constexpr std::array<NamedPoint, 10> NAMED_POINTS = {{
    {"zero", unit_point::zero},
    {"center", unit_point::center},
    {"leading", unit_point::leading},
    {"trailing", unit_point::trailing},
    {"top", unit_point::top},
    {"bottom", unit_point::bottom},
    {"top-leading", unit_point::top_leading},
    {"top-trailing", unit_point::top_trailing},
    {"bottom-leading", unit_point::bottom_leading},
    {"bottom-trailing", unit_point::bottom_trailing},
}};

float to_float(const std::string& option, const std::string& value)
{
    char* end = nullptr;
    const float v = std::strtof(value.c_str(), &end);
    if (value.empty() || *end != '\0')
        throw UsageError(option + " expects a number, got '" + value + "'");
    return v;
}

long to_long(const std::string& option, const std::string& value)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0')
        throw UsageError(option + " expects an integer, got '" + value + "'");
    if (errno == ERANGE)
        throw UsageError(option + " is out of range: " + value);
    return v;
}

// Values below 1 are left for validate() to reject with their own value.
int to_subdivisions(const std::string& option, const std::string& value)
{
    const long v = to_long(option, value);
    if (v > MAX_SUBDIVISIONS)
        throw UsageError(option + " must be <= " + std::to_string(MAX_SUBDIVISIONS) + ", got "
                         + value);
    if (v < std::numeric_limits<int>::min())
        throw UsageError(option + " is out of range: " + value);
    return static_cast<int>(v);
}

uint32_t to_extent(const std::string& option, const std::string& value)
{
    const long v = to_long(option, value);
    if (v < 1 || v > 16384)
        throw UsageError(option + " must be in [1, 16384], got " + value);
    return static_cast<uint32_t>(v);
}

UnitPoint to_point(const std::string& option, const std::string& value)
{
    auto point = parse_unit_point(value);
    if (!point)
        throw UsageError(option + " expects a named point or 'x,y', got '" + value + "'");
    return *point;
}

// "color@location". The last '@' splits so colors never need escaping.
NativeStop<std::string> to_stop(const std::string& value)
{
    const auto at = value.rfind('@');
    if (at == std::string::npos || at == 0)
        throw UsageError("--stop expects COLOR@LOCATION, got '" + value + "'");
    return {value.substr(0, at), to_float("--stop", value.substr(at + 1))};
}

}  // anonymous namespace

std::optional<UnitPoint> parse_unit_point(const std::string& text)
{
    std::string name = text;
    std::replace(name.begin(), name.end(), '_', '-');
    for (const auto& named : NAMED_POINTS)
    {
        if (named.name == name)
            return named.point;
    }

    const auto comma = text.find(',');
    if (comma == std::string::npos)
        return std::nullopt;

    const std::string xs = text.substr(0, comma);
    const std::string ys = text.substr(comma + 1);
    char* end_x = nullptr;
    char* end_y = nullptr;
    const float x = std::strtof(xs.c_str(), &end_x);
    const float y = std::strtof(ys.c_str(), &end_y);
    if (xs.empty() || ys.empty() || *end_x != '\0' || *end_y != '\0')
        return std::nullopt;
    return UnitPoint{x, y};
}

CliConfig parse_args(const std::vector<std::string>& args, const char* env_log_level)
{
    CliConfig cfg;

    if (env_log_level && *env_log_level)
    {
        if (auto level = Logger::level_from_string(env_log_level))
            cfg.log_level = *level;
    }

    std::vector<std::string> colors;
    std::vector<NativeStop<std::string>> stops;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help")
        {
            cfg.show_help = true;
            continue;
        }

        if (i + 1 >= args.size())
            throw UsageError("missing value for " + arg);
        const std::string& value = args[++i];

        if (arg == "--color")
            colors.push_back(value);
        else if (arg == "--stop")
            stops.push_back(to_stop(value));
        else if (arg == "--exponent")
            cfg.params.exponent = to_float(arg, value);
        else if (arg == "--subdivisions")
            cfg.params.subdivisions = to_subdivisions(arg, value);
        else if (arg == "--start")
            cfg.start_point = to_point(arg, value);
        else if (arg == "--end")
            cfg.end_point = to_point(arg, value);
        else if (arg == "--width")
            cfg.width = to_extent(arg, value);
        else if (arg == "--height")
            cfg.height = to_extent(arg, value);
        else if (arg == "--svg")
            cfg.svg_path = value;
        else if (arg == "--png")
            cfg.png_path = value;
        else if (arg == "--log-file")
            cfg.log_file = value;
        else if (arg == "--log-level")
        {
            auto level = Logger::level_from_string(value);
            if (!level)
                throw UsageError("unknown log level '" + value + "'");
            cfg.log_level = *level;
        }
        else
            throw UsageError("unknown option " + arg);
    }

    if (cfg.show_help)
        return cfg;

    if (!colors.empty() && !stops.empty())
        throw UsageError("--color and --stop cannot be combined");

    if (!stops.empty())
    {
        cfg.stops = std::move(stops);
    }
    else
    {
        // Evenly spaced, same placement as make_gradient()
        const std::size_t n = colors.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const float location =
                (n > 1) ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
            cfg.stops.push_back({colors[i], location});
        }
    }

    if (cfg.stops.empty())
        throw UsageError("no colors given (use --color or --stop)");

    return cfg;
}

std::string usage()
{
    return "usage: expgrad [options]\n"
           "\n"
           "  --color C            append an evenly spaced color (repeatable)\n"
           "  --stop C@LOC         append a stop at LOC (repeatable)\n"
           "  --exponent E         curve exponent, > 0 (default 2)\n"
           "  --subdivisions N     steps per segment, 1..1048576 (default 32)\n"
           "  --start P, --end P   anchor: leading, trailing, top, bottom, center,\n"
           "                       top-leading, ..., or x,y (default leading -> trailing)\n"
           "  --width W, --height H  raster size (default 512x64)\n"
           "  --svg PATH           write an SVG document\n"
           "  --png PATH           write a PNG image\n"
           "  --log-level L        trace|debug|info|warn|error|critical\n"
           "  --log-file PATH      also append log output to PATH\n"
           "\n"
           "Colors: #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(r,g,b), rgba(r,g,b,a), names.\n"
           "Without --svg/--png the subdivided stops are printed as 'location color'.\n"
           "EXPGRAD_LOG_LEVEL sets the default log level.\n";
}

}  // namespace expgrad::cli
