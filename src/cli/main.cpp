// expgrad — render an exponential gradient to SVG/PNG or list its stops.

#include <expgrad/channels.hpp>
#include <expgrad/error.hpp>
#include <expgrad/exponential_gradient.hpp>
#include <expgrad/export.hpp>
#include <expgrad/logger.hpp>
#include <expgrad/raster.hpp>

#include "cli/cli_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace expgrad;

void init_logging(const cli::CliConfig& cfg)
{
    auto& logger = Logger::instance();
    logger.set_level(cfg.log_level);
    logger.add_sink(sinks::console_sink());
    if (!cfg.log_file.empty())
        logger.add_sink(sinks::file_sink(cfg.log_file));
}

void print_stops(const cli::CliConfig& cfg, const CssColorAdapter& adapter)
{
    const auto dense =
        subdivide(adapter, cfg.stops, cfg.params.exponent, cfg.params.subdivisions);
    for (const auto& stop : dense)
    {
        char location[32];
        std::snprintf(location, sizeof(location), "%.6f", static_cast<double>(stop.location));
        std::cout << location << " " << stop.color << "\n";
    }
}

bool export_outputs(const cli::CliConfig& cfg, const CssColorAdapter& adapter)
{
    Gradient stops;
    stops.reserve(cfg.stops.size());
    for (const auto& stop : cfg.stops)
        stops.push_back({adapter.require_channels(stop.color), stop.location});

    ExponentialGradient gradient(std::move(stops),
                                 cfg.start_point,
                                 cfg.end_point,
                                 cfg.params.exponent,
                                 cfg.params.subdivisions);
    const LinearGradient resolved = gradient.resolve();
    EXPGRAD_LOG_INFO("cli",
                     "Resolved {} stops into {} (exponent {}, subdivisions {})",
                     gradient.gradient().size(),
                     resolved.stops.size(),
                     gradient.exponent(),
                     gradient.subdivisions());

    bool ok = true;
    if (!cfg.svg_path.empty())
        ok = SvgExporter::write_svg(cfg.svg_path, resolved, cfg.width, cfg.height) && ok;

    if (!cfg.png_path.empty())
    {
#ifdef EXPGRAD_USE_STB
        const auto pixels = rasterize(resolved, cfg.width, cfg.height);
        ok = ImageExporter::write_png(cfg.png_path, pixels.data(), cfg.width, cfg.height) && ok;
#else
        EXPGRAD_LOG_ERROR("cli", "PNG output unavailable: built without stb_image_write");
        ok = false;
#endif
    }
    return ok;
}

}  // anonymous namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);

    expgrad::cli::CliConfig cfg;
    try
    {
        cfg = expgrad::cli::parse_args(args, std::getenv("EXPGRAD_LOG_LEVEL"));
    }
    catch (const expgrad::cli::UsageError& e)
    {
        std::cerr << "expgrad: " << e.what() << "\n\n" << expgrad::cli::usage();
        return 2;
    }

    if (cfg.show_help)
    {
        std::cout << expgrad::cli::usage();
        return 0;
    }

    init_logging(cfg);

    const expgrad::CssColorAdapter adapter;
    try
    {
        if (cfg.svg_path.empty() && cfg.png_path.empty())
        {
            print_stops(cfg, adapter);
            return 0;
        }
        return export_outputs(cfg, adapter) ? 0 : 1;
    }
    catch (const expgrad::InvalidParameter& e)
    {
        EXPGRAD_LOG_ERROR("cli", "Invalid parameter: {}", e.what());
    }
    catch (const expgrad::UnsupportedColorFormat& e)
    {
        EXPGRAD_LOG_ERROR("cli", "Unsupported color: {}", e.what());
    }
    return 1;
}
