#include <cstdio>
#include <expgrad/export.hpp>
#include <expgrad/logger.hpp>
#include <fstream>
#include <sstream>

namespace expgrad
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

// Convert a Color to an SVG rgb() string (alpha goes to stop-opacity)
std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(Color::to_byte(c.r)),
                  static_cast<int>(Color::to_byte(c.g)),
                  static_cast<int>(Color::to_byte(c.b)));
    return buf;
}

// Convert a float to a compact string (no trailing zeros)
std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(v));
    return buf;
}

std::string percent(float unit)
{
    return fmt(unit * 100.0f) + "%";
}

}  // anonymous namespace

std::string SvgExporter::to_string(const LinearGradient& gradient, uint32_t width, uint32_t height)
{
    std::ostringstream svg;

    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width << "\" height=\""
        << height << "\" viewBox=\"0 0 " << width << " " << height << "\">\n";

    svg << "  <defs>\n";
    svg << "    <linearGradient id=\"expgrad\" gradientUnits=\"objectBoundingBox\" x1=\""
        << percent(gradient.start_point.x) << "\" y1=\"" << percent(gradient.start_point.y)
        << "\" x2=\"" << percent(gradient.end_point.x) << "\" y2=\""
        << percent(gradient.end_point.y) << "\">\n";

    for (const auto& stop : gradient.stops)
    {
        svg << "      <stop offset=\"" << fmt(stop.location) << "\" stop-color=\""
            << svg_color(stop.color) << "\" stop-opacity=\"" << fmt(stop.color.a) << "\"/>\n";
    }

    svg << "    </linearGradient>\n";
    svg << "  </defs>\n";
    svg << "  <rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height
        << "\" fill=\"url(#expgrad)\"/>\n";
    svg << "</svg>\n";

    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path,
                            const LinearGradient& gradient,
                            uint32_t width,
                            uint32_t height)
{
    std::string content = to_string(gradient, width, height);

    std::ofstream file(path);
    if (!file.is_open())
    {
        EXPGRAD_LOG_ERROR("export", "Cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        EXPGRAD_LOG_ERROR("export", "Failed writing SVG to '{}'", path);
        return false;
    }

    EXPGRAD_LOG_DEBUG("export", "Wrote {} stops to '{}'", gradient.stops.size(), path);
    return true;
}

}  // namespace expgrad
