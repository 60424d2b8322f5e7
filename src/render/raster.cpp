#include <expgrad/error.hpp>
#include <expgrad/raster.hpp>
#include <string>

namespace expgrad
{

Color sample(const Gradient& stops, float location)
{
    if (stops.empty())
        throw InvalidParameter("cannot sample an empty gradient");

    if (location < stops.front().location)
        return stops.front().color;

    // Pairs are visited in sequence order, so a zero-width pair is skipped
    // and the later of two coincident stops wins.
    for (std::size_t i = 0; i + 1 < stops.size(); ++i)
    {
        const ColorStop& a = stops[i];
        const ColorStop& b = stops[i + 1];
        if (a.location <= location && location < b.location)
        {
            const float t = (location - a.location) / (b.location - a.location);
            return a.color.lerp(b.color, t);
        }
    }
    return stops.back().color;
}

std::vector<uint8_t> rasterize(const LinearGradient& gradient, uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        throw InvalidParameter("raster size must be non-zero, got " + std::to_string(width) + "x"
                               + std::to_string(height));
    if (gradient.stops.empty())
        throw InvalidParameter("cannot rasterize an empty gradient");

    std::vector<uint8_t> pixels(static_cast<std::size_t>(width) * height * 4);

    const float dx = gradient.end_point.x - gradient.start_point.x;
    const float dy = gradient.end_point.y - gradient.start_point.y;
    const float len2 = dx * dx + dy * dy;

    const float inv_w = 1.0f / static_cast<float>(width);
    const float inv_h = 1.0f / static_cast<float>(height);

    std::size_t offset = 0;
    for (uint32_t y = 0; y < height; ++y)
    {
        const float v = (static_cast<float>(y) + 0.5f) * inv_h - gradient.start_point.y;
        for (uint32_t x = 0; x < width; ++x)
        {
            Color c;
            if (len2 > 0.0f)
            {
                const float u = (static_cast<float>(x) + 0.5f) * inv_w - gradient.start_point.x;
                c = sample(gradient.stops, (u * dx + v * dy) / len2);
            }
            else
            {
                c = gradient.stops.back().color;
            }

            pixels[offset++] = Color::to_byte(c.r);
            pixels[offset++] = Color::to_byte(c.g);
            pixels[offset++] = Color::to_byte(c.b);
            pixels[offset++] = Color::to_byte(c.a);
        }
    }
    return pixels;
}

}  // namespace expgrad
