#pragma once

#include <cstdint>
#include <expgrad/exponential_gradient.hpp>
#include <string>

namespace expgrad
{

#ifdef EXPGRAD_USE_STB
class ImageExporter
{
   public:
    static bool write_png(const std::string& path,
                          const uint8_t* rgba_data,
                          uint32_t width,
                          uint32_t height);
};
#endif  // EXPGRAD_USE_STB

class SvgExporter
{
   public:
    // Write a gradient-filled rectangle to an SVG file. Returns false on I/O
    // failure.
    static bool write_svg(const std::string& path,
                          const LinearGradient& gradient,
                          uint32_t width,
                          uint32_t height);

    // Write SVG to a string instead of a file.
    static std::string to_string(const LinearGradient& gradient, uint32_t width, uint32_t height);
};

}  // namespace expgrad
