#include <expgrad/export.hpp>
#include <expgrad/logger.hpp>
#include <limits>

// Suppress warnings in third-party STB headers
#if defined(__clang__)
    #pragma clang diagnostic push
    #pragma clang diagnostic ignored "-Wmissing-field-initializers"
    #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wmissing-field-initializers"
    #pragma GCC diagnostic ignored "-Wunused-function"
#endif

// stb_image_write header-only (implementation in src/io/stb_impl.cpp)
#include "stb_image_write.h"

#if defined(__clang__)
    #pragma clang diagnostic pop
#elif defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif

namespace expgrad
{

bool ImageExporter::write_png(const std::string& path,
                              const uint8_t* rgba_data,
                              uint32_t width,
                              uint32_t height)
{
    if (!rgba_data || width == 0 || height == 0)
    {
        EXPGRAD_LOG_ERROR("export", "Refusing to write empty image to '{}'", path);
        return false;
    }

    // stb takes int dimensions and an int stride
    constexpr uint32_t max_int = static_cast<uint32_t>(std::numeric_limits<int>::max());
    if (width > max_int / 4 || height > max_int)
    {
        EXPGRAD_LOG_ERROR("export", "Image {}x{} too large for '{}'", width, height, path);
        return false;
    }

    // RGBA = 4 channels, stride = width * 4
    int result = stbi_write_png(path.c_str(),
                                static_cast<int>(width),
                                static_cast<int>(height),
                                4,
                                rgba_data,
                                static_cast<int>(width * 4));
    if (result == 0)
    {
        EXPGRAD_LOG_ERROR("export", "stbi_write_png failed for '{}'", path);
        return false;
    }

    EXPGRAD_LOG_DEBUG("export", "Wrote {}x{} PNG to '{}'", width, height, path);
    return true;
}

}  // namespace expgrad
