#pragma once

#include <cstdint>
#include <expgrad/color.hpp>
#include <expgrad/exponential_gradient.hpp>
#include <expgrad/gradient.hpp>
#include <vector>

namespace expgrad
{

/// Color of a linearly rendered gradient at `location`.
/// Before the first stop the first color is held, after the last stop the
/// last color. Between stops the bracketing index-adjacent pair is blended
/// linearly; stops sharing a location form a hard edge (later stop wins).
/// Throws InvalidParameter on an empty stop list.
[[nodiscard]] Color sample(const Gradient& stops, float location);

/// Paint `gradient` into a width x height RGBA8 buffer (row-major, 4 bytes
/// per pixel). Each pixel center is projected onto the start -> end axis in
/// unit space. A zero-length axis paints the last stop color.
/// Throws InvalidParameter for zero size or an empty stop list.
[[nodiscard]] std::vector<uint8_t> rasterize(const LinearGradient& gradient,
                                             uint32_t width,
                                             uint32_t height);

}  // namespace expgrad
