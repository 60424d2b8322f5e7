#pragma once

#include <expgrad/color.hpp>
#include <vector>

namespace expgrad
{

struct ColorStop
{
    Color color;
    float location = 0.0f;  // not clamped

    constexpr bool operator==(const ColorStop&) const = default;
};

// Ordered by location. Never sorted by this library: interpolation only
// happens between index-adjacent stops.
using Gradient = std::vector<ColorStop>;

struct SubdivisionParams
{
    float exponent = 2.0f;   // 1 = linear, > 1 slow start, < 1 fast start
    int subdivisions = 32;   // generated steps per original segment
};

// Evenly spaces `colors` at i / (n - 1). A single color sits at 0.
[[nodiscard]] Gradient make_gradient(const std::vector<Color>& colors);

/// Exponential interpolation between two colors.
/// All four channels (alpha included) move by f = t^exponent:
///   result = a + (b - a) * f
/// t is the linear fraction within the segment and is not clamped.
/// t == 0 yields `a` and t == 1 yields `b` exactly.
/// Throws InvalidParameter if exponent is not a finite value > 0.
[[nodiscard]] Color lerp_exp(const Color& a, const Color& b, float t, float exponent);

/// Subdivide every segment of `stops` into `subdivisions` linear steps whose
/// colors follow the exponential curve. Locations stay uniformly spaced
/// within each segment; only the colors are warped.
///
/// Output length is (n - 1) * subdivisions + 1 for n >= 2. The final stop is
/// the input's last stop, copied verbatim. Gradients with fewer than two
/// stops are returned unchanged.
///
/// Throws InvalidParameter for subdivisions < 1 or exponent <= 0, whatever
/// the stop count.
[[nodiscard]] Gradient subdivide(const Gradient& stops,
                                 float exponent = 2.0f,
                                 int subdivisions = 32);

[[nodiscard]] Gradient subdivide(const Gradient& stops, const SubdivisionParams& params);

// Throws InvalidParameter unless params are usable by subdivide().
void validate(const SubdivisionParams& params);

}  // namespace expgrad
