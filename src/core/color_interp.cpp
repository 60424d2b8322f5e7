#include <cmath>
#include <expgrad/error.hpp>
#include <expgrad/gradient.hpp>
#include <string>

namespace expgrad
{

namespace
{

// a + (b - a) * f, returning b itself at f == 1 so the segment end is exact.
inline float mix(float a, float b, float f)
{
    if (f == 1.0f)
        return b;
    return a + (b - a) * f;
}

}  // anonymous namespace

Color lerp_exp(const Color& a, const Color& b, float t, float exponent)
{
    if (!std::isfinite(exponent) || exponent <= 0.0f)
        throw InvalidParameter("exponent must be a finite value > 0, got " + std::to_string(exponent));

    // Same warped fraction for every channel, alpha included.
    const float f = std::pow(t, exponent);
    return Color(mix(a.r, b.r, f), mix(a.g, b.g, f), mix(a.b, b.b, f), mix(a.a, b.a, f));
}

}  // namespace expgrad
