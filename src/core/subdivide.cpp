#include <cmath>
#include <expgrad/error.hpp>
#include <expgrad/gradient.hpp>
#include <string>

namespace expgrad
{

Gradient make_gradient(const std::vector<Color>& colors)
{
    Gradient stops;
    stops.reserve(colors.size());

    const std::size_t n = colors.size();
    for (std::size_t i = 0; i < n; ++i)
    {
        const float location =
            (n > 1) ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
        stops.push_back({colors[i], location});
    }
    return stops;
}

void validate(const SubdivisionParams& params)
{
    if (params.subdivisions < 1)
        throw InvalidParameter("subdivisions must be >= 1, got "
                               + std::to_string(params.subdivisions));
    if (!std::isfinite(params.exponent) || params.exponent <= 0.0f)
        throw InvalidParameter("exponent must be a finite value > 0, got "
                               + std::to_string(params.exponent));
}

Gradient subdivide(const Gradient& stops, float exponent, int subdivisions)
{
    validate(SubdivisionParams{exponent, subdivisions});

    if (stops.size() <= 1)
        return stops;

    Gradient out;
    out.reserve((stops.size() - 1) * static_cast<std::size_t>(subdivisions) + 1);

    const auto steps = static_cast<float>(subdivisions);
    for (std::size_t i = 0; i + 1 < stops.size(); ++i)
    {
        const ColorStop& current = stops[i];
        const ColorStop& next = stops[i + 1];
        const float span = next.location - current.location;

        // t stays below 1 here; `next` is emitted by the following segment
        // or as the trailing stop.
        for (int step = 0; step < subdivisions; ++step)
        {
            const float t = static_cast<float>(step) / steps;
            out.push_back({lerp_exp(current.color, next.color, t, exponent),
                           current.location + span * t});
        }
    }

    out.push_back(stops.back());
    return out;
}

Gradient subdivide(const Gradient& stops, const SubdivisionParams& params)
{
    return subdivide(stops, params.exponent, params.subdivisions);
}

}  // namespace expgrad
