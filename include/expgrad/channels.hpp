#pragma once

#include <cstdint>
#include <expgrad/color.hpp>
#include <expgrad/error.hpp>
#include <expgrad/gradient.hpp>
#include <optional>
#include <string>
#include <vector>

namespace expgrad
{

// Converts a host color value to four normalized channels and back.
// to_channels() returns std::nullopt when the value has no RGBA
// representation (pattern fills, image-backed colors, ...). Callers turn
// that into UnsupportedColorFormat; nothing substitutes a default color.
template <typename NativeColor>
class ChannelAdapter
{
   public:
    using native_type = NativeColor;

    virtual ~ChannelAdapter() = default;

    virtual std::optional<Color> to_channels(const NativeColor& color) const = 0;
    virtual NativeColor from_channels(const Color& color) const = 0;

    // Human readable form used in error messages.
    virtual std::string describe(const NativeColor& color) const = 0;

    Color require_channels(const NativeColor& color) const
    {
        auto channels = to_channels(color);
        if (!channels)
            throw UnsupportedColorFormat("color has no RGBA representation: " + describe(color));
        return *channels;
    }
};

template <typename NativeColor>
struct NativeStop
{
    NativeColor color;
    float location = 0.0f;
};

// 0xRRGGBBAA packed into 32 bits.
class PackedRgbaAdapter final : public ChannelAdapter<uint32_t>
{
   public:
    std::optional<Color> to_channels(const uint32_t& color) const override;
    uint32_t from_channels(const Color& color) const override;
    std::string describe(const uint32_t& color) const override;
};

// CSS color strings: #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba() and the
// basic named colors. Anything else (url(#pattern), currentColor, ...) is
// reported as unrepresentable.
class CssColorAdapter final : public ChannelAdapter<std::string>
{
   public:
    std::optional<Color> to_channels(const std::string& color) const override;

    // Always emits #rrggbbaa.
    std::string from_channels(const Color& color) const override;

    std::string describe(const std::string& color) const override { return "'" + color + "'"; }
};

template <typename NativeColor>
NativeColor lerp_exp(const ChannelAdapter<NativeColor>& adapter,
                     const NativeColor& a,
                     const NativeColor& b,
                     float t,
                     float exponent)
{
    const Color ca = adapter.require_channels(a);
    const Color cb = adapter.require_channels(b);
    return adapter.from_channels(lerp_exp(ca, cb, t, exponent));
}

// Subdivision over host colors. Every stop is converted up front so an
// unrepresentable color fails the whole call with no partial output.
// Generated stops that coincide with an original stop (t == 0 and the
// trailing stop) carry the caller's original value, not a round trip.
template <typename NativeColor>
std::vector<NativeStop<NativeColor>> subdivide(const ChannelAdapter<NativeColor>& adapter,
                                               const std::vector<NativeStop<NativeColor>>& stops,
                                               float exponent = 2.0f,
                                               int subdivisions = 32)
{
    validate(SubdivisionParams{exponent, subdivisions});
    if (stops.size() <= 1)
        return stops;

    Gradient channels;
    channels.reserve(stops.size());
    for (const auto& stop : stops)
        channels.push_back({adapter.require_channels(stop.color), stop.location});

    const Gradient dense = subdivide(channels, exponent, subdivisions);

    std::vector<NativeStop<NativeColor>> out;
    out.reserve(dense.size());
    const auto step_count = static_cast<std::size_t>(subdivisions);
    for (std::size_t i = 0; i + 1 < dense.size(); ++i)
    {
        if (i % step_count == 0)
            out.push_back(stops[i / step_count]);
        else
            out.push_back({adapter.from_channels(dense[i].color), dense[i].location});
    }
    out.push_back(stops.back());
    return out;
}

}  // namespace expgrad
