#pragma once

#include <cstddef>
#include <cstdint>

namespace expgrad
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // From packed 0xRRGGBBAA
    static constexpr Color from_rgba8(uint32_t packed)
    {
        return Color(((packed >> 24) & 0xFF) / 255.0f,
                     ((packed >> 16) & 0xFF) / 255.0f,
                     ((packed >> 8) & 0xFF) / 255.0f,
                     (packed & 0xFF) / 255.0f);
    }

    // To packed 0xRRGGBBAA, channels clamped to [0,1] and rounded
    constexpr uint32_t to_rgba8() const
    {
        return (uint32_t(to_byte(r)) << 24) | (uint32_t(to_byte(g)) << 16)
               | (uint32_t(to_byte(b)) << 8) | uint32_t(to_byte(a));
    }

    constexpr Color with_alpha(float alpha) const { return Color(r, g, b, alpha); }

    // Straight linear interpolation, t unclamped.
    constexpr Color lerp(const Color& other, float t) const
    {
        return Color(r + (other.r - r) * t,
                     g + (other.g - g) * t,
                     b + (other.b - b) * t,
                     a + (other.a - a) * t);
    }

    constexpr bool operator==(const Color&) const = default;

    static constexpr uint8_t to_byte(float v)
    {
        if (!(v > 0.0f))
            return 0;
        if (v >= 1.0f)
            return 255;
        return static_cast<uint8_t>(v * 255.0f + 0.5f);
    }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color cyan{0.0f, 1.0f, 1.0f};
inline constexpr Color magenta{1.0f, 0.0f, 1.0f};
inline constexpr Color yellow{1.0f, 1.0f, 0.0f};
inline constexpr Color orange{1.0f, 0.65f, 0.0f};
inline constexpr Color purple{0.5f, 0.0f, 0.5f};
inline constexpr Color indigo{0.294f, 0.0f, 0.51f};
inline constexpr Color pink{1.0f, 0.753f, 0.796f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
inline constexpr Color clear{0.0f, 0.0f, 0.0f, 0.0f};
}  // namespace colors

}  // namespace expgrad
