#pragma once

#include <expgrad/color.hpp>
#include <expgrad/gradient.hpp>
#include <vector>

namespace expgrad
{

// A point in the unit square of the painted area, (0,0) top-left.
struct UnitPoint
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr bool operator==(const UnitPoint&) const = default;
};

namespace unit_point
{
inline constexpr UnitPoint zero{0.0f, 0.0f};
inline constexpr UnitPoint center{0.5f, 0.5f};
inline constexpr UnitPoint leading{0.0f, 0.5f};
inline constexpr UnitPoint trailing{1.0f, 0.5f};
inline constexpr UnitPoint top{0.5f, 0.0f};
inline constexpr UnitPoint bottom{0.5f, 1.0f};
inline constexpr UnitPoint top_leading{0.0f, 0.0f};
inline constexpr UnitPoint top_trailing{1.0f, 0.0f};
inline constexpr UnitPoint bottom_leading{0.0f, 1.0f};
inline constexpr UnitPoint bottom_trailing{1.0f, 1.0f};
}  // namespace unit_point

// What a plain linear-gradient painter consumes.
struct LinearGradient
{
    Gradient stops;
    UnitPoint start_point;
    UnitPoint end_point;
};

// Gradient whose segments are eased by a power curve. Holds the parameters
// only; resolve() does the subdivision so invalid parameters surface at
// paint time, not at construction.
class ExponentialGradient
{
   public:
    ExponentialGradient(Gradient gradient,
                        UnitPoint start_point,
                        UnitPoint end_point,
                        float exponent = 2.0f,
                        int subdivisions = 32);

    // Colors evenly spaced from start to end.
    ExponentialGradient(const std::vector<Color>& colors,
                        UnitPoint start_point,
                        UnitPoint end_point,
                        float exponent = 2.0f,
                        int subdivisions = 32);

    const Gradient& gradient() const { return gradient_; }
    UnitPoint start_point() const { return start_point_; }
    UnitPoint end_point() const { return end_point_; }
    float exponent() const { return params_.exponent; }
    int subdivisions() const { return params_.subdivisions; }
    const SubdivisionParams& params() const { return params_; }

    // Subdivided stops plus the same anchors. Throws InvalidParameter.
    [[nodiscard]] LinearGradient resolve() const;

   private:
    Gradient gradient_;
    UnitPoint start_point_;
    UnitPoint end_point_;
    SubdivisionParams params_;
};

}  // namespace expgrad
