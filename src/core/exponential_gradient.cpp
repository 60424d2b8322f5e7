#include <expgrad/exponential_gradient.hpp>
#include <utility>

namespace expgrad
{

ExponentialGradient::ExponentialGradient(Gradient gradient,
                                         UnitPoint start_point,
                                         UnitPoint end_point,
                                         float exponent,
                                         int subdivisions)
    : gradient_(std::move(gradient)),
      start_point_(start_point),
      end_point_(end_point),
      params_{exponent, subdivisions}
{
}

ExponentialGradient::ExponentialGradient(const std::vector<Color>& colors,
                                         UnitPoint start_point,
                                         UnitPoint end_point,
                                         float exponent,
                                         int subdivisions)
    : ExponentialGradient(make_gradient(colors), start_point, end_point, exponent, subdivisions)
{
}

LinearGradient ExponentialGradient::resolve() const
{
    return LinearGradient{subdivide(gradient_, params_), start_point_, end_point_};
}

}  // namespace expgrad
