#include <expgrad/error.hpp>
#include <expgrad/exponential_gradient.hpp>
#include <gtest/gtest.h>

using namespace expgrad;

TEST(ExponentialGradient, ColorsAreEvenlySpaced)
{
    ExponentialGradient g({colors::indigo, colors::purple, colors::pink},
                          unit_point::top,
                          unit_point::bottom);
    ASSERT_EQ(g.gradient().size(), 3u);
    EXPECT_FLOAT_EQ(g.gradient()[0].location, 0.0f);
    EXPECT_FLOAT_EQ(g.gradient()[1].location, 0.5f);
    EXPECT_FLOAT_EQ(g.gradient()[2].location, 1.0f);
    EXPECT_EQ(g.gradient()[1].color, colors::purple);
}

TEST(ExponentialGradient, Defaults)
{
    ExponentialGradient g(std::vector<Color>{colors::blue, colors::purple},
                          unit_point::leading,
                          unit_point::trailing);
    EXPECT_FLOAT_EQ(g.exponent(), 2.0f);
    EXPECT_EQ(g.subdivisions(), 32);
    EXPECT_EQ(g.start_point(), unit_point::leading);
    EXPECT_EQ(g.end_point(), unit_point::trailing);
}

TEST(ExponentialGradient, StopsKeepCustomLocations)
{
    Gradient stops = {{colors::clear, 0.0f},
                      {colors::blue.with_alpha(0.5f), 0.3f},
                      {colors::blue, 0.7f},
                      {colors::purple, 1.0f}};
    ExponentialGradient g(stops, unit_point::leading, unit_point::trailing, 1.5f, 48);

    EXPECT_EQ(g.gradient(), stops);
    EXPECT_FLOAT_EQ(g.exponent(), 1.5f);
    EXPECT_EQ(g.subdivisions(), 48);
}

TEST(ExponentialGradient, ResolveSubdividesAndKeepsAnchors)
{
    Gradient stops = {{colors::blue, 0.0f}, {colors::green, 0.3f}, {colors::red, 1.0f}};
    ExponentialGradient g(stops, unit_point::top_leading, unit_point::bottom_trailing, 2.5f, 64);

    LinearGradient resolved = g.resolve();
    EXPECT_EQ(resolved.stops.size(), 2u * 64u + 1u);
    EXPECT_EQ(resolved.stops, subdivide(stops, 2.5f, 64));
    EXPECT_EQ(resolved.start_point, unit_point::top_leading);
    EXPECT_EQ(resolved.end_point, unit_point::bottom_trailing);
}

TEST(ExponentialGradient, ResolveIsRepeatable)
{
    ExponentialGradient g({colors::black, colors::white}, unit_point::leading, unit_point::trailing);
    EXPECT_EQ(g.resolve().stops, g.resolve().stops);
}

TEST(ExponentialGradient, InvalidParametersSurfaceOnResolve)
{
    ExponentialGradient zero_steps({colors::red, colors::blue},
                                   unit_point::leading,
                                   unit_point::trailing,
                                   2.0f,
                                   0);
    EXPECT_THROW((void)zero_steps.resolve(), InvalidParameter);

    ExponentialGradient negative({colors::red, colors::blue},
                                 unit_point::leading,
                                 unit_point::trailing,
                                 -1.0f);
    EXPECT_THROW((void)negative.resolve(), InvalidParameter);
}

TEST(ExponentialGradient, EmptyAndSingleColor)
{
    ExponentialGradient empty(std::vector<Color>{}, unit_point::leading, unit_point::trailing);
    EXPECT_TRUE(empty.resolve().stops.empty());

    ExponentialGradient single({colors::green}, unit_point::leading, unit_point::trailing);
    LinearGradient resolved = single.resolve();
    ASSERT_EQ(resolved.stops.size(), 1u);
    EXPECT_EQ(resolved.stops[0], (ColorStop{colors::green, 0.0f}));
}
