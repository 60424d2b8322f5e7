#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "cli/cli_config.hpp"

using namespace expgrad;
using namespace expgrad::cli;

TEST(CliConfig, DefaultsWithEvenlySpacedColors)
{
    CliConfig cfg = parse_args({"--color", "red", "--color", "#00f"});

    ASSERT_EQ(cfg.stops.size(), 2u);
    EXPECT_EQ(cfg.stops[0].color, "red");
    EXPECT_FLOAT_EQ(cfg.stops[0].location, 0.0f);
    EXPECT_EQ(cfg.stops[1].color, "#00f");
    EXPECT_FLOAT_EQ(cfg.stops[1].location, 1.0f);

    EXPECT_FLOAT_EQ(cfg.params.exponent, 2.0f);
    EXPECT_EQ(cfg.params.subdivisions, 32);
    EXPECT_EQ(cfg.start_point, unit_point::leading);
    EXPECT_EQ(cfg.end_point, unit_point::trailing);
    EXPECT_EQ(cfg.width, 512u);
    EXPECT_EQ(cfg.height, 64u);
    EXPECT_EQ(cfg.log_level, LogLevel::Warning);
    EXPECT_TRUE(cfg.svg_path.empty());
    EXPECT_TRUE(cfg.png_path.empty());
}

TEST(CliConfig, ExplicitStops)
{
    CliConfig cfg = parse_args({"--stop", "rgb(0,0,0)@0.25", "--stop", "white@0.75"});
    ASSERT_EQ(cfg.stops.size(), 2u);
    EXPECT_EQ(cfg.stops[0].color, "rgb(0,0,0)");
    EXPECT_FLOAT_EQ(cfg.stops[0].location, 0.25f);
    EXPECT_EQ(cfg.stops[1].color, "white");
    EXPECT_FLOAT_EQ(cfg.stops[1].location, 0.75f);
}

TEST(CliConfig, AllOptions)
{
    CliConfig cfg = parse_args({"--color", "black", "--color", "white", "--exponent", "0.5",
                                "--subdivisions", "48", "--start", "top", "--end", "0.2,0.9",
                                "--width", "100", "--height", "20", "--svg", "out.svg",
                                "--png", "out.png", "--log-file", "run.log"});
    EXPECT_FLOAT_EQ(cfg.params.exponent, 0.5f);
    EXPECT_EQ(cfg.params.subdivisions, 48);
    EXPECT_EQ(cfg.start_point, unit_point::top);
    EXPECT_FLOAT_EQ(cfg.end_point.x, 0.2f);
    EXPECT_FLOAT_EQ(cfg.end_point.y, 0.9f);
    EXPECT_EQ(cfg.width, 100u);
    EXPECT_EQ(cfg.height, 20u);
    EXPECT_EQ(cfg.svg_path, "out.svg");
    EXPECT_EQ(cfg.png_path, "out.png");
    EXPECT_EQ(cfg.log_file, "run.log");
}

TEST(CliConfig, CurveParametersValidatedLater)
{
    // Domain checks belong to subdivide(); parsing only checks syntax.
    CliConfig cfg = parse_args({"--color", "red", "--subdivisions", "0", "--exponent", "-1"});
    EXPECT_EQ(cfg.params.subdivisions, 0);
    EXPECT_FLOAT_EQ(cfg.params.exponent, -1.0f);
}

TEST(CliConfig, LogLevelFromEnvironment)
{
    EXPECT_EQ(parse_args({"--color", "red"}, "debug").log_level, LogLevel::Debug);
    EXPECT_EQ(parse_args({"--color", "red"}, "bogus").log_level, LogLevel::Warning);
    EXPECT_EQ(parse_args({"--color", "red", "--log-level", "error"}, "trace").log_level,
              LogLevel::Error);
}

TEST(CliConfig, HelpNeedsNoColors)
{
    EXPECT_TRUE(parse_args({"--help"}).show_help);
    EXPECT_TRUE(parse_args({"-h"}).show_help);
}

TEST(CliConfig, UsageErrors)
{
    using Args = std::vector<std::string>;
    EXPECT_THROW(parse_args(Args{}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--stop", "blue@1"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--frobnicate", "1"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--exponent", "two"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--width", "0"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--start", "left"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--log-level", "loud"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--stop", "red"}), UsageError);
    EXPECT_THROW(parse_args(Args{"--stop", "@0.5"}), UsageError);
}

TEST(CliConfig, OversizedSubdivisionsRejected)
{
    using Args = std::vector<std::string>;
    EXPECT_THROW(parse_args(Args{"--color", "red", "--color", "blue", "--subdivisions", "5000000"}),
                 UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--subdivisions", "99999999999999999999"}),
                 UsageError);
    EXPECT_THROW(parse_args(Args{"--color", "red", "--subdivisions", "-99999999999999999999"}),
                 UsageError);
    EXPECT_EQ(parse_args(Args{"--color", "red", "--subdivisions", "1048576"}).params.subdivisions,
              1 << 20);
}

TEST(CliConfig, NegativeSubdivisionsKeptForValidation)
{
    CliConfig cfg = parse_args({"--color", "red", "--subdivisions", "-7"});
    EXPECT_EQ(cfg.params.subdivisions, -7);
}

TEST(ParseUnitPoint, NamedAndNumeric)
{
    EXPECT_EQ(parse_unit_point("center"), unit_point::center);
    EXPECT_EQ(parse_unit_point("top-leading"), unit_point::top_leading);
    EXPECT_EQ(parse_unit_point("bottom_trailing"), unit_point::bottom_trailing);

    auto p = parse_unit_point("0.25,1");
    ASSERT_TRUE(p.has_value());
    EXPECT_FLOAT_EQ(p->x, 0.25f);
    EXPECT_FLOAT_EQ(p->y, 1.0f);

    EXPECT_FALSE(parse_unit_point("middle").has_value());
    EXPECT_FALSE(parse_unit_point("1,").has_value());
    EXPECT_FALSE(parse_unit_point("a,b").has_value());
}
