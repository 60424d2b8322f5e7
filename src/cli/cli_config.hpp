#pragma once

#include <cstdint>
#include <expgrad/channels.hpp>
#include <expgrad/exponential_gradient.hpp>
#include <expgrad/gradient.hpp>
#include <expgrad/logger.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace expgrad::cli
{

// Malformed command line. Reported with usage text, exit status 2.
class UsageError : public std::invalid_argument
{
   public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

struct CliConfig
{
    // Colors as written on the command line; resolved by CssColorAdapter.
    std::vector<NativeStop<std::string>> stops;

    SubdivisionParams params;
    UnitPoint start_point = unit_point::leading;
    UnitPoint end_point = unit_point::trailing;

    uint32_t width = 512;
    uint32_t height = 64;

    std::string svg_path;
    std::string png_path;

    LogLevel log_level = LogLevel::Warning;
    std::string log_file;

    bool show_help = false;
};

// Parses argv[1..]. `env_log_level` is the value of EXPGRAD_LOG_LEVEL (may be
// null); an explicit --log-level overrides it. Throws UsageError.
CliConfig parse_args(const std::vector<std::string>& args, const char* env_log_level = nullptr);

// "leading", "top-trailing", ... or "x,y".
std::optional<UnitPoint> parse_unit_point(const std::string& text);

std::string usage();

}  // namespace expgrad::cli
