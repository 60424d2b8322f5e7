#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <expgrad/channels.hpp>
#include <string_view>

namespace expgrad
{

// ─── PackedRgbaAdapter ──────────────────────────────────────────────────────

std::optional<Color> PackedRgbaAdapter::to_channels(const uint32_t& color) const
{
    return Color::from_rgba8(color);
}

uint32_t PackedRgbaAdapter::from_channels(const Color& color) const
{
    return color.to_rgba8();
}

std::string PackedRgbaAdapter::describe(const uint32_t& color) const
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned>(color));
    return buf;
}

// ─── CssColorAdapter ────────────────────────────────────────────────────────

namespace
{

struct NamedColor
{
    std::string_view name;
    uint32_t rgba;
};

constexpr std::array<NamedColor, 19> NAMED_COLORS = {{
    {"black", 0x000000FF},
    {"white", 0xFFFFFFFF},
    {"red", 0xFF0000FF},
    {"green", 0x008000FF},
    {"lime", 0x00FF00FF},
    {"blue", 0x0000FFFF},
    {"yellow", 0xFFFF00FF},
    {"cyan", 0x00FFFFFF},
    {"aqua", 0x00FFFFFF},
    {"magenta", 0xFF00FFFF},
    {"fuchsia", 0xFF00FFFF},
    {"gray", 0x808080FF},
    {"grey", 0x808080FF},
    {"silver", 0xC0C0C0FF},
    {"orange", 0xFFA500FF},
    {"purple", 0x800080FF},
    {"indigo", 0x4B0082FF},
    {"pink", 0xFFC0CBFF},
    {"transparent", 0x00000000},
}};

std::string normalize(const std::string& s)
{
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); })
                    .base();
    std::string out;
    if (first >= last)
        return out;
    out.reserve(static_cast<std::size_t>(last - first));
    for (auto it = first; it != last; ++it)
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(*it)));
    return out;
}

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::optional<Color> parse_hex(std::string_view digits)
{
    const std::size_t n = digits.size();
    if (n != 3 && n != 4 && n != 6 && n != 8)
        return std::nullopt;

    std::array<int, 8> v{};
    for (std::size_t i = 0; i < n; ++i)
    {
        v[i] = hex_digit(digits[i]);
        if (v[i] < 0)
            return std::nullopt;
    }

    std::array<int, 4> bytes{0, 0, 0, 255};
    if (n <= 4)
    {
        // Short form: each digit is doubled (#f80 == #ff8800)
        for (std::size_t i = 0; i < n; ++i)
            bytes[i] = v[i] * 17;
    }
    else
    {
        for (std::size_t i = 0; i < n / 2; ++i)
            bytes[i] = v[2 * i] * 16 + v[2 * i + 1];
    }

    return Color(bytes[0] / 255.0f, bytes[1] / 255.0f, bytes[2] / 255.0f, bytes[3] / 255.0f);
}

// strtof also takes nan, inf and hex floats; CSS numbers are decimal only.
bool is_css_number(const char* begin, const char* end)
{
    bool digits = false;
    for (const char* c = begin; c != end; ++c)
    {
        if (std::isdigit(static_cast<unsigned char>(*c)))
            digits = true;
        else if (*c != '.' && *c != '+' && *c != '-' && *c != 'e' && !std::isspace(static_cast<unsigned char>(*c)))
            return false;
    }
    return digits;
}

// Parses "r,g,b" or "r,g,b,a": r/g/b in [0,255], a in [0,1].
std::optional<Color> parse_functional(std::string_view args, bool with_alpha)
{
    std::array<float, 4> values{0.0f, 0.0f, 0.0f, 1.0f};
    const std::size_t expected = with_alpha ? 4 : 3;

    std::string buffer(args);
    const char* p = buffer.c_str();
    for (std::size_t i = 0; i < expected; ++i)
    {
        char* end = nullptr;
        values[i] = std::strtof(p, &end);
        if (end == p || !is_css_number(p, end))
            return std::nullopt;
        p = end;
        while (std::isspace(static_cast<unsigned char>(*p)))
            ++p;
        if (i + 1 < expected)
        {
            if (*p != ',')
                return std::nullopt;
            ++p;
        }
    }
    if (*p != '\0')
        return std::nullopt;

    for (std::size_t i = 0; i < 3; ++i)
    {
        if (!(values[i] >= 0.0f && values[i] <= 255.0f))
            return std::nullopt;
        values[i] /= 255.0f;
    }
    if (!(values[3] >= 0.0f && values[3] <= 1.0f))
        return std::nullopt;

    return Color(values[0], values[1], values[2], values[3]);
}

std::optional<std::string_view> strip_call(std::string_view s, std::string_view fn)
{
    if (s.size() < fn.size() + 2 || s.substr(0, fn.size()) != fn)
        return std::nullopt;
    if (s[fn.size()] != '(' || s.back() != ')')
        return std::nullopt;
    return s.substr(fn.size() + 1, s.size() - fn.size() - 2);
}

}  // anonymous namespace

std::optional<Color> CssColorAdapter::to_channels(const std::string& color) const
{
    const std::string s = normalize(color);
    if (s.empty())
        return std::nullopt;

    if (s.front() == '#')
        return parse_hex(std::string_view(s).substr(1));

    if (auto args = strip_call(s, "rgba"))
        return parse_functional(*args, true);
    if (auto args = strip_call(s, "rgb"))
        return parse_functional(*args, false);

    for (const auto& named : NAMED_COLORS)
    {
        if (named.name == s)
            return Color::from_rgba8(named.rgba);
    }
    return std::nullopt;
}

std::string CssColorAdapter::from_channels(const Color& color) const
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "#%08x", static_cast<unsigned>(color.to_rgba8()));
    return buf;
}

}  // namespace expgrad
