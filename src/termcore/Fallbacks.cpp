// SPDX-License-Identifier: Apache-2.0
#include <termcore/Fallbacks.h>

#include <libunicode/utf8.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>
#include <variant>

using std::optional;
using std::string;
using std::string_view;

namespace termcore::fallbacks
{

namespace
{
    // Reference RGB values of the 16 ANSI colors.
    constexpr auto AnsiPalette = std::array<RGBColor, 16> {
        RGBColor { 0, 0, 0 },       RGBColor { 128, 0, 0 },   RGBColor { 0, 128, 0 },
        RGBColor { 128, 128, 0 },   RGBColor { 0, 0, 128 },   RGBColor { 128, 0, 128 },
        RGBColor { 0, 128, 128 },   RGBColor { 192, 192, 192 }, RGBColor { 128, 128, 128 },
        RGBColor { 255, 0, 0 },     RGBColor { 0, 255, 0 },   RGBColor { 255, 255, 0 },
        RGBColor { 0, 0, 255 },     RGBColor { 255, 0, 255 }, RGBColor { 0, 255, 255 },
        RGBColor { 255, 255, 255 },
    };

    // clang-format off
    constexpr auto GlyphFallbacks = std::array<std::pair<string_view, string_view>, 48> {{
        { "─", "-" }, { "│", "|" }, { "┌", "+" }, { "┐", "+" }, { "└", "+" }, { "┘", "+" },
        { "├", "+" }, { "┤", "+" }, { "┬", "+" }, { "┴", "+" }, { "┼", "+" },
        { "═", "=" }, { "║", "|" }, { "╔", "+" }, { "╗", "+" }, { "╚", "+" }, { "╝", "+" },
        { "╠", "+" }, { "╣", "+" }, { "╦", "+" }, { "╩", "+" }, { "╬", "+" },
        { "╭", "+" }, { "╮", "+" }, { "╯", "+" }, { "╰", "+" },
        { "█", "#" }, { "▀", "^" }, { "▄", "_" }, { "▌", "|" }, { "▐", "|" },
        { "░", "." }, { "▒", ":" }, { "▓", "#" },
        { "←", "<" }, { "→", ">" }, { "↑", "^" }, { "↓", "v" },
        { "•", "*" }, { "·", "." }, { "…", "..." }, { "×", "x" }, { "÷", "/" },
        { "≠", "!=" }, { "≤", "<=" }, { "≥", ">=" }, { "✓", "[x]" }, { "✗", "[ ]" },
    }};
    // clang-format on

    bool isGrayscale(RGBColor c) noexcept
    {
        auto const maxValue = std::max({ c.red, c.green, c.blue });
        auto const minValue = std::min({ c.red, c.green, c.blue });
        return maxValue - minValue <= 8;
    }

    int cubeIndex(uint8_t value) noexcept
    {
        if (value < 48)
            return 0;
        if (value < 115)
            return 1;
        if (value < 155)
            return 2;
        if (value < 195)
            return 3;
        if (value < 235)
            return 4;
        return 5;
    }

    int squaredDistance(RGBColor a, RGBColor b) noexcept
    {
        auto const dr = int(a.red) - int(b.red);
        auto const dg = int(a.green) - int(b.green);
        auto const db = int(a.blue) - int(b.blue);
        return dr * dr + dg * dg + db * db;
    }

} // namespace

uint8_t rgbTo256(RGBColor color) noexcept
{
    if (isGrayscale(color))
    {
        auto const average = (double(color.red) + double(color.green) + double(color.blue)) / 3.0;
        auto const grayIndex = static_cast<int>(std::round(average / 255.0 * 23.0));
        return static_cast<uint8_t>(232 + std::min(23, grayIndex));
    }

    return static_cast<uint8_t>(16 + 36 * cubeIndex(color.red) + 6 * cubeIndex(color.green)
                                + cubeIndex(color.blue));
}

NamedColor rgbTo16(RGBColor color) noexcept
{
    auto bestIndex = size_t { 0 };
    auto bestDistance = std::numeric_limits<int>::max();
    for (size_t i = 0; i < AnsiPalette.size(); ++i)
    {
        if (auto const d = squaredDistance(color, AnsiPalette[i]); d < bestDistance)
        {
            bestDistance = d;
            bestIndex = i;
        }
    }
    return static_cast<NamedColor>(bestIndex);
}

NamedColor color256To16(uint8_t index) noexcept
{
    if (index < 16)
        return static_cast<NamedColor>(index);

    if (index < 232)
    {
        auto const cube = index - 16;
        auto const r = static_cast<uint8_t>(((cube / 36) % 6) * 51);
        auto const g = static_cast<uint8_t>(((cube / 6) % 6) * 51);
        auto const b = static_cast<uint8_t>((cube % 6) * 51);
        return rgbTo16(RGBColor { r, g, b });
    }

    auto const gray = static_cast<uint8_t>((index - 232) * 10 + 8);
    return rgbTo16(RGBColor { gray, gray, gray });
}

optional<Color> degrade(Color const& color, ColorMode mode) noexcept
{
    if (std::holds_alternative<DefaultColor>(color))
        return color;

    switch (mode)
    {
        case ColorMode::TrueColor: return color;
        case ColorMode::Indexed256:
            if (auto const* rgb = std::get_if<RGBColor>(&color))
                return IndexedColor { rgbTo256(*rgb) };
            return color;
        case ColorMode::Indexed16:
            if (auto const* rgb = std::get_if<RGBColor>(&color))
                return rgbTo16(*rgb);
            if (auto const* indexed = std::get_if<IndexedColor>(&color))
                return color256To16(indexed->index);
            return color;
        case ColorMode::Monochrome: return std::nullopt;
    }
    return std::nullopt;
}

optional<string_view> asciiFallback(string_view glyph) noexcept
{
    for (auto const& [unicode, ascii]: GlyphFallbacks)
        if (unicode == glyph)
            return ascii;
    return std::nullopt;
}

string toAscii(string_view text)
{
    auto result = string {};
    result.reserve(text.size());

    auto state = unicode::utf8_decoder_state {};
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        auto const r = unicode::from_utf8(state, static_cast<uint8_t>(text[i]));
        if (std::holds_alternative<unicode::Incomplete>(r))
            continue;

        auto const glyph = text.substr(start, i + 1 - start);
        if (auto const ascii = asciiFallback(glyph); ascii)
            result += *ascii;
        else
            result += glyph;
        state = {};
        start = i + 1;
    }

    // A truncated trailing sequence is kept as is.
    result += text.substr(start);
    return result;
}

} // namespace termcore::fallbacks
