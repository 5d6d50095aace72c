// SPDX-License-Identifier: Apache-2.0
#include <termcore/Sequences.h>

#include <fmt/ranges.h>

#include <stdexcept>

using std::string;
using std::string_view;
using std::vector;

namespace termcore::sequences
{

namespace
{
    int requirePositive(int value, string_view what)
    {
        if (value < 1)
            throw std::invalid_argument { fmt::format("{} must be at least 1, got {}.", what, value) };
        return value;
    }

    unsigned requireByte(int value, string_view what)
    {
        if (value < 0 || value > 255)
            throw std::invalid_argument { fmt::format("{} must be within 0..255, got {}.", what, value) };
        return static_cast<unsigned>(value);
    }

    string relativeMove(int n, char direction)
    {
        return fmt::format(TERMCORE_CSI "{}{}", requirePositive(n, "Cursor movement count"), direction);
    }
} // namespace

// {{{ cursor
string cursorTo(int row, int column)
{
    return fmt::format(
        TERMCORE_CSI "{};{}H", requirePositive(row, "Cursor row"), requirePositive(column, "Cursor column"));
}

string cursorUp(int n)
{
    return relativeMove(n, 'A');
}

string cursorDown(int n)
{
    return relativeMove(n, 'B');
}

string cursorForward(int n)
{
    return relativeMove(n, 'C');
}

string cursorBack(int n)
{
    return relativeMove(n, 'D');
}

string cursorSave()
{
    return TERMCORE_CSI "s";
}

string cursorRestore()
{
    return TERMCORE_CSI "u";
}

string showCursor()
{
    return enableMode(DecMode::ShowCursor);
}

string hideCursor()
{
    return disableMode(DecMode::ShowCursor);
}
// }}}

// {{{ screen
string clearScreen()
{
    return TERMCORE_CSI "2J";
}

string clearToEndOfScreen()
{
    return TERMCORE_CSI "0J";
}

string clearToStartOfScreen()
{
    return TERMCORE_CSI "1J";
}

string clearLine()
{
    return TERMCORE_CSI "2K";
}

string clearToEndOfLine()
{
    return TERMCORE_CSI "K";
}

string clearToStartOfLine()
{
    return TERMCORE_CSI "1K";
}

string setScrollRegion(int top, int bottom)
{
    requirePositive(top, "Scroll region top");
    requirePositive(bottom, "Scroll region bottom");
    if (top > bottom)
        throw std::invalid_argument { fmt::format(
            "Scroll region top ({}) must not be below its bottom ({}).", top, bottom) };
    return fmt::format(TERMCORE_CSI "{};{}r", top, bottom);
}

string scrollUp(int n)
{
    return fmt::format(TERMCORE_CSI "{}S", requirePositive(n, "Scroll count"));
}

string scrollDown(int n)
{
    return fmt::format(TERMCORE_CSI "{}T", requirePositive(n, "Scroll count"));
}
// }}}

// {{{ graphics rendition
void appendColorParameters(vector<unsigned>& out, Color const& color, bool isForeground)
{
    if (std::holds_alternative<DefaultColor>(color))
    {
        out.push_back(isForeground ? 39 : 49);
    }
    else if (auto const* named = std::get_if<NamedColor>(&color))
    {
        auto const value = static_cast<unsigned>(*named);
        if (value < 8)
            out.push_back((isForeground ? 30 : 40) + value);
        else
            out.push_back((isForeground ? 90 : 100) + (value - 8));
    }
    else if (auto const* indexed = std::get_if<IndexedColor>(&color))
    {
        out.insert(out.end(), { isForeground ? 38u : 48u, 5u, static_cast<unsigned>(indexed->index) });
    }
    else if (auto const* rgb = std::get_if<RGBColor>(&color))
    {
        // clang-format off
        out.insert(out.end(), { isForeground ? 38u : 48u, 2u,
                                static_cast<unsigned>(rgb->red),
                                static_cast<unsigned>(rgb->green),
                                static_cast<unsigned>(rgb->blue) });
        // clang-format on
    }
}

string foreground(NamedColor color)
{
    return sgr(Style { .foreground = color });
}

string background(NamedColor color)
{
    return sgr(Style { .background = color });
}

string defaultForeground()
{
    return TERMCORE_CSI "39m";
}

string defaultBackground()
{
    return TERMCORE_CSI "49m";
}

string foreground256(int index)
{
    return fmt::format(TERMCORE_CSI "38;5;{}m", requireByte(index, "Palette index"));
}

string background256(int index)
{
    return fmt::format(TERMCORE_CSI "48;5;{}m", requireByte(index, "Palette index"));
}

string foregroundRGB(int red, int green, int blue)
{
    return fmt::format(TERMCORE_CSI "38;2;{};{};{}m",
                       requireByte(red, "Red channel"),
                       requireByte(green, "Green channel"),
                       requireByte(blue, "Blue channel"));
}

string backgroundRGB(int red, int green, int blue)
{
    return fmt::format(TERMCORE_CSI "48;2;{};{};{}m",
                       requireByte(red, "Red channel"),
                       requireByte(green, "Green channel"),
                       requireByte(blue, "Blue channel"));
}

string attributeOn(Attribute attribute)
{
    return fmt::format(TERMCORE_CSI "{}m", sgrCode(attribute));
}

string attributeOff(Attribute attribute)
{
    return fmt::format(TERMCORE_CSI "{}m", sgrOffCode(attribute));
}

string reset()
{
    return TERMCORE_CSI "0m";
}

vector<unsigned> sgrParameters(Style const& style)
{
    auto parameters = vector<unsigned> {};

    for (auto i = 0u; i < 8; ++i)
        if (auto const attribute = static_cast<Attribute>(1u << i); style.attributes.test(attribute))
            parameters.push_back(sgrCode(attribute));

    if (style.foreground)
        appendColorParameters(parameters, *style.foreground, true);

    if (style.background)
        appendColorParameters(parameters, *style.background, false);

    return parameters;
}

string sgr(vector<unsigned> const& parameters)
{
    if (parameters.empty())
        return {};
    return fmt::format(TERMCORE_CSI "{}m", fmt::join(parameters, ";"));
}

string sgr(Style const& style)
{
    return sgr(sgrParameters(style));
}
// }}}

string setMode(DecMode mode, bool enable)
{
    return fmt::format(TERMCORE_CSI "?{}{}", static_cast<unsigned>(mode), enable ? 'h' : 'l');
}

} // namespace termcore::sequences
