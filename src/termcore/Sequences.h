// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Color.h>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <vector>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define TERMCORE_ESC "\x1B"
#define TERMCORE_CSI "\x1B["
#define TERMCORE_SS3 "\x1BO"
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace termcore
{

/// DEC private modes toggled via `CSI ? Pm h` and `CSI ? Pm l`.
enum class DecMode : uint16_t
{
    ApplicationCursorKeys = 1,
    MouseX10 = 9,
    ShowCursor = 25,
    MouseNormalTracking = 1000,
    MouseButtonTracking = 1002,
    MouseAnyEventTracking = 1003,
    FocusEvents = 1004,
    MouseSgr = 1006,
    AlternateScreen = 1049,
    BracketedPaste = 2004,
};

/// Mutually exclusive mouse tracking protocols.
enum class MouseTracking : uint8_t
{
    None,
    /// Old X10 mouse protocol: press events only.
    X10,
    /// Press and release events with modifiers.
    Normal,
    /// Like Normal plus motion while a button is held.
    Button,
    /// Like Button plus motion without any button held.
    Any,
};

[[nodiscard]] constexpr DecMode toDecMode(MouseTracking tracking) noexcept
{
    switch (tracking)
    {
        case MouseTracking::X10: return DecMode::MouseX10;
        case MouseTracking::Normal: return DecMode::MouseNormalTracking;
        case MouseTracking::Button: return DecMode::MouseButtonTracking;
        case MouseTracking::Any: return DecMode::MouseAnyEventTracking;
        case MouseTracking::None: break;
    }
    return DecMode::MouseNormalTracking;
}

/// Stateless builders for exact escape sequences.
///
/// Every function returns the same bytes for the same input. Arguments that
/// cannot be encoded (zero or negative coordinates, palette indices or RGB
/// channels out of 0..255) throw std::invalid_argument.
namespace sequences
{
    // {{{ cursor
    [[nodiscard]] std::string cursorTo(int row, int column);
    [[nodiscard]] std::string cursorUp(int n);
    [[nodiscard]] std::string cursorDown(int n);
    [[nodiscard]] std::string cursorForward(int n);
    [[nodiscard]] std::string cursorBack(int n);
    [[nodiscard]] std::string cursorSave();
    [[nodiscard]] std::string cursorRestore();
    [[nodiscard]] std::string showCursor();
    [[nodiscard]] std::string hideCursor();
    // }}}

    // {{{ screen
    [[nodiscard]] std::string clearScreen();
    [[nodiscard]] std::string clearToEndOfScreen();
    [[nodiscard]] std::string clearToStartOfScreen();
    [[nodiscard]] std::string clearLine();
    [[nodiscard]] std::string clearToEndOfLine();
    [[nodiscard]] std::string clearToStartOfLine();
    [[nodiscard]] std::string setScrollRegion(int top, int bottom);
    [[nodiscard]] std::string scrollUp(int n);
    [[nodiscard]] std::string scrollDown(int n);
    // }}}

    // {{{ graphics rendition
    [[nodiscard]] std::string foreground(NamedColor color);
    [[nodiscard]] std::string background(NamedColor color);
    [[nodiscard]] std::string defaultForeground();
    [[nodiscard]] std::string defaultBackground();
    [[nodiscard]] std::string foreground256(int index);
    [[nodiscard]] std::string background256(int index);
    [[nodiscard]] std::string foregroundRGB(int red, int green, int blue);
    [[nodiscard]] std::string backgroundRGB(int red, int green, int blue);
    [[nodiscard]] std::string attributeOn(Attribute attribute);
    [[nodiscard]] std::string attributeOff(Attribute attribute);
    [[nodiscard]] std::string reset();

    /// Appends the SGR parameters selecting @p color as foreground or background.
    void appendColorParameters(std::vector<unsigned>& out, Color const& color, bool isForeground);

    /// Collects all SGR parameters for @p style: attributes first, then
    /// foreground, then background.
    [[nodiscard]] std::vector<unsigned> sgrParameters(Style const& style);

    /// Builds one `CSI ... m` sequence from @p parameters, or an empty string
    /// if there are none.
    [[nodiscard]] std::string sgr(std::vector<unsigned> const& parameters);

    /// Merges all of @p style into a single `CSI ... m` sequence.
    [[nodiscard]] std::string sgr(Style const& style);
    // }}}

    // {{{ modes
    [[nodiscard]] std::string setMode(DecMode mode, bool enable);
    [[nodiscard]] inline std::string enableMode(DecMode mode)
    {
        return setMode(mode, true);
    }
    [[nodiscard]] inline std::string disableMode(DecMode mode)
    {
        return setMode(mode, false);
    }
    // }}}
} // namespace sequences

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::MouseTracking>: fmt::formatter<std::string_view>
{
    auto format(termcore::MouseTracking value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::MouseTracking::None: name = "none"; break;
            case termcore::MouseTracking::X10: name = "x10"; break;
            case termcore::MouseTracking::Normal: name = "normal"; break;
            case termcore::MouseTracking::Button: name = "button"; break;
            case termcore::MouseTracking::Any: name = "any"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::DecMode>: fmt::formatter<unsigned>
{
    auto format(termcore::DecMode value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<unsigned>::format(static_cast<unsigned>(value), ctx);
    }
};
// }}}
