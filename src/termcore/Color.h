// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/flags.h>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace termcore
{

/// The 16 ANSI colors. Values 8..15 are the aixterm bright variants.
enum class NamedColor : uint8_t
{
    Black = 0,
    Red = 1,
    Green = 2,
    Yellow = 3,
    Blue = 4,
    Magenta = 5,
    Cyan = 6,
    White = 7,
    BrightBlack = 8,
    BrightRed = 9,
    BrightGreen = 10,
    BrightYellow = 11,
    BrightBlue = 12,
    BrightMagenta = 13,
    BrightCyan = 14,
    BrightWhite = 15,
};

struct DefaultColor
{
    constexpr bool operator==(DefaultColor const&) const noexcept = default;
};

/// An index into the 256-color palette.
struct IndexedColor
{
    uint8_t index = 0;

    constexpr bool operator==(IndexedColor const&) const noexcept = default;
};

struct RGBColor
{
    uint8_t red { 0 };
    uint8_t green { 0 };
    uint8_t blue { 0 };

    constexpr RGBColor() = default;
    constexpr RGBColor(uint8_t r, uint8_t g, uint8_t b): red { r }, green { g }, blue { b } {}
    constexpr explicit RGBColor(uint32_t rgb):
        red { static_cast<uint8_t>((rgb >> 16) & 0xFF) },
        green { static_cast<uint8_t>((rgb >> 8) & 0xFF) },
        blue { static_cast<uint8_t>(rgb & 0xFF) }
    {
    }

    [[nodiscard]] constexpr uint32_t value() const noexcept
    {
        return static_cast<uint32_t>((red << 16) | (green << 8) | blue);
    }

    constexpr auto operator<=>(RGBColor const&) const noexcept = default;
};

constexpr RGBColor operator"" _rgb(unsigned long long value)
{
    return RGBColor { static_cast<uint32_t>(value) };
}

using Color = std::variant<DefaultColor, NamedColor, IndexedColor, RGBColor>;

enum class Attribute : uint8_t
{
    Bold = 0x01,
    Dim = 0x02,
    Italic = 0x04,
    Underline = 0x08,
    Blink = 0x10,
    Reverse = 0x20,
    Hidden = 0x40,
    Strikethrough = 0x80,
};

using Attributes = crispy::flags<Attribute>;

/// SGR code that enables @p attribute.
[[nodiscard]] constexpr unsigned sgrCode(Attribute attribute) noexcept
{
    switch (attribute)
    {
        case Attribute::Bold: return 1;
        case Attribute::Dim: return 2;
        case Attribute::Italic: return 3;
        case Attribute::Underline: return 4;
        case Attribute::Blink: return 5;
        case Attribute::Reverse: return 7;
        case Attribute::Hidden: return 8;
        case Attribute::Strikethrough: return 9;
    }
    return 0;
}

/// SGR code that disables @p attribute. Bold and dim share code 22.
[[nodiscard]] constexpr unsigned sgrOffCode(Attribute attribute) noexcept
{
    switch (attribute)
    {
        case Attribute::Bold: return 22;
        case Attribute::Dim: return 22;
        case Attribute::Italic: return 23;
        case Attribute::Underline: return 24;
        case Attribute::Blink: return 25;
        case Attribute::Reverse: return 27;
        case Attribute::Hidden: return 28;
        case Attribute::Strikethrough: return 29;
    }
    return 0;
}

/// Desired graphics rendition: colors plus attributes.
struct Style
{
    std::optional<Color> foreground;
    std::optional<Color> background;
    Attributes attributes;

    [[nodiscard]] bool empty() const noexcept { return !foreground && !background && attributes.none(); }

    bool operator==(Style const&) const = default;
};

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::Attribute>: fmt::formatter<std::string_view>
{
    auto format(termcore::Attribute value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::Attribute::Bold: name = "bold"; break;
            case termcore::Attribute::Dim: name = "dim"; break;
            case termcore::Attribute::Italic: name = "italic"; break;
            case termcore::Attribute::Underline: name = "underline"; break;
            case termcore::Attribute::Blink: name = "blink"; break;
            case termcore::Attribute::Reverse: name = "reverse"; break;
            case termcore::Attribute::Hidden: name = "hidden"; break;
            case termcore::Attribute::Strikethrough: name = "strikethrough"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::RGBColor>: fmt::formatter<std::string>
{
    auto format(termcore::RGBColor value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("#{:06X}", value.value()), ctx);
    }
};

template <>
struct fmt::formatter<termcore::Color>: fmt::formatter<std::string>
{
    auto format(termcore::Color const& value, format_context& ctx) const -> format_context::iterator
    {
        std::string text;
        if (std::holds_alternative<termcore::DefaultColor>(value))
            text = "default";
        else if (auto const* named = std::get_if<termcore::NamedColor>(&value))
            text = fmt::format("ansi:{}", static_cast<unsigned>(*named));
        else if (auto const* indexed = std::get_if<termcore::IndexedColor>(&value))
            text = fmt::format("index:{}", indexed->index);
        else if (auto const* rgb = std::get_if<termcore::RGBColor>(&value))
            text = fmt::format("{}", *rgb);
        return formatter<std::string>::format(text, ctx);
    }
};
// }}}
