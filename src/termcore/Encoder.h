// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Capabilities.h>
#include <termcore/Color.h>
#include <termcore/Sequences.h>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace termcore
{

enum class CharacterSet : uint8_t
{
    Unicode,
    Ascii,
};

/// Encodes styled output for one session.
///
/// Colors are emitted in the session's negotiated color mode: richer colors
/// are degraded to it, and nothing is ever emitted above it. The Encoder holds
/// no other state, so equal inputs always produce equal bytes.
class Encoder
{
  public:
    explicit Encoder(ColorMode colorMode, CharacterSet characterSet = CharacterSet::Unicode) noexcept:
        _colorMode { colorMode }, _characterSet { characterSet }
    {
    }

    /// Constructs an encoder matching the given capability snapshot.
    static Encoder forCapabilities(Capabilities const& caps) noexcept
    {
        return Encoder(caps.colorMode, caps.unicode ? CharacterSet::Unicode : CharacterSet::Ascii);
    }

    [[nodiscard]] ColorMode colorMode() const noexcept { return _colorMode; }
    [[nodiscard]] CharacterSet characterSet() const noexcept { return _characterSet; }

    /// @returns @p color as it will be emitted, or std::nullopt if it is dropped.
    [[nodiscard]] std::optional<Color> effectiveColor(Color const& color) const noexcept;

    [[nodiscard]] std::string foreground(Color const& color) const;
    [[nodiscard]] std::string background(Color const& color) const;

    /// Merges @p style into one SGR sequence, after degrading its colors.
    [[nodiscard]] std::string sgr(Style const& style) const;

    /// @returns @p text with box-drawing glyphs replaced when the character set is ASCII.
    [[nodiscard]] std::string text(std::string_view text) const;

    /// @returns @p text wrapped in @p style followed by an SGR reset, or the
    ///          plain text if the style encodes to nothing.
    [[nodiscard]] std::string styledText(Style const& style, std::string_view text) const;

  private:
    [[nodiscard]] Style degraded(Style const& style) const noexcept;

    ColorMode _colorMode;
    CharacterSet _characterSet;
};

} // namespace termcore

template <>
struct fmt::formatter<termcore::CharacterSet>: fmt::formatter<std::string_view>
{
    auto format(termcore::CharacterSet value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string_view>::format(value == termcore::CharacterSet::Unicode ? "unicode" : "ascii",
                                                   ctx);
    }
};
