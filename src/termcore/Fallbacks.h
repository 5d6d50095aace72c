// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Capabilities.h>
#include <termcore/Color.h>

#include <optional>
#include <string>
#include <string_view>

namespace termcore::fallbacks
{

/// Maps an RGB color to the nearest entry of the 256-color palette.
///
/// Near-gray colors (channel spread of at most 8) map onto the grayscale
/// ramp 232..255, all others onto the 6x6x6 color cube 16..231.
[[nodiscard]] uint8_t rgbTo256(RGBColor color) noexcept;

/// Maps an RGB color to the nearest of the 16 ANSI colors.
[[nodiscard]] NamedColor rgbTo16(RGBColor color) noexcept;

/// Maps a 256-color palette index to the nearest of the 16 ANSI colors.
[[nodiscard]] NamedColor color256To16(uint8_t index) noexcept;

/// Degrades @p color so that it is representable in @p mode.
///
/// Colors are only ever lowered to the target tier, never raised.
/// In monochrome mode every color, except the default, yields std::nullopt.
[[nodiscard]] std::optional<Color> degrade(Color const& color, ColorMode mode) noexcept;

/// @returns the ASCII replacement for a single Unicode glyph, or std::nullopt
///          if there is none.
[[nodiscard]] std::optional<std::string_view> asciiFallback(std::string_view glyph) noexcept;

/// Replaces all known box-drawing and symbol glyphs in @p text by ASCII.
[[nodiscard]] std::string toAscii(std::string_view text);

} // namespace termcore::fallbacks
