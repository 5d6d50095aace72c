// SPDX-License-Identifier: Apache-2.0
#include <termcore/Encoder.h>
#include <termcore/Fallbacks.h>

using std::optional;
using std::string;
using std::string_view;

namespace termcore
{

optional<Color> Encoder::effectiveColor(Color const& color) const noexcept
{
    return fallbacks::degrade(color, _colorMode);
}

Style Encoder::degraded(Style const& style) const noexcept
{
    auto result = Style { .attributes = style.attributes };
    if (style.foreground)
        result.foreground = effectiveColor(*style.foreground);
    if (style.background)
        result.background = effectiveColor(*style.background);
    return result;
}

string Encoder::foreground(Color const& color) const
{
    return sgr(Style { .foreground = color });
}

string Encoder::background(Color const& color) const
{
    return sgr(Style { .background = color });
}

string Encoder::sgr(Style const& style) const
{
    return sequences::sgr(degraded(style));
}

string Encoder::text(string_view text) const
{
    if (_characterSet == CharacterSet::Ascii)
        return fallbacks::toAscii(text);
    return string(text);
}

string Encoder::styledText(Style const& style, string_view text) const
{
    auto const prefix = sgr(style);
    if (prefix.empty())
        return this->text(text);
    return prefix + this->text(text) + sequences::reset();
}

} // namespace termcore
