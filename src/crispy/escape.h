// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace crispy
{

/// Renders a single byte printable, e.g. ESC as "\e" and 0x03 as "\x03".
inline std::string escape(uint8_t ch)
{
    switch (ch)
    {
        case '\\': return "\\\\";
        case 0x1B: return "\\e";
        case '\t': return "\\t";
        case '\r': return "\\r";
        case '\n': return "\\n";
        case '"': return "\\\"";
        default:
            if (0x20 <= ch && ch < 0x7F)
                return std::string(1, static_cast<char>(ch));
            return fmt::format("\\x{:02x}", static_cast<unsigned>(ch));
    }
}

template <typename T>
inline std::string escape(T begin, T end)
{
    static_assert(sizeof(*std::declval<T>()) == 1, "should be only 1 byte, such as: char, uint8_t, ...");
    auto result = std::string {};
    for (T cur = begin; cur != end; ++cur)
        result += escape(static_cast<uint8_t>(*cur));
    return result;
}

inline std::string escape(std::string_view s)
{
    return escape(s.begin(), s.end());
}

} // namespace crispy
