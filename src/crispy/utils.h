// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace crispy
{

template <typename T, typename Callback>
constexpr inline bool split(std::basic_string_view<T> text, T delimiter, Callback const& callback)
{
    size_t a = 0;
    size_t b = 0;
    while ((b = text.find(delimiter, a)) != std::basic_string_view<T>::npos)
    {
        if (!callback(text.substr(a, b - a)))
            return false;
        a = b + 1;
    }

    if (a < text.size())
        return callback(text.substr(a));

    return true;
}

template <typename T>
inline auto split(std::basic_string_view<T> text, T delimiter) -> std::vector<std::basic_string_view<T>>
{
    std::vector<std::basic_string_view<T>> output {};
    split(text, delimiter, [&](auto value) {
        output.emplace_back(value);
        return true;
    });
    return output;
}

inline auto split(std::string const& text, char delimiter) -> std::vector<std::string_view>
{
    return split(std::string_view(text), delimiter);
}

inline std::string toLower(std::string_view value)
{
    std::string result;
    result.reserve(value.size());
    std::transform(value.begin(), value.end(), std::back_inserter(result), [](char ch) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });
    return result;
}

/// Case-insensitive (ASCII only) substring search.
inline bool containsIgnoreCase(std::string_view text, std::string_view pattern)
{
    return toLower(text).find(toLower(pattern)) != std::string::npos;
}

constexpr std::string_view trim(std::string_view value) noexcept
{
    auto const isSpace = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!value.empty() && isSpace(value.front()))
        value.remove_prefix(1);
    while (!value.empty() && isSpace(value.back()))
        value.remove_suffix(1);
    return value;
}

/// Parses the whole of @p text as a decimal integer.
///
/// @returns std::nullopt on empty input, trailing garbage or overflow.
template <typename T = unsigned>
std::optional<T> to_integer(std::string_view text) noexcept
{
    if (text.empty())
        return std::nullopt;

    T value {};
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc {} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

} // namespace crispy
