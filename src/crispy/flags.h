// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>

namespace crispy
{

// Type-safe set of bit flags over an enum class whose enumerators are single bits.
//
//     enum class Modifier : uint8_t { Shift = 1, Alt = 2, Control = 4 };
//     using Modifiers = crispy::flags<Modifier>;
//
//     auto m = Modifiers { Modifier::Shift, Modifier::Control };
//     if (m.test(Modifier::Shift)) { ... }
//
template <typename flag_type>
class flags
{
  public:
    using value_type = std::underlying_type_t<flag_type>;

    constexpr flags() noexcept = default;
    constexpr flags(flag_type flag) noexcept: _value { static_cast<value_type>(flag) } {}
    constexpr flags(std::initializer_list<flag_type> bits) noexcept
    {
        for (auto const bit: bits)
            enable(bit);
    }

    // NOLINTNEXTLINE(readability-identifier-naming)
    [[nodiscard]] static constexpr flags from_value(value_type value) noexcept
    {
        auto result = flags {};
        result._value = value;
        return result;
    }

    constexpr void enable(flag_type flag) noexcept { _value |= static_cast<value_type>(flag); }
    constexpr void disable(flag_type flag) noexcept { _value &= static_cast<value_type>(~static_cast<value_type>(flag)); }

    // Tests whether all flags of @p other are set.
    [[nodiscard]] constexpr bool contains(flags other) const noexcept
    {
        return (_value & other._value) == other._value;
    }

    [[nodiscard]] constexpr bool test(flag_type flag) const noexcept { return contains(flag); }

    [[nodiscard]] constexpr bool none() const noexcept { return _value == 0; }
    [[nodiscard]] constexpr bool any() const noexcept { return _value != 0; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return _value != 0; }

    [[nodiscard]] constexpr value_type value() const noexcept { return _value; }

    [[nodiscard]] constexpr flags operator|(flags other) const noexcept
    {
        return from_value(static_cast<value_type>(_value | other._value));
    }

    constexpr flags& operator|=(flags other) noexcept
    {
        _value |= other._value;
        return *this;
    }

    [[nodiscard]] constexpr bool operator==(flags const& other) const noexcept = default;

    // Folds @p f over all set flags, lowest bit first.
    [[nodiscard]] auto reduce(auto init, auto f) const
    {
        auto result = std::move(init);
        for (auto i = 0u; i < sizeof(flag_type) * 8; ++i)
            if (auto const flag = static_cast<flag_type>(1u << i); test(flag))
                result = f(std::move(result), flag);
        return result;
    }

  private:
    value_type _value = 0;
};

} // namespace crispy

// Formats as the '|'-joined names of the set flags, e.g. "Shift|Control".
// Flags the enum's own formatter renders empty are skipped.
template <typename Enum>
struct fmt::formatter<crispy::flags<Enum>>: public fmt::formatter<std::string>
{
    auto format(crispy::flags<Enum> const& flags, format_context& ctx) const -> format_context::iterator
    {
        auto const text = flags.reduce(std::string {}, [](std::string acc, Enum flag) {
            auto const element = fmt::format("{}", flag);
            if (element.empty())
                return acc;
            if (!acc.empty())
                acc += '|';
            return acc + element;
        });
        return formatter<std::string>::format(text, ctx);
    }
};
