// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/escape.h>
#include <crispy/flags.h>

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <variant>

namespace termcore
{

// {{{ Modifier
enum class Modifier : uint8_t
{
    // NB: These values match the bits of (parameter - 1) in CSI modifier
    // parameters, e.g. `CSI 1 ; 5 A` for Control+Up.
    Shift = 1,
    Alt = 2,
    Control = 4,
    Meta = 8,
};

using Modifiers = crispy::flags<Modifier>;

/// Decodes the modifier parameter of a CSI key sequence (1 means none).
[[nodiscard]] constexpr Modifiers decodeModifierParameter(unsigned parameter) noexcept
{
    if (parameter <= 1)
        return Modifiers {};
    return Modifiers::from_value(static_cast<uint8_t>((parameter - 1) & 0x0F));
}
// }}}

// {{{ KeyEvent
enum class Key : uint8_t
{
    /// A text key; the text is stored in KeyEvent::text.
    Character,
    /// A byte or sequence without a known key meaning.
    Unknown,

    Escape,
    Enter,
    Tab,
    BackTab,
    Backspace,

    // cursor keys
    UpArrow,
    DownArrow,
    LeftArrow,
    RightArrow,

    // 6-key editing pad
    Insert,
    Delete,
    Home,
    End,
    PageUp,
    PageDown,

    // function keys
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,
};

struct KeyEvent
{
    Key key = Key::Unknown;
    /// UTF-8 text for Key::Character, empty otherwise.
    std::string text;
    Modifiers modifiers;

    bool operator==(KeyEvent const&) const = default;
};
// }}}

// {{{ MouseEvent
enum class MouseAction : uint8_t
{
    Press,
    Release,
    Drag,
    Move,
    Wheel,
};

enum class MouseButton : uint8_t
{
    None,
    Left,
    Middle,
    Right,
    WheelUp,
    WheelDown,
};

struct MouseEvent
{
    MouseAction action = MouseAction::Press;
    MouseButton button = MouseButton::None;
    /// 1-indexed column.
    unsigned x = 1;
    /// 1-indexed row.
    unsigned y = 1;
    Modifiers modifiers;

    bool operator==(MouseEvent const&) const = default;
};
// }}}

struct PasteEvent
{
    std::string content;

    bool operator==(PasteEvent const&) const = default;
};

struct FocusEvent
{
    bool gained = true;

    bool operator==(FocusEvent const&) const = default;
};

struct ResizeEvent
{
    unsigned rows = 0;
    unsigned columns = 0;

    bool operator==(ResizeEvent const&) const = default;
};

using Event = std::variant<KeyEvent, MouseEvent, PasteEvent, FocusEvent, ResizeEvent>;

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::Modifier>: fmt::formatter<std::string_view>
{
    auto format(termcore::Modifier value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::Modifier::Shift: name = "Shift"; break;
            case termcore::Modifier::Alt: name = "Alt"; break;
            case termcore::Modifier::Control: name = "Control"; break;
            case termcore::Modifier::Meta: name = "Meta"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::Key>: fmt::formatter<std::string_view>
{
    auto format(termcore::Key value, format_context& ctx) const -> format_context::iterator
    {
        using termcore::Key;
        std::string_view name;
        switch (value)
        {
            case Key::Character: name = "Character"; break;
            case Key::Unknown: name = "Unknown"; break;
            case Key::Escape: name = "Escape"; break;
            case Key::Enter: name = "Enter"; break;
            case Key::Tab: name = "Tab"; break;
            case Key::BackTab: name = "BackTab"; break;
            case Key::Backspace: name = "Backspace"; break;
            case Key::UpArrow: name = "UpArrow"; break;
            case Key::DownArrow: name = "DownArrow"; break;
            case Key::LeftArrow: name = "LeftArrow"; break;
            case Key::RightArrow: name = "RightArrow"; break;
            case Key::Insert: name = "Insert"; break;
            case Key::Delete: name = "Delete"; break;
            case Key::Home: name = "Home"; break;
            case Key::End: name = "End"; break;
            case Key::PageUp: name = "PageUp"; break;
            case Key::PageDown: name = "PageDown"; break;
            case Key::F1: name = "F1"; break;
            case Key::F2: name = "F2"; break;
            case Key::F3: name = "F3"; break;
            case Key::F4: name = "F4"; break;
            case Key::F5: name = "F5"; break;
            case Key::F6: name = "F6"; break;
            case Key::F7: name = "F7"; break;
            case Key::F8: name = "F8"; break;
            case Key::F9: name = "F9"; break;
            case Key::F10: name = "F10"; break;
            case Key::F11: name = "F11"; break;
            case Key::F12: name = "F12"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::MouseAction>: fmt::formatter<std::string_view>
{
    auto format(termcore::MouseAction value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::MouseAction::Press: name = "Press"; break;
            case termcore::MouseAction::Release: name = "Release"; break;
            case termcore::MouseAction::Drag: name = "Drag"; break;
            case termcore::MouseAction::Move: name = "Move"; break;
            case termcore::MouseAction::Wheel: name = "Wheel"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::MouseButton>: fmt::formatter<std::string_view>
{
    auto format(termcore::MouseButton value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::MouseButton::None: name = "None"; break;
            case termcore::MouseButton::Left: name = "Left"; break;
            case termcore::MouseButton::Middle: name = "Middle"; break;
            case termcore::MouseButton::Right: name = "Right"; break;
            case termcore::MouseButton::WheelUp: name = "WheelUp"; break;
            case termcore::MouseButton::WheelDown: name = "WheelDown"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::Event>: fmt::formatter<std::string>
{
    auto format(termcore::Event const& event, format_context& ctx) const -> format_context::iterator
    {
        std::string text;
        if (auto const* key = std::get_if<termcore::KeyEvent>(&event))
        {
            if (key->key == termcore::Key::Character)
                text = fmt::format("Key({}, \"{}\", {})", key->key, crispy::escape(key->text), key->modifiers);
            else
                text = fmt::format("Key({}, {})", key->key, key->modifiers);
        }
        else if (auto const* mouse = std::get_if<termcore::MouseEvent>(&event))
            text = fmt::format("Mouse({}, {}, {}:{}, {})",
                               mouse->action,
                               mouse->button,
                               mouse->x,
                               mouse->y,
                               mouse->modifiers);
        else if (auto const* paste = std::get_if<termcore::PasteEvent>(&event))
            text = fmt::format("Paste(\"{}\")", crispy::escape(paste->content));
        else if (auto const* focus = std::get_if<termcore::FocusEvent>(&event))
            text = fmt::format("Focus({})", focus->gained ? "gained" : "lost");
        else if (auto const* resize = std::get_if<termcore::ResizeEvent>(&event))
            text = fmt::format("Resize({}x{})", resize->rows, resize->columns);
        return formatter<std::string>::format(text, ctx);
    }
};
// }}}
