// SPDX-License-Identifier: Apache-2.0
#include <termcore/InputDecoder.h>
#include <termcore/logging.h>

#include <crispy/escape.h>
#include <crispy/utils.h>

#include <variant>

using namespace std::string_view_literals;

using std::nullopt;
using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace termcore
{

namespace
{
    constexpr auto PasteStart = "\033[200~"sv;
    constexpr auto PasteEnd = "\033[201~"sv;

    // Longest parameter string accepted in a CSI sequence before it is
    // considered garbage.
    constexpr size_t MaxParameterLength = 64;

    // Final bytes of CSI sequences that only a terminal receives. Seeing one
    // of these on input means our own output was looped back.
    constexpr auto EchoedOutputFinals = "ABCDEFGHJKPSTdfhlmrsu"sv;

    constexpr bool isPrintable(uint8_t ch) noexcept
    {
        return 0x20 <= ch && ch <= 0x7E;
    }

    // Smallest code point that needs a UTF-8 sequence of @p length bytes.
    constexpr char32_t minimumCodepoint(size_t length) noexcept
    {
        switch (length)
        {
            case 2: return 0x80;
            case 3: return 0x800;
            case 4: return 0x10000;
            default: return 0;
        }
    }

    // Rejects overlong encodings, UTF-16 surrogates and values beyond U+10FFFF.
    constexpr bool isValidCodepoint(char32_t value, size_t length) noexcept
    {
        if (value < minimumCodepoint(length))
            return false;
        if (0xD800 <= value && value <= 0xDFFF)
            return false;
        return value <= 0x10FFFF;
    }

    vector<unsigned> parseParameters(string_view text)
    {
        auto result = vector<unsigned> {};
        if (text.empty())
            return result;
        crispy::split(text, ';', [&](string_view field) {
            result.push_back(crispy::to_integer<unsigned>(field).value_or(0));
            return true;
        });
        // split() does not report a trailing empty field.
        if (text.back() == ';')
            result.push_back(0);
        return result;
    }

    /// Accepts the parameter forms terminals use for key reports:
    /// none at all, or `1;N` with a modifier parameter N in 2..16.
    optional<Modifiers> keyReportModifiers(vector<unsigned> const& params) noexcept
    {
        if (params.empty())
            return Modifiers {};
        if (params.size() == 2 && params[0] == 1 && 2 <= params[1] && params[1] <= 16)
            return decodeModifierParameter(params[1]);
        return nullopt;
    }

    /// Final bytes shared by CSI and SS3 key reports.
    optional<Key> finalByteKey(char final) noexcept
    {
        switch (final)
        {
            case 'A': return Key::UpArrow;
            case 'B': return Key::DownArrow;
            case 'C': return Key::RightArrow;
            case 'D': return Key::LeftArrow;
            case 'H': return Key::Home;
            case 'F': return Key::End;
            case 'P': return Key::F1;
            case 'Q': return Key::F2;
            case 'R': return Key::F3;
            case 'S': return Key::F4;
            default: return nullopt;
        }
    }

    optional<Key> tildeKey(unsigned code) noexcept
    {
        switch (code)
        {
            case 1: return Key::Home;
            case 2: return Key::Insert;
            case 3: return Key::Delete;
            case 4: return Key::End;
            case 5: return Key::PageUp;
            case 6: return Key::PageDown;
            case 7: return Key::Home;
            case 8: return Key::End;
            case 11: return Key::F1;
            case 12: return Key::F2;
            case 13: return Key::F3;
            case 14: return Key::F4;
            case 15: return Key::F5;
            case 17: return Key::F6;
            case 18: return Key::F7;
            case 19: return Key::F8;
            case 20: return Key::F9;
            case 21: return Key::F10;
            case 23: return Key::F11;
            case 24: return Key::F12;
            default: return nullopt;
        }
    }

    MouseButton pressedButton(unsigned base) noexcept
    {
        switch (base)
        {
            case 0: return MouseButton::Left;
            case 1: return MouseButton::Middle;
            case 2: return MouseButton::Right;
            default: return MouseButton::None;
        }
    }
} // namespace

optional<MouseEvent> decodeMouseReport(unsigned buttonByte, unsigned x, unsigned y, bool release, bool x10) noexcept
{
    if (x < 1 || x > InputDecoder::MaxMouseCoordinate || y < 1 || y > InputDecoder::MaxMouseCoordinate)
        return nullopt;

    // Extended buttons (8 and above) are not supported.
    if (buttonByte & 128)
        return nullopt;

    auto event = MouseEvent { .x = x, .y = y };
    if (buttonByte & 4)
        event.modifiers.enable(Modifier::Shift);
    if (buttonByte & 8)
        event.modifiers.enable(Modifier::Alt);
    if (buttonByte & 16)
        event.modifiers.enable(Modifier::Control);

    auto const base = buttonByte & 3;

    if (buttonByte & 64)
    {
        // Horizontal wheel (base 2 and 3) is not supported.
        if (base > 1)
            return nullopt;
        event.action = MouseAction::Wheel;
        event.button = base == 0 ? MouseButton::WheelUp : MouseButton::WheelDown;
        return event;
    }

    if (buttonByte & 32)
    {
        event.action = base == 3 ? MouseAction::Move : MouseAction::Drag;
        event.button = pressedButton(base);
        return event;
    }

    if (release || (x10 && base == 3))
    {
        event.action = MouseAction::Release;
        event.button = pressedButton(base);
        return event;
    }

    if (base == 3)
        return nullopt;

    event.action = MouseAction::Press;
    event.button = pressedButton(base);
    return event;
}

// {{{ public API
vector<Event> InputDecoder::decode(string_view bytes)
{
    auto events = vector<Event> {};
    for (auto const ch: bytes)
        process(static_cast<uint8_t>(ch), events);
    return events;
}

vector<Event> InputDecoder::flush()
{
    auto events = vector<Event> {};
    while (_state != State::Ground)
    {
        switch (_state)
        {
            case State::Ground: break;
            case State::Escape:
                emitKey(Key::Escape, {}, events);
                toGround();
                break;
            case State::CsiEntry:
            case State::Ss3:
            case State::MouseX10: {
                auto const rest = _pending.substr(1);
                emitKey(Key::Escape, {}, events);
                toGround();
                for (auto const ch: rest)
                    process(static_cast<uint8_t>(ch), events);
                break;
            }
            case State::Utf8:
                emitUnknown(events);
                toGround();
                break;
            case State::BracketedPaste:
                emit(PasteEvent { _pending.substr(PasteStart.size()) }, events);
                toGround();
                break;
        }
    }
    return events;
}

void InputDecoder::reset() noexcept
{
    toGround();
}

std::pair<vector<Event>, string> InputDecoder::decodeChunk(string_view bytes)
{
    auto decoder = InputDecoder {};
    auto events = decoder.decode(bytes);
    return { std::move(events), string(decoder.remaining()) };
}
// }}}

// {{{ state machine
void InputDecoder::process(uint8_t ch, vector<Event>& out)
{
    switch (_state)
    {
        case State::Ground: processGround(ch, out); break;
        case State::Utf8: processUtf8(ch, out); break;
        case State::Escape: processEscape(ch, out); break;
        case State::CsiEntry: processCsi(ch, out); break;
        case State::Ss3: processSs3(ch, out); break;
        case State::MouseX10: processMouseX10(ch, out); break;
        case State::BracketedPaste: processPaste(ch, out); break;
    }
}

void InputDecoder::processGround(uint8_t ch, vector<Event>& out)
{
    switch (ch)
    {
        case 0x1B:
            _pending.assign(1, static_cast<char>(ch));
            _state = State::Escape;
            return;
        case 0x00: emit(KeyEvent { Key::Character, " ", Modifier::Control }, out); return;
        case 0x08:
        case 0x7F: emitKey(Key::Backspace, {}, out); return;
        case 0x09: emitKey(Key::Tab, {}, out); return;
        case 0x0A:
        case 0x0D: emitKey(Key::Enter, {}, out); return;
        default: break;
    }

    if (0x01 <= ch && ch <= 0x1A)
    {
        emit(KeyEvent { Key::Character, string(1, static_cast<char>('a' + ch - 1)), Modifier::Control }, out);
        return;
    }

    if (ch < 0x20)
    {
        _pending.assign(1, static_cast<char>(ch));
        emitUnknown(out);
        _pending.clear();
        return;
    }

    if (isPrintable(ch))
    {
        emit(KeyEvent { Key::Character, string(1, static_cast<char>(ch)), {} }, out);
        return;
    }

    _pending.assign(1, static_cast<char>(ch));
    _utf8 = {};
    if (std::holds_alternative<unicode::Incomplete>(unicode::from_utf8(_utf8, ch)))
    {
        _state = State::Utf8;
        return;
    }

    emitUnknown(out);
    toGround();
}

void InputDecoder::processUtf8(uint8_t ch, vector<Event>& out)
{
    if ((ch & 0xC0) != 0x80)
    {
        emitUnknown(out);
        toGround();
        processGround(ch, out);
        return;
    }

    _pending.push_back(static_cast<char>(ch));
    unicode::ConvertResult const r = unicode::from_utf8(_utf8, ch);
    if (std::holds_alternative<unicode::Incomplete>(r))
        return;

    auto const* success = std::get_if<unicode::Success>(&r);
    if (success && isValidCodepoint(success->value, _pending.size()))
        emit(KeyEvent { Key::Character, _pending, {} }, out);
    else
        emitUnknown(out);
    toGround();
}

void InputDecoder::processEscape(uint8_t ch, vector<Event>& out)
{
    switch (ch)
    {
        case '[':
            _pending.push_back('[');
            _parameters.clear();
            _state = State::CsiEntry;
            return;
        case 'O':
            _pending.push_back('O');
            _state = State::Ss3;
            return;
        case 0x1B:
            // The first ESC stands alone, the second one starts a new sequence.
            emitKey(Key::Escape, {}, out);
            return;
        default: break;
    }

    if (isPrintable(ch))
    {
        emit(KeyEvent { Key::Character, string(1, static_cast<char>(ch)), Modifier::Alt }, out);
        toGround();
        return;
    }

    emitKey(Key::Escape, {}, out);
    toGround();
    processGround(ch, out);
}

void InputDecoder::processCsi(uint8_t ch, vector<Event>& out)
{
    if (ch == 'M' && _parameters.empty())
    {
        _pending.push_back('M');
        _state = State::MouseX10;
        return;
    }

    if (0x20 <= ch && ch <= 0x3F)
    {
        _pending.push_back(static_cast<char>(ch));
        if (_parameters.size() >= MaxParameterLength)
        {
            emitUnknown(out);
            toGround();
            return;
        }
        _parameters.push_back(static_cast<char>(ch));
        return;
    }

    if (0x40 <= ch && ch <= 0x7E)
    {
        _pending.push_back(static_cast<char>(ch));
        dispatchCsi(static_cast<char>(ch), out);
        if (_state == State::CsiEntry)
            toGround();
        return;
    }

    // A byte that can never be part of a CSI sequence aborts it.
    emitUnknown(out);
    toGround();
    processGround(ch, out);
}

void InputDecoder::processSs3(uint8_t ch, vector<Event>& out)
{
    if (0x40 <= ch && ch <= 0x7E)
    {
        _pending.push_back(static_cast<char>(ch));
        if (auto const key = finalByteKey(static_cast<char>(ch)))
            emitKey(*key, {}, out);
        else
            emitUnknown(out);
        toGround();
        return;
    }

    emitUnknown(out);
    toGround();
    processGround(ch, out);
}

void InputDecoder::processMouseX10(uint8_t ch, vector<Event>& out)
{
    _pending.push_back(static_cast<char>(ch));
    _parameters.push_back(static_cast<char>(ch));
    if (_parameters.size() < 3)
        return;

    auto const value = [this](size_t i) -> unsigned {
        auto const byte = static_cast<uint8_t>(_parameters[i]);
        return byte >= 32 ? byte - 32u : 0u;
    };

    if (auto const event = decodeMouseReport(value(0), value(1), value(2), false, true))
        emit(*event, out);
    else
        emitUnknown(out);
    toGround();
}

void InputDecoder::processPaste(uint8_t ch, vector<Event>& out)
{
    _pending.push_back(static_cast<char>(ch));
    if (!string_view(_pending).ends_with(PasteEnd))
        return;

    auto const contentLength = _pending.size() - PasteStart.size() - PasteEnd.size();
    emit(PasteEvent { _pending.substr(PasteStart.size(), contentLength) }, out);
    toGround();
}
// }}}

// {{{ dispatch
void InputDecoder::dispatchCsi(char final, vector<Event>& out)
{
    auto const parameters = string_view(_parameters);

    if (!parameters.empty() && parameters.front() == '<')
    {
        dispatchSgrMouse(final, out);
        return;
    }

    if (!parameters.empty() && parameters.front() == '?')
    {
        if (final == 'h' || final == 'l')
        {
            if (inputLog)
                inputLog()("Ignoring echoed mode sequence: {}", crispy::escape(_pending));
        }
        else
            emitUnknown(out);
        return;
    }

    auto const params = parseParameters(parameters);

    if (auto const key = finalByteKey(final))
    {
        if (auto const modifiers = keyReportModifiers(params))
        {
            emitKey(*key, *modifiers, out);
            return;
        }
    }

    switch (final)
    {
        case '~': dispatchTilde(params, out); return;
        case 'Z':
            if (params.empty())
            {
                emitKey(Key::BackTab, Modifier::Shift, out);
                return;
            }
            break;
        case 'I':
        case 'O':
            if (params.empty())
            {
                emit(FocusEvent { final == 'I' }, out);
                return;
            }
            break;
        default: break;
    }

    if (EchoedOutputFinals.find(final) != string_view::npos)
    {
        if (inputLog)
            inputLog()("Ignoring echoed output sequence: {}", crispy::escape(_pending));
        return;
    }

    emitUnknown(out);
}

void InputDecoder::dispatchTilde(vector<unsigned> const& params, vector<Event>& out)
{
    if (params.empty() || params.size() > 2)
    {
        emitUnknown(out);
        return;
    }

    if (params[0] == 200 && params.size() == 1)
    {
        _pending.assign(PasteStart);
        _parameters.clear();
        _state = State::BracketedPaste;
        return;
    }

    auto const key = tildeKey(params[0]);
    if (!key)
    {
        emitUnknown(out);
        return;
    }

    auto const modifiers = params.size() == 2 ? decodeModifierParameter(params[1]) : Modifiers {};
    emitKey(*key, modifiers, out);
}

void InputDecoder::dispatchSgrMouse(char final, vector<Event>& out)
{
    if (final != 'M' && final != 'm')
    {
        emitUnknown(out);
        return;
    }

    auto const fields = crispy::split(string_view(_parameters).substr(1), ';');
    if (fields.size() != 3)
    {
        emitUnknown(out);
        return;
    }

    auto const button = crispy::to_integer<unsigned>(fields[0]);
    auto const x = crispy::to_integer<unsigned>(fields[1]);
    auto const y = crispy::to_integer<unsigned>(fields[2]);
    if (!button || !x || !y || *button > 255)
    {
        emitUnknown(out);
        return;
    }

    if (auto const event = decodeMouseReport(*button, *x, *y, final == 'm', false))
        emit(*event, out);
    else
        emitUnknown(out);
}
// }}}

// {{{ helpers
void InputDecoder::emit(Event event, vector<Event>& out)
{
    if (inputLog)
        inputLog()("Decoded {}", event);
    out.emplace_back(std::move(event));
}

void InputDecoder::emitKey(Key key, Modifiers modifiers, vector<Event>& out)
{
    emit(KeyEvent { key, {}, modifiers }, out);
}

void InputDecoder::emitUnknown(vector<Event>& out)
{
    if (inputLog)
        inputLog()("Unrecognized input: \"{}\"", crispy::escape(_pending));
    emitKey(Key::Unknown, {}, out);
}

void InputDecoder::toGround() noexcept
{
    _state = State::Ground;
    _pending.clear();
    _parameters.clear();
    _utf8 = {};
}
// }}}

} // namespace termcore
