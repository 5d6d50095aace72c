// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Event.h>

#include <fmt/format.h>

#include <libunicode/utf8.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termcore
{

/// Decodes the byte stream read from a terminal into input events.
///
/// The decoder is resumable: bytes of a sequence that has not been completed
/// yet are kept and combined with the next chunk passed to decode(). Such
/// bytes never produce an event on their own; call flush() once no more input
/// is expected (end of stream, or after an idle timeout) to resolve them.
///
/// Recognized input grammar:
///  - printable ASCII and UTF-8 text, C0 control codes as Control+key
///  - ESC + key as Alt+key, SS3 keys (`ESC O P` .. `ESC O S`, arrows, Home/End)
///  - CSI keys (arrows, Home/End, `CSI n ~` editing and function keys) with
///    optional `;modifier` parameter
///  - X10 (`CSI M b x y`) and SGR (`CSI < b ; x ; y M/m`) mouse reports
///  - bracketed paste (`CSI 200~` .. `CSI 201~`) and focus reports (`CSI I/O`)
///
/// CSI sequences that only a terminal would receive (SGR, cursor positioning,
/// erase, mode set/reset) are recognized as echoed output and produce no event.
///
/// An instance must be fed from a single call site; it is not thread-safe.
class InputDecoder
{
  public:
    enum class State : uint8_t
    {
        /// No sequence in progress.
        Ground,
        /// Inside a multi-byte UTF-8 character.
        Utf8,
        /// After ESC.
        Escape,
        /// After `ESC [`, collecting parameter bytes.
        CsiEntry,
        /// After `ESC O`.
        Ss3,
        /// After `ESC [ M`, collecting the three report bytes.
        MouseX10,
        /// Between `ESC [ 200 ~` and `ESC [ 201 ~`.
        BracketedPaste,
    };

    /// Maximum coordinate accepted in mouse reports.
    static constexpr unsigned MaxMouseCoordinate = 9999;

    /// Decodes @p bytes, returning all events completed by them, in order.
    std::vector<Event> decode(std::string_view bytes);

    /// Resolves any retained partial sequence into events.
    ///
    /// - a lone ESC becomes Key::Escape;
    /// - an incomplete CSI or SS3 sequence becomes Key::Escape, followed by its
    ///   remaining bytes decoded as plain input;
    /// - an incomplete UTF-8 character becomes Key::Unknown;
    /// - an unterminated bracketed paste becomes a PasteEvent with the text so far.
    std::vector<Event> flush();

    /// Drops any retained partial sequence without producing events.
    void reset() noexcept;

    [[nodiscard]] State state() const noexcept { return _state; }

    /// Bytes retained for the next decode() call.
    [[nodiscard]] std::string_view remaining() const noexcept { return _pending; }

    /// One-shot decoding of a complete chunk.
    ///
    /// @returns the decoded events and the bytes of any trailing partial sequence.
    [[nodiscard]] static std::pair<std::vector<Event>, std::string> decodeChunk(std::string_view bytes);

  private:
    void process(uint8_t ch, std::vector<Event>& out);
    void processGround(uint8_t ch, std::vector<Event>& out);
    void processUtf8(uint8_t ch, std::vector<Event>& out);
    void processEscape(uint8_t ch, std::vector<Event>& out);
    void processCsi(uint8_t ch, std::vector<Event>& out);
    void processSs3(uint8_t ch, std::vector<Event>& out);
    void processMouseX10(uint8_t ch, std::vector<Event>& out);
    void processPaste(uint8_t ch, std::vector<Event>& out);

    void dispatchCsi(char final, std::vector<Event>& out);
    void dispatchTilde(std::vector<unsigned> const& params, std::vector<Event>& out);
    void dispatchSgrMouse(char final, std::vector<Event>& out);

    void emit(Event event, std::vector<Event>& out);
    void emitKey(Key key, Modifiers modifiers, std::vector<Event>& out);
    void emitUnknown(std::vector<Event>& out);
    void toGround() noexcept;

    State _state = State::Ground;
    std::string _pending;
    std::string _parameters;
    unicode::utf8_decoder_state _utf8 {};
};

/// Decodes a mouse button byte as shared by the X10 and SGR protocols.
///
/// @param release whether the report signals a release (SGR trailing 'm').
/// @param x10 whether the report uses the X10 encoding, in which button
///            value 3 signals the release of any button.
[[nodiscard]] std::optional<MouseEvent> decodeMouseReport(
    unsigned buttonByte, unsigned x, unsigned y, bool release, bool x10) noexcept;

} // namespace termcore

template <>
struct fmt::formatter<termcore::InputDecoder::State>: fmt::formatter<std::string_view>
{
    auto format(termcore::InputDecoder::State value, format_context& ctx) const -> format_context::iterator
    {
        using State = termcore::InputDecoder::State;
        std::string_view name;
        switch (value)
        {
            case State::Ground: name = "Ground"; break;
            case State::Utf8: name = "Utf8"; break;
            case State::Escape: name = "Escape"; break;
            case State::CsiEntry: name = "CsiEntry"; break;
            case State::Ss3: name = "Ss3"; break;
            case State::MouseX10: name = "MouseX10"; break;
            case State::BracketedPaste: name = "BracketedPaste"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
