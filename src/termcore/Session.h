// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/BackendSelector.h>
#include <termcore/Encoder.h>
#include <termcore/Event.h>
#include <termcore/InputDecoder.h>
#include <termcore/ResizeWatcher.h>
#include <termcore/Sequences.h>

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termcore
{

/// How frames are drawn on the cooperative (Tty) backend.
enum class LineMode : uint8_t
{
    /// Clear the screen and draw everything on each frame.
    FullRedraw,
    /// Only rewrite what changed since the last frame.
    Incremental,
};

/// Terminal modes a session switches on when it owns the terminal.
struct SessionOptions
{
    bool alternateScreen = true;
    bool hideCursor = true;
    bool clearScreen = true;
    MouseTracking mouseTracking = MouseTracking::Normal;
    bool sgrMouse = true;
    bool bracketedPaste = true;
    bool focusEvents = true;

    /// Preferred character set for glyphs.
    CharacterSet characterSet = CharacterSet::Unicode;
    /// Character set used when the terminal lacks Unicode support.
    CharacterSet fallbackCharacterSet = CharacterSet::Ascii;

    LineMode lineMode = LineMode::FullRedraw;

    /// Whether to watch for window size changes.
    bool watchResize = true;
};

/// Owns the terminal for the lifetime of an application.
///
/// start() selects the backend and, on the raw backend, emits the configured
/// mode toggles. Each toggle registers the sequence that reverts it, and
/// teardown() writes those in strict reverse order before restoring the
/// terminal settings. Teardown runs at most once per start().
class Session
{
  public:
    using Writer = std::function<void(std::string_view)>;

    Session(BackendSelector& selector, Writer writer, SessionOptions options = {});
    ~Session();

    Session(Session const&) = delete;
    Session& operator=(Session const&) = delete;

    /// Selects the backend and applies the terminal modes.
    ///
    /// Calling start() on an active session returns the current selection.
    BackendSelection const& start(BackendKind kind = BackendKind::Auto);

    /// Starts the session on a caller-named backend. No modes are toggled.
    BackendSelection const& start(ExplicitBackend backend);

    /// Reverts every applied mode in reverse order and restores the terminal.
    ///
    /// @returns false if the terminal settings could not be restored.
    bool teardown() noexcept;

    [[nodiscard]] bool active() const noexcept { return _selection.has_value(); }
    [[nodiscard]] std::optional<BackendSelection> const& selection() const noexcept { return _selection; }
    [[nodiscard]] SessionOptions const& options() const noexcept { return _options; }

    /// The encoder negotiated for this session.
    [[nodiscard]] Encoder const& encoder() const noexcept { return _encoder; }

    /// Decodes input read from the terminal.
    ///
    /// A resize notified since the last call is appended as a ResizeEvent.
    [[nodiscard]] std::vector<Event> feed(std::string_view bytes);

    /// Resolves pending partial input, e.g. after an idle timeout.
    [[nodiscard]] std::vector<Event> flush();

    /// @returns a ResizeEvent if the terminal was resized since the last check.
    [[nodiscard]] std::optional<ResizeEvent> pendingResize();

    /// @returns the bytes to write before drawing a new frame.
    [[nodiscard]] std::string frameStart() const;

    /// Sequences that will be written by teardown(), in the order they will be written.
    [[nodiscard]] std::vector<std::string> pendingTeardown() const;

  private:
    void applyModes(Capabilities const& caps);
    void toggle(std::string const& enable, std::string disable);
    void write(std::string_view bytes);

    BackendSelector& _selector;
    Writer _writer;
    SessionOptions _options;
    Encoder _encoder { ColorMode::Indexed16 };
    InputDecoder _decoder;
    std::unique_ptr<ResizeWatcher> _resizeWatcher;
    std::optional<BackendSelection> _selection;
    std::vector<std::string> _undoStack;
};

} // namespace termcore

template <>
struct fmt::formatter<termcore::LineMode>: fmt::formatter<std::string_view>
{
    auto format(termcore::LineMode value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string_view>::format(
            value == termcore::LineMode::FullRedraw ? "full_redraw" : "incremental", ctx);
    }
};
