// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Capabilities.h>
#include <termcore/Environment.h>
#include <termcore/Platform.h>
#include <termcore/RawMode.h>

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace termcore
{

/// Exclusive raw terminal control is active.
struct RawBackend
{
    Capabilities capabilities;
    std::optional<TerminalSize> dimensions;
    bool rawModeStarted = true;

    bool operator==(RawBackend const&) const = default;
};

/// Cooperative line-oriented output, used when raw mode is unavailable.
struct TtyBackend
{
    Capabilities capabilities;
    std::optional<TerminalSize> dimensions;
    /// Whether a terminal device is attached at all.
    bool terminal = false;

    bool operator==(TtyBackend const&) const = default;
};

/// A caller-named backend, passed through unchanged.
struct ExplicitBackend
{
    std::string name;
    std::map<std::string, std::string> options;

    bool operator==(ExplicitBackend const&) const = default;
};

using BackendSelection = std::variant<RawBackend, TtyBackend, ExplicitBackend>;

enum class BackendKind : uint8_t
{
    Auto,
    Raw,
    Tty,
    Explicit,
};

/// The single selection point deciding between raw and cooperative terminal control.
///
/// The raw mode attempt is a process-wide side effect. It runs at most once:
/// later calls to select() return the first result until teardown().
class BackendSelector
{
  public:
    using SizeQuery = std::function<std::optional<TerminalSize>()>;

    /// @param sizeQuery detects the terminal dimensions; defaults to
    ///                  detectTerminalSize() on the raw mode device.
    BackendSelector(std::unique_ptr<RawMode> rawMode,
                    CapabilityCache& cache,
                    Environment const& env,
                    SizeQuery sizeQuery = {});
    ~BackendSelector();

    BackendSelector(BackendSelector const&) = delete;
    BackendSelector& operator=(BackendSelector const&) = delete;

    /// Selects a backend.
    ///
    /// - Auto and Raw attempt raw mode and degrade to Tty if it cannot be activated.
    /// - Tty skips the raw mode attempt.
    /// - Explicit is rejected; pass an ExplicitBackend instead.
    ///
    /// @throws std::invalid_argument for BackendKind::Explicit.
    BackendSelection select(BackendKind kind = BackendKind::Auto);

    /// Returns @p backend verbatim, without touching the terminal.
    BackendSelection select(ExplicitBackend backend);

    /// @returns the current selection, if any.
    [[nodiscard]] std::optional<BackendSelection> selection() const;

    /// Restores the terminal settings and forgets the current selection.
    ///
    /// Calling it again, or without a selection, is a no-op.
    ///
    /// @returns false if the terminal settings could not be restored.
    bool teardown() noexcept;

    [[nodiscard]] RawMode& rawMode() noexcept { return *_rawMode; }

    /// Queries the current terminal dimensions.
    [[nodiscard]] std::optional<TerminalSize> dimensions() const { return _sizeQuery(); }

    /// Tests whether @p term names one of the widely known terminal families.
    [[nodiscard]] static bool isBasicTerminal(std::string_view term) noexcept;

    /// Adjusts the color mode of a degraded snapshot using the TERM name alone.
    ///
    /// A TERM ending in "-direct" announces direct (true) color.
    static void applyBasicColorGuess(Capabilities& caps);

  private:
    BackendSelection attemptRawMode();
    TtyBackend degraded(std::optional<std::string> rawModeError);

    std::unique_ptr<RawMode> _rawMode;
    CapabilityCache& _cache;
    Environment const& _env;
    SizeQuery _sizeQuery;

    mutable std::mutex _mutex;
    std::optional<BackendSelection> _selection;
};

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::BackendKind>: fmt::formatter<std::string_view>
{
    auto format(termcore::BackendKind value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::BackendKind::Auto: name = "auto"; break;
            case termcore::BackendKind::Raw: name = "raw"; break;
            case termcore::BackendKind::Tty: name = "tty"; break;
            case termcore::BackendKind::Explicit: name = "explicit"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::BackendSelection>: fmt::formatter<std::string>
{
    auto format(termcore::BackendSelection const& selection, format_context& ctx) const
        -> format_context::iterator
    {
        std::string text;
        if (auto const* raw = std::get_if<termcore::RawBackend>(&selection))
            text = fmt::format("Raw({})", raw->capabilities.colorMode);
        else if (auto const* tty = std::get_if<termcore::TtyBackend>(&selection))
            text = fmt::format("Tty({}, terminal: {})", tty->capabilities.colorMode, tty->terminal);
        else if (auto const* explicitBackend = std::get_if<termcore::ExplicitBackend>(&selection))
            text = fmt::format("Explicit({})", explicitBackend->name);
        return formatter<std::string>::format(text, ctx);
    }
};
// }}}
