// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Environment.h>
#include <termcore/Platform.h>

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace termcore
{

/// Color depth of a terminal, ordered by rank.
enum class ColorMode : uint8_t
{
    Monochrome = 0,
    Indexed16 = 1,
    Indexed256 = 2,
    TrueColor = 3,
};

constexpr int TrueColorCount = 16'777'216;

[[nodiscard]] constexpr int rank(ColorMode mode) noexcept
{
    return static_cast<int>(mode);
}

/// @returns the number of colors a color mode can address.
[[nodiscard]] constexpr int colorCount(ColorMode mode) noexcept
{
    switch (mode)
    {
        case ColorMode::Monochrome: return 2;
        case ColorMode::Indexed16: return 16;
        case ColorMode::Indexed256: return 256;
        case ColorMode::TrueColor: return TrueColorCount;
    }
    return 2;
}

/// Immutable snapshot of what the attached terminal supports.
struct Capabilities
{
    ColorMode colorMode = ColorMode::Indexed16;
    int maxColors = 16;
    bool unicode = false;
    bool mouse = false;
    bool bracketedPaste = false;
    bool focusEvents = false;
    bool alternateScreen = true;
    std::optional<std::string> terminalType;
    std::optional<std::string> terminalProgram;

    /// Reason a raw mode attempt failed, for diagnostics only.
    std::optional<std::string> rawModeError;

    /// Raises the color mode to @p mode if that is of higher rank.
    ///
    /// maxColors always becomes the maximum of its current value and @p colors,
    /// so neither field is ever lowered.
    void upgradeColorMode(ColorMode mode, int colors) noexcept;

    bool operator==(Capabilities const&) const = default;
};

/// Runs the terminal-info database lookup and returns the reported color count.
///
/// Any failure yields std::nullopt.
using TermInfoQuery = std::function<std::optional<int>(std::chrono::milliseconds timeout)>;

struct DetectorOptions
{
    bool queryTermInfo = true;
    std::chrono::milliseconds termInfoTimeout { 500 };
};

/// Determines terminal capabilities from environment signals and,
/// optionally, the terminal-info database.
///
/// Each detection step may only raise the color mode rank.
class CapabilityDetector
{
  public:
    CapabilityDetector(Environment const& env,
                       Platform const& platform,
                       DetectorOptions options = {},
                       TermInfoQuery termInfoQuery = {});

    /// Runs all detection steps. Never throws.
    [[nodiscard]] Capabilities detect() const noexcept;

    // Individual detection steps, applied by detect() in this order.
    static void applyTerm(Capabilities& caps, std::optional<std::string> const& term);
    static void applyColorTerm(Capabilities& caps, std::optional<std::string> const& colorTerm);
    static void applyTermProgram(Capabilities& caps, std::optional<std::string> const& termProgram);
    static void applyUnicode(Capabilities& caps, Environment const& env);
    static void applyTermInfoColors(Capabilities& caps, std::optional<int> colors);
    static void finalize(Capabilities& caps);

  private:
    Environment const& _env;
    Platform const& _platform;
    DetectorOptions _options;
    TermInfoQuery _termInfoQuery;
};

/// Thread-safe, lazily populated cell holding the current capability snapshot.
///
/// Readers never observe a partially written snapshot: detection builds a
/// complete value first and then swaps the pointer under an exclusive lock.
class CapabilityCache
{
  public:
    using Detect = std::function<Capabilities()>;

    explicit CapabilityCache(Detect detect);

    /// Process-wide instance that detects from the system environment.
    static CapabilityCache& global();

    /// @returns the cached snapshot, detecting it first if absent.
    [[nodiscard]] std::shared_ptr<Capabilities const> get();

    /// Runs detection unconditionally and stores the result.
    std::shared_ptr<Capabilities const> detect();

    /// Stores an externally obtained snapshot.
    void store(Capabilities caps);

    /// Drops the cached snapshot. Safe to call when nothing is cached.
    void invalidate() noexcept;

    [[nodiscard]] bool cached() const;

    [[nodiscard]] ColorMode colorMode() { return get()->colorMode; }
    [[nodiscard]] bool supportsTrueColor() { return get()->colorMode == ColorMode::TrueColor; }
    [[nodiscard]] bool supports256Color() { return rank(get()->colorMode) >= rank(ColorMode::Indexed256); }
    [[nodiscard]] bool supportsUnicode() { return get()->unicode; }
    [[nodiscard]] bool supportsMouse() { return get()->mouse; }
    [[nodiscard]] bool supportsBracketedPaste() { return get()->bracketedPaste; }
    [[nodiscard]] bool supportsFocusEvents() { return get()->focusEvents; }
    [[nodiscard]] bool supportsAlternateScreen() { return get()->alternateScreen; }

  private:
    Detect _detect;
    mutable std::shared_mutex _mutex;
    std::shared_ptr<Capabilities const> _snapshot;
};

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::ColorMode>: fmt::formatter<std::string_view>
{
    auto format(termcore::ColorMode value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::ColorMode::Monochrome: name = "monochrome"; break;
            case termcore::ColorMode::Indexed16: name = "color_16"; break;
            case termcore::ColorMode::Indexed256: name = "color_256"; break;
            case termcore::ColorMode::TrueColor: name = "true_color"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::Capabilities>: fmt::formatter<std::string>
{
    auto format(termcore::Capabilities const& caps, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            fmt::format("{{colorMode: {}, maxColors: {}, unicode: {}, mouse: {}, bracketedPaste: {}, "
                        "focusEvents: {}, alternateScreen: {}, term: {}, program: {}}}",
                        caps.colorMode,
                        caps.maxColors,
                        caps.unicode,
                        caps.mouse,
                        caps.bracketedPaste,
                        caps.focusEvents,
                        caps.alternateScreen,
                        caps.terminalType.value_or("(none)"),
                        caps.terminalProgram.value_or("(none)")),
            ctx);
    }
};
// }}}
