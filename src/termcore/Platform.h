// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Environment.h>

#include <crispy/flags.h>

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace termcore
{

enum class OsFamily : uint8_t
{
    Linux,
    MacOS,
    FreeBSD,
    Windows,
    Unknown,
};

enum class PlatformFeature : uint8_t
{
    Signals = 0x01,
    Pty = 0x02,
    TermInfo = 0x04,
    VtSequences = 0x08,
};

using PlatformFeatures = crispy::flags<PlatformFeature>;

/// Signals a terminal application may want to react to.
enum class Signal : uint8_t
{
    WindowResize,
    Terminate,
    Interrupt,
    Hangup,
    User1,
    User2,
};

struct WindowsVersion
{
    unsigned major = 0;
    unsigned minor = 0;
    unsigned build = 0;

    constexpr auto operator<=>(WindowsVersion const&) const noexcept = default;
};

struct TerminalSize
{
    unsigned rows = 24;
    unsigned columns = 80;

    constexpr bool operator==(TerminalSize const&) const noexcept = default;
};

/// Operating system facts consumed by capability detection and backend selection.
///
/// All OS-conditional code lives in the Platform_*.cpp translation units.
class Platform
{
  public:
    /// Minimum Windows 10 build that understands virtual terminal sequences.
    static constexpr WindowsVersion MinimumWindowsVersion { 10, 0, 10586 };

    explicit Platform(OsFamily family, bool wsl = false) noexcept: _family { family }, _wsl { wsl } {}

    /// @returns the platform this process runs on.
    static Platform const& current();

    [[nodiscard]] OsFamily family() const noexcept { return _family; }
    [[nodiscard]] bool isUnix() const noexcept;
    [[nodiscard]] bool isWindows() const noexcept { return _family == OsFamily::Windows; }

    /// Whether the process runs under the Windows Subsystem for Linux.
    [[nodiscard]] bool isWsl() const noexcept { return _wsl; }

    [[nodiscard]] PlatformFeatures features() const noexcept;
    [[nodiscard]] bool has(PlatformFeature feature) const noexcept { return features().test(feature); }

    [[nodiscard]] std::vector<Signal> supportedSignals() const;

    /// Directories searched for compiled terminfo entries, in lookup order.
    [[nodiscard]] std::vector<std::filesystem::path> terminfoPaths(Environment const& env) const;

    /// Whether the session runs inside Windows Terminal.
    [[nodiscard]] static bool isWindowsTerminal(Environment const& env);

    /// Queries whether the output device accepts virtual terminal sequences.
    ///
    /// On Unix this is always true. On Windows the console mode is queried
    /// and VT support is never assumed.
    [[nodiscard]] bool vtSupport() const;

    /// @returns true if @p version is recent enough for VT sequences.
    [[nodiscard]] static constexpr bool meetsMinimumVersion(WindowsVersion version) noexcept
    {
        return version >= MinimumWindowsVersion;
    }

    /// Detects whether /proc/version text identifies a WSL kernel.
    [[nodiscard]] static bool isWslKernel(std::string_view procVersion);

  private:
    OsFamily _family;
    bool _wsl;
};

/// @returns the native signal number, or std::nullopt if unavailable on this OS.
[[nodiscard]] std::optional<int> nativeSignalNumber(Signal signal) noexcept;

/// @returns whether @p fd refers to a terminal device.
[[nodiscard]] bool isTerminal(int fd) noexcept;

/// Queries the window size of the terminal device @p fd.
[[nodiscard]] std::optional<TerminalSize> queryDeviceSize(int fd) noexcept;

} // namespace termcore

// {{{ fmt formatter
template <>
struct fmt::formatter<termcore::OsFamily>: fmt::formatter<std::string_view>
{
    auto format(termcore::OsFamily value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::OsFamily::Linux: name = "linux"; break;
            case termcore::OsFamily::MacOS: name = "macos"; break;
            case termcore::OsFamily::FreeBSD: name = "freebsd"; break;
            case termcore::OsFamily::Windows: name = "windows"; break;
            case termcore::OsFamily::Unknown: name = "unknown"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::PlatformFeature>: fmt::formatter<std::string_view>
{
    auto format(termcore::PlatformFeature value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::PlatformFeature::Signals: name = "signals"; break;
            case termcore::PlatformFeature::Pty: name = "pty"; break;
            case termcore::PlatformFeature::TermInfo: name = "terminfo"; break;
            case termcore::PlatformFeature::VtSequences: name = "vt_sequences"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::Signal>: fmt::formatter<std::string_view>
{
    auto format(termcore::Signal value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case termcore::Signal::WindowResize: name = "SIGWINCH"; break;
            case termcore::Signal::Terminate: name = "SIGTERM"; break;
            case termcore::Signal::Interrupt: name = "SIGINT"; break;
            case termcore::Signal::Hangup: name = "SIGHUP"; break;
            case termcore::Signal::User1: name = "SIGUSR1"; break;
            case termcore::Signal::User2: name = "SIGUSR2"; break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<termcore::TerminalSize>: fmt::formatter<std::string>
{
    auto format(termcore::TerminalSize value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("{}x{}", value.rows, value.columns), ctx);
    }
};
// }}}
