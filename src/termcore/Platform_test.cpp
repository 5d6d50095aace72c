// SPDX-License-Identifier: Apache-2.0
#include <termcore/Platform.h>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace termcore;

namespace fs = std::filesystem;

TEST_CASE("Platform.features", "[platform]")
{
    auto const linuxPlatform = Platform(OsFamily::Linux);
    CHECK(linuxPlatform.isUnix());
    CHECK(linuxPlatform.has(PlatformFeature::Signals));
    CHECK(linuxPlatform.has(PlatformFeature::Pty));
    CHECK(linuxPlatform.has(PlatformFeature::TermInfo));
    CHECK(fmt::format("{}", linuxPlatform.features()) == "signals|pty|terminfo|vt_sequences");

    auto const windows = Platform(OsFamily::Windows);
    CHECK(windows.isWindows());
    CHECK_FALSE(windows.isUnix());
    CHECK_FALSE(windows.has(PlatformFeature::Signals));
    CHECK_FALSE(windows.has(PlatformFeature::Pty));
    CHECK_FALSE(windows.has(PlatformFeature::TermInfo));
    CHECK(windows.has(PlatformFeature::VtSequences));

    CHECK(Platform(OsFamily::Unknown).features().none());
    CHECK(Platform(OsFamily::MacOS).isUnix());
    CHECK(Platform(OsFamily::FreeBSD).has(PlatformFeature::TermInfo));
}

TEST_CASE("Platform.supportedSignals", "[platform]")
{
    auto const signals = Platform(OsFamily::MacOS).supportedSignals();
    auto const supports = [&](Signal signal) {
        return std::find(signals.begin(), signals.end(), signal) != signals.end();
    };
    CHECK(supports(Signal::WindowResize));
    CHECK(supports(Signal::Terminate));
    CHECK(supports(Signal::Interrupt));

    CHECK(Platform(OsFamily::Windows).supportedSignals().empty());
}

TEST_CASE("Platform.terminfoPaths", "[platform]")
{
    auto const env = MapEnvironment({
        { "TERMINFO", "/opt/terminfo" },
        { "HOME", "/home/user" },
        { "TERMINFO_DIRS", "/a::/b" },
    });

    auto const paths = Platform(OsFamily::Linux).terminfoPaths(env);
    REQUIRE(paths.size() == 8);
    CHECK(paths[0] == fs::path("/opt/terminfo"));
    CHECK(paths[1] == fs::path("/home/user/.terminfo"));
    CHECK(paths[2] == fs::path("/a"));
    CHECK(paths[3] == fs::path("/b"));
    CHECK(paths[4] == fs::path("/usr/share/terminfo"));
    CHECK(paths.back() == fs::path("/etc/terminfo"));
}

TEST_CASE("Platform.terminfoPaths.defaults", "[platform]")
{
    auto const paths = Platform(OsFamily::Linux).terminfoPaths(MapEnvironment {});
    REQUIRE(paths.size() == 4);
    CHECK(paths.front() == fs::path("/usr/share/terminfo"));

    CHECK(Platform(OsFamily::Windows).terminfoPaths(MapEnvironment {}).empty());
}

TEST_CASE("Platform.windows.minimumVersion", "[platform]")
{
    static_assert(Platform::meetsMinimumVersion(WindowsVersion { 10, 0, 10586 }));
    static_assert(Platform::meetsMinimumVersion(WindowsVersion { 10, 0, 19041 }));
    static_assert(!Platform::meetsMinimumVersion(WindowsVersion { 10, 0, 10240 }));
    static_assert(!Platform::meetsMinimumVersion(WindowsVersion { 6, 3, 9600 }));
    CHECK(Platform::meetsMinimumVersion(Platform::MinimumWindowsVersion));
}

TEST_CASE("Platform.windows.terminalSession", "[platform]")
{
    CHECK(Platform::isWindowsTerminal(MapEnvironment(std::map<std::string, std::string, std::less<>> { { "WT_SESSION", "c3a1f2" } })));
    CHECK_FALSE(Platform::isWindowsTerminal(MapEnvironment(std::map<std::string, std::string, std::less<>> { { "WT_SESSION", "" } })));
    CHECK_FALSE(Platform::isWindowsTerminal(MapEnvironment {}));
}

TEST_CASE("Platform.isWslKernel", "[platform]")
{
    CHECK(Platform::isWslKernel("Linux version 5.15.90.1-microsoft-standard-WSL2"));
    CHECK(Platform::isWslKernel("Linux version 4.4.0-19041-Microsoft"));
    CHECK_FALSE(Platform::isWslKernel("Linux version 6.1.0-18-amd64 (debian-kernel@lists.debian.org)"));
}

TEST_CASE("Platform.current", "[platform]")
{
    auto const& platform = Platform::current();
    CHECK(&platform == &Platform::current());
#if defined(_WIN32)
    CHECK(platform.isWindows());
#else
    CHECK(platform.isUnix());
    CHECK(platform.vtSupport());
    CHECK(nativeSignalNumber(Signal::WindowResize).has_value());
#endif
}

TEST_CASE("Platform.format", "[platform]")
{
    CHECK(fmt::format("{}", OsFamily::MacOS) == "macos");
    CHECK(fmt::format("{}", Signal::WindowResize) == "SIGWINCH");
    CHECK(fmt::format("{}", TerminalSize { 24, 80 }) == "24x80");
}
