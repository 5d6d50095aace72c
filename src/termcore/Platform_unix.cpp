// SPDX-License-Identifier: Apache-2.0
#include <termcore/Platform.h>
#include <termcore/logging.h>

#include <csignal>
#include <fstream>
#include <iterator>
#include <string>

#include <sys/ioctl.h>
#include <sys/utsname.h>

#include <unistd.h>

namespace termcore
{

namespace
{
    OsFamily detectOsFamily()
    {
        utsname info {};
        if (uname(&info) != 0)
            return OsFamily::Unknown;

        auto const sysname = std::string_view(info.sysname);
        if (sysname == "Linux")
            return OsFamily::Linux;
        if (sysname == "Darwin")
            return OsFamily::MacOS;
        if (sysname == "FreeBSD")
            return OsFamily::FreeBSD;
        return OsFamily::Unknown;
    }

    bool detectWsl(OsFamily family)
    {
        if (family != OsFamily::Linux)
            return false;

        auto file = std::ifstream("/proc/version");
        if (!file.good())
            return false;

        auto const text = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char> {});
        return Platform::isWslKernel(text);
    }
} // namespace

Platform const& Platform::current()
{
    static Platform const platform = []() {
        auto const family = detectOsFamily();
        auto const wsl = detectWsl(family);
        auto p = Platform(family, wsl);
        backendLog()("Platform detected: {} (wsl: {}, features: {})", family, wsl, p.features());
        return p;
    }();
    return platform;
}

bool Platform::vtSupport() const
{
    return isUnix();
}

std::optional<int> nativeSignalNumber(Signal signal) noexcept
{
    switch (signal)
    {
        case Signal::WindowResize: return SIGWINCH;
        case Signal::Terminate: return SIGTERM;
        case Signal::Interrupt: return SIGINT;
        case Signal::Hangup: return SIGHUP;
        case Signal::User1: return SIGUSR1;
        case Signal::User2: return SIGUSR2;
    }
    return std::nullopt;
}

bool isTerminal(int fd) noexcept
{
    return ::isatty(fd) == 1;
}

std::optional<TerminalSize> queryDeviceSize(int fd) noexcept
{
    winsize ws {};
    if (ioctl(fd, TIOCGWINSZ, &ws) != 0)
        return std::nullopt;

    if (ws.ws_row == 0 || ws.ws_col == 0)
        return std::nullopt;

    return TerminalSize { ws.ws_row, ws.ws_col };
}

} // namespace termcore
