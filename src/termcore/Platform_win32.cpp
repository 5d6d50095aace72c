// SPDX-License-Identifier: Apache-2.0
#include <termcore/Platform.h>
#include <termcore/logging.h>

#include <io.h>

#include <Windows.h>

namespace termcore
{

Platform const& Platform::current()
{
    static Platform const platform = []() {
        auto p = Platform(OsFamily::Windows);
        backendLog()("Platform detected: windows (features: {})", p.features());
        return p;
    }();
    return platform;
}

bool Platform::vtSupport() const
{
    HANDLE const output = GetStdHandle(STD_OUTPUT_HANDLE);
    if (output == INVALID_HANDLE_VALUE || output == nullptr)
        return false;

    DWORD mode = 0;
    if (!GetConsoleMode(output, &mode))
        return false;

    return (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
}

std::optional<int> nativeSignalNumber(Signal /*signal*/) noexcept
{
    return std::nullopt;
}

bool isTerminal(int fd) noexcept
{
    return _isatty(fd) != 0;
}

std::optional<TerminalSize> queryDeviceSize(int /*fd*/) noexcept
{
    CONSOLE_SCREEN_BUFFER_INFO info {};
    if (!GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &info))
        return std::nullopt;

    auto const rows = static_cast<unsigned>(info.srWindow.Bottom - info.srWindow.Top + 1);
    auto const columns = static_cast<unsigned>(info.srWindow.Right - info.srWindow.Left + 1);
    return TerminalSize { rows, columns };
}

} // namespace termcore
