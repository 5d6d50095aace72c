// SPDX-License-Identifier: Apache-2.0
#include <termcore/RawMode.h>
#include <termcore/UnixUtils.h>
#include <termcore/logging.h>

#include <cerrno>
#include <cstring>
#include <optional>

#include <termios.h>
#include <unistd.h>

namespace termcore
{

namespace
{
    class UnixRawMode final: public RawMode
    {
      public:
        explicit UnixRawMode(int fd) noexcept: _fd { fd } {}
        ~UnixRawMode() override { restore(); }

        UnixRawMode(UnixRawMode const&) = delete;
        UnixRawMode& operator=(UnixRawMode const&) = delete;

        RawModeOutcome attempt() override;
        bool restore() noexcept override;

        [[nodiscard]] bool active() const noexcept override { return _savedSettings.has_value(); }
        [[nodiscard]] bool isTerminal() const noexcept override { return ::isatty(_fd) == 1; }
        [[nodiscard]] int fileDescriptor() const noexcept override { return _fd; }

      private:
        int _fd;
        std::optional<termios> _savedSettings;
    };

    RawModeOutcome UnixRawMode::attempt()
    {
        if (_savedSettings)
            return rawmode::AlreadyClaimed { "raw mode is already active" };

        if (!isTerminal())
            return classifyRawModeError(errno, "isatty");

        // Changing the settings from a background process group would stop
        // us with SIGTTOU, so make sure we own the terminal first.
        auto const foregroundGroup = ::tcgetpgrp(_fd);
        if (foregroundGroup == -1)
            return classifyRawModeError(errno, "tcgetpgrp");
        if (foregroundGroup != ::getpgrp())
            return rawmode::AlreadyClaimed { fmt::format(
                "terminal is owned by foreground process group {}", foregroundGroup) };

        auto const settings = detail::getTerminalSettings(_fd);
        if (!settings)
            return classifyRawModeError(errno, "tcgetattr");

        if (!detail::applyTerminalSettings(_fd, detail::constructRawSettings(*settings)))
            return classifyRawModeError(errno, "tcsetattr");

        _savedSettings = *settings;
        backendLog()("Raw mode activated on fd {}.", _fd);
        return rawmode::Activated {};
    }

    bool UnixRawMode::restore() noexcept
    {
        if (!_savedSettings)
            return true;

        auto const saved = *_savedSettings;
        _savedSettings.reset();

        if (!detail::applyTerminalSettings(_fd, saved))
        {
            errorlog()("Failed to restore terminal settings on fd {}. {}", _fd, std::strerror(errno));
            return false;
        }

        backendLog()("Raw mode deactivated on fd {}.", _fd);
        return true;
    }
} // namespace

std::unique_ptr<RawMode> createRawMode(int fd)
{
    return std::make_unique<UnixRawMode>(fd);
}

} // namespace termcore
