// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cerrno>
#include <optional>

#include <termios.h>

#include <fcntl.h>
#include <unistd.h>

namespace termcore::detail
{

std::optional<termios> getTerminalSettings(int fd) noexcept;
termios constructRawSettings(termios tio) noexcept;
bool applyTerminalSettings(int fd, termios const& tio) noexcept;
bool setFileFlags(int fd, int flags) noexcept;
void saveClose(int* fd) noexcept;

// {{{ impl
inline std::optional<termios> getTerminalSettings(int fd) noexcept
{
    termios tio {};
    if (tcgetattr(fd, &tio) != 0)
        return std::nullopt;
    return tio;
}

inline termios constructRawSettings(termios tio) noexcept
{
    // input flags
    tio.c_iflag &= ~static_cast<tcflag_t>(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
#if defined(IUTF8)
    tio.c_iflag |= IUTF8;
#endif

    // output flags
    tio.c_oflag &= ~static_cast<tcflag_t>(OPOST);

    // local flags
    tio.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHONL | ICANON | ISIG | IEXTEN);

    // control flags
    tio.c_cflag &= ~static_cast<tcflag_t>(CSIZE | PARENB);
    tio.c_cflag |= CS8;

    // special characters
    tio.c_cc[VMIN] = 1;  // Report as soon as 1 character is available.
    tio.c_cc[VTIME] = 0; // Disable timeout.

    return tio;
}

inline bool applyTerminalSettings(int fd, termios const& tio) noexcept
{
    while (tcsetattr(fd, TCSAFLUSH, &tio) != 0)
        if (errno != EINTR)
            return false;
    return true;
}

inline bool setFileFlags(int fd, int flags) noexcept
{
    int const currentFlags = fcntl(fd, F_GETFL);
    if (currentFlags < 0)
        return false;
    if (fcntl(fd, F_SETFL, currentFlags | flags) < 0)
        return false;
    return true;
}

inline void saveClose(int* fd) noexcept
{
    if (fd && *fd != -1)
    {
        ::close(*fd);
        *fd = -1;
    }
}
// }}}

} // namespace termcore::detail

namespace termcore
{

struct UnixPipe
{
    std::array<int, 2> pfd;

    explicit UnixPipe(unsigned flags = 0);
    UnixPipe(UnixPipe&&) noexcept;
    UnixPipe& operator=(UnixPipe&&) noexcept;
    UnixPipe(UnixPipe const&) = delete;
    UnixPipe& operator=(UnixPipe const&) = delete;
    ~UnixPipe();

    [[nodiscard]] bool good() const noexcept { return pfd[0] != -1 && pfd[1] != -1; }

    [[nodiscard]] int reader() const noexcept { return pfd[0]; }
    [[nodiscard]] int writer() const noexcept { return pfd[1]; }

    void closeReader() noexcept { detail::saveClose(&pfd[0]); }
    void closeWriter() noexcept { detail::saveClose(&pfd[1]); }

    void close() noexcept
    {
        closeReader();
        closeWriter();
    }
};

// {{{ UnixPipe
inline UnixPipe::UnixPipe(UnixPipe&& v) noexcept: pfd { v.pfd }
{
    v.pfd = { -1, -1 };
}

inline UnixPipe& UnixPipe::operator=(UnixPipe&& v) noexcept
{
    close();
    pfd = v.pfd;
    v.pfd = { -1, -1 };
    return *this;
}

inline UnixPipe::~UnixPipe()
{
    close();
}
// }}}

} // namespace termcore
