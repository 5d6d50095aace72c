// SPDX-License-Identifier: Apache-2.0
#include <termcore/RawMode.h>

#include <io.h>

namespace termcore
{

namespace
{
    // Console input on Windows has no termios line discipline to switch.
    class Win32RawMode final: public RawMode
    {
      public:
        explicit Win32RawMode(int fd) noexcept: _fd { fd } {}

        RawModeOutcome attempt() override
        {
            return rawmode::Unsupported { "raw mode requires a termios line discipline" };
        }

        bool restore() noexcept override { return true; }

        [[nodiscard]] bool active() const noexcept override { return false; }
        [[nodiscard]] bool isTerminal() const noexcept override { return _isatty(_fd) != 0; }
        [[nodiscard]] int fileDescriptor() const noexcept override { return _fd; }

      private:
        int _fd;
    };
} // namespace

std::unique_ptr<RawMode> createRawMode(int fd)
{
    return std::make_unique<Win32RawMode>(fd);
}

} // namespace termcore
