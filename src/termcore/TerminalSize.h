// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/Environment.h>
#include <termcore/Platform.h>

#include <chrono>
#include <optional>
#include <string_view>

namespace termcore
{

constexpr auto DefaultTerminalSize = TerminalSize { 24, 80 };
constexpr unsigned MaxTerminalDimension = 9999;

[[nodiscard]] constexpr bool isValid(TerminalSize size) noexcept
{
    return size.rows >= 1 && size.rows <= MaxTerminalDimension && size.columns >= 1
           && size.columns <= MaxTerminalDimension;
}

/// Reads the size from the LINES and COLUMNS environment variables.
[[nodiscard]] std::optional<TerminalSize> querySizeFromEnvironment(Environment const& env);

/// Parses the "rows columns" output of `stty size`.
[[nodiscard]] std::optional<TerminalSize> parseSttySize(std::string_view output);

/// Runs `stty size` against the controlling terminal.
[[nodiscard]] std::optional<TerminalSize> querySizeFromStty(std::chrono::milliseconds timeout);

/// Determines the terminal size.
///
/// Tries the device ioctl on @p fd first, then LINES/COLUMNS, then `stty size`.
/// Each candidate must lie within 1..9999 in both dimensions.
///
/// @returns the detected size or std::nullopt if no method succeeded.
[[nodiscard]] std::optional<TerminalSize> detectTerminalSize(int fd, Environment const& env);

} // namespace termcore
