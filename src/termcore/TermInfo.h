// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string_view>

namespace termcore::terminfo
{

/// Extracts the numeric `colors` capability from `infocmp -1` output.
///
/// Accepts both `colors#256` and `colors=256`, and the hexadecimal form
/// `colors#0x100` that newer ncurses versions print.
[[nodiscard]] std::optional<int> parseColors(std::string_view infocmpOutput);

/// Runs `infocmp -1` for the current TERM and returns the color count it reports.
///
/// The subprocess is bounded by @p timeout. A missing binary, a non-zero exit
/// status or unparsable output all yield std::nullopt.
[[nodiscard]] std::optional<int> queryColors(std::chrono::milliseconds timeout);

} // namespace termcore::terminfo
