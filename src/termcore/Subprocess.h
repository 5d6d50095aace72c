// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace termcore
{

struct ProcessOutput
{
    int exitCode = 0;
    std::string standardOutput;
};

/// Runs @p program with @p args, capturing its standard output.
///
/// The child is killed and reaped if it does not finish within @p timeout.
/// Standard input is connected to the caller's terminal so tools like
/// `stty` can inspect it; standard error is discarded.
///
/// @returns std::nullopt if the program could not be started, was killed,
///          or exceeded the timeout.
[[nodiscard]] std::optional<ProcessOutput> runProcess(std::string const& program,
                                                      std::vector<std::string> const& args,
                                                      std::chrono::milliseconds timeout);

} // namespace termcore
