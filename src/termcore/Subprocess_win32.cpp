// SPDX-License-Identifier: Apache-2.0
#include <termcore/Subprocess.h>
#include <termcore/logging.h>

namespace termcore
{

std::optional<ProcessOutput> runProcess(std::string const& program,
                                        std::vector<std::string> const& /*args*/,
                                        std::chrono::milliseconds /*timeout*/)
{
    // Only used for terminfo and stty lookups, neither of which exists on Windows.
    backendLog()("Not spawning {}: subprocess queries are unavailable on this platform.", program);
    return std::nullopt;
}

} // namespace termcore
