// SPDX-License-Identifier: Apache-2.0
#include <termcore/RawMode.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace termcore
{

RawModeOutcome classifyRawModeError(int errorCode, std::string_view operation)
{
    auto reason = fmt::format("{} failed: {}", operation, std::strerror(errorCode));
    switch (errorCode)
    {
        case ENOTTY:
        case EBADF: return rawmode::Unsupported { std::move(reason) };
        case EBUSY:
        case EPERM:
        case EACCES: return rawmode::AlreadyClaimed { std::move(reason) };
        default: return rawmode::Failed { std::move(reason) };
    }
}

} // namespace termcore
