// SPDX-License-Identifier: Apache-2.0
#include <termcore/Subprocess.h>
#include <termcore/TerminalSize.h>
#include <termcore/logging.h>

#include <crispy/utils.h>

using std::optional;
using std::string_view;

namespace termcore
{

namespace
{
    optional<TerminalSize> validated(optional<TerminalSize> size)
    {
        if (size && isValid(*size))
            return size;
        return std::nullopt;
    }
} // namespace

optional<TerminalSize> querySizeFromEnvironment(Environment const& env)
{
    auto const lines = env.nonEmpty("LINES");
    auto const columns = env.nonEmpty("COLUMNS");
    if (!lines || !columns)
        return std::nullopt;

    auto const rows = crispy::to_integer<unsigned>(crispy::trim(*lines));
    auto const cols = crispy::to_integer<unsigned>(crispy::trim(*columns));
    if (!rows || !cols)
        return std::nullopt;

    return validated(TerminalSize { *rows, *cols });
}

optional<TerminalSize> parseSttySize(string_view output)
{
    auto const parts = crispy::split(crispy::trim(output), ' ');
    if (parts.size() != 2)
        return std::nullopt;

    auto const rows = crispy::to_integer<unsigned>(parts[0]);
    auto const cols = crispy::to_integer<unsigned>(parts[1]);
    if (!rows || !cols)
        return std::nullopt;

    return validated(TerminalSize { *rows, *cols });
}

optional<TerminalSize> querySizeFromStty(std::chrono::milliseconds timeout)
{
    auto const result = runProcess("stty", { "size" }, timeout);
    if (!result || result->exitCode != 0)
        return std::nullopt;
    return parseSttySize(result->standardOutput);
}

optional<TerminalSize> detectTerminalSize(int fd, Environment const& env)
{
    if (auto const size = validated(queryDeviceSize(fd)); size)
        return size;

    if (auto const size = querySizeFromEnvironment(env); size)
    {
        backendLog()("Terminal size taken from LINES/COLUMNS: {}", *size);
        return size;
    }

    if (!Platform::current().isUnix())
        return std::nullopt;

    if (auto const size = querySizeFromStty(std::chrono::milliseconds(500)); size)
    {
        backendLog()("Terminal size taken from stty: {}", *size);
        return size;
    }

    return std::nullopt;
}

} // namespace termcore
