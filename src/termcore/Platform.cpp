// SPDX-License-Identifier: Apache-2.0
#include <termcore/Platform.h>

#include <crispy/utils.h>

using std::string_view;
using std::vector;

namespace fs = std::filesystem;

namespace termcore
{

bool Platform::isUnix() const noexcept
{
    switch (_family)
    {
        case OsFamily::Linux:
        case OsFamily::MacOS:
        case OsFamily::FreeBSD: return true;
        case OsFamily::Windows:
        case OsFamily::Unknown: return false;
    }
    return false;
}

PlatformFeatures Platform::features() const noexcept
{
    if (isUnix())
        return PlatformFeatures {
            PlatformFeature::Signals,
            PlatformFeature::Pty,
            PlatformFeature::TermInfo,
            PlatformFeature::VtSequences,
        };

    if (isWindows())
        return PlatformFeature::VtSequences;

    return PlatformFeatures {};
}

vector<Signal> Platform::supportedSignals() const
{
    if (!has(PlatformFeature::Signals))
        return {};

    return {
        Signal::WindowResize, Signal::Terminate, Signal::Interrupt,
        Signal::Hangup,       Signal::User1,     Signal::User2,
    };
}

vector<fs::path> Platform::terminfoPaths(Environment const& env) const
{
    if (!has(PlatformFeature::TermInfo))
        return {};

    auto paths = vector<fs::path> {};

    if (auto const dir = env.nonEmpty("TERMINFO"); dir)
        paths.emplace_back(*dir);

    if (auto const home = env.nonEmpty("HOME"); home)
        paths.emplace_back(fs::path(*home) / ".terminfo");

    if (auto const dirs = env.nonEmpty("TERMINFO_DIRS"); dirs)
        for (auto const dir: crispy::split(*dirs, ':'))
            if (!dir.empty())
                paths.emplace_back(std::string(dir));

    for (auto const* dir: { "/usr/share/terminfo", "/usr/lib/terminfo", "/lib/terminfo", "/etc/terminfo" })
        paths.emplace_back(dir);

    return paths;
}

bool Platform::isWindowsTerminal(Environment const& env)
{
    return env.nonEmpty("WT_SESSION").has_value();
}

bool Platform::isWslKernel(string_view procVersion)
{
    auto const text = crispy::toLower(procVersion);
    return text.find("microsoft") != std::string::npos || text.find("wsl") != std::string::npos;
}

} // namespace termcore
