// SPDX-License-Identifier: Apache-2.0
#include <termcore/Capabilities.h>
#include <termcore/TermInfo.h>
#include <termcore/logging.h>

#include <crispy/utils.h>

#include <algorithm>
#include <array>
#include <mutex>

using std::optional;
using std::string;
using std::string_view;

namespace termcore
{

namespace
{
    constexpr auto TrueColorPrograms = std::array<string_view, 6> {
        "iTerm.app", "vscode", "WezTerm", "kitty", "Alacritty", "Hyper",
    };

    constexpr auto Color256Programs = std::array<string_view, 4> {
        "Apple_Terminal",
        "gnome-terminal",
        "konsole",
        "xfce4-terminal",
    };

    constexpr auto Color256TermPrefixes = std::array<string_view, 3> { "xterm", "screen", "tmux" };

    template <size_t N>
    bool contains(std::array<string_view, N> const& list, string_view value)
    {
        return std::find(list.begin(), list.end(), value) != list.end();
    }

    bool isTrueColorToken(string_view value)
    {
        return value.find("truecolor") != string_view::npos || value.find("24bit") != string_view::npos;
    }
} // namespace

void Capabilities::upgradeColorMode(ColorMode mode, int colors) noexcept
{
    if (rank(mode) > rank(colorMode))
        colorMode = mode;
    maxColors = std::max(maxColors, colors);
}

// {{{ CapabilityDetector
CapabilityDetector::CapabilityDetector(Environment const& env,
                                       Platform const& platform,
                                       DetectorOptions options,
                                       TermInfoQuery termInfoQuery):
    _env { env }, _platform { platform }, _options { options }, _termInfoQuery { std::move(termInfoQuery) }
{
    if (!_termInfoQuery)
        _termInfoQuery = terminfo::queryColors;
}

void CapabilityDetector::applyTerm(Capabilities& caps, optional<string> const& term)
{
    if (!term)
        return;

    caps.terminalType = term;

    if (*term == "linux")
    {
        caps.upgradeColorMode(ColorMode::Indexed16, 16);
        return;
    }

    if (*term == "dumb")
    {
        // "dumb" replaces the 16-color default baseline, but never a tier
        // that another source already raised.
        if (rank(caps.colorMode) <= rank(ColorMode::Indexed16) && caps.maxColors <= 16)
        {
            caps.colorMode = ColorMode::Monochrome;
            caps.maxColors = 2;
        }
        return;
    }

    if (isTrueColorToken(*term))
        caps.upgradeColorMode(ColorMode::TrueColor, TrueColorCount);
    else if (term->find("256color") != string::npos)
        caps.upgradeColorMode(ColorMode::Indexed256, 256);
    else if (std::any_of(Color256TermPrefixes.begin(), Color256TermPrefixes.end(), [&](string_view prefix) {
                 return term->starts_with(prefix);
             }))
        caps.upgradeColorMode(ColorMode::Indexed256, 256);
}

void CapabilityDetector::applyColorTerm(Capabilities& caps, optional<string> const& colorTerm)
{
    if (colorTerm && (*colorTerm == "truecolor" || *colorTerm == "24bit"))
        caps.upgradeColorMode(ColorMode::TrueColor, TrueColorCount);
}

void CapabilityDetector::applyTermProgram(Capabilities& caps, optional<string> const& termProgram)
{
    if (!termProgram)
        return;

    caps.terminalProgram = termProgram;

    if (contains(TrueColorPrograms, *termProgram))
    {
        caps.upgradeColorMode(ColorMode::TrueColor, TrueColorCount);
        caps.mouse = true;
        caps.bracketedPaste = true;
        caps.focusEvents = true;
    }
    else if (contains(Color256Programs, *termProgram))
    {
        caps.upgradeColorMode(ColorMode::Indexed256, 256);
        caps.mouse = true;
        caps.bracketedPaste = true;
    }
}

void CapabilityDetector::applyUnicode(Capabilities& caps, Environment const& env)
{
    auto locale = env.nonEmpty("LC_ALL");
    if (!locale)
        locale = env.nonEmpty("LC_CTYPE");
    if (!locale)
        locale = env.nonEmpty("LANG");

    caps.unicode = locale.has_value()
                   && (crispy::containsIgnoreCase(*locale, "utf-8") || crispy::containsIgnoreCase(*locale, "utf8"));
}

void CapabilityDetector::applyTermInfoColors(Capabilities& caps, optional<int> colors)
{
    if (!colors || *colors < 8)
        return;

    auto const n = *colors;
    if (n >= TrueColorCount)
        caps.upgradeColorMode(ColorMode::TrueColor, n);
    else if (n >= 256)
        caps.upgradeColorMode(ColorMode::Indexed256, n);
    else if (n >= 16)
        caps.upgradeColorMode(ColorMode::Indexed16, n);
    else
        caps.maxColors = std::max(caps.maxColors, n);
}

void CapabilityDetector::finalize(Capabilities& caps)
{
    if (caps.maxColors >= 256)
    {
        caps.mouse = true;
        caps.bracketedPaste = true;
    }
    caps.focusEvents = caps.focusEvents || caps.maxColors >= TrueColorCount;
}

Capabilities CapabilityDetector::detect() const noexcept
{
    auto caps = Capabilities {};

    try
    {
        applyTerm(caps, _env.get("TERM"));
        applyColorTerm(caps, _env.get("COLORTERM"));
        applyTermProgram(caps, _env.get("TERM_PROGRAM"));
        applyUnicode(caps, _env);

        if (_options.queryTermInfo && _platform.has(PlatformFeature::TermInfo))
            applyTermInfoColors(caps, _termInfoQuery(_options.termInfoTimeout));

        finalize(caps);
    }
    catch (std::exception const& e)
    {
        errorlog()("Capability detection failed, using defaults gathered so far. {}", e.what());
    }

    capsLog()("Detected capabilities: {}", caps);
    return caps;
}
// }}}

// {{{ CapabilityCache
CapabilityCache::CapabilityCache(Detect detect): _detect { std::move(detect) }
{
}

CapabilityCache& CapabilityCache::global()
{
    static auto instance = CapabilityCache([]() {
        return CapabilityDetector(SystemEnvironment::instance(), Platform::current()).detect();
    });
    return instance;
}

std::shared_ptr<Capabilities const> CapabilityCache::get()
{
    {
        auto const _ = std::shared_lock { _mutex };
        if (_snapshot)
            return _snapshot;
    }
    return detect();
}

std::shared_ptr<Capabilities const> CapabilityCache::detect()
{
    auto snapshot = std::make_shared<Capabilities const>(_detect());
    auto const _ = std::unique_lock { _mutex };
    _snapshot = snapshot;
    return snapshot;
}

void CapabilityCache::store(Capabilities caps)
{
    auto snapshot = std::make_shared<Capabilities const>(std::move(caps));
    auto const _ = std::unique_lock { _mutex };
    _snapshot = std::move(snapshot);
}

void CapabilityCache::invalidate() noexcept
{
    auto const _ = std::unique_lock { _mutex };
    _snapshot.reset();
}

bool CapabilityCache::cached() const
{
    auto const _ = std::shared_lock { _mutex };
    return _snapshot != nullptr;
}
// }}}

} // namespace termcore
