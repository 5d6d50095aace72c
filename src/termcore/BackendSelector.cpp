// SPDX-License-Identifier: Apache-2.0
#include <termcore/BackendSelector.h>
#include <termcore/TerminalSize.h>
#include <termcore/logging.h>

#include <array>
#include <stdexcept>

using namespace std::string_view_literals;

using std::optional;
using std::string;
using std::string_view;

namespace termcore
{

namespace
{
    // clang-format off
    constexpr auto BasicTerminalPrefixes = std::array {
        "xterm"sv, "screen"sv, "tmux"sv, "vt100"sv, "vt220"sv, "linux"sv, "rxvt"sv,
        "ansi"sv, "cygwin"sv, "putty"sv, "konsole"sv, "gnome"sv, "eterm"sv,
    };
    // clang-format on
} // namespace

BackendSelector::BackendSelector(std::unique_ptr<RawMode> rawMode,
                                 CapabilityCache& cache,
                                 Environment const& env,
                                 SizeQuery sizeQuery):
    _rawMode { std::move(rawMode) }, _cache { cache }, _env { env }, _sizeQuery { std::move(sizeQuery) }
{
    if (!_rawMode)
        throw std::invalid_argument("BackendSelector requires a raw mode primitive.");

    if (!_sizeQuery)
        _sizeQuery = [this]() {
            return detectTerminalSize(_rawMode->fileDescriptor(), _env);
        };
}

BackendSelector::~BackendSelector()
{
    teardown();
}

BackendSelection BackendSelector::select(BackendKind kind)
{
    auto const _ = std::lock_guard { _mutex };

    if (_selection)
    {
        backendLog()("Reusing backend selection {}.", *_selection);
        return *_selection;
    }

    switch (kind)
    {
        case BackendKind::Explicit:
            throw std::invalid_argument("An explicit backend must be selected by name.");
        case BackendKind::Tty: _selection = degraded(std::nullopt); break;
        case BackendKind::Auto:
        case BackendKind::Raw: _selection = attemptRawMode(); break;
    }

    backendLog()("Selected backend {} (requested: {}).", *_selection, kind);
    return *_selection;
}

BackendSelection BackendSelector::select(ExplicitBackend backend)
{
    backendLog()("Using explicit backend {} with {} option(s).", backend.name, backend.options.size());
    return backend;
}

optional<BackendSelection> BackendSelector::selection() const
{
    auto const _ = std::lock_guard { _mutex };
    return _selection;
}

bool BackendSelector::teardown() noexcept
{
    auto const _ = std::lock_guard { _mutex };
    _selection.reset();
    return _rawMode->restore();
}

bool BackendSelector::isBasicTerminal(string_view term) noexcept
{
    for (auto const prefix: BasicTerminalPrefixes)
        if (term.starts_with(prefix))
            return true;
    return false;
}

void BackendSelector::applyBasicColorGuess(Capabilities& caps)
{
    if (!caps.terminalType)
        return;

    auto const& term = *caps.terminalType;
    if (term.ends_with("-direct"))
        caps.upgradeColorMode(ColorMode::TrueColor, TrueColorCount);
    else if (!isBasicTerminal(term))
        capsLog()("Unrecognized terminal type {}, keeping {}.", term, caps.colorMode);
}

BackendSelection BackendSelector::attemptRawMode()
{
    auto const outcome = _rawMode->attempt();
    backendLog()("Raw mode attempt: {}", outcome);

    if (std::holds_alternative<rawmode::Activated>(outcome))
        return RawBackend { .capabilities = *_cache.get(), .dimensions = _sizeQuery(), .rawModeStarted = true };

    if (auto const* failed = std::get_if<rawmode::Failed>(&outcome))
        return degraded(failed->reason);

    return degraded(std::nullopt);
}

TtyBackend BackendSelector::degraded(optional<string> rawModeError)
{
    auto caps = *_cache.detect();
    applyBasicColorGuess(caps);
    caps.rawModeError = std::move(rawModeError);

    return TtyBackend { .capabilities = std::move(caps),
                        .dimensions = _sizeQuery(),
                        .terminal = _rawMode->isTerminal() };
}

} // namespace termcore
