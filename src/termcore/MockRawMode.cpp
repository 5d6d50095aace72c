// SPDX-License-Identifier: Apache-2.0
#include <termcore/MockRawMode.h>

namespace termcore
{

MockRawMode::MockRawMode(RawModeOutcome outcome, bool terminal): _outcome { std::move(outcome) }, _terminal { terminal }
{
}

RawModeOutcome MockRawMode::attempt()
{
    ++_attemptCount;
    if (_active)
        return rawmode::AlreadyClaimed { "raw mode is already active" };
    if (std::holds_alternative<rawmode::Activated>(_outcome))
        _active = true;
    return _outcome;
}

bool MockRawMode::restore() noexcept
{
    if (!_active)
        return true;
    ++_restoreCount;
    _active = false;
    return _restoreResult;
}

} // namespace termcore
