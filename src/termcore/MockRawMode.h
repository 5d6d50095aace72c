// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/RawMode.h>

namespace termcore
{

/// Mock raw mode primitive, to be used in unit tests.
///
/// attempt() returns the configured outcome; an Activated outcome makes the
/// mock active until restore() is called.
class MockRawMode: public RawMode
{
  public:
    explicit MockRawMode(RawModeOutcome outcome, bool terminal = true);

    RawModeOutcome attempt() override;
    bool restore() noexcept override;

    [[nodiscard]] bool active() const noexcept override { return _active; }
    [[nodiscard]] bool isTerminal() const noexcept override { return _terminal; }
    [[nodiscard]] int fileDescriptor() const noexcept override { return -1; }

    void setOutcome(RawModeOutcome outcome) { _outcome = std::move(outcome); }
    void setRestoreResult(bool result) noexcept { _restoreResult = result; }

    [[nodiscard]] int attemptCount() const noexcept { return _attemptCount; }
    [[nodiscard]] int restoreCount() const noexcept { return _restoreCount; }

  private:
    RawModeOutcome _outcome;
    bool _terminal;
    bool _active = false;
    bool _restoreResult = true;
    int _attemptCount = 0;
    int _restoreCount = 0;
};

} // namespace termcore
