// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>

namespace termcore
{

/// Records window size change notifications of the controlling terminal.
///
/// On Unix a SIGWINCH handler is installed for the lifetime of the watcher;
/// the handler only sets a flag, which the owner consumes at its own pace.
/// At most one watcher should exist per process.
class ResizeWatcher
{
  public:
    ResizeWatcher();
    ~ResizeWatcher();

    ResizeWatcher(ResizeWatcher const&) = delete;
    ResizeWatcher& operator=(ResizeWatcher const&) = delete;

    /// Whether a signal handler could be installed on this platform.
    [[nodiscard]] bool installed() const noexcept { return _installed; }

    /// @returns true if a resize was notified since the last call.
    [[nodiscard]] bool consume() noexcept { return _pending.exchange(false); }

    /// Marks a resize as pending. Async-signal-safe.
    static void notify() noexcept { _pending.store(true); }

  private:
    bool install() noexcept;
    void uninstall() noexcept;

    static inline std::atomic<bool> _pending = false;
    bool _installed = false;
};

} // namespace termcore
