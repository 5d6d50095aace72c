// SPDX-License-Identifier: Apache-2.0
#include <termcore/ResizeWatcher.h>
#include <termcore/logging.h>

#include <cerrno>
#include <csignal>
#include <cstring>

namespace termcore
{

namespace
{
    struct sigaction previousAction {};

    void onWindowChanged(int /*signal*/)
    {
        ResizeWatcher::notify();
    }
} // namespace

ResizeWatcher::ResizeWatcher(): _installed { install() }
{
}

ResizeWatcher::~ResizeWatcher()
{
    uninstall();
}

bool ResizeWatcher::install() noexcept
{
    // Notifications delivered before this watcher existed belong to no one.
    _pending.store(false);

    struct sigaction action {};
    action.sa_handler = &onWindowChanged;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGWINCH, &action, &previousAction) != 0)
    {
        errorlog()("Failed to install SIGWINCH handler. {}", std::strerror(errno));
        return false;
    }

    backendLog()("SIGWINCH handler installed.");
    return true;
}

void ResizeWatcher::uninstall() noexcept
{
    if (!_installed)
        return;

    if (sigaction(SIGWINCH, &previousAction, nullptr) != 0)
        errorlog()("Failed to restore previous SIGWINCH handler. {}", std::strerror(errno));

    _installed = false;
}

} // namespace termcore
