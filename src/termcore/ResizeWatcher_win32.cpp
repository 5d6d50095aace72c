// SPDX-License-Identifier: Apache-2.0
#include <termcore/ResizeWatcher.h>

namespace termcore
{

// Windows reports console size changes as input records, not as signals.

ResizeWatcher::ResizeWatcher(): _installed { install() }
{
}

ResizeWatcher::~ResizeWatcher()
{
    uninstall();
}

bool ResizeWatcher::install() noexcept
{
    _pending.store(false);
    return false;
}

void ResizeWatcher::uninstall() noexcept
{
}

} // namespace termcore
