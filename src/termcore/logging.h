// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/logstore.h>

namespace termcore
{

auto const inline capsLog = logstore::category("termcore.caps", "Logs terminal capability detection.");
auto const inline backendLog =
    logstore::category("termcore.backend", "Logs backend selection and raw mode transitions.");
auto const inline inputLog = logstore::category("termcore.input",
                                                "Logs decoded terminal input events.",
                                                logstore::category::state::Disabled,
                                                logstore::category::visibility::Hidden);
auto const inline outputLog = logstore::category("termcore.output",
                                                 "Logs control sequences written to the terminal.",
                                                 logstore::category::state::Disabled,
                                                 logstore::category::visibility::Hidden);
auto const inline configLog = logstore::category("termcore.config", "Logs configuration file loading.");

} // namespace termcore
