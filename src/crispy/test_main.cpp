// SPDX-License-Identifier: Apache-2.0
#define CATCH_CONFIG_RUNNER
#include <crispy/logstore.h>

#include <catch2/catch.hpp>

#include <cstdlib>

int main(int argc, char const* argv[])
{
    // e.g. LOG=termcore.input,termcore.caps to trace what the tests feed through.
    if (auto const* filter = std::getenv("LOG"); filter && *filter)
        logstore::configure(filter);

    int const result = Catch::Session().run(argc, argv);

    return result;
}
