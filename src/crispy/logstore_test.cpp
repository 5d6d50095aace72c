// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace
{

auto const inline testLog = logstore::category("test.logstore", "Used by logstore tests.");
auto const inline otherLog = logstore::category("other.logstore", "Used by logstore tests.");

struct CapturingSink
{
    std::vector<std::string> lines;
    logstore::sink sink { true, [this](std::string_view text) { lines.emplace_back(text); } };
};

} // namespace

TEST_CASE("logstore.category.registered")
{
    CHECK(logstore::get("test.logstore") != nullptr);
    CHECK(logstore::get("no.such.category") == nullptr);
}

TEST_CASE("logstore.configure")
{
    logstore::configure("test.*");
    CHECK(testLog.is_enabled());
    CHECK_FALSE(otherLog.is_enabled());

    logstore::configure("other.logstore");
    CHECK_FALSE(testLog.is_enabled());
    CHECK(otherLog.is_enabled());

    logstore::configure("all");
    CHECK(testLog.is_enabled());
    CHECK(otherLog.is_enabled());

    logstore::configure("");
    CHECK_FALSE(testLog.is_enabled());
    CHECK_FALSE(otherLog.is_enabled());

    // The error category can not be disabled.
    CHECK(logstore::ErrorLog.is_enabled());
}

TEST_CASE("logstore.sink.write")
{
    auto capture = CapturingSink {};
    auto& cat = *logstore::get("test.logstore");
    cat.set_sink(capture.sink);
    cat.enable();

    testLog()("Hello {}", 42);

    cat.disable();
    cat.set_sink(logstore::sink::console());

    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].find("Hello 42") != std::string::npos);
}

TEST_CASE("logstore.sink.disabled_category")
{
    auto capture = CapturingSink {};
    auto& cat = *logstore::get("test.logstore");
    cat.set_sink(capture.sink);
    cat.disable();

    testLog()("not written");

    cat.set_sink(logstore::sink::console());
    CHECK(capture.lines.empty());
}
