// SPDX-License-Identifier: Apache-2.0
#include <termcore/BackendSelector.h>
#include <termcore/MockRawMode.h>

#include <catch2/catch.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace termcore;

namespace
{

struct Fixture
{
    MapEnvironment env;
    int detections = 0;
    Capabilities detected {};
    CapabilityCache cache { [this]() {
        ++detections;
        return detected;
    } };
    MockRawMode* mock = nullptr;

    std::unique_ptr<BackendSelector> create(RawModeOutcome outcome, bool terminal = true)
    {
        auto rawMode = std::make_unique<MockRawMode>(std::move(outcome), terminal);
        mock = rawMode.get();
        return std::make_unique<BackendSelector>(
            std::move(rawMode), cache, env, []() { return std::optional<TerminalSize> { TerminalSize { 40, 100 } }; });
    }
};

} // namespace

TEST_CASE("BackendSelector.raw", "[backend]")
{
    auto f = Fixture {};
    f.detected.colorMode = ColorMode::Indexed256;
    auto selector = f.create(rawmode::Activated {});

    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<RawBackend>(selection));
    auto const& raw = std::get<RawBackend>(selection);
    CHECK(raw.rawModeStarted);
    CHECK(raw.capabilities.colorMode == ColorMode::Indexed256);
    CHECK(raw.dimensions == TerminalSize { 40, 100 });
    CHECK(f.mock->active());
}

TEST_CASE("BackendSelector.already_claimed", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::AlreadyClaimed { "terminal is owned by foreground process group 42" });

    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    auto const& tty = std::get<TtyBackend>(selection);
    CHECK(tty.terminal);
    CHECK_FALSE(tty.capabilities.rawModeError.has_value());
    CHECK(tty.dimensions == TerminalSize { 40, 100 });
    CHECK(f.detections == 1);
    CHECK_FALSE(f.mock->active());
}

TEST_CASE("BackendSelector.already_claimed.no_terminal", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::AlreadyClaimed { "busy" }, false);
    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK_FALSE(std::get<TtyBackend>(selection).terminal);
}

TEST_CASE("BackendSelector.unsupported", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Unsupported { "isatty failed" }, false);
    auto const selection = selector->select(BackendKind::Auto);
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK_FALSE(std::get<TtyBackend>(selection).capabilities.rawModeError.has_value());
}

TEST_CASE("BackendSelector.failed", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Failed { "tcsetattr failed: Input/output error" });
    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK(std::get<TtyBackend>(selection).capabilities.rawModeError == "tcsetattr failed: Input/output error");
}

TEST_CASE("BackendSelector.degraded_detects_fresh", "[backend]")
{
    auto f = Fixture {};
    f.cache.store(Capabilities {});
    auto selector = f.create(rawmode::AlreadyClaimed { "busy" });

    f.detected.colorMode = ColorMode::TrueColor;
    f.detected.maxColors = TrueColorCount;
    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK(std::get<TtyBackend>(selection).capabilities.colorMode == ColorMode::TrueColor);
    CHECK(f.detections == 1);
}

TEST_CASE("BackendSelector.tty_skips_attempt", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});
    auto const selection = selector->select(BackendKind::Tty);
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK(f.mock->attemptCount() == 0);
    CHECK_FALSE(f.mock->active());
}

TEST_CASE("BackendSelector.at_most_once", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});

    auto const first = selector->select();
    auto const second = selector->select();
    auto const third = selector->select(BackendKind::Tty);
    CHECK(first == second);
    CHECK(first == third);
    CHECK(f.mock->attemptCount() == 1);
    CHECK(selector->selection() == first);
}

TEST_CASE("BackendSelector.concurrent_select", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});

    auto rawCount = std::atomic<int> { 0 };
    auto threads = std::vector<std::thread> {};
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&]() {
            if (std::holds_alternative<RawBackend>(selector->select()))
                ++rawCount;
        });
    for (auto& thread: threads)
        thread.join();

    CHECK(f.mock->attemptCount() == 1);
    CHECK(rawCount.load() == 8);
}

TEST_CASE("BackendSelector.teardown", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});
    (void) selector->select();
    REQUIRE(f.mock->active());

    CHECK(selector->teardown());
    CHECK_FALSE(f.mock->active());
    CHECK_FALSE(selector->selection().has_value());

    // Repeated teardown is a no-op.
    CHECK(selector->teardown());
    CHECK(f.mock->restoreCount() == 1);

    // After teardown raw mode may be attempted again.
    CHECK(std::holds_alternative<RawBackend>(selector->select()));
    CHECK(f.mock->attemptCount() == 2);
}

TEST_CASE("BackendSelector.teardown.restore_failure", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});
    (void) selector->select();
    f.mock->setRestoreResult(false);
    CHECK_FALSE(selector->teardown());
    CHECK(selector->teardown());
}

TEST_CASE("BackendSelector.explicit", "[backend]")
{
    auto f = Fixture {};
    auto selector = f.create(rawmode::Activated {});

    auto const backend = ExplicitBackend { "MyApp.Backend", { { "socket", "/tmp/app.sock" } } };
    auto const selection = selector->select(backend);
    REQUIRE(std::holds_alternative<ExplicitBackend>(selection));
    CHECK(std::get<ExplicitBackend>(selection) == backend);

    // No detection and no raw mode attempt.
    CHECK(f.mock->attemptCount() == 0);
    CHECK(f.detections == 0);

    CHECK_THROWS_AS(selector->select(BackendKind::Explicit), std::invalid_argument);
}

TEST_CASE("BackendSelector.auto_equals_default", "[backend]")
{
    auto f = Fixture {};
    auto a = f.create(rawmode::Failed { "x" });
    auto const viaDefault = a->select();

    auto g = Fixture {};
    auto b = g.create(rawmode::Failed { "x" });
    CHECK(b->select(BackendKind::Auto) == viaDefault);
}

TEST_CASE("BackendSelector.null_raw_mode", "[backend]")
{
    auto cache = CapabilityCache([]() { return Capabilities {}; });
    auto const env = MapEnvironment {};
    CHECK_THROWS_AS(BackendSelector(nullptr, cache, env), std::invalid_argument);
}

TEST_CASE("BackendSelector.basic_color_guess", "[backend]")
{
    auto caps = Capabilities {};
    caps.terminalType = "xterm-direct";
    BackendSelector::applyBasicColorGuess(caps);
    CHECK(caps.colorMode == ColorMode::TrueColor);
    CHECK(caps.maxColors == TrueColorCount);

    auto plain = Capabilities {};
    plain.terminalType = "foo";
    BackendSelector::applyBasicColorGuess(plain);
    CHECK(plain.colorMode == ColorMode::Indexed16);

    CHECK(BackendSelector::isBasicTerminal("xterm-kitty"));
    CHECK(BackendSelector::isBasicTerminal("vt100"));
    CHECK_FALSE(BackendSelector::isBasicTerminal("foot"));
}

TEST_CASE("BackendSelector.degraded_direct_term", "[backend]")
{
    auto f = Fixture {};
    f.detected.terminalType = "alacritty-direct";
    auto selector = f.create(rawmode::AlreadyClaimed { "busy" });
    auto const selection = selector->select();
    REQUIRE(std::holds_alternative<TtyBackend>(selection));
    CHECK(std::get<TtyBackend>(selection).capabilities.colorMode == ColorMode::TrueColor);
}

TEST_CASE("BackendKind.format", "[backend]")
{
    CHECK(fmt::format("{}", BackendKind::Auto) == "auto");
    CHECK(fmt::format("{}", BackendKind::Explicit) == "explicit");
    CHECK(fmt::format("{}", BackendSelection { ExplicitBackend { "X", {} } }) == "Explicit(X)");
}
