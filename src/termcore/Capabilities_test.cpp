// SPDX-License-Identifier: Apache-2.0
#include <termcore/Capabilities.h>

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace termcore;
using std::optional;

namespace
{

auto const linuxPlatform = Platform(OsFamily::Linux);
auto const windowsPlatform = Platform(OsFamily::Windows);

optional<int> noTermInfo(std::chrono::milliseconds /*timeout*/)
{
    return std::nullopt;
}

MapEnvironment environment(std::map<std::string, std::string, std::less<>> values)
{
    return MapEnvironment(std::move(values));
}

Capabilities detect(Environment const& env, TermInfoQuery query = noTermInfo)
{
    return CapabilityDetector(env, linuxPlatform, DetectorOptions {}, std::move(query)).detect();
}

} // namespace

TEST_CASE("CapabilityDetector.defaults", "[caps]")
{
    auto const caps = detect(environment({}));
    CHECK(caps.colorMode == ColorMode::Indexed16);
    CHECK(caps.maxColors == 16);
    CHECK_FALSE(caps.unicode);
    CHECK_FALSE(caps.mouse);
    CHECK_FALSE(caps.bracketedPaste);
    CHECK_FALSE(caps.focusEvents);
    CHECK(caps.alternateScreen);
    CHECK_FALSE(caps.terminalType.has_value());
    CHECK_FALSE(caps.terminalProgram.has_value());
    CHECK_FALSE(caps.rawModeError.has_value());
}

TEST_CASE("CapabilityDetector.COLORTERM.truecolor", "[caps]")
{
    auto const caps = detect(environment({ { "COLORTERM", "truecolor" } }));
    CHECK(caps.colorMode == ColorMode::TrueColor);
    CHECK(caps.maxColors == 16'777'216);

    // Assumed for every terminal at this tier.
    CHECK(caps.mouse);
    CHECK(caps.bracketedPaste);
    CHECK(caps.focusEvents);
}

TEST_CASE("CapabilityDetector.COLORTERM.24bit", "[caps]")
{
    CHECK(detect(environment({ { "COLORTERM", "24bit" } })).colorMode == ColorMode::TrueColor);
    CHECK(detect(environment({ { "COLORTERM", "yes" } })).colorMode == ColorMode::Indexed16);
    CHECK(detect(environment({ { "COLORTERM", "no-truecolor" } })).colorMode == ColorMode::Indexed16);
    CHECK(detect(environment({ { "COLORTERM", "24bitx" } })).colorMode == ColorMode::Indexed16);
}

TEST_CASE("CapabilityDetector.TERM.exact", "[caps]")
{
    SECTION("linux")
    {
        auto const caps = detect(environment({ { "TERM", "linux" } }));
        CHECK(caps.colorMode == ColorMode::Indexed16);
        CHECK(caps.maxColors == 16);
        CHECK(caps.terminalType == "linux");
    }
    SECTION("dumb")
    {
        auto const caps = detect(environment({ { "TERM", "dumb" } }));
        CHECK(caps.colorMode == ColorMode::Monochrome);
        CHECK(caps.maxColors == 2);
        CHECK_FALSE(caps.mouse);
    }
}

TEST_CASE("CapabilityDetector.TERM.patterns", "[caps]")
{
    CHECK(detect(environment({ { "TERM", "xterm-truecolor" } })).colorMode == ColorMode::TrueColor);
    CHECK(detect(environment({ { "TERM", "foot-24bit" } })).colorMode == ColorMode::TrueColor);
    CHECK(detect(environment({ { "TERM", "rxvt-unicode-256color" } })).colorMode == ColorMode::Indexed256);
    CHECK(detect(environment({ { "TERM", "xterm" } })).colorMode == ColorMode::Indexed256);
    CHECK(detect(environment({ { "TERM", "screen" } })).colorMode == ColorMode::Indexed256);
    CHECK(detect(environment({ { "TERM", "tmux" } })).maxColors == 256);
    CHECK(detect(environment({ { "TERM", "vt100" } })).colorMode == ColorMode::Indexed16);
}

TEST_CASE("CapabilityDetector.TERM.256color_assumes_mouse", "[caps]")
{
    auto const caps = detect(environment({ { "TERM", "xterm-256color" } }));
    CHECK(caps.mouse);
    CHECK(caps.bracketedPaste);
    CHECK_FALSE(caps.focusEvents);
}

TEST_CASE("CapabilityDetector.COLORTERM_overrides_dumb", "[caps]")
{
    auto const caps = detect(environment({ { "TERM", "dumb" }, { "COLORTERM", "truecolor" } }));
    CHECK(caps.colorMode == ColorMode::TrueColor);
    CHECK(caps.maxColors == 16'777'216);
}

TEST_CASE("CapabilityDetector.TERM_PROGRAM", "[caps]")
{
    SECTION("true color emulator")
    {
        auto const caps = detect(environment({ { "TERM_PROGRAM", "iTerm.app" } }));
        CHECK(caps.colorMode == ColorMode::TrueColor);
        CHECK(caps.mouse);
        CHECK(caps.bracketedPaste);
        CHECK(caps.focusEvents);
        CHECK(caps.terminalProgram == "iTerm.app");
    }
    SECTION("256 color emulator")
    {
        auto const caps = detect(environment({ { "TERM_PROGRAM", "Apple_Terminal" } }));
        CHECK(caps.colorMode == ColorMode::Indexed256);
        CHECK(caps.maxColors == 256);
        CHECK(caps.mouse);
        CHECK(caps.bracketedPaste);
        CHECK_FALSE(caps.focusEvents);
    }
    SECTION("unknown emulator")
    {
        auto const caps = detect(environment({ { "TERM_PROGRAM", "my-term" } }));
        CHECK(caps.colorMode == ColorMode::Indexed16);
        CHECK_FALSE(caps.mouse);
        CHECK(caps.terminalProgram == "my-term");
    }
    SECTION("does not lower TERM")
    {
        auto const caps = detect(
            environment({ { "TERM", "xterm-direct-truecolor" }, { "TERM_PROGRAM", "Apple_Terminal" } }));
        CHECK(caps.colorMode == ColorMode::TrueColor);
        CHECK(caps.maxColors == 16'777'216);
    }
}

TEST_CASE("CapabilityDetector.unicode", "[caps]")
{
    CHECK(detect(environment({ { "LANG", "en_US.UTF-8" } })).unicode);
    CHECK(detect(environment({ { "LANG", "de_DE.utf8" } })).unicode);
    CHECK_FALSE(detect(environment({ { "LANG", "C" } })).unicode);

    // LC_ALL wins over LC_CTYPE wins over LANG.
    CHECK_FALSE(detect(environment({ { "LC_ALL", "C" }, { "LANG", "en_US.UTF-8" } })).unicode);
    CHECK(detect(environment({ { "LC_CTYPE", "en_US.UTF-8" }, { "LANG", "C" } })).unicode);

    // Empty variables are skipped.
    CHECK(detect(environment({ { "LC_ALL", "" }, { "LC_CTYPE", "" }, { "LANG", "C.UTF-8" } })).unicode);
}

TEST_CASE("CapabilityDetector.terminfo", "[caps]")
{
    auto const env = MapEnvironment {};

    SECTION("256 colors raise the tier")
    {
        auto const caps = detect(env, [](auto) { return optional<int> { 256 }; });
        CHECK(caps.colorMode == ColorMode::Indexed256);
        CHECK(caps.maxColors == 256);
    }
    SECTION("direct color raises the tier")
    {
        auto const caps = detect(env, [](auto) { return optional<int> { 16'777'216 }; });
        CHECK(caps.colorMode == ColorMode::TrueColor);
    }
    SECTION("8 colors only raise max colors")
    {
        auto const caps = detect(environment({ { "TERM", "dumb" } }), [](auto) { return optional<int> { 8 }; });
        CHECK(caps.colorMode == ColorMode::Monochrome);
        CHECK(caps.maxColors == 8);
    }
    SECTION("fewer than 8 colors are ignored")
    {
        auto const caps = detect(environment({ { "TERM", "dumb" } }), [](auto) { return optional<int> { 2 }; });
        CHECK(caps.colorMode == ColorMode::Monochrome);
        CHECK(caps.maxColors == 2);
    }
    SECTION("never lowers")
    {
        auto const caps =
            detect(environment({ { "COLORTERM", "truecolor" } }), [](auto) { return optional<int> { 256 }; });
        CHECK(caps.colorMode == ColorMode::TrueColor);
        CHECK(caps.maxColors == 16'777'216);
    }
    SECTION("no information")
    {
        CHECK(detect(env) == detect(environment({})));
    }
}

TEST_CASE("CapabilityDetector.terminfo.options", "[caps]")
{
    auto const env = MapEnvironment {};
    auto calls = 0;
    auto timeoutSeen = std::chrono::milliseconds {};
    auto query = [&](std::chrono::milliseconds timeout) -> optional<int> {
        ++calls;
        timeoutSeen = timeout;
        return 256;
    };

    SECTION("timeout is passed on")
    {
        auto const options =
            DetectorOptions { .queryTermInfo = true, .termInfoTimeout = std::chrono::milliseconds(42) };
        (void) CapabilityDetector(env, linuxPlatform, options, query).detect();
        CHECK(calls == 1);
        CHECK(timeoutSeen == std::chrono::milliseconds(42));
    }
    SECTION("disabled")
    {
        auto const options = DetectorOptions { .queryTermInfo = false };
        auto const caps = CapabilityDetector(env, linuxPlatform, options, query).detect();
        CHECK(calls == 0);
        CHECK(caps.colorMode == ColorMode::Indexed16);
    }
    SECTION("platform without terminfo")
    {
        (void) CapabilityDetector(env, windowsPlatform, DetectorOptions {}, query).detect();
        CHECK(calls == 0);
    }
}

TEST_CASE("CapabilityDetector.monotonic", "[caps]")
{
    // Sources applied in any order agree on the final tier.
    auto a = Capabilities {};
    CapabilityDetector::applyColorTerm(a, "truecolor");
    CHECK(a.colorMode == ColorMode::TrueColor);
    CapabilityDetector::applyTerm(a, std::string("xterm-256color"));
    CHECK(a.colorMode == ColorMode::TrueColor);
    CapabilityDetector::applyTerm(a, std::string("dumb"));
    CHECK(a.colorMode == ColorMode::TrueColor);
    CapabilityDetector::applyTermInfoColors(a, 16);
    CHECK(a.colorMode == ColorMode::TrueColor);

    auto b = Capabilities {};
    CapabilityDetector::applyTerm(b, std::string("dumb"));
    CapabilityDetector::applyTerm(b, std::string("xterm-256color"));
    CHECK(b.colorMode == ColorMode::Indexed256);
    CapabilityDetector::applyTermInfoColors(b, 16);
    CHECK(b.colorMode == ColorMode::Indexed256);
    CapabilityDetector::applyColorTerm(b, "truecolor");

    a.terminalType.reset();
    b.terminalType.reset();
    CHECK(a == b);
}

TEST_CASE("Capabilities.upgradeColorMode", "[caps]")
{
    auto caps = Capabilities {};
    caps.upgradeColorMode(ColorMode::Indexed256, 256);
    CHECK(caps.colorMode == ColorMode::Indexed256);
    CHECK(caps.maxColors == 256);

    caps.upgradeColorMode(ColorMode::Indexed16, 16);
    CHECK(caps.colorMode == ColorMode::Indexed256);
    CHECK(caps.maxColors == 256);
}

TEST_CASE("ColorMode.format", "[caps]")
{
    CHECK(fmt::format("{}", ColorMode::Monochrome) == "monochrome");
    CHECK(fmt::format("{}", ColorMode::TrueColor) == "true_color");
    CHECK(colorCount(ColorMode::Indexed256) == 256);
    static_assert(rank(ColorMode::Monochrome) < rank(ColorMode::Indexed16));
    static_assert(rank(ColorMode::Indexed256) < rank(ColorMode::TrueColor));
}

TEST_CASE("CapabilityCache.lazy", "[caps]")
{
    auto detections = 0;
    auto cache = CapabilityCache([&]() {
        ++detections;
        auto caps = Capabilities {};
        caps.maxColors = 16 + detections;
        return caps;
    });

    CHECK_FALSE(cache.cached());
    CHECK(detections == 0);

    auto const first = cache.get();
    CHECK(cache.cached());
    CHECK(detections == 1);
    CHECK(cache.get() == first);
    CHECK(detections == 1);
}

TEST_CASE("CapabilityCache.invalidate", "[caps]")
{
    auto detections = 0;
    auto cache = CapabilityCache([&]() {
        ++detections;
        return Capabilities {};
    });

    // Invalidating an empty cache is fine.
    cache.invalidate();
    cache.invalidate();
    CHECK_FALSE(cache.cached());

    (void) cache.get();
    cache.invalidate();
    CHECK_FALSE(cache.cached());
    (void) cache.get();
    CHECK(detections == 2);
}

TEST_CASE("CapabilityCache.store", "[caps]")
{
    auto cache = CapabilityCache([]() { return Capabilities {}; });
    auto caps = Capabilities {};
    caps.colorMode = ColorMode::TrueColor;
    caps.maxColors = TrueColorCount;
    cache.store(caps);

    CHECK(cache.supportsTrueColor());
    CHECK(cache.supports256Color());
    CHECK(cache.colorMode() == ColorMode::TrueColor);
    CHECK_FALSE(cache.supportsMouse());
    CHECK(cache.supportsAlternateScreen());
}

TEST_CASE("CapabilityCache.concurrent_readers", "[caps]")
{
    auto const mono = []() {
        auto caps = Capabilities {};
        caps.colorMode = ColorMode::Monochrome;
        caps.maxColors = 2;
        return caps;
    }();
    auto const truecolor = []() {
        auto caps = Capabilities {};
        caps.colorMode = ColorMode::TrueColor;
        caps.maxColors = TrueColorCount;
        return caps;
    }();

    auto flip = std::atomic<bool> { false };
    auto cache = CapabilityCache([&]() { return flip.exchange(!flip.load()) ? mono : truecolor; });

    auto torn = std::atomic<int> { 0 };
    auto readers = std::vector<std::thread> {};
    for (int i = 0; i < 4; ++i)
        readers.emplace_back([&]() {
            for (int k = 0; k < 2000; ++k)
            {
                auto const caps = cache.get();
                if (*caps != mono && *caps != truecolor)
                    ++torn;
            }
        });

    for (int k = 0; k < 500; ++k)
    {
        cache.invalidate();
        (void) cache.detect();
    }

    for (auto& reader: readers)
        reader.join();

    CHECK(torn.load() == 0);
}
