// SPDX-License-Identifier: Apache-2.0
#include <termcore/Config.h>

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace std::chrono_literals;
using namespace termcore;
using namespace termcore::config;

namespace fs = std::filesystem;

namespace
{

struct CountingCache
{
    int detections = 0;
    CapabilityCache cache { [this]() {
        ++detections;
        return Capabilities {};
    } };

    CountingCache() { (void) cache.get(); }
};

} // namespace

TEST_CASE("Config.defaults", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("", c.cache);
    CHECK(config.backend == BackendKind::Auto);
    CHECK(config.characterSet == CharacterSet::Unicode);
    CHECK(config.fallbackCharacterSet == CharacterSet::Ascii);
    CHECK(config.lineMode == LineMode::FullRedraw);
    CHECK(config.alternateScreen);
    CHECK(config.mouseTracking == MouseTracking::Normal);
    CHECK(config.bracketedPaste);
    CHECK(config.focusEvents);
    CHECK(config.termInfoEnabled);
    CHECK(config.termInfoTimeout == 500ms);
    CHECK(config.logFilter.empty());
}

TEST_CASE("Config.load", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString(R"(
backend: tty
character_set: ascii
fallback_character_set: unicode
log: termcore.*
tty:
    line_mode: incremental
raw:
    alternate_screen: false
    mouse_tracking: any
    bracketed_paste: false
    focus_events: false
terminfo:
    enabled: false
    timeout_ms: 250
)",
                                             c.cache);

    CHECK(config.backend == BackendKind::Tty);
    CHECK(config.characterSet == CharacterSet::Ascii);
    CHECK(config.fallbackCharacterSet == CharacterSet::Unicode);
    CHECK(config.logFilter == "termcore.*");
    CHECK(config.lineMode == LineMode::Incremental);
    CHECK_FALSE(config.alternateScreen);
    CHECK(config.mouseTracking == MouseTracking::Any);
    CHECK_FALSE(config.bracketedPaste);
    CHECK_FALSE(config.focusEvents);
    CHECK_FALSE(config.termInfoEnabled);
    CHECK(config.termInfoTimeout == 250ms);

    auto const options = config.sessionOptions();
    CHECK_FALSE(options.alternateScreen);
    CHECK(options.mouseTracking == MouseTracking::Any);
    CHECK(options.characterSet == CharacterSet::Ascii);
    CHECK(options.lineMode == LineMode::Incremental);

    auto const detector = config.detectorOptions();
    CHECK_FALSE(detector.queryTermInfo);
    CHECK(detector.termInfoTimeout == 250ms);
    CHECK_FALSE(config.explicitSelection().has_value());
}

TEST_CASE("Config.invalid_values", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString(R"(
backend: quantum
character_set: ebcdic
raw:
    mouse_tracking: sometimes
    bracketed_paste: maybe
terminfo:
    timeout_ms: 0
)",
                                             c.cache);

    CHECK(config.backend == BackendKind::Auto);
    CHECK(config.characterSet == CharacterSet::Unicode);
    CHECK(config.mouseTracking == MouseTracking::Normal);
    CHECK(config.bracketedPaste);
    CHECK(config.termInfoTimeout == 500ms);
}

TEST_CASE("Config.negative_timeout", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("terminfo:\n  timeout_ms: -20\n", c.cache);
    CHECK(config.termInfoTimeout == 500ms);
}

TEST_CASE("Config.case_insensitive", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("backend: ' RAW '\ntty:\n  line_mode: Full_Redraw\n", c.cache);
    CHECK(config.backend == BackendKind::Raw);
    CHECK(config.lineMode == LineMode::FullRedraw);
}

TEST_CASE("Config.corrupt", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("backend: [tty\nraw: {", c.cache);
    CHECK(config.backend == BackendKind::Auto);
    CHECK(config.alternateScreen);
}

TEST_CASE("Config.not_a_mapping", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("- backend\n- tty\n", c.cache);
    CHECK(config.backend == BackendKind::Auto);
}

TEST_CASE("Config.sections_not_mappings", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("raw: true\ntty: 3\nbackend: tty\n", c.cache);
    CHECK(config.backend == BackendKind::Tty);
    CHECK(config.alternateScreen);
    CHECK(config.lineMode == LineMode::FullRedraw);
}

TEST_CASE("Config.explicit", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString(R"(
backend: explicit
explicit_backend: MyApp.Backend
explicit_options:
    socket: /tmp/app.sock
    mode: fast
)",
                                             c.cache);

    CHECK(config.backend == BackendKind::Explicit);
    auto const selection = config.explicitSelection();
    REQUIRE(selection.has_value());
    CHECK(selection->name == "MyApp.Backend");
    CHECK(selection->options.size() == 2);
    CHECK(selection->options.at("socket") == "/tmp/app.sock");
    CHECK(selection->options.at("mode") == "fast");
}

TEST_CASE("Config.explicit_without_name", "[config]")
{
    auto c = CountingCache {};
    auto const config = loadConfigFromString("backend: explicit\nexplicit_options: nothing\n", c.cache);
    CHECK(config.backend == BackendKind::Auto);
    CHECK(config.explicitOptions.empty());
    CHECK_FALSE(config.explicitSelection().has_value());
}

TEST_CASE("Config.invalidates_cache", "[config]")
{
    auto c = CountingCache {};
    REQUIRE(c.cache.cached());
    REQUIRE(c.detections == 1);

    (void) loadConfigFromString("backend: tty\n", c.cache);
    CHECK_FALSE(c.cache.cached());

    (void) c.cache.get();
    CHECK(c.detections == 2);
}

TEST_CASE("Config.file", "[config]")
{
    auto const fileName = fs::temp_directory_path() / "termcore_config_test.yml";
    {
        auto file = std::ofstream(fileName);
        file << "backend: raw\nraw:\n  mouse_tracking: button\n";
    }

    auto c = CountingCache {};
    auto const config = loadConfigFromFile(fileName, c.cache);
    CHECK(config.configFile == fileName);
    CHECK(config.backend == BackendKind::Raw);
    CHECK(config.mouseTracking == MouseTracking::Button);
    CHECK_FALSE(c.cache.cached());

    fs::remove(fileName);
}

TEST_CASE("Config.file.missing", "[config]")
{
    auto c = CountingCache {};
    auto const fileName = fs::temp_directory_path() / "termcore_config_test_missing.yml";
    fs::remove(fileName);
    auto const config = loadConfigFromFile(fileName, c.cache);
    CHECK(config.backend == BackendKind::Auto);
    CHECK_FALSE(c.cache.cached());
}

TEST_CASE("Config.parse", "[config]")
{
    CHECK(parseBackendKind("explicit") == BackendKind::Explicit);
    CHECK_FALSE(parseBackendKind("").has_value());
    CHECK(parseCharacterSet("Unicode") == CharacterSet::Unicode);
    CHECK(parseLineMode("incremental") == LineMode::Incremental);
    CHECK_FALSE(parseLineMode("partial").has_value());
    CHECK(parseMouseTracking("x10") == MouseTracking::X10);
    CHECK(parseMouseTracking("none") == MouseTracking::None);
}

TEST_CASE("Config.configHome", "[config]")
{
    auto env = MapEnvironment {};
    CHECK(configHome(env) == fs::path { "." });

    env.set("LOCALAPPDATA", "C:/Users/me/AppData/Local");
    CHECK(configHome(env) == fs::path { "C:/Users/me/AppData/Local" } / "termcore");

    env.set("HOME", "/home/me");
    CHECK(configHome(env) == fs::path { "/home/me/.config/termcore" });

    env.set("XDG_CONFIG_HOME", "");
    CHECK(configHome(env) == fs::path { "/home/me/.config/termcore" });

    env.set("XDG_CONFIG_HOME", "/etc/xdg");
    CHECK(configHome(env) == fs::path { "/etc/xdg/termcore" });
    CHECK(defaultConfigFilePath(env) == fs::path { "/etc/xdg/termcore/termcore.yml" });
}
