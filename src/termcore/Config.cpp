// SPDX-License-Identifier: Apache-2.0
#include <termcore/Config.h>
#include <termcore/logging.h>

#include <crispy/utils.h>

#include <fmt/chrono.h>

using std::optional;
using std::string;
using std::string_view;

namespace fs = std::filesystem;

namespace termcore::config
{

namespace
{
    template <typename T>
    void loadEnum(logstore::category const& logger,
                  YAML::Node const& node,
                  std::string const& entry,
                  T& where,
                  optional<T> (*parse)(string_view))
    {
        auto const child = node[entry];
        if (!child)
            return;

        auto const text = child.as<string>();
        if (auto const value = parse(text))
        {
            where = *value;
            logger()("Loading entry: {}, value {}", entry, where);
        }
        else
            logger()("Invalid value {} for entry {}, keeping {}.", text, entry, where);
    }
} // namespace

// {{{ BackendConfig
SessionOptions BackendConfig::sessionOptions() const
{
    auto options = SessionOptions {};
    options.alternateScreen = alternateScreen;
    options.mouseTracking = mouseTracking;
    options.bracketedPaste = bracketedPaste;
    options.focusEvents = focusEvents;
    options.characterSet = characterSet;
    options.fallbackCharacterSet = fallbackCharacterSet;
    options.lineMode = lineMode;
    return options;
}

DetectorOptions BackendConfig::detectorOptions() const
{
    return DetectorOptions { .queryTermInfo = termInfoEnabled, .termInfoTimeout = termInfoTimeout };
}

optional<ExplicitBackend> BackendConfig::explicitSelection() const
{
    if (backend != BackendKind::Explicit)
        return std::nullopt;
    return ExplicitBackend { explicitBackend, explicitOptions };
}
// }}}

// {{{ value parsers
optional<BackendKind> parseBackendKind(string_view text)
{
    auto const value = crispy::toLower(crispy::trim(text));
    if (value == "auto")
        return BackendKind::Auto;
    if (value == "raw")
        return BackendKind::Raw;
    if (value == "tty")
        return BackendKind::Tty;
    if (value == "explicit")
        return BackendKind::Explicit;
    return std::nullopt;
}

optional<CharacterSet> parseCharacterSet(string_view text)
{
    auto const value = crispy::toLower(crispy::trim(text));
    if (value == "unicode")
        return CharacterSet::Unicode;
    if (value == "ascii")
        return CharacterSet::Ascii;
    return std::nullopt;
}

optional<LineMode> parseLineMode(string_view text)
{
    auto const value = crispy::toLower(crispy::trim(text));
    if (value == "full_redraw")
        return LineMode::FullRedraw;
    if (value == "incremental")
        return LineMode::Incremental;
    return std::nullopt;
}

optional<MouseTracking> parseMouseTracking(string_view text)
{
    auto const value = crispy::toLower(crispy::trim(text));
    if (value == "none")
        return MouseTracking::None;
    if (value == "x10")
        return MouseTracking::X10;
    if (value == "normal")
        return MouseTracking::Normal;
    if (value == "button")
        return MouseTracking::Button;
    if (value == "any")
        return MouseTracking::Any;
    return std::nullopt;
}
// }}}

// {{{ YAMLConfigReader
YAMLConfigReader YAMLConfigReader::fromFile(fs::path const& fileName, logstore::category const& log)
{
    auto ec = std::error_code {};
    if (!fs::exists(fileName, ec))
    {
        log()("Configuration file {} does not exist, using defaults.", fileName.string());
        return YAMLConfigReader(YAML::Node {}, log);
    }

    try
    {
        return YAMLConfigReader(YAML::LoadFile(fileName.string()), log);
    }
    catch (std::exception const& e)
    {
        errorlog()("Configuration file is corrupted. {}\nDefault config will be loaded.", e.what());
        return YAMLConfigReader(YAML::Node {}, log);
    }
}

YAMLConfigReader YAMLConfigReader::fromString(string const& text, logstore::category const& log)
{
    try
    {
        return YAMLConfigReader(YAML::Load(text), log);
    }
    catch (std::exception const& e)
    {
        errorlog()("Configuration is corrupted. {}\nDefault config will be loaded.", e.what());
        return YAMLConfigReader(YAML::Node {}, log);
    }
}

void YAMLConfigReader::load(BackendConfig& c)
{
    if (!doc || doc.IsNull())
        return;

    if (!doc.IsMap())
    {
        errorlog()("Configuration must be a mapping of entries. Default config will be loaded.");
        return;
    }

    loadEntry(doc, "backend", c.backend);
    loadEntry(doc, "explicit_backend", c.explicitBackend);
    loadEntry(doc, "explicit_options", c.explicitOptions);
    loadEntry(doc, "character_set", c.characterSet);
    loadEntry(doc, "fallback_character_set", c.fallbackCharacterSet);
    loadEntry(doc, "log", c.logFilter);

    if (auto const tty = doc["tty"]; tty && tty.IsMap())
        loadEntry(tty, "line_mode", c.lineMode);

    if (auto const raw = doc["raw"]; raw && raw.IsMap())
    {
        loadEntry(raw, "alternate_screen", c.alternateScreen);
        loadEntry(raw, "mouse_tracking", c.mouseTracking);
        loadEntry(raw, "bracketed_paste", c.bracketedPaste);
        loadEntry(raw, "focus_events", c.focusEvents);
    }

    if (auto const terminfo = doc["terminfo"]; terminfo && terminfo.IsMap())
    {
        loadEntry(terminfo, "enabled", c.termInfoEnabled);
        loadEntry(terminfo, "timeout_ms", c.termInfoTimeout);
    }

    if (c.backend == BackendKind::Explicit && c.explicitBackend.empty())
    {
        logger()("Backend \"explicit\" requires explicit_backend to be set, falling back to auto.");
        c.backend = BackendKind::Auto;
    }
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, std::string& where)
{
    if (auto const child = node[entry]; child)
        where = child.as<string>();
    logger()("Loading entry: {}, value {}", entry, where);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     std::chrono::milliseconds& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    auto const value = child.as<int>();
    if (value <= 0)
    {
        logger()("Invalid value {} for entry {}, keeping {}.", value, entry, where);
        return;
    }
    where = std::chrono::milliseconds(value);
    logger()("Loading entry: {}, value {}", entry, where);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node,
                                     std::string const& entry,
                                     std::map<std::string, std::string>& where)
{
    auto const child = node[entry];
    if (!child)
        return;

    if (!child.IsMap())
    {
        logger()("Entry {} must be a mapping, ignoring it.", entry);
        return;
    }

    for (auto const& option: child)
    {
        auto const name = option.first.as<string>();
        where[name] = option.second.as<string>();
        logger()("Loading map entry: {}.{}, value {}", entry, name, where[name]);
    }
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, BackendKind& where)
{
    loadEnum(logger, node, entry, where, &parseBackendKind);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, CharacterSet& where)
{
    loadEnum(logger, node, entry, where, &parseCharacterSet);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, LineMode& where)
{
    loadEnum(logger, node, entry, where, &parseLineMode);
}

void YAMLConfigReader::loadFromEntry(YAML::Node const& node, std::string const& entry, MouseTracking& where)
{
    loadEnum(logger, node, entry, where, &parseMouseTracking);
}
// }}}

fs::path configHome(Environment const& env)
{
    if (auto const xdg = env.nonEmpty("XDG_CONFIG_HOME"))
        return fs::path { *xdg } / "termcore";
    if (auto const home = env.nonEmpty("HOME"))
        return fs::path { *home } / ".config" / "termcore";
    if (auto const appData = env.nonEmpty("LOCALAPPDATA"))
        return fs::path { *appData } / "termcore";
    return fs::path { "." };
}

fs::path defaultConfigFilePath(Environment const& env)
{
    return configHome(env) / "termcore.yml";
}

BackendConfig loadConfigFromFile(fs::path const& fileName, CapabilityCache& cache)
{
    configLog()("Loading configuration from file: {}", fileName.string());

    auto config = BackendConfig {};
    config.configFile = fileName;
    YAMLConfigReader::fromFile(fileName, configLog).load(config);
    cache.invalidate();
    return config;
}

BackendConfig loadConfigFromString(string const& text, CapabilityCache& cache)
{
    auto config = BackendConfig {};
    YAMLConfigReader::fromString(text, configLog).load(config);
    cache.invalidate();
    return config;
}

} // namespace termcore::config
