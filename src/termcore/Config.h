// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <termcore/BackendSelector.h>
#include <termcore/Capabilities.h>
#include <termcore/Encoder.h>
#include <termcore/Environment.h>
#include <termcore/Sequences.h>
#include <termcore/Session.h>

#include <crispy/logstore.h>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace termcore::config
{

/// Backend configuration, as read from termcore.yml.
///
/// Every entry has a default, so an absent or unreadable file yields a
/// working configuration.
struct BackendConfig
{
    std::filesystem::path configFile;

    BackendKind backend = BackendKind::Auto;
    std::string explicitBackend;
    std::map<std::string, std::string> explicitOptions;

    CharacterSet characterSet = CharacterSet::Unicode;
    CharacterSet fallbackCharacterSet = CharacterSet::Ascii;

    // tty
    LineMode lineMode = LineMode::FullRedraw;

    // raw
    bool alternateScreen = true;
    MouseTracking mouseTracking = MouseTracking::Normal;
    bool bracketedPaste = true;
    bool focusEvents = true;

    // terminfo
    bool termInfoEnabled = true;
    std::chrono::milliseconds termInfoTimeout { 500 };

    /// logstore filter, such as "termcore.*" or "all".
    std::string logFilter;

    [[nodiscard]] SessionOptions sessionOptions() const;
    [[nodiscard]] DetectorOptions detectorOptions() const;

    /// @returns the explicit backend to select, if the backend is "explicit".
    [[nodiscard]] std::optional<ExplicitBackend> explicitSelection() const;
};

struct YAMLConfigReader
{
    YAML::Node doc;
    logstore::category const& logger;

    YAMLConfigReader(YAML::Node document, logstore::category const& log):
        doc { std::move(document) }, logger { log }
    {
    }

    /// Parses @p fileName. A missing or corrupt file results in an empty document.
    static YAMLConfigReader fromFile(std::filesystem::path const& fileName, logstore::category const& log);

    /// Parses @p text. Corrupt text results in an empty document.
    static YAMLConfigReader fromString(std::string const& text, logstore::category const& log);

    void load(BackendConfig& c);

    /// Loads a single entry, keeping the current value if it cannot be read.
    template <typename T>
    void loadEntry(YAML::Node const& node, std::string const& entry, T& where)
    {
        try
        {
            loadFromEntry(node, entry, where);
        }
        catch (std::exception const& e)
        {
            logger()("Failed to load entry {}, default value will be used. {}", entry, e.what());
        }
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    void loadFromEntry(YAML::Node const& node, std::string const& entry, T& where)
    {
        auto const child = node[entry];
        if (child)
            where = child.as<T>();
        logger()("Loading entry: {}, value {}", entry, where);
    }

    void loadFromEntry(YAML::Node const& node, std::string const& entry, std::string& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, std::chrono::milliseconds& where);
    void loadFromEntry(YAML::Node const& node,
                       std::string const& entry,
                       std::map<std::string, std::string>& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, BackendKind& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, CharacterSet& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, LineMode& where);
    void loadFromEntry(YAML::Node const& node, std::string const& entry, MouseTracking& where);
};

[[nodiscard]] std::optional<BackendKind> parseBackendKind(std::string_view text);
[[nodiscard]] std::optional<CharacterSet> parseCharacterSet(std::string_view text);
[[nodiscard]] std::optional<LineMode> parseLineMode(std::string_view text);
[[nodiscard]] std::optional<MouseTracking> parseMouseTracking(std::string_view text);

/// Directory holding the configuration: $XDG_CONFIG_HOME/termcore or ~/.config/termcore.
[[nodiscard]] std::filesystem::path configHome(Environment const& env);

[[nodiscard]] std::filesystem::path defaultConfigFilePath(Environment const& env);

/// Reads the configuration from @p fileName.
///
/// Reading a configuration counts as a reconfiguration, so @p cache is invalidated.
[[nodiscard]] BackendConfig loadConfigFromFile(std::filesystem::path const& fileName,
                                               CapabilityCache& cache = CapabilityCache::global());

/// Reads the configuration from YAML @p text; @p cache is invalidated.
[[nodiscard]] BackendConfig loadConfigFromString(std::string const& text,
                                                 CapabilityCache& cache = CapabilityCache::global());

} // namespace termcore::config
