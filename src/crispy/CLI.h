// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace crispy::cli
{

using value = std::variant<int, unsigned int, std::string, double, bool>;
using name = std::string;

enum class presence : uint8_t
{
    Optional,
    Required,
};

struct option_name
{
    char shortName {};
    std::string_view longName {};

    option_name(char shortName, std::string_view longName): shortName { shortName }, longName { longName } {}
    option_name(std::string_view longName): longName { longName } {}
    option_name(char const* longName): longName { longName } {}
};

struct option
{
    option_name name;
    value v;
    std::string_view helpText = {};
    std::string_view placeholder = {};
    cli::presence presence = presence::Optional;
};

using option_list = std::vector<option>;

struct command
{
    std::string_view name;
    std::string_view helpText = {};
    option_list options = {};
    std::vector<command> children = {};
};

using command_list = std::vector<command>;

class parser_error: public std::runtime_error
{
  public:
    explicit parser_error(std::string const& msg): std::runtime_error(msg) {}
};

/// Parsed command line. Keys are the dot-joined command path, e.g.
/// "app" and "app.sub" for commands and "app.sub.option" for options.
struct flag_store
{
    std::map<name, value> values;

    [[nodiscard]] bool boolean(std::string const& key) const { return std::get<bool>(values.at(key)); }
    [[nodiscard]] int integer(std::string const& key) const { return std::get<int>(values.at(key)); }
    [[nodiscard]] unsigned uint(std::string const& key) const { return std::get<unsigned>(values.at(key)); }
    [[nodiscard]] double real(std::string const& key) const { return std::get<double>(values.at(key)); }
    [[nodiscard]] std::string const& str(std::string const& key) const
    {
        return std::get<std::string>(values.at(key));
    }

    template <typename T>
    [[nodiscard]] T get(std::string const& key) const
    {
        return std::get<T>(values.at(key));
    }
};

using string_view_list = std::vector<std::string_view>;

/**
 * Parses the command line arguments with respect to @p command as passed via @p args.
 *
 * Options are accepted as `--NAME=VALUE`, `--NAME VALUE`, `-N VALUE` or `NAME VALUE`.
 * Boolean options given without a value are set to true.
 *
 * @returns the parsed flags, or std::nullopt if unrecognized arguments remain.
 * @throws parser_error on malformed values or missing required options.
 */
std::optional<flag_store> parse(command const& command, string_view_list const& args);

/**
 * Parses the command line arguments with respect to @p command as passed via (argc, argv) suitable
 * for a general main() functions's argc and argv.
 */
std::optional<flag_store> parse(command const& command, int argc, char const* const* argv);

/// Constructs a help text listing the options and sub commands of @p command.
std::string helpText(command const& command);

} // namespace crispy::cli

template <>
struct fmt::formatter<crispy::cli::value>: fmt::formatter<std::string>
{
    auto format(crispy::cli::value const& value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(std::visit([](auto const& v) { return fmt::format("{}", v); }, value),
                                              ctx);
    }
};
