// SPDX-License-Identifier: Apache-2.0
#include <crispy/CLI.h>
#include <crispy/utils.h>

#include <algorithm>
#include <deque>
#include <numeric>
#include <utility>

/*
    Grammar
    =======

        CLI        := Command
        Command    := NAME Option* SubCommand?
        Option     := NAME [Value]
        SubCommand := Command

        Value      := STR | BOOL | FLOAT | INT | UINT
        NAME       := <name without = or leading -'s>

    Examples
    ========

        termcore-probe --config=probe.yml --log 'termcore.*'
        termcore-probe -c probe.yml help
        termcore-probe config probe.yml
*/

using std::deque;
using std::holds_alternative;
using std::nullopt;
using std::optional;
using std::pair;
using std::string;
using std::string_view;

namespace crispy::cli
{

namespace // {{{ helper
{
    struct parse_context
    {
        string_view_list const& args;
        size_t pos = 0;

        deque<command const*> currentCommand = {};
        option const* currentOption = nullptr;

        flag_store output = {};
    };

    string namePrefix(parse_context const& context)
    {
        auto output = string {};
        for (auto const* cmd: context.currentCommand)
        {
            if (!output.empty())
                output += '.';
            output += cmd->name;
        }
        return output;
    }

    string_view currentToken(parse_context const& context)
    {
        if (context.pos >= context.args.size())
            return {};
        return context.args[context.pos];
    }

    string_view consumeToken(parse_context& context)
    {
        if (context.pos >= context.args.size())
            throw parser_error("Not enough arguments specified.");
        return context.args[context.pos++];
    }

    bool isTrue(string_view token)
    {
        return token == "true" || token == "yes";
    }

    bool isFalse(string_view token)
    {
        return token == "false" || token == "no";
    }

    option const* findOption(parse_context const& context, string_view name)
    {
        for (auto const& option: context.currentCommand.back()->options)
            if (name == option.name.longName || (name.size() == 1 && name[0] == option.name.shortName))
                return &option;
        return nullptr;
    }

    /// Parses the given parameter value @p text with respect to the current option's type.
    value parseValue(parse_context& context, string_view text) // {{{
    {
        auto const& v = context.currentOption->v;

        if (holds_alternative<bool>(v))
        {
            if (isTrue(text))
                return value { true };
            if (isFalse(text))
                return value { false };
            throw parser_error(
                fmt::format("Boolean value expected for {} but got \"{}\".", context.currentOption->name.longName, text));
        }

        if (holds_alternative<double>(v))
        {
            try
            {
                return value { std::stod(string(text)) };
            }
            catch (std::exception const&)
            {
                throw parser_error(fmt::format("Floating point value expected for {} but got \"{}\".",
                                               context.currentOption->name.longName,
                                               text));
            }
        }

        if (holds_alternative<unsigned>(v))
        {
            if (auto const number = to_integer<unsigned>(text))
                return value { *number };
            throw parser_error(fmt::format("Unsigned integer value expected for {} but got \"{}\".",
                                           context.currentOption->name.longName,
                                           text));
        }

        if (holds_alternative<int>(v))
        {
            if (auto const number = to_integer<int>(text))
                return value { *number };
            throw parser_error(fmt::format(
                "Integer value expected for {} but got \"{}\".", context.currentOption->name.longName, text));
        }

        return value { string(text) };
    } // }}}

    value parseValue(parse_context& context)
    {
        if (holds_alternative<bool>(context.currentOption->v))
        {
            auto const text = currentToken(context);
            if (isTrue(text) || isFalse(text))
                return parseValue(context, consumeToken(context));

            // Booleans can be specified just by `--flag` or `flag` and are then true.
            return value { true };
        }
        return parseValue(context, consumeToken(context));
    }

    struct scoped_option
    {
        parse_context& context;
        scoped_option(parse_context& context, option const& option): context { context }
        {
            context.currentOption = &option;
        }
        ~scoped_option() { context.currentOption = nullptr; }
    };

    struct scoped_command
    {
        parse_context& context;
        scoped_command(parse_context& context, command const& command): context { context }
        {
            context.currentCommand.emplace_back(&command);
        }
        ~scoped_command() { context.currentCommand.pop_back(); }
    };

    /// Tries parsing an option name and, if matching, its value.
    ///
    /// @returns std::nullopt if the current token names no option of the current command.
    optional<pair<option const*, value>> tryParseOption(parse_context& context)
    {
        auto current = currentToken(context);

        if (current.starts_with("--"))
        {
            if (auto const i = current.find('='); i != string_view::npos)
            {
                // --NAME=VALUE
                auto const valueText = current.substr(i + 1);
                if (option const* opt = findOption(context, current.substr(2, i - 2)))
                {
                    consumeToken(context);
                    if (valueText.empty() && !holds_alternative<string>(opt->v))
                        throw parser_error("Explicit empty value passed but a non-string value expected.");
                    auto const optionScope = scoped_option { context, *opt };
                    return pair { opt, parseValue(context, valueText) };
                }
                return nullopt;
            }
            current.remove_prefix(2);
        }
        else if (current.starts_with("-"))
            current.remove_prefix(1);

        // --NAME [VALUE], -N [VALUE], NAME [VALUE]
        if (option const* opt = findOption(context, current))
        {
            consumeToken(context);
            auto const optionScope = scoped_option { context, *opt };
            return pair { opt, parseValue(context) };
        }

        return nullopt;
    }

    void parseOptionList(parse_context& context)
    {
        auto const optionPrefix = namePrefix(context);
        while (auto parsed = tryParseOption(context))
        {
            auto& [option, v] = *parsed;
            context.output.values[optionPrefix + "." + name(option->name.longName)] = std::move(v);
        }
    }

    command const* tryLookupCommand(parse_context const& context)
    {
        auto token = currentToken(context);
        if (token.starts_with("--"))
            token.remove_prefix(2);

        for (command const& child: context.currentCommand.back()->children)
            if (token == child.name)
                return &child;

        return nullptr;
    }

    void prefillDefaults(parse_context& context, command const& com)
    {
        auto const commandScope = scoped_command { context, com };
        auto const prefix = namePrefix(context) + ".";

        for (option const& option: com.options)
            if (option.presence == presence::Optional)
                context.output.values[prefix + name(option.name.longName)] = option.v;

        for (command const& child: com.children)
        {
            context.output.values[prefix + name(child.name)] = value { false };
            prefillDefaults(context, child);
        }
    }

    bool parseCommand(command const& com, parse_context& context)
    {
        auto const commandScope = scoped_command { context, com };
        context.output.values[namePrefix(context)] = value { true };

        parseOptionList(context);

        if (command const* child = tryLookupCommand(context))
        {
            consumeToken(context);
            return parseCommand(*child, context);
        }

        // A command must not leave any trailing tokens at the end of parsing.
        return context.pos == context.args.size();
    }

    void validate(command const& com, parse_context const& context, string const& keyPrefix)
    {
        auto const key = keyPrefix.empty() ? string(com.name) : fmt::format("{}.{}", keyPrefix, com.name);

        for (option const& option: com.options)
        {
            auto const optionKey = fmt::format("{}.{}", key, option.name.longName);
            if (option.presence == presence::Required && !context.output.values.contains(optionKey))
                throw parser_error(fmt::format("Missing option: {}", optionKey));
        }

        for (command const& child: com.children)
            if (context.output.get<bool>(fmt::format("{}.{}", key, child.name)))
                validate(child, context, key);
    }

    string optionSyntax(option const& option)
    {
        auto text = option.name.shortName ? fmt::format("-{}, --{}", option.name.shortName, option.name.longName)
                                          : fmt::format("    --{}", option.name.longName);
        if (!holds_alternative<bool>(option.v))
            text += fmt::format("={}", option.placeholder.empty() ? "VALUE" : option.placeholder);
        return text;
    }

    void appendHelp(string& output, command const& com, string const& indent)
    {
        auto const width = std::accumulate(
            com.options.begin(), com.options.end(), size_t { 0 }, [](size_t acc, option const& option) {
                return std::max(acc, optionSyntax(option).size());
            });

        for (option const& option: com.options)
        {
            output += fmt::format("{}  {:<{}}  {}", indent, optionSyntax(option), width, option.helpText);
            if (option.presence == presence::Required)
                output += " (required)";
            else if (auto const defaultValue = fmt::format("{}", option.v);
                     !defaultValue.empty() && !holds_alternative<bool>(option.v))
                output += fmt::format(" (default: {})", defaultValue);
            output += '\n';
        }

        for (command const& child: com.children)
        {
            output += fmt::format("\n{}  {}  {}\n", indent, child.name, child.helpText);
            appendHelp(output, child, indent + "  ");
        }
    }
} // namespace
// }}}

optional<flag_store> parse(command const& command, string_view_list const& args)
{
    auto context = parse_context { args };

    prefillDefaults(context, command);

    // The first token is the program name, as with main()'s argv[0].
    consumeToken(context);
    if (!parseCommand(command, context))
        return nullopt;

    validate(command, context, "");

    return std::move(context.output);
}

optional<flag_store> parse(command const& command, int argc, char const* const* argv)
{
    auto args = string_view_list {};
    args.reserve(static_cast<size_t>(argc));
    for (auto i = 0; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse(command, args);
}

string helpText(command const& command)
{
    auto output = fmt::format("{} - {}\n\nUsage:\n  {} [OPTIONS]", command.name, command.helpText, command.name);
    if (!command.children.empty())
        output += " [COMMAND]";
    output += "\n\n";
    appendHelp(output, command, "");
    return output;
}

} // namespace crispy::cli
