// SPDX-License-Identifier: Apache-2.0
#include <termcore/Subprocess.h>
#include <termcore/TermInfo.h>
#include <termcore/logging.h>

#include <charconv>
#include <system_error>

using std::optional;
using std::string_view;

namespace termcore::terminfo
{

namespace
{
    optional<int> parseNumber(string_view text)
    {
        int base = 10;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        {
            base = 16;
            text.remove_prefix(2);
        }

        int value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
        if (ec != std::errc {} || ptr == text.data())
            return std::nullopt;
        return value;
    }
} // namespace

optional<int> parseColors(string_view infocmpOutput)
{
    constexpr auto Name = string_view("colors");

    for (auto pos = infocmpOutput.find(Name); pos != string_view::npos;
         pos = infocmpOutput.find(Name, pos + Name.size()))
    {
        auto const valueStart = pos + Name.size();
        if (valueStart >= infocmpOutput.size())
            break;

        auto const separator = infocmpOutput[valueStart];
        if (separator != '#' && separator != '=')
            continue;

        auto const valueEnd = infocmpOutput.find_first_of(",\n \t", valueStart + 1);
        auto const value = infocmpOutput.substr(valueStart + 1, valueEnd - (valueStart + 1));
        if (auto const number = parseNumber(value); number)
            return number;
    }

    return std::nullopt;
}

optional<int> queryColors(std::chrono::milliseconds timeout)
{
    auto const result = runProcess("infocmp", { "-1" }, timeout);
    if (!result)
    {
        capsLog()("infocmp query yielded no result.");
        return std::nullopt;
    }

    if (result->exitCode != 0)
    {
        capsLog()("infocmp exited with status {}.", result->exitCode);
        return std::nullopt;
    }

    auto const colors = parseColors(result->standardOutput);
    capsLog()("infocmp reports colors: {}", colors.has_value() ? std::to_string(*colors) : "(unknown)");
    return colors;
}

} // namespace termcore::terminfo
