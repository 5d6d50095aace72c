// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

namespace logstore
{

sink::sink(bool enabled, writer wr): _enabled { enabled }, _writer { std::move(wr) }
{
}

sink::sink(bool enabled, std::ostream& output):
    sink(enabled, [out = &output](std::string_view text) {
        *out << text;
        out->flush();
    })
{
}

sink& sink::console()
{
    static auto instance = sink(true, std::clog);
    return instance;
}

sink& sink::error_console() // NOLINT(readability-identifier-naming)
{
    static auto instance = sink(true, std::cerr);
    return instance;
}

void configure(std::string_view filterString)
{
    auto const filters = crispy::split(filterString, ',');
    auto const matches = [&](category const& cat) -> bool {
        if (filterString == "all")
            return cat.visible() || cat.name() == "error";
        return std::any_of(filters.begin(), filters.end(), [&](std::string_view pattern) {
            if (pattern.empty())
                return false;
            if (pattern.back() != '*')
                return cat.name() == pattern;
            return cat.visible() && cat.name().starts_with(pattern.substr(0, pattern.size() - 1));
        });
    };

    for (auto& cat: get())
        cat.get().enable(cat.get().name() == "error" || matches(cat.get()));
}

} // namespace logstore
