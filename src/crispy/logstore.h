// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace logstore
{

class category;
class sink;

using source_location = std::source_location;

class message_builder
{
  private:
    category const& _category;
    source_location _location;
    std::string _buffer;

  public:
    explicit message_builder(category const& cat, source_location loc = source_location::current());

    [[nodiscard]] category const& get_category() const noexcept { return _category; }
    [[nodiscard]] source_location const& location() const noexcept { return _location; }
    [[nodiscard]] std::string const& text() const noexcept { return _buffer; }

    message_builder& operator()(std::string_view msg)
    {
        _buffer += msg;
        return *this;
    }

    template <typename... T>
    message_builder& operator()(fmt::format_string<T...> fmt, T&&... args)
    {
        _buffer += fmt::format(fmt, std::forward<T>(args)...);
        return *this;
    }

    [[nodiscard]] std::string message() const;

    ~message_builder();
};

/// A named logging category, such as: error, termcore.caps, or termcore.input.
///
/// Every category registers itself in a process-wide list so it can be
/// enabled or disabled by name via configure().
class category
{
  public:
    using formatter = std::function<std::string(message_builder const&)>;

    enum class state
    {
        Enabled,
        Disabled
    };

    enum class visibility
    {
        Public,
        Hidden
    };

    category(std::string_view name,
             std::string_view desc,
             state state = state::Disabled,
             visibility visibility = visibility::Public) noexcept;
    ~category();

    category(category const&) = delete;
    category& operator=(category const&) = delete;

    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] std::string_view description() const noexcept { return _description; }

    [[nodiscard]] bool is_enabled() const noexcept { return _state == state::Enabled; }
    void enable(bool enabled = true) noexcept { _state = enabled ? state::Enabled : state::Disabled; }
    void disable() noexcept { _state = state::Disabled; }

    [[nodiscard]] bool visible() const noexcept { return _visibility == visibility::Public; }

    operator bool() const noexcept { return is_enabled(); }

    [[nodiscard]] formatter const& get_formatter() const { return _formatter; }
    void set_formatter(formatter f) { _formatter = std::move(f); }

    void set_sink(logstore::sink& s) { _sink = s; }
    [[nodiscard]] logstore::sink& sink() const noexcept { return _sink.get(); }

    [[nodiscard]] message_builder operator()(source_location location = source_location::current()) const
    {
        return message_builder(*this, location);
    }

    static std::string defaultFormatter(message_builder const& message);

  private:
    std::string_view _name;
    std::string_view _description;
    state _state;
    visibility _visibility;
    formatter _formatter;
    std::reference_wrapper<logstore::sink> _sink;
};

/// Logging sink API, such as the console or a log file.
class sink
{
  public:
    using writer = std::function<void(std::string_view)>;

    sink(bool enabled, writer writer);
    sink(bool enabled, std::ostream& output);

    void set_writer(writer writer) { _writer = std::move(writer); }
    void set_enabled(bool enabled) noexcept { _enabled = enabled; }

    /// Writes given built message to this sink.
    void write(message_builder const& message);

    static sink& console();
    static sink& error_console(); // NOLINT(readability-identifier-naming)

  private:
    bool _enabled;
    writer _writer;
};

std::vector<std::reference_wrapper<category>>& get();
category* get(std::string_view categoryName);
void set_sink(sink& s);
void enable(std::string_view categoryName, bool enabled = true);

/// Enables categories by a comma separated filter string.
///
/// Each filter element is either a full category name, a prefix ending in '*',
/// or the word "all". Categories not matched are disabled, except for the
/// error category, which always stays enabled.
void configure(std::string_view filterString);

// {{{ implementation
inline std::string message_builder::message() const
{
    if (_category.get_formatter())
        return _category.get_formatter()(*this);
    if (_buffer.empty() || _buffer.back() == '\n')
        return _buffer;
    return _buffer + '\n';
}

inline message_builder::message_builder(logstore::category const& cat, source_location location):
    _category { cat }, _location { location }
{
}

inline message_builder::~message_builder()
{
    _category.sink().write(*this);
}

inline std::vector<std::reference_wrapper<category>>& get()
{
    static std::vector<std::reference_wrapper<category>> logStore;
    return logStore;
}

inline category* get(std::string_view categoryName)
{
    for (auto const& cat: get())
        if (cat.get().name() == categoryName)
            return &cat.get();
    return nullptr;
}

inline void set_sink(sink& s)
{
    for (auto const& cat: get())
        cat.get().set_sink(s);
}

inline void enable(std::string_view categoryName, bool enabled)
{
    if (auto* cat = get(categoryName); cat)
        cat->enable(enabled);
}

inline category::category(std::string_view name,
                          std::string_view desc,
                          state state,
                          visibility visibility) noexcept:
    _name { name },
    _description { desc },
    _state { state },
    _visibility { visibility },
    _sink { logstore::sink::console() }
{
    get().emplace_back(*this);
}

inline category::~category()
{
    auto& store = get();
    store.erase(std::remove_if(store.begin(), store.end(), [this](auto const& c) { return &c.get() == this; }),
                store.end());
}

inline std::string category::defaultFormatter(message_builder const& message)
{
    return fmt::format("[{}:{}:{}]: {}\n",
                       message.get_category().name(),
                       message.location().file_name(),
                       message.location().line(),
                       message.text());
}

inline void sink::write(message_builder const& message)
{
    if (_enabled && message.get_category().is_enabled())
        _writer(message.message());
}
// }}}

inline category ErrorLog { "error", "Error Logger", category::state::Enabled };

#define errorlog() (::logstore::ErrorLog())

} // namespace logstore
