// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace termcore
{

/// Read-only view onto process environment variables.
///
/// Detection code reads the environment only through this interface so that
/// tests can supply a fixed set of variables.
class Environment
{
  public:
    virtual ~Environment() = default;

    /// @returns the value of the variable, or std::nullopt if it is not set.
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view name) const = 0;

    /// @returns the value of the variable if it is set and non-empty.
    [[nodiscard]] std::optional<std::string> nonEmpty(std::string_view name) const
    {
        if (auto value = get(name); value && !value->empty())
            return value;
        return std::nullopt;
    }
};

class SystemEnvironment final: public Environment
{
  public:
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override
    {
        if (auto const* value = std::getenv(std::string(name).c_str()); value)
            return std::string(value);
        return std::nullopt;
    }

    static SystemEnvironment const& instance()
    {
        static SystemEnvironment const env;
        return env;
    }
};

class MapEnvironment final: public Environment
{
  public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string, std::less<>> values):
        _values { std::move(values) }
    {
    }

    void set(std::string name, std::string value) { _values[std::move(name)] = std::move(value); }

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override
    {
        if (auto const i = _values.find(name); i != _values.end())
            return i->second;
        return std::nullopt;
    }

  private:
    std::map<std::string, std::string, std::less<>> _values;
};

} // namespace termcore
