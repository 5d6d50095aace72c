// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace termcore
{

namespace rawmode
{
    /// Raw mode is now active; the previous settings are saved for restore().
    struct Activated
    {
        bool operator==(Activated const&) const = default;
    };

    /// Another process group owns the terminal, or raw mode is already active.
    struct AlreadyClaimed
    {
        std::string reason;
        bool operator==(AlreadyClaimed const&) const = default;
    };

    /// The device is not a terminal, or the platform has no raw mode primitive.
    struct Unsupported
    {
        std::string reason;
        bool operator==(Unsupported const&) const = default;
    };

    /// Any other failure of the underlying system calls.
    struct Failed
    {
        std::string reason;
        bool operator==(Failed const&) const = default;
    };
} // namespace rawmode

using RawModeOutcome = std::variant<rawmode::Activated, rawmode::AlreadyClaimed, rawmode::Unsupported, rawmode::Failed>;

/// Maps the errno of a failed terminal system call to its outcome.
///
/// ENOTTY and EBADF mean Unsupported, EBUSY, EPERM and EACCES mean
/// AlreadyClaimed, everything else is Failed.
[[nodiscard]] RawModeOutcome classifyRawModeError(int errorCode, std::string_view operation);

/// Raw mode primitive of one terminal device.
///
/// The one and only place the terminal line discipline is modified.
class RawMode
{
  public:
    virtual ~RawMode() = default;

    /// Attempts to switch the device into raw mode, saving the current settings.
    [[nodiscard]] virtual RawModeOutcome attempt() = 0;

    /// Reapplies the settings saved by a successful attempt().
    ///
    /// Does nothing if raw mode is not active, so it may be called repeatedly.
    ///
    /// @returns false if the saved settings could not be reapplied.
    virtual bool restore() noexcept = 0;

    [[nodiscard]] virtual bool active() const noexcept = 0;

    /// @returns whether the device is a terminal, regardless of raw mode.
    [[nodiscard]] virtual bool isTerminal() const noexcept = 0;

    [[nodiscard]] virtual int fileDescriptor() const noexcept = 0;
};

/// Creates the raw mode primitive of the current platform for @p fd.
[[nodiscard]] std::unique_ptr<RawMode> createRawMode(int fd);

} // namespace termcore

template <>
struct fmt::formatter<termcore::RawModeOutcome>: fmt::formatter<std::string>
{
    auto format(termcore::RawModeOutcome const& outcome, format_context& ctx) const -> format_context::iterator
    {
        using namespace termcore::rawmode;
        std::string text;
        if (std::holds_alternative<Activated>(outcome))
            text = "Activated";
        else if (auto const* claimed = std::get_if<AlreadyClaimed>(&outcome))
            text = fmt::format("AlreadyClaimed({})", claimed->reason);
        else if (auto const* unsupported = std::get_if<Unsupported>(&outcome))
            text = fmt::format("Unsupported({})", unsupported->reason);
        else if (auto const* failed = std::get_if<Failed>(&outcome))
            text = fmt::format("Failed({})", failed->reason);
        return formatter<std::string>::format(text, ctx);
    }
};
