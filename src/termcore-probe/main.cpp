// SPDX-License-Identifier: Apache-2.0
#include <termcore/BackendSelector.h>
#include <termcore/Capabilities.h>
#include <termcore/Config.h>
#include <termcore/Environment.h>
#include <termcore/Platform.h>
#include <termcore/RawMode.h>
#include <termcore/Session.h>

#include <crispy/CLI.h>
#include <crispy/logstore.h>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <poll.h>
#include <unistd.h>

using namespace std::string_literals;
using namespace termcore;

namespace
{

namespace cli = crispy::cli;

// Input that stays incomplete for this long is flushed, so that a lone ESC
// is reported as the Escape key.
constexpr auto IdleFlushTimeout = std::chrono::milliseconds(50);

void writeToStdout(std::string_view bytes)
{
    while (!bytes.empty())
    {
        auto const rv = ::write(STDOUT_FILENO, bytes.data(), bytes.size());
        if (rv < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::runtime_error { "Failed to write to stdout. "s + strerror(errno) };
        }
        bytes.remove_prefix(static_cast<size_t>(rv));
    }
}

class Probe
{
  public:
    Probe(Session& session, bool raw): _session { session }, _newline { raw ? "\r\n" : "\n" } {}

    void printLine(std::string_view text) { writeToStdout(fmt::format("{}{}", text, _newline)); }

    void printCapabilities(Capabilities const& caps)
    {
        auto const& encoder = _session.encoder();
        auto const heading = Style { .foreground = NamedColor::BrightCyan, .attributes = Attribute::Bold };
        printLine(encoder.styledText(heading, "Terminal capabilities"));
        printLine(fmt::format("  color mode:       {} ({} colors)", caps.colorMode, caps.maxColors));
        printLine(fmt::format("  unicode:          {}", caps.unicode));
        printLine(fmt::format("  mouse:            {}", caps.mouse));
        printLine(fmt::format("  bracketed paste:  {}", caps.bracketedPaste));
        printLine(fmt::format("  focus events:     {}", caps.focusEvents));
        printLine(fmt::format("  alternate screen: {}", caps.alternateScreen));
        printLine(fmt::format("  TERM:             {}", caps.terminalType.value_or("(unset)")));
        printLine(fmt::format("  TERM_PROGRAM:     {}", caps.terminalProgram.value_or("(unset)")));
        if (caps.rawModeError)
            printLine(fmt::format("  raw mode error:   {}", *caps.rawModeError));
        printLine(encoder.text("────────────────────────────────────────"));
    }

    /// @returns false once the user asked to quit.
    bool report(std::vector<Event> const& events)
    {
        for (auto const& event: events)
        {
            printLine(fmt::format("{}", event));
            if (isQuitRequest(event))
                return false;
        }
        return true;
    }

  private:
    static bool isQuitRequest(Event const& event)
    {
        auto const* key = std::get_if<KeyEvent>(&event);
        if (!key || key->key != Key::Character)
            return false;
        if (key->text == "q" && key->modifiers.none())
            return true;
        return key->text == "c" && key->modifiers == Modifiers { Modifier::Control };
    }

    Session& _session;
    std::string_view _newline;
};

cli::command parameterDefinition()
{
    return cli::command {
        "termcore-probe",
        "Shows the detected terminal capabilities and decodes keyboard and mouse input.",
        cli::option_list {
            cli::option { { 'c', "config" }, cli::value { ""s }, "Configuration file to load.", "PATH" },
            cli::option {
                { 'l', "log" }, cli::value { ""s }, "Log categories to enable, e.g. termcore.*", "FILTER" },
            cli::option { { 'h', "help" }, cli::value { false }, "Shows this help and exits." },
        },
    };
}

int run(cli::flag_store const& flags)
{
    auto const& env = SystemEnvironment::instance();

    auto const& configPath = flags.str("termcore-probe.config");
    auto const configFile =
        configPath.empty() ? config::defaultConfigFilePath(env) : std::filesystem::path(configPath);
    auto const configuration = config::loadConfigFromFile(configFile);
    if (auto const& filter = flags.str("termcore-probe.log"); !filter.empty())
        logstore::configure(filter);
    else if (!configuration.logFilter.empty() && !env.nonEmpty("LOG"))
        logstore::configure(configuration.logFilter);

    auto cache = CapabilityCache([&]() {
        return CapabilityDetector(env, Platform::current(), configuration.detectorOptions()).detect();
    });
    auto selector = BackendSelector(createRawMode(STDIN_FILENO), cache, env);
    auto session = Session(selector, &writeToStdout, configuration.sessionOptions());

    auto const& selection = configuration.explicitSelection() ? session.start(*configuration.explicitSelection())
                                                               : session.start(configuration.backend);

    if (auto const* explicitBackend = std::get_if<ExplicitBackend>(&selection))
    {
        fmt::print("Explicit backend selected: {}\n", explicitBackend->name);
        for (auto const& [name, value]: explicitBackend->options)
            fmt::print("  {} = {}\n", name, value);
        return EXIT_SUCCESS;
    }

    auto const raw = std::holds_alternative<RawBackend>(selection);
    auto probe = Probe(session, raw);

    writeToStdout(session.frameStart());
    probe.printLine(fmt::format("Backend: {}", selection));
    probe.printCapabilities(raw ? std::get<RawBackend>(selection).capabilities
                                : std::get<TtyBackend>(selection).capabilities);
    probe.printLine("Type to see decoded events, press q to quit.");

    auto buffer = std::array<char, 4096> {};
    auto pfd = pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
    for (;;)
    {
        auto const rv = ::poll(&pfd, 1, static_cast<int>(IdleFlushTimeout.count()));
        if (rv < 0)
        {
            if (errno == EINTR)
            {
                if (!probe.report(session.feed({})))
                    break;
                continue;
            }
            throw std::runtime_error { "Failed to poll stdin. "s + strerror(errno) };
        }

        if (rv == 0)
        {
            if (!probe.report(session.flush()))
                break;
            if (auto const resize = session.pendingResize(); resize && !probe.report({ *resize }))
                break;
            continue;
        }

        auto const n = ::read(STDIN_FILENO, buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw std::runtime_error { "Failed to read stdin. "s + strerror(errno) };
        }

        if (n == 0)
        {
            probe.report(session.flush());
            break;
        }

        if (!probe.report(session.feed(std::string_view(buffer.data(), static_cast<size_t>(n)))))
            break;
    }

    return session.teardown() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char const* argv[])
{
    if (auto const* filter = std::getenv("LOG"); filter && *filter)
        logstore::configure(filter);

    try
    {
        auto const syntax = parameterDefinition();
        auto const flags = cli::parse(syntax, argc, argv);
        if (!flags)
        {
            fmt::print(stderr, "Failed to parse command line parameters.\n\n{}", cli::helpText(syntax));
            return EXIT_FAILURE;
        }

        if (flags->boolean("termcore-probe.help"))
        {
            fmt::print("{}", cli::helpText(syntax));
            return EXIT_SUCCESS;
        }

        return run(*flags);
    }
    catch (std::exception const& e)
    {
        errorlog()("Unhandled error: {}", e.what());
        return EXIT_FAILURE;
    }
}
