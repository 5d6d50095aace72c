// SPDX-License-Identifier: Apache-2.0
#include <termcore/Session.h>
#include <termcore/logging.h>

#include <crispy/escape.h>

#include <stdexcept>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace termcore
{

namespace
{
    Capabilities const* capabilitiesOf(BackendSelection const& selection) noexcept
    {
        if (auto const* raw = std::get_if<RawBackend>(&selection))
            return &raw->capabilities;
        if (auto const* tty = std::get_if<TtyBackend>(&selection))
            return &tty->capabilities;
        return nullptr;
    }
} // namespace

Session::Session(BackendSelector& selector, Writer writer, SessionOptions options):
    _selector { selector }, _writer { std::move(writer) }, _options { std::move(options) }
{
    if (!_writer)
        throw std::invalid_argument("Session requires an output writer.");
}

Session::~Session()
{
    teardown();
}

BackendSelection const& Session::start(BackendKind kind)
{
    if (_selection)
        return *_selection;

    auto selection = _selector.select(kind);

    if (auto const* caps = capabilitiesOf(selection))
        _encoder = Encoder(caps->colorMode,
                           caps->unicode ? _options.characterSet : _options.fallbackCharacterSet);

    _selection = std::move(selection);

    if (auto const* raw = std::get_if<RawBackend>(&*_selection))
        applyModes(raw->capabilities);

    if (_options.watchResize)
        _resizeWatcher = std::make_unique<ResizeWatcher>();

    backendLog()("Session started on {} with encoder {}/{}.",
                 *_selection,
                 _encoder.colorMode(),
                 _encoder.characterSet());
    return *_selection;
}

BackendSelection const& Session::start(ExplicitBackend backend)
{
    if (!_selection)
        _selection = _selector.select(std::move(backend));
    return *_selection;
}

bool Session::teardown() noexcept
{
    if (!_selection)
        return true;

    // A failed write must not keep the remaining modes from being reverted.
    while (!_undoStack.empty())
    {
        auto const sequence = std::move(_undoStack.back());
        _undoStack.pop_back();
        try
        {
            write(sequence);
        }
        catch (std::exception const& e)
        {
            errorlog()("Failed to revert terminal mode {}. {}", crispy::escape(sequence), e.what());
        }
    }

    _resizeWatcher.reset();
    auto const isExplicit = std::holds_alternative<ExplicitBackend>(*_selection);
    _selection.reset();
    _decoder.reset();

    if (isExplicit)
        return true;

    auto const restored = _selector.teardown();
    backendLog()("Session torn down (terminal settings restored: {}).", restored);
    return restored;
}

vector<Event> Session::feed(string_view bytes)
{
    auto events = _decoder.decode(bytes);
    if (auto resize = pendingResize())
        events.emplace_back(*resize);
    return events;
}

vector<Event> Session::flush()
{
    return _decoder.flush();
}

optional<ResizeEvent> Session::pendingResize()
{
    if (!_resizeWatcher || !_resizeWatcher->consume())
        return std::nullopt;

    auto const size = _selector.dimensions();
    if (!size)
        return std::nullopt;

    return ResizeEvent { size->rows, size->columns };
}

string Session::frameStart() const
{
    auto const tty = _selection && std::holds_alternative<TtyBackend>(*_selection);
    if (tty && _options.lineMode == LineMode::FullRedraw)
        return sequences::clearScreen() + sequences::cursorTo(1, 1);
    return sequences::cursorTo(1, 1);
}

vector<string> Session::pendingTeardown() const
{
    return vector<string>(_undoStack.rbegin(), _undoStack.rend());
}

void Session::applyModes(Capabilities const& caps)
{
    if (_options.alternateScreen && caps.alternateScreen)
        toggle(sequences::enableMode(DecMode::AlternateScreen), sequences::disableMode(DecMode::AlternateScreen));

    // Whatever is drawn from here on may leave graphics renditions behind.
    toggle({}, sequences::reset());

    if (_options.clearScreen)
        write(sequences::clearScreen());

    if (_options.hideCursor)
        toggle(sequences::hideCursor(), sequences::showCursor());

    if (_options.bracketedPaste)
        toggle(sequences::enableMode(DecMode::BracketedPaste), sequences::disableMode(DecMode::BracketedPaste));

    if (_options.focusEvents)
        toggle(sequences::enableMode(DecMode::FocusEvents), sequences::disableMode(DecMode::FocusEvents));

    if (_options.mouseTracking != MouseTracking::None)
    {
        auto const mode = toDecMode(_options.mouseTracking);
        toggle(sequences::enableMode(mode), sequences::disableMode(mode));
        if (_options.sgrMouse)
            toggle(sequences::enableMode(DecMode::MouseSgr), sequences::disableMode(DecMode::MouseSgr));
    }
}

void Session::toggle(string const& enable, string disable)
{
    if (!enable.empty())
        write(enable);
    _undoStack.emplace_back(std::move(disable));
}

void Session::write(string_view bytes)
{
    if (bytes.empty())
        return;
    if (outputLog)
        outputLog()("Writing \"{}\"", crispy::escape(bytes));
    _writer(bytes);
}

} // namespace termcore
