// SPDX-License-Identifier: Apache-2.0
#include <termcore/Encoder.h>
#include <termcore/InputDecoder.h>

#include <crispy/escape.h>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace termcore;
using crispy::escape;
using std::string;

TEST_CASE("Encoder.foreground.per_mode", "[encoder]")
{
    auto const orange = Color { 0xFF8700_rgb };

    CHECK(escape(Encoder(ColorMode::TrueColor).foreground(orange)) == "\\e[38;2;255;135;0m");
    CHECK(escape(Encoder(ColorMode::Indexed256).foreground(orange)) == "\\e[38;5;208m");
    CHECK(escape(Encoder(ColorMode::Indexed16).foreground(orange)) == "\\e[93m");
    CHECK(Encoder(ColorMode::Monochrome).foreground(orange).empty());
}

TEST_CASE("Encoder.background.per_mode", "[encoder]")
{
    auto const color = Color { IndexedColor { 196 } };

    CHECK(escape(Encoder(ColorMode::TrueColor).background(color)) == "\\e[48;5;196m");
    CHECK(escape(Encoder(ColorMode::Indexed256).background(color)) == "\\e[48;5;196m");
    CHECK(escape(Encoder(ColorMode::Indexed16).background(color)) == "\\e[101m");
}

TEST_CASE("Encoder.never_upgrades", "[encoder]")
{
    // Named colors stay named, whatever the mode allows.
    CHECK(escape(Encoder(ColorMode::TrueColor).foreground(NamedColor::Green)) == "\\e[32m");
    CHECK(Encoder(ColorMode::Indexed16).effectiveColor(NamedColor::Green) == Color { NamedColor::Green });
}

TEST_CASE("Encoder.sgr", "[encoder]")
{
    auto const style = Style {
        .foreground = RGBColor { 255, 0, 0 },
        .background = NamedColor::Black,
        .attributes = Attributes { Attribute::Bold, Attribute::Reverse },
    };

    CHECK(escape(Encoder(ColorMode::TrueColor).sgr(style)) == "\\e[1;7;38;2;255;0;0;40m");
    CHECK(escape(Encoder(ColorMode::Indexed256).sgr(style)) == "\\e[1;7;38;5;196;40m");
    CHECK(escape(Encoder(ColorMode::Indexed16).sgr(style)) == "\\e[1;7;91;40m");

    // Monochrome keeps the attributes only.
    CHECK(escape(Encoder(ColorMode::Monochrome).sgr(style)) == "\\e[1;7m");
}

TEST_CASE("Encoder.text", "[encoder]")
{
    CHECK(Encoder(ColorMode::Indexed16, CharacterSet::Unicode).text("┌─┐") == "┌─┐");
    CHECK(Encoder(ColorMode::Indexed16, CharacterSet::Ascii).text("┌─┐") == "+-+");
}

TEST_CASE("Encoder.styledText", "[encoder]")
{
    auto const encoder = Encoder(ColorMode::Indexed16, CharacterSet::Ascii);
    auto const bold = Style { .attributes = Attribute::Bold };

    CHECK(escape(encoder.styledText(bold, "─ok─")) == "\\e[1m-ok-\\e[0m");
    CHECK(encoder.styledText(Style {}, "plain") == "plain");

    // Nothing to emit in monochrome, so no reset either.
    auto const colored = Style { .foreground = NamedColor::Red };
    CHECK(Encoder(ColorMode::Monochrome).styledText(colored, "x") == "x");
}

TEST_CASE("Encoder.forCapabilities", "[encoder]")
{
    auto caps = Capabilities {};
    caps.colorMode = ColorMode::Indexed256;
    caps.unicode = true;

    auto const encoder = Encoder::forCapabilities(caps);
    CHECK(encoder.colorMode() == ColorMode::Indexed256);
    CHECK(encoder.characterSet() == CharacterSet::Unicode);

    caps.unicode = false;
    CHECK(Encoder::forCapabilities(caps).characterSet() == CharacterSet::Ascii);
}

TEST_CASE("Encoder.deterministic", "[encoder]")
{
    auto const style = Style { .foreground = 0x123456_rgb, .attributes = Attribute::Underline };
    auto const encoder = Encoder(ColorMode::Indexed256);
    CHECK(encoder.sgr(style) == encoder.sgr(style));
    CHECK(encoder.sgr(style) == Encoder(ColorMode::Indexed256).sgr(style));
}

TEST_CASE("Encoder.output_is_not_input", "[encoder][decoder]")
{
    // Output looped back into the decoder must not turn into user input.
    auto const encoder = Encoder(ColorMode::TrueColor);
    auto const output = std::vector<string> {
        sequences::cursorTo(1, 1),
        sequences::cursorTo(24, 80),
        sequences::cursorTo(17, 3),
        sequences::cursorUp(1),
        sequences::cursorDown(5),
        sequences::cursorForward(12),
        sequences::cursorBack(2),
        sequences::cursorSave(),
        sequences::cursorRestore(),
        sequences::showCursor(),
        sequences::hideCursor(),
        sequences::clearScreen(),
        sequences::clearToEndOfScreen(),
        sequences::clearLine(),
        sequences::clearToEndOfLine(),
        sequences::setScrollRegion(2, 20),
        sequences::scrollUp(3),
        sequences::scrollDown(1),
        sequences::foreground256(42),
        sequences::backgroundRGB(10, 20, 30),
        sequences::attributeOn(Attribute::Bold),
        sequences::attributeOff(Attribute::Italic),
        sequences::reset(),
        sequences::enableMode(DecMode::AlternateScreen),
        sequences::disableMode(DecMode::BracketedPaste),
        sequences::enableMode(DecMode::MouseAnyEventTracking),
        encoder.sgr(Style { .foreground = 0xFF0000_rgb, .attributes = Attribute::Bold }),
        encoder.background(NamedColor::BrightCyan),
    };

    for (auto const& bytes: output)
    {
        INFO("Sequence: " << escape(bytes));
        auto decoder = InputDecoder {};
        CHECK(decoder.decode(bytes).empty());
        CHECK(decoder.state() == InputDecoder::State::Ground);
        CHECK(decoder.flush().empty());
    }

    auto joined = string {};
    for (auto const& bytes: output)
        joined += bytes;
    CHECK(InputDecoder().decode(joined).empty());
}
