#include "di/test/prelude.h"
#include "tcomp/escape_encoder.h"
#include "tcomp/features.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/terminal_command.h"

namespace escape_encoder {
using namespace tcomp;

static auto encode(EscapeEncoder& encoder, TerminalCommand command) -> di::String {
    auto commands = di::Vector<TerminalCommand> {};
    commands.push_back(di::move(command));
    return encoder.encode(commands.span());
}

static void setup() {
    auto encoder = EscapeEncoder {};
    ASSERT_EQ(encoder.setup({}), "\033[?1049h\033[?7l\033[?25l\033[H\033[m\033[2J"_sv);
    ASSERT_EQ(encoder.features(), Feature::SyncronizedOutput);
    ASSERT_EQ(encoder.cleanup(), "\033[m\033[?25h\033[?7h\033[?1049l"_sv);

    auto titled = EscapeEncoder {};
    ASSERT_EQ(titled.setup({ "tcomp"_s, Feature::None }),
              "\033[?1049h\033[?7l\033[?25l\033[22;2t\033]2;tcomp\033\\\033[H\033[m\033[2J"_sv);
    ASSERT_EQ(titled.features(), Feature::None);
    ASSERT_EQ(titled.cleanup(), "\033[m\033[23;2t\033[?25h\033[?7h\033[?1049l"_sv);

    // Nothing to encode means nothing is written, not even the synchronized update markers.
    ASSERT_EQ(encoder.encode({}), ""_sv);
}

static void move_cursor() {
    struct Case {
        MoveCursor move {};
        di::StringView expected {};
    };

    // Each case starts where the previous one ended.
    auto cases = di::Array {
        Case { { 0, 5 }, "\033[5C"_sv },
        Case { { 1, 5 }, "\n"_sv },
        Case { { 1, 0 }, "\r"_sv },
        Case { { 10, 0 }, "\033[9B"_sv },
        Case { { 10, 3 }, "\033[3C"_sv },
        Case { { 2, 0 }, "\033[8F"_sv },
        Case { { 2, 4 }, "\033[4C"_sv },
        Case { { 11, 0 }, "\033[9E"_sv },
        Case { { 5, 7 }, "\033[6;8H"_sv },
        Case { { 5, 6 }, "\x08"_sv },
        Case { { 5, 2 }, "\033[4D"_sv },
        Case { { 6, 3 }, "\033[1C\n"_sv },
        Case { { 3, 3 }, "\033[3A"_sv },
        Case { { 2, 0 }, "\r\033M"_sv },
        Case { { 2, 5 }, "\033[5C"_sv },
        Case { { 0, 0 }, "\033[H"_sv },
        Case { { 1, 4 }, "\033[4C\n"_sv },
        Case { { 0, 4 }, "\033M"_sv },
        Case { { 0, 4 }, ""_sv },
    };

    auto encoder = EscapeEncoder {};
    encoder.set_size({ 24, 80 });
    encoder.setup({ {}, Feature::None });
    for (auto const& [move, expected] : cases) {
        ASSERT_EQ(encode(encoder, move), expected);
    }
}

static void unknown_position() {
    auto encoder = EscapeEncoder {};
    encoder.set_size({ 24, 80 });
    ASSERT_EQ(encode(encoder, MoveCursor { 2, 3 }), "\033[3;4H"_sv);

    encoder.forget_state();
    ASSERT_EQ(encode(encoder, MoveCursor { 0, 0 }), "\033[H"_sv);

    // Writing to the last column leaves the column unknown, but not the row.
    encoder.set_size({ 24, 5 });
    auto commands = di::Vector<TerminalCommand> {};
    commands.push_back(WriteText { "abcde"_s, 5 });
    commands.push_back(MoveCursor { 0, 1 });
    ASSERT_EQ(encoder.encode(commands.span()), "abcde\033[2G"_sv);
}

static void graphics_rendition() {
    auto bold = GraphicsRendition { .font_weight = FontWeight::Bold };

    auto encoder = EscapeEncoder {};
    encoder.setup({ {}, Feature::None });
    ASSERT_EQ(encode(encoder, SetGraphicsRendition { bold }), "\033[1m"_sv);
    ASSERT_EQ(encode(encoder, SetGraphicsRendition { bold }), ""_sv);
    ASSERT_EQ(encode(encoder, SetGraphicsRendition {}), "\033[0m"_sv);

    // Without known state, the rendition is set from scratch.
    encoder.forget_state();
    ASSERT_EQ(encode(encoder, SetGraphicsRendition { bold }), "\033[0;1m"_sv);
}

static void synchronized() {
    auto encoder = EscapeEncoder {};
    encoder.set_size({ 24, 80 });
    encoder.setup({ {}, Feature::SyncronizedOutput });

    ASSERT_EQ(encode(encoder, SetCursor { false, CursorStyle::SteadyBar }),
              "\033[?2026h\033[6 q\033[?25h\033[?2026l"_sv);

    // The visible cursor is hidden while drawing.
    ASSERT_EQ(encode(encoder, WriteText { "a"_s, 1 }), "\033[?2026h\033[?25la\033[?25h\033[?2026l"_sv);

    ASSERT_EQ(encode(encoder, SetCursor { true, CursorStyle::SteadyBar }), "\033[?2026h\033[?25l\033[?2026l"_sv);

    // The cursor shape was changed, so it is restored on cleanup.
    ASSERT_EQ(encoder.cleanup(), "\033[m\033[ q\033[?25h\033[?7h\033[?1049l"_sv);
}

TEST(escape_encoder, setup)
TEST(escape_encoder, move_cursor)
TEST(escape_encoder, unknown_position)
TEST(escape_encoder, graphics_rendition)
TEST(escape_encoder, synchronized)
}
