#include "di/test/prelude.h"
#include "tcomp/grapheme.h"

namespace grapheme {
using namespace tcomp;

static void width() {
    struct Case {
        di::StringView input {};
        u8 expected { 0 };
    };

    auto cases = di::Array {
        Case { ""_sv, 0 },
        Case { "a"_sv, 1 },
        Case { " "_sv, 1 },
        Case { "猫"_sv, 2 },
        Case { "😀"_sv, 2 },
        // Combining acute accent.
        Case { "é"_sv, 1 },
        // Emoji presentation selector.
        Case { "❤️"_sv, 2 },
        // Family emoji joined with ZWJ.
        Case { "👨‍👩‍👧"_sv, 2 },
    };

    for (auto const& [input, expected] : cases) {
        ASSERT_EQ(display_width(input), expected);
    }
}

static void split() {
    auto graphemes = split_graphemes("aé猫b"_sv);
    ASSERT_EQ(graphemes.size(), 4);
    ASSERT_EQ(graphemes[0], (Grapheme { "a"_sv, 1 }));
    ASSERT_EQ(graphemes[1], (Grapheme { "é"_sv, 1 }));
    ASSERT_EQ(graphemes[2], (Grapheme { "猫"_sv, 2 }));
    ASSERT_EQ(graphemes[3], (Grapheme { "b"_sv, 1 }));

    ASSERT(split_graphemes(""_sv).empty());

    auto family = split_graphemes("x👨‍👩‍👧y"_sv);
    ASSERT_EQ(family.size(), 3);
    ASSERT_EQ(family[1].width, 2);
}

static void total_width() {
    ASSERT_EQ(text_width("hello"_sv), 5);
    ASSERT_EQ(text_width("猫x猫"_sv), 5);
    ASSERT_EQ(text_width(""_sv), 0);
}

TEST(grapheme, width)
TEST(grapheme, split)
TEST(grapheme, total_width)
}
