#include "di/test/prelude.h"
#include "tcomp/color.h"
#include "tcomp/features.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/sgr_params.h"

namespace graphics_rendition {
using namespace tcomp;

static void from_scratch() {
    struct Case {
        GraphicsRendition input {};
        Feature features { Feature::None };
        di::StringView expected {};
    };

    auto cases = di::Array {
        Case { {}, Feature::None, "\033[0m"_sv },
        Case { { .fg = Color::Red, .font_weight = FontWeight::Bold }, Feature::None, "\033[0;1m\033[31m"_sv },
        Case { { .fg = Color::BrightBlue, .bg = Color::indexed(200) }, Feature::None,
               "\033[0m\033[94m\033[48;5;200m"_sv },
        Case { { .fg = Color(1, 2, 3) }, Feature::None, "\033[0m\033[38;2;1;2;3m"_sv },
        Case { { .italic = true, .inverted = true, .strike_through = true }, Feature::None, "\033[0;3;7;9m"_sv },
        Case { { .blink_mode = BlinkMode::Rapid, .overline = true }, Feature::None, "\033[0;6;53m"_sv },
        Case { { .underline_mode = UnderlineMode::Double }, Feature::None, "\033[0;21m"_sv },
        // Styled underlines are downgraded when the terminal doesn't support them.
        Case { { .underline_color = Color(22, 35, 87), .underline_mode = UnderlineMode::Curly }, Feature::None,
               "\033[0;4m"_sv },
        Case { { .underline_color = Color(22, 35, 87), .underline_mode = UnderlineMode::Curly },
               Feature::Undercurl, "\033[0m\033[4:3m\033[58:2::22:35:87m"_sv },
        Case { { .underline_color = Color::Green, .underline_mode = UnderlineMode::Dotted }, Feature::Undercurl,
               "\033[0m\033[4:4m\033[58:5:2m"_sv },
    };

    for (auto const& [input, features, expected] : cases) {
        auto actual = render_graphics_rendition(input, features, {});
        ASSERT_EQ(actual, expected);
    }
}

static void delta() {
    auto bold_red = GraphicsRendition { .fg = Color::Red, .font_weight = FontWeight::Bold };
    auto red = GraphicsRendition { .fg = Color::Red };

    // Turning off bold is shorter than resetting and setting the color again.
    ASSERT_EQ(render_graphics_rendition(red, Feature::None, bold_red), "\033[22m"_sv);

    // Switching from bold to dim must reset the font weight first.
    auto dim_red = GraphicsRendition { .fg = Color::Red, .font_weight = FontWeight::Dim };
    ASSERT_EQ(render_graphics_rendition(dim_red, Feature::None, bold_red), "\033[22;2m"_sv);

    // Clearing many attributes at once is shorter with a reset.
    auto busy = GraphicsRendition {
        .fg = Color(10, 20, 30),
        .bg = Color(40, 50, 60),
        .font_weight = FontWeight::Bold,
        .italic = true,
        .inverted = true,
    };
    ASSERT_EQ(render_graphics_rendition({}, Feature::None, busy), "\033[0m"_sv);

    auto default_fg = GraphicsRendition {};
    ASSERT_EQ(render_graphics_rendition(default_fg, Feature::None, red), "\033[0m"_sv);
    ASSERT_EQ(render_graphics_rendition(red, Feature::None, default_fg), "\033[31m"_sv);
}

static void as_sgr_params() {
    auto rendition = GraphicsRendition {};
    rendition.blink_mode = BlinkMode::Normal;
    rendition.italic = true;
    rendition.font_weight = FontWeight::Bold;
    rendition.fg = Color(2, 45, 67);

    auto actual = rendition.as_sgr_params();
    ASSERT_EQ(actual.size(), 2);
    ASSERT_EQ(actual[0], (SgrParams { { 0 }, { 1 }, { 3 }, { 5 } }));
    ASSERT_EQ(actual[1], (SgrParams { { 38 }, { 2 }, { 2 }, { 45 }, { 67 } }));

    // Nothing to do when the rendition is unchanged.
    ASSERT(rendition.as_sgr_params(Feature::None, rendition).empty());

    // The underline color is only emitted when supported.
    auto underline = GraphicsRendition { .underline_color = Color::Red };
    auto plain = GraphicsRendition {};
    ASSERT(underline.as_sgr_params(Feature::None, plain).empty());
    ASSERT_EQ(underline.as_sgr_params(Feature::Undercurl, plain).size(), 1);
}

static void colors() {
    struct Case {
        Color color {};
        di::StringView expected_fg {};
        di::StringView expected_bg {};
    };

    auto cases = di::Array {
        Case { Color::Black, "\033[0m\033[30m"_sv, "\033[0m\033[40m"_sv },
        Case { Color::White, "\033[0m\033[37m"_sv, "\033[0m\033[47m"_sv },
        Case { Color::BrightBlack, "\033[0m\033[90m"_sv, "\033[0m\033[100m"_sv },
        Case { Color::BrightWhite, "\033[0m\033[97m"_sv, "\033[0m\033[107m"_sv },
        Case { Color::indexed(16), "\033[0m\033[38;5;16m"_sv, "\033[0m\033[48;5;16m"_sv },
        Case { Color(0, 0, 0), "\033[0m\033[38;2;0;0;0m"_sv, "\033[0m\033[48;2;0;0;0m"_sv },
    };

    for (auto const& [color, expected_fg, expected_bg] : cases) {
        ASSERT_EQ(render_graphics_rendition({ .fg = color }, Feature::None, {}), expected_fg);
        ASSERT_EQ(render_graphics_rendition({ .bg = color }, Feature::None, {}), expected_bg);
    }

    // Going back to the default color uses the dedicated reset code when that is shorter.
    auto blue = GraphicsRendition {
        .fg = Color::Blue, .font_weight = FontWeight::Bold, .italic = true, .inverted = true
    };
    auto plain = GraphicsRendition { .font_weight = FontWeight::Bold, .italic = true, .inverted = true };
    ASSERT_EQ(render_graphics_rendition(plain, Feature::None, blue), "\033[39m"_sv);
}

TEST(graphics_rendition, from_scratch)
TEST(graphics_rendition, delta)
TEST(graphics_rendition, as_sgr_params)
TEST(graphics_rendition, colors)
}
