#include "di/test/prelude.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/sprite.h"
#include "tcomp/style_map.h"

namespace sprite {
using namespace tcomp;

static void from_text() {
    auto sprite = Sprite::from_text("ab\ncde"_sv);
    ASSERT_EQ(sprite.width, 3);
    ASSERT_EQ(sprite.height, 2);
    ASSERT_EQ(sprite.cells.size(), 6);

    ASSERT_EQ(sprite.cell(0, 0).text, "a"_sv);
    ASSERT_EQ(sprite.cell(1, 0).text, "b"_sv);
    ASSERT(!sprite.cell(1, 0).transparent);

    // Short lines are padded with transparent cells.
    ASSERT(sprite.cell(2, 0).transparent);
    ASSERT(sprite.cell(2, 0).text.empty());

    ASSERT_EQ(sprite.cell(0, 1).text, "c"_sv);
    ASSERT_EQ(sprite.cell(2, 1).text, "e"_sv);

    ASSERT_EQ(sprite.x_center(), 1);
    ASSERT_EQ(sprite.y_center(), 1);
}

static void wide() {
    auto sprite = Sprite::from_text("猫x"_sv);
    ASSERT_EQ(sprite.width, 3);
    ASSERT_EQ(sprite.height, 1);

    ASSERT_EQ(sprite.cell(0, 0).text, "猫"_sv);
    ASSERT(!sprite.cell(0, 0).continuation);
    ASSERT(sprite.cell(1, 0).continuation);
    ASSERT(sprite.cell(1, 0).text.empty());
    ASSERT_EQ(sprite.cell(2, 0).text, "x"_sv);
}

static void whitespace() {
    auto opaque = Sprite::from_text("a b"_sv);
    ASSERT(!opaque.cell(1, 0).transparent);
    ASSERT_EQ(opaque.cell(1, 0).text, " "_sv);

    auto transparent = Sprite::from_text("a b"_sv, {}, WhitespaceMode::Transparent);
    ASSERT(transparent.cell(1, 0).transparent);
    ASSERT(!transparent.cell(0, 0).transparent);
    ASSERT(!transparent.cell(2, 0).transparent);
}

static void style_map() {
    auto red = GraphicsRendition { .fg = Color::Red };
    auto bold = GraphicsRendition { .font_weight = FontWeight::Bold };

    auto styles = StyleMap(red);
    styles.set_style(1, 0, bold);
    styles.set_row_style(1, 0, 2, bold);

    ASSERT_EQ(styles.style_at(0, 0), red);
    ASSERT_EQ(styles.style_at(1, 0), bold);
    ASSERT_EQ(styles.style_at(0, 1), bold);
    ASSERT_EQ(styles.style_at(2, 1), red);
    ASSERT_EQ(styles.style_at(100, 100), red);

    auto sprite = Sprite::from_text("abc\ndef"_sv, styles);
    ASSERT_EQ(sprite.cell(0, 0).graphics_rendition, red);
    ASSERT_EQ(sprite.cell(1, 0).graphics_rendition, bold);
    ASSERT_EQ(sprite.cell(1, 1).graphics_rendition, bold);
    ASSERT_EQ(sprite.cell(2, 1).graphics_rendition, red);

    // The continuation half of a wide glyph uses the style of its owner.
    auto wide = Sprite::from_text("猫"_sv, StyleMap(bold));
    ASSERT_EQ(wide.cell(1, 0).graphics_rendition, bold);
}

static void bounds() {
    auto sprite = Sprite::filled(4, 2, "#"_sv, {});
    sprite.x = -3;
    sprite.y = 5;
    ASSERT_EQ(sprite.bounds(), (Aabb { -3, 5, 1, 7 }));
    ASSERT_EQ(sprite.cell(3, 1).text, "#"_sv);

    auto clone = sprite.clone();
    ASSERT_EQ(clone, sprite);
}

static void filled_wide() {
    auto sprite = Sprite::filled(5, 2, "日"_sv, {});
    ASSERT_EQ(sprite.cells.size(), 10);
    ASSERT(sprite.has_complete_grid());
    for (auto row : di::range(2_u32)) {
        ASSERT_EQ(sprite.cell(0, row).text, "日"_sv);
        ASSERT(sprite.cell(1, row).continuation);
        ASSERT_EQ(sprite.cell(2, row).text, "日"_sv);
        ASSERT(sprite.cell(3, row).continuation);
        ASSERT(sprite.cell(4, row).text.empty());
        ASSERT(!sprite.cell(4, row).continuation);
    }
}

TEST(sprite, from_text)
TEST(sprite, wide)
TEST(sprite, whitespace)
TEST(sprite, style_map)
TEST(sprite, bounds)
TEST(sprite, filled_wide)
}
