#include "scene.h"

#include "tcomp/graphics_rendition.h"
#include "tcomp/style_map.h"

namespace tcomp {
static auto make_banner() -> Sprite {
    auto style = StyleMap(GraphicsRendition {
        .fg = Color::BrightWhite,
        .bg = Color::Blue,
        .font_weight = FontWeight::Bold,
    });
    style.set_row_style(1, 0, 13,
                        GraphicsRendition {
                            .fg = Color::BrightYellow,
                            .bg = Color::Blue,
                            .underline_color = Color(255, 128, 0),
                            .underline_mode = UnderlineMode::Curly,
                        });
    return Sprite::from_text(" tcomp demo  \n bouncing 猫 "_sv, style);
}

static auto make_cat(usize index) -> Sprite {
    auto style = StyleMap(GraphicsRendition { .fg = Color::indexed(u8(1 + index % 6)) });
    return Sprite::from_text(" /\\_/\\ \n( o.o )\n > ^ < "_sv, style, WhitespaceMode::Transparent);
}

static auto make_box(usize index) -> Sprite {
    auto graphics_rendition = GraphicsRendition {
        .fg = Color::indexed(u8(16 + (index * 37) % 216)),
        .bg = Color(u8(32 * (index % 8)), 64, u8(255 - 32 * (index % 8))),
    };
    return Sprite::filled(u32(6 + index % 5), u32(3 + index % 3), "#"_sv, graphics_rendition);
}

static auto make_wide(usize index) -> Sprite {
    auto style = StyleMap(GraphicsRendition { .fg = Color::indexed(u8(9 + index % 6)), .italic = true });
    return Sprite::from_text("字符\n寬度"_sv, style);
}

auto Scene::create(usize sprite_count, Size const& size) -> Scene {
    auto scene = Scene {};
    auto cols = di::max(size.cols, 1_u32);
    auto rows = di::max(size.rows, 1_u32);
    for (auto i : di::range(sprite_count)) {
        auto sprite = [&] {
            switch (i % 4) {
                case 0:
                    return make_banner();
                case 1:
                    return make_cat(i);
                case 2:
                    return make_box(i);
                default:
                    return make_wide(i);
            }
        }();
        sprite.entity_id = i + 1;
        sprite.depth = i64(i % 4);
        if (i == 0) {
            // The first banner starts in the middle of the screen.
            sprite.x = i32(size.x_center()) - i32(sprite.x_center());
            sprite.y = i32(size.y_center()) - i32(sprite.y_center());
        } else {
            sprite.x = i32((i * 7) % cols);
            sprite.y = i32((i * 3) % rows);
        }
        scene.m_sprites.push_back(di::move(sprite));
        scene.m_velocities.push_back({ i % 2 == 0 ? i32(1 + i % 3) : -i32(1 + i % 3), i % 3 == 0 ? 1 : -1 });
    }
    return scene;
}

// Reflect the velocity once the center of the sprite would cross the edge of the screen. Sprites which start
// outside the screen keep moving inward.
static void bounce(i32& position, i32& velocity, u32 extent, u32 limit) {
    auto half = i64(extent / 2);
    auto next = i64(position) + velocity;
    if ((velocity < 0 && next + half < 0) || (velocity > 0 && next + half >= i64(limit))) {
        velocity = -velocity;
        next = i64(position) + velocity;
    }
    position = i32(next);
}

void Scene::tick(Size const& size) {
    m_tick_count++;
    if (size.empty()) {
        return;
    }

    for (auto [index, sprite] : di::enumerate(m_sprites)) {
        auto& velocity = m_velocities[index];
        bounce(sprite.x, velocity.dx, sprite.width, size.cols);
        bounce(sprite.y, velocity.dy, sprite.height, size.rows);

        // Every fifth sprite blinks.
        if (index % 5 == 4) {
            sprite.visible = (m_tick_count / 16) % 2 == 0;
        }
    }
}
}
