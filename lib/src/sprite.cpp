#include "tcomp/sprite.h"

#include "di/container/string/string_view.h"
#include "tcomp/grapheme.h"
#include "tcomp/style_map.h"

namespace tcomp {
auto Sprite::from_text(di::StringView text, StyleMap const& style_map, WhitespaceMode whitespace) -> Sprite {
    auto lines = text | di::split(U'\n') | di::transform(split_graphemes) | di::to<di::Vector>();

    // Zero width clusters (like a combining mark at the start of a line) still take up a column.
    auto column_width = [](Grapheme const& grapheme) -> u32 {
        return grapheme.width == 2 ? 2 : 1;
    };

    auto width = 0_u32;
    for (auto const& line : lines) {
        auto line_width = 0_u32;
        for (auto const& grapheme : line) {
            line_width += column_width(grapheme);
        }
        width = di::max(width, line_width);
    }

    auto result = Sprite {};
    result.width = width;
    result.height = u32(lines.size());
    for (auto _ : di::range(usize(result.width) * result.height)) {
        // Padding past the end of a short line never hides anything.
        result.cells.push_back(SpriteCell { .transparent = true });
    }

    for (auto [row, line] : di::enumerate(lines)) {
        auto col = 0_u32;
        for (auto const& grapheme : line) {
            auto const& style = style_map.style_at(col, u32(row));
            auto transparent = whitespace == WhitespaceMode::Transparent && grapheme.text == " "_sv;
            result.cell(col, u32(row)) = { grapheme.text.to_owned(), style, transparent, false };
            if (column_width(grapheme) == 2) {
                result.cell(col + 1, u32(row)) = { ""_s, style, transparent, true };
            }
            col += column_width(grapheme);
        }
    }
    return result;
}

auto Sprite::filled(u32 width, u32 height, di::StringView glyph, GraphicsRendition const& graphics_rendition)
    -> Sprite {
    auto const wide = display_width(glyph) == 2;

    auto result = Sprite {};
    result.width = width;
    result.height = height;
    for (auto _ : di::range(height)) {
        for (auto col : di::range(width)) {
            if (!wide) {
                result.cells.push_back({ glyph.to_owned(), graphics_rendition, false, false });
            } else if (col % 2 == 1) {
                result.cells.push_back({ ""_s, graphics_rendition, false, true });
            } else if (col + 1 == width) {
                // An odd width leaves a single column at the end of each row.
                result.cells.push_back({ ""_s, graphics_rendition, false, false });
            } else {
                result.cells.push_back({ glyph.to_owned(), graphics_rendition, false, false });
            }
        }
    }
    return result;
}
}
