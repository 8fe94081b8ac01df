#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "tcomp/aabb.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/style_map.h"

namespace tcomp {
/// @brief A single cell of a sprite's glyph grid
struct SpriteCell {
    di::String text;                         ///< Grapheme cluster. Empty text is drawn as a blank.
    GraphicsRendition graphics_rendition {}; ///< Colors and attributes for this cell
    bool transparent { false };              ///< Transparent cells never overwrite what is below them.
    bool continuation { false };             ///< Right half of a wide glyph in the previous column.

    auto clone() const -> SpriteCell { return { di::clone(text), graphics_rendition, transparent, continuation }; }

    auto operator==(SpriteCell const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SpriteCell>) {
        return di::make_fields<"SpriteCell">(di::field<"text", &SpriteCell::text>,
                                             di::field<"graphics_rendition", &SpriteCell::graphics_rendition>,
                                             di::field<"transparent", &SpriteCell::transparent>,
                                             di::field<"continuation", &SpriteCell::continuation>);
    }
};

/// @brief Controls whether space characters in sprite text hide what is below them.
enum class WhitespaceMode {
    Opaque,
    Transparent,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<WhitespaceMode>) {
    using enum WhitespaceMode;
    return di::make_enumerators<"WhitespaceMode">(di::enumerator<"Opaque", Opaque>,
                                                  di::enumerator<"Transparent", Transparent>);
}

/// @brief A positioned, depth ordered grid of styled glyphs
///
/// Sprites are owned by the host, which hands the renderer a read-only snapshot every tick. The position is the
/// top-left screen coordinate, and may be partially or fully off-screen. Higher depth values are drawn on top.
struct Sprite {
    u64 entity_id { 0 };
    i32 x { 0 };
    i32 y { 0 };
    i64 depth { 0 };
    bool visible { true };
    u32 width { 0 };
    u32 height { 0 };
    di::Vector<SpriteCell> cells; ///< Row-major, width * height entries. Sprites with fewer cells are never drawn.

    /// @brief Create a sprite from multi-line text
    ///
    /// Each line of text becomes a row of the sprite, and the sprite is as wide as its widest line. Lines shorter
    /// than the widest line are padded with transparent cells. Wide glyphs occupy 2 columns.
    static auto from_text(di::StringView text, StyleMap const& style_map = {},
                          WhitespaceMode whitespace = WhitespaceMode::Opaque) -> Sprite;

    /// @brief Create a rectangular sprite where every cell displays the same glyph
    ///
    /// The glyph must be a single grapheme cluster. A wide glyph is repeated every 2 columns, and an odd width leaves
    /// the last column of each row blank.
    static auto filled(u32 width, u32 height, di::StringView glyph, GraphicsRendition const& graphics_rendition)
        -> Sprite;

    /// Whether cells holds an entry for every position of the grid.
    auto has_complete_grid() const -> bool { return cells.size() >= usize(width) * height; }

    auto cell(u32 col, u32 row) const -> SpriteCell const& { return cells[usize(row) * width + col]; }
    auto cell(u32 col, u32 row) -> SpriteCell& { return cells[usize(row) * width + col]; }

    /// Screen-space bounding box, before clipping.
    auto bounds() const -> Aabb { return Aabb::from_position_and_size(x, y, width, height); }

    auto x_center() const -> u32 { return width / 2; }
    auto y_center() const -> u32 { return height / 2; }

    auto clone() const -> Sprite {
        return { entity_id, x, y, depth, visible, width, height, di::clone(cells) };
    }

    auto operator==(Sprite const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Sprite>) {
        return di::make_fields<"Sprite">(di::field<"entity_id", &Sprite::entity_id>, di::field<"x", &Sprite::x>,
                                         di::field<"y", &Sprite::y>, di::field<"depth", &Sprite::depth>,
                                         di::field<"visible", &Sprite::visible>, di::field<"width", &Sprite::width>,
                                         di::field<"height", &Sprite::height>, di::field<"cells", &Sprite::cells>);
    }
};
}
