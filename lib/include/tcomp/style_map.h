#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/optional/prelude.h"
#include "tcomp/graphics_rendition.h"

namespace tcomp {
/// @brief Per-cell styling applied when building a sprite from text
///
/// A style map has a default graphics rendition and an optional grid of overrides. Any cell
/// without an override, including cells outside the override grid, uses the default.
class StyleMap {
public:
    StyleMap() = default;
    explicit StyleMap(GraphicsRendition const& default_style) : m_default_style(default_style) {}

    auto default_style() const -> GraphicsRendition const& { return m_default_style; }
    void set_default_style(GraphicsRendition const& style) { m_default_style = style; }

    auto style_at(u32 col, u32 row) const -> GraphicsRendition const&;

    void set_style(u32 col, u32 row, GraphicsRendition const& style);
    void set_row_style(u32 row, u32 col_start, u32 col_end, GraphicsRendition const& style);

    auto clone() const -> StyleMap {
        auto result = StyleMap(m_default_style);
        result.m_rows = di::clone(m_rows);
        return result;
    }

private:
    GraphicsRendition m_default_style {};
    di::Vector<di::Vector<di::Optional<GraphicsRendition>>> m_rows;
};
}
