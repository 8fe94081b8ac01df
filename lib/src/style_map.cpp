#include "tcomp/style_map.h"

#include "tcomp/graphics_rendition.h"

namespace tcomp {
auto StyleMap::style_at(u32 col, u32 row) const -> GraphicsRendition const& {
    if (row >= m_rows.size()) {
        return m_default_style;
    }
    auto const& styles = m_rows[row];
    if (col >= styles.size() || !styles[col]) {
        return m_default_style;
    }
    return styles[col].value();
}

void StyleMap::set_style(u32 col, u32 row, GraphicsRendition const& style) {
    if (row >= m_rows.size()) {
        m_rows.resize(row + 1);
    }
    auto& styles = m_rows[row];
    if (col >= styles.size()) {
        styles.resize(col + 1);
    }
    styles[col] = style;
}

void StyleMap::set_row_style(u32 row, u32 col_start, u32 col_end, GraphicsRendition const& style) {
    for (auto col : di::range(col_start, col_end)) {
        set_style(col, row, style);
    }
}
}
