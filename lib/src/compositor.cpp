#include "tcomp/compositor.h"

#include "di/container/algorithm/sort.h"
#include "di/vocab/tuple/prelude.h"
#include "tcomp/cell.h"
#include "tcomp/frame_buffer.h"
#include "tcomp/grapheme.h"
#include "tcomp/spatial_index.h"

namespace tcomp {
// Turn a cell into a blank, keeping its style and provenance.
static void blank_cell(Cell& cell) {
    cell.text.clear();
    cell.width = 1;
    cell.continuation = false;
}

// Before overwriting the cell at col, make sure we don't leave half of a wide glyph behind.
static void break_wide_cell(FrameBuffer& target, u32 row, u32 col) {
    auto& cell = target.at(row, col);
    if (cell.continuation && col > 0) {
        blank_cell(target.at(row, col - 1));
    } else if (cell.width == 2 && col + 1 < target.size().cols) {
        blank_cell(target.at(row, col + 1));
    }
}

static void put_cell(FrameBuffer& target, u32 row, u32 col, di::StringView text,
                     GraphicsRendition const& graphics_rendition, bool wide, i64 depth) {
    break_wide_cell(target, row, col);
    if (wide) {
        break_wide_cell(target, row, col + 1);
    }

    auto& cell = target.at(row, col);
    cell.text.clear();
    cell.text.append(text);
    cell.graphics_rendition = graphics_rendition;
    cell.width = wide ? 2 : 1;
    cell.continuation = false;
    cell.origin_depth = depth;

    if (wide) {
        auto& next = target.at(row, col + 1);
        next.text.clear();
        next.graphics_rendition = graphics_rendition;
        next.width = 1;
        next.continuation = true;
        next.origin_depth = depth;
    }
}

void Compositor::paint_band(FrameBuffer& target, Sprite const& sprite, Aabb const& clipped, u32 band_start,
                            u32 band_end) {
    auto row_start = di::max(u32(clipped.y0), band_start);
    auto row_end = di::min(u32(clipped.y1), band_end);
    auto const col_end = u32(clipped.x1);
    for (auto row : di::range(row_start, row_end)) {
        auto sprite_row = u32(i64(row) - sprite.y);
        auto covered = false;
        for (auto col : di::range(u32(clipped.x0), col_end)) {
            // The second half of the previous wide glyph already occupies this column.
            if (covered) {
                covered = false;
                continue;
            }

            auto sprite_col = u32(i64(col) - sprite.x);
            auto const& cell = sprite.cell(sprite_col, sprite_row);
            if (cell.transparent) {
                continue;
            }

            if (cell.continuation) {
                // Normally the continuation is written along with its owner. When the owner is clipped off
                // the left edge, the remaining half is drawn as a blank.
                if (col == u32(clipped.x0)) {
                    put_cell(target, row, col, ""_sv, cell.graphics_rendition, false, sprite.depth);
                }
                continue;
            }

            // Sprites built by the host may omit the continuation cell, so the glyph itself decides.
            auto wide = display_width(cell.text.view()) == 2 ||
                        (sprite_col + 1 < sprite.width && sprite.cell(sprite_col + 1, sprite_row).continuation);
            if (wide && col + 1 >= col_end) {
                // No room for the second half, so clip the glyph to a single blank column.
                put_cell(target, row, col, ""_sv, cell.graphics_rendition, false, sprite.depth);
                continue;
            }
            put_cell(target, row, col, cell.text.view(), cell.graphics_rendition, wide, sprite.depth);
            covered = wide;
        }
    }
}

void Compositor::compose_into(FrameBuffer& target, SpatialIndex const& index, di::Span<Sprite const> sprites,
                              Size const& size) {
    target.reset(size);
    if (size.empty() || index.empty()) {
        return;
    }

    auto band_height = di::max(m_options.band_height, 1_u32);
    for (auto band_start = 0_u32; band_start < size.rows;) {
        auto band_end = u32(di::min(u64(band_start) + band_height, u64(size.rows)));
        auto band = Aabb::from_position_and_size(0, i32(band_start), size.cols, band_end - band_start);

        m_band_entries.clear();
        index.visit_overlapping(band, [&](SpatialEntry const& entry) {
            m_band_entries.push_back(entry);
        });
        di::sort(m_band_entries, di::compare, [](SpatialEntry const& entry) {
            return di::Tuple { entry.depth, entry.entity_id, entry.sprite_index };
        });

        for (auto const& entry : m_band_entries) {
            paint_band(target, sprites[entry.sprite_index], entry.aabb, band_start, band_end);
        }
        band_start = band_end;
    }
}

auto Compositor::compose(SpatialIndex const& index, di::Span<Sprite const> sprites, Size const& size)
    -> FrameBuffer {
    auto result = FrameBuffer {};
    compose_into(result, index, sprites, size);
    return result;
}
}
