#pragma once

#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/cell.h"
#include "tcomp/frame_buffer.h"

namespace tcomp {
/// @brief A horizontal span of changed cells
///
/// The cells refer to the current frame buffer, and are only valid until it is modified.
struct DiffRun {
    u32 row { 0 };
    u32 col_start { 0 };
    u32 col_end { 0 }; ///< Exclusive
    di::Span<Cell const> cells;

    auto width() const -> u32 { return col_end - col_start; }
};

enum class DiffMode {
    Incremental, ///< Only emit cells which differ
    FullRedraw,  ///< Treat every cell as dirty
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<DiffMode>) {
    using enum DiffMode;
    return di::make_enumerators<"DiffMode">(di::enumerator<"Incremental", Incremental>,
                                            di::enumerator<"FullRedraw", FullRedraw>);
}

/// @brief Compute the runs of cells which changed between previous and current
///
/// Runs are ordered by row and then by column. Adjacent dirty cells in a row are merged, and the
/// continuation cell of a wide glyph is always part of the same run as its owner. If the buffers have
/// different sizes, every cell of current is considered dirty.
auto diff(FrameBuffer const& previous, FrameBuffer const& current, DiffMode mode = DiffMode::Incremental)
    -> di::Vector<DiffRun>;
}
