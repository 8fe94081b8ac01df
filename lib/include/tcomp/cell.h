#pragma once

#include "di/container/string/prelude.h"
#include "di/math/numeric_limits.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "tcomp/graphics_rendition.h"

namespace tcomp {
/// @brief A single composited terminal cell
///
/// Cells with empty text are blank, and are drawn as a space using the background color of the graphics
/// rendition. A cell of width 2 is always followed by a continuation cell, which is never written on its own.
struct Cell {
    constexpr static auto no_depth = di::NumericLimits<i64>::min;

    di::String text;
    GraphicsRendition graphics_rendition {};
    u8 width { 1 };
    bool continuation { false };
    i64 origin_depth { no_depth }; ///< Depth of the sprite which painted this cell

    auto clone() const -> Cell { return { di::clone(text), graphics_rendition, width, continuation, origin_depth }; }

    auto is_default() const -> bool {
        return text.empty() && graphics_rendition == GraphicsRendition {} && width == 1 && !continuation;
    }

    // Two cells look the same on the terminal. Depth provenance is ignored.
    auto visually_equal(Cell const& other) const -> bool {
        return text == other.text && graphics_rendition == other.graphics_rendition && width == other.width &&
               continuation == other.continuation;
    }

    auto operator==(Cell const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Cell>) {
        return di::make_fields<"Cell">(di::field<"text", &Cell::text>,
                                       di::field<"graphics_rendition", &Cell::graphics_rendition>,
                                       di::field<"width", &Cell::width>,
                                       di::field<"continuation", &Cell::continuation>,
                                       di::field<"origin_depth", &Cell::origin_depth>);
    }
};
}
