#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "dius/tty.h"

namespace tcomp {
/// @brief Terminal dimensions in cells, plus the pixel size when the terminal reports it
struct Size {
    u32 rows { 0 };
    u32 cols { 0 };
    u32 xpixels { 0 };
    u32 ypixels { 0 };

    static auto from_window_size(dius::tty::WindowSize const& window_size) -> Size {
        return { window_size.rows, window_size.cols, window_size.pixel_width, window_size.pixel_height };
    }

    constexpr auto empty() const -> bool { return rows == 0 || cols == 0; }
    constexpr auto cell_count() const -> usize { return usize(rows) * usize(cols); }

    // Center coordinates, used by hosts to place sprites in the middle of the screen.
    constexpr auto x_center() const -> u32 { return cols / 2; }
    constexpr auto y_center() const -> u32 { return rows / 2; }

    // Compares only the cell grid. Pixel sizes don't affect rendering.
    constexpr auto same_grid(Size const& other) const -> bool { return rows == other.rows && cols == other.cols; }

    auto operator==(Size const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Size>) {
        return di::make_fields<"Size">(di::field<"rows", &Size::rows>, di::field<"cols", &Size::cols>,
                                       di::field<"xpixels", &Size::xpixels>, di::field<"ypixels", &Size::ypixels>);
    }
};
}
