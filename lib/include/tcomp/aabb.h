#pragma once

#include "di/math/numeric_limits.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/util/clamp.h"
#include "di/vocab/optional/prelude.h"
#include "tcomp/size.h"

namespace tcomp {
/// @brief Axis aligned bounding box in screen cell coordinates
///
/// The box is half-open: it covers columns [x0, x1) and rows [y0, y1).
struct Aabb {
    i32 x0 { 0 };
    i32 y0 { 0 };
    i32 x1 { 0 };
    i32 y1 { 0 };

    constexpr static auto from_position_and_size(i32 x, i32 y, u32 width, u32 height) -> Aabb {
        // Widen before adding so that sprites placed near the edge of the coordinate space don't overflow.
        auto clamp = [](i64 value) -> i32 {
            return i32(di::clamp(value, i64(di::NumericLimits<i32>::min), i64(di::NumericLimits<i32>::max)));
        };
        return { x, y, clamp(i64(x) + width), clamp(i64(y) + height) };
    }

    constexpr static auto from_size(Size const& size) -> Aabb {
        return from_position_and_size(0, 0, size.cols, size.rows);
    }

    constexpr auto empty() const -> bool { return x0 >= x1 || y0 >= y1; }
    constexpr auto width() const -> u32 { return empty() ? 0 : u32(i64(x1) - x0); }
    constexpr auto height() const -> u32 { return empty() ? 0 : u32(i64(y1) - y0); }

    constexpr auto intersects(Aabb const& other) const -> bool {
        return !empty() && !other.empty() && x0 < other.x1 && other.x0 < x1 && y0 < other.y1 && other.y0 < y1;
    }

    constexpr auto contains(i32 x, i32 y) const -> bool { return x >= x0 && x < x1 && y >= y0 && y < y1; }

    constexpr auto intersection(Aabb const& other) const -> di::Optional<Aabb> {
        auto result = Aabb { di::max(x0, other.x0), di::max(y0, other.y0), di::min(x1, other.x1),
                             di::min(y1, other.y1) };
        if (result.empty()) {
            return {};
        }
        return result;
    }

    /// Smallest box containing both boxes. Empty boxes are ignored.
    constexpr auto merged(Aabb const& other) const -> Aabb {
        if (empty()) {
            return other;
        }
        if (other.empty()) {
            return *this;
        }
        return { di::min(x0, other.x0), di::min(y0, other.y0), di::max(x1, other.x1), di::max(y1, other.y1) };
    }

    // Doubled center coordinates, which avoids rounding when comparing centroids.
    constexpr auto center_x2() const -> i64 { return i64(x0) + x1; }
    constexpr auto center_y2() const -> i64 { return i64(y0) + y1; }

    auto operator==(Aabb const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Aabb>) {
        return di::make_fields<"Aabb">(di::field<"x0", &Aabb::x0>, di::field<"y0", &Aabb::y0>,
                                       di::field<"x1", &Aabb::x1>, di::field<"y1", &Aabb::y1>);
    }
};
}
