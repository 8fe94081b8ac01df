#pragma once

#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace tcomp {
/// @brief A single user-perceived character and the number of terminal columns it occupies.
struct Grapheme {
    di::StringView text;
    u8 width { 1 };

    auto operator==(Grapheme const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Grapheme>) {
        return di::make_fields<"Grapheme">(di::field<"text", &Grapheme::text>, di::field<"width", &Grapheme::width>);
    }
};

/// @brief Compute the display width of a single grapheme cluster
///
/// @return 0 for empty or purely combining clusters, 1 for normal text, and 2 for wide (east asian or emoji
/// presentation) clusters. Code points with an undefined width count as a single column.
auto display_width(di::StringView grapheme) -> u8;

/// @brief Split text into grapheme clusters, using the extended grapheme cluster rules
///
/// The returned views point into text.
auto split_graphemes(di::StringView text) -> di::Vector<Grapheme>;

/// @brief Total display width of text, summed cluster by cluster
auto text_width(di::StringView text) -> usize;
}
