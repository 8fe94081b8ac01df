#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "tcomp/color.h"
#include "tcomp/features.h"
#include "tcomp/sgr_params.h"

namespace tcomp {
enum class FontWeight : u8 { None, Bold, Dim };
enum class BlinkMode : u8 { None, Normal, Rapid };

/// Values match the SGR 4:n subparameter.
enum class UnderlineMode : u8 { None, Normal, Double, Curly, Dotted, Dashed };

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<FontWeight>) {
    using enum FontWeight;
    return di::make_enumerators<"FontWeight">(di::enumerator<"None", None>, di::enumerator<"Bold", Bold>,
                                              di::enumerator<"Dim", Dim>);
}

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<BlinkMode>) {
    using enum BlinkMode;
    return di::make_enumerators<"BlinkMode">(di::enumerator<"None", None>, di::enumerator<"Normal", Normal>,
                                             di::enumerator<"Rapid", Rapid>);
}

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<UnderlineMode>) {
    using enum UnderlineMode;
    return di::make_enumerators<"UnderlineMode">(
        di::enumerator<"None", None>, di::enumerator<"Normal", Normal>, di::enumerator<"Double", Double>,
        di::enumerator<"Curly", Curly>, di::enumerator<"Dotted", Dotted>, di::enumerator<"Dashed", Dashed>);
}

/// @brief Colors and text attributes of a cell
///
/// A default constructed rendition is the terminal's state after `CSI 0 m`.
struct GraphicsRendition {
    Color fg {};
    Color bg {};
    Color underline_color {}; ///< Only emitted with Feature::Undercurl

    FontWeight font_weight { FontWeight::None };
    BlinkMode blink_mode { BlinkMode::None };
    UnderlineMode underline_mode { UnderlineMode::None };
    bool italic { false };
    bool overline { false };
    bool inverted { false };
    bool invisible { false };
    bool strike_through { false };

    /// @brief SGR parameter lists which set this rendition
    ///
    /// Without prev, the first list starts with a reset. Otherwise only the changed attributes are included,
    /// and the result is empty when nothing changed. Each list is sent as its own escape sequence.
    auto as_sgr_params(Feature features = Feature::None, di::Optional<GraphicsRendition const&> prev = {}) const
        -> di::Vector<SgrParams>;

    auto operator==(GraphicsRendition const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<GraphicsRendition>) {
        return di::make_fields<"GraphicsRendition">(
            di::field<"fg", &GraphicsRendition::fg>, di::field<"bg", &GraphicsRendition::bg>,
            di::field<"underline_color", &GraphicsRendition::underline_color>,
            di::field<"font_weight", &GraphicsRendition::font_weight>,
            di::field<"blink_mode", &GraphicsRendition::blink_mode>,
            di::field<"underline_mode", &GraphicsRendition::underline_mode>,
            di::field<"italic", &GraphicsRendition::italic>, di::field<"overline", &GraphicsRendition::overline>,
            di::field<"inverted", &GraphicsRendition::inverted>, di::field<"invisible", &GraphicsRendition::invisible>,
            di::field<"strike_through", &GraphicsRendition::strike_through>);
    }
};

/// @brief Escape sequences which switch the terminal from current to desired
///
/// The shorter of a delta and a full reset is returned. An unknown current rendition always uses a reset.
auto render_graphics_rendition(GraphicsRendition const& desired, Feature features,
                               di::Optional<GraphicsRendition const&> current) -> di::String;
}
