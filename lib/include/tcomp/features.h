#pragma once

#include "di/reflect/prelude.h"
#include "di/util/bitwise_enum.h"

namespace tcomp {
/// @brief Optional capabilities of the host terminal which change the emitted escape sequences
enum class Feature : u64 {
    None = 0,
    SyncronizedOutput = 1 << 0, ///< Wrap each tick in DEC mode 2026, so the terminal never shows a partial frame
    Undercurl = 1 << 1,         ///< Styled underlines (SGR 4:n) and underline colors (SGR 58)
};

DI_DEFINE_ENUM_BITWISE_OPERATIONS(Feature)

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Feature>) {
    using enum Feature;
    return di::make_enumerators<"Feature">(di::enumerator<"None", None>,
                                           di::enumerator<"SyncronizedOutput", SyncronizedOutput>,
                                           di::enumerator<"Undercurl", Undercurl>);
}
}
