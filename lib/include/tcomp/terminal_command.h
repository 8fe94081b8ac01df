#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/variant/prelude.h"
#include "tcomp/graphics_rendition.h"

namespace tcomp {
/// @brief Host cursor shape, using the numbering of DECSCUSR (CSI Ps SP q)
enum class CursorStyle {
    BlinkingBlock = 1,
    SteadyBlock = 2,
    BlinkingUnderline = 3,
    SteadyUnderline = 4,
    BlinkingBar = 5,
    SteadyBar = 6,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<CursorStyle>) {
    using enum CursorStyle;
    return di::make_enumerators<"CursorStyle">(
        di::enumerator<"BlinkingBlock", BlinkingBlock>, di::enumerator<"SteadyBlock", SteadyBlock>,
        di::enumerator<"BlinkingUnderline", BlinkingUnderline>, di::enumerator<"SteadyUnderline", SteadyUnderline>,
        di::enumerator<"BlinkingBar", BlinkingBar>, di::enumerator<"SteadyBar", SteadyBar>);
}

/// @brief Cursor state requested by the host for the end of a tick
struct RenderedCursor {
    u32 cursor_row { 0 };
    u32 cursor_col { 0 };
    CursorStyle style { CursorStyle::SteadyBlock };
    bool hidden { true };

    auto operator==(RenderedCursor const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<RenderedCursor>) {
        return di::make_fields<"RenderedCursor">(
            di::field<"cursor_row", &RenderedCursor::cursor_row>, di::field<"cursor_col", &RenderedCursor::cursor_col>,
            di::field<"style", &RenderedCursor::style>, di::field<"hidden", &RenderedCursor::hidden>);
    }
};

struct MoveCursor {
    u32 row { 0 };
    u32 col { 0 };

    auto operator==(MoveCursor const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<MoveCursor>) {
        return di::make_fields<"MoveCursor">(di::field<"row", &MoveCursor::row>, di::field<"col", &MoveCursor::col>);
    }
};

struct SetGraphicsRendition {
    GraphicsRendition graphics_rendition;

    auto operator==(SetGraphicsRendition const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SetGraphicsRendition>) {
        return di::make_fields<"SetGraphicsRendition">(
            di::field<"graphics_rendition", &SetGraphicsRendition::graphics_rendition>);
    }
};

/// Text written at the cursor, which advances the cursor by width columns.
struct WriteText {
    di::String text;
    u32 width { 0 };

    auto clone() const -> WriteText { return { di::clone(text), width }; }

    auto operator==(WriteText const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<WriteText>) {
        return di::make_fields<"WriteText">(di::field<"text", &WriteText::text>,
                                            di::field<"width", &WriteText::width>);
    }
};

struct SetCursor {
    bool hidden { false };
    CursorStyle style { CursorStyle::SteadyBlock };

    auto operator==(SetCursor const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SetCursor>) {
        return di::make_fields<"SetCursor">(di::field<"hidden", &SetCursor::hidden>,
                                            di::field<"style", &SetCursor::style>);
    }
};

/// @brief A single device independent terminal operation
using TerminalCommand = di::Variant<MoveCursor, SetGraphicsRendition, WriteText, SetCursor>;
}
