#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"

namespace tcomp {
/// @brief A terminal color
///
/// A color is either the terminal's default, an entry of the 256 color palette, or a 24 bit RGB value. The
/// first 16 palette entries are the named ANSI colors, whose appearance depends on the terminal's theme.
struct Color {
    enum class Kind : u8 {
        Default,
        Indexed,
        Rgb,
    };

    enum Named : u8 {
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        White,
        BrightBlack,
        BrightRed,
        BrightGreen,
        BrightYellow,
        BrightBlue,
        BrightMagenta,
        BrightCyan,
        BrightWhite,
    };

    Color() = default;
    constexpr Color(Named named) : kind(Kind::Indexed), index(named) {}
    constexpr Color(u8 r, u8 g, u8 b) : kind(Kind::Rgb), r(r), g(g), b(b) {}

    constexpr static auto indexed(u8 index) -> Color { return Color(Named(index)); }

    constexpr auto is_default() const -> bool { return kind == Kind::Default; }
    constexpr auto is_named() const -> bool { return kind == Kind::Indexed && index <= BrightWhite; }

    Kind kind { Kind::Default };
    u8 index { 0 };
    u8 r { 0 };
    u8 g { 0 };
    u8 b { 0 };

    auto operator==(Color const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color>) {
        return di::make_fields<"Color">(di::field<"kind", &Color::kind>, di::field<"index", &Color::index>,
                                        di::field<"r", &Color::r>, di::field<"g", &Color::g>,
                                        di::field<"b", &Color::b>);
    }
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Color::Kind>) {
    using enum Color::Kind;
    return di::make_enumerators<"Color::Kind">(di::enumerator<"Default", Default>, di::enumerator<"Indexed", Indexed>,
                                               di::enumerator<"Rgb", Rgb>);
}
}
