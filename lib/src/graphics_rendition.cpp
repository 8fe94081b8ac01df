#include "tcomp/graphics_rendition.h"

#include "di/container/vector/vector.h"
#include "di/format/prelude.h"
#include "tcomp/color.h"
#include "tcomp/sgr_params.h"

namespace tcomp {
enum class ColorSlot {
    Foreground,
    Background,
    Underline,
};

static auto color_params(Color const& color, ColorSlot slot) -> SgrParams {
    if (color.is_default()) {
        return { { slot == ColorSlot::Foreground ? 39u : slot == ColorSlot::Background ? 49u : 59u } };
    }

    // The underline color was introduced together with subparameters, so it always uses the colon form. Foreground
    // and background colors use the semicolon form, which every terminal understands.
    auto const extended_code = slot == ColorSlot::Foreground ? 38u : slot == ColorSlot::Background ? 48u : 58u;
    if (color.kind == Color::Kind::Rgb) {
        if (slot == ColorSlot::Underline) {
            return { { extended_code, 2, {}, color.r, color.g, color.b } };
        }
        return { { extended_code }, { 2 }, { color.r }, { color.g }, { color.b } };
    }
    if (slot == ColorSlot::Underline) {
        return { { extended_code, 5, color.index } };
    }

    // Named colors have short codes: 30-37 and 90-97 for the foreground, 40-47 and 100-107 for the background.
    if (color.is_named()) {
        auto const bright = color.index >= Color::BrightBlack;
        auto const base = slot == ColorSlot::Foreground ? (bright ? 90u : 30u) : (bright ? 100u : 40u);
        return { { base + color.index % 8 } };
    }
    return { { extended_code }, { 5 }, { color.index } };
}

// Styled underlines need a terminal which understands subparameters. Elsewhere they are shown as a normal
// underline.
static auto supported_underline_mode(UnderlineMode mode, Feature features) -> UnderlineMode {
    if (!!(features & Feature::Undercurl)) {
        return mode;
    }
    switch (mode) {
        case UnderlineMode::Curly:
        case UnderlineMode::Dotted:
        case UnderlineMode::Dashed:
            return UnderlineMode::Normal;
        default:
            return mode;
    }
}

// Styled underlines go in a separate escape sequence, so that no sequence mixes plain parameters with
// subparameters.
static void push_underline(SgrParams& basic, di::Vector<SgrParams>& separate, UnderlineMode mode) {
    switch (mode) {
        case UnderlineMode::None:
            basic.push(24);
            return;
        case UnderlineMode::Normal:
            basic.push(4);
            return;
        case UnderlineMode::Double:
            basic.push(21);
            return;
        case UnderlineMode::Curly:
        case UnderlineMode::Dotted:
        case UnderlineMode::Dashed:
            separate.push_back(SgrParams { { 4, u32(mode) } });
            return;
    }
}

static auto font_weight_code(FontWeight weight) -> di::Optional<u32> {
    switch (weight) {
        case FontWeight::Bold:
            return 1;
        case FontWeight::Dim:
            return 2;
        case FontWeight::None:
            return {};
    }
    return {};
}

static auto blink_code(BlinkMode mode) -> di::Optional<u32> {
    switch (mode) {
        case BlinkMode::Normal:
            return 5;
        case BlinkMode::Rapid:
            return 6;
        case BlinkMode::None:
            return {};
    }
    return {};
}

// Assemble the final list: plain attributes first, then styled underlines, then one sequence per color. Keeping
// colors separate stays well below the 16 parameter limit of most terminals.
static auto assemble(SgrParams basic, di::Vector<SgrParams> separate, di::Vector<SgrParams> colors)
    -> di::Vector<SgrParams> {
    auto result = di::Vector<SgrParams> {};
    if (!basic.empty()) {
        result.push_back(di::move(basic));
    }
    for (auto& params : separate) {
        result.push_back(di::move(params));
    }
    for (auto& params : colors) {
        result.push_back(di::move(params));
    }
    return result;
}

static auto sgr_from_scratch(GraphicsRendition const& self, Feature features) -> di::Vector<SgrParams> {
    auto basic = SgrParams { { 0 } };
    auto separate = di::Vector<SgrParams> {};
    auto colors = di::Vector<SgrParams> {};

    if (auto code = font_weight_code(self.font_weight)) {
        basic.push(*code);
    }
    if (self.italic) {
        basic.push(3);
    }
    if (auto code = blink_code(self.blink_mode)) {
        basic.push(*code);
    }
    if (self.inverted) {
        basic.push(7);
    }
    if (self.invisible) {
        basic.push(8);
    }
    if (self.strike_through) {
        basic.push(9);
    }
    if (self.overline) {
        basic.push(53);
    }
    if (auto mode = supported_underline_mode(self.underline_mode, features); mode != UnderlineMode::None) {
        push_underline(basic, separate, mode);
    }

    if (!self.fg.is_default()) {
        colors.push_back(color_params(self.fg, ColorSlot::Foreground));
    }
    if (!self.bg.is_default()) {
        colors.push_back(color_params(self.bg, ColorSlot::Background));
    }
    if (!!(features & Feature::Undercurl) && !self.underline_color.is_default()) {
        colors.push_back(color_params(self.underline_color, ColorSlot::Underline));
    }
    return assemble(di::move(basic), di::move(separate), di::move(colors));
}

// Every attribute has a dedicated code which turns it off, so only the attributes which changed are emitted.
static auto sgr_delta(GraphicsRendition const& self, Feature features, GraphicsRendition const& prev)
    -> di::Vector<SgrParams> {
    auto basic = SgrParams {};
    auto separate = di::Vector<SgrParams> {};
    auto colors = di::Vector<SgrParams> {};

    if (self.font_weight != prev.font_weight) {
        // Bold and dim share the reset code 22.
        if (prev.font_weight != FontWeight::None) {
            basic.push(22);
        }
        if (auto code = font_weight_code(self.font_weight)) {
            basic.push(*code);
        }
    }
    if (self.italic != prev.italic) {
        basic.push(self.italic ? 3 : 23);
    }
    if (self.blink_mode != prev.blink_mode) {
        basic.push(blink_code(self.blink_mode).value_or(25));
    }
    if (self.inverted != prev.inverted) {
        basic.push(self.inverted ? 7 : 27);
    }
    if (self.invisible != prev.invisible) {
        basic.push(self.invisible ? 8 : 28);
    }
    if (self.strike_through != prev.strike_through) {
        basic.push(self.strike_through ? 9 : 29);
    }
    if (self.overline != prev.overline) {
        basic.push(self.overline ? 53 : 55);
    }
    if (auto mode = supported_underline_mode(self.underline_mode, features);
        mode != supported_underline_mode(prev.underline_mode, features)) {
        push_underline(basic, separate, mode);
    }

    if (self.fg != prev.fg) {
        colors.push_back(color_params(self.fg, ColorSlot::Foreground));
    }
    if (self.bg != prev.bg) {
        colors.push_back(color_params(self.bg, ColorSlot::Background));
    }
    if (!!(features & Feature::Undercurl) && self.underline_color != prev.underline_color) {
        colors.push_back(color_params(self.underline_color, ColorSlot::Underline));
    }
    return assemble(di::move(basic), di::move(separate), di::move(colors));
}

auto GraphicsRendition::as_sgr_params(Feature features, di::Optional<GraphicsRendition const&> prev) const
    -> di::Vector<SgrParams> {
    if (!prev) {
        return sgr_from_scratch(*this, features);
    }
    if (*this == *prev) {
        return {};
    }
    return sgr_delta(*this, features, *prev);
}

auto render_graphics_rendition(GraphicsRendition const& desired, Feature features,
                               di::Optional<GraphicsRendition const&> current) -> di::String {
    auto encode = [&](di::Optional<GraphicsRendition const&> prev) {
        auto result = di::String {};
        for (auto const& params : desired.as_sgr_params(features, prev)) {
            result.append(params.to_escape());
        }
        return result;
    };

    // A delta is usually shorter, but clearing many attributes at once is cheaper with a reset.
    auto from_scratch = encode({});
    if (!current) {
        return from_scratch;
    }
    auto from_current = encode(current);
    if (from_scratch.size_bytes() < from_current.size_bytes()) {
        return from_scratch;
    }
    return from_current;
}
}
