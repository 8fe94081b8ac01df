#include "tcomp/grapheme.h"

#include "di/container/string/string_view.h"
#include "dius/unicode/emoji.h"
#include "dius/unicode/grapheme_cluster.h"
#include "dius/unicode/width.h"

namespace tcomp {
auto display_width(di::StringView grapheme) -> u8 {
    // The width of a cluster is the width of its widest code point, which handles both combining marks
    // (width 0) and ZWJ emoji sequences (width 2). Variation selector 16 requests emoji presentation, which
    // promotes the preceding emoji to width 2.
    auto result = 0_u8;
    auto prev = c32(0);
    for (auto code_point : grapheme) {
        if (code_point == dius::unicode::VariationSelector_16) {
            if (prev != 0 && dius::unicode::emoji(prev) == dius::unicode::Emoji::Yes) {
                result = 2;
            }
        } else {
            auto width = u8(dius::unicode::code_point_width(code_point).value_or(1));
            result = di::max(result, width);
        }
        prev = code_point;
    }
    return di::min(result, 2_u8);
}

auto split_graphemes(di::StringView text) -> di::Vector<Grapheme> {
    auto result = di::Vector<Grapheme> {};
    auto clusterer = dius::unicode::GraphemeClusterer {};
    auto start = text.begin();
    for (auto it = text.begin(); it != text.end(); ++it) {
        // Every code point must be fed to the clusterer, since the boundary rules depend on prior state.
        auto is_break = clusterer.is_boundary(*it);
        if (it == text.begin() || !is_break) {
            continue;
        }

        auto cluster = di::StringView(start, it);
        result.push_back({ cluster, display_width(cluster) });
        start = it;
    }
    if (start != text.end()) {
        auto cluster = di::StringView(start, text.end());
        result.push_back({ cluster, display_width(cluster) });
    }
    return result;
}

auto text_width(di::StringView text) -> usize {
    auto result = 0_usize;
    for (auto const& grapheme : split_graphemes(text)) {
        result += grapheme.width;
    }
    return result;
}
}
