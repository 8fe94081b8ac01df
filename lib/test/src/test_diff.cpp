#include "di/test/prelude.h"
#include "tcomp/cell.h"
#include "tcomp/diff.h"
#include "tcomp/frame_buffer.h"
#include "tcomp/graphics_rendition.h"

namespace diff {
using namespace tcomp;

static void put(FrameBuffer& buffer, u32 row, u32 col, di::StringView text, GraphicsRendition const& rendition = {}) {
    auto& cell = buffer.at(row, col);
    cell.text.clear();
    cell.text.append(text);
    cell.graphics_rendition = rendition;
}

static void put_wide(FrameBuffer& buffer, u32 row, u32 col, di::StringView text,
                     GraphicsRendition const& rendition = {}) {
    put(buffer, row, col, text, rendition);
    buffer.at(row, col).width = 2;

    auto& next = buffer.at(row, col + 1);
    next.text.clear();
    next.graphics_rendition = rendition;
    next.continuation = true;
}

static void identical() {
    auto previous = FrameBuffer({ 3, 6 });
    put(previous, 1, 2, "a"_sv);
    auto current = previous.clone();

    ASSERT(tcomp::diff(previous, current).empty());

    // Provenance is not visible on the terminal.
    current.at(1, 2).origin_depth = 7;
    ASSERT(tcomp::diff(previous, current).empty());
}

static void single() {
    auto previous = FrameBuffer({ 2, 6 });
    auto current = previous.clone();
    put(current, 1, 3, "z"_sv);

    auto runs = tcomp::diff(previous, current);
    ASSERT_EQ(runs.size(), 1);
    ASSERT_EQ(runs[0].row, 1);
    ASSERT_EQ(runs[0].col_start, 3);
    ASSERT_EQ(runs[0].col_end, 4);
    ASSERT_EQ(runs[0].width(), 1);
    ASSERT_EQ(runs[0].cells.size(), 1);
    ASSERT_EQ(runs[0].cells[0].text, "z"_sv);
}

static void merge() {
    auto previous = FrameBuffer({ 2, 8 });
    auto current = previous.clone();
    put(current, 0, 1, "a"_sv);
    put(current, 0, 2, "b"_sv);
    put(current, 0, 4, "c"_sv);
    put(current, 1, 7, "d"_sv);

    // A style change alone makes a cell dirty.
    put(current, 1, 0, ""_sv, { .bg = Color::Blue });

    auto runs = tcomp::diff(previous, current);
    ASSERT_EQ(runs.size(), 4);

    struct Expected {
        u32 row;
        u32 col_start;
        u32 col_end;
    };
    auto expected = di::Array {
        Expected { 0, 1, 3 },
        Expected { 0, 4, 5 },
        Expected { 1, 0, 1 },
        Expected { 1, 7, 8 },
    };
    for (auto const& [ex, run] : di::zip(expected, runs)) {
        ASSERT_EQ(ex.row, run.row);
        ASSERT_EQ(ex.col_start, run.col_start);
        ASSERT_EQ(ex.col_end, run.col_end);
        ASSERT_EQ(run.cells.size(), run.width());
    }

    ASSERT_EQ(runs[0].cells[0].text, "a"_sv);
    ASSERT_EQ(runs[0].cells[1].text, "b"_sv);
}

static void wide() {
    auto previous = FrameBuffer({ 1, 6 });
    put_wide(previous, 0, 2, "猫"_sv);

    // Only the owner changes, but the continuation is always emitted with it.
    auto current = previous.clone();
    current.at(0, 2).graphics_rendition = { .font_weight = FontWeight::Bold };

    auto runs = tcomp::diff(previous, current);
    ASSERT_EQ(runs.size(), 1);
    ASSERT_EQ(runs[0].col_start, 2);
    ASSERT_EQ(runs[0].col_end, 4);

    // Replacing a narrow cell with the start of a wide glyph dirties both columns.
    auto narrow = FrameBuffer({ 1, 6 });
    put(narrow, 0, 2, "a"_sv);
    runs = tcomp::diff(narrow, previous);
    ASSERT_EQ(runs.size(), 1);
    ASSERT_EQ(runs[0].col_start, 2);
    ASSERT_EQ(runs[0].col_end, 4);
}

static void full_redraw() {
    auto previous = FrameBuffer({ 2, 5 });
    auto current = previous.clone();

    auto runs = tcomp::diff(previous, current, DiffMode::FullRedraw);
    ASSERT_EQ(runs.size(), 2);
    for (auto [row, run] : di::enumerate(runs)) {
        ASSERT_EQ(run.row, row);
        ASSERT_EQ(run.col_start, 0);
        ASSERT_EQ(run.col_end, 5);
        ASSERT_EQ(run.cells.size(), 5);
    }

    // A change in size redraws everything.
    auto smaller = FrameBuffer({ 1, 5 });
    runs = tcomp::diff(smaller, current);
    ASSERT_EQ(runs.size(), 2);
    ASSERT_EQ(runs[1].width(), 5);

    // Nothing to draw on an empty screen.
    ASSERT(tcomp::diff(current, FrameBuffer({ 0, 0 }), DiffMode::FullRedraw).empty());
}

TEST(diff, identical)
TEST(diff, single)
TEST(diff, merge)
TEST(diff, wide)
TEST(diff, full_redraw)
}
