#include "tcomp/diff.h"

#include "tcomp/cell.h"
#include "tcomp/frame_buffer.h"

namespace tcomp {
static auto make_run(FrameBuffer const& current, u32 row, u32 col_start, u32 col_end) -> DiffRun {
    return { row, col_start, col_end, *current.row(row).subspan(col_start, col_end - col_start) };
}

auto diff(FrameBuffer const& previous, FrameBuffer const& current, DiffMode mode) -> di::Vector<DiffRun> {
    auto result = di::Vector<DiffRun> {};
    auto const& size = current.size();
    if (size.empty()) {
        return result;
    }

    if (mode == DiffMode::FullRedraw || !previous.size().same_grid(size)) {
        for (auto row : di::range(size.rows)) {
            result.push_back(make_run(current, row, 0, size.cols));
        }
        return result;
    }

    for (auto row : di::range(size.rows)) {
        auto previous_row = previous.row(row);
        auto current_row = current.row(row);

        auto run_start = di::Optional<u32> {};
        auto owner_dirty = false;
        for (auto col : di::range(size.cols)) {
            auto const& cell = current_row[col];

            // Continuation cells follow their owner, which is always the cell to the left.
            auto dirty = (cell.continuation && col > 0) ? owner_dirty : !cell.visually_equal(previous_row[col]);
            if (dirty && !run_start) {
                run_start = col;
            } else if (!dirty && run_start) {
                result.push_back(make_run(current, row, *run_start, col));
                run_start = {};
            }
            owner_dirty = dirty;
        }
        if (run_start) {
            result.push_back(make_run(current, row, *run_start, size.cols));
        }
    }
    return result;
}
}
