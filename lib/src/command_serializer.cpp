#include "tcomp/command_serializer.h"

#include "tcomp/cell.h"
#include "tcomp/diff.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
void CommandSerializer::reset() {
    m_cursor_row = {};
    m_cursor_col = {};
    m_graphics_rendition = {};
    m_cursor_mode = {};
}

void CommandSerializer::move_cursor(di::Vector<TerminalCommand>& commands, u32 row, u32 col) {
    if (m_cursor_row == row && m_cursor_col == col) {
        return;
    }
    commands.push_back(MoveCursor { row, col });
    m_cursor_row = row;
    m_cursor_col = col;
}

// Writing a few clean cells is cheaper than moving the cursor over them, as long as doing so doesn't
// require changing the graphics rendition. Only simple narrow cells are rewritten.
auto CommandSerializer::bridge_start(FrameBuffer const& current, DiffRun const& run) const -> di::Optional<u32> {
    if (m_options.max_bridge_gap == 0 || m_cursor_row != run.row || !m_cursor_col || !m_graphics_rendition) {
        return {};
    }
    auto col = *m_cursor_col;
    if (col >= run.col_start || run.col_start - col > m_options.max_bridge_gap) {
        return {};
    }
    for (auto const& cell : *current.row(run.row).subspan(col, run.col_start - col)) {
        if (cell.continuation || cell.width != 1 || cell.graphics_rendition != *m_graphics_rendition) {
            return {};
        }
    }
    return col;
}

void CommandSerializer::write_cells(di::Vector<TerminalCommand>& commands, FrameBuffer const& current, u32 row,
                                    u32 col_start, u32 col_end) {
    auto text = di::String {};
    auto width = 0_u32;
    auto flush = [&] {
        if (width == 0) {
            return;
        }
        commands.push_back(WriteText { di::move(text), width });
        text = {};

        // Forget the cursor column once it reaches the last column. Terminals disagree on where the cursor
        // ends up when autowrap is disabled.
        if (m_cursor_col) {
            *m_cursor_col += width;
            if (*m_cursor_col >= current.size().cols) {
                m_cursor_col = {};
            }
        }
        width = 0;
    };

    for (auto const& cell : *current.row(row).subspan(col_start, col_end - col_start)) {
        if (cell.continuation) {
            continue;
        }
        if (m_graphics_rendition != cell.graphics_rendition) {
            flush();
            commands.push_back(SetGraphicsRendition { cell.graphics_rendition });
            m_graphics_rendition = cell.graphics_rendition;
        }
        if (cell.text.empty()) {
            text.append(" "_sv);
        } else {
            text.append(cell.text);
        }
        width += cell.width;
        m_cells_written++;
    }
    flush();
}

auto CommandSerializer::serialize(FrameBuffer const& current, di::Span<DiffRun const> runs,
                                  di::Optional<RenderedCursor const&> cursor) -> di::Vector<TerminalCommand> {
    auto commands = di::Vector<TerminalCommand> {};
    m_cells_written = 0;
    for (auto const& run : runs) {
        if (run.col_start >= run.col_end) {
            continue;
        }

        auto start = bridge_start(current, run);
        if (!start) {
            move_cursor(commands, run.row, run.col_start);
            start = run.col_start;
        }
        write_cells(commands, current, run.row, *start, run.col_end);
    }

    if (m_options.emit_cursor && cursor) {
        if (!cursor->hidden) {
            move_cursor(commands, cursor->cursor_row, cursor->cursor_col);
        }
        auto mode = SetCursor { cursor->hidden, cursor->style };
        if (m_cursor_mode != mode) {
            commands.push_back(mode);
            m_cursor_mode = mode;
        }
    }
    return commands;
}
}
