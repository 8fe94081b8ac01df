#include "tcomp/escape_encoder.h"

#include "di/format/prelude.h"
#include "di/function/overload.h"
#include "di/vocab/variant/prelude.h"
#include "tcomp/features.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
auto EscapeEncoder::setup(TerminalSettings const& settings) -> di::String {
    m_cleanup = {};
    m_features = settings.features;

    auto buffer = di::String {};

    // Setup - alternate screen buffer.
    buffer.append("\033[?1049h"_sv);
    m_cleanup.push_back("\033[?1049l"_s);

    // Setup - disable autowrap.
    buffer.append("\033[?7l"_sv);
    m_cleanup.push_back("\033[?7h"_s);

    // Setup - hide the cursor. It is shown again on each tick if the host wants it visible.
    buffer.append("\033[?25l"_sv);
    m_cleanup.push_back("\033[?25h"_s);

    // Setup - window title. The old title is saved on the terminal's title stack.
    if (!settings.title.empty()) {
        buffer.append(*di::present("\033[22;2t\033]2;{}\033\\"_sv, settings.title));
        m_cleanup.push_back("\033[23;2t"_s);
    }

    // Setup - clear the screen and reset graphics state, so that nothing is left from before.
    buffer.append("\033[H\033[m\033[2J"_sv);
    m_cursor_row = 0;
    m_cursor_col = 0;
    m_graphics_rendition = GraphicsRendition {};
    m_cursor_style = {};
    m_cursor_hidden = true;

    return buffer;
}

auto EscapeEncoder::cleanup() -> di::String {
    auto buffer = di::String {};
    buffer.append("\033[m"_sv);
    if (m_cursor_style) {
        // Restore the terminal's default cursor shape.
        buffer.append("\033[ q"_sv);
    }
    for (auto const& string : m_cleanup | di::reverse) {
        buffer.append(string);
    }
    m_cleanup.clear();
    forget_state();
    return buffer;
}

void EscapeEncoder::forget_state() {
    m_cursor_row = {};
    m_cursor_col = {};
    m_graphics_rendition = {};
    m_cursor_style = {};
    m_cursor_hidden = true;
}

static auto current_graphics_rendition(di::Optional<GraphicsRendition> const& value)
    -> di::Optional<GraphicsRendition const&> {
    if (!value) {
        return {};
    }
    return *value;
}

// Moves within the current row. An unknown column can only be left with CR or CHA.
static void append_horizontal_move(di::String& buffer, di::Optional<u32> from, u32 to) {
    if (to == 0) {
        buffer.append("\r"_sv);
    } else if (!from) {
        buffer.append(*di::present("\033[{}G"_sv, to + 1));
    } else if (*from == to + 1) {
        buffer.append("\x08"_sv);
    } else if (*from > to) {
        buffer.append(*di::present("\033[{}D"_sv, *from - to));
    } else if (*from < to) {
        buffer.append(*di::present("\033[{}C"_sv, to - *from));
    }
}

// Moves within the current column. LF and RI cover adjacent rows.
static void append_vertical_move(di::String& buffer, u32 from, u32 to) {
    if (to == from + 1) {
        buffer.append("\n"_sv);
    } else if (to + 1 == from) {
        buffer.append("\033M"_sv);
    } else if (to < from) {
        buffer.append(*di::present("\033[{}A"_sv, from - to));
    } else {
        buffer.append(*di::present("\033[{}B"_sv, to - from));
    }
}

static void append_absolute_move(di::String& buffer, u32 row, u32 col) {
    if (row == 0 && col == 0) {
        buffer.append("\033[H"_sv);
    } else {
        buffer.append(*di::present("\033[{};{}H"_sv, row + 1, col + 1));
    }
}

// Emits a short sequence taking the cursor from its tracked position to the target. Relative movement is
// only attempted along one axis, or diagonally to an adjacent row. Everything else falls back to CUP.
static void move_cursor(di::String& buffer, di::Optional<u32> current_row, di::Optional<u32> current_col,
                        u32 target_row, u32 target_col) {
    if (!current_row) {
        append_absolute_move(buffer, target_row, target_col);
        return;
    }

    auto const row = *current_row;
    auto const adjacent_row = target_row == row + 1 || target_row + 1 == row;
    if (row == target_row) {
        if (current_col != target_col) {
            append_horizontal_move(buffer, current_col, target_col);
        }
    } else if (current_col == target_col) {
        append_vertical_move(buffer, row, target_row);
    } else if (target_col == 0 && target_row == 0) {
        append_absolute_move(buffer, 0, 0);
    } else if (target_col == 0 && adjacent_row) {
        buffer.append("\r"_sv);
        append_vertical_move(buffer, row, target_row);
    } else if (target_col == 0 && target_row > row) {
        buffer.append(*di::present("\033[{}E"_sv, target_row - row));
    } else if (target_col == 0) {
        buffer.append(*di::present("\033[{}F"_sv, row - target_row));
    } else if (adjacent_row) {
        append_horizontal_move(buffer, current_col, target_col);
        append_vertical_move(buffer, row, target_row);
    } else {
        append_absolute_move(buffer, target_row, target_col);
    }
}

auto EscapeEncoder::encode(di::Span<TerminalCommand const> commands) -> di::String {
    auto buffer = di::String {};
    if (commands.empty()) {
        return buffer;
    }

    // Start sequence: begin a synchronized update and hide the cursor.
    auto const synchronized = !!(m_features & Feature::SyncronizedOutput);
    if (synchronized) {
        buffer.append("\033[?2026h"_sv);
    }
    if (!m_cursor_hidden) {
        buffer.append("\033[?25l"_sv);
    }

    for (auto const& command : commands) {
        di::visit(di::overload(
                      [&](MoveCursor const& move) {
                          move_cursor(buffer, m_cursor_row, m_cursor_col, move.row, move.col);
                          m_cursor_row = move.row;
                          m_cursor_col = move.col;
                      },
                      [&](SetGraphicsRendition const& set) {
                          if (m_graphics_rendition == set.graphics_rendition) {
                              return;
                          }
                          buffer.append(render_graphics_rendition(set.graphics_rendition, m_features,
                                                                  current_graphics_rendition(m_graphics_rendition)));
                          m_graphics_rendition = set.graphics_rendition;
                      },
                      [&](WriteText const& write) {
                          buffer.append(write.text);
                          if (!m_cursor_col) {
                              return;
                          }

                          // Forget the cursor column at the right edge, since terminals disagree on where the
                          // cursor is placed once the last column is written.
                          *m_cursor_col += write.width;
                          if (m_cols == 0 || *m_cursor_col >= m_cols) {
                              m_cursor_col = {};
                          }
                      },
                      [&](SetCursor const& set) {
                          if (m_cursor_style != set.style) {
                              buffer.append(*di::present("\033[{} q"_sv, i32(set.style)));
                              m_cursor_style = set.style;
                          }
                          m_cursor_hidden = set.hidden;
                      }),
                  command);
    }

    // End sequence: maybe show the cursor, and end the synchronized update.
    if (!m_cursor_hidden) {
        buffer.append("\033[?25h"_sv);
    }
    if (synchronized) {
        buffer.append("\033[?2026l"_sv);
    }
    return buffer;
}
}
