#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/diff.h"
#include "tcomp/frame_buffer.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
struct SerializerOptions {
    /// Clean cells between two runs on the same row which are rewritten instead of moving the cursor.
    u32 max_bridge_gap { 4 };

    /// Append the host cursor position and style after the frame contents.
    bool emit_cursor { true };
};

/// @brief Converts diff runs into an ordered list of terminal commands
///
/// The serializer tracks the cursor position and graphics rendition of the terminal across calls, so
/// that redundant cursor movement and style changes are never emitted. Whenever the real terminal state
/// becomes unknown (a forced redraw or a failed write), reset() must be called.
class CommandSerializer {
public:
    CommandSerializer() = default;
    explicit CommandSerializer(SerializerOptions const& options) : m_options(options) {}

    auto options() const -> SerializerOptions const& { return m_options; }

    /// @brief Serialize the runs computed from current
    ///
    /// @param current The frame buffer the runs point into. Used to fill small gaps between runs.
    /// @param runs Output of diff(), in row-major order
    /// @param cursor Where to leave the host cursor, if anywhere
    auto serialize(FrameBuffer const& current, di::Span<DiffRun const> runs,
                   di::Optional<RenderedCursor const&> cursor = {}) -> di::Vector<TerminalCommand>;

    /// Forget all tracked terminal state.
    void reset();

    /// Cells written by the last call to serialize(), including bridged cells. Continuations are not counted.
    auto cells_written() const -> usize { return m_cells_written; }

    auto cursor_row() const -> di::Optional<u32> { return m_cursor_row; }
    auto cursor_col() const -> di::Optional<u32> { return m_cursor_col; }
    auto graphics_rendition() const -> di::Optional<GraphicsRendition const&> {
        if (!m_graphics_rendition) {
            return {};
        }
        return *m_graphics_rendition;
    }

private:
    void move_cursor(di::Vector<TerminalCommand>& commands, u32 row, u32 col);
    auto bridge_start(FrameBuffer const& current, DiffRun const& run) const -> di::Optional<u32>;
    void write_cells(di::Vector<TerminalCommand>& commands, FrameBuffer const& current, u32 row, u32 col_start,
                     u32 col_end);

    SerializerOptions m_options;
    di::Optional<u32> m_cursor_row;
    di::Optional<u32> m_cursor_col;
    di::Optional<GraphicsRendition> m_graphics_rendition;
    di::Optional<SetCursor> m_cursor_mode;
    usize m_cells_written { 0 };
};
}
