#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/features.h"
#include "tcomp/graphics_rendition.h"
#include "tcomp/size.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
struct TerminalSettings {
    di::String title;                               ///< Window title set with OSC 2. Empty means leave it alone.
    Feature features { Feature::SyncronizedOutput }; ///< Features of the host terminal

    auto clone() const -> TerminalSettings { return { di::clone(title), features }; }
};

/// @brief Translates terminal commands into VT escape sequences
///
/// The encoder mirrors the state of the host terminal (cursor position, graphics rendition and cursor mode),
/// which lets it pick the shortest escape sequence for each command. If the output is lost, forget_state()
/// must be called so the next encoding makes no assumptions.
class EscapeEncoder {
public:
    EscapeEncoder() = default;
    explicit EscapeEncoder(Feature features) : m_features(features) {}

    auto features() const -> Feature { return m_features; }

    /// The terminal width is needed to know when the cursor is stuck at the right edge.
    void set_size(Size const& size) { m_cols = size.cols; }

    /// @brief Escape sequences which prepare the terminal for drawing
    ///
    /// This enters the alternate screen, disables autowrap and hides the cursor. The matching cleanup sequences
    /// are remembered, and returned in reverse order by cleanup().
    auto setup(TerminalSettings const& settings) -> di::String;
    auto cleanup() -> di::String;

    /// @brief Encode all commands of a single tick
    ///
    /// Non-empty output is wrapped in a synchronized update when the host terminal supports it, and the
    /// cursor is hidden while the screen is being drawn. An empty command list encodes to an empty string.
    auto encode(di::Span<TerminalCommand const> commands) -> di::String;

    void forget_state();

private:
    Feature m_features { Feature::None };
    di::Vector<di::String> m_cleanup;
    di::Optional<u32> m_cursor_row;
    di::Optional<u32> m_cursor_col;
    di::Optional<GraphicsRendition> m_graphics_rendition;
    di::Optional<CursorStyle> m_cursor_style;
    bool m_cursor_hidden { true };
    u32 m_cols { 0 };
};
}
