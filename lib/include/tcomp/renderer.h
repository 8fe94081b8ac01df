#pragma once

#include "di/reflect/prelude.h"
#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/command_serializer.h"
#include "tcomp/compositor.h"
#include "tcomp/frame_buffer.h"
#include "tcomp/sprite.h"
#include "tcomp/terminal_command.h"
#include "tcomp/terminal_device.h"

namespace tcomp {
/// @brief Counters describing the most recent successful tick
struct RenderStats {
    usize sprites_indexed { 0 };
    usize runs { 0 };
    usize cells_written { 0 }; ///< Cells sent as text. A wide glyph counts once, bridged cells are included.
    usize commands { 0 };
    bool full_redraw { false };

    auto operator==(RenderStats const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<RenderStats>) {
        return di::make_fields<"RenderStats">(
            di::field<"sprites_indexed", &RenderStats::sprites_indexed>, di::field<"runs", &RenderStats::runs>,
            di::field<"cells_written", &RenderStats::cells_written>, di::field<"commands", &RenderStats::commands>,
            di::field<"full_redraw", &RenderStats::full_redraw>);
    }
};

/// @brief Runs the whole frame pipeline once per tick
///
/// The renderer owns the previous and current frame buffers. Each tick it composites the sprite snapshot,
/// diffs against what was last shown, and hands the resulting commands to the device in a single call.
class Renderer {
public:
    Renderer() = default;
    explicit Renderer(CompositorOptions const& compositor_options, SerializerOptions const& serializer_options = {})
        : m_compositor(compositor_options), m_serializer(serializer_options) {}

    /// @brief Render a single tick
    ///
    /// @return An error if the terminal size could not be determined, the terminal has a zero dimension
    /// (BasicError::InvalidArgument), or the device failed to apply the commands. After a device failure, the
    /// next tick redraws the whole screen.
    auto render(TerminalDevice& device, di::Span<Sprite const> sprites,
                di::Optional<RenderedCursor const&> cursor = {}) -> di::Result<>;

    /// Redraw every cell on the next tick.
    void request_full_redraw() { m_force_redraw = true; }
    auto full_redraw_pending() const -> bool { return m_force_redraw; }

    /// The frame which is currently shown on the terminal.
    auto previous() const -> FrameBuffer const& { return m_previous; }

    auto stats() const -> RenderStats const& { return m_stats; }

private:
    Compositor m_compositor;
    CommandSerializer m_serializer;
    FrameBuffer m_previous;
    FrameBuffer m_current;
    RenderStats m_stats;
    bool m_force_redraw { true };
};
}
