#include "tcomp/renderer.h"

#include "di/util/swap.h"
#include "tcomp/diff.h"
#include "tcomp/spatial_index.h"

namespace tcomp {
auto Renderer::render(TerminalDevice& device, di::Span<Sprite const> sprites,
                      di::Optional<RenderedCursor const&> cursor) -> di::Result<> {
    auto size = TRY(device.size());
    if (size.empty()) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    // If the size has changed, the previous frame no longer describes the screen.
    if (!m_previous.size().same_grid(size)) {
        m_force_redraw = true;
    }

    auto full_redraw = m_force_redraw;
    if (full_redraw) {
        m_serializer.reset();
    }

    auto index = SpatialIndex::build(sprites, size);
    m_compositor.compose_into(m_current, index, sprites, size);

    auto runs = diff(m_previous, m_current, full_redraw ? DiffMode::FullRedraw : DiffMode::Incremental);
    auto commands = m_serializer.serialize(m_current, runs.span(), cursor);

    auto result = device.apply(commands.span());
    if (!result) {
        // Nothing is known about what reached the terminal, so start over next tick.
        m_force_redraw = true;
        m_serializer.reset();
        return result;
    }

    m_stats = { index.size(), runs.size(), m_serializer.cells_written(), commands.size(), full_redraw };

    di::swap(m_previous, m_current);
    m_force_redraw = false;
    return {};
}
}
