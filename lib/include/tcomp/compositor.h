#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/frame_buffer.h"
#include "tcomp/size.h"
#include "tcomp/spatial_index.h"
#include "tcomp/sprite.h"

namespace tcomp {
struct CompositorOptions {
    u32 band_height { 8 }; ///< Number of rows in each horizontal band. 0 is treated as 1.
};

/// @brief Paints sprites back to front into a frame buffer
///
/// The screen is processed in full width horizontal bands. For each band, the spatial index is queried and the
/// overlapping sprites are painted in order of (depth, entity id, snapshot index). Bands never overlap, so the
/// result is the same as a single back to front pass over the whole screen.
class Compositor {
public:
    Compositor() = default;
    explicit Compositor(CompositorOptions const& options) : m_options(options) {}

    auto options() const -> CompositorOptions const& { return m_options; }

    auto compose(SpatialIndex const& index, di::Span<Sprite const> sprites, Size const& size) -> FrameBuffer;

    /// Same as compose(), but reuses the allocation of target.
    void compose_into(FrameBuffer& target, SpatialIndex const& index, di::Span<Sprite const> sprites,
                      Size const& size);

private:
    void paint_band(FrameBuffer& target, Sprite const& sprite, Aabb const& clipped, u32 band_start, u32 band_end);

    CompositorOptions m_options;
    di::Vector<SpatialEntry> m_band_entries;
};
}
