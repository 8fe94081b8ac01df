#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/size.h"
#include "tcomp/sprite.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
struct Velocity {
    i32 dx { 0 };
    i32 dy { 0 };
};

/// @brief Demo scene of sprites bouncing around the screen
class Scene {
public:
    static auto create(usize sprite_count, Size const& size) -> Scene;

    /// Advance the simulation by one tick. Sprites bounce when half of them leaves the screen.
    void tick(Size const& size);

    auto sprites() const -> di::Span<Sprite const> { return m_sprites.span(); }
    auto velocities() const -> di::Span<Velocity const> { return m_velocities.span(); }
    auto tick_count() const -> u64 { return m_tick_count; }

    auto cursor() const -> RenderedCursor { return { .hidden = true }; }

private:
    Scene() = default;

    di::Vector<Sprite> m_sprites;
    di::Vector<Velocity> m_velocities;
    u64 m_tick_count { 0 };
};
}
