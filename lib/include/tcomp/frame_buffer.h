#pragma once

#include "di/assert/prelude.h"
#include "di/container/vector/vector.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/cell.h"
#include "tcomp/size.h"

namespace tcomp {
/// @brief Fixed size, row-major grid of cells
class FrameBuffer {
public:
    FrameBuffer() = default;
    explicit FrameBuffer(Size const& size) { reset(size); }

    FrameBuffer(FrameBuffer&&) = default;
    auto operator=(FrameBuffer&&) -> FrameBuffer& = default;

    auto size() const -> Size const& { return m_size; }

    /// @brief Resize the buffer and fill it with default cells
    ///
    /// The existing allocation is reused when possible.
    void reset(Size const& size);

    auto at(u32 row, u32 col) -> Cell& {
        ASSERT_LT(row, m_size.rows);
        ASSERT_LT(col, m_size.cols);
        return m_cells[usize(row) * m_size.cols + col];
    }
    auto at(u32 row, u32 col) const -> Cell const& {
        ASSERT_LT(row, m_size.rows);
        ASSERT_LT(col, m_size.cols);
        return m_cells[usize(row) * m_size.cols + col];
    }

    auto row(u32 row) -> di::Span<Cell>;
    auto row(u32 row) const -> di::Span<Cell const>;

    auto cells() const -> di::Span<Cell const> { return m_cells.span(); }

    auto clone() const -> FrameBuffer;

    auto operator==(FrameBuffer const& other) const -> bool {
        return m_size == other.m_size && m_cells == other.m_cells;
    }

private:
    Size m_size;
    di::Vector<Cell> m_cells;
};
}
