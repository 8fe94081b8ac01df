#include "tcomp/frame_buffer.h"

#include "di/util/clone.h"

namespace tcomp {
void FrameBuffer::reset(Size const& size) {
    m_size = size;
    m_cells.clear();
    m_cells.resize(size.cell_count());
}

auto FrameBuffer::row(u32 row) -> di::Span<Cell> {
    ASSERT_LT(row, m_size.rows);
    return *m_cells.span().subspan(usize(row) * m_size.cols, m_size.cols);
}

auto FrameBuffer::row(u32 row) const -> di::Span<Cell const> {
    ASSERT_LT(row, m_size.rows);
    return *m_cells.span().subspan(usize(row) * m_size.cols, m_size.cols);
}

auto FrameBuffer::clone() const -> FrameBuffer {
    auto result = FrameBuffer {};
    result.m_size = m_size;
    result.m_cells = di::clone(m_cells);
    return result;
}
}
