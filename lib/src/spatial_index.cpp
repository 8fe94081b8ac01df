#include "tcomp/spatial_index.h"

#include "di/container/algorithm/sort.h"
#include "di/vocab/tuple/prelude.h"
#include "tcomp/aabb.h"
#include "tcomp/sprite.h"

namespace tcomp {
auto SpatialIndex::build(di::Span<Sprite const> sprites, Size const& bounds) -> SpatialIndex {
    auto result = SpatialIndex {};
    auto screen = Aabb::from_size(bounds);
    for (auto [index, sprite] : di::enumerate(sprites)) {
        if (!sprite.visible || sprite.width == 0 || sprite.height == 0 || !sprite.has_complete_grid()) {
            continue;
        }
        auto clipped = sprite.bounds().intersection(screen);
        if (!clipped) {
            continue;
        }
        result.m_entries.push_back({ sprite.entity_id, *clipped, sprite.depth, u32(index) });
    }

    if (!result.m_entries.empty()) {
        result.build_node(0, u32(result.m_entries.size()));
    }
    return result;
}

auto SpatialIndex::build_node(u32 first, u32 count) -> u32 {
    auto entries = *m_entries.span().subspan(first, count);

    auto bounds = Aabb {};
    for (auto const& entry : entries) {
        bounds = bounds.merged(entry.aabb);
    }

    auto node_index = u32(m_nodes.size());
    m_nodes.push_back({ bounds, first, count, 0 });
    if (count <= max_leaf_entries) {
        return node_index;
    }

    // Median split along the longer axis. Ties are broken by snapshot order so that the tree shape is
    // deterministic.
    if (bounds.width() >= bounds.height()) {
        di::sort(entries, di::compare, [](SpatialEntry const& entry) {
            return di::Tuple { entry.aabb.center_x2(), entry.sprite_index };
        });
    } else {
        di::sort(entries, di::compare, [](SpatialEntry const& entry) {
            return di::Tuple { entry.aabb.center_y2(), entry.sprite_index };
        });
    }

    auto left_count = count / 2;
    auto left = build_node(first, left_count);
    auto right = build_node(first + left_count, count - left_count);

    // Children were appended after this node, so m_nodes may have been reallocated.
    auto& node = m_nodes[node_index];
    node.first = left;
    node.count = 0;
    node.right = right;
    return node_index;
}

void SpatialIndex::visit_node(u32 node_index, Aabb const& region,
                              di::FunctionRef<void(SpatialEntry const&)> visitor) const {
    auto const& node = m_nodes[node_index];
    if (!node.bounds.intersects(region)) {
        return;
    }
    if (!node.is_leaf()) {
        visit_node(node.first, region, visitor);
        visit_node(node.right, region, visitor);
        return;
    }
    for (auto const& entry : *m_entries.span().subspan(node.first, node.count)) {
        if (entry.aabb.intersects(region)) {
            visitor(entry);
        }
    }
}

void SpatialIndex::visit_overlapping(Aabb const& region, di::FunctionRef<void(SpatialEntry const&)> visitor) const {
    if (m_nodes.empty()) {
        return;
    }
    visit_node(0, region, visitor);
}

auto SpatialIndex::query_overlapping(Aabb const& region) const -> di::Vector<u64> {
    auto result = di::Vector<u64> {};
    visit_overlapping(region, [&](SpatialEntry const& entry) {
        result.push_back(entry.entity_id);
    });
    return result;
}

auto SpatialIndex::bounds() const -> Aabb {
    if (m_nodes.empty()) {
        return {};
    }
    return m_nodes[0].bounds;
}
}
