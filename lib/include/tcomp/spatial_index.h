#pragma once

#include "di/container/vector/vector.h"
#include "di/function/container/function_ref.h"
#include "di/reflect/prelude.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/aabb.h"
#include "tcomp/size.h"
#include "tcomp/sprite.h"

namespace tcomp {
struct SpatialEntry {
    u64 entity_id { 0 };
    Aabb aabb;          ///< Sprite bounds, clipped to the screen
    i64 depth { 0 };
    u32 sprite_index { 0 }; ///< Position of the sprite in the snapshot

    auto operator==(SpatialEntry const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<SpatialEntry>) {
        return di::make_fields<"SpatialEntry">(
            di::field<"entity_id", &SpatialEntry::entity_id>, di::field<"aabb", &SpatialEntry::aabb>,
            di::field<"depth", &SpatialEntry::depth>, di::field<"sprite_index", &SpatialEntry::sprite_index>);
    }
};

/// @brief Bulk loaded bounding volume tree over the on-screen rectangles of sprites
///
/// The index is rebuilt from scratch every tick. Entries are split recursively at the centroid median
/// of the longer axis, until each leaf holds at most max_leaf_entries entries.
class SpatialIndex {
public:
    constexpr static auto max_leaf_entries = 4zu;

    /// @brief Build an index over the visible sprites which intersect the screen
    ///
    /// Invisible sprites and sprites which lie entirely outside of bounds are excluded.
    static auto build(di::Span<Sprite const> sprites, Size const& bounds) -> SpatialIndex;

    SpatialIndex() = default;

    /// @brief List the entity ids of all entries whose rectangle overlaps region
    ///
    /// The result is ordered by tree traversal, not by depth.
    auto query_overlapping(Aabb const& region) const -> di::Vector<u64>;

    /// Like query_overlapping(), but without allocating.
    void visit_overlapping(Aabb const& region, di::FunctionRef<void(SpatialEntry const&)> visitor) const;

    auto entries() const -> di::Span<SpatialEntry const> { return m_entries.span(); }
    auto size() const -> usize { return m_entries.size(); }
    auto empty() const -> bool { return m_entries.empty(); }

    /// Bounds of the root node, which is empty when the index is empty.
    auto bounds() const -> Aabb;

private:
    struct Node {
        Aabb bounds;
        u32 first { 0 }; ///< Leaf: offset into m_entries. Interior: left child.
        u32 count { 0 }; ///< Leaf: entry count. Interior: 0.
        u32 right { 0 }; ///< Interior: right child.

        auto is_leaf() const -> bool { return count > 0; }
    };

    auto build_node(u32 first, u32 count) -> u32;
    void visit_node(u32 node_index, Aabb const& region, di::FunctionRef<void(SpatialEntry const&)> visitor) const;

    di::Vector<SpatialEntry> m_entries;
    di::Vector<Node> m_nodes;
};
}
