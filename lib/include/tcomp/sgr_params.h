#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/util/initializer_list.h"
#include "di/vocab/optional/prelude.h"

namespace tcomp {
/// @brief Numeric parameters of a single SGR (CSI ... m) escape sequence
///
/// Parameters are grouped. Groups are separated by `;` and the values within a group by `:`. A value may be
/// omitted, which the ITU T.416 color form needs for its unused color space id (`58:2::r:g:b`).
class SgrParams {
public:
    using Value = di::Optional<u32>;

    SgrParams() = default;
    SgrParams(std::initializer_list<std::initializer_list<Value>> groups);

    auto clone() const -> SgrParams;

    auto empty() const -> bool { return m_groups.empty(); }
    auto size() const -> usize { return m_groups.size(); }

    /// The first value of a group, or fallback when the group doesn't exist or its first value is omitted.
    auto first(usize group, u32 fallback = 0) const -> u32;

    void push(u32 value);
    void push_group(std::initializer_list<Value> values);

    auto to_string() const -> di::String;
    auto to_escape() const -> di::String;

    auto operator==(SgrParams const&) const -> bool = default;

private:
    di::Vector<di::Vector<Value>> m_groups;
};
}
