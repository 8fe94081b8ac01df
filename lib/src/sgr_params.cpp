#include "tcomp/sgr_params.h"

#include "di/container/view/transform.h"
#include "di/format/prelude.h"

namespace tcomp {
SgrParams::SgrParams(std::initializer_list<std::initializer_list<Value>> groups) {
    for (auto const& values : groups) {
        push_group(values);
    }
}

auto SgrParams::clone() const -> SgrParams {
    auto result = SgrParams {};
    result.m_groups = m_groups.clone();
    return result;
}

auto SgrParams::first(usize group, u32 fallback) const -> u32 {
    if (group >= m_groups.size() || m_groups[group].empty()) {
        return fallback;
    }
    return m_groups[group][0].value_or(fallback);
}

void SgrParams::push(u32 value) {
    auto group = di::Vector<Value> {};
    group.push_back(value);
    m_groups.push_back(di::move(group));
}

void SgrParams::push_group(std::initializer_list<Value> values) {
    auto group = di::Vector<Value> {};
    for (auto const& value : values) {
        group.push_back(value);
    }
    m_groups.push_back(di::move(group));
}

auto SgrParams::to_string() const -> di::String {
    auto group_to_string = [](di::Vector<Value> const& group) -> di::String {
        return group | di::transform([](Value const& value) -> di::String {
                   if (!value) {
                       return {};
                   }
                   return di::to_string(*value);
               }) |
               di::join_with(U':') | di::to<di::String>();
    };
    return m_groups | di::transform(group_to_string) | di::join_with(U';') | di::to<di::String>();
}

auto SgrParams::to_escape() const -> di::String {
    return *di::present("\033[{}m"_sv, to_string());
}
}
