#include "minipg/planner/plan.hpp"

namespace minipg::planner {

const JoinSpec* SelectPlan::find_join(std::string_view table) const noexcept
{
    for (const auto& [name, join] : joins) {
        if (name == table) {
            return &join;
        }
    }
    return nullptr;
}

std::string_view join_kind_to_string(JoinKind kind) noexcept
{
    switch (kind) {
    case JoinKind::Join:
        return "JOIN";
    case JoinKind::Inner:
        return "INNER JOIN";
    case JoinKind::Left:
        return "LEFT JOIN";
    case JoinKind::Right:
        return "RIGHT JOIN";
    case JoinKind::Full:
        return "FULL JOIN";
    }
    return "JOIN";
}

}  // namespace minipg::planner
