#pragma once

#include "minipg/executor/executor_node.hpp"
#include "minipg/planner/plan.hpp"

namespace minipg::catalog {
class CatalogStore;
}

namespace minipg::executor {

// Validates the plan against the catalog and assembles
// scan -> join* -> [sort] -> filter | aggregate -> projection -> [limit].
// Throws TableNotFound, ColumnNotFound or AggregateRequiresGroupBy.
[[nodiscard]] ExecutorNodePtr build_select_pipeline(const planner::SelectPlan& plan, const catalog::CatalogStore& catalog);

}  // namespace minipg::executor
