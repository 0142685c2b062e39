#include "minipg/executor/select_pipeline.hpp"

#include "minipg/catalog/catalog_store.hpp"
#include "minipg/common/errors.hpp"
#include "minipg/executor/aggregate_functions.hpp"
#include "minipg/executor/aggregation_executor.hpp"
#include "minipg/executor/filter_executor.hpp"
#include "minipg/executor/limit_executor.hpp"
#include "minipg/executor/nested_loop_join_executor.hpp"
#include "minipg/executor/predicate.hpp"
#include "minipg/executor/projection_executor.hpp"
#include "minipg/executor/seq_scan_executor.hpp"
#include "minipg/executor/sort_executor.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace minipg::executor {

namespace {

struct ReferencedTable final {
    std::string name{};
    catalog::TableSchema schema{};
};

catalog::TableSchema require_table(const catalog::CatalogStore& catalog, const std::string& name, bool joined)
{
    auto schema = catalog.get_table(name);
    if (!schema) {
        throw_engine_error(EngineErrc::TableNotFound,
                           std::string{joined ? "Join table '" : "Table '"} + name + "' not found in catalog");
    }
    return std::move(*schema);
}

bool table_has_column(const catalog::TableSchema& schema, const std::string& column)
{
    if (schema.has_column(column)) {
        return true;
    }
    return column == catalog::kRowIdColumn && schema.append_only();
}

const ReferencedTable* find_table(const std::vector<ReferencedTable>& tables, std::string_view name)
{
    const auto it = std::find_if(tables.begin(), tables.end(), [name](const ReferencedTable& table) {
        return table.name == name;
    });
    return it == tables.end() ? nullptr : &*it;
}

void validate_select_column(const std::string& column, const std::vector<ReferencedTable>& tables)
{
    if (column == "*" || parse_aggregate_call(column)) {
        return;
    }

    const auto& base = tables.front();
    const auto dot = column.find('.');
    if (dot != std::string::npos) {
        const auto table_name = column.substr(0U, dot);
        const auto column_name = column.substr(dot + 1U);
        const auto* table = find_table(tables, table_name);
        if (table == nullptr) {
            throw_engine_error(EngineErrc::ColumnNotFound,
                               "Column '" + column + "' not found: table '" + table_name + "' is not referenced");
        }
        if (column_name == "*" || table_has_column(table->schema, column_name)) {
            return;
        }
        throw_engine_error(EngineErrc::ColumnNotFound,
                           "Column '" + column_name + "' not found in table '" + table->name + "'");
    }

    const auto found = std::count_if(tables.begin(), tables.end(), [&column](const ReferencedTable& table) {
        return table_has_column(table.schema, column);
    });
    if (found == 0) {
        throw_engine_error(EngineErrc::ColumnNotFound, "Column '" + column + "' not found in table '" + base.name + "'");
    }
    if (found > 1) {
        throw_engine_error(EngineErrc::ColumnNotFound,
                           "Column '" + column + "' is ambiguous: qualify it with a table name");
    }
}

// Strips a qualifier naming the base table; empty when the key belongs to a joined table.
std::optional<SortKey> base_sort_key(const SortKey& key, const ReferencedTable& base)
{
    const auto dot = key.column.find('.');
    if (dot == std::string::npos) {
        if (!table_has_column(base.schema, key.column)) {
            return std::nullopt;
        }
        return key;
    }
    if (key.column.substr(0U, dot) != base.name) {
        return std::nullopt;
    }
    SortKey stripped = key;
    stripped.column = key.column.substr(dot + 1U);
    return stripped;
}

}  // namespace

ExecutorNodePtr build_select_pipeline(const planner::SelectPlan& plan, const catalog::CatalogStore& catalog)
{
    std::vector<ReferencedTable> tables;
    tables.push_back(ReferencedTable{plan.from, require_table(catalog, plan.from, false)});
    for (const auto& [table, join] : plan.joins) {
        (void)join;
        tables.push_back(ReferencedTable{table, require_table(catalog, table, true)});
    }

    std::vector<AggregateCall> aggregates;
    std::vector<std::string> plain_columns;
    for (const auto& column : plan.select) {
        validate_select_column(column, tables);
        if (auto call = parse_aggregate_call(column)) {
            aggregates.push_back(std::move(*call));
        } else if (column != "*") {
            plain_columns.push_back(column);
        }
    }
    if (!aggregates.empty() && !plan.group_by && plan.select.size() > 1U) {
        throw_engine_error(EngineErrc::AggregateRequiresGroupBy,
                           "Aggregate functions require GROUP BY when more than one column is selected");
    }

    const bool joined = !plan.joins.empty();

    std::vector<SortKey> scan_keys;
    std::vector<SortKey> post_join_keys;
    if (plan.order_by && !plan.order_by->empty()) {
        std::vector<SortKey> keys;
        bool all_base = true;
        for (const auto& text : *plan.order_by) {
            keys.push_back(parse_sort_key(text));
            if (!base_sort_key(keys.back(), tables.front())) {
                all_base = false;
            }
        }
        if (all_base) {
            for (const auto& key : keys) {
                scan_keys.push_back(*base_sort_key(key, tables.front()));
            }
            const auto& declared = tables.front().schema.sort;
            if (scan_keys.size() == 1U && declared && sort_key_to_string(scan_keys.front()) == *declared) {
                scan_keys.clear();
            }
        } else {
            post_join_keys = std::move(keys);
        }
    }

    SequentialScanExecutor::Config scan_config{};
    scan_config.table = plan.from;
    if (joined) {
        scan_config.column_prefix = plan.from;
    }
    scan_config.sort_keys = std::move(scan_keys);
    ExecutorNodePtr root = std::make_unique<SequentialScanExecutor>(std::move(scan_config));

    for (const auto& [table, join] : plan.joins) {
        SequentialScanExecutor::Config inner_config{};
        inner_config.table = table;
        inner_config.column_prefix = table;

        NestedLoopJoinExecutor::Config join_config{};
        join_config.outer_key = join.left_table + "." + join.left_column;
        join_config.inner_key = join.right_table + "." + join.right_column;
        root = std::make_unique<NestedLoopJoinExecutor>(std::move(root),
                                                        std::make_unique<SequentialScanExecutor>(std::move(inner_config)),
                                                        std::move(join_config));
    }

    if (!post_join_keys.empty()) {
        root = std::make_unique<SortExecutor>(std::move(root), SortExecutor::Config{std::move(post_join_keys)});
    }

    std::optional<std::string> where = plan.where;
    if (where && where->empty()) {
        where.reset();
    }
    auto where_predicate = [where](const storage::Row& row, ExecutorContext&) {
        return evaluate_where(row, *where);
    };

    if (plan.group_by) {
        AggregationExecutor::Config aggregation{};
        aggregation.group_columns = *plan.group_by;
        aggregation.passthrough_columns = plain_columns;
        aggregation.aggregates = aggregates;
        if (where) {
            aggregation.row_filter = where_predicate;
        }
        root = std::make_unique<AggregationExecutor>(std::move(root), std::move(aggregation));
    } else {
        if (where) {
            root = std::make_unique<FilterExecutor>(std::move(root), FilterExecutor::Config{where_predicate});
        }
        if (!aggregates.empty()) {
            AggregationExecutor::Config aggregation{};
            aggregation.aggregates = aggregates;
            root = std::make_unique<AggregationExecutor>(std::move(root), std::move(aggregation));
        }
    }

    root = std::make_unique<ProjectionExecutor>(std::move(root), ProjectionExecutor::Config{plan.select});

    if (plan.limit) {
        root = std::make_unique<LimitExecutor>(std::move(root), LimitExecutor::Config{std::max<std::int64_t>(0, *plan.limit)});
    }
    return root;
}

}  // namespace minipg::executor
