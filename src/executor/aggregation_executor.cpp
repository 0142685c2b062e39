#include "minipg/executor/aggregation_executor.hpp"

#include "minipg/executor/column_resolver.hpp"
#include "minipg/storage/json_codec.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace minipg::executor {

namespace {

constexpr char kKeySeparator = '\x1f';

const storage::Value& lookup(const storage::Row& row, const std::string& column)
{
    static const storage::Value null_value{};
    const auto* value = resolve_column(row, column);
    return value != nullptr ? *value : null_value;
}

// Numeric values that compare equal share a key: 1, 1.0 and true group together.
std::string group_key_text(const storage::Value& value)
{
    switch (value.kind()) {
    case storage::ValueKind::Bool:
        return value.as_bool() ? "1" : "0";
    case storage::ValueKind::Int:
        return std::to_string(value.as_int());
    case storage::ValueKind::Float: {
        const auto real = value.as_float();
        constexpr double kInt64Bound = 9223372036854775808.0;
        if (std::trunc(real) == real && real >= -kInt64Bound && real < kInt64Bound) {
            return std::to_string(static_cast<std::int64_t>(real));
        }
        return storage::value_to_json_text(value);
    }
    default:
        return storage::value_to_json_text(value);
    }
}

}  // namespace

AggregationExecutor::AggregationExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"AggregationExecutor requires a child executor"};
    }
    add_child(std::move(child));
}

void AggregationExecutor::open(ExecutorContext& context)
{
    auto* input = child(0U);
    if (input == nullptr) {
        throw std::logic_error{"AggregationExecutor missing child executor"};
    }
    groups_.clear();
    group_index_.clear();
    emission_index_ = 0U;
    built_ = false;
    input->open(context);
}

bool AggregationExecutor::next(ExecutorContext& context, storage::Row& row)
{
    if (!built_) {
        build_groups(context);
        built_ = true;
    }

    while (emission_index_ < groups_.size()) {
        const auto& group = groups_[emission_index_++];
        if (!config_.group_columns.empty() && group.rows.empty()) {
            continue;
        }
        row = project_group(group);
        return true;
    }
    return false;
}

void AggregationExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
    groups_.clear();
    group_index_.clear();
    emission_index_ = 0U;
}

void AggregationExecutor::build_groups(ExecutorContext& context)
{
    auto* input = child(0U);
    if (config_.group_columns.empty()) {
        groups_.emplace_back();
    }

    storage::Row row;
    while (input->next(context, row)) {
        std::size_t index = 0U;
        if (!config_.group_columns.empty()) {
            std::string key;
            for (const auto& column : config_.group_columns) {
                key += group_key_text(lookup(row, column));
                key.push_back(kKeySeparator);
            }
            const auto [it, inserted] = group_index_.emplace(std::move(key), groups_.size());
            if (inserted) {
                groups_.emplace_back();
            }
            index = it->second;
        }

        if (!config_.row_filter || config_.row_filter(row, context)) {
            groups_[index].rows.push_back(std::move(row));
        }
        row = storage::Row{};
    }
}

storage::Row AggregationExecutor::project_group(const GroupEntry& group) const
{
    storage::Row output;
    const storage::Row empty_row;
    const auto& first = group.rows.empty() ? empty_row : group.rows.front();

    for (const auto& column : config_.group_columns) {
        output.set(column, lookup(first, column));
    }
    for (const auto& column : config_.passthrough_columns) {
        if (!output.contains(column)) {
            output.set(column, lookup(first, column));
        }
    }
    for (const auto& aggregate : config_.aggregates) {
        output.set(aggregate.output_name, evaluate_aggregate(aggregate, group.rows));
    }
    return output;
}

}  // namespace minipg::executor
