#include "minipg/engine/query_engine.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/executor/executor_context.hpp"
#include "minipg/executor/insert_executor.hpp"
#include "minipg/executor/select_pipeline.hpp"
#include "minipg/executor/values_executor.hpp"
#include "minipg/planner/plan_compiler.hpp"

#include <cctype>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace minipg::engine {

namespace {

constexpr const char* kComponent = "engine";

std::string trim_copy(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1U);
    }
    return std::string{text};
}

executor::ExecutorContext make_context(EngineState& state, DiagnosticLog& log)
{
    executor::ExecutorContextConfig config{};
    config.catalog = &state.catalog();
    config.tables = &state.tables();
    config.diagnostics = &log;
    return executor::ExecutorContext{config};
}

void execute_select(EngineState& state, const planner::SelectPlan& plan, DiagnosticLog& log, QueryResult& result)
{
    result.command_category = "SELECT";
    auto context = make_context(state, log);
    auto root = executor::build_select_pipeline(plan, state.catalog());
    auto rows = executor::drain(*root, context);

    result.rows_touched = rows.size();
    result.status = "Query OK, " + std::to_string(rows.size()) + " rows returned";
    result.rows = std::move(rows);
}

void execute_insert(EngineState& state, const planner::InsertPlan& plan, DiagnosticLog& log, QueryResult& result)
{
    result.command_category = "INSERT";
    const auto schema = state.catalog().get_table(plan.table);
    if (!schema) {
        throw_engine_error(EngineErrc::TableNotFound, "Table '" + plan.table + "' not found in catalog");
    }
    if (!schema->append_only()) {
        throw_engine_error(EngineErrc::AppendOnlyViolation,
                           "Table '" + plan.table + "' does not accept inserts: declared sort is not '"
                               + std::string{catalog::kAppendOnlySort} + "'");
    }

    auto columns = plan.columns;
    if (columns.empty()) {
        for (const auto& column : schema->columns) {
            if (column.name != catalog::kRowIdColumn) {
                columns.push_back(column.name);
            }
        }
    }
    for (const auto& column : columns) {
        if (column != catalog::kRowIdColumn && !schema->has_column(column)) {
            throw_engine_error(EngineErrc::ColumnNotFound,
                               "Column '" + column + "' not found in table '" + plan.table + "'");
        }
    }

    const auto sequence = catalog::row_id_sequence_name(plan.table);
    auto& sequences = state.sequences();

    executor::ValuesExecutor::Config values{};
    values.columns = std::move(columns);
    values.tuples = plan.values;
    values.allocate_row_id = [&sequences, sequence]() {
        return sequences.next_value(sequence);
    };

    executor::TableInsertTarget target{plan.table};
    executor::InsertExecutor insert{std::make_unique<executor::ValuesExecutor>(std::move(values)),
                                    executor::InsertExecutor::Config{&target}};
    auto context = make_context(state, log);
    (void)executor::drain(insert, context);

    result.rows_touched = insert.inserted_rows();
    result.status = "Inserted " + std::to_string(plan.values.size()) + " records into table '" + plan.table + "'";
    result.rows = std::vector<storage::Row>{};
}

void execute_create_table(EngineState& state, const planner::CreateTablePlan& plan, DiagnosticLog& log,
                          QueryResult& result)
{
    result.command_category = "CREATE TABLE";
    if (state.catalog().table_exists(plan.table)) {
        throw_engine_error(EngineErrc::TableAlreadyExists, "Table '" + plan.table + "' already exists");
    }

    catalog::TableSchema schema{};
    schema.name = plan.table;
    schema.columns = plan.columns;
    schema.sort = std::string{catalog::kAppendOnlySort};
    state.catalog().create_table(schema);
    state.tables().create_table(plan.table);
    state.sequences().register_sequence(catalog::row_id_sequence_name(plan.table));

    try {
        state.statistics().update_table_stats(plan.table);
    } catch (const std::system_error& error) {
        log.record(Severity::Warning, kComponent,
                   "initial statistics for table '" + plan.table + "' were not written: " + error_message(error));
    }

    result.status = "Table '" + plan.table + "' created successfully";
    result.rows.reset();
}

}  // namespace

EngineState::EngineState(EngineConfig config)
    : config_{std::move(config)}
    , paths_{make_engine_paths(config_.data_dir)}
{
    validate_engine_config(config_);

    storage::WorkerPoolConfig pool_config{};
    pool_config.worker_threads = config_.max_bg_workers;
    pool_config.queue_depth = config_.bg_queue_depth;
    background_ = std::make_unique<storage::WorkerPool>(pool_config);

    tables_ = storage::create_table_store(config_.storage_format, paths_.table_root);
    catalog_ = std::make_unique<catalog::CatalogStore>(catalog::CatalogStore::Config{paths_.catalog_path});

    catalog::SequenceManager::Config sequence_config{};
    sequence_config.sequences_path = paths_.sequences_path;
    sequence_config.flush_after = config_.seq_cache_flush_after;
    sequence_config.background = background_.get();
    sequence_config.diagnostics = config_.diagnostic_sink;
    sequences_ = std::make_unique<catalog::SequenceManager>(std::move(sequence_config));

    planner::StatisticsManager::Config statistics_config{};
    statistics_config.catalog = catalog_.get();
    statistics_config.tables = tables_.get();
    statistics_config.stats_root = paths_.stats_root;
    statistics_config.max_workers = config_.max_stats_workers;
    statistics_config.diagnostics = config_.diagnostic_sink;
    statistics_ = std::make_unique<planner::StatisticsManager>(std::move(statistics_config));
}

EngineState::~EngineState()
{
    try {
        close();
    } catch (const std::exception& error) {
        if (config_.diagnostic_sink) {
            Diagnostic diagnostic{};
            diagnostic.severity = Severity::Error;
            diagnostic.component = kComponent;
            diagnostic.message = std::string{"close during destruction failed: "} + error.what();
            config_.diagnostic_sink(diagnostic);
        }
    }
}

const EngineConfig& EngineState::config() const noexcept
{
    return config_;
}

const EnginePaths& EngineState::paths() const noexcept
{
    return paths_;
}

catalog::CatalogStore& EngineState::catalog() noexcept
{
    return *catalog_;
}

catalog::SequenceManager& EngineState::sequences() noexcept
{
    return *sequences_;
}

planner::StatisticsManager& EngineState::statistics() noexcept
{
    return *statistics_;
}

storage::TableStore& EngineState::tables() noexcept
{
    return *tables_;
}

void EngineState::close()
{
    std::scoped_lock lock(close_mutex_);
    if (closed_.exchange(true)) {
        return;
    }
    background_->shutdown();
    sequences_->flush_all();
}

bool EngineState::closed() const noexcept
{
    return closed_.load();
}

std::uint64_t EngineState::next_correlation_id() noexcept
{
    return correlation_counter_.fetch_add(1U, std::memory_order_relaxed);
}

std::unique_ptr<EngineState> open_engine(EngineConfig config)
{
    return std::make_unique<EngineState>(std::move(config));
}

void close_engine(EngineState& state)
{
    state.close();
}

QueryResult run_query(EngineState& state, std::string_view statement)
{
    QueryResult result{};
    result.command_text = trim_copy(statement);
    result.correlation_id = state.next_correlation_id();
    result.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    DiagnosticLog log{state.config().diagnostic_sink};
    try {
        if (state.closed()) {
            throw std::logic_error{"engine is closed"};
        }
        auto compiled = planner::compile_statement(statement);
        log.append(compiled.diagnostics);

        if (const auto* select = std::get_if<planner::SelectPlan>(&compiled.plan)) {
            execute_select(state, *select, log, result);
        } else if (const auto* insert = std::get_if<planner::InsertPlan>(&compiled.plan)) {
            execute_insert(state, *insert, log, result);
        } else if (const auto* create = std::get_if<planner::CreateTablePlan>(&compiled.plan)) {
            execute_create_table(state, *create, log, result);
        }
        result.success = true;
    } catch (const std::system_error& error) {
        result.success = false;
        result.error = error.code();
        result.status = "Error: " + error_message(error);
        result.rows.reset();
    } catch (const std::exception& error) {
        result.success = false;
        result.status = std::string{"Error: "} + error.what();
        result.rows.reset();
    }

    result.finished_at = std::chrono::system_clock::now();
    result.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    result.diagnostics = log.take();

    if (state.config().query_logger) {
        try {
            state.config().query_logger(result);
        } catch (const std::exception& error) {
            Diagnostic diagnostic{};
            diagnostic.severity = Severity::Error;
            diagnostic.component = kComponent;
            diagnostic.message = std::string{"query logger failed: "} + error.what();
            diagnostic.statement = result.command_text;
            if (state.config().diagnostic_sink) {
                state.config().diagnostic_sink(diagnostic);
            }
            result.diagnostics.push_back(std::move(diagnostic));
        }
    }
    return result;
}

planner::TableStatistics get_table_stats(EngineState& state, const std::string& table)
{
    return state.statistics().get_table_stats(table);
}

planner::StatsRefreshReport update_all_table_stats(EngineState& state)
{
    return state.statistics().update_all_table_stats();
}

}  // namespace minipg::engine
