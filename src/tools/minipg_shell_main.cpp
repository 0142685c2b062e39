#include "minipg/common/errors.hpp"
#include "minipg/engine/query_engine.hpp"
#include "minipg/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using minipg::engine::EngineState;
using minipg::engine::QueryResult;

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".mpg_history";
    return path;
}

void render_result(const QueryResult& result, bool show_timing)
{
    if (result.rows) {
        for (const auto& row : *result.rows) {
            std::cout << minipg::tools::format_row_json(row) << '\n';
        }
    }

    std::cout << result.status;
    if (show_timing) {
        std::cout << " [" << std::fixed << std::setprecision(2) << result.duration_ms << " ms]";
    }
    std::cout << '\n';

    for (const auto& diagnostic : result.diagnostics) {
        if (diagnostic.severity == minipg::Severity::Info) {
            continue;
        }
        std::cout << "  " << minipg::severity_to_string(diagnostic.severity) << ": " << diagnostic.message << '\n';
    }
}

// True once the buffer holds a statement terminated by ';' outside quotes and parentheses.
bool command_complete(std::string_view text)
{
    std::int32_t paren_depth = 0;
    bool in_quote = false;
    bool in_line_comment = false;
    bool terminated = false;

    for (std::size_t index = 0U; index < text.size(); ++index) {
        const char ch = text[index];
        const char next = (index + 1U < text.size()) ? text[index + 1U] : '\0';

        if (in_line_comment) {
            if (ch == '\n') {
                in_line_comment = false;
            }
            continue;
        }

        if (in_quote) {
            if (ch == '\'') {
                in_quote = false;
            }
            continue;
        }

        if (ch == '-' && next == '-') {
            in_line_comment = true;
            ++index;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }

        terminated = false;
        switch (ch) {
        case '\'':
            in_quote = true;
            break;
        case '(':
            ++paren_depth;
            break;
        case ')':
            if (paren_depth > 0) {
                --paren_depth;
            }
            break;
        case ';':
            terminated = paren_depth == 0;
            break;
        default:
            break;
        }
    }

    return terminated && !in_quote;
}

bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();

    std::string buffer;
    std::string line;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (buffer.empty() && trim(line).rfind("--", 0U) == 0U) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (!command_complete(buffer)) {
            continue;
        }

        auto statement = trim(buffer);
        if (!statement.empty()) {
            commands.push_back(std::move(statement));
        }
        buffer.clear();
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }

    auto trailing = trim(buffer);
    if (!trailing.empty()) {
        commands.push_back(std::move(trailing));
    }

    return true;
}

void print_help()
{
    std::cout << "Commands:\n";
    std::cout << "  SQL statements must end with ';'\n";
    std::cout << "  \\stats <table>  Show stored statistics for a table\n";
    std::cout << "  \\analyze        Recompute statistics for every table\n";
    std::cout << "  \\help           Show this message\n";
    std::cout << "  \\quit           Exit the shell\n";
}

// Returns false when the meta command asks the shell to exit.
bool run_meta_command(EngineState& state, const std::string& command)
{
    if (command == "\\q" || command == "\\quit") {
        return false;
    }

    if (command == "\\help") {
        print_help();
        return true;
    }

    if (command == "\\analyze") {
        const auto report = minipg::engine::update_all_table_stats(state);
        std::cout << minipg::tools::format_refresh_report(report) << '\n';
        return true;
    }

    if (command.rfind("\\stats", 0U) == 0U) {
        const auto table = trim(std::string_view{command}.substr(6U));
        if (table.empty()) {
            std::cerr << "error: table name is required after \\stats" << '\n';
            return true;
        }
        try {
            const auto statistics = minipg::engine::get_table_stats(state, table);
            std::cout << minipg::tools::format_statistics_json(statistics) << '\n';
        } catch (const std::system_error& error) {
            std::cerr << "Error: " << minipg::error_message(error) << '\n';
        }
        return true;
    }

    std::cerr << "error: unknown command '" << command << "' (try \\help)" << '\n';
    return true;
}

int run_repl(EngineState& state, bool quiet)
{
    replxx::Replxx repl;

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "minipg shell. Enter SQL statements terminated with ';' or type \\help.\n";
    }

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "minipg> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(line);
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            repl.history_add(trimmed);
            if (!run_meta_command(state, trimmed)) {
                break;
            }
            continue;
        }

        if (trimmed.empty() && buffer.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (!command_complete(buffer)) {
            continue;
        }

        const auto statement = trim(buffer);
        repl.history_add(statement);

        const auto result = minipg::engine::run_query(state, statement);
        render_result(result, !quiet);
        if (!history.empty()) {
            (void)repl.history_save(history.string());
        }
        buffer.clear();
    }

    std::cerr << "[debug] run_repl exiting with code=0\n";
    return 0;
}

int run_batch(EngineState& state, const std::vector<std::string>& commands, bool show_timing)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        if (command.rfind("\\", 0U) == 0U) {
            if (!run_meta_command(state, command)) {
                break;
            }
            continue;
        }
        const auto result = minipg::engine::run_query(state, command);
        render_result(result, show_timing);
        if (!result.success) {
            exit_code = 1;
        }
    }
    std::cerr << "[debug] run_batch exiting with code=" << exit_code << '\n';
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive SQL shell for the minipg storage engine."};
    app.set_config("--config", "", "Read options from a TOML or INI configuration file");

    minipg::engine::EngineConfig config;
    std::string data_directory = config.data_dir.string();
    bool quiet = false;
    bool show_timing = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::vector<std::string> positional_queries;
    std::string log_json_path;

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_flag("--timing", show_timing, "Print query duration after each status line");
    app.add_option("-c,--command", execute_commands, "Execute the provided SQL command and exit")
        ->type_name("SQL")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute SQL commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("query", positional_queries, "SQL statements to run before exiting")->type_name("SQL");
    app.add_option("--log-json", log_json_path, "Write structured query logs as JSON Lines (use '-' for stdout)")
        ->type_name("PATH");
    app.add_option("--data-dir", data_directory, "Directory holding catalog, sequences, statistics and tables")
        ->type_name("PATH")
        ->capture_default_str();
    app.add_option("--seq-cache-flush-after", config.seq_cache_flush_after, "Sequence allocations between persisted writes")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--max-stats-workers", config.max_stats_workers, "Worker threads used by a statistics refresh")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--max-bg-workers", config.max_bg_workers, "Worker threads for background sequence writes")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--bg-queue-depth", config.bg_queue_depth, "Pending background writes before submit blocks")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        std::cerr << "[debug] exiting main via CLI parse error path code=" << code << '\n';
        return code;
    }

    config.data_dir = std::filesystem::path{data_directory};

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                std::cerr << "[debug] exiting main due to log open failure code=1\n";
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }

        config.query_logger = [log_stream, &log_mutex](const QueryResult& result) {
            const auto line = minipg::tools::format_query_log_json(result);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    config.diagnostic_sink = [&log_mutex](const minipg::Diagnostic& diagnostic) {
        if (diagnostic.severity != minipg::Severity::Error) {
            return;
        }
        std::lock_guard<std::mutex> guard{log_mutex};
        std::cerr << "[" << diagnostic.component << "] " << diagnostic.message << '\n';
    };

    std::vector<std::string> commands_to_run;
    bool stdin_consumed = false;
    for (const auto& script_path : script_files) {
        std::istream* input = nullptr;
        std::ifstream script_stream;
        if (script_path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin script '-' specified more than once" << '\n';
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            script_stream.open(script_path);
            if (!script_stream.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                std::cerr << "[debug] exiting main due to script open failure code=1\n";
                return 1;
            }
            input = &script_stream;
        }

        std::string error;
        if (!load_script_commands(*input, commands_to_run, error)) {
            std::cerr << "error: " << error << " ('" << (script_path == "-" ? "<stdin>" : script_path) << "')" << '\n';
            return 1;
        }
    }

    commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());
    commands_to_run.insert(commands_to_run.end(), positional_queries.begin(), positional_queries.end());

    std::unique_ptr<EngineState> state;
    try {
        state = minipg::engine::open_engine(config);
    } catch (const std::exception& error) {
        std::cerr << "error: failed to open data directory '" << data_directory << "': " << error.what() << '\n';
        std::cerr << "[debug] exiting main due to engine open failure code=1\n";
        return 1;
    }

    int code = 0;
    if (!commands_to_run.empty()) {
        code = run_batch(*state, commands_to_run, show_timing);
    } else if (script_files.empty()) {
        code = run_repl(*state, quiet);
    }

    try {
        minipg::engine::close_engine(*state);
    } catch (const std::exception& error) {
        std::cerr << "error: failed to flush engine state: " << error.what() << '\n';
        code = 1;
    }

    std::cerr << "[debug] exiting main code=" << code << '\n';
    return code;
}
