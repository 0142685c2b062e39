#include "minipg/storage/table_store.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/storage/json_codec.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace minipg::storage {

namespace {

constexpr const char* kJsonLinesExtension = ".jsonl";

[[nodiscard]] bool is_blank(const std::string& line) noexcept
{
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

class JsonLinesScanCursor final : public TableScanCursor {
public:
    explicit JsonLinesScanCursor(std::filesystem::path path)
        : path_{std::move(path)}
        , stream_{path_}
    {
        if (!stream_.is_open()) {
            throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                    "failed to open table file '" + path_.string() + "'"};
        }
    }

    bool next(Row& out_row) override
    {
        std::string line;
        while (std::getline(stream_, line)) {
            if (is_blank(line)) {
                continue;
            }
            out_row = row_from_json_line(line);
            return true;
        }
        if (stream_.bad()) {
            throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                    "I/O error while scanning '" + path_.string() + "'"};
        }
        return false;
    }

    void reset() override
    {
        stream_.clear();
        stream_.seekg(0, std::ios::beg);
    }

private:
    std::filesystem::path path_{};
    std::ifstream stream_{};
};

class JsonLinesTableStore final : public TableStore {
public:
    explicit JsonLinesTableStore(std::filesystem::path root)
        : root_{std::move(root)}
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec) {
            throw std::system_error{ec, "failed to create table storage root '" + root_.string() + "'"};
        }
    }

    void create_table(const std::string& table) override
    {
        std::ofstream stream{table_path(table), std::ios::out | std::ios::trunc};
        if (!stream.is_open()) {
            throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                    "failed to create table file for '" + table + "'"};
        }
    }

    bool table_exists(const std::string& table) const override
    {
        std::error_code ec;
        return std::filesystem::exists(table_path(table), ec);
    }

    std::unique_ptr<TableScanCursor> create_table_scan(const std::string& table) override
    {
        return std::make_unique<JsonLinesScanCursor>(table_path(table));
    }

    void append_rows(const std::string& table, const std::vector<Row>& rows) override
    {
        std::ofstream stream{table_path(table), std::ios::out | std::ios::app};
        if (!stream.is_open()) {
            throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                    "failed to open table file for '" + table + "'"};
        }
        for (const auto& row : rows) {
            stream << row_to_json_line(row) << '\n';
        }
        stream.flush();
        if (!stream) {
            throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                    "failed to append rows to '" + table + "'"};
        }
    }

    std::filesystem::path table_path(const std::string& table) const override
    {
        return root_ / (table + kJsonLinesExtension);
    }

private:
    std::filesystem::path root_{};
};

}  // namespace

std::unique_ptr<TableStore> create_table_store(StorageFormat format, std::filesystem::path root)
{
    switch (format) {
    case StorageFormat::JsonLines:
        return create_json_lines_table_store(std::move(root));
    case StorageFormat::Csv:
        throw std::system_error{std::make_error_code(std::errc::not_supported), "CSV table storage is not implemented"};
    case StorageFormat::Columnar:
    default:
        throw std::system_error{std::make_error_code(std::errc::not_supported),
                                "columnar table storage is not implemented"};
    }
}

std::unique_ptr<TableStore> create_json_lines_table_store(std::filesystem::path root)
{
    return std::make_unique<JsonLinesTableStore>(std::move(root));
}

std::vector<Row> read_all_rows(TableStore& store, const std::string& table)
{
    std::vector<Row> rows;
    auto cursor = store.create_table_scan(table);
    Row row;
    while (cursor->next(row)) {
        rows.push_back(std::move(row));
        row = Row{};
    }
    return rows;
}

}  // namespace minipg::storage
