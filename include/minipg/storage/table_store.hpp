#pragma once

#include "minipg/storage/value.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace minipg::storage {

enum class StorageFormat : std::uint8_t {
    JsonLines = 0,
    Csv,
    Columnar
};

class TableScanCursor {
public:
    virtual ~TableScanCursor() = default;

    virtual bool next(Row& out_row) = 0;
    virtual void reset() = 0;
};

// Physical row storage: one file per table under a storage root.
class TableStore {
public:
    virtual ~TableStore() = default;

    virtual void create_table(const std::string& table) = 0;
    [[nodiscard]] virtual bool table_exists(const std::string& table) const = 0;
    [[nodiscard]] virtual std::unique_ptr<TableScanCursor> create_table_scan(const std::string& table) = 0;
    virtual void append_rows(const std::string& table, const std::vector<Row>& rows) = 0;

    [[nodiscard]] virtual std::filesystem::path table_path(const std::string& table) const = 0;
};

[[nodiscard]] std::unique_ptr<TableStore> create_table_store(StorageFormat format, std::filesystem::path root);
[[nodiscard]] std::unique_ptr<TableStore> create_json_lines_table_store(std::filesystem::path root);

[[nodiscard]] std::vector<Row> read_all_rows(TableStore& store, const std::string& table);

}  // namespace minipg::storage
