#include "minipg/catalog/catalog_store.hpp"

#include "minipg/common/errors.hpp"
#include "minipg/storage/json_codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace minipg::catalog {

namespace {

using storage::Json;

constexpr const char* kColumnsKey = "columns";
constexpr const char* kSortKey = "sort";

[[nodiscard]] TableSchema decode_schema(const std::string& name, const Json& entry)
{
    TableSchema schema{};
    schema.name = name;
    if (!entry.is_object()) {
        throw std::system_error{make_error_code(EngineErrc::StorageFailure),
                                "catalog entry for '" + name + "' is not an object"};
    }
    if (const auto columns = entry.find(kColumnsKey); columns != entry.end() && columns->is_object()) {
        for (const auto& [column, type] : columns->items()) {
            schema.columns.push_back(ColumnDefinition{column, type.is_string() ? type.get<std::string>() : type.dump()});
        }
    }
    if (const auto sort = entry.find(kSortKey); sort != entry.end() && sort->is_string()) {
        schema.sort = sort->get<std::string>();
    }
    return schema;
}

[[nodiscard]] Json encode_schema(const TableSchema& schema)
{
    auto columns = Json::object();
    for (const auto& column : schema.columns) {
        columns[column.name] = column.declared_type;
    }
    auto entry = Json::object();
    entry[kColumnsKey] = std::move(columns);
    entry[kSortKey] = schema.sort ? Json(*schema.sort) : Json(nullptr);
    return entry;
}

}  // namespace

bool TableSchema::has_column(std::string_view column) const noexcept
{
    return std::any_of(columns.begin(), columns.end(), [column](const ColumnDefinition& definition) {
        return definition.name == column;
    });
}

bool TableSchema::append_only() const noexcept
{
    return sort.has_value() && *sort == kAppendOnlySort;
}

std::vector<std::string> TableSchema::column_names() const
{
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

CatalogStore::CatalogStore(Config config)
    : config_{std::move(config)}
{
    if (config_.catalog_path.empty()) {
        throw std::invalid_argument{"CatalogStore requires a catalog path"};
    }
    std::error_code ec;
    if (!std::filesystem::exists(config_.catalog_path, ec)) {
        std::filesystem::create_directories(config_.catalog_path.parent_path(), ec);
        storage::write_json_document(config_.catalog_path, Json::object());
    }
}

std::optional<TableSchema> CatalogStore::get_table(const std::string& name) const
{
    std::scoped_lock lock(mutex_);
    const auto document = storage::read_json_document(config_.catalog_path);
    const auto it = document.find(name);
    if (it == document.end()) {
        return std::nullopt;
    }
    return decode_schema(name, *it);
}

bool CatalogStore::table_exists(const std::string& name) const
{
    std::scoped_lock lock(mutex_);
    const auto document = storage::read_json_document(config_.catalog_path);
    return document.contains(name);
}

std::vector<std::string> CatalogStore::list_tables() const
{
    std::scoped_lock lock(mutex_);
    const auto document = storage::read_json_document(config_.catalog_path);
    std::vector<std::string> names;
    names.reserve(document.size());
    for (const auto& [name, _] : document.items()) {
        names.push_back(name);
    }
    return names;
}

void CatalogStore::create_table(const TableSchema& schema)
{
    std::scoped_lock lock(mutex_);
    auto document = storage::read_json_document(config_.catalog_path);
    if (document.contains(schema.name)) {
        throw std::system_error{make_error_code(EngineErrc::TableAlreadyExists),
                                "Table '" + schema.name + "' already exists"};
    }
    document[schema.name] = encode_schema(schema);
    storage::write_json_document(config_.catalog_path, document);
}

const std::filesystem::path& CatalogStore::catalog_path() const noexcept
{
    return config_.catalog_path;
}

}  // namespace minipg::catalog
