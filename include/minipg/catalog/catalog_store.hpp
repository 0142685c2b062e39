#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minipg::catalog {

inline constexpr std::string_view kAppendOnlySort = "id ASC";
inline constexpr std::string_view kRowIdColumn = "id";

struct ColumnDefinition final {
    std::string name{};
    std::string declared_type{};

    friend bool operator==(const ColumnDefinition&, const ColumnDefinition&) = default;
};

struct TableSchema final {
    std::string name{};
    std::vector<ColumnDefinition> columns{};
    std::optional<std::string> sort{};

    [[nodiscard]] bool has_column(std::string_view column) const noexcept;
    [[nodiscard]] bool append_only() const noexcept;
    [[nodiscard]] std::vector<std::string> column_names() const;
};

// Durable table name -> schema mapping. Every call re-reads the catalog document;
// mutations rewrite the whole document under an in-process writer lock.
class CatalogStore final {
public:
    struct Config final {
        std::filesystem::path catalog_path{};
    };

    explicit CatalogStore(Config config);

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    [[nodiscard]] std::optional<TableSchema> get_table(const std::string& name) const;
    [[nodiscard]] bool table_exists(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> list_tables() const;

    // Throws TableAlreadyExists and leaves the stored schema untouched when the name is taken.
    void create_table(const TableSchema& schema);

    [[nodiscard]] const std::filesystem::path& catalog_path() const noexcept;

private:
    Config config_{};
    mutable std::mutex mutex_{};
};

}  // namespace minipg::catalog
