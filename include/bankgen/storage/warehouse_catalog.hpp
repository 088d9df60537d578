#pragma once

#include <bankgen/schema/schema.hpp>
#include <bankgen/storage/sink.hpp>

#include <arrow/filesystem/api.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bankgen::storage {

/// Catalog entry of a managed table, persisted as `_table.json` in the table
/// directory.
struct TableMetadata {
    std::string database;
    std::string name;
    FileFormat format = FileFormat::Parquet;
    Layout layout;
    /// Logical columns in table order, partition columns included.
    std::vector<std::pair<std::string, ColumnKind>> columns;

    [[nodiscard]] auto to_json() const -> std::string;
    [[nodiscard]] static auto from_json(std::string_view text)
        -> std::expected<TableMetadata, std::string>;
};

/// A Hive-style warehouse on an Arrow filesystem.
///
/// Layout: `<root>/<database>.db/<table>/_table.json` plus the table's part
/// files. Metadata is cached per table after first use; refresh_metadata()
/// re-reads it so that changes made by other writers become visible.
///
/// Appends resolve columns by name: a batch with the table's column names and
/// types is accepted in any order and written in the table's order.
class WarehouseCatalog final : public CatalogSink {
   public:
    WarehouseCatalog(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root);

    void create_database(const std::string& name) override;
    void use_database(const std::string& name) override;
    [[nodiscard]] auto current_database() const -> const std::string& override {
        return database_;
    }

    [[nodiscard]] auto table_exists(const std::string& name) -> bool override;
    void refresh_metadata(const std::string& name) override;
    void write(const Table& rows, const std::string& name, WriteMode mode, FileFormat format,
               const Layout& layout) override;
    [[nodiscard]] auto read_table(const std::string& name) -> Table override;

    /// Cached metadata of `name`; throws DataError if the table does not exist.
    [[nodiscard]] auto metadata(const std::string& name) -> const TableMetadata&;
    /// Cached metadata of `name`, or nullptr if the table does not exist.
    [[nodiscard]] auto find_metadata(const std::string& name) -> const TableMetadata*;

    [[nodiscard]] auto table_path(const std::string& name) const -> std::string;

   private:
    [[nodiscard]] auto database_path(const std::string& database) const -> std::string;
    [[nodiscard]] auto load_metadata(const std::string& name) -> std::optional<TableMetadata>;
    void store_metadata(const TableMetadata& meta);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string root_;
    std::string database_ = "default";
    std::unordered_map<std::string, TableMetadata> cache_;
};

}  // namespace bankgen::storage
