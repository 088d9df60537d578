#pragma once

#include <bankgen/config/config.hpp>
#include <bankgen/storage/file_sink.hpp>
#include <bankgen/storage/warehouse_catalog.hpp>

#include <arrow/filesystem/api.h>

#include <memory>
#include <optional>
#include <string>

namespace bankgen::storage {

/// The per-process storage session: one filesystem, the warehouse catalog on
/// top of it and a flat-file sink rooted at the same base path.
///
/// In catalog mode open() creates the configured database if needed and makes
/// it the active one.
class Session {
   public:
    /// Throws ConfigurationError when the base path cannot be resolved and
    /// Error subclasses when the database cannot be prepared.
    [[nodiscard]] static auto open(const ConfigModel& config) -> Session;

    [[nodiscard]] auto catalog() noexcept -> WarehouseCatalog& { return *catalog_; }
    [[nodiscard]] auto files() noexcept -> ArrowFileSink& { return *files_; }
    [[nodiscard]] auto target() const noexcept -> const StorageTarget& { return target_; }

    /// Read a materialized table from wherever the target keeps it.
    [[nodiscard]] auto read(const std::string& table) -> Table;

    /// Replace a materialized table, keeping how it is laid out.
    ///
    /// Catalog tables keep their stored layout and column order. Flat-file
    /// datasets use `file_layout` when given and otherwise the layout found
    /// on storage; a bucketed dataset needs `file_layout`, since part names
    /// do not record the bucket key.
    void replace(const std::string& table, const Table& rows,
                 const std::optional<Layout>& file_layout = std::nullopt);

   private:
    Session(StorageTarget target, std::shared_ptr<arrow::fs::FileSystem> fs,
            const std::string& root);

    StorageTarget target_;
    std::unique_ptr<WarehouseCatalog> catalog_;
    std::unique_ptr<ArrowFileSink> files_;
};

}  // namespace bankgen::storage
