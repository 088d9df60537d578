#include <bankgen/core/error.hpp>
#include <bankgen/storage/dataset.hpp>
#include <bankgen/storage/filesystem.hpp>
#include <bankgen/storage/session.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace bankgen::storage {

Session::Session(StorageTarget target, std::shared_ptr<arrow::fs::FileSystem> fs,
                 const std::string& root)
    : target_(std::move(target)),
      catalog_(std::make_unique<WarehouseCatalog>(fs, root)),
      files_(std::make_unique<ArrowFileSink>(std::move(fs), root)) {}

auto Session::open(const ConfigModel& config) -> Session {
    auto resolved = resolve_base_path(config.storage);
    if (!resolved) {
        throw ConfigurationError(resolved.error());
    }
    Session session(config.storage, resolved->fs, resolved->root);
    spdlog::info("storage session ready ({}: {})", to_string(config.storage.storage),
                 config.storage.base_path);

    if (config.storage.kind == TargetKind::Catalog) {
        session.catalog().create_database(config.storage.database_name);
        session.catalog().use_database(config.storage.database_name);
    }
    return session;
}

auto Session::read(const std::string& table) -> Table {
    if (target_.kind == TargetKind::Catalog) {
        return catalog_->read_table(table);
    }
    return files_->read(table, target_.file_format);
}

void Session::replace(const std::string& table, const Table& rows,
                      const std::optional<Layout>& file_layout) {
    if (target_.kind == TargetKind::Catalog) {
        const auto& meta = catalog_->metadata(table);
        auto layout = meta.layout;
        std::vector<std::string> names;
        for (const auto& [name, kind] : meta.columns) {
            names.push_back(name);
        }
        // Keep the stored column order so later appends line up.
        const bool same_names =
            names.size() == rows.columns.size() &&
            std::ranges::all_of(names, [&](const auto& name) { return rows.index.contains(name); });
        catalog_->write(same_names ? select_columns(rows, names) : rows, table,
                        WriteMode::Overwrite, FileFormat::Parquet, layout);
        return;
    }

    auto layout = file_layout;
    if (!layout) {
        auto detected = detect_layout(files_->file_system(), join_path(files_->root(), table));
        if (!detected) {
            throw DataError("cannot inspect '" + table + "': " + detected.error());
        }
        if (detected->kind == LayoutKind::BucketByKey && detected->column.empty()) {
            throw WriteError("'" + table +
                             "' is bucketed; its bucket key must be given to rewrite it");
        }
        layout = std::move(*detected);
    }
    spdlog::debug("rewriting '{}' ({})", table, layout->describe());
    files_->write(rows, table, WriteMode::Overwrite, target_.file_format, *layout);
}

}  // namespace bankgen::storage
