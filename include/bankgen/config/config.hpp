#pragma once

#include <bankgen/storage/format.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bankgen {

/// Per-table generation and layout settings.
struct TableSpec {
    std::string name;
    std::size_t num_records = 0;
    bool partitioned = false;
    bool bucketed = false;
    std::size_t num_buckets = 0;  // > 0 whenever bucketed
};

/// Where materialized tables go: managed catalog tables or bare files.
enum class TargetKind : std::uint8_t {
    Catalog,
    FlatFile,
};

/// Object-store flavour of `base_path`.
enum class StorageKind : std::uint8_t {
    S3,
    ADLS,
    Local,
};

[[nodiscard]] auto parse_storage_kind(std::string_view name) -> std::optional<StorageKind>;
[[nodiscard]] auto to_string(StorageKind kind) -> std::string_view;
[[nodiscard]] auto to_string(TargetKind kind) -> std::string_view;

struct StorageTarget {
    TargetKind kind = TargetKind::Catalog;
    StorageKind storage = StorageKind::S3;
    std::string base_path;
    storage::FileFormat file_format = storage::FileFormat::Parquet;
    std::string database_name = "bancodemo";
};

/// Typed, immutable view over the INI configuration.
///
/// Built once at startup by load_config()/parse_config(), which validate every
/// key eagerly and throw ConfigurationError on the first problem.
struct ConfigModel {
    StorageTarget storage;
    /// Table names in the order given by `tabelas`.
    std::vector<std::string> tables;
    /// Specs for listed tables that have a section of their own.
    std::unordered_map<std::string, TableSpec> specs;

    /// nullptr when the table is listed but has no section.
    [[nodiscard]] auto find_spec(const std::string& table) const -> const TableSpec*;
};

[[nodiscard]] auto parse_config(std::istream& input) -> ConfigModel;

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> ConfigModel;

}  // namespace bankgen
