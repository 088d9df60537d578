#include <bankgen/core/error.hpp>
#include <bankgen/storage/dataset.hpp>
#include <bankgen/storage/warehouse_catalog.hpp>

#include <arrow/io/api.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace bankgen::storage {

namespace {

constexpr std::string_view kMetadataFile = "_table.json";

auto is_identifier(std::string_view name) -> bool {
    return !name.empty() && std::ranges::all_of(name, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_';
    });
}

void check_identifier(std::string_view what, const std::string& name) {
    if (!is_identifier(name)) {
        throw ConfigurationError("invalid " + std::string(what) + " name: '" + name + "'");
    }
}

auto parse_kind(std::string_view text) -> std::optional<ColumnKind> {
    for (auto kind : {ColumnKind::Int, ColumnKind::Double, ColumnKind::String, ColumnKind::Date,
                      ColumnKind::Timestamp}) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

auto parse_layout_kind(std::string_view text) -> std::optional<LayoutKind> {
    for (auto kind : {LayoutKind::None, LayoutKind::PartitionByDate, LayoutKind::BucketByKey}) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

auto empty_column(ColumnKind kind) -> ColumnValue {
    switch (kind) {
        case ColumnKind::Int:
            return Column<std::int64_t>{};
        case ColumnKind::Double:
            return Column<double>{};
        case ColumnKind::Date:
            return Column<Date>{};
        case ColumnKind::Timestamp:
            return Column<Timestamp>{};
        case ColumnKind::String:
            break;
    }
    return Column<std::string>{};
}

auto columns_of(const Table& rows) -> std::vector<std::pair<std::string, ColumnKind>> {
    std::vector<std::pair<std::string, ColumnKind>> columns;
    columns.reserve(rows.columns.size());
    for (const auto& entry : rows.columns) {
        columns.emplace_back(entry.name, kind_of(*entry.column));
    }
    return columns;
}

auto describe_columns(const std::vector<std::pair<std::string, ColumnKind>>& columns)
    -> std::string {
    std::string out;
    for (const auto& [name, kind] : columns) {
        if (!out.empty()) {
            out.append(", ");
        }
        out.append(name).append(":").append(to_string(kind));
    }
    return out;
}

using ColumnList = std::vector<std::pair<std::string, ColumnKind>>;

auto column_names(const ColumnList& columns) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& [name, kind] : columns) {
        names.push_back(name);
    }
    return names;
}

/// Same names and kinds, in any order.
auto same_columns(const ColumnList& table, const ColumnList& batch) -> bool {
    if (table.size() != batch.size()) {
        return false;
    }
    return std::ranges::all_of(table, [&](const auto& column) {
        return std::ranges::find(batch, column) != batch.end();
    });
}

}  // namespace

auto TableMetadata::to_json() const -> std::string {
    nlohmann::json doc;
    doc["database"] = database;
    doc["name"] = name;
    doc["format"] = std::string(to_string(format));
    doc["layout"] = {{"kind", std::string(to_string(layout.kind))},
                     {"column", layout.column},
                     {"num_buckets", layout.num_buckets}};
    auto cols = nlohmann::json::array();
    for (const auto& [col_name, kind] : columns) {
        cols.push_back({{"name", col_name}, {"type", std::string(to_string(kind))}});
    }
    doc["columns"] = std::move(cols);
    return doc.dump(2);
}

auto TableMetadata::from_json(std::string_view text) -> std::expected<TableMetadata, std::string> {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected("table metadata is not a JSON object");
    }
    try {
        TableMetadata meta;
        meta.database = doc.at("database").get<std::string>();
        meta.name = doc.at("name").get<std::string>();
        auto format = parse_file_format(doc.at("format").get<std::string>());
        if (!format) {
            return std::unexpected("unknown format in table metadata");
        }
        meta.format = *format;
        const auto& layout = doc.at("layout");
        auto kind = parse_layout_kind(layout.at("kind").get<std::string>());
        if (!kind) {
            return std::unexpected("unknown layout in table metadata");
        }
        meta.layout.kind = *kind;
        meta.layout.column = layout.value("column", "");
        meta.layout.num_buckets = layout.value("num_buckets", std::size_t{0});
        for (const auto& col : doc.at("columns")) {
            auto col_kind = parse_kind(col.at("type").get<std::string>());
            if (!col_kind) {
                return std::unexpected("unknown column type in table metadata");
            }
            meta.columns.emplace_back(col.at("name").get<std::string>(), *col_kind);
        }
        return meta;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("malformed table metadata: ") + e.what());
    }
}

WarehouseCatalog::WarehouseCatalog(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root)
    : fs_(std::move(fs)), root_(std::move(root)) {}

auto WarehouseCatalog::database_path(const std::string& database) const -> std::string {
    return join_path(root_, database + ".db");
}

auto WarehouseCatalog::table_path(const std::string& name) const -> std::string {
    return join_path(database_path(database_), name);
}

void WarehouseCatalog::create_database(const std::string& name) {
    check_identifier("database", name);
    auto st = fs_->CreateDir(database_path(name), /*recursive=*/true);
    if (!st.ok()) {
        throw WriteError("cannot create database " + name + ": " + st.ToString());
    }
}

void WarehouseCatalog::use_database(const std::string& name) {
    check_identifier("database", name);
    auto info = fs_->GetFileInfo(database_path(name));
    if (!info.ok() || !info->IsDirectory()) {
        throw DataError("database not found: " + name);
    }
    database_ = name;
    spdlog::info("using database: {}", name);
}

auto WarehouseCatalog::table_exists(const std::string& name) -> bool {
    check_identifier("table", name);
    auto info = fs_->GetFileInfo(join_path(table_path(name), kMetadataFile));
    if (!info.ok()) {
        throw DataError("cannot check table " + name + ": " + info.status().ToString());
    }
    bool exists = info->IsFile();
    spdlog::info("table '{}' {}", name, exists ? "exists" : "does not exist");
    return exists;
}

auto WarehouseCatalog::load_metadata(const std::string& name) -> std::optional<TableMetadata> {
    auto path = join_path(table_path(name), kMetadataFile);
    auto input = fs_->OpenInputFile(path);
    if (!input.ok()) {
        return std::nullopt;
    }
    auto size = (*input)->GetSize();
    if (!size.ok()) {
        throw DataError("cannot stat " + path + ": " + size.status().ToString());
    }
    auto buffer = (*input)->Read(*size);
    if (!buffer.ok()) {
        throw DataError("cannot read " + path + ": " + buffer.status().ToString());
    }
    auto meta = TableMetadata::from_json((*buffer)->ToString());
    if (!meta) {
        throw DataError(path + ": " + meta.error());
    }
    return std::move(*meta);
}

void WarehouseCatalog::store_metadata(const TableMetadata& meta) {
    auto path = join_path(table_path(meta.name), kMetadataFile);
    auto sink = fs_->OpenOutputStream(path);
    if (!sink.ok()) {
        throw WriteError("cannot open " + path + ": " + sink.status().ToString());
    }
    auto text = meta.to_json();
    auto st = (*sink)->Write(text.data(), static_cast<std::int64_t>(text.size()));
    if (st.ok()) {
        st = (*sink)->Close();
    }
    if (!st.ok()) {
        throw WriteError("cannot write " + path + ": " + st.ToString());
    }
    cache_.insert_or_assign(meta.database + "." + meta.name, meta);
}

auto WarehouseCatalog::metadata(const std::string& name) -> const TableMetadata& {
    const auto* meta = find_metadata(name);
    if (meta == nullptr) {
        throw DataError("table not found: " + database_ + "." + name);
    }
    return *meta;
}

auto WarehouseCatalog::find_metadata(const std::string& name) -> const TableMetadata* {
    check_identifier("table", name);
    auto key = database_ + "." + name;
    if (auto it = cache_.find(key); it != cache_.end()) {
        return &it->second;
    }
    auto meta = load_metadata(name);
    if (!meta) {
        return nullptr;
    }
    return &cache_.emplace(key, std::move(*meta)).first->second;
}

void WarehouseCatalog::refresh_metadata(const std::string& name) {
    check_identifier("table", name);
    cache_.erase(database_ + "." + name);
    (void)metadata(name);
    spdlog::info("refreshed metadata of table '{}'", name);
}

void WarehouseCatalog::write(const Table& rows, const std::string& name, WriteMode mode,
                             FileFormat format, const Layout& layout) {
    check_identifier("table", name);
    auto columns = columns_of(rows);

    const TableMetadata* existing = mode == WriteMode::Append ? find_metadata(name) : nullptr;
    Table ordered;
    if (existing != nullptr) {
        if (!same_columns(existing->columns, columns)) {
            throw WriteError("cannot append to '" + name + "': columns [" +
                             describe_columns(columns) + "] do not match table columns [" +
                             describe_columns(existing->columns) + "]");
        }
        if (existing->layout != layout) {
            throw WriteError("cannot append to '" + name + "': layout '" + layout.describe() +
                             "' differs from table layout '" + existing->layout.describe() +
                             "'");
        }
        if (existing->format != format) {
            throw WriteError("cannot append to '" + name + "': format differs from table format " +
                             std::string(to_string(existing->format)));
        }
        ordered = select_columns(rows, column_names(existing->columns));
    }

    auto dir = table_path(name);
    auto result =
        write_dataset(*fs_, dir, existing != nullptr ? ordered : rows, mode, format, layout);
    if (!result) {
        throw WriteError("failed to write table '" + name + "': " + result.error());
    }
    if (existing == nullptr) {
        store_metadata(TableMetadata{.database = database_,
                                     .name = name,
                                     .format = format,
                                     .layout = layout,
                                     .columns = std::move(columns)});
    }
    spdlog::debug("table '{}': {} {} rows in {} file(s)", name, to_string(mode), result->rows,
                  result->files);
}

auto WarehouseCatalog::read_table(const std::string& name) -> Table {
    const auto& meta = metadata(name);
    auto data = read_dataset(*fs_, table_path(name), meta.format);
    if (!data) {
        throw DataError("failed to read table '" + name + "': " + data.error());
    }

    Table out;
    for (const auto& [col_name, kind] : meta.columns) {
        const auto* entry = data->find_entry(col_name);
        if (entry == nullptr) {
            if (data->rows() != 0 || !data->columns.empty()) {
                throw DataError("table '" + name + "' is missing column '" + col_name + "'");
            }
            out.add_column(col_name, empty_column(kind));
            continue;
        }
        out.columns.push_back(*entry);
        out.index[col_name] = out.columns.size() - 1;
    }
    return out;
}

}  // namespace bankgen::storage
