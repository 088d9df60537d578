#include <bankgen/core/error.hpp>
#include <bankgen/schema/schema.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <type_traits>

namespace bankgen {

namespace {

const std::unordered_map<std::string_view, ColumnKind> kTypeKinds = {
    {"byte", ColumnKind::Int},        {"short", ColumnKind::Int},
    {"integer", ColumnKind::Int},     {"long", ColumnKind::Int},
    {"boolean", ColumnKind::Int},     {"float", ColumnKind::Double},
    {"double", ColumnKind::Double},   {"string", ColumnKind::String},
    {"binary", ColumnKind::String},   {"date", ColumnKind::Date},
    {"timestamp", ColumnKind::Timestamp}, {"timestamp_ntz", ColumnKind::Timestamp},
};

}  // namespace

auto to_string(ColumnKind kind) -> std::string_view {
    switch (kind) {
        case ColumnKind::Int:
            return "int64";
        case ColumnKind::Double:
            return "double";
        case ColumnKind::String:
            return "string";
        case ColumnKind::Date:
            return "date";
        case ColumnKind::Timestamp:
            return "timestamp";
    }
    return "unknown";
}

auto kind_for_type(std::string_view type) -> std::optional<ColumnKind> {
    if (type.starts_with("decimal")) {
        return ColumnKind::Double;
    }
    if (type.starts_with("varchar") || type.starts_with("char")) {
        return ColumnKind::String;
    }
    if (auto it = kTypeKinds.find(type); it != kTypeKinds.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto kind_of(const ColumnValue& column) -> ColumnKind {
    return std::visit(
        [](const auto& col) -> ColumnKind {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                return ColumnKind::Int;
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                return ColumnKind::Double;
            } else if constexpr (std::is_same_v<ColType, Column<Date>>) {
                return ColumnKind::Date;
            } else if constexpr (std::is_same_v<ColType, Column<Timestamp>>) {
                return ColumnKind::Timestamp;
            } else {
                return ColumnKind::String;
            }
        },
        column);
}

Schema::Schema(std::vector<Field> fields) : fields_(std::move(fields)) {
    index_.reserve(fields_.size());
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        index_.emplace(fields_[i].name, i);
    }
}

auto Schema::find(const std::string& name) const -> const Field* {
    if (auto it = index_.find(name); it != index_.end()) {
        return &fields_[it->second];
    }
    return nullptr;
}

auto Schema::with_field(Field field) const -> Schema {
    auto fields = fields_;
    fields.push_back(std::move(field));
    return Schema{std::move(fields)};
}

auto Schema::check(const Table& table) const -> std::expected<void, std::string> {
    if (table.columns.size() != fields_.size()) {
        return std::unexpected("expected " + std::to_string(fields_.size()) + " columns, got " +
                               std::to_string(table.columns.size()));
    }
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        const auto& entry = table.columns[i];
        if (entry.name != fields_[i].name) {
            return std::unexpected("column " + std::to_string(i) + " is '" + entry.name +
                                   "', expected '" + fields_[i].name + "'");
        }
        if (kind_of(*entry.column) != fields_[i].kind) {
            return std::unexpected("column '" + entry.name + "' has type " +
                                   std::string(column_type_name(*entry.column)) + ", expected " +
                                   std::string(to_string(fields_[i].kind)));
        }
    }
    return {};
}

auto Schema::operator==(const Schema& other) const -> bool {
    if (fields_.size() != other.fields_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name != other.fields_[i].name || fields_[i].kind != other.fields_[i].kind) {
            return false;
        }
    }
    return true;
}

auto parse_schema(std::string_view json) -> std::expected<Schema, std::string> {
    auto doc = nlohmann::json::parse(json, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return std::unexpected("invalid JSON");
    }
    if (!doc.is_object() || doc.value("type", "") != "struct" || !doc.contains("fields") ||
        !doc["fields"].is_array()) {
        return std::unexpected("expected a StructType object with a 'fields' array");
    }

    std::vector<Field> fields;
    std::unordered_map<std::string, bool> seen;
    for (const auto& item : doc["fields"]) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            return std::unexpected("field without a name");
        }
        auto name = item["name"].get<std::string>();
        if (!item.contains("type") || !item["type"].is_string()) {
            return std::unexpected("field '" + name + "' has a nested or missing type");
        }
        auto type = item["type"].get<std::string>();
        auto kind = kind_for_type(type);
        if (!kind) {
            return std::unexpected("field '" + name + "' has unsupported type '" + type + "'");
        }
        if (seen.contains(name)) {
            return std::unexpected("duplicate field '" + name + "'");
        }
        seen.emplace(name, true);
        fields.push_back(Field{.name = std::move(name),
                               .type = std::move(type),
                               .kind = *kind,
                               .nullable = item.value("nullable", true)});
    }
    if (fields.empty()) {
        return std::unexpected("schema has no fields");
    }
    return Schema{std::move(fields)};
}

SchemaRegistry::SchemaRegistry(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto SchemaRegistry::path_for(const std::string& table) const -> std::filesystem::path {
    return directory_ / (table + ".json");
}

auto SchemaRegistry::resolve(const std::string& table) -> const Schema& {
    if (auto it = cache_.find(table); it != cache_.end()) {
        return it->second;
    }

    auto path = path_for(table);
    spdlog::info("loading schema for '{}' from {}", table, path.string());
    std::ifstream input(path);
    if (!input) {
        throw SchemaError("schema file not found: " + path.string());
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});

    auto schema = parse_schema(text);
    if (!schema) {
        throw SchemaError("malformed schema " + path.string() + ": " + schema.error());
    }
    spdlog::debug("schema for '{}' has {} columns", table, schema->size());
    return cache_.emplace(table, std::move(*schema)).first->second;
}

}  // namespace bankgen
