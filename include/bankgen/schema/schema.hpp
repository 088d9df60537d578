#pragma once

#include <bankgen/table/table.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bankgen {

/// Physical column kind a semantic type is stored as.
enum class ColumnKind : std::uint8_t {
    Int,
    Double,
    String,
    Date,
    Timestamp,
};

[[nodiscard]] auto to_string(ColumnKind kind) -> std::string_view;

/// Map a Spark SQL primitive type name ("integer", "decimal(10,2)", ...) to
/// its physical kind. Returns nullopt for unsupported types.
[[nodiscard]] auto kind_for_type(std::string_view type) -> std::optional<ColumnKind>;

/// The kind of an existing column.
[[nodiscard]] auto kind_of(const ColumnValue& column) -> ColumnKind;

struct Field {
    std::string name;
    std::string type;  // semantic (Spark SQL) type name
    ColumnKind kind = ColumnKind::String;
    bool nullable = true;
};

/// Ordered, immutable column schema of a table.
class Schema {
   public:
    Schema() = default;
    explicit Schema(std::vector<Field> fields);

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto find(const std::string& name) const -> const Field*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.contains(name);
    }

    /// A copy of this schema with `field` appended.
    [[nodiscard]] auto with_field(Field field) const -> Schema;

    /// Check that `table` has exactly these columns, in order, with matching kinds.
    [[nodiscard]] auto check(const Table& table) const -> std::expected<void, std::string>;

    auto operator==(const Schema& other) const -> bool;

   private:
    std::vector<Field> fields_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// Parse a Spark StructType JSON document.
[[nodiscard]] auto parse_schema(std::string_view json) -> std::expected<Schema, std::string>;

/// Resolves table names to schemas stored as `<dir>/<table>.json`.
///
/// Schemas are loaded lazily and cached for the lifetime of the registry.
class SchemaRegistry {
   public:
    explicit SchemaRegistry(std::filesystem::path directory);

    /// Throws SchemaError when the file is missing or malformed.
    [[nodiscard]] auto resolve(const std::string& table) -> const Schema&;

    [[nodiscard]] auto path_for(const std::string& table) const -> std::filesystem::path;

   private:
    std::filesystem::path directory_;
    std::unordered_map<std::string, Schema> cache_;
};

}  // namespace bankgen
