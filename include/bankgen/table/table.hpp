#pragma once

#include <bankgen/core/column.hpp>
#include <bankgen/core/time.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace bankgen {

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                 Column<Categorical>, Column<Date>, Column<Timestamp>>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// An in-memory, column-oriented batch of rows.
///
/// Columns are shared on copy; add_column() reseats rather than mutates, so
/// a copied Table can be extended without touching the original.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
};

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// Short type name of a column ("int64", "double", "string", "date", "timestamp").
/// Categorical columns report "string".
[[nodiscard]] auto column_type_name(const ColumnValue& column) -> std::string_view;

/// An empty column of the same type; categorical columns keep their dictionary.
[[nodiscard]] auto make_empty_like(const ColumnValue& src) -> ColumnValue;

/// Append row `index` of `src` to `out`. Both must hold the same alternative.
void append_value(ColumnValue& out, const ColumnValue& src, std::size_t index);

/// Gather `rows` from `src` into a new column.
[[nodiscard]] auto take(const ColumnValue& src, std::span<const std::size_t> rows) -> ColumnValue;

/// Gather `rows` from every column of `src`, validity included.
[[nodiscard]] auto take_rows(const Table& src, std::span<const std::size_t> rows) -> Table;

/// Vertically concatenate tables that share column names and types.
/// Returns an empty table for an empty input.
[[nodiscard]] auto concat_tables(const std::vector<Table>& parts) -> Table;

/// A copy of `src` without the named column (no-op if absent).
[[nodiscard]] auto drop_column(const Table& src, const std::string& name) -> Table;

/// A copy of `src` holding exactly `names`, in that order.
/// Throws std::runtime_error if a name is missing.
[[nodiscard]] auto select_columns(const Table& src, const std::vector<std::string>& names)
    -> Table;

}  // namespace bankgen
