#pragma once

#include <bankgen/table/table.hpp>

#include <arrow/api.h>

#include <expected>
#include <memory>
#include <string>

namespace bankgen::storage {

/// Convert a Table to an Arrow table.
///
/// Column type mappings:
///   Int64       → int64
///   Double      → float64
///   String      → utf8
///   Categorical → utf8 (dictionary decoded)
///   Date        → date32
///   Timestamp   → timestamp[ns]
///
/// Validity bitmaps become Arrow nulls.
[[nodiscard]] auto to_arrow(const Table& table)
    -> std::expected<std::shared_ptr<arrow::Table>, std::string>;

/// Convert an Arrow table back. Integer widths collapse to int64, float to
/// double, large strings to strings, date64 to date and timestamps of any unit
/// to nanoseconds. Nulls are carried in validity bitmaps.
[[nodiscard]] auto from_arrow(const arrow::Table& table) -> std::expected<Table, std::string>;

}  // namespace bankgen::storage
