#pragma once

#include <bankgen/storage/format.hpp>
#include <bankgen/table/table.hpp>

#include <arrow/filesystem/api.h>

#include <expected>
#include <istream>
#include <string>

namespace bankgen::storage {

/// Write `table` as a single file at `path` on `fs`, replacing any existing
/// file. Parquet goes through parquet::arrow, CSV through Arrow's CSV writer
/// (header row, RFC 4180 quoting).
[[nodiscard]] auto write_file(arrow::fs::FileSystem& fs, const std::string& path,
                              const Table& table, FileFormat format)
    -> std::expected<void, std::string>;

/// Read a single data file from `fs`.
[[nodiscard]] auto read_file(arrow::fs::FileSystem& fs, const std::string& path,
                             FileFormat format) -> std::expected<Table, std::string>;

/// Parse CSV text with a header row. Column types are inferred per column:
/// int64, then double, then ISO date, else string. Empty cells are nulls.
[[nodiscard]] auto read_csv(std::istream& input) -> std::expected<Table, std::string>;

}  // namespace bankgen::storage
