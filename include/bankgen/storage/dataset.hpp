#pragma once

#include <bankgen/storage/format.hpp>
#include <bankgen/storage/layout.hpp>
#include <bankgen/table/table.hpp>

#include <arrow/filesystem/api.h>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace bankgen::storage {

struct DatasetWriteResult {
    std::size_t files = 0;
    std::size_t rows = 0;
};

/// Join two abstract (forward-slash) paths.
[[nodiscard]] auto join_path(std::string_view base, std::string_view name) -> std::string;

/// Write `table` as a directory of part files under `dir`.
///
/// Overwrite clears `dir` first; Append keeps existing files and numbers the
/// new parts after the highest sequence already present.
[[nodiscard]] auto write_dataset(arrow::fs::FileSystem& fs, const std::string& dir,
                                 const Table& table, WriteMode mode, FileFormat format,
                                 const Layout& layout)
    -> std::expected<DatasetWriteResult, std::string>;

/// Read every part file of `format` under `dir` (recursively), restoring
/// Hive-style `column=value` directory segments as trailing columns. Files
/// and directories starting with `_` or `.` are ignored.
[[nodiscard]] auto read_dataset(arrow::fs::FileSystem& fs, const std::string& dir,
                                FileFormat format) -> std::expected<Table, std::string>;

/// Infer the layout an existing dataset under `dir` was written with.
///
/// A `column=value` directory means PartitionByDate on that column; `-b`
/// part names mean BucketByKey with one bucket past the highest number seen.
/// File names do not record the bucket key, so a bucketed result has an
/// empty `column`. A missing or flat directory yields Layout::none().
[[nodiscard]] auto detect_layout(arrow::fs::FileSystem& fs, const std::string& dir)
    -> std::expected<Layout, std::string>;

}  // namespace bankgen::storage
