#pragma once

#include <bankgen/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bankgen::storage {

enum class WriteMode : std::uint8_t {
    Overwrite,
    Append,
};

enum class LayoutKind : std::uint8_t {
    None,
    PartitionByDate,
    BucketByKey,
};

[[nodiscard]] auto to_string(WriteMode mode) -> std::string_view;
[[nodiscard]] auto to_string(LayoutKind kind) -> std::string_view;

/// Physical arrangement of written data.
struct Layout {
    LayoutKind kind = LayoutKind::None;
    /// Partition column (PartitionByDate) or bucket key (BucketByKey).
    std::string column;
    std::size_t num_buckets = 0;

    [[nodiscard]] static auto none() -> Layout { return Layout{}; }
    [[nodiscard]] static auto partition_by(std::string column) -> Layout {
        return Layout{.kind = LayoutKind::PartitionByDate, .column = std::move(column)};
    }
    [[nodiscard]] static auto bucket_by(std::string column, std::size_t buckets) -> Layout {
        return Layout{
            .kind = LayoutKind::BucketByKey, .column = std::move(column), .num_buckets = buckets};
    }

    [[nodiscard]] auto describe() const -> std::string;

    auto operator==(const Layout&) const -> bool = default;
};

/// One output file: where it goes relative to the dataset root and its rows.
struct FilePart {
    /// Hive-style partition directory ("data_execucao=2026-10-17"), or empty.
    std::string partition_dir;
    std::optional<std::size_t> bucket;
    Table rows;
};

/// Split `table` into the files `layout` calls for.
///
/// Partitioning drops the partition column from the rows (its value lives in
/// the directory name). Bucketing hashes the key column into `num_buckets`
/// files; empty buckets produce no file. An empty table with no layout still
/// yields a single part so the dataset keeps its columns.
[[nodiscard]] auto plan_parts(const Table& table, const Layout& layout)
    -> std::expected<std::vector<FilePart>, std::string>;

/// Bucket of row `row` in `column`; stable for a given value and bucket count.
[[nodiscard]] auto bucket_of(const ColumnValue& column, std::size_t row, std::size_t num_buckets)
    -> std::size_t;

/// File name of a part: `part-<seq>[-b<bucket>]<ext>`.
[[nodiscard]] auto part_file_name(std::size_t sequence, std::optional<std::size_t> bucket,
                                  std::string_view extension) -> std::string;

/// Sequence number encoded in a part file name, if it is one.
[[nodiscard]] auto part_sequence(std::string_view file_name) -> std::optional<std::size_t>;

/// Bucket number encoded in a part file name (`-b<bucket>`), if any.
[[nodiscard]] auto part_bucket(std::string_view file_name) -> std::optional<std::size_t>;

}  // namespace bankgen::storage
