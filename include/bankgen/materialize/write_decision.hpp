#pragma once

#include <bankgen/config/config.hpp>
#include <bankgen/storage/layout.hpp>

#include <string_view>

namespace bankgen {

/// Column stamped with the run date on every materialized row.
inline constexpr std::string_view kExecutionDateColumn = "data_execucao";

/// Natural key that bucketed tables are hashed on.
inline constexpr std::string_view kBucketColumn = "id_uf";

/// How a table is written on this run.
struct WriteDecision {
    storage::WriteMode mode = storage::WriteMode::Overwrite;
    storage::Layout layout;

    auto operator==(const WriteDecision&) const -> bool = default;
};

/// Partitioning takes precedence over bucketing when both are requested.
/// Flat-file targets always overwrite; catalog targets append once the table
/// exists.
[[nodiscard]] auto decide_write(const TableSpec& spec, TargetKind target, bool table_exists)
    -> WriteDecision;

}  // namespace bankgen
