#include <bankgen/core/error.hpp>
#include <bankgen/materialize/materializer.hpp>

#include <spdlog/spdlog.h>

namespace bankgen {

TableMaterializer::TableMaterializer(RowSource& source, Sinks sinks, Clock clock)
    : source_(source), sinks_(sinks), clock_(std::move(clock)) {}

auto TableMaterializer::materialize(const std::string& table, const TableSpec& spec,
                                    const Schema& schema, const StorageTarget& target)
    -> WriteDecision {
    try {
        return materialize_unchecked(table, spec, schema, target);
    } catch (const Error& e) {
        throw MaterializationError(table, e);
    }
}

auto TableMaterializer::materialize_unchecked(const std::string& table, const TableSpec& spec,
                                              const Schema& schema, const StorageTarget& target)
    -> WriteDecision {
    const bool catalog = target.kind == TargetKind::Catalog;
    if (catalog && sinks_.catalog == nullptr) {
        throw ConfigurationError("no catalog sink for a catalog target");
    }
    if (!catalog && sinks_.files == nullptr) {
        throw ConfigurationError("no file sink for a flat-file target");
    }

    const std::string date_column(kExecutionDateColumn);
    if (schema.contains(date_column)) {
        throw SchemaError("schema already defines the execution date column '" + date_column +
                          "'");
    }

    const bool exists = catalog && sinks_.catalog->table_exists(table);

    auto rows = source_.generate(table, schema, spec.num_records);
    if (rows.rows() != spec.num_records || (spec.num_records > 0 && rows.columns.empty())) {
        throw DataError("generator returned " + std::to_string(rows.rows()) + " rows, expected " +
                        std::to_string(spec.num_records));
    }
    if (auto checked = schema.check(rows); !checked) {
        throw DataError("generated batch does not match schema: " + checked.error());
    }
    rows.add_column(date_column, Column<Date>(std::vector<Date>(rows.rows(), clock_())));

    auto decision = decide_write(spec, target.kind, exists);
    if (decision.layout.kind == storage::LayoutKind::BucketByKey &&
        !schema.contains(decision.layout.column)) {
        throw ConfigurationError("cannot bucket by '" + decision.layout.column +
                                 "': column not in schema");
    }
    spdlog::info("writing table '{}' ({}, {})", table, to_string(decision.mode),
                 decision.layout.describe());

    if (catalog) {
        if (decision.mode == storage::WriteMode::Append) {
            sinks_.catalog->refresh_metadata(table);
        }
        sinks_.catalog->write(rows, table, decision.mode, storage::FileFormat::Parquet,
                              decision.layout);
    } else {
        sinks_.files->write(rows, table, decision.mode, target.file_format, decision.layout);
    }
    return decision;
}

}  // namespace bankgen
