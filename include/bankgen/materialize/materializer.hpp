#pragma once

#include <bankgen/config/config.hpp>
#include <bankgen/core/time.hpp>
#include <bankgen/generator/row_source.hpp>
#include <bankgen/materialize/write_decision.hpp>
#include <bankgen/schema/schema.hpp>
#include <bankgen/storage/sink.hpp>

#include <functional>
#include <string>

namespace bankgen {

/// The sinks a materializer writes through. Only the one matching the target
/// kind is required.
struct Sinks {
    storage::CatalogSink* catalog = nullptr;
    storage::FileSink* files = nullptr;
};

/// Generates one table's batch and writes it as the target calls for.
class TableMaterializer {
   public:
    /// Source of the execution date stamped on each batch.
    using Clock = std::function<Date()>;

    TableMaterializer(RowSource& source, Sinks sinks, Clock clock = today_utc);

    /// Generate `spec.num_records` rows of `schema`, stamp them with the run
    /// date and write them. Any failure is rethrown as MaterializationError
    /// carrying the table name and the kind of the cause.
    auto materialize(const std::string& table, const TableSpec& spec, const Schema& schema,
                     const StorageTarget& target) -> WriteDecision;

   private:
    auto materialize_unchecked(const std::string& table, const TableSpec& spec,
                               const Schema& schema, const StorageTarget& target)
        -> WriteDecision;

    RowSource& source_;
    Sinks sinks_;
    Clock clock_;
};

}  // namespace bankgen
