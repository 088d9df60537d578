#pragma once

#include <bankgen/config/config.hpp>
#include <bankgen/materialize/materializer.hpp>
#include <bankgen/schema/schema.hpp>

#include <string>
#include <vector>

namespace bankgen {

/// Outcome of a batch run, by table name.
struct BatchReport {
    std::vector<std::string> written;
    std::vector<std::string> failed;
    /// Listed in `tabelas` but without a section of their own.
    std::vector<std::string> skipped;
};

/// Materialize every listed table in order.
///
/// Per-table failures are logged with the table name and cause and do not
/// stop the loop.
auto run_batch(const ConfigModel& config, SchemaRegistry& schemas, TableMaterializer& materializer)
    -> BatchReport;

}  // namespace bankgen
