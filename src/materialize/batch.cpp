#include <bankgen/core/error.hpp>
#include <bankgen/materialize/batch.hpp>

#include <spdlog/spdlog.h>

namespace bankgen {

auto run_batch(const ConfigModel& config, SchemaRegistry& schemas, TableMaterializer& materializer)
    -> BatchReport {
    BatchReport report;
    if (config.tables.empty()) {
        spdlog::error("no tables listed in 'tabelas'");
        return report;
    }

    for (const auto& name : config.tables) {
        const auto* spec = config.find_spec(name);
        if (spec == nullptr) {
            spdlog::warn("table '{}' has no configuration section, skipping", name);
            report.skipped.push_back(name);
            continue;
        }
        spdlog::info("processing table '{}'", name);
        try {
            const auto& schema = schemas.resolve(name);
            materializer.materialize(name, *spec, schema, config.storage);
            report.written.push_back(name);
            spdlog::info("table '{}' processed", name);
        } catch (const Error& e) {
            spdlog::error("table '{}' failed ({}): {}", name, to_string(e.kind()), e.what());
            report.failed.push_back(name);
        } catch (const std::exception& e) {
            spdlog::error("table '{}' failed: {}", name, e.what());
            report.failed.push_back(name);
        }
    }

    spdlog::info("batch finished: {} written, {} failed, {} skipped", report.written.size(),
                 report.failed.size(), report.skipped.size());
    return report;
}

}  // namespace bankgen
