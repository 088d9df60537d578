#include <bankgen/config/config.hpp>
#include <bankgen/core/error.hpp>
#include <bankgen/materialize/write_decision.hpp>
#include <bankgen/reconcile/reconciler.hpp>
#include <bankgen/storage/session.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"bankgen_rekey — spread a fact table's foreign key over a dimension's keys"};
    app.set_version_flag("--version", "bankgen_rekey 0.1.0");

    std::string config_path = "/app/mount/config.ini";
    std::string dimension = "clientes";
    std::string fact = "transacoes_cartao";
    bankgen::ReconcileOptions options;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "Configuration file")->capture_default_str();
    app.add_option("--dimension", dimension, "Dimension table")->capture_default_str();
    app.add_option("--fact", fact, "Fact table to re-key")->capture_default_str();
    app.add_option("--key", options.dimension_key, "Dimension key column")->capture_default_str();
    app.add_option("--foreign-key", options.fact_key,
                   "Fact foreign-key column (default: same as --key)");
    app.add_option("--seed", options.seed, "Seed for the shuffles");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    if (app.count("--foreign-key") == 0) {
        options.fact_key = options.dimension_key;
    }

    bankgen::ConfigModel config;
    try {
        config = bankgen::load_config(config_path);
    } catch (const bankgen::Error& e) {
        spdlog::error("failed to load configuration: {}", e.what());
        return 1;
    }

    std::optional<bankgen::storage::Session> session;
    try {
        session.emplace(bankgen::storage::Session::open(config));
    } catch (const std::exception& e) {
        spdlog::error("failed to initialize storage session: {}", e.what());
        return 1;
    }

    try {
        auto dim_rows = session->read(dimension);
        auto fact_rows = session->read(fact);
        spdlog::info("re-keying '{}' ({} rows) onto '{}' ({} rows) by '{}'", fact,
                     fact_rows.rows(), dimension, dim_rows.rows(), options.dimension_key);

        auto rekeyed = bankgen::reconcile(dim_rows, fact_rows, options);
        std::optional<bankgen::storage::Layout> layout;
        if (const auto* spec = config.find_spec(fact)) {
            layout = bankgen::decide_write(*spec, config.storage.kind, true).layout;
        }
        session->replace(fact, rekeyed, layout);
        spdlog::info("table '{}' rewritten with {} rows", fact, rekeyed.rows());
    } catch (const bankgen::Error& e) {
        spdlog::error("re-keying failed ({}): {}", bankgen::to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("re-keying failed: {}", e.what());
        return 1;
    }
    return 0;
}
