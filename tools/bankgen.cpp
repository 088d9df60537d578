#include <bankgen/bankgen.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"bankgen — materialize synthetic banking demo tables"};
    app.set_version_flag("--version", "bankgen 0.1.0");

    std::string config_path = "/app/mount/config.ini";
    std::string schema_dir = "/app/mount/";
    std::optional<std::uint64_t> seed;
    std::int64_t key_range = 1000;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "Configuration file")->capture_default_str();
    app.add_option("-s,--schemas", schema_dir, "Directory holding <table>.json schema files")
        ->capture_default_str();
    app.add_option("--seed", seed, "Seed for the data generator");
    app.add_option("--key-range", key_range, "Largest generated foreign-key id")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
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

    bankgen::SyntheticRowSource source(
        bankgen::SyntheticOptions{.seed = seed, .key_range = key_range});
    bankgen::TableMaterializer materializer(
        source, bankgen::Sinks{.catalog = &session->catalog(), .files = &session->files()});
    bankgen::SchemaRegistry schemas(schema_dir);

    (void)bankgen::run_batch(config, schemas, materializer);
    return 0;
}
