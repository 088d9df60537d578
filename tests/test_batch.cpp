#include "fakes.hpp"

#include <bankgen/generator/synthetic_row_source.hpp>
#include <bankgen/materialize/batch.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace {

using bankgen::testing::CapturedLog;
using bankgen::testing::RecordingCatalog;

auto schema_dir() -> std::filesystem::path {
    return std::filesystem::path(BANKGEN_SOURCE_DIR) / "tests" / "data" / "schemas";
}

auto parse(const std::string& text) -> bankgen::ConfigModel {
    std::istringstream input(text);
    return bankgen::parse_config(input);
}

}  // namespace

TEST_CASE("Batch runs tables in order and scopes failures per table", "[materialize][batch]") {
    auto config = parse(R"(
[DEFAULT]
tabelas = clientes, sem_schema, sem_secao, contas, transacoes_cartao
num_buckets = 4

[clientes]
num_records = 10

[sem_schema]
num_records = 10

[contas]
num_records = 10
bucketing = true

[transacoes_cartao]
num_records = 25
particionamento = true

[storage]
storage_type = LOCAL
base_path = /tmp/unused
)");

    bankgen::SchemaRegistry registry(schema_dir());
    bankgen::SyntheticRowSource source(bankgen::SyntheticOptions{.seed = 3});
    RecordingCatalog catalog;
    bankgen::TableMaterializer materializer(source, bankgen::Sinks{.catalog = &catalog});

    auto report = bankgen::run_batch(config, registry, materializer);

    REQUIRE(report.written == std::vector<std::string>{"clientes", "transacoes_cartao"});
    // No schema file, and a bucketed table without id_uf.
    REQUIRE(report.failed == std::vector<std::string>{"sem_schema", "contas"});
    REQUIRE(report.skipped == std::vector<std::string>{"sem_secao"});

    auto writes = catalog.writes();
    REQUIRE(writes.size() == 2);
    REQUIRE(writes[0].name == "clientes");
    REQUIRE(writes[1].name == "transacoes_cartao");
    REQUIRE(writes[1].rows.rows() == 25);
}

TEST_CASE("Write failures do not stop the batch", "[materialize][batch]") {
    auto config = parse(R"(
[DEFAULT]
tabelas = clientes, transacoes_cartao
num_records = 5

[clientes]
[transacoes_cartao]

[storage]
base_path = s3://bucket/demo
)");

    bankgen::SchemaRegistry registry(schema_dir());
    bankgen::SyntheticRowSource source(bankgen::SyntheticOptions{.seed = 9});
    RecordingCatalog catalog;
    catalog.failing_writes.insert("clientes");
    bankgen::TableMaterializer materializer(source, bankgen::Sinks{.catalog = &catalog});

    CapturedLog log;
    auto report = bankgen::run_batch(config, registry, materializer);

    REQUIRE(report.failed == std::vector<std::string>{"clientes"});
    REQUIRE(report.written == std::vector<std::string>{"transacoes_cartao"});

    auto lines = log.lines();
    auto failure = std::ranges::find_if(lines, [](const std::string& line) {
        return line.starts_with("table 'clientes' failed");
    });
    REQUIRE(failure != lines.end());
    REQUIRE(failure->starts_with("table 'clientes' failed (write error): "));
    REQUIRE(failure->find("error error") == std::string::npos);
}

TEST_CASE("An empty table list writes nothing", "[materialize][batch]") {
    auto config = parse("[storage]\nbase_path = s3://bucket/demo\n");

    bankgen::SchemaRegistry registry(schema_dir());
    bankgen::SyntheticRowSource source;
    RecordingCatalog catalog;
    bankgen::TableMaterializer materializer(source, bankgen::Sinks{.catalog = &catalog});

    auto report = bankgen::run_batch(config, registry, materializer);
    REQUIRE(report.written.empty());
    REQUIRE(report.failed.empty());
    REQUIRE(report.skipped.empty());
    REQUIRE(catalog.calls.empty());
}
