#include <bankgen/config/config.hpp>
#include <bankgen/core/error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

auto parse(const std::string& text) -> bankgen::ConfigModel {
    std::istringstream input(text);
    return bankgen::parse_config(input);
}

constexpr const char* kStorage = R"(
[storage]
storage_type = S3
base_path = s3a://bucket/bancodemo/
)";

}  // namespace

TEST_CASE("Config - full example", "[config]") {
    auto config = parse(std::string(R"(
[DEFAULT]
apenas_arquivos = False
formato_arquivo = parquet
dbname = bancodemo
tabelas = clientes, transacoes_cartao

[clientes]
num_records = 100
particionamento = False
bucketing = True
num_buckets = 4

[transacoes_cartao]
num_records = 1000
particionamento = True
bucketing = False
)") + kStorage);

    REQUIRE(config.storage.kind == bankgen::TargetKind::Catalog);
    REQUIRE(config.storage.storage == bankgen::StorageKind::S3);
    REQUIRE(config.storage.base_path == "s3a://bucket/bancodemo/");
    REQUIRE(config.storage.file_format == bankgen::storage::FileFormat::Parquet);
    REQUIRE(config.storage.database_name == "bancodemo");
    REQUIRE(config.tables == std::vector<std::string>{"clientes", "transacoes_cartao"});

    const auto* clientes = config.find_spec("clientes");
    REQUIRE(clientes != nullptr);
    REQUIRE(clientes->num_records == 100);
    REQUIRE_FALSE(clientes->partitioned);
    REQUIRE(clientes->bucketed);
    REQUIRE(clientes->num_buckets == 4);

    const auto* transacoes = config.find_spec("transacoes_cartao");
    REQUIRE(transacoes != nullptr);
    REQUIRE(transacoes->num_records == 1000);
    REQUIRE(transacoes->partitioned);
    REQUIRE_FALSE(transacoes->bucketed);
}

TEST_CASE("Config - DEFAULT keys are inherited by table sections", "[config]") {
    auto config = parse(std::string(R"(
[DEFAULT]
tabelas = a,b
particionamento = yes
num_records = 7

[a]

[b]
num_records = 3
particionamento = off
)") + kStorage);

    REQUIRE(config.find_spec("a")->num_records == 7);
    REQUIRE(config.find_spec("a")->partitioned);
    REQUIRE(config.find_spec("b")->num_records == 3);
    REQUIRE_FALSE(config.find_spec("b")->partitioned);
}

TEST_CASE("Config - defaults and file-only mode", "[config]") {
    auto config = parse(R"(
[DEFAULT]
apenas_arquivos = TRUE
formato_arquivo = CSV
tabelas = clientes

[storage]
base_path = abfss://container@account.dfs.core.windows.net/demo
)");

    REQUIRE(config.storage.kind == bankgen::TargetKind::FlatFile);
    REQUIRE(config.storage.storage == bankgen::StorageKind::S3);
    REQUIRE(config.storage.file_format == bankgen::storage::FileFormat::Csv);
    REQUIRE(config.storage.database_name == "bancodemo");

    SECTION("listed table without a section has no spec") {
        REQUIRE(config.tables.size() == 1);
        REQUIRE(config.find_spec("clientes") == nullptr);
    }
}

TEST_CASE("Config - table list handling", "[config]") {
    SECTION("blank entries are dropped") {
        auto config = parse(std::string("[DEFAULT]\ntabelas = , a ,,\n[a]\nnum_records = 1\n") +
                            kStorage);
        REQUIRE(config.tables == std::vector<std::string>{"a"});
    }
    SECTION("missing list is empty") {
        auto config = parse(kStorage);
        REQUIRE(config.tables.empty());
    }
}

TEST_CASE("Config - unsupported storage kind", "[config]") {
    REQUIRE_THROWS_AS(parse(R"(
[DEFAULT]
tabelas = clientes
[clientes]
num_records = 10
[storage]
storage_type = GCS
base_path = gs://bucket/
)"),
                      bankgen::ConfigurationError);
}

TEST_CASE("Config - validation failures", "[config]") {
    SECTION("missing storage section") {
        REQUIRE_THROWS_AS(parse("[DEFAULT]\ntabelas = a\n"), bankgen::ConfigurationError);
    }
    SECTION("missing base_path") {
        REQUIRE_THROWS_AS(parse("[storage]\nstorage_type = ADLS\n"), bankgen::ConfigurationError);
    }
    SECTION("unknown file format") {
        REQUIRE_THROWS_AS(parse(std::string("[DEFAULT]\nformato_arquivo = orc\n") + kStorage),
                          bankgen::ConfigurationError);
    }
    SECTION("missing num_records") {
        REQUIRE_THROWS_AS(parse(std::string("[DEFAULT]\ntabelas = a\n[a]\nbucketing = no\n") +
                                kStorage),
                          bankgen::ConfigurationError);
    }
    SECTION("negative num_records") {
        REQUIRE_THROWS_AS(
            parse(std::string("[DEFAULT]\ntabelas = a\n[a]\nnum_records = -5\n") + kStorage),
            bankgen::ConfigurationError);
    }
    SECTION("bad boolean") {
        REQUIRE_THROWS_AS(
            parse(std::string("[DEFAULT]\ntabelas = a\n[a]\nnum_records = 5\nbucketing = maybe\n") +
                  kStorage),
            bankgen::ConfigurationError);
    }
    SECTION("bucketing without buckets") {
        REQUIRE_THROWS_AS(
            parse(std::string("[DEFAULT]\ntabelas = a\n[a]\nnum_records = 5\nbucketing = 1\n") +
                  kStorage),
            bankgen::ConfigurationError);
    }
    SECTION("malformed INI") {
        REQUIRE_THROWS_AS(parse("[storage\nbase_path = x\n"), bankgen::ConfigurationError);
    }
}

TEST_CASE("Config - load_config reads files", "[config]") {
    SECTION("missing file") {
        REQUIRE_THROWS_AS(bankgen::load_config("/nonexistent/bankgen/config.ini"),
                          bankgen::ConfigurationError);
    }
    SECTION("example configuration") {
        auto config =
            bankgen::load_config(std::filesystem::path(BANKGEN_SOURCE_DIR) / "examples/config.ini");
        REQUIRE(config.storage.storage == bankgen::StorageKind::Local);
        REQUIRE(config.tables.size() == 2);
        REQUIRE(config.find_spec("transacoes_cartao")->partitioned);
    }
}
