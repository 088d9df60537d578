#include "fakes.hpp"

#include <bankgen/core/error.hpp>
#include <bankgen/generator/synthetic_row_source.hpp>
#include <bankgen/materialize/materializer.hpp>
#include <bankgen/schema/schema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>

namespace {

using bankgen::storage::FileFormat;
using bankgen::storage::LayoutKind;
using bankgen::storage::WriteMode;
using bankgen::testing::RecordingCatalog;
using bankgen::testing::RecordingFileSink;

auto schema_dir() -> std::filesystem::path {
    return std::filesystem::path(BANKGEN_SOURCE_DIR) / "tests" / "data" / "schemas";
}

auto run_date() -> bankgen::Date { return bankgen::make_date(2024, 5, 17); }

auto catalog_target() -> bankgen::StorageTarget {
    return bankgen::StorageTarget{.kind = bankgen::TargetKind::Catalog,
                                  .base_path = "s3://bucket/demo",
                                  .file_format = FileFormat::Csv};
}

auto file_target() -> bankgen::StorageTarget {
    auto target = catalog_target();
    target.kind = bankgen::TargetKind::FlatFile;
    return target;
}

auto spec(const std::string& name, std::size_t rows, bool partitioned = false,
          bool bucketed = false) -> bankgen::TableSpec {
    return bankgen::TableSpec{.name = name,
                              .num_records = rows,
                              .partitioned = partitioned,
                              .bucketed = bucketed,
                              .num_buckets = bucketed ? 4 : 0};
}

struct Fixture {
    bankgen::SchemaRegistry registry{schema_dir()};
    bankgen::SyntheticRowSource source{bankgen::SyntheticOptions{.seed = 5}};
    RecordingCatalog catalog;
    RecordingFileSink files;
    bankgen::TableMaterializer materializer{
        source, bankgen::Sinks{.catalog = &catalog, .files = &files}, run_date};
};

void require_stamped(const bankgen::Table& rows, bankgen::Date expected) {
    const auto* stamp = std::get_if<bankgen::Column<bankgen::Date>>(rows.find("data_execucao"));
    REQUIRE(stamp != nullptr);
    REQUIRE(stamp->size() == rows.rows());
    REQUIRE(std::ranges::all_of(*stamp, [&](bankgen::Date d) { return d == expected; }));
}

}  // namespace

TEST_CASE("New catalog table is created with an overwrite", "[materialize]") {
    Fixture f;
    const auto& schema = f.registry.resolve("clientes");

    auto decision =
        f.materializer.materialize("clientes", spec("clientes", 100), schema, catalog_target());

    REQUIRE(decision.mode == WriteMode::Overwrite);
    REQUIRE(decision.layout.kind == LayoutKind::None);

    auto writes = f.catalog.writes();
    REQUIRE(writes.size() == 1);
    const auto& write = writes.front();
    REQUIRE(write.name == "clientes");
    REQUIRE(write.mode == WriteMode::Overwrite);
    REQUIRE(write.layout.kind == LayoutKind::None);
    REQUIRE(write.format == FileFormat::Parquet);
    REQUIRE(write.rows.rows() == 100);

    auto expected = schema.with_field(bankgen::Field{
        .name = "data_execucao", .type = "date", .kind = bankgen::ColumnKind::Date});
    REQUIRE(expected.check(write.rows).has_value());
    require_stamped(write.rows, run_date());

    REQUIRE(std::ranges::none_of(f.catalog.calls,
                                 [](const auto& call) { return call.op == "refresh"; }));
    REQUIRE(f.files.calls.empty());
}

TEST_CASE("Existing catalog table is refreshed then appended", "[materialize]") {
    Fixture f;
    f.catalog.existing.insert("transacoes_cartao");
    const auto& schema = f.registry.resolve("transacoes_cartao");

    f.materializer.materialize("transacoes_cartao", spec("transacoes_cartao", 50, true), schema,
                               catalog_target());

    REQUIRE(f.catalog.calls.size() == 3);
    REQUIRE(f.catalog.calls[0].op == "exists");
    REQUIRE(f.catalog.calls[1].op == "refresh");
    REQUIRE(f.catalog.calls[1].name == "transacoes_cartao");
    REQUIRE(f.catalog.calls[2].op == "write");
    REQUIRE(f.catalog.calls[2].mode == WriteMode::Append);
    REQUIRE(f.catalog.calls[2].layout == bankgen::storage::Layout::partition_by("data_execucao"));
    REQUIRE(f.catalog.calls[2].format == FileFormat::Parquet);
    require_stamped(f.catalog.calls[2].rows, run_date());
}

TEST_CASE("Flat-file targets always overwrite with the configured format", "[materialize]") {
    Fixture f;
    f.catalog.existing.insert("clientes");
    const auto& schema = f.registry.resolve("clientes");

    f.materializer.materialize("clientes", spec("clientes", 20, false, true), schema,
                               file_target());
    f.materializer.materialize("clientes", spec("clientes", 20, false, true), schema,
                               file_target());

    REQUIRE(f.catalog.calls.empty());
    REQUIRE(f.files.calls.size() == 2);
    for (const auto& call : f.files.calls) {
        REQUIRE(call.name == "clientes");
        REQUIRE(call.mode == WriteMode::Overwrite);
        REQUIRE(call.format == FileFormat::Csv);
        REQUIRE(call.layout == bankgen::storage::Layout::bucket_by("id_uf", 4));
    }
}

TEST_CASE("Every row of a call carries the same execution date", "[materialize]") {
    Fixture f;
    int ticks = 0;
    bankgen::TableMaterializer materializer(
        f.source, bankgen::Sinks{.catalog = &f.catalog},
        [&ticks] { return bankgen::make_date(2024, 1, 1 + static_cast<unsigned>(ticks++)); });
    const auto& schema = f.registry.resolve("clientes");

    materializer.materialize("clientes", spec("clientes", 30), schema, catalog_target());
    materializer.materialize("clientes", spec("clientes", 30), schema, catalog_target());

    auto writes = f.catalog.writes();
    REQUIRE(writes.size() == 2);
    require_stamped(writes[0].rows, bankgen::make_date(2024, 1, 1));
    require_stamped(writes[1].rows, bankgen::make_date(2024, 1, 2));
}

TEST_CASE("Materialization failures carry the table and cause", "[materialize]") {
    Fixture f;

    SECTION("row count mismatch is a data error") {
        bankgen::testing::ShortRowSource short_source(3);
        bankgen::TableMaterializer materializer(short_source,
                                                bankgen::Sinks{.catalog = &f.catalog}, run_date);
        try {
            materializer.materialize("clientes", spec("clientes", 10),
                                     f.registry.resolve("clientes"), catalog_target());
            FAIL("expected a MaterializationError");
        } catch (const bankgen::MaterializationError& e) {
            REQUIRE(e.table() == "clientes");
            REQUIRE(e.kind() == bankgen::ErrorKind::Data);
        }
        REQUIRE(f.catalog.writes().empty());
    }

    SECTION("bucketing needs the bucket column") {
        try {
            f.materializer.materialize("contas", spec("contas", 10, false, true),
                                       f.registry.resolve("contas"), catalog_target());
            FAIL("expected a MaterializationError");
        } catch (const bankgen::MaterializationError& e) {
            REQUIRE(e.kind() == bankgen::ErrorKind::Configuration);
        }
        REQUIRE(f.catalog.writes().empty());
    }

    SECTION("sink rejections surface as write errors") {
        f.catalog.failing_writes.insert("clientes");
        try {
            f.materializer.materialize("clientes", spec("clientes", 10),
                                       f.registry.resolve("clientes"), catalog_target());
            FAIL("expected a MaterializationError");
        } catch (const bankgen::MaterializationError& e) {
            REQUIRE(e.table() == "clientes");
            REQUIRE(e.kind() == bankgen::ErrorKind::Write);
        }
    }

    SECTION("a missing sink is a configuration error") {
        bankgen::TableMaterializer materializer(f.source, bankgen::Sinks{.catalog = &f.catalog},
                                                run_date);
        REQUIRE_THROWS_AS(materializer.materialize("clientes", spec("clientes", 1),
                                                   f.registry.resolve("clientes"), file_target()),
                          bankgen::MaterializationError);
    }
}
