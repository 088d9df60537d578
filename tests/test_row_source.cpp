#include <bankgen/generator/synthetic_row_source.hpp>
#include <bankgen/schema/schema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>

namespace {

auto schema_dir() -> std::filesystem::path {
    return std::filesystem::path(BANKGEN_SOURCE_DIR) / "tests" / "data" / "schemas";
}

auto seeded(std::uint64_t seed) -> bankgen::SyntheticRowSource {
    return bankgen::SyntheticRowSource(bankgen::SyntheticOptions{
        .seed = seed, .key_range = 50, .today = bankgen::make_date(2024, 6, 30)});
}

}  // namespace

TEST_CASE("SyntheticRowSource matches the schema", "[generator]") {
    bankgen::SchemaRegistry registry(schema_dir());
    auto source = seeded(7);

    for (const std::string table : {"clientes", "transacoes_cartao", "contas"}) {
        const auto& schema = registry.resolve(table);
        auto rows = source.generate(table, schema, 250);
        INFO(table);
        REQUIRE(rows.rows() == 250);
        REQUIRE(schema.check(rows).has_value());
        for (const auto& entry : rows.columns) {
            REQUIRE_FALSE(entry.validity.has_value());
        }
    }
}

TEST_CASE("SyntheticRowSource banking heuristics", "[generator]") {
    bankgen::SchemaRegistry registry(schema_dir());
    auto source = seeded(11);
    auto clientes = source.generate("clientes", registry.resolve("clientes"), 100);
    auto transacoes =
        source.generate("transacoes_cartao", registry.resolve("transacoes_cartao"), 500);

    SECTION("leading id column is sequential") {
        const auto& ids = std::get<bankgen::Column<std::int64_t>>(*clientes.find("id_usuario"));
        for (std::size_t i = 0; i < ids.size(); ++i) {
            REQUIRE(ids[i] == static_cast<std::int64_t>(i) + 1);
        }
    }
    SECTION("foreign ids stay within the key range") {
        const auto& ids = std::get<bankgen::Column<std::int64_t>>(*transacoes.find("id_usuario"));
        REQUIRE(std::ranges::all_of(ids, [](std::int64_t id) { return id >= 1 && id <= 50; }));
    }
    SECTION("state codes are IBGE codes") {
        const std::set<std::int64_t> codes = {11, 12, 13, 14, 15, 16, 17, 21, 22,
                                              23, 24, 25, 26, 27, 28, 29, 31, 32,
                                              33, 35, 41, 42, 43, 50, 51, 52, 53};
        const auto& uf = std::get<bankgen::Column<std::int64_t>>(*clientes.find("id_uf"));
        REQUIRE(std::ranges::all_of(uf, [&](std::int64_t c) { return codes.contains(c); }));
    }
    SECTION("cpf is formatted") {
        const auto& cpf = std::get<bankgen::Column<std::string>>(*clientes.find("cpf"));
        for (const auto& value : cpf) {
            REQUIRE(value.size() == 14);
            REQUIRE(value[3] == '.');
            REQUIRE(value[7] == '.');
            REQUIRE(value[11] == '-');
        }
    }
    SECTION("categories are dictionary encoded") {
        const auto* cat =
            std::get_if<bankgen::Column<bankgen::Categorical>>(transacoes.find("categoria"));
        REQUIRE(cat != nullptr);
        REQUIRE(cat->dictionary().size() <= 10);
    }
    SECTION("amounts are positive and booleans are 0 or 1") {
        const auto& valor = std::get<bankgen::Column<double>>(*transacoes.find("valor"));
        REQUIRE(std::ranges::all_of(valor, [](double v) { return v > 0.0; }));
        const auto& aprovada =
            std::get<bankgen::Column<std::int64_t>>(*transacoes.find("aprovada"));
        REQUIRE(std::ranges::all_of(aprovada, [](std::int64_t v) { return v == 0 || v == 1; }));
    }
    SECTION("dates fall before the reference date") {
        const auto& births =
            std::get<bankgen::Column<bankgen::Date>>(*clientes.find("data_nascimento"));
        auto adult = bankgen::make_date(2006, 7, 10);
        REQUIRE(std::ranges::all_of(births, [&](bankgen::Date d) { return d <= adult; }));
        const auto& ts =
            std::get<bankgen::Column<bankgen::Timestamp>>(*transacoes.find("data_transacao"));
        auto end = static_cast<std::int64_t>(bankgen::make_date(2024, 6, 30).days) *
                   86'400'000'000'000LL;
        REQUIRE(std::ranges::all_of(ts, [&](bankgen::Timestamp t) { return t.nanos < end; }));
    }
}

TEST_CASE("SyntheticRowSource is reproducible with a seed", "[generator]") {
    bankgen::SchemaRegistry registry(schema_dir());
    const auto& schema = registry.resolve("clientes");
    auto a = seeded(42).generate("clientes", schema, 20);
    auto b = seeded(42).generate("clientes", schema, 20);
    REQUIRE(std::get<bankgen::Column<std::string>>(*a.find("nome")).span().size() == 20);
    for (std::size_t i = 0; i < 20; ++i) {
        REQUIRE(std::get<bankgen::Column<std::string>>(*a.find("nome"))[i] ==
                std::get<bankgen::Column<std::string>>(*b.find("nome"))[i]);
    }
}

TEST_CASE("SyntheticRowSource handles zero rows", "[generator]") {
    bankgen::SchemaRegistry registry(schema_dir());
    const auto& schema = registry.resolve("transacoes_cartao");
    auto rows = seeded(1).generate("transacoes_cartao", schema, 0);
    REQUIRE(rows.rows() == 0);
    REQUIRE(rows.columns.size() == schema.size());
}
