#include <bankgen/core/error.hpp>
#include <bankgen/reconcile/reconciler.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>

namespace {

auto dimension(std::initializer_list<std::string> keys) -> bankgen::Table {
    bankgen::Table table;
    table.add_column("id_usuario", bankgen::Column<std::string>(keys));
    table.add_column("nome",
                     bankgen::Column<std::string>(std::vector<std::string>(keys.size(), "x")));
    return table;
}

auto fact(std::size_t rows) -> bankgen::Table {
    bankgen::Column<std::int64_t> ids;
    bankgen::Column<std::string> old_keys;
    bankgen::Column<double> valor;
    for (std::size_t i = 0; i < rows; ++i) {
        ids.push_back(static_cast<std::int64_t>(i));
        old_keys.push_back("old");
        valor.push_back(static_cast<double>(i) * 1.5);
    }
    bankgen::Table table;
    table.add_column("id_transacao", std::move(ids));
    table.add_column("id_usuario", std::move(old_keys));
    table.add_column("valor", std::move(valor));
    return table;
}

auto key_counts(const bankgen::Table& table) -> std::map<std::string, std::size_t> {
    std::map<std::string, std::size_t> counts;
    for (const auto& key : std::get<bankgen::Column<std::string>>(*table.find("id_usuario"))) {
        ++counts[key];
    }
    return counts;
}

auto options(std::uint64_t seed) -> bankgen::ReconcileOptions {
    return bankgen::ReconcileOptions{.seed = seed};
}

}  // namespace

TEST_CASE("plan_rekey sizes the key pool", "[reconcile]") {
    auto plan = bankgen::plan_rekey(3, 10);
    REQUIRE(plan.replication_factor == 4);
    REQUIRE(plan.pool_size == 12);

    REQUIRE(bankgen::plan_rekey(5, 5).replication_factor == 1);
    REQUIRE(bankgen::plan_rekey(100, 7).replication_factor == 1);
    REQUIRE(bankgen::plan_rekey(100, 7).pool_size == 100);
    REQUIRE(bankgen::plan_rekey(4, 0).replication_factor == 1);
    REQUIRE_THROWS_AS(bankgen::plan_rekey(0, 10), bankgen::DataError);
}

TEST_CASE("Three keys spread over ten fact rows", "[reconcile]") {
    auto out = bankgen::reconcile(dimension({"A", "B", "C"}), fact(10), options(1));

    REQUIRE(out.rows() == 10);
    REQUIRE(out.column_names() ==
            std::vector<std::string>{"id_transacao", "valor", "id_usuario"});

    auto counts = key_counts(out);
    REQUIRE(counts.size() == 3);
    for (const auto& [key, count] : counts) {
        REQUIRE((key == "A" || key == "B" || key == "C"));
        REQUIRE((count == 3 || count == 4));
    }

    SECTION("other fact columns are untouched") {
        const auto& ids = std::get<bankgen::Column<std::int64_t>>(*out.find("id_transacao"));
        for (std::size_t i = 0; i < ids.size(); ++i) {
            REQUIRE(ids[i] == static_cast<std::int64_t>(i));
        }
    }
}

TEST_CASE("Key counts differ by at most one", "[reconcile]") {
    for (std::uint64_t seed : {1U, 2U, 3U}) {
        for (std::size_t rows : {1U, 7U, 100U, 1001U}) {
            auto out = bankgen::reconcile(dimension({"k1", "k2", "k3", "k4", "k5", "k6", "k7"}),
                                          fact(rows), options(seed));
            REQUIRE(out.rows() == rows);
            std::size_t lo = rows;
            std::size_t hi = 0;
            std::size_t total = 0;
            for (const auto& [key, count] : key_counts(out)) {
                lo = std::min(lo, count);
                hi = std::max(hi, count);
                total += count;
            }
            REQUIRE(total == rows);
            if (rows >= 7) {
                REQUIRE(hi - lo <= 1);
            }
        }
    }
}

TEST_CASE("Duplicate and null dimension keys", "[reconcile]") {
    bankgen::Table dim;
    dim.add_column("id_usuario", bankgen::Column<std::int64_t>{5, 5, 9, 0},
                   std::vector<bool>{true, true, true, false});
    bankgen::Table facts;
    facts.add_column("id_usuario",
                     bankgen::Column<std::int64_t>(std::vector<std::int64_t>(6, -1)));

    auto out = bankgen::reconcile(dim, facts, options(4));
    REQUIRE(out.rows() == 6);
    const auto& keys = std::get<bankgen::Column<std::int64_t>>(*out.find("id_usuario"));
    std::map<std::int64_t, int> counts;
    for (auto key : keys) {
        ++counts[key];
    }
    REQUIRE(counts == std::map<std::int64_t, int>{{5, 3}, {9, 3}});
    REQUIRE_FALSE(out.find_entry("id_usuario")->validity.has_value());
}

TEST_CASE("Reconcile edge cases", "[reconcile]") {
    SECTION("empty dimension is a data error") {
        REQUIRE_THROWS_AS(bankgen::reconcile(dimension({}), fact(5), options(1)),
                          bankgen::DataError);
    }
    SECTION("dimension with only null keys is a data error") {
        bankgen::Table dim;
        dim.add_column("id_usuario", bankgen::Column<std::string>{"a"}, std::vector<bool>{false});
        REQUIRE_THROWS_AS(bankgen::reconcile(dim, fact(5), options(1)), bankgen::DataError);
    }
    SECTION("empty fact table gives an empty result") {
        auto out = bankgen::reconcile(dimension({"A"}), fact(0), options(1));
        REQUIRE(out.rows() == 0);
        REQUIRE(out.column_names() ==
                std::vector<std::string>{"id_transacao", "valor", "id_usuario"});
    }
    SECTION("missing key columns are data errors") {
        bankgen::ReconcileOptions opts{.dimension_key = "nope", .seed = 1};
        REQUIRE_THROWS_AS(bankgen::reconcile(dimension({"A"}), fact(3), opts), bankgen::DataError);
        opts = bankgen::ReconcileOptions{.fact_key = "nope", .seed = 1};
        REQUIRE_THROWS_AS(bankgen::reconcile(dimension({"A"}), fact(3), opts), bankgen::DataError);
    }
}

TEST_CASE("Different key column names", "[reconcile]") {
    bankgen::Table dim;
    dim.add_column("id_cliente", bankgen::Column<std::int64_t>{10, 20});
    bankgen::Table facts;
    facts.add_column("cliente", bankgen::Column<std::int64_t>{0, 0, 0, 0});
    facts.add_column("valor", bankgen::Column<double>{1.0, 2.0, 3.0, 4.0});

    bankgen::CardinalityReconciler reconciler(
        bankgen::ReconcileOptions{.dimension_key = "id_cliente", .fact_key = "cliente", .seed = 8});
    auto out = reconciler.reconcile(dim, facts);

    REQUIRE(out.column_names() == std::vector<std::string>{"valor", "cliente"});
    std::set<std::int64_t> seen;
    for (auto key : std::get<bankgen::Column<std::int64_t>>(*out.find("cliente"))) {
        seen.insert(key);
    }
    REQUIRE(seen == std::set<std::int64_t>{10, 20});
}
