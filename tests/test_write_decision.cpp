#include <bankgen/materialize/write_decision.hpp>

#include <catch2/catch_test_macros.hpp>

namespace {

using bankgen::TargetKind;
using bankgen::storage::LayoutKind;
using bankgen::storage::WriteMode;

auto spec(bool partitioned, bool bucketed) -> bankgen::TableSpec {
    return bankgen::TableSpec{.name = "t",
                              .num_records = 10,
                              .partitioned = partitioned,
                              .bucketed = bucketed,
                              .num_buckets = bucketed ? 8 : 0};
}

}  // namespace

TEST_CASE("Partitioning wins over bucketing", "[materialize][decision]") {
    for (auto target : {TargetKind::Catalog, TargetKind::FlatFile}) {
        for (bool exists : {false, true}) {
            auto decision = bankgen::decide_write(spec(true, true), target, exists);
            REQUIRE(decision.layout.kind == LayoutKind::PartitionByDate);
            REQUIRE(decision.layout.column == "data_execucao");
        }
    }
}

TEST_CASE("Layout follows the table flags", "[materialize][decision]") {
    auto bucketed = bankgen::decide_write(spec(false, true), TargetKind::Catalog, false);
    REQUIRE(bucketed.layout == bankgen::storage::Layout::bucket_by("id_uf", 8));

    auto plain = bankgen::decide_write(spec(false, false), TargetKind::Catalog, false);
    REQUIRE(plain.layout == bankgen::storage::Layout::none());
}

TEST_CASE("Write mode depends on target and existence", "[materialize][decision]") {
    REQUIRE(bankgen::decide_write(spec(false, false), TargetKind::Catalog, false).mode ==
            WriteMode::Overwrite);
    REQUIRE(bankgen::decide_write(spec(false, false), TargetKind::Catalog, true).mode ==
            WriteMode::Append);
    REQUIRE(bankgen::decide_write(spec(false, false), TargetKind::FlatFile, false).mode ==
            WriteMode::Overwrite);
    REQUIRE(bankgen::decide_write(spec(true, false), TargetKind::FlatFile, true).mode ==
            WriteMode::Overwrite);
}
