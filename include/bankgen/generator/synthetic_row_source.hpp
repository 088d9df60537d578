#pragma once

#include <bankgen/core/time.hpp>
#include <bankgen/generator/row_source.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace bankgen {

struct SyntheticOptions {
    /// Seed for the value stream; a random device seeds it when unset.
    std::optional<std::uint64_t> seed;
    /// Upper bound of generated foreign-key ids (`id_*` columns other than the
    /// table's leading key).
    std::int64_t key_range = 1000;
    /// Reference date for date and timestamp windows.
    Date today = today_utc();
};

/// Schema-driven generator of banking demo data.
///
/// Values are picked by column name first (ids, state codes, customer
/// attributes, card transaction fields) and by column kind otherwise. Every
/// generated column is fully valid.
class SyntheticRowSource final : public RowSource {
   public:
    SyntheticRowSource();
    explicit SyntheticRowSource(SyntheticOptions options);

    [[nodiscard]] auto generate(const std::string& table, const Schema& schema,
                                std::size_t count) -> Table override;

   private:
    [[nodiscard]] auto make_column(const Field& field, bool leading, std::size_t count)
        -> ColumnValue;
    [[nodiscard]] auto make_int(const Field& field, bool leading, std::size_t count)
        -> ColumnValue;
    [[nodiscard]] auto make_double(const Field& field, std::size_t count) -> ColumnValue;
    [[nodiscard]] auto make_string(const Field& field, std::size_t count) -> ColumnValue;
    [[nodiscard]] auto make_date(const Field& field, std::size_t count) -> ColumnValue;
    [[nodiscard]] auto make_timestamp(std::size_t count) -> ColumnValue;

    SyntheticOptions options_;
    std::mt19937_64 rng_;
};

}  // namespace bankgen
