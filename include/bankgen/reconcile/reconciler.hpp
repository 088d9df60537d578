#pragma once

#include <bankgen/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace bankgen {

struct ReconcileOptions {
    /// Key column of the dimension table.
    std::string dimension_key = "id_usuario";
    /// Foreign-key column of the fact table that gets replaced.
    std::string fact_key = "id_usuario";
    /// Seed for the shuffles; a random device seeds them when unset.
    std::optional<std::uint64_t> seed;
};

/// Sizes of one re-keying pass.
struct ReKeyPlan {
    std::size_t key_count = 0;
    std::size_t fact_rows = 0;
    /// ceil(fact_rows / key_count), at least 1.
    std::size_t replication_factor = 1;
    /// key_count * replication_factor; never smaller than fact_rows.
    std::size_t pool_size = 0;

    auto operator==(const ReKeyPlan&) const -> bool = default;
};

/// Throws DataError when `key_count` is zero.
[[nodiscard]] auto plan_rekey(std::size_t key_count, std::size_t fact_rows) -> ReKeyPlan;

/// Re-keys a fact table onto the keys of a (usually much smaller) dimension.
///
/// The distinct dimension keys are shuffled, replicated until the pool covers
/// every fact row, cut to the fact row count, shuffled again and paired with
/// the fact rows in order. Every key ends up on floor(n/k) or ceil(n/k) rows.
/// The output holds the fact columns without the old foreign key, followed by
/// the new one; its row count equals the fact row count.
class CardinalityReconciler {
   public:
    CardinalityReconciler();
    explicit CardinalityReconciler(ReconcileOptions options);

    /// Throws DataError if a key column is missing or the dimension has no
    /// non-null keys. An empty fact table yields an empty result.
    [[nodiscard]] auto reconcile(const Table& dimension, const Table& fact) -> Table;

   private:
    ReconcileOptions options_;
    std::mt19937_64 rng_;
};

/// One-shot reconcile with the given options.
[[nodiscard]] auto reconcile(const Table& dimension, const Table& fact,
                             const ReconcileOptions& options = {}) -> Table;

}  // namespace bankgen
