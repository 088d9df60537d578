#include <bankgen/core/error.hpp>
#include <bankgen/reconcile/reconciler.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>
#include <vector>

namespace bankgen {

namespace {

// Row of the first occurrence of every distinct non-null key.
auto distinct_key_rows(const ColumnEntry& entry) -> std::vector<std::size_t> {
    return std::visit(
        [&entry](const auto& col) {
            using ColType = std::decay_t<decltype(col)>;
            std::vector<std::size_t> rows;
            auto collect = [&](auto&& key_at) {
                using Key = std::decay_t<decltype(key_at(std::size_t{0}))>;
                robin_hood::unordered_set<Key> seen;
                for (std::size_t i = 0; i < col.size(); ++i) {
                    if (!is_null(entry, i) && seen.insert(key_at(i)).second) {
                        rows.push_back(i);
                    }
                }
            };
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                collect([&col](std::size_t i) { return col.code_at(i); });
            } else {
                collect([&col](std::size_t i) { return col[i]; });
            }
            return rows;
        },
        *entry.column);
}

auto require_column(const Table& table, const std::string& name, std::string_view role)
    -> const ColumnEntry& {
    const auto* entry = table.find_entry(name);
    if (entry == nullptr) {
        throw DataError(std::string(role) + " table has no column '" + name + "'");
    }
    return *entry;
}

}  // namespace

auto plan_rekey(std::size_t key_count, std::size_t fact_rows) -> ReKeyPlan {
    if (key_count == 0) {
        throw DataError("cannot re-key against an empty dimension table");
    }
    ReKeyPlan plan{.key_count = key_count, .fact_rows = fact_rows};
    plan.replication_factor = std::max<std::size_t>(1, (fact_rows + key_count - 1) / key_count);
    plan.pool_size = key_count * plan.replication_factor;
    return plan;
}

CardinalityReconciler::CardinalityReconciler() : CardinalityReconciler(ReconcileOptions{}) {}

CardinalityReconciler::CardinalityReconciler(ReconcileOptions options)
    : options_(std::move(options)),
      rng_(options_.seed ? *options_.seed : std::random_device{}()) {}

auto CardinalityReconciler::reconcile(const Table& dimension, const Table& fact) -> Table {
    const auto& key_entry = require_column(dimension, options_.dimension_key, "dimension");
    (void)require_column(fact, options_.fact_key, "fact");

    auto keys = distinct_key_rows(key_entry);
    auto plan = plan_rekey(keys.size(), fact.rows());
    spdlog::debug("re-keying {} fact rows onto {} keys: factor {}, pool {}", plan.fact_rows,
                  plan.key_count, plan.replication_factor, plan.pool_size);

    std::ranges::shuffle(keys, rng_);
    std::vector<std::size_t> pool;
    pool.reserve(plan.pool_size);
    for (std::size_t copy = 0; copy < plan.replication_factor; ++copy) {
        pool.insert(pool.end(), keys.begin(), keys.end());
    }
    pool.resize(plan.fact_rows);
    std::ranges::shuffle(pool, rng_);

    auto out = drop_column(fact, options_.fact_key);
    out.add_column(options_.fact_key, take(*key_entry.column, pool));
    return out;
}

auto reconcile(const Table& dimension, const Table& fact, const ReconcileOptions& options)
    -> Table {
    CardinalityReconciler reconciler(options);
    return reconciler.reconcile(dimension, fact);
}

}  // namespace bankgen
