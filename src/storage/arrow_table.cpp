#include <bankgen/storage/arrow_table.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <type_traits>
#include <vector>

namespace bankgen::storage {

namespace {

constexpr std::int64_t kMillisPerDay = 86'400'000;

// ─── Arrow → Table ────────────────────────────────────────────────────────────

struct NullTracker {
    std::vector<bool> validity;
    bool has_nulls = false;

    void push(bool valid) {
        validity.push_back(valid);
        has_nulls = has_nulls || !valid;
    }
};

/// Append every chunk of `chunked` (all of type ArrowArray) to `out`, mapping
/// values through `convert` and nulls to `fallback`.
template <typename ArrowArray, typename ColT, typename Convert>
void append_chunks(const arrow::ChunkedArray& chunked, ColT& out, NullTracker& nulls,
                   typename ColT::value_type fallback, Convert convert) {
    for (const auto& chunk : chunked.chunks()) {
        const auto& arr = static_cast<const ArrowArray&>(*chunk);
        for (std::int64_t i = 0; i < arr.length(); ++i) {
            if (arr.IsNull(i)) {
                out.push_back(fallback);
                nulls.push(false);
            } else {
                out.push_back(convert(arr.Value(i)));
                nulls.push(true);
            }
        }
    }
}

template <typename ArrowArray>
void append_string_chunks(const arrow::ChunkedArray& chunked, Column<std::string>& out,
                          NullTracker& nulls) {
    for (const auto& chunk : chunked.chunks()) {
        const auto& arr = static_cast<const ArrowArray&>(*chunk);
        for (std::int64_t i = 0; i < arr.length(); ++i) {
            if (arr.IsNull(i)) {
                out.push_back(std::string{});
                nulls.push(false);
            } else {
                out.push_back(arr.GetString(i));
                nulls.push(true);
            }
        }
    }
}

auto nanos_per_unit(arrow::TimeUnit::type unit) -> std::int64_t {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return 1'000'000'000;
        case arrow::TimeUnit::MILLI:
            return 1'000'000;
        case arrow::TimeUnit::MICRO:
            return 1'000;
        case arrow::TimeUnit::NANO:
            return 1;
    }
    return 1;
}

auto convert_column(const arrow::ChunkedArray& chunked, NullTracker& nulls)
    -> std::expected<ColumnValue, std::string> {
    const auto to_i64 = [](auto v) { return static_cast<std::int64_t>(v); };
    Column<std::int64_t> ints;
    switch (chunked.type()->id()) {
        case arrow::Type::INT64:
            append_chunks<arrow::Int64Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::INT32:
            append_chunks<arrow::Int32Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::INT16:
            append_chunks<arrow::Int16Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::INT8:
            append_chunks<arrow::Int8Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::UINT32:
            append_chunks<arrow::UInt32Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::UINT16:
            append_chunks<arrow::UInt16Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::UINT8:
            append_chunks<arrow::UInt8Array>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::BOOL:
            append_chunks<arrow::BooleanArray>(chunked, ints, nulls, 0, to_i64);
            return ints;
        case arrow::Type::DOUBLE: {
            Column<double> out;
            append_chunks<arrow::DoubleArray>(chunked, out, nulls, 0.0,
                                              [](double v) { return v; });
            return out;
        }
        case arrow::Type::FLOAT: {
            Column<double> out;
            append_chunks<arrow::FloatArray>(chunked, out, nulls, 0.0,
                                             [](float v) { return static_cast<double>(v); });
            return out;
        }
        case arrow::Type::STRING: {
            Column<std::string> out;
            append_string_chunks<arrow::StringArray>(chunked, out, nulls);
            return out;
        }
        case arrow::Type::LARGE_STRING: {
            Column<std::string> out;
            append_string_chunks<arrow::LargeStringArray>(chunked, out, nulls);
            return out;
        }
        case arrow::Type::DATE32: {
            Column<Date> out;
            append_chunks<arrow::Date32Array>(chunked, out, nulls, Date{},
                                              [](std::int32_t v) { return Date{v}; });
            return out;
        }
        case arrow::Type::DATE64: {
            Column<Date> out;
            append_chunks<arrow::Date64Array>(
                chunked, out, nulls, Date{}, [](std::int64_t ms) {
                    auto days = ms / kMillisPerDay;
                    if (ms % kMillisPerDay < 0) {
                        --days;
                    }
                    return Date{static_cast<std::int32_t>(days)};
                });
            return out;
        }
        case arrow::Type::TIMESTAMP: {
            const auto& type = static_cast<const arrow::TimestampType&>(*chunked.type());
            const auto scale = nanos_per_unit(type.unit());
            Column<Timestamp> out;
            append_chunks<arrow::TimestampArray>(
                chunked, out, nulls, Timestamp{},
                [scale](std::int64_t v) { return Timestamp{v * scale}; });
            return out;
        }
        default:
            return std::unexpected("unsupported arrow type " + chunked.type()->ToString());
    }
}

// ─── Table → Arrow ────────────────────────────────────────────────────────────

template <typename Builder, typename Append>
auto build_array(Builder& builder, const ColumnEntry& entry, std::size_t n, Append append)
    -> std::expected<std::shared_ptr<arrow::Array>, std::string> {
    auto st = builder.Reserve(static_cast<std::int64_t>(n));
    if (!st.ok()) {
        return std::unexpected("reserve failed for '" + entry.name + "': " + st.ToString());
    }
    for (std::size_t i = 0; i < n; ++i) {
        st = is_null(entry, i) ? builder.AppendNull() : append(builder, i);
        if (!st.ok()) {
            return std::unexpected("append failed for '" + entry.name + "': " + st.ToString());
        }
    }
    std::shared_ptr<arrow::Array> arr;
    st = builder.Finish(&arr);
    if (!st.ok()) {
        return std::unexpected("finish failed for '" + entry.name + "': " + st.ToString());
    }
    return arr;
}

auto to_arrow_array(const ColumnEntry& entry)
    -> std::expected<std::shared_ptr<arrow::Array>, std::string> {
    return std::visit(
        [&](const auto& col) -> std::expected<std::shared_ptr<arrow::Array>, std::string> {
            using ColT = std::decay_t<decltype(col)>;
            const std::size_t n = col.size();
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                arrow::Int64Builder builder;
                return build_array(builder, entry, n,
                                   [&](auto& b, std::size_t i) { return b.Append(col[i]); });
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                arrow::DoubleBuilder builder;
                return build_array(builder, entry, n,
                                   [&](auto& b, std::size_t i) { return b.Append(col[i]); });
            } else if constexpr (std::is_same_v<ColT, Column<std::string>> ||
                                 std::is_same_v<ColT, Column<Categorical>>) {
                arrow::StringBuilder builder;
                return build_array(builder, entry, n, [&](auto& b, std::size_t i) {
                    std::string_view sv = col[i];
                    return b.Append(sv.data(), static_cast<std::int32_t>(sv.size()));
                });
            } else if constexpr (std::is_same_v<ColT, Column<Date>>) {
                arrow::Date32Builder builder;
                return build_array(builder, entry, n,
                                   [&](auto& b, std::size_t i) { return b.Append(col[i].days); });
            } else {
                static_assert(std::is_same_v<ColT, Column<Timestamp>>,
                              "unhandled column type in to_arrow");
                arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::NANO),
                                                arrow::default_memory_pool());
                return build_array(builder, entry, n,
                                   [&](auto& b, std::size_t i) { return b.Append(col[i].nanos); });
            }
        },
        *entry.column);
}

auto to_arrow_field(const ColumnEntry& entry) -> std::shared_ptr<arrow::Field> {
    return std::visit(
        [&](const auto& col) -> std::shared_ptr<arrow::Field> {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                return arrow::field(entry.name, arrow::int64());
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                return arrow::field(entry.name, arrow::float64());
            } else if constexpr (std::is_same_v<ColT, Column<Date>>) {
                return arrow::field(entry.name, arrow::date32());
            } else if constexpr (std::is_same_v<ColT, Column<Timestamp>>) {
                return arrow::field(entry.name, arrow::timestamp(arrow::TimeUnit::NANO));
            } else {
                return arrow::field(entry.name, arrow::utf8());
            }
        },
        *entry.column);
}

}  // namespace

auto to_arrow(const Table& table) -> std::expected<std::shared_ptr<arrow::Table>, std::string> {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.columns.size());
    arrays.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        fields.push_back(to_arrow_field(entry));
        auto array = to_arrow_array(entry);
        if (!array) {
            return std::unexpected(array.error());
        }
        arrays.push_back(std::move(*array));
    }
    return arrow::Table::Make(arrow::schema(std::move(fields)), arrays,
                              static_cast<std::int64_t>(table.rows()));
}

auto from_arrow(const arrow::Table& table) -> std::expected<Table, std::string> {
    Table out;
    for (int i = 0; i < table.num_columns(); ++i) {
        const auto& name = table.field(i)->name();
        NullTracker nulls;
        nulls.validity.reserve(static_cast<std::size_t>(table.num_rows()));
        auto column = convert_column(*table.column(i), nulls);
        if (!column) {
            return std::unexpected(fmt::format("column '{}': {}", name, column.error()));
        }
        if (nulls.has_nulls) {
            out.add_column(name, std::move(*column), std::move(nulls.validity));
        } else {
            out.add_column(name, std::move(*column));
        }
    }
    return out;
}

}  // namespace bankgen::storage
