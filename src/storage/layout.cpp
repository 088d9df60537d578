#include <bankgen/storage/layout.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <charconv>
#include <map>
#include <type_traits>

namespace bankgen::storage {

auto to_string(WriteMode mode) -> std::string_view {
    return mode == WriteMode::Overwrite ? "overwrite" : "append";
}

auto to_string(LayoutKind kind) -> std::string_view {
    switch (kind) {
        case LayoutKind::None:
            return "none";
        case LayoutKind::PartitionByDate:
            return "partition";
        case LayoutKind::BucketByKey:
            return "bucket";
    }
    return "unknown";
}

auto Layout::describe() const -> std::string {
    switch (kind) {
        case LayoutKind::None:
            return "no partitioning or bucketing";
        case LayoutKind::PartitionByDate:
            return fmt::format("partitioned by {}", column);
        case LayoutKind::BucketByKey:
            return fmt::format("bucketed by {} into {} buckets", column, num_buckets);
    }
    return {};
}

auto bucket_of(const ColumnValue& column, std::size_t row, std::size_t num_buckets)
    -> std::size_t {
    auto hash = std::visit(
        [row](const auto& col) -> std::size_t {
            using T = typename std::decay_t<decltype(col)>::value_type;
            return robin_hood::hash<T>{}(col[row]);
        },
        column);
    return hash % num_buckets;
}

auto part_file_name(std::size_t sequence, std::optional<std::size_t> bucket,
                    std::string_view extension) -> std::string {
    if (bucket) {
        return fmt::format("part-{:05}-b{:05}{}", sequence, *bucket, extension);
    }
    return fmt::format("part-{:05}{}", sequence, extension);
}

auto part_sequence(std::string_view file_name) -> std::optional<std::size_t> {
    constexpr std::string_view kPrefix = "part-";
    if (!file_name.starts_with(kPrefix)) {
        return std::nullopt;
    }
    auto digits = file_name.substr(kPrefix.size());
    std::size_t value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc() || result.ptr == digits.data()) {
        return std::nullopt;
    }
    return value;
}

auto part_bucket(std::string_view file_name) -> std::optional<std::size_t> {
    if (!part_sequence(file_name)) {
        return std::nullopt;
    }
    auto marker = file_name.find("-b");
    if (marker == std::string_view::npos) {
        return std::nullopt;
    }
    auto digits = file_name.substr(marker + 2);
    std::size_t value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc() || result.ptr == digits.data()) {
        return std::nullopt;
    }
    return value;
}

auto plan_parts(const Table& table, const Layout& layout)
    -> std::expected<std::vector<FilePart>, std::string> {
    std::vector<FilePart> parts;

    switch (layout.kind) {
        case LayoutKind::None:
            parts.push_back(FilePart{.rows = table});
            return parts;

        case LayoutKind::PartitionByDate: {
            const auto* column = table.find(layout.column);
            if (column == nullptr) {
                return std::unexpected("partition column not found: " + layout.column);
            }
            const auto* dates = std::get_if<Column<Date>>(column);
            if (dates == nullptr) {
                return std::unexpected("partition column '" + layout.column +
                                       "' must be a date column");
            }
            std::map<Date, std::vector<std::size_t>> groups;
            for (std::size_t r = 0; r < dates->size(); ++r) {
                groups[(*dates)[r]].push_back(r);
            }
            auto data = drop_column(table, layout.column);
            for (const auto& [date, rows] : groups) {
                parts.push_back(FilePart{
                    .partition_dir = fmt::format("{}={}", layout.column, format_date(date)),
                    .rows = take_rows(data, rows)});
            }
            return parts;
        }

        case LayoutKind::BucketByKey: {
            if (layout.num_buckets == 0) {
                return std::unexpected("bucketing requires at least one bucket");
            }
            const auto* column = table.find(layout.column);
            if (column == nullptr) {
                return std::unexpected("bucket column not found: " + layout.column);
            }
            std::vector<std::vector<std::size_t>> buckets(layout.num_buckets);
            for (std::size_t r = 0; r < table.rows(); ++r) {
                buckets[bucket_of(*column, r, layout.num_buckets)].push_back(r);
            }
            for (std::size_t b = 0; b < buckets.size(); ++b) {
                if (buckets[b].empty()) {
                    continue;
                }
                parts.push_back(FilePart{.bucket = b, .rows = take_rows(table, buckets[b])});
            }
            return parts;
        }
    }
    return std::unexpected("unknown layout");
}

}  // namespace bankgen::storage
