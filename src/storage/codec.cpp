#include <bankgen/storage/arrow_table.hpp>
#include <bankgen/storage/codec.hpp>

#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <rapidcsv.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace bankgen::storage {

namespace {

constexpr std::int64_t kParquetChunkSize = static_cast<std::int64_t>(64) * 1024 * 1024;

auto csv_try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto csv_try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

/// True when every non-empty value satisfies `accept` and at least one exists.
template <typename Accept>
auto all_values(const std::vector<std::string>& vals, Accept accept) -> bool {
    bool any = false;
    for (const auto& v : vals) {
        if (v.empty()) {
            continue;
        }
        if (!accept(v)) {
            return false;
        }
        any = true;
    }
    return any;
}

template <typename ColT, typename Parse>
void add_typed_column(Table& table, const std::string& name, const std::vector<std::string>& vals,
                      Parse parse) {
    ColT col;
    col.reserve(vals.size());
    std::vector<bool> validity(vals.size(), true);
    bool has_nulls = false;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (vals[i].empty()) {
            col.push_back(typename ColT::value_type{});
            validity[i] = false;
            has_nulls = true;
            continue;
        }
        col.push_back(parse(vals[i]));
    }
    if (has_nulls) {
        table.add_column(name, std::move(col), std::move(validity));
    } else {
        table.add_column(name, std::move(col));
    }
}

auto write_parquet(arrow::fs::FileSystem& fs, const std::string& path,
                   const arrow::Table& table) -> std::expected<void, std::string> {
    auto sink = fs.OpenOutputStream(path);
    if (!sink.ok()) {
        return std::unexpected("cannot open for writing: " + path + " (" +
                               sink.status().ToString() + ")");
    }
    auto st = parquet::arrow::WriteTable(table, arrow::default_memory_pool(), *sink,
                                         kParquetChunkSize);
    if (!st.ok()) {
        return std::unexpected("failed to write parquet: " + path + " (" + st.ToString() + ")");
    }
    st = (*sink)->Close();
    if (!st.ok()) {
        return std::unexpected("failed to close: " + path + " (" + st.ToString() + ")");
    }
    return {};
}

auto write_csv(arrow::fs::FileSystem& fs, const std::string& path, const arrow::Table& table)
    -> std::expected<void, std::string> {
    auto sink = fs.OpenOutputStream(path);
    if (!sink.ok()) {
        return std::unexpected("cannot open for writing: " + path + " (" +
                               sink.status().ToString() + ")");
    }
    auto st = arrow::csv::WriteCSV(table, arrow::csv::WriteOptions::Defaults(), sink->get());
    if (!st.ok()) {
        return std::unexpected("failed to write csv: " + path + " (" + st.ToString() + ")");
    }
    st = (*sink)->Close();
    if (!st.ok()) {
        return std::unexpected("failed to close: " + path + " (" + st.ToString() + ")");
    }
    return {};
}

auto read_parquet(arrow::fs::FileSystem& fs, const std::string& path)
    -> std::expected<Table, std::string> {
    auto input = fs.OpenInputFile(path);
    if (!input.ok()) {
        return std::unexpected("failed to open: " + path + " (" + input.status().ToString() +
                               ")");
    }
    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto st = parquet::arrow::OpenFile(*input, arrow::default_memory_pool(), &reader);
    if (!st.ok()) {
        return std::unexpected("failed to read: " + path + " (" + st.ToString() + ")");
    }
    std::shared_ptr<arrow::Table> table;
    st = reader->ReadTable(&table);
    if (!st.ok()) {
        return std::unexpected("failed to load table: " + path + " (" + st.ToString() + ")");
    }
    return from_arrow(*table);
}

auto read_csv_file(arrow::fs::FileSystem& fs, const std::string& path)
    -> std::expected<Table, std::string> {
    auto input = fs.OpenInputFile(path);
    if (!input.ok()) {
        return std::unexpected("failed to open: " + path + " (" + input.status().ToString() +
                               ")");
    }
    auto size = (*input)->GetSize();
    if (!size.ok()) {
        return std::unexpected("failed to stat: " + path + " (" + size.status().ToString() + ")");
    }
    auto buffer = (*input)->Read(*size);
    if (!buffer.ok()) {
        return std::unexpected("failed to read: " + path + " (" + buffer.status().ToString() +
                               ")");
    }
    std::istringstream text((*buffer)->ToString());
    return read_csv(text);
}

}  // namespace

auto write_file(arrow::fs::FileSystem& fs, const std::string& path, const Table& table,
                FileFormat format) -> std::expected<void, std::string> {
    auto arrow_table = to_arrow(table);
    if (!arrow_table) {
        return std::unexpected(arrow_table.error());
    }
    switch (format) {
        case FileFormat::Parquet:
            return write_parquet(fs, path, **arrow_table);
        case FileFormat::Csv:
            return write_csv(fs, path, **arrow_table);
    }
    return std::unexpected("unsupported file format");
}

auto read_file(arrow::fs::FileSystem& fs, const std::string& path, FileFormat format)
    -> std::expected<Table, std::string> {
    switch (format) {
        case FileFormat::Parquet:
            return read_parquet(fs, path);
        case FileFormat::Csv:
            return read_csv_file(fs, path);
    }
    return std::unexpected("unsupported file format");
}

auto read_csv(std::istream& input) -> std::expected<Table, std::string> {
    try {
        rapidcsv::Document doc(input,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );

        Table table;
        for (const auto& name : doc.GetColumnNames()) {
            auto vals = doc.GetColumn<std::string>(name);
            if (all_values(vals, [](const std::string& v) {
                    std::int64_t iv{};
                    return csv_try_int(v, iv);
                })) {
                add_typed_column<Column<std::int64_t>>(table, name, vals, [](const std::string& v) {
                    std::int64_t iv{};
                    csv_try_int(v, iv);
                    return iv;
                });
            } else if (all_values(vals, [](const std::string& v) {
                           double dv{};
                           return csv_try_double(v, dv);
                       })) {
                add_typed_column<Column<double>>(table, name, vals, [](const std::string& v) {
                    double dv{};
                    csv_try_double(v, dv);
                    return dv;
                });
            } else if (all_values(vals, [](const std::string& v) {
                           return parse_date(v).has_value();
                       })) {
                add_typed_column<Column<Date>>(table, name, vals, [](const std::string& v) {
                    return parse_date(v).value_or(Date{});
                });
            } else {
                add_typed_column<Column<std::string>>(table, name, vals,
                                                      [](const std::string& v) { return v; });
            }
        }
        return table;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("failed to parse csv: ") + e.what());
    }
}

}  // namespace bankgen::storage
