#include <bankgen/table/table.hpp>

#include <stdexcept>
#include <type_traits>

namespace bankgen {

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    std::string key = name;
    add_column(std::move(name), std::move(column));
    columns[index.at(key)].validity = std::move(validity);
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_type_name(const ColumnValue& column) -> std::string_view {
    return std::visit(
        [](const auto& col) -> std::string_view {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                return "int64";
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                return "double";
            } else if constexpr (std::is_same_v<ColType, Column<Date>>) {
                return "date";
            } else if constexpr (std::is_same_v<ColType, Column<Timestamp>>) {
                return "timestamp";
            } else {
                return "string";
            }
        },
        column);
}

auto make_empty_like(const ColumnValue& src) -> ColumnValue {
    return std::visit(
        [](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                return Column<Categorical>{col.dictionary_ptr(), col.index_ptr(), {}};
            }
            return ColType{};
        },
        src);
}

void append_value(ColumnValue& out, const ColumnValue& src, std::size_t index) {
    std::visit(
        [&](auto& dst_col) {
            using ColType = std::decay_t<decltype(dst_col)>;
            const auto* src_col = std::get_if<ColType>(&src);
            if (src_col == nullptr) {
                throw std::runtime_error("column type mismatch");
            }
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                if (src_col->dictionary_ptr() == dst_col.dictionary_ptr()) {
                    dst_col.push_code(src_col->code_at(index));
                } else {
                    dst_col.push_back((*src_col)[index]);
                }
            } else {
                dst_col.push_back((*src_col)[index]);
            }
        },
        out);
}

auto take(const ColumnValue& src, std::span<const std::size_t> rows) -> ColumnValue {
    return std::visit(
        [rows](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<Categorical>>) {
                std::vector<Column<Categorical>::code_type> codes;
                codes.reserve(rows.size());
                for (auto row : rows) {
                    codes.push_back(col.code_at(row));
                }
                return Column<Categorical>{col.dictionary_ptr(), col.index_ptr(),
                                           std::move(codes)};
            } else {
                ColType out;
                out.reserve(rows.size());
                for (auto row : rows) {
                    out.push_back(col[row]);
                }
                return out;
            }
        },
        src);
}

auto take_rows(const Table& src, std::span<const std::size_t> rows) -> Table {
    Table out;
    for (const auto& entry : src.columns) {
        auto gathered = take(*entry.column, rows);
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(rows.size());
            for (auto row : rows) {
                validity.push_back((*entry.validity)[row]);
            }
            out.add_column(entry.name, std::move(gathered), std::move(validity));
        } else {
            out.add_column(entry.name, std::move(gathered));
        }
    }
    return out;
}

auto concat_tables(const std::vector<Table>& parts) -> Table {
    Table out;
    if (parts.empty()) {
        return out;
    }
    const Table& first = parts.front();
    bool any_nulls = false;
    for (const auto& part : parts) {
        if (part.columns.size() != first.columns.size()) {
            throw std::runtime_error("concat: column count mismatch");
        }
        for (const auto& entry : part.columns) {
            any_nulls = any_nulls || entry.validity.has_value();
        }
    }

    std::vector<std::vector<bool>> validity(first.columns.size());
    for (const auto& entry : first.columns) {
        out.add_column(entry.name, make_empty_like(*entry.column));
    }
    for (const auto& part : parts) {
        for (std::size_t c = 0; c < first.columns.size(); ++c) {
            const auto* entry = part.find_entry(first.columns[c].name);
            if (entry == nullptr) {
                throw std::runtime_error("concat: missing column " + first.columns[c].name);
            }
            auto& dst = *out.columns[c].column;
            const std::size_t n = column_size(*entry->column);
            for (std::size_t r = 0; r < n; ++r) {
                append_value(dst, *entry->column, r);
                if (any_nulls) {
                    validity[c].push_back(!is_null(*entry, r));
                }
            }
        }
    }
    if (any_nulls) {
        for (std::size_t c = 0; c < out.columns.size(); ++c) {
            out.columns[c].validity = std::move(validity[c]);
        }
    }
    return out;
}

auto drop_column(const Table& src, const std::string& name) -> Table {
    Table out;
    for (const auto& entry : src.columns) {
        if (entry.name == name) {
            continue;
        }
        out.columns.push_back(entry);
        out.index[entry.name] = out.columns.size() - 1;
    }
    return out;
}

auto select_columns(const Table& src, const std::vector<std::string>& names) -> Table {
    Table out;
    for (const auto& name : names) {
        const auto* entry = src.find_entry(name);
        if (entry == nullptr) {
            throw std::runtime_error("select: missing column " + name);
        }
        out.columns.push_back(*entry);
        out.index[name] = out.columns.size() - 1;
    }
    return out;
}

}  // namespace bankgen
