#include <bankgen/storage/codec.hpp>
#include <bankgen/storage/dataset.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

namespace bankgen::storage {

namespace {

auto is_hidden(std::string_view name) -> bool {
    return !name.empty() && (name.front() == '_' || name.front() == '.');
}

auto next_sequence(arrow::fs::FileSystem& fs, const std::string& dir)
    -> std::expected<std::size_t, std::string> {
    arrow::fs::FileSelector selector;
    selector.base_dir = dir;
    selector.recursive = true;
    selector.allow_not_found = true;
    auto infos = fs.GetFileInfo(selector);
    if (!infos.ok()) {
        return std::unexpected("cannot list " + dir + " (" + infos.status().ToString() + ")");
    }
    std::size_t next = 0;
    for (const auto& info : *infos) {
        if (!info.IsFile()) {
            continue;
        }
        if (auto seq = part_sequence(info.base_name())) {
            next = std::max(next, *seq + 1);
        }
    }
    return next;
}

/// Add one constant column per `key=value` directory between `root` and `file`.
void add_partition_columns(Table& table, std::string_view root, std::string_view file) {
    auto relative = file.substr(std::min(root.size(), file.size()));
    const std::size_t rows = table.rows();
    std::size_t pos = 0;
    while (pos < relative.size()) {
        auto slash = relative.find('/', pos);
        if (slash == std::string_view::npos) {
            break;  // last segment is the file itself
        }
        auto segment = relative.substr(pos, slash - pos);
        pos = slash + 1;
        auto eq = segment.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        std::string key(segment.substr(0, eq));
        auto value = segment.substr(eq + 1);
        if (auto date = parse_date(value)) {
            Column<Date> col;
            col.reserve(rows);
            for (std::size_t r = 0; r < rows; ++r) {
                col.push_back(*date);
            }
            table.add_column(std::move(key), std::move(col));
        } else {
            Column<std::string> col;
            col.reserve(rows);
            for (std::size_t r = 0; r < rows; ++r) {
                col.push_back(std::string(value));
            }
            table.add_column(std::move(key), std::move(col));
        }
    }
}

}  // namespace

auto join_path(std::string_view base, std::string_view name) -> std::string {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (out.empty()) {
        return std::string(name);
    }
    out.push_back('/');
    out.append(name);
    return out;
}

auto write_dataset(arrow::fs::FileSystem& fs, const std::string& dir, const Table& table,
                   WriteMode mode, FileFormat format, const Layout& layout)
    -> std::expected<DatasetWriteResult, std::string> {
    auto parts = plan_parts(table, layout);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    std::size_t sequence = 0;
    if (mode == WriteMode::Overwrite) {
        auto st = fs.DeleteDirContents(dir, /*missing_dir_ok=*/true);
        if (!st.ok()) {
            return std::unexpected("cannot clear " + dir + " (" + st.ToString() + ")");
        }
    } else {
        auto next = next_sequence(fs, dir);
        if (!next) {
            return std::unexpected(next.error());
        }
        sequence = *next;
    }
    auto st = fs.CreateDir(dir, /*recursive=*/true);
    if (!st.ok()) {
        return std::unexpected("cannot create " + dir + " (" + st.ToString() + ")");
    }

    DatasetWriteResult result;
    for (const auto& part : *parts) {
        auto part_dir = part.partition_dir.empty() ? dir : join_path(dir, part.partition_dir);
        if (!part.partition_dir.empty()) {
            st = fs.CreateDir(part_dir, /*recursive=*/true);
            if (!st.ok()) {
                return std::unexpected("cannot create " + part_dir + " (" + st.ToString() + ")");
            }
        }
        auto path =
            join_path(part_dir, part_file_name(sequence, part.bucket, file_extension(format)));
        auto written = write_file(fs, path, part.rows, format);
        if (!written) {
            return std::unexpected(written.error());
        }
        spdlog::debug("wrote {} rows to {}", part.rows.rows(), path);
        ++result.files;
        result.rows += part.rows.rows();
    }
    return result;
}

auto read_dataset(arrow::fs::FileSystem& fs, const std::string& dir, FileFormat format)
    -> std::expected<Table, std::string> {
    arrow::fs::FileSelector selector;
    selector.base_dir = dir;
    selector.recursive = true;
    auto infos = fs.GetFileInfo(selector);
    if (!infos.ok()) {
        return std::unexpected("cannot list " + dir + " (" + infos.status().ToString() + ")");
    }

    std::vector<std::string> paths;
    for (const auto& info : *infos) {
        if (!info.IsFile() || info.extension() != to_string(format)) {
            continue;
        }
        auto relative =
            std::string_view(info.path()).substr(std::min(dir.size(), info.path().size()));
        bool hidden = false;
        std::size_t pos = 0;
        while (pos <= relative.size() && !hidden) {
            auto slash = relative.find('/', pos);
            if (slash == std::string_view::npos) {
                slash = relative.size();
            }
            hidden = is_hidden(relative.substr(pos, slash - pos));
            pos = slash + 1;
        }
        if (!hidden) {
            paths.push_back(info.path());
        }
    }
    std::ranges::sort(paths);

    std::vector<Table> parts;
    parts.reserve(paths.size());
    for (const auto& path : paths) {
        auto part = read_file(fs, path, format);
        if (!part) {
            return std::unexpected(part.error());
        }
        add_partition_columns(*part, dir, path);
        parts.push_back(std::move(*part));
    }
    try {
        return concat_tables(parts);
    } catch (const std::runtime_error& e) {
        return std::unexpected(std::string("inconsistent dataset ") + dir + ": " + e.what());
    }
}

auto detect_layout(arrow::fs::FileSystem& fs, const std::string& dir)
    -> std::expected<Layout, std::string> {
    arrow::fs::FileSelector selector;
    selector.base_dir = dir;
    selector.recursive = true;
    selector.allow_not_found = true;
    auto infos = fs.GetFileInfo(selector);
    if (!infos.ok()) {
        return std::unexpected("cannot list " + dir + " (" + infos.status().ToString() + ")");
    }

    std::optional<std::size_t> max_bucket;
    for (const auto& info : *infos) {
        if (!info.IsFile() || !part_sequence(info.base_name())) {
            continue;
        }
        auto relative =
            std::string_view(info.path()).substr(std::min(dir.size(), info.path().size()));
        while (relative.starts_with('/')) {
            relative.remove_prefix(1);
        }
        auto slash = relative.find('/');
        if (slash != std::string_view::npos) {
            auto segment = relative.substr(0, slash);
            if (auto eq = segment.find('='); eq != std::string_view::npos && eq > 0) {
                return Layout::partition_by(std::string(segment.substr(0, eq)));
            }
        }
        if (auto bucket = part_bucket(info.base_name())) {
            max_bucket = std::max(max_bucket.value_or(0), *bucket);
        }
    }
    if (max_bucket) {
        return Layout{.kind = LayoutKind::BucketByKey, .num_buckets = *max_bucket + 1};
    }
    return Layout::none();
}

}  // namespace bankgen::storage
