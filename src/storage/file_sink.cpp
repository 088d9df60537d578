#include <bankgen/core/error.hpp>
#include <bankgen/storage/dataset.hpp>
#include <bankgen/storage/file_sink.hpp>

#include <spdlog/spdlog.h>

namespace bankgen::storage {

ArrowFileSink::ArrowFileSink(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root)
    : fs_(std::move(fs)), root_(std::move(root)) {}

void ArrowFileSink::write(const Table& rows, const std::string& path, WriteMode mode,
                          FileFormat format, const Layout& layout) {
    auto dir = join_path(root_, path);
    auto result = write_dataset(*fs_, dir, rows, mode, format, layout);
    if (!result) {
        throw WriteError("failed to write " + dir + ": " + result.error());
    }
    spdlog::debug("{} {} rows in {} file(s) to {}", to_string(mode), result->rows, result->files,
                  dir);
}

auto ArrowFileSink::read(const std::string& path, FileFormat format) -> Table {
    auto dir = join_path(root_, path);
    auto table = read_dataset(*fs_, dir, format);
    if (!table) {
        throw DataError("failed to read " + dir + ": " + table.error());
    }
    return std::move(*table);
}

}  // namespace bankgen::storage
